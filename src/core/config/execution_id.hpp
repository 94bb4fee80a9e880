#pragma once
#include <cstdint>
#include <iomanip>
#include <random>
#include <sstream>
#include <string>

namespace knife::core::config {

    inline std::mt19937_64 make_seeded_engine() {
        std::random_device rd;
        std::seed_seq seq{rd(), rd(), rd(), rd(), rd(), rd(), rd(), rd()};
        return std::mt19937_64(seq);
    }

    // 128 random bits rendered as 32 lowercase hex characters.
    inline std::string generate_execution_id() {
        static thread_local std::mt19937_64 gen = make_seeded_engine();

        std::ostringstream ss;
        ss << std::hex << std::setfill('0');
        for (int i = 0; i < 2; ++i) {
            ss << std::setw(16) << static_cast<std::uint64_t>(gen());
        }
        return ss.str();
    }

} // namespace knife::core::config
