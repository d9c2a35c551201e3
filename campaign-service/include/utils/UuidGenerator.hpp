#pragma once

#include <string>
#include <random>
#include <sstream>
#include <iomanip>
#include <cstdint>

namespace campaign::utils {

/**
 * @brief Генератор UUID v4 (идентификаторы событий и агрегатов)
 *
 * @note Thread-safe благодаря thread_local генератору
 */
class UuidGenerator {
public:
    static std::string generate() {
        thread_local std::mt19937_64 gen(std::random_device{}());
        std::uniform_int_distribution<uint64_t> dist;

        uint64_t high = dist(gen);
        uint64_t low = dist(gen);

        high = (high & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;  // version 4
        low = (low & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;    // RFC 4122 variant

        std::ostringstream ss;
        ss << std::hex << std::setfill('0')
           << std::setw(8) << (high >> 32) << '-'
           << std::setw(4) << ((high >> 16) & 0xFFFF) << '-'
           << std::setw(4) << (high & 0xFFFF) << '-'
           << std::setw(4) << (low >> 48) << '-'
           << std::setw(12) << (low & 0xFFFFFFFFFFFFULL);
        return ss.str();
    }
};

} // namespace campaign::utils
