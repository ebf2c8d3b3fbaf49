#pragma once

#include <cstdint>
#include <iomanip>
#include <random>
#include <sstream>
#include <string>

namespace portal::utils {

/**
 * @brief Генератор UUID v4 для токенов ожидающих входа гостей
 *
 * Формат: xxxxxxxx-xxxx-4xxx-yxxx-xxxxxxxxxxxx, y из [8, 9, a, b].
 *
 * @note Thread-safe благодаря thread_local генератору
 */
class UuidGenerator {
public:
    static std::string generate() {
        thread_local std::random_device rd;
        thread_local std::mt19937_64 gen((static_cast<uint64_t>(rd()) << 32) ^ rd());
        std::uniform_int_distribution<uint64_t> dist;

        uint64_t part1 = dist(gen);
        uint64_t part2 = dist(gen);

        std::ostringstream ss;
        ss << std::hex << std::setfill('0');

        ss << std::setw(8) << ((part1 >> 32) & 0xFFFFFFFF) << "-";
        ss << std::setw(4) << ((part1 >> 16) & 0xFFFF) << "-";
        ss << std::setw(4) << ((part1 & 0x0FFF) | 0x4000) << "-";          // version 4
        ss << std::setw(4) << (((part2 >> 48) & 0x3FFF) | 0x8000) << "-";  // variant
        ss << std::setw(12) << (part2 & 0xFFFFFFFFFFFFULL);

        return ss.str();
    }
};

} // namespace portal::utils
