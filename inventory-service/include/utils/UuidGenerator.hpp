#pragma once

#include <string>
#include <random>
#include <sstream>
#include <iomanip>
#include <cstdint>

namespace inventory::utils {

/**
 * @brief Генератор идентификаторов (UUID v4)
 *
 * @note Thread-safe благодаря thread_local генератору
 */
class UuidGenerator {
public:
    /// Формат: xxxxxxxx-xxxx-4xxx-yxxx-xxxxxxxxxxxx
    static std::string generate() {
        thread_local std::random_device rd;
        thread_local std::mt19937_64 gen(rd());
        std::uniform_int_distribution<uint64_t> dist;

        const uint64_t high = dist(gen);
        const uint64_t low = dist(gen);

        std::ostringstream ss;
        ss << std::hex << std::setfill('0')
           << std::setw(8) << (high >> 32) << '-'
           << std::setw(4) << ((high >> 16) & 0xFFFF) << '-'
           << std::setw(4) << ((high & 0x0FFF) | 0x4000) << '-'
           << std::setw(4) << (((low >> 48) & 0x3FFF) | 0x8000) << '-'
           << std::setw(12) << (low & 0xFFFFFFFFFFFFULL);
        return ss.str();
    }
};

} // namespace inventory::utils
