#pragma once

#include <string>
#include <chrono>
#include <sstream>
#include <iomanip>
#include <ctime>
#include <cstdint>
#include <cctype>

namespace inventory::domain {

/**
 * @brief Временная метка (UTC, точность до микросекунд)
 *
 * Микросекунды нужны для упорядочивания бэкордеров по времени создания.
 */
class Timestamp {
public:
    std::chrono::system_clock::time_point value;

    Timestamp() : value(std::chrono::system_clock::now()) {}

    explicit Timestamp(std::chrono::system_clock::time_point tp) : value(tp) {}

    static Timestamp now() {
        return Timestamp(std::chrono::system_clock::now());
    }

    /**
     * @brief Разбор ISO 8601: "2024-05-01T10:20:30.123456Z" или "2024-05-01 10:20:30.123456+00"
     */
    static Timestamp fromString(const std::string& str) {
        std::tm tm = {};
        std::string normalized = str;
        if (normalized.size() > 10 && normalized[10] == ' ') {
            normalized[10] = 'T';
        }
        std::istringstream ss(normalized);
        ss >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%S");
        auto tp = std::chrono::system_clock::from_time_t(timegm(&tm));

        auto dot = normalized.find('.', 19);
        if (dot != std::string::npos) {
            std::string digits;
            for (size_t i = dot + 1; i < normalized.size() && std::isdigit(static_cast<unsigned char>(normalized[i])); ++i) {
                digits += normalized[i];
            }
            digits = digits.substr(0, 6);
            while (digits.size() < 6) digits += '0';
            tp += std::chrono::microseconds(std::stoll(digits));
        }
        return Timestamp(std::chrono::time_point_cast<std::chrono::system_clock::duration>(tp));
    }

    std::string toString() const {
        auto time_t_val = std::chrono::system_clock::to_time_t(value);
        std::tm tm = {};
        gmtime_r(&time_t_val, &tm);

        auto micros = std::chrono::duration_cast<std::chrono::microseconds>(
            value.time_since_epoch()).count() % 1000000;
        if (micros < 0) micros += 1000000;

        std::ostringstream ss;
        ss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S")
           << '.' << std::setw(6) << std::setfill('0') << micros << 'Z';
        return ss.str();
    }

    /// Дата в формате yyMMdd (UTC), используется в номерах документов
    std::string toDateStamp() const {
        auto time_t_val = std::chrono::system_clock::to_time_t(value);
        std::tm tm = {};
        gmtime_r(&time_t_val, &tm);

        std::ostringstream ss;
        ss << std::put_time(&tm, "%y%m%d");
        return ss.str();
    }

    bool operator<(const Timestamp& other) const { return value < other.value; }
    bool operator>(const Timestamp& other) const { return value > other.value; }
    bool operator==(const Timestamp& other) const { return value == other.value; }
    bool operator!=(const Timestamp& other) const { return value != other.value; }
};

} // namespace inventory::domain
