#pragma once

#include <string>
#include <chrono>
#include <iomanip>
#include <sstream>
#include <ctime>
#include <cstdint>
#include <cctype>
#include <stdexcept>

namespace campaign::domain {

/**
 * @brief Временная метка с точностью до миллисекунд (UTC)
 *
 * Миллисекундная точность нужна, чтобы время события переживало
 * сериализацию в журнал без потерь: состояние, восстановленное из журнала,
 * должно совпадать с состоянием в памяти.
 */
struct Timestamp {
    std::chrono::system_clock::time_point value;

    Timestamp() : value(truncate(std::chrono::system_clock::now())) {}

    explicit Timestamp(std::chrono::system_clock::time_point tp) : value(truncate(tp)) {}

    static Timestamp now() {
        return Timestamp(std::chrono::system_clock::now());
    }

    static Timestamp fromMillis(int64_t millis) {
        return Timestamp(std::chrono::system_clock::time_point(std::chrono::milliseconds(millis)));
    }

    int64_t toMillis() const {
        return std::chrono::duration_cast<std::chrono::milliseconds>(value.time_since_epoch()).count();
    }

    /**
     * @brief Разобрать ISO 8601 строку ("2025-12-16T10:30:00Z" или "2025-12-16T10:30:00.123Z")
     * @throws std::invalid_argument при неверном формате
     */
    static Timestamp fromString(const std::string& isoString) {
        std::tm tm = {};
        std::istringstream ss(isoString);
        ss >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%S");
        if (ss.fail()) {
            throw std::invalid_argument("Invalid ISO 8601 timestamp: " + isoString);
        }

        int64_t millis = 0;
        if (ss.peek() == '.') {
            ss.get();
            std::string fraction;
            while (std::isdigit(ss.peek())) {
                fraction.push_back(static_cast<char>(ss.get()));
            }
            fraction = (fraction + "000").substr(0, 3);
            millis = std::stoll(fraction);
        }

        auto seconds = static_cast<int64_t>(timegm(&tm));
        return fromMillis(seconds * 1000 + millis);
    }

    /**
     * @brief ISO 8601 строка в UTC с миллисекундами
     */
    std::string toString() const {
        auto millis = toMillis();
        auto seconds = static_cast<std::time_t>(millis / 1000);
        std::tm tm{};
        gmtime_r(&seconds, &tm);

        std::ostringstream ss;
        ss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S")
           << '.' << std::setw(3) << std::setfill('0') << (millis % 1000) << 'Z';
        return ss.str();
    }

    Timestamp addSeconds(int64_t seconds) const {
        return Timestamp(value + std::chrono::seconds(seconds));
    }

    Timestamp addHours(int64_t hours) const {
        return Timestamp(value + std::chrono::hours(hours));
    }

    bool operator==(const Timestamp& other) const { return value == other.value; }
    bool operator!=(const Timestamp& other) const { return value != other.value; }
    bool operator<(const Timestamp& other) const { return value < other.value; }
    bool operator>(const Timestamp& other) const { return value > other.value; }
    bool operator<=(const Timestamp& other) const { return value <= other.value; }
    bool operator>=(const Timestamp& other) const { return value >= other.value; }

private:
    static std::chrono::system_clock::time_point truncate(std::chrono::system_clock::time_point tp) {
        return std::chrono::time_point_cast<std::chrono::milliseconds>(tp);
    }
};

} // namespace campaign::domain
