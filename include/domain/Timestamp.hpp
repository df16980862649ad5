#pragma once

#include <chrono>
#include <cstdint>
#include <ctime>
#include <iomanip>
#include <optional>
#include <regex>
#include <sstream>
#include <string>

namespace nimbasms::domain {

/**
 * @brief Временная метка
 *
 * На проводе встречается в двух видах: целое число секунд
 * от эпохи (added_at, sent_at, ...) и ISO 8601 (created_at расширения).
 */
class Timestamp {
public:
    std::chrono::system_clock::time_point value;

    Timestamp() = default;

    explicit Timestamp(std::chrono::system_clock::time_point tp) : value(tp) {}

    static Timestamp now() {
        return Timestamp(std::chrono::system_clock::now());
    }

    /**
     * @brief Наибольшее |секунд от эпохи|, которое помещается в system_clock
     *
     * Запас в одну секунду оставлен под дробную часть ISO 8601.
     */
    static constexpr int64_t MAX_EPOCH_SECONDS =
        std::chrono::duration_cast<std::chrono::seconds>(std::chrono::system_clock::duration::max()).count() - 1;

    static bool isRepresentable(int64_t seconds) {
        return seconds >= -MAX_EPOCH_SECONDS && seconds <= MAX_EPOCH_SECONDS;
    }

    /**
     * @pre isRepresentable(seconds)
     */
    static Timestamp fromEpochSeconds(int64_t seconds) {
        return Timestamp(std::chrono::system_clock::time_point(std::chrono::seconds(seconds)));
    }

    /**
     * @brief Разбор ISO 8601
     *
     * Поддерживает дробные секунды (до 9 знаков) и смещение
     * "Z" / "+HH:MM" / "+HHMM". Без смещения время считается UTC.
     */
    static std::optional<Timestamp> fromString(const std::string& str) {
        static const std::regex pattern(
            R"(^(\d{4})-(\d{2})-(\d{2})[T ](\d{2}):(\d{2}):(\d{2})(?:\.(\d{1,9}))?(Z|[+-]\d{2}:?\d{2})?$)");

        std::smatch m;
        if (!std::regex_match(str, m, pattern)) {
            return std::nullopt;
        }

        int year = std::stoi(m[1]);
        unsigned month = static_cast<unsigned>(std::stoi(m[2]));
        unsigned day = static_cast<unsigned>(std::stoi(m[3]));
        int hour = std::stoi(m[4]);
        int minute = std::stoi(m[5]);
        int second = std::stoi(m[6]);
        if (month < 1 || month > 12 || day < 1 || day > 31 || hour > 23 || minute > 59 || second > 60) {
            return std::nullopt;
        }

        int64_t seconds = daysFromCivil(year, month, day) * 86400
                        + hour * 3600 + minute * 60 + second;

        if (m[8].matched && m[8].str() != "Z") {
            std::string offset = m[8].str();
            int sign = offset[0] == '-' ? -1 : 1;
            int offHours = std::stoi(offset.substr(1, 2));
            int offMinutes = std::stoi(offset.substr(offset.size() - 2));
            seconds -= sign * (offHours * 3600 + offMinutes * 60);
        }
        if (!isRepresentable(seconds)) {
            return std::nullopt;
        }

        std::chrono::nanoseconds fraction(0);
        if (m[7].matched) {
            std::string digits = m[7].str();
            digits.append(9 - digits.size(), '0');
            fraction = std::chrono::nanoseconds(std::stoll(digits));
        }

        auto tp = std::chrono::system_clock::time_point(
            std::chrono::duration_cast<std::chrono::system_clock::duration>(
                std::chrono::seconds(seconds) + fraction));
        return Timestamp(tp);
    }

    int64_t toEpochSeconds() const {
        return std::chrono::duration_cast<std::chrono::seconds>(
            value.time_since_epoch()).count();
    }

    /**
     * @brief ISO 8601 в UTC ("2024-01-15T10:30:00Z", дробная часть только если есть)
     */
    std::string toString() const {
        auto sinceEpoch = value.time_since_epoch();
        auto secs = std::chrono::floor<std::chrono::seconds>(sinceEpoch);
        auto nanos = std::chrono::duration_cast<std::chrono::nanoseconds>(sinceEpoch - secs).count();

        std::time_t timeVal = static_cast<std::time_t>(secs.count());
        std::tm tm = {};
        gmtime_r(&timeVal, &tm);

        std::ostringstream ss;
        ss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S");
        if (nanos != 0) {
            std::ostringstream frac;
            frac << std::setw(9) << std::setfill('0') << nanos;
            std::string digits = frac.str();
            digits.erase(digits.find_last_not_of('0') + 1);
            ss << "." << digits;
        }
        ss << "Z";
        return ss.str();
    }

    /**
     * @brief Локальное время для вывода пользователю
     */
    std::string toDisplayString() const {
        std::time_t timeVal = std::chrono::system_clock::to_time_t(value);
        std::tm tm = {};
        localtime_r(&timeVal, &tm);

        std::ostringstream ss;
        ss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S");
        return ss.str();
    }

    bool operator==(const Timestamp& other) const { return value == other.value; }
    bool operator!=(const Timestamp& other) const { return value != other.value; }
    bool operator<(const Timestamp& other) const { return value < other.value; }
    bool operator>(const Timestamp& other) const { return value > other.value; }

private:
    // Алгоритм days_from_civil (H. Hinnant)
    static int64_t daysFromCivil(int y, unsigned m, unsigned d) {
        y -= m <= 2;
        const int64_t era = (y >= 0 ? y : y - 399) / 400;
        const unsigned yoe = static_cast<unsigned>(y - era * 400);
        const unsigned doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
        const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
        return era * 146097 + static_cast<int64_t>(doe) - 719468;
    }
};

} // namespace nimbasms::domain
