#pragma once

#include <string>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <stdexcept>

namespace btctax::domain {

/**
 * @brief Временная метка (UTC) в ISO 8601 формате
 *
 * Является ключом упорядочивания транзакций и якорем периода владения лотом.
 */
struct Timestamp {
    std::chrono::system_clock::time_point value;

    Timestamp() : value(now().value) {}

    explicit Timestamp(std::chrono::system_clock::time_point tp) : value(tp) {}

    /**
     * @brief Создать Timestamp с текущим временем, усечённым до целых секунд
     */
    static Timestamp now() {
        using namespace std::chrono;
        return Timestamp(time_point_cast<system_clock::duration>(floor<seconds>(system_clock::now())));
    }

    /**
     * @brief Создать Timestamp из календарной даты (полночь UTC)
     */
    static Timestamp fromDate(int year, unsigned month, unsigned day,
                              int hour = 0, int minute = 0, int second = 0) {
        using namespace std::chrono;
        year_month_day ymd{std::chrono::year{year}, std::chrono::month{month}, std::chrono::day{day}};
        if (!ymd.ok()) {
            throw std::invalid_argument("Invalid calendar date: " + std::to_string(year) + "-" +
                                        std::to_string(month) + "-" + std::to_string(day));
        }
        auto tp = sys_days{ymd} + hours{hour} + minutes{minute} + seconds{second};
        return Timestamp(time_point_cast<system_clock::duration>(tp));
    }

    /**
     * @brief Создать Timestamp из ISO 8601 строки
     * @param isoString Строка формата "2025-12-16T10:30:00Z", "2025-12-16 10:30:00" или "2025-12-16"
     * @throws std::invalid_argument если строка не распознана
     */
    static Timestamp fromString(const std::string& isoString) {
        int year = 0;
        unsigned month = 0;
        unsigned day = 0;
        int hour = 0;
        int minute = 0;
        int second = 0;

        int parsed = std::sscanf(isoString.c_str(), "%d-%u-%u%*[T ]%d:%d:%d",
                                 &year, &month, &day, &hour, &minute, &second);
        if (parsed != 3 && parsed != 6) {
            throw std::invalid_argument("Invalid timestamp: '" + isoString + "'");
        }
        if (hour < 0 || hour > 23 || minute < 0 || minute > 59 || second < 0 || second > 60) {
            throw std::invalid_argument("Invalid time of day: '" + isoString + "'");
        }
        return fromDate(year, month, day, hour, minute, second);
    }

    /**
     * @brief Преобразовать в ISO 8601 строку
     */
    std::string toString() const {
        using namespace std::chrono;
        auto secs = floor<seconds>(value);
        auto dayPoint = floor<days>(secs);
        year_month_day ymd{dayPoint};
        hh_mm_ss<seconds> tod{secs - dayPoint};

        char buffer[32];
        std::snprintf(buffer, sizeof(buffer), "%04d-%02u-%02uT%02d:%02d:%02dZ",
                      static_cast<int>(ymd.year()),
                      static_cast<unsigned>(ymd.month()),
                      static_cast<unsigned>(ymd.day()),
                      static_cast<int>(tod.hours().count()),
                      static_cast<int>(tod.minutes().count()),
                      static_cast<int>(tod.seconds().count()));
        return buffer;
    }

    /**
     * @brief Получить Unix timestamp (секунды с 1970)
     */
    int64_t toUnixSeconds() const {
        return std::chrono::duration_cast<std::chrono::seconds>(
            value.time_since_epoch()
        ).count();
    }

    /**
     * @brief Создать из Unix timestamp
     */
    static Timestamp fromUnixSeconds(int64_t seconds) {
        return Timestamp(std::chrono::system_clock::time_point(
            std::chrono::seconds(seconds)
        ));
    }

    /**
     * @brief Календарный год (UTC)
     */
    int year() const {
        using namespace std::chrono;
        year_month_day ymd{floor<days>(value)};
        return static_cast<int>(ymd.year());
    }

    /**
     * @brief Количество полных суток от `from` до этой метки
     *
     * Округление вниз: 23 часа это 0 суток, -1 час это -1 сутки.
     */
    int64_t wholeDaysSince(const Timestamp& from) const {
        return std::chrono::floor<std::chrono::days>(value - from.value).count();
    }

    // Операторы сравнения
    bool operator==(const Timestamp& other) const { return value == other.value; }
    bool operator!=(const Timestamp& other) const { return value != other.value; }
    bool operator<(const Timestamp& other) const { return value < other.value; }
    bool operator>(const Timestamp& other) const { return value > other.value; }
    bool operator<=(const Timestamp& other) const { return value <= other.value; }
    bool operator>=(const Timestamp& other) const { return value >= other.value; }
};

} // namespace btctax::domain
