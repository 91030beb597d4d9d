#pragma once

#include <gmpxx.h>
#include <string>
#include <ostream>

namespace btctax::domain {

/**
 * @brief Десятичное число произвольной точности
 *
 * Хранит точную рациональную дробь (GMP mpq_class), поэтому сложение,
 * вычитание, умножение и деление не теряют точность. Округление
 * выполняется только явно через round().
 */
class Decimal {
public:
    static constexpr unsigned USD_SCALE = 2;
    static constexpr unsigned BTC_SCALE = 8;

    Decimal() = default;
    Decimal(long value);
    explicit Decimal(const mpq_class& value);

    /**
     * @brief Разобрать строку вида "-123.45678"
     * @throws std::invalid_argument если строка не является десятичным числом
     */
    static Decimal fromString(const std::string& text);

    /**
     * @brief Округлить до заданного количества знаков после запятой
     *
     * Единственный режим: HALF_DOWN (половина округляется к нулю).
     */
    Decimal round(unsigned places) const;

    /**
     * @brief Округлить до центов (HALF_DOWN)
     */
    Decimal roundUsd() const { return round(USD_SCALE); }

    /**
     * @brief Строка с фиксированным количеством знаков (с округлением HALF_DOWN)
     */
    std::string toString(unsigned places) const;

    /**
     * @brief Каноническая строка: минимальное точное представление,
     *        либо 18 знаков, если дробь не конечна
     */
    std::string toString() const;

    bool isZero() const { return sgn(value_) == 0; }
    bool isNegative() const { return sgn(value_) < 0; }
    bool isPositive() const { return sgn(value_) > 0; }

    Decimal abs() const;

    Decimal operator+(const Decimal& other) const;
    Decimal operator-(const Decimal& other) const;
    Decimal operator*(const Decimal& other) const;

    /**
     * @throws std::domain_error при делении на ноль
     */
    Decimal operator/(const Decimal& other) const;
    Decimal operator-() const;

    Decimal& operator+=(const Decimal& other);
    Decimal& operator-=(const Decimal& other);

    bool operator==(const Decimal& other) const { return value_ == other.value_; }
    bool operator!=(const Decimal& other) const { return value_ != other.value_; }
    bool operator<(const Decimal& other) const { return value_ < other.value_; }
    bool operator>(const Decimal& other) const { return value_ > other.value_; }
    bool operator<=(const Decimal& other) const { return value_ <= other.value_; }
    bool operator>=(const Decimal& other) const { return value_ >= other.value_; }

    static const Decimal& min(const Decimal& a, const Decimal& b) { return b < a ? b : a; }

private:
    mpq_class value_{0};
};

inline std::ostream& operator<<(std::ostream& os, const Decimal& value) {
    return os << value.toString();
}

} // namespace btctax::domain
