#include "domain/Decimal.hpp"

#include <cctype>
#include <stdexcept>

namespace btctax::domain {

namespace {

constexpr unsigned MAX_CANONICAL_PLACES = 18;

mpz_class pow10(unsigned exponent) {
    mpz_class result;
    mpz_ui_pow_ui(result.get_mpz_t(), 10, exponent);
    return result;
}

/**
 * @brief |value| * 10^places, округлённое HALF_DOWN до целого, со знаком value
 */
mpz_class scaleAndRound(const mpq_class& value, unsigned places) {
    mpq_class scaled = abs(value) * mpq_class(pow10(places));
    scaled.canonicalize();

    mpz_class quotient;
    mpz_class remainder;
    mpz_tdiv_qr(quotient.get_mpz_t(), remainder.get_mpz_t(),
                scaled.get_num_mpz_t(), scaled.get_den_mpz_t());

    mpz_class twice = remainder * 2;
    int half = mpz_cmp(twice.get_mpz_t(), scaled.get_den_mpz_t());

    if (half > 0) {
        ++quotient;
    }

    return sgn(value) < 0 ? mpz_class(-quotient) : quotient;
}

} // namespace

Decimal::Decimal(long value) : value_(value) {}

Decimal::Decimal(const mpq_class& value) : value_(value) {
    value_.canonicalize();
}

Decimal Decimal::fromString(const std::string& text) {
    std::size_t pos = 0;
    bool negative = false;

    if (pos < text.size() && (text[pos] == '-' || text[pos] == '+')) {
        negative = text[pos] == '-';
        ++pos;
    }

    std::string integerDigits;
    std::string fractionDigits;
    bool seenPoint = false;

    for (; pos < text.size(); ++pos) {
        char c = text[pos];
        if (std::isdigit(static_cast<unsigned char>(c))) {
            (seenPoint ? fractionDigits : integerDigits) += c;
        } else if (c == '.' && !seenPoint) {
            seenPoint = true;
        } else {
            throw std::invalid_argument("Invalid decimal: '" + text + "'");
        }
    }

    if (integerDigits.empty() && fractionDigits.empty()) {
        throw std::invalid_argument("Invalid decimal: '" + text + "'");
    }

    std::string digits = integerDigits + fractionDigits;
    mpz_class numerator(digits.empty() ? "0" : digits, 10);
    if (negative) {
        numerator = -numerator;
    }

    mpq_class result(numerator, pow10(static_cast<unsigned>(fractionDigits.size())));
    return Decimal(result);
}

Decimal Decimal::round(unsigned places) const {
    mpq_class result(scaleAndRound(value_, places), pow10(places));
    return Decimal(result);
}

std::string Decimal::toString(unsigned places) const {
    mpz_class scaled = scaleAndRound(value_, places);
    bool negative = sgn(scaled) < 0;

    std::string digits = mpz_class(::abs(scaled)).get_str();
    if (digits.size() <= places) {
        digits.insert(0, places + 1 - digits.size(), '0');
    }

    std::string result = negative ? "-" : "";
    if (places == 0) {
        return result + digits;
    }
    std::size_t split = digits.size() - places;
    return result + digits.substr(0, split) + "." + digits.substr(split);
}

std::string Decimal::toString() const {
    for (unsigned places = 0; places <= MAX_CANONICAL_PLACES; ++places) {
        mpz_class scale = pow10(places);
        if (mpz_divisible_p(scale.get_mpz_t(), value_.get_den_mpz_t())) {
            return toString(places);
        }
    }
    return toString(MAX_CANONICAL_PLACES);
}

Decimal Decimal::abs() const {
    return Decimal(mpq_class(::abs(value_)));
}

Decimal Decimal::operator+(const Decimal& other) const {
    return Decimal(mpq_class(value_ + other.value_));
}

Decimal Decimal::operator-(const Decimal& other) const {
    return Decimal(mpq_class(value_ - other.value_));
}

Decimal Decimal::operator*(const Decimal& other) const {
    return Decimal(mpq_class(value_ * other.value_));
}

Decimal Decimal::operator/(const Decimal& other) const {
    if (other.isZero()) {
        throw std::domain_error("Decimal division by zero");
    }
    return Decimal(mpq_class(value_ / other.value_));
}

Decimal Decimal::operator-() const {
    return Decimal(mpq_class(-value_));
}

Decimal& Decimal::operator+=(const Decimal& other) {
    value_ += other.value_;
    return *this;
}

Decimal& Decimal::operator-=(const Decimal& other) {
    value_ -= other.value_;
    return *this;
}

} // namespace btctax::domain
