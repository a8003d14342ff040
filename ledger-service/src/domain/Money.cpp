#include "domain/Money.hpp"
#include "domain/errors/LedgerErrors.hpp"

#include <cctype>
#include <cstdlib>

namespace ledger::domain {

namespace {

// Самое длинное целое, которое гарантированно помещается в int64 пайс
constexpr size_t MAX_INTEGER_DIGITS = 15;

int64_t roundedQuotient(int64_t numerator, int64_t denominator) {
    int64_t quotient = numerator / denominator;
    int64_t remainder = numerator % denominator;
    if (remainder == 0) {
        return quotient;
    }
    // Половина и больше округляется от нуля
    if (2 * std::llabs(remainder) >= std::llabs(denominator)) {
        bool negative = (numerator < 0) != (denominator < 0);
        quotient += negative ? -1 : 1;
    }
    return quotient;
}

} // namespace

Money Money::fromString(const std::string& text) {
    std::string cleaned;
    cleaned.reserve(text.size());
    for (char c : text) {
        if (c == ',' || std::isspace(static_cast<unsigned char>(c))) continue;
        cleaned += c;
    }
    if (cleaned.rfind("Rs.", 0) == 0) {
        cleaned = cleaned.substr(3);
    }

    bool negative = false;
    size_t pos = 0;
    if (pos < cleaned.size() && (cleaned[pos] == '-' || cleaned[pos] == '+')) {
        negative = cleaned[pos] == '-';
        ++pos;
    }

    std::string integerPart;
    std::string fractionPart;
    bool seenPoint = false;
    for (; pos < cleaned.size(); ++pos) {
        char c = cleaned[pos];
        if (c == '.') {
            if (seenPoint) throw MoneyFormatError(text);
            seenPoint = true;
            continue;
        }
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            throw MoneyFormatError(text);
        }
        (seenPoint ? fractionPart : integerPart) += c;
    }

    if (integerPart.empty() && fractionPart.empty()) {
        throw MoneyFormatError(text);
    }
    if (integerPart.size() > MAX_INTEGER_DIGITS) {
        throw MoneyFormatError(text);
    }

    int64_t major = integerPart.empty() ? 0 : std::stoll(integerPart);
    int64_t minor = 0;
    if (!fractionPart.empty()) {
        std::string firstTwo = fractionPart.substr(0, 2);
        while (firstTwo.size() < 2) firstTwo += '0';
        minor = std::stoll(firstTwo);
        if (fractionPart.size() > 2 && fractionPart[2] >= '5') {
            minor += 1;
        }
    }

    int64_t total = major * MINOR_PER_MAJOR + minor;
    return Money(negative ? -total : total);
}

Money Money::subtractNonNegative(const Money& other) const {
    if (other.minor_ > minor_) {
        throw MoneyUnderflowError(toDecimalString() + " - " + other.toDecimalString());
    }
    return Money(minor_ - other.minor_);
}

Money Money::divide(int64_t divisor) const {
    if (divisor == 0) {
        throw DivisionByZeroError();
    }
    return Money(roundedQuotient(minor_, divisor));
}

Money Money::prorate(int64_t numerator, int64_t denominator) const {
    if (denominator == 0) {
        throw DivisionByZeroError();
    }
    return Money(roundedQuotient(minor_ * numerator, denominator));
}

std::string Money::toDecimalString() const {
    int64_t absolute = std::llabs(minor_);
    std::string fraction = std::to_string(absolute % MINOR_PER_MAJOR);
    if (fraction.size() < 2) fraction = "0" + fraction;
    std::string result = std::to_string(absolute / MINOR_PER_MAJOR) + "." + fraction;
    return minor_ < 0 ? "-" + result : result;
}

std::string Money::toString() const {
    int64_t absolute = std::llabs(minor_);
    std::string digits = std::to_string(absolute / MINOR_PER_MAJOR);

    std::string grouped;
    int counter = 0;
    for (auto it = digits.rbegin(); it != digits.rend(); ++it) {
        if (counter > 0 && counter % 3 == 0) grouped.insert(grouped.begin(), ',');
        grouped.insert(grouped.begin(), *it);
        ++counter;
    }

    std::string fraction = std::to_string(absolute % MINOR_PER_MAJOR);
    if (fraction.size() < 2) fraction = "0" + fraction;

    return std::string(minor_ < 0 ? "-" : "") + "Rs. " + grouped + "." + fraction;
}

} // namespace ledger::domain
