#ifndef PIIGUARD_DETECTION_VALIDATORS_HPP
#define PIIGUARD_DETECTION_VALIDATORS_HPP

#include <string>
#include <cstdint>
#include <unicode/uchar.h>

/**
 * @file validators.hpp
 * @brief Checksum and shape tests that decide whether a pattern match is kept.
 *
 * All validators strip non-digit characters first. A digit is any Unicode decimal
 * digit (general category Nd), the same set \d matches in the rule patterns, and
 * it is weighed by its decimal value. They never throw and never modify their input.
 */

namespace piiguard {
namespace detection {

/**
 * @brief The closed set of validators a Rule can carry.
 */
enum class ValidatorKind {
    None,
    Luhn,                  ///< payment cards
    BusinessRegistration,  ///< 10-digit business registration numbers
    NotDateShaped          ///< 13-digit corporate numbers whose prefix is not YYMMDD
};

inline bool isDigit(wchar_t c)
{
    const uint32_t cp = static_cast<uint32_t>(c);
    return cp <= 0x10FFFF && u_isdigit(static_cast<UChar32>(cp));
}

/// Decimal value of a digit; 0 for anything isDigit rejects.
inline int digitValue(wchar_t c)
{
    return isDigit(c) ? u_charDigitValue(static_cast<UChar32>(c)) : 0;
}

/**
 * @brief Keep only the digits of a match, as they are written.
 */
inline std::wstring digitsOnly(const std::wstring &raw)
{
    std::wstring out;
    out.reserve(raw.size());
    for (wchar_t c : raw) {
        if (isDigit(c)) {
            out.push_back(c);
        }
    }
    return out;
}

/**
 * @brief Luhn checksum over at least 13 digits.
 *
 * Starting at the rightmost digit, every second digit is doubled (9 subtracted when
 * the product exceeds 9); the sum of all digits must be a multiple of 10.
 */
inline bool luhnCheck(const std::wstring &raw)
{
    const std::wstring digits = digitsOnly(raw);
    if (digits.size() < 13) {
        return false;
    }

    int sum = 0;
    bool alternate = false;
    for (auto it = digits.rbegin(); it != digits.rend(); ++it) {
        int v = digitValue(*it);
        if (alternate) {
            v *= 2;
            if (v > 9) {
                v -= 9;
            }
        }
        sum += v;
        alternate = !alternate;
    }
    return sum % 10 == 0;
}

/**
 * @brief Weighted-modulus check of a 10-digit business registration number.
 *
 * weights 1,3,7,1,3,7,1,3,5 over the first nine digits, plus (d9 * 5) / 10 where
 * d9 is the ninth digit; the check digit is (10 - sum % 10) % 10.
 */
inline bool businessRegistrationCheck(const std::wstring &raw)
{
    static const int weights[9] = {1, 3, 7, 1, 3, 7, 1, 3, 5};

    const std::wstring digits = digitsOnly(raw);
    if (digits.size() != 10) {
        return false;
    }

    int d[10];
    for (size_t i = 0; i < 10; ++i) {
        d[i] = digitValue(digits[i]);
    }

    int sum = 0;
    for (size_t i = 0; i < 9; ++i) {
        sum += d[i] * weights[i];
    }
    sum += (d[8] * 5) / 10;

    int check = (10 - (sum % 10)) % 10;
    return check == d[9];
}

/**
 * @brief True if a 13-digit number starts with a plausible YYMMDD date
 *        (month 1-12, day 1-31), the shape of a resident registration number.
 */
inline bool looksLikeResidentDate(const std::wstring &raw)
{
    const std::wstring digits = digitsOnly(raw);
    if (digits.size() != 13) {
        return false;
    }
    int month = digitValue(digits[2]) * 10 + digitValue(digits[3]);
    int day = digitValue(digits[4]) * 10 + digitValue(digits[5]);
    return month >= 1 && month <= 12 && day >= 1 && day <= 31;
}

/**
 * @brief Dispatch a ValidatorKind. ValidatorKind::None accepts everything.
 */
inline bool runValidator(ValidatorKind kind, const std::wstring &raw)
{
    switch (kind) {
    case ValidatorKind::None:
        return true;
    case ValidatorKind::Luhn:
        return luhnCheck(raw);
    case ValidatorKind::BusinessRegistration:
        return businessRegistrationCheck(raw);
    case ValidatorKind::NotDateShaped:
        return !looksLikeResidentDate(raw);
    }
    return false;
}

inline const char* validatorName(ValidatorKind kind)
{
    switch (kind) {
    case ValidatorKind::None:                 return "none";
    case ValidatorKind::Luhn:                 return "luhn";
    case ValidatorKind::BusinessRegistration: return "brn-checksum";
    case ValidatorKind::NotDateShaped:        return "not-date-shaped";
    }
    return "unknown";
}

} // namespace detection
} // namespace piiguard

#endif // PIIGUARD_DETECTION_VALIDATORS_HPP
