#ifndef PIIGUARD_DETECTION_MASK_RENDERER_HPP
#define PIIGUARD_DETECTION_MASK_RENDERER_HPP

#include <string>
#include <cwctype>
#include "detection/match.hpp"
#include "detection/validators.hpp"

/**
 * @file mask_renderer.hpp
 * @brief Mask tokens substituted for detected values.
 *
 * Each token is a literal prefix plus a bracketed body that keeps only a short tail
 * (or, for project codes, a fixed head) of the original value:
 *
 *   TEL[***-****-**78]   RRN[******-***4567]   EMAIL[a****@example.com]
 *   CARD[**** **** **** 1111]   PP[******678]   DL[**********12]
 *   BRN[***-**-**517]   CRN[******-****567]   PRJ[2023000***]   ACCT[********9012]
 */

namespace piiguard {
namespace detection {

/**
 * @brief The closed set of mask formats a Rule (or the account pass) can render.
 */
enum class MaskKind {
    None,
    MobilePhone,
    ResidentId,
    Email,
    Card,
    Passport,
    DriverLicense,
    BusinessRegistration,
    CorporateRegistration,
    Project,
    Account
};

/**
 * @brief Last @p n characters of @p s, or all of it when shorter.
 */
inline std::wstring lastChars(const std::wstring &s, size_t n)
{
    return s.size() > n ? s.substr(s.size() - n) : s;
}

/**
 * @brief Replace all but the last @p keep characters with @p maskChar.
 *
 * Whitespace is removed first. If what remains is not longer than @p keep the input
 * is returned as given, whitespace included.
 */
inline std::wstring keepTailMask(const std::wstring &s, size_t keep = 4, wchar_t maskChar = L'*')
{
    std::wstring compact;
    compact.reserve(s.size());
    for (wchar_t c : s) {
        if (!std::iswspace(static_cast<wint_t>(c))) {
            compact.push_back(c);
        }
    }
    if (compact.size() <= keep) {
        return s;
    }
    return std::wstring(compact.size() - keep, maskChar) + compact.substr(compact.size() - keep);
}

inline std::wstring maskMobilePhone(const Match &m)
{
    return L"TEL[***-****-**" + lastChars(digitsOnly(m.text), 2) + L"]";
}

inline std::wstring maskResidentId(const Match &m)
{
    return L"RRN[******-***" + lastChars(m.text, 4) + L"]";
}

/// Expects group 1 = local part, group 2 = domain.
inline std::wstring maskEmail(const Match &m)
{
    const std::wstring local = m.group(1);
    const std::wstring domain = m.group(2);
    std::wstring maskedLocal = local.size() > 1
        ? local.substr(0, 1) + std::wstring(local.size() - 1, L'*')
        : std::wstring(L"*");
    return L"EMAIL[" + maskedLocal + L"@" + domain + L"]";
}

/// Luhn failures come back unchanged.
inline std::wstring maskCard(const Match &m)
{
    if (!luhnCheck(m.text)) {
        return m.text;
    }
    return L"CARD[**** **** **** " + lastChars(digitsOnly(m.text), 4) + L"]";
}

inline std::wstring maskPassport(const Match &m)
{
    return L"PP[" + keepTailMask(m.text, 3) + L"]";
}

inline std::wstring maskDriverLicense(const Match &m)
{
    return L"DL[" + keepTailMask(digitsOnly(m.text), 2) + L"]";
}

inline std::wstring maskBusinessRegistration(const Match &m)
{
    return L"BRN[***-**-**" + lastChars(digitsOnly(m.text), 3) + L"]";
}

inline std::wstring maskCorporateRegistration(const Match &m)
{
    return L"CRN[******-****" + lastChars(digitsOnly(m.text), 3) + L"]";
}

inline std::wstring maskProject(const Match &m)
{
    return L"PRJ[" + m.text.substr(0, 7) + L"***]";
}

inline std::wstring maskAccount(const Match &m)
{
    return L"ACCT[" + keepTailMask(digitsOnly(m.text), 4) + L"]";
}

/**
 * @brief Render the token for @p kind. MaskKind::None returns the match unchanged.
 */
inline std::wstring renderMask(MaskKind kind, const Match &m)
{
    switch (kind) {
    case MaskKind::None:                  return m.text;
    case MaskKind::MobilePhone:           return maskMobilePhone(m);
    case MaskKind::ResidentId:            return maskResidentId(m);
    case MaskKind::Email:                 return maskEmail(m);
    case MaskKind::Card:                  return maskCard(m);
    case MaskKind::Passport:              return maskPassport(m);
    case MaskKind::DriverLicense:         return maskDriverLicense(m);
    case MaskKind::BusinessRegistration:  return maskBusinessRegistration(m);
    case MaskKind::CorporateRegistration: return maskCorporateRegistration(m);
    case MaskKind::Project:               return maskProject(m);
    case MaskKind::Account:               return maskAccount(m);
    }
    return m.text;
}

} // namespace detection
} // namespace piiguard

#endif // PIIGUARD_DETECTION_MASK_RENDERER_HPP
