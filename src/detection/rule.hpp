#ifndef PIIGUARD_DETECTION_RULE_HPP
#define PIIGUARD_DETECTION_RULE_HPP

#include <string>
#include <vector>
#include "detection/match.hpp"
#include "detection/validators.hpp"
#include "detection/mask_renderer.hpp"

/**
 * @file rule.hpp
 * @brief One PII category: a compiled pattern, an optional validator, an optional
 *        mask format and display metadata.
 *
 * Rules are immutable after construction and independent of each other.
 */

namespace piiguard {
namespace detection {

/**
 * Span labels. Rule labels are the rule names; the last two belong to the
 * keyword-proximity passes and never name a Rule.
 */
namespace labels {
const char* const kMobilePhone           = "mobile_phone";
const char* const kResidentId            = "rrn";
const char* const kEmail                 = "email";
const char* const kCard                  = "card";
const char* const kPassport              = "passport";
const char* const kDriverLicense         = "driver";
const char* const kBusinessRegistration  = "business_reg_no";
const char* const kCorporateRegistration = "corporate_reg_no";
const char* const kProject               = "project_id";
const char* const kAccount               = "account";
const char* const kCorporateKeyword      = "corporate_reg_no_keyword";
} // namespace labels

class Rule
{
public:
    /**
     * @param name        machine label, used as the Span label
     * @param displayName human readable label for reports
     * @param pattern     pattern over codepoints, Unicode-aware \b \d \s
     * @param validator   filter applied to each match
     * @param mask        token format used by the redactor
     * @param displayTag  highlight colour used by the formatter
     * @throw std::runtime_error if the pattern does not compile
     */
    Rule(std::string name,
         std::string displayName,
         std::wstring pattern,
         ValidatorKind validator,
         MaskKind mask,
         std::string displayTag)
        : name_(std::move(name)),
          displayName_(std::move(displayName)),
          pattern_(std::move(pattern)),
          validator_(validator),
          mask_(mask),
          displayTag_(std::move(displayTag))
    {
    }

    const std::string& name() const { return name_; }
    const std::string& displayName() const { return displayName_; }
    const std::string& displayTag() const { return displayTag_; }
    const std::wstring& patternSource() const { return pattern_.source(); }
    const Pattern& pattern() const { return pattern_; }
    ValidatorKind validator() const { return validator_; }
    MaskKind mask() const { return mask_; }
    bool hasMask() const { return mask_ != MaskKind::None; }

    /// False when the validator rejects the match.
    bool accepts(const Match &m) const
    {
        return runValidator(validator_, m.text);
    }

    /// Mask token for an accepted match; rejected matches render as themselves.
    std::wstring render(const Match &m) const
    {
        if (!accepts(m)) {
            return m.text;
        }
        return renderMask(mask_, m);
    }

private:
    std::string name_;
    std::string displayName_;
    Pattern pattern_;
    ValidatorKind validator_;
    MaskKind mask_;
    std::string displayTag_;
};

/**
 * An ordered selection of registry rules, always in registration order.
 * The pointers stay valid for the lifetime of the owning RuleRegistry.
 */
using RuleSet = std::vector<const Rule*>;

} // namespace detection
} // namespace piiguard

#endif // PIIGUARD_DETECTION_RULE_HPP
