#ifndef PIIGUARD_DETECTION_RULE_REGISTRY_HPP
#define PIIGUARD_DETECTION_RULE_REGISTRY_HPP

#include <string>
#include <vector>
#include <unordered_map>
#include <unordered_set>
#include <stdexcept>
#include "detection/rule.hpp"

/**
 * @file rule_registry.hpp
 * @brief The ordered, immutable rule catalogue.
 *
 * DESIGN:
 *   - defaultRegistry() builds the fixed catalogue once (function-local static, so
 *     initialisation is thread-safe) and hands out a const reference. Nothing
 *     mutates it afterwards, so concurrent scans share it without locking.
 *   - Registration order matters in two places: the redactor applies rules in this
 *     order, and the resolver breaks (start, end) ties in favour of the earlier rule.
 *
 * USAGE:
 *   @code
 *   const auto &registry = piiguard::detection::RuleRegistry::defaultRegistry();
 *   auto enabled = registry.select({"mobile_phone", "email"});
 *   @endcode
 */

namespace piiguard {
namespace detection {

class RuleRegistry
{
public:
    /**
     * @throw std::runtime_error on duplicate rule names.
     */
    explicit RuleRegistry(std::vector<Rule> rules)
        : rules_(std::move(rules))
    {
        for (size_t i = 0; i < rules_.size(); ++i) {
            if (!index_.emplace(rules_[i].name(), i).second) {
                throw std::runtime_error("RuleRegistry: duplicate rule name '" + rules_[i].name() + "'");
            }
        }
    }

    RuleRegistry(const RuleRegistry&) = delete;
    RuleRegistry& operator=(const RuleRegistry&) = delete;

    /**
     * @brief The built-in catalogue of nine rules.
     */
    static const RuleRegistry& defaultRegistry()
    {
        static const RuleRegistry instance(defaultRules());
        return instance;
    }

    const std::vector<Rule>& rules() const { return rules_; }
    size_t size() const { return rules_.size(); }

    RuleSet all() const
    {
        RuleSet out;
        out.reserve(rules_.size());
        for (const Rule &r : rules_) {
            out.push_back(&r);
        }
        return out;
    }

    /**
     * @brief The named rules, in registration order whatever order @p names uses.
     *        Duplicate names select the rule once.
     * @throw std::runtime_error on an unknown name.
     */
    RuleSet select(const std::vector<std::string> &names) const
    {
        std::unordered_set<std::string> wanted;
        for (const std::string &n : names) {
            if (index_.find(n) == index_.end()) {
                throw std::runtime_error("RuleRegistry: unknown rule '" + n + "'");
            }
            wanted.insert(n);
        }

        RuleSet out;
        for (const Rule &r : rules_) {
            if (wanted.count(r.name())) {
                out.push_back(&r);
            }
        }
        return out;
    }

    /// nullptr when no rule has that name.
    const Rule* find(const std::string &name) const
    {
        auto it = index_.find(name);
        return it == index_.end() ? nullptr : &rules_[it->second];
    }

    /**
     * @brief Highlight colour for a span label. The account label has its own colour;
     *        any other label without a rule, corporate keyword spans included, gets the
     *        default highlight.
     */
    std::string displayTagFor(const std::string &label) const
    {
        if (const Rule *r = find(label)) {
            return r->displayTag();
        }
        if (label == labels::kAccount) {
            return "#ffe082";
        }
        return "#ffd54f";
    }

    /**
     * @brief Human readable name for a span label; unknown labels come back as is.
     */
    std::string displayNameFor(const std::string &label) const
    {
        if (const Rule *r = find(label)) {
            return r->displayName();
        }
        if (label == labels::kAccount) {
            return "계좌(키워드근접)";
        }
        if (label == labels::kCorporateKeyword) {
            return "법인등록번호(CRN)";
        }
        return label;
    }

    /**
     * @brief The catalogue in registration order.
     */
    static std::vector<Rule> defaultRules()
    {
        std::vector<Rule> rules;
        rules.reserve(9);

        rules.emplace_back(labels::kMobilePhone, "전화번호",
            LR"(\b(01[016789])[\-\s]?\d{3,4}[\-\s]?\d{4}\b)",
            ValidatorKind::None, MaskKind::MobilePhone, "#c8e6c9");

        // YYMMDD prefix with a plausible month and day, optional dash, 7 digits
        rules.emplace_back(labels::kResidentId, "주민등록번호",
            LR"(\b\d{2}(0[1-9]|1[0-2])(0[1-9]|[12]\d|3[01])\-?\d{7}\b)",
            ValidatorKind::None, MaskKind::ResidentId, "#ffecb3");

        rules.emplace_back(labels::kEmail, "이메일",
            LR"(\b([A-Za-z0-9._%+\-]+)@([A-Za-z0-9.\-]+\.[A-Za-z]{2,})\b)",
            ValidatorKind::None, MaskKind::Email, "#bbdefb");

        rules.emplace_back(labels::kCard, "카드번호",
            LR"(\b(?:\d[ \-]?){13,19}\b)",
            ValidatorKind::Luhn, MaskKind::Card, "#ffcdd2");

        rules.emplace_back(labels::kPassport, "여권",
            LR"(\b([MSRHD]\d{8}|[A-Z]{2}\d{7})\b)",
            ValidatorKind::None, MaskKind::Passport, "#e1bee7");

        rules.emplace_back(labels::kDriverLicense, "운전면허",
            LR"(\b\d{2}-\d{2}-\d{6}-\d{2}\b|\b\d{2}-\d{6}-\d{2}\b)",
            ValidatorKind::None, MaskKind::DriverLicense, "#d7ccc8");

        rules.emplace_back(labels::kBusinessRegistration, "사업자등록번호",
            LR"(\b\d{3}[\-\s]?\d{2}[\-\s]?\d{5}\b)",
            ValidatorKind::BusinessRegistration, MaskKind::BusinessRegistration, "#fff0b3");

        // a YYMMDD-looking prefix belongs to the rrn rule
        rules.emplace_back(labels::kCorporateRegistration, "법인등록번호",
            LR"(\b\d{6}[\-\s]?\d{7}\b)",
            ValidatorKind::NotDateShaped, MaskKind::CorporateRegistration, "#e0f7fa");

        rules.emplace_back(labels::kProject, "연구과제번호",
            LR"(\b202[0-9]000\d{2}[A-Z]\b)",
            ValidatorKind::None, MaskKind::Project, "#f0b3ff");

        return rules;
    }

private:
    std::vector<Rule> rules_;
    std::unordered_map<std::string, size_t> index_;
};

} // namespace detection
} // namespace piiguard

#endif // PIIGUARD_DETECTION_RULE_REGISTRY_HPP
