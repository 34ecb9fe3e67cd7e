#ifndef PIIGUARD_ENGINE_PII_ENGINE_HPP
#define PIIGUARD_ENGINE_PII_ENGINE_HPP

#include <string>
#include <vector>
#include <memory>
#include "config/engine_config.hpp"
#include "detection/rule_registry.hpp"
#include "detection/primary_scanner.hpp"
#include "detection/proximity_scanner.hpp"
#include "detection/span_resolver.hpp"
#include "redaction/redactor.hpp"
#include "report/formatter.hpp"
#include "util/thread_pool.hpp"
#include "util/utf8.hpp"
#include "util/logger.hpp"

/**
 * @file pii_engine.hpp
 * @brief The two engine operations, detect() and redact().
 *
 * DESIGN GOALS:
 *   - Stateless per call: nothing about one text survives into the next call.
 *   - The registry is borrowed, never copied or modified.
 *   - detect() = PrimaryScanner + ProximityScanner -> SpanResolver.
 *   - redact() = Redactor, an independent substitution pass (see redactor.hpp for how
 *     its output can diverge from detect()'s labels).
 *   - UTF-8 overloads decode once, strictly, and report codepoint offsets.
 *
 * USAGE EXAMPLE:
 *   @code
 *   using namespace piiguard;
 *   engine::PiiEngine engine;
 *   auto rules = engine.enabledRules({"mobile_phone", "email"});
 *   engine::ScanOptions options;                  // account pass on, window 50
 *   auto spans = engine.detect(text, rules, options);
 *   std::string masked = engine.redact(text, rules, options);
 *   @endcode
 */

namespace piiguard {
namespace engine {

/**
 * @struct ScanOptions
 * @brief Per-call switches shared by detect() and redact().
 */
struct ScanOptions
{
    bool accountProximity = true;
    size_t proximityWindow = 50;
    /// Detection only; the redactor has no corporate keyword pass.
    bool corporateKeywordProximity = false;

    static ScanOptions fromConfig(const piiguard::config::EngineConfig &cfg)
    {
        ScanOptions options;
        options.accountProximity = cfg.accountProximity;
        options.proximityWindow = cfg.proximityWindow;
        options.corporateKeywordProximity = cfg.corporateKeywordProximity;
        return options;
    }
};

class PiiEngine
{
public:
    /**
     * @brief Sequential engine over the default catalogue.
     */
    PiiEngine()
        : registry_(detection::RuleRegistry::defaultRegistry())
    {
    }

    /**
     * @brief Engine over @p registry; starts a worker pool when cfg.parallelScan is set.
     */
    PiiEngine(const detection::RuleRegistry &registry, const piiguard::config::EngineConfig &cfg)
        : registry_(registry)
    {
        if (cfg.parallelScan) {
            pool_ = std::make_unique<piiguard::util::ThreadPool>(cfg.threadCount);
            piiguard::util::logger::info("PiiEngine: parallel scan with "
                + std::to_string(pool_->size()) + " workers");
        }
    }

    PiiEngine(const PiiEngine&) = delete;
    PiiEngine& operator=(const PiiEngine&) = delete;

    const detection::RuleRegistry& registry() const { return registry_; }

    bool isParallel() const { return pool_ != nullptr; }

    /**
     * @brief The rules named in @p names, or the whole catalogue when @p names is empty.
     * @throw std::runtime_error on an unknown name.
     */
    detection::RuleSet enabledRules(const std::vector<std::string> &names) const
    {
        return names.empty() ? registry_.all() : registry_.select(names);
    }

    /**
     * @brief Resolved spans for @p text, offsets in codepoints.
     */
    detection::ResolvedSpanSet detect(const std::wstring &text,
                                      const detection::RuleSet &rules,
                                      const ScanOptions &options) const
    {
        if (text.empty()) {
            return {};
        }

        std::vector<detection::Span> candidates = primary_.scan(text, rules, pool_.get());

        detection::ProximityScanner proximity(options.proximityWindow);
        if (options.accountProximity) {
            auto accounts = proximity.scanAccounts(text);
            candidates.insert(candidates.end(), accounts.begin(), accounts.end());
        }
        if (options.corporateKeywordProximity) {
            auto corporate = proximity.scanCorporate(text);
            candidates.insert(candidates.end(), corporate.begin(), corporate.end());
        }

        return resolver_.resolve(std::move(candidates));
    }

    /**
     * @brief UTF-8 overload; offsets are still codepoints.
     * @throw std::runtime_error if @p utf8Text is not valid UTF-8.
     */
    detection::ResolvedSpanSet detect(const std::string &utf8Text,
                                      const detection::RuleSet &rules,
                                      const ScanOptions &options) const
    {
        return detect(piiguard::util::utf8::decode(utf8Text), rules, options);
    }

    std::wstring redact(const std::wstring &text,
                        const detection::RuleSet &rules,
                        const ScanOptions &options) const
    {
        if (text.empty()) {
            return text;
        }
        redaction::Redactor redactor(options.proximityWindow);
        return redactor.redact(text, rules, options.accountProximity);
    }

    /**
     * @throw std::runtime_error if @p utf8Text is not valid UTF-8.
     */
    std::string redact(const std::string &utf8Text,
                       const detection::RuleSet &rules,
                       const ScanOptions &options) const
    {
        return piiguard::util::utf8::encode(
            redact(piiguard::util::utf8::decode(utf8Text), rules, options));
    }

    /**
     * @brief Occurrences per label, in order of first appearance.
     */
    static report::LabelCounts summarize(const detection::ResolvedSpanSet &spans)
    {
        return report::countByLabel(spans);
    }

private:
    const detection::RuleRegistry &registry_;
    detection::PrimaryScanner primary_;
    detection::SpanResolver resolver_;
    std::unique_ptr<piiguard::util::ThreadPool> pool_;
};

} // namespace engine
} // namespace piiguard

#endif // PIIGUARD_ENGINE_PII_ENGINE_HPP
