#ifndef PIIGUARD_CONFIG_ENGINE_CONFIG_HPP
#define PIIGUARD_CONFIG_ENGINE_CONFIG_HPP

#include <string>
#include <vector>
#include <cstddef>

/**
 * @file engine_config.hpp
 * @brief Run-time settings of the detection/redaction engine and the CLI around it.
 *
 * USAGE:
 *   - Populated with defaults, then optionally through util/config_parser.hpp,
 *     then by command line flags.
 */

namespace piiguard {
namespace config {

/**
 * @struct EngineConfig
 * @brief Holds the engine settings:
 *   - enabledRules: rule names to apply; empty means the whole catalogue.
 *   - accountProximity: run the keyword-anchored account pass.
 *   - proximityWindow: codepoints searched after each account anchor.
 *   - corporateKeywordProximity: run the corporate-registration keyword pass (detection only).
 *   - parallelScan / threadCount: scan rules concurrently on a pool.
 *   - logLevel / logFile: logger settings.
 */
struct EngineConfig
{
    EngineConfig()
        : accountProximity(true),
          proximityWindow(50),
          corporateKeywordProximity(false),
          parallelScan(false),
          threadCount(0),
          logLevel("warn")
    {
    }

    std::vector<std::string> enabledRules;

    bool accountProximity;

    /// Window length in codepoints, counted from the end of the anchor keyword.
    size_t proximityWindow;

    bool corporateKeywordProximity;

    bool parallelScan;

    /// Worker count for parallelScan; 0 selects hardware concurrency.
    size_t threadCount;

    std::string logLevel;

    /// Optional log file in addition to stderr.
    std::string logFile;
};

} // namespace config
} // namespace piiguard

#endif // PIIGUARD_CONFIG_ENGINE_CONFIG_HPP
