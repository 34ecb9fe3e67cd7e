#ifndef PIIGUARD_UTIL_CONFIG_PARSER_HPP
#define PIIGUARD_UTIL_CONFIG_PARSER_HPP

#include <string>
#include <vector>
#include <fstream>
#include <istream>
#include <stdexcept>
#include <cstdint>
#include <algorithm>
#include <cctype>
#include "config/engine_config.hpp"
#include "util/logger.hpp"

/**
 * @file config_parser.hpp
 * @brief Reads a "key=value" settings file into piiguard::config::EngineConfig.
 *
 * FORMAT:
 *   # comment
 *   enabledRules=mobile_phone,email,card
 *   proximityWindow=50
 *   accountProximity=true
 *
 * Blank lines and lines starting with '#' are skipped. A missing file is not an
 * error (defaults stay in place); a malformed line or value is.
 *
 * USAGE:
 *   @code
 *   piiguard::config::EngineConfig cfg;
 *   piiguard::util::ConfigParser parser(cfg);
 *   parser.loadFromFile("piiguard.conf");
 *   @endcode
 */

namespace piiguard {
namespace util {

/**
 * @class ConfigParser
 * @brief Applies recognised keys to a referenced EngineConfig.
 */
class ConfigParser
{
public:
    explicit ConfigParser(piiguard::config::EngineConfig &engineConfig)
        : engineConfig_(engineConfig)
    {
    }

    /**
     * @brief Parse the given file. Returns false (and logs a warning) if it cannot be opened.
     * @throw std::runtime_error on malformed lines or values.
     */
    inline bool loadFromFile(const std::string &filepath)
    {
        std::ifstream inFile(filepath);
        if (!inFile.is_open()) {
            piiguard::util::logger::warn("ConfigParser: File not found: " + filepath);
            return false;
        }

        piiguard::util::logger::info("ConfigParser: Loading config from " + filepath);
        loadFromStream(inFile);
        piiguard::util::logger::info("ConfigParser: Config loaded.");
        return true;
    }

    /**
     * @brief Parse key=value lines from any stream.
     * @throw std::runtime_error on malformed lines or values.
     */
    inline void loadFromStream(std::istream &in)
    {
        std::string line;
        size_t lineNo = 0;
        while (std::getline(in, line)) {
            ++lineNo;
            trim(line);

            if (line.empty() || line[0] == '#') {
                continue;
            }

            auto pos = line.find('=');
            if (pos == std::string::npos) {
                throw std::runtime_error("ConfigParser: invalid line " + std::to_string(lineNo)
                                         + " (no '='): " + line);
            }
            std::string key = line.substr(0, pos);
            std::string val = line.substr(pos + 1);
            trim(key);
            trim(val);

            applyKeyValue(key, val);
        }
    }

    /**
     * @brief Split a comma separated list, trimming each entry and dropping empties.
     */
    static std::vector<std::string> splitList(const std::string &val)
    {
        std::vector<std::string> out;
        size_t begin = 0;
        while (begin <= val.size()) {
            size_t comma = val.find(',', begin);
            if (comma == std::string::npos) {
                comma = val.size();
            }
            std::string item = val.substr(begin, comma - begin);
            trim(item);
            if (!item.empty()) {
                out.push_back(item);
            }
            begin = comma + 1;
        }
        return out;
    }

    /**
     * @brief Parse true/false, yes/no, on/off, 1/0 (case-insensitive).
     * @throw std::runtime_error on anything else.
     */
    static bool parseBool(const std::string &val)
    {
        std::string lower(val);
        std::transform(lower.begin(), lower.end(), lower.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        if (lower == "true" || lower == "yes" || lower == "on" || lower == "1") {
            return true;
        }
        if (lower == "false" || lower == "no" || lower == "off" || lower == "0") {
            return false;
        }
        throw std::runtime_error("ConfigParser: parseBool failed on '" + val + "'");
    }

    /**
     * @brief Parse an unsigned decimal integer. Rejects signs and trailing characters.
     * @throw std::runtime_error if invalid.
     */
    static uint64_t parseUInt(const std::string &val)
    {
        if (val.empty() || !std::isdigit(static_cast<unsigned char>(val[0]))) {
            throw std::runtime_error("ConfigParser: parseUInt failed on '" + val + "'");
        }
        try {
            size_t idx = 0;
            uint64_t n = std::stoull(val, &idx, 10);
            if (idx != val.size()) {
                throw std::runtime_error("Non-numeric suffix");
            }
            return n;
        }
        catch (const std::exception &ex) {
            throw std::runtime_error("ConfigParser: parseUInt failed on '" + val + "': " + ex.what());
        }
    }

private:
    piiguard::config::EngineConfig &engineConfig_;

    inline void applyKeyValue(const std::string &key, const std::string &val)
    {
        if (key == "enabledRules") {
            engineConfig_.enabledRules = splitList(val);
            piiguard::util::logger::debug("ConfigParser: enabledRules set ("
                + std::to_string(engineConfig_.enabledRules.size()) + " entries)");
        }
        else if (key == "accountProximity") {
            engineConfig_.accountProximity = parseBool(val);
        }
        else if (key == "proximityWindow") {
            engineConfig_.proximityWindow = static_cast<size_t>(parseUInt(val));
            piiguard::util::logger::debug("ConfigParser: proximityWindow set to "
                + std::to_string(engineConfig_.proximityWindow));
        }
        else if (key == "corporateKeywordProximity") {
            engineConfig_.corporateKeywordProximity = parseBool(val);
        }
        else if (key == "parallelScan") {
            engineConfig_.parallelScan = parseBool(val);
        }
        else if (key == "threadCount") {
            engineConfig_.threadCount = static_cast<size_t>(parseUInt(val));
        }
        else if (key == "logLevel") {
            // throws on unknown level names
            piiguard::util::logger::parseLogLevel(val);
            engineConfig_.logLevel = val;
        }
        else if (key == "logFile") {
            engineConfig_.logFile = val;
        }
        else {
            piiguard::util::logger::warn("ConfigParser: Unrecognized key '" + key + "' with value '" + val + "'");
        }
    }

    static void trim(std::string &s)
    {
        static const std::string whitespace = " \t\r\n";
        auto pos = s.find_first_not_of(whitespace);
        if (pos != std::string::npos) {
            s.erase(0, pos);
        }
        else {
            s.clear();
            return;
        }
        pos = s.find_last_not_of(whitespace);
        if (pos != std::string::npos) {
            s.erase(pos + 1);
        }
    }
};

} // namespace util
} // namespace piiguard

#endif // PIIGUARD_UTIL_CONFIG_PARSER_HPP
