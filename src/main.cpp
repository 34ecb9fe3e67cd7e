#include <iostream>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>
#include <stdexcept>

#include "config/engine_config.hpp"
#include "detection/rule_registry.hpp"
#include "engine/pii_engine.hpp"
#include "report/formatter.hpp"
#include "util/config_parser.hpp"
#include "util/logger.hpp"
#include "util/utf8.hpp"

namespace {

namespace logger = piiguard::util::logger;

const int kExitOk = 0;
const int kExitFailure = 1;
const int kExitUsage = 2;

void printUsage()
{
    std::cerr <<
        "Usage: piiguard [options] <command> [args]\n"
        "\n"
        "Commands:\n"
        "  detect <input> [--pretty]        print detected spans as JSON\n"
        "  redact <input> [-o <output>]     write masked text (default <input>.sanitized.txt)\n"
        "  annotate <input> [-o <output>]   write highlight HTML (default <input>.annotated.html)\n"
        "  summary <input>                  print detection counts per category\n"
        "  rules                            list the rule catalogue\n"
        "\n"
        "Options:\n"
        "  --config <file>          key=value settings file\n"
        "  --rules <a,b,...>        enable only these rules\n"
        "  --window <n>             account keyword window in characters (default 50)\n"
        "  --no-account             disable the keyword-anchored account pass\n"
        "  --corporate-keyword      enable the corporate registration keyword pass\n"
        "  --parallel               scan rules on a worker pool\n"
        "  --verbose                log at debug level\n";
}

/// Thrown for command line mistakes; reported with the usage text.
struct UsageError : std::runtime_error
{
    explicit UsageError(const std::string &msg) : std::runtime_error(msg) {}
};

struct CommandLine
{
    std::string configPath;
    std::string command;
    std::string input;
    std::string output;
    bool pretty = false;
    bool verbose = false;

    // flag overrides applied after the config file
    bool hasRules = false;
    std::vector<std::string> rules;
    bool hasWindow = false;
    size_t window = 0;
    bool noAccount = false;
    bool corporateKeyword = false;
    bool parallel = false;
};

CommandLine parseCommandLine(int argc, char **argv)
{
    CommandLine cl;
    std::vector<std::string> positional;

    auto needValue = [&](int &i, const std::string &flag) -> std::string {
        if (i + 1 >= argc) {
            throw UsageError("missing value for " + flag);
        }
        return argv[++i];
    };

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config") {
            cl.configPath = needValue(i, arg);
        } else if (arg == "--rules") {
            cl.hasRules = true;
            cl.rules = piiguard::util::ConfigParser::splitList(needValue(i, arg));
        } else if (arg == "--window") {
            cl.hasWindow = true;
            cl.window = static_cast<size_t>(piiguard::util::ConfigParser::parseUInt(needValue(i, arg)));
        } else if (arg == "--no-account") {
            cl.noAccount = true;
        } else if (arg == "--corporate-keyword") {
            cl.corporateKeyword = true;
        } else if (arg == "--parallel") {
            cl.parallel = true;
        } else if (arg == "--verbose") {
            cl.verbose = true;
        } else if (arg == "--pretty") {
            cl.pretty = true;
        } else if (arg == "-o" || arg == "--output") {
            cl.output = needValue(i, arg);
        } else if (arg == "-h" || arg == "--help") {
            cl.command = "help";
            return cl;
        } else if (!arg.empty() && arg[0] == '-') {
            throw UsageError("unknown option " + arg);
        } else {
            positional.push_back(arg);
        }
    }

    if (positional.empty()) {
        throw UsageError("missing command");
    }
    cl.command = positional[0];
    if (cl.command == "rules") {
        if (positional.size() != 1) {
            throw UsageError("'rules' takes no arguments");
        }
    } else if (cl.command == "detect" || cl.command == "redact"
               || cl.command == "annotate" || cl.command == "summary") {
        if (positional.size() != 2) {
            throw UsageError("'" + cl.command + "' takes exactly one input file");
        }
        cl.input = positional[1];
    } else {
        throw UsageError("unknown command '" + cl.command + "'");
    }
    return cl;
}

piiguard::config::EngineConfig buildConfig(const CommandLine &cl)
{
    piiguard::config::EngineConfig cfg;
    if (!cl.configPath.empty()) {
        piiguard::util::ConfigParser parser(cfg);
        if (!parser.loadFromFile(cl.configPath)) {
            throw std::runtime_error("cannot open config file " + cl.configPath);
        }
    }
    if (cl.hasRules)        cfg.enabledRules = cl.rules;
    if (cl.hasWindow)       cfg.proximityWindow = cl.window;
    if (cl.noAccount)       cfg.accountProximity = false;
    if (cl.corporateKeyword) cfg.corporateKeywordProximity = true;
    if (cl.parallel)        cfg.parallelScan = true;
    if (cl.verbose)         cfg.logLevel = "debug";
    return cfg;
}

/// Reads the file as bytes; invalid UTF-8 sequences are dropped.
std::wstring readText(const std::string &path)
{
    std::ifstream in(path, std::ios::in | std::ios::binary);
    if (!in.is_open()) {
        throw std::runtime_error("cannot open input file " + path);
    }
    std::ostringstream buf;
    buf << in.rdbuf();
    if (in.bad()) {
        throw std::runtime_error("failed reading input file " + path);
    }
    return piiguard::util::utf8::decode(buf.str(), piiguard::util::utf8::DecodeMode::Lenient);
}

void writeText(const std::string &path, const std::string &content)
{
    std::ofstream out(path, std::ios::out | std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
        throw std::runtime_error("cannot open output file " + path);
    }
    out << content;
    out.flush();
    if (!out) {
        throw std::runtime_error("failed writing output file " + path);
    }
}

void listRules(const piiguard::detection::RuleRegistry &registry)
{
    for (const auto &rule : registry.rules()) {
        std::cout << rule.name() << "\t" << rule.displayName()
                  << "\tvalidator=" << piiguard::detection::validatorName(rule.validator())
                  << "\t" << piiguard::util::utf8::encode(rule.patternSource()) << "\n";
    }
}

int run(const CommandLine &cl)
{
    piiguard::config::EngineConfig cfg = buildConfig(cl);
    logger::setLogLevel(logger::parseLogLevel(cfg.logLevel));
    if (!cfg.logFile.empty()) {
        logger::enableFileOutput(cfg.logFile, true);
    }

    const auto &registry = piiguard::detection::RuleRegistry::defaultRegistry();
    if (cl.command == "rules") {
        listRules(registry);
        return kExitOk;
    }

    piiguard::engine::PiiEngine engine(registry, cfg);
    piiguard::detection::RuleSet rules = engine.enabledRules(cfg.enabledRules);
    piiguard::engine::ScanOptions options = piiguard::engine::ScanOptions::fromConfig(cfg);

    std::wstring text = readText(cl.input);
    logger::info("[main] " + cl.command + ": " + std::to_string(text.size()) + " characters, "
                 + std::to_string(rules.size()) + " rules");

    if (cl.command == "detect") {
        auto spans = engine.detect(text, rules, options);
        std::cout << piiguard::report::spansToJson(text, spans, cl.pretty) << std::endl;
    } else if (cl.command == "summary") {
        auto spans = engine.detect(text, rules, options);
        std::cout << piiguard::report::formatSummary(engine.summarize(spans), registry) << std::endl;
    } else if (cl.command == "annotate") {
        auto spans = engine.detect(text, rules, options);
        std::string path = cl.output.empty() ? cl.input + ".annotated.html" : cl.output;
        writeText(path, piiguard::report::annotateDocument(text, spans, registry));
        std::cout << "[OK] saved: " << path << std::endl;
    } else {
        std::string path = cl.output.empty() ? cl.input + ".sanitized.txt" : cl.output;
        writeText(path, piiguard::util::utf8::encode(engine.redact(text, rules, options)));
        std::cout << "[OK] saved: " << path << std::endl;
    }
    return kExitOk;
}

} // namespace

int main(int argc, char** argv)
{
    CommandLine cl;
    try {
        cl = parseCommandLine(argc, argv);
    } catch (const std::exception &ex) {
        std::cerr << "piiguard: " << ex.what() << "\n\n";
        printUsage();
        return kExitUsage;
    }

    if (cl.command == "help") {
        printUsage();
        return kExitOk;
    }

    try {
        return run(cl);
    } catch (const std::exception &ex) {
        logger::error(std::string("[main] ") + ex.what());
        return kExitFailure;
    }
}
