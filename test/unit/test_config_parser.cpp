// test/unit/test_config_parser.cpp
// -----------------------------------------------------------
// key=value settings parsing into EngineConfig.

#include <gtest/gtest.h>
#include <sstream>
#include <stdexcept>
#include <string>

#include "util/config_parser.hpp"

namespace {

using piiguard::config::EngineConfig;
using piiguard::util::ConfigParser;

TEST(ConfigParserTest, DefaultsAreUntouchedByEmptyInput) {
    EngineConfig cfg;
    ConfigParser parser(cfg);
    std::istringstream in("\n# only a comment\n   \n");
    parser.loadFromStream(in);
    EXPECT_TRUE(cfg.enabledRules.empty());
    EXPECT_TRUE(cfg.accountProximity);
    EXPECT_EQ(cfg.proximityWindow, (size_t)50);
    EXPECT_FALSE(cfg.corporateKeywordProximity);
    EXPECT_FALSE(cfg.parallelScan);
    EXPECT_EQ(cfg.logLevel, "warn");
}

TEST(ConfigParserTest, LoadsAllKeys) {
    EngineConfig cfg;
    ConfigParser parser(cfg);
    std::istringstream in(
        "# engine settings\n"
        "enabledRules = mobile_phone, email ,card\n"
        "accountProximity=no\n"
        "proximityWindow=80\n"
        "corporateKeywordProximity=ON\n"
        "parallelScan=true\n"
        "threadCount=3\n"
        "logLevel=debug\n"
        "logFile=/tmp/piiguard.log\n");
    parser.loadFromStream(in);

    ASSERT_EQ(cfg.enabledRules.size(), (size_t)3);
    EXPECT_EQ(cfg.enabledRules[0], "mobile_phone");
    EXPECT_EQ(cfg.enabledRules[1], "email");
    EXPECT_EQ(cfg.enabledRules[2], "card");
    EXPECT_FALSE(cfg.accountProximity);
    EXPECT_EQ(cfg.proximityWindow, (size_t)80);
    EXPECT_TRUE(cfg.corporateKeywordProximity);
    EXPECT_TRUE(cfg.parallelScan);
    EXPECT_EQ(cfg.threadCount, (size_t)3);
    EXPECT_EQ(cfg.logLevel, "debug");
    EXPECT_EQ(cfg.logFile, "/tmp/piiguard.log");
}

TEST(ConfigParserTest, UnknownKeyIsIgnored) {
    EngineConfig cfg;
    ConfigParser parser(cfg);
    std::istringstream in("colour=blue\nproximityWindow=10\n");
    EXPECT_NO_THROW(parser.loadFromStream(in));
    EXPECT_EQ(cfg.proximityWindow, (size_t)10);
}

TEST(ConfigParserTest, MissingFileReturnsFalse) {
    EngineConfig cfg;
    ConfigParser parser(cfg);
    EXPECT_FALSE(parser.loadFromFile("/nonexistent/dir/piiguard.conf"));
    EXPECT_EQ(cfg.proximityWindow, (size_t)50);
}

TEST(ConfigParserTest, MalformedInputThrows) {
    EngineConfig cfg;
    ConfigParser parser(cfg);

    std::istringstream noEquals("proximityWindow=10\njust some words\n");
    EXPECT_THROW(parser.loadFromStream(noEquals), std::runtime_error);

    std::istringstream badBool("accountProximity=maybe\n");
    EXPECT_THROW(parser.loadFromStream(badBool), std::runtime_error);

    std::istringstream badNumber("proximityWindow=fifty\n");
    EXPECT_THROW(parser.loadFromStream(badNumber), std::runtime_error);

    std::istringstream badLevel("logLevel=loud\n");
    EXPECT_THROW(parser.loadFromStream(badLevel), std::runtime_error);
}

TEST(ConfigParserTest, SplitList) {
    auto items = ConfigParser::splitList(" a, ,b ,, c ");
    ASSERT_EQ(items.size(), (size_t)3);
    EXPECT_EQ(items[0], "a");
    EXPECT_EQ(items[1], "b");
    EXPECT_EQ(items[2], "c");
    EXPECT_TRUE(ConfigParser::splitList("").empty());
}

TEST(ConfigParserTest, ParseUInt) {
    EXPECT_EQ(ConfigParser::parseUInt("0"), (uint64_t)0);
    EXPECT_EQ(ConfigParser::parseUInt("1234"), (uint64_t)1234);
    EXPECT_THROW(ConfigParser::parseUInt("-1"), std::runtime_error);
    EXPECT_THROW(ConfigParser::parseUInt("12a"), std::runtime_error);
    EXPECT_THROW(ConfigParser::parseUInt(""), std::runtime_error);
}

TEST(ConfigParserTest, ParseBool) {
    EXPECT_TRUE(ConfigParser::parseBool("Yes"));
    EXPECT_TRUE(ConfigParser::parseBool("1"));
    EXPECT_FALSE(ConfigParser::parseBool("OFF"));
    EXPECT_FALSE(ConfigParser::parseBool("false"));
    EXPECT_THROW(ConfigParser::parseBool(""), std::runtime_error);
}

} // anonymous namespace
