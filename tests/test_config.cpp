/**
 * @file test_config.cpp
 * @brief Unit tests for Keytree::ConfigManager and Keytree::Logger using Catch2.
 * @author Keytree Project
 * @date 2026
 */

#define CATCH_CONFIG_MAIN
#include <catch2/catch.hpp>

#include "../include/config_manager.hpp"
#include "../include/logger.hpp"
#include "../include/xkeys.hpp"

#include <sstream>
#include <stdexcept>
#include <string>

using namespace Keytree;

TEST_CASE("ConfigManager parses .env style content", "[config]") {
    ConfigManager::clear();
    ConfigManager::loadFromString(
        "# derivation settings\n"
        "KEYTREE_BACKEND = openssl\n"
        "\n"
        "   KEYTREE_HINT=legacy   \n"
        "not a setting\n"
        "KEYTREE_HMAC_KEY=Bitcoin seed\n"
        "EMPTY=\n"
        "=orphan\n");

    REQUIRE(ConfigManager::getOr("KEYTREE_BACKEND", "secp256k1") == "openssl");
    REQUIRE(ConfigManager::getOrThrow("KEYTREE_HINT") == "legacy");
    REQUIRE(ConfigManager::getOrThrow("KEYTREE_HMAC_KEY") == "Bitcoin seed");
    REQUIRE(ConfigManager::get("EMPTY").has_value());
    REQUIRE(ConfigManager::get("EMPTY")->empty());
    REQUIRE_FALSE(ConfigManager::get("not a setting").has_value());
    REQUIRE_FALSE(ConfigManager::get("").has_value());

    REQUIRE(ConfigManager::getOr("KEYTREE_LOG_LEVEL", "info") == "info");
    REQUIRE_THROWS_AS(ConfigManager::getOrThrow("KEYTREE_LOG_PATH"), std::runtime_error);

    ConfigManager::clear();
    REQUIRE_FALSE(ConfigManager::get("KEYTREE_BACKEND").has_value());
}

TEST_CASE("ConfigManager typed getters fall back on bad values", "[config]") {
    ConfigManager::clear();
    ConfigManager::set("COUNT", "42");
    ConfigManager::set("NEGATIVE", "-7");
    ConfigManager::set("TRAILING", "12abc");
    ConfigManager::set("ENABLED", "Yes");
    ConfigManager::set("DISABLED", "0");
    ConfigManager::set("MAYBE", "perhaps");

    REQUIRE(ConfigManager::getIntOr("COUNT", 0) == 42);
    REQUIRE(ConfigManager::getIntOr("NEGATIVE", 0) == -7);
    REQUIRE(ConfigManager::getIntOr("TRAILING", 5) == 5);
    REQUIRE(ConfigManager::getIntOr("MISSING", 9) == 9);

    REQUIRE(ConfigManager::getBoolOr("ENABLED", false));
    REQUIRE_FALSE(ConfigManager::getBoolOr("DISABLED", true));
    REQUIRE(ConfigManager::getBoolOr("MAYBE", true));
    REQUIRE_FALSE(ConfigManager::getBoolOr("MISSING", false));

    ConfigManager::clear();
}

TEST_CASE("ConfigManager::initialize reports a missing file", "[config]") {
    ConfigManager::set("STALE", "1");
    REQUIRE_FALSE(ConfigManager::initialize("/nonexistent/keytree.env"));
    REQUIRE_FALSE(ConfigManager::get("STALE").has_value());
}

TEST_CASE("Hint names round-trip through configuration strings", "[config][xkeys]") {
    REQUIRE(hintFromString("legacy") == Hint::Legacy);
    REQUIRE(hintFromString("Compatibility") == Hint::Compatibility);
    REQUIRE(hintFromString("SEGWIT") == Hint::SegWit);
    REQUIRE(hintToString(Hint::Compatibility) == "compatibility");
    REQUIRE_THROWS_AS(hintFromString("taproot"), std::invalid_argument);
}

TEST_CASE("Logger filters by level and formats entries", "[logger]") {
    std::ostringstream out;
    Logger::initializeStream(out, LogLevel::WARNING);

    REQUIRE_FALSE(Logger::enabled(LogLevel::INFO));
    REQUIRE(Logger::enabled(LogLevel::ERROR));

    Logger::info("hidden", __FILE__, __LINE__);
    Logger::warning("shown", __FILE__, __LINE__);

    const std::string text = out.str();
    REQUIRE(text.find("hidden") == std::string::npos);
    REQUIRE(text.find("[WARN] test_config.cpp:") != std::string::npos);
    REQUIRE(text.find(" - shown\n") != std::string::npos);

    Logger::shutdown();
    REQUIRE_FALSE(Logger::enabled(LogLevel::CRITICAL));

    Logger::error("after shutdown", __FILE__, __LINE__);
    REQUIRE(out.str() == text);
}

TEST_CASE("Logger per-level helpers", "[logger]") {
    std::ostringstream out;
    Logger::initializeStream(out, LogLevel::DEBUG);

    Logger::debug("d", __FILE__, __LINE__);
    Logger::info("i", __FILE__, __LINE__);
    Logger::error("e", __FILE__, __LINE__);
    Logger::critical("backend unusable", __FILE__, __LINE__);
    Logger::warning("no location");
    Logger::shutdown();

    const std::string text = out.str();
    REQUIRE(text.find("[DEBUG] test_config.cpp:") != std::string::npos);
    REQUIRE(text.find("[INFO] test_config.cpp:") != std::string::npos);
    REQUIRE(text.find("[ERROR] test_config.cpp:") != std::string::npos);
    REQUIRE(text.find("[CRIT] test_config.cpp:") != std::string::npos);
    REQUIRE(text.find(" - backend unusable\n") != std::string::npos);
    REQUIRE(text.find("[WARN] - no location\n") != std::string::npos);
}

TEST_CASE("Logger level names", "[logger]") {
    REQUIRE(Logger::levelFromString("debug") == LogLevel::DEBUG);
    REQUIRE(Logger::levelFromString("INFO") == LogLevel::INFO);
    REQUIRE(Logger::levelFromString("warn") == LogLevel::WARNING);
    REQUIRE(Logger::levelFromString("Critical") == LogLevel::CRITICAL);
    REQUIRE(Logger::levelToString(LogLevel::ERROR) == "ERROR");
    REQUIRE_THROWS_AS(Logger::levelFromString("verbose"), std::invalid_argument);
}

TEST_CASE("Logger::initialize rejects an unwritable path", "[logger]") {
    REQUIRE_THROWS_AS(Logger::initialize("/nonexistent/dir/keytree.log"), std::runtime_error);
    REQUIRE_FALSE(Logger::enabled(LogLevel::CRITICAL));
}
