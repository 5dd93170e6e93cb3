// Copyright (c) 2025 The peerdial developers
// Unit tests for DialConfig defaults, JSON loading and option parsing

#include <catch2/catch_test_macros.hpp>
#include "network/dial_config.hpp"
#include <nlohmann/json.hpp>
#include <filesystem>
#include <fstream>

using namespace peerdial::network;
using json = nlohmann::json;

namespace {

void WriteFile(const std::string& filepath, const std::string& content) {
    std::ofstream file(filepath);
    file << content;
    file.close();
}

} // anonymous namespace

TEST_CASE("DialConfig - defaults", "[network][dial][config]") {
    DialConfig config;
    CHECK(config.max_parallel_dials == 100);
    CHECK(config.max_cold_calls == 50);
    CHECK(config.clean_interval == std::chrono::minutes(15));
}

TEST_CASE("DialConfig - ParseDialConfig accepts valid documents", "[network][dial][config]") {
    SECTION("All fields") {
        json root;
        root["max_parallel_dials"] = 8;
        root["max_cold_calls"] = 3;
        root["clean_interval_sec"] = 60;

        auto config = ParseDialConfig(root.dump(2));
        REQUIRE(config.has_value());
        CHECK(config->max_parallel_dials == 8);
        CHECK(config->max_cold_calls == 3);
        CHECK(config->clean_interval == std::chrono::seconds(60));
    }

    SECTION("Missing fields keep their defaults") {
        auto config = ParseDialConfig(R"({"max_cold_calls": 0})");
        REQUIRE(config.has_value());
        CHECK(config->max_parallel_dials == DialConfig::DEFAULT_MAX_PARALLEL_DIALS);
        CHECK(config->max_cold_calls == 0);
        CHECK(config->clean_interval == DialConfig::DEFAULT_CLEAN_INTERVAL);
    }

    SECTION("Empty object is all defaults") {
        auto config = ParseDialConfig("{}");
        REQUIRE(config.has_value());
        CHECK(config->max_parallel_dials == DialConfig::DEFAULT_MAX_PARALLEL_DIALS);
    }

    SECTION("Unknown keys are ignored") {
        auto config = ParseDialConfig(R"({"max_parallel_dials": 4, "comment": "lab node"})");
        REQUIRE(config.has_value());
        CHECK(config->max_parallel_dials == 4);
    }

    SECTION("Bounds are inclusive") {
        auto config = ParseDialConfig(
            R"({"max_parallel_dials": 100000, "max_cold_calls": 100000, "clean_interval_sec": 604800})");
        REQUIRE(config.has_value());
        CHECK(config->max_parallel_dials == 100000);
        CHECK(config->clean_interval == std::chrono::seconds(604800));
    }
}

TEST_CASE("DialConfig - ParseDialConfig rejects invalid documents", "[network][dial][config]") {
    SECTION("Malformed JSON") {
        CHECK_FALSE(ParseDialConfig("{\"max_parallel_dials\": ").has_value());
    }

    SECTION("Top-level value is not an object") {
        CHECK_FALSE(ParseDialConfig("[1, 2, 3]").has_value());
        CHECK_FALSE(ParseDialConfig("42").has_value());
    }

    SECTION("Zero parallel dials") {
        CHECK_FALSE(ParseDialConfig(R"({"max_parallel_dials": 0})").has_value());
    }

    SECTION("Negative cold call limit") {
        CHECK_FALSE(ParseDialConfig(R"({"max_cold_calls": -1})").has_value());
    }

    SECTION("Interval out of range") {
        CHECK_FALSE(ParseDialConfig(R"({"clean_interval_sec": 0})").has_value());
        CHECK_FALSE(ParseDialConfig(R"({"clean_interval_sec": 604801})").has_value());
    }

    SECTION("Wrong value types") {
        CHECK_FALSE(ParseDialConfig(R"({"max_parallel_dials": "100"})").has_value());
        CHECK_FALSE(ParseDialConfig(R"({"max_cold_calls": 2.5})").has_value());
        CHECK_FALSE(ParseDialConfig(R"({"clean_interval_sec": null})").has_value());
    }

    SECTION("One bad field rejects the whole document") {
        CHECK_FALSE(ParseDialConfig(R"({"max_parallel_dials": 10, "max_cold_calls": 1000001})").has_value());
    }
}

TEST_CASE("DialConfig - LoadDialConfig", "[network][dial][config]") {
    const std::string test_file = "/tmp/test_peerdial_dial_config.json";
    std::filesystem::remove(test_file);

    SECTION("Missing file yields defaults") {
        auto config = LoadDialConfig(test_file);
        REQUIRE(config.has_value());
        CHECK(config->max_parallel_dials == DialConfig::DEFAULT_MAX_PARALLEL_DIALS);
        CHECK(config->max_cold_calls == DialConfig::DEFAULT_MAX_COLD_CALLS);
    }

    SECTION("Valid file") {
        WriteFile(test_file, R"({"max_parallel_dials": 12, "clean_interval_sec": 30})");
        auto config = LoadDialConfig(test_file);
        REQUIRE(config.has_value());
        CHECK(config->max_parallel_dials == 12);
        CHECK(config->max_cold_calls == DialConfig::DEFAULT_MAX_COLD_CALLS);
        CHECK(config->clean_interval == std::chrono::seconds(30));
    }

    SECTION("Corrupted file is an error, not a silent default") {
        WriteFile(test_file, "not json at all");
        CHECK_FALSE(LoadDialConfig(test_file).has_value());
    }

    std::filesystem::remove(test_file);
}

TEST_CASE("DialConfig - ApplyDialOption", "[network][dial][config]") {
    DialConfig config;

    SECTION("Recognized options") {
        CHECK(ApplyDialOption(config, "--maxparalleldials=25"));
        CHECK(ApplyDialOption(config, "--maxcoldcalls=0"));
        CHECK(ApplyDialOption(config, "--dialcleaninterval=120"));
        CHECK(config.max_parallel_dials == 25);
        CHECK(config.max_cold_calls == 0);
        CHECK(config.clean_interval == std::chrono::seconds(120));
    }

    SECTION("Invalid values leave the config unchanged") {
        CHECK_FALSE(ApplyDialOption(config, "--maxparalleldials=0"));
        CHECK_FALSE(ApplyDialOption(config, "--maxparalleldials=abc"));
        CHECK_FALSE(ApplyDialOption(config, "--maxcoldcalls=-3"));
        CHECK_FALSE(ApplyDialOption(config, "--maxcoldcalls="));
        CHECK_FALSE(ApplyDialOption(config, "--dialcleaninterval=10s"));
        CHECK_FALSE(ApplyDialOption(config, "--dialcleaninterval=604801"));
        CHECK(config.max_parallel_dials == DialConfig::DEFAULT_MAX_PARALLEL_DIALS);
        CHECK(config.max_cold_calls == DialConfig::DEFAULT_MAX_COLD_CALLS);
        CHECK(config.clean_interval == DialConfig::DEFAULT_CLEAN_INTERVAL);
    }

    SECTION("Unknown option") {
        CHECK_FALSE(ApplyDialOption(config, "--maxpeers=10"));
        CHECK_FALSE(ApplyDialOption(config, "maxparalleldials=10"));
    }
}
