// =============================================================================
// profile_loader_test.cpp
// =============================================================================
// Unit tests for config::ProfileLoader and config::validate.
//
// Validates:
//   - Missing keys keep their defaults
//   - Stage and execution blocks override defaults
//   - Wrong types, unknown modes and invalid values throw ConfigException
//   - toJson -> fromJson reproduces the profile
//   - The shipped default profile loads
// =============================================================================

#include "exceptions.hpp"
#include "profile.hpp"
#include "profile_loader.hpp"

#include <gtest/gtest.h>

#include <cstdio>
#include <filesystem>
#include <fstream>

using config::Profile;
using config::ProfileLoader;
using json = nlohmann::json;

// -----------------------------------------------------------------------------
// 1. Defaults.
// -----------------------------------------------------------------------------
TEST(ProfileLoaderTest, EmptyObjectGivesDefaults) {
    Profile profile = ProfileLoader::fromJson(json::object());
    EXPECT_EQ(profile.name, "default");
    EXPECT_EQ(profile.mode, core::Mode::Retrospective);
    EXPECT_EQ(profile.resolution, core::Resolution::Daily);
    EXPECT_DOUBLE_EQ(profile.stages.relative_strength.threshold, 90.0);
    ASSERT_EQ(profile.stages.daily.windows.size(), 5u);
    EXPECT_EQ(profile.stages.daily.windows.front().label, "2Y");
    EXPECT_EQ(profile.stages.daily.windows.front().bars, 400u);
    EXPECT_DOUBLE_EQ(profile.execution.max_position_fraction, 0.25);
    EXPECT_EQ(profile.execution.max_positions, 10u);
}

// -----------------------------------------------------------------------------
// 2. Overrides.
// -----------------------------------------------------------------------------
TEST(ProfileLoaderTest, OverridesAreApplied) {
    json config = {
        {"name", "fast"},
        {"mode", "forward"},
        {"resolution", "minute"},
        {"worker_threads", 2},
        {"stages", {
            {"weekly", {{"enabled", false}}},
            {"relative_strength", {{"threshold", 80}}},
            {"daily", {{"windows", json::array({{{"label", "3M"}, {"bars", 50}}, {{"label", "1M"}, {"bars", 20}}})}}}
        }},
        {"execution", {
            {"max_positions", 3},
            {"pyramiding_enabled", true},
            {"slippage", 0.001}
        }}
    };
    Profile profile = ProfileLoader::fromJson(config);
    EXPECT_EQ(profile.name, "fast");
    EXPECT_EQ(profile.mode, core::Mode::Forward);
    EXPECT_EQ(profile.resolution, core::Resolution::Minute);
    EXPECT_EQ(profile.worker_threads, 2u);
    EXPECT_FALSE(profile.stages.weekly.enabled);
    EXPECT_TRUE(profile.stages.earnings.enabled);
    EXPECT_DOUBLE_EQ(profile.stages.relative_strength.threshold, 80.0);
    ASSERT_EQ(profile.stages.daily.windows.size(), 2u);
    EXPECT_EQ(profile.stages.daily.windows[1].label, "1M");
    EXPECT_EQ(profile.execution.max_positions, 3u);
    EXPECT_TRUE(profile.execution.pyramiding_enabled);
    EXPECT_DOUBLE_EQ(profile.execution.slippage, 0.001);
}

// -----------------------------------------------------------------------------
// 3. Rejections.
// -----------------------------------------------------------------------------
TEST(ProfileLoaderTest, WrongTypeThrows) {
    EXPECT_THROW(ProfileLoader::fromJson({{"execution", {{"initial_cash", "lots"}}}}), core::ConfigException);
    EXPECT_THROW(ProfileLoader::fromJson({{"stages", {{"earnings", {{"enabled", 1}}}}}}), core::ConfigException);
    EXPECT_THROW(ProfileLoader::fromJson({{"stages", 5}}), core::ConfigException);
    EXPECT_THROW(ProfileLoader::fromJson(json::array()), core::ConfigException);
}

TEST(ProfileLoaderTest, UnknownModeThrows) {
    EXPECT_THROW(ProfileLoader::fromJson({{"mode", "sideways"}}), core::ConfigException);
}

TEST(ProfileLoaderTest, InvalidValuesThrow) {
    // min cap above max cap
    EXPECT_THROW(ProfileLoader::fromJson({{"stages", {{"fundamental", {{"min_market_cap", 5e9}, {"max_market_cap", 1e9}}}}}}),
                 core::ConfigException);
    // negative bound
    EXPECT_THROW(ProfileLoader::fromJson({{"stages", {{"fundamental", {{"min_market_cap", -1}}}}}}),
                 core::ConfigException);
    // fraction outside (0, 1]
    EXPECT_THROW(ProfileLoader::fromJson({{"execution", {{"max_position_fraction", 1.5}}}}), core::ConfigException);
    EXPECT_THROW(ProfileLoader::fromJson({{"execution", {{"risk_per_trade", 0}}}}), core::ConfigException);
    // windows not longest-first
    EXPECT_THROW(ProfileLoader::fromJson({{"stages", {{"daily", {{"windows",
                     json::array({{{"label", "1M"}, {"bars", 20}}, {{"label", "1Y"}, {"bars", 200}}})}}}}}}),
                 core::ConfigException);
    // empty window list
    EXPECT_THROW(ProfileLoader::fromJson({{"stages", {{"daily", {{"windows", json::array()}}}}}}),
                 core::ConfigException);
    EXPECT_THROW(ProfileLoader::fromJson({{"execution", {{"max_positions", 0}}}}), core::ConfigException);
}

TEST(ProfileValidateTest, AlternateWindowMustExist) {
    Profile profile;
    profile.stages.daily.alternate_rs_enabled = true;
    profile.stages.daily.alternate_window_label = "9Y";
    EXPECT_THROW(config::validate(profile), core::ConfigException);
    profile.stages.daily.alternate_window_label = "1M";
    EXPECT_NO_THROW(config::validate(profile));
}

// -----------------------------------------------------------------------------
// 4. Serialisation back to JSON.
// -----------------------------------------------------------------------------
TEST(ProfileLoaderTest, ToJsonReloadsToSameProfile) {
    Profile original;
    original.name = "roundtrip";
    original.mode = core::Mode::Forward;
    original.stages.fundamental.enabled = false;
    original.stages.daily.alternate_rs_enabled = true;
    original.execution.max_positions = 4;
    original.execution.commission_rate = 0.0005;

    json dumped = ProfileLoader::toJson(original);
    Profile reloaded = ProfileLoader::fromJson(dumped);
    EXPECT_EQ(ProfileLoader::toJson(reloaded), dumped);
    EXPECT_EQ(reloaded.mode, core::Mode::Forward);
    EXPECT_FALSE(reloaded.stages.fundamental.enabled);
    EXPECT_EQ(reloaded.execution.max_positions, 4u);
}

// -----------------------------------------------------------------------------
// 5. Files.
// -----------------------------------------------------------------------------
TEST(ProfileLoaderTest, MissingFileThrows) {
    EXPECT_THROW(ProfileLoader::fromFile("/nonexistent/profile.json"), core::ConfigException);
}

TEST(ProfileLoaderTest, MalformedFileThrows) {
    auto path = std::filesystem::temp_directory_path() / "cascade_bad_profile.json";
    {
        std::ofstream out(path);
        out << "{ \"name\": ";
    }
    EXPECT_THROW(ProfileLoader::fromFile(path.string()), core::ConfigException);
    std::filesystem::remove(path);
}

TEST(ProfileLoaderTest, ShippedDefaultProfileLoads) {
    Profile profile = ProfileLoader::fromFile(std::string(CASCADE_SOURCE_DIR) + "/config/profiles/default.json");
    EXPECT_EQ(profile.name, "default");
    EXPECT_EQ(profile.stages.daily.windows.size(), 5u);
    EXPECT_DOUBLE_EQ(profile.execution.initial_cash, 100000.0);
}
