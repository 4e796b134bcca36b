#include <gtest/gtest.h>

#include "corvus/options.hpp"
#include "support/temp_directory.hpp"

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

using corvus::config::OptionDefinition;
using corvus::config::OptionKind;
using corvus::config::OptionRegistry;
using corvus::config::OptionValue;
using corvus::test::TempDirectory;
using corvus::test::writeFile;

TEST(OptionRegistry, RegistersAndReadsDefaults)
{
    OptionRegistry registry("test-app");
    OptionDefinition def{"featureEnabled", OptionKind::Boolean, OptionValue(true), "Feature Enabled",
                         "Enables a feature for testing."};
    registry.registerOption(def);

    EXPECT_TRUE(registry.hasOption("featureEnabled"));
    EXPECT_TRUE(registry.getBool("featureEnabled"));

    registry.set("featureEnabled", OptionValue(false));
    EXPECT_FALSE(registry.getBool("featureEnabled"));
    registry.reset("featureEnabled");
    EXPECT_TRUE(registry.getBool("featureEnabled"));
}

TEST(OptionRegistry, NormalizesValuesToDefinitionTypes)
{
    OptionRegistry registry("test-app");
    registry.registerOption(
        {"threshold", OptionKind::Integer, OptionValue(std::int64_t{10}), "Threshold", "Integer threshold"});
    registry.registerOption({"ignored", OptionKind::Boolean, OptionValue(false), "Ignored", "Boolean flag"});

    registry.set("threshold", OptionValue(std::string("42")));
    registry.set("ignored", OptionValue(std::string("yes")));
    EXPECT_EQ(registry.getInteger("threshold"), 42);
    EXPECT_TRUE(registry.getBool("ignored"));

    registry.set("threshold", OptionValue(std::string("lots")));
    EXPECT_EQ(registry.getInteger("threshold"), 10);
}

TEST(OptionRegistry, IgnoresUnregisteredKeys)
{
    OptionRegistry registry("test-app");
    registry.set("unknown", OptionValue(true));
    EXPECT_FALSE(registry.hasOption("unknown"));
    EXPECT_TRUE(registry.get("unknown").isNull());
}

TEST(OptionRegistry, PersistsValuesToDisk)
{
    TempDirectory temp("options");
    OptionRegistry registry("test-app");
    registry.registerOption(
        {"paths", OptionKind::StringList, OptionValue(std::vector<std::string>{}), "Paths", "List of paths"});

    std::vector<std::string> expected{"/tmp/a", "/tmp/b"};
    registry.set("paths", OptionValue(expected));

    const auto filePath = temp / "nested" / "options.json";
    ASSERT_TRUE(registry.saveToFile(filePath));

    OptionRegistry loaded("test-app");
    loaded.registerOption(
        {"paths", OptionKind::StringList, OptionValue(std::vector<std::string>{}), "Paths", "List of paths"});
    ASSERT_TRUE(loaded.loadFromFile(filePath));
    EXPECT_EQ(loaded.getStringList("paths"), expected);
}

TEST(OptionRegistry, ReportsUnreadableFiles)
{
    TempDirectory temp("options-bad");
    OptionRegistry registry("test-app");
    registry.registerOption({"level", OptionKind::Integer, OptionValue(std::int64_t{-1}), "Level", "Level"});

    std::string error;
    EXPECT_FALSE(registry.loadFromFile(temp / "missing.json", &error));
    EXPECT_NE(error.find("cannot open"), std::string::npos);

    writeFile(temp / "broken.json", "{ \"level\": ");
    EXPECT_FALSE(registry.loadFromFile(temp / "broken.json", &error));
    EXPECT_NE(error.find("cannot parse"), std::string::npos);

    writeFile(temp / "array.json", "[1, 2]");
    EXPECT_FALSE(registry.loadFromFile(temp / "array.json", &error));
    EXPECT_NE(error.find("JSON object"), std::string::npos);
    EXPECT_EQ(registry.getInteger("level"), -1);
}

TEST(OptionRegistry, ListsOptionsSortedByKey)
{
    OptionRegistry registry("test-app");
    registry.registerOption({"zeta", OptionKind::String, OptionValue(std::string("z")), "Zeta", ""});
    registry.registerOption({"alpha", OptionKind::String, OptionValue(std::string("a")), "Alpha", ""});

    auto options = registry.listRegisteredOptions();
    ASSERT_EQ(options.size(), 2u);
    EXPECT_EQ(options[0].key, "alpha");
    EXPECT_EQ(options[1].key, "zeta");
    EXPECT_EQ(registry.defaultOptionsPath().filename(), "defaults.json");
    EXPECT_EQ(registry.defaultOptionsPath().parent_path().filename(), "test-app");
}
