#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

#include "tbc/foundation/config_manager.hpp"

using namespace tbc::foundation;

class ConfigManagerTest : public ::testing::Test {
protected:
    void SetUp() override {
        // Use unique directory per test to avoid races under ctest --parallel
        auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        auto dirname = std::string("tbc_test_") + info->name();
        tmpDir_ = std::filesystem::temp_directory_path() / dirname;
        std::filesystem::create_directories(tmpDir_);
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(tmpDir_, ec);
    }

    std::filesystem::path writeYaml(const std::string& filename,
                                    const std::string& content) {
        auto path = tmpDir_ / filename;
        std::ofstream ofs(path);
        ofs << content;
        return path;
    }

    std::filesystem::path tmpDir_;
};

TEST_F(ConfigManagerTest, LoadAndGetNestedKeys) {
    auto path = writeYaml("battle.yaml", R"(
combat:
  crit_multiplier: 1.5
  minimum_damage: 1
encounter:
  victory: KillAll
)");

    ConfigManager config;
    ASSERT_TRUE(config.load(path).hasValue());

    auto multiplier = config.get<float>("combat.crit_multiplier");
    ASSERT_TRUE(multiplier.hasValue());
    EXPECT_FLOAT_EQ(multiplier.value(), 1.5f);

    auto victory = config.get<std::string>("encounter.victory");
    ASSERT_TRUE(victory.hasValue());
    EXPECT_EQ(victory.value(), "KillAll");
}

TEST_F(ConfigManagerTest, LoadNonexistentFile) {
    ConfigManager config;
    auto result = config.load("/nonexistent/battle.yaml");
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::ConfigLoadFailed);
}

TEST_F(ConfigManagerTest, LoadReplacesPreviousEntries) {
    ConfigManager config;
    ASSERT_TRUE(config.loadFromString("a: 1").hasValue());
    ASSERT_TRUE(config.loadFromString("b: 2").hasValue());
    EXPECT_FALSE(config.hasKey("a"));
    EXPECT_TRUE(config.hasKey("b"));
}

TEST_F(ConfigManagerTest, NonMappingRootIsRejected) {
    ConfigManager config;
    auto result = config.loadFromString("- 1\n- 2\n");
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::ConfigLoadFailed);
}

TEST_F(ConfigManagerTest, MalformedYamlIsRejected) {
    ConfigManager config;
    auto result = config.loadFromString("combat: [1, 2");
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::ConfigLoadFailed);
}

TEST_F(ConfigManagerTest, KeyNotFoundAndTypeMismatch) {
    ConfigManager config;
    ASSERT_TRUE(config.loadFromString("value: hello").hasValue());

    auto missing = config.get<int>("nonexistent.key");
    ASSERT_TRUE(missing.hasError());
    EXPECT_EQ(missing.error().code(), ErrorCode::ConfigKeyNotFound);

    auto mismatch = config.get<int>("value");
    ASSERT_TRUE(mismatch.hasError());
    EXPECT_EQ(mismatch.error().code(), ErrorCode::ConfigTypeMismatch);
}

TEST_F(ConfigManagerTest, GetOrFallsBackOnlyWhenAbsent) {
    ConfigManager config;
    ASSERT_TRUE(config.loadFromString("ai:\n  thinking_delay_ms: fast\n").hasValue());

    auto absent = config.getOr<int>("ai.inter_unit_gap_ms", 100);
    ASSERT_TRUE(absent.hasValue());
    EXPECT_EQ(absent.value(), 100);

    auto wrongType = config.getOr<int>("ai.thinking_delay_ms", 1500);
    ASSERT_TRUE(wrongType.hasError());
    EXPECT_EQ(wrongType.error().code(), ErrorCode::ConfigTypeMismatch);
}

TEST_F(ConfigManagerTest, SequencesReadAsVectors) {
    ConfigManager config;
    ASSERT_TRUE(config.loadFromString(R"(
factions:
  relationships:
    - [Player, Faction1, Hostile]
    - [Player, Faction2, Ally]
)").hasValue());

    auto rows = config.get<std::vector<std::vector<std::string>>>("factions.relationships");
    ASSERT_TRUE(rows.hasValue());
    ASSERT_EQ(rows.value().size(), 2u);
    EXPECT_EQ(rows.value()[1][2], "Ally");
}

TEST_F(ConfigManagerTest, SetNotifiesWatcher) {
    ConfigManager config;
    std::string notifiedKey;
    int readBack = 0;

    config.watch("combat.minimum_damage", [&](std::string_view key) {
        notifiedKey = std::string(key);
        readBack = config.get<int>(key).valueOr(-1);
    });

    config.set<int>("combat.minimum_damage", 2);
    EXPECT_EQ(notifiedKey, "combat.minimum_damage");
    EXPECT_EQ(readBack, 2);
}
