#include "splitsheet/core/ConfigStore.hpp"
#include "splitsheet/core/Exception.hpp"
#include "splitsheet/utils/Logger.hpp"
#include "support/PackageBuilder.hpp"
#include <gtest/gtest.h>
#include <cstdlib>
#include <fstream>

namespace splitsheet {
namespace core {

class ConfigStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::getInstance().initialize("logs/ConfigStore_test.log", Logger::Level::DEBUG, false);
    }

    void TearDown() override {
        Logger::getInstance().shutdown();
    }

    void writeConfigFile(const std::string& content) const {
        std::ofstream out(config_path_.string(), std::ios::binary);
        out << content;
    }

    test::TempDirectory temp_{"config_store"};
    Path config_path_ = temp_.path() / "nested" / ConfigStore::kFileName;
};

TEST_F(ConfigStoreTest, ProcessTypeNames) {
    EXPECT_STREQ(toString(ProcessType::SeaRailWithImage), "sea-rail-with-image");
    EXPECT_STREQ(toString(ProcessType::SeaRailNoImage), "sea-rail-no-image");
    EXPECT_STREQ(toString(ProcessType::AirFreight), "air-freight");
    EXPECT_EQ(processTypeFromString("air-freight"), ProcessType::AirFreight);
    EXPECT_FALSE(processTypeFromString("Air-Freight").has_value());
    EXPECT_EQ(allProcessTypes().size(), 3u);
}

TEST_F(ConfigStoreTest, DefaultsPerProcessType) {
    auto sea = ProcessConfig::defaultFor(ProcessType::SeaRailWithImage);
    EXPECT_EQ(sea.weight_column, 13);
    EXPECT_EQ(sea.box_column, 11);
    EXPECT_TRUE(sea.copy_images);
    EXPECT_EQ(sea.weightIndex(), 12);
    EXPECT_EQ(sea.quantityIndex(), 11);
    EXPECT_EQ(sea.boxIndex(), 10);

    EXPECT_FALSE(ProcessConfig::defaultFor(ProcessType::SeaRailNoImage).copy_images);

    auto air = ProcessConfig::defaultFor(ProcessType::AirFreight);
    EXPECT_EQ(air.weight_column, 15);
    EXPECT_EQ(air.box_column, 13);
    EXPECT_TRUE(air.copy_images);
}

TEST_F(ConfigStoreTest, ValidateRejectsBadColumns) {
    ProcessConfig config = ProcessConfig::defaultFor(ProcessType::SeaRailWithImage);
    EXPECT_NO_THROW(config.validate());

    config.box_column = 0;
    EXPECT_THROW(config.validate(), ValidationException);

    config.box_column = 11;
    config.weight_column = 1;
    EXPECT_THROW(config.validate(), ValidationException);

    config.weight_column = 11;
    try {
        config.validate();
        FAIL() << "expected ValidationException";
    } catch (const ValidationException& e) {
        EXPECT_EQ(e.getCategory(), ErrorCategory::ValidationError);
    }
}

TEST_F(ConfigStoreTest, MissingFileGivesDefaults) {
    ConfigStore store(config_path_);
    auto configs = store.loadAll();

    EXPECT_EQ(configs, ConfigStore::defaults());
    EXPECT_EQ(configs.size(), 3u);
    EXPECT_EQ(store.loadForType("air-freight"), ProcessConfig::defaultFor(ProcessType::AirFreight));
    EXPECT_FALSE(config_path_.exists());
}

TEST_F(ConfigStoreTest, SaveForTypeRoundTrips) {
    ConfigStore store(config_path_);

    ProcessConfig custom = ProcessConfig::defaultFor(ProcessType::AirFreight);
    custom.weight_column = 9;
    custom.box_column = 7;
    custom.copy_images = false;
    store.saveForType(custom);

    EXPECT_TRUE(config_path_.exists());

    ConfigStore reopened(config_path_);
    EXPECT_EQ(reopened.loadForType("air-freight"), custom);
    EXPECT_EQ(reopened.loadForType("sea-rail-no-image"),
              ProcessConfig::defaultFor(ProcessType::SeaRailNoImage));
}

TEST_F(ConfigStoreTest, PartialEntriesUseDefaults) {
    ConfigStore store(config_path_);
    store.saveAll({});
    writeConfigFile(R"({"sea-rail-with-image": {"process_type": "sea-rail-with-image", "weight_column": 14}})");

    auto config = store.loadForType("sea-rail-with-image");
    EXPECT_EQ(config.weight_column, 14);
    EXPECT_EQ(config.box_column, 11);
    EXPECT_TRUE(config.copy_images);
}

TEST_F(ConfigStoreTest, UnknownProcessTypeIsRejected) {
    ConfigStore store(config_path_);
    try {
        store.loadForType("truck");
        FAIL() << "expected ConfigException";
    } catch (const ConfigException& e) {
        EXPECT_EQ(e.getErrorCode(), ErrorCode::UnknownProcessType);
    }

    store.saveAll({});
    writeConfigFile(R"({"truck": {"process_type": "truck", "weight_column": 3}})");
    try {
        store.loadAll();
        FAIL() << "expected ConfigException";
    } catch (const ConfigException& e) {
        EXPECT_EQ(e.getErrorCode(), ErrorCode::UnknownProcessType);
    }
}

TEST_F(ConfigStoreTest, MalformedJsonIsParseError) {
    ConfigStore store(config_path_);
    store.saveAll({});
    writeConfigFile("{ not json");

    try {
        store.loadAll();
        FAIL() << "expected ConfigException";
    } catch (const ConfigException& e) {
        EXPECT_EQ(e.getErrorCode(), ErrorCode::ConfigParseError);
        EXPECT_EQ(e.getCategory(), ErrorCategory::ConfigError);
    }

    writeConfigFile("[1, 2, 3]");
    try {
        store.loadAll();
        FAIL() << "expected ConfigException";
    } catch (const ConfigException& e) {
        EXPECT_EQ(e.getErrorCode(), ErrorCode::ConfigParseError);
    }
}

TEST_F(ConfigStoreTest, DefaultPathFollowsXdgConfigHome) {
    const char* previous = std::getenv("XDG_CONFIG_HOME");
    const std::string saved = previous ? previous : "";

    ::setenv("XDG_CONFIG_HOME", temp_.path().string().c_str(), 1);
    const Path path = ConfigStore::defaultPath();
    EXPECT_EQ(path.string(), (temp_.path() / ConfigStore::kAppDirectory / ConfigStore::kFileName).string());

    if (previous) {
        ::setenv("XDG_CONFIG_HOME", saved.c_str(), 1);
    } else {
        ::unsetenv("XDG_CONFIG_HOME");
    }
}

}} // namespace splitsheet::core
