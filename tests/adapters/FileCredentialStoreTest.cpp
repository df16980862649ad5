#include <gtest/gtest.h>

#include "adapters/secondary/FileCredentialStore.hpp"
#include "utils/UuidGenerator.hpp"
#include <nlohmann/json.hpp>
#include <filesystem>
#include <fstream>

using namespace nimbasms;
using namespace nimbasms::adapters::secondary;

namespace fs = std::filesystem;

// ============================================================================
// Test Fixture: временный каталог конфигурации на каждый тест
// ============================================================================

class FileCredentialStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        configDir_ = fs::temp_directory_path() / ("nimbasms-test-" + utils::UuidGenerator::generate()) / "nimbasms";
        store_ = std::make_unique<FileCredentialStore>(configDir_.string());
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(configDir_.parent_path(), ec);
    }

    void writeConfig(const std::string& content) {
        fs::create_directories(configDir_);
        std::ofstream file(configDir_ / "config.json");
        file << content;
    }

    nlohmann::json readConfig() {
        std::ifstream file(configDir_ / "config.json");
        return nlohmann::json::parse(file);
    }

    fs::path configDir_;
    std::unique_ptr<FileCredentialStore> store_;
};

// ============================================================================
// ТЕСТЫ: load
// ============================================================================

TEST_F(FileCredentialStoreTest, Load_MissingFile_EmptyCredentials) {
    auto credentials = store_->load();

    EXPECT_FALSE(credentials.serviceId.has_value());
    EXPECT_FALSE(credentials.secretToken.has_value());
    EXPECT_FALSE(credentials.isComplete());
}

TEST_F(FileCredentialStoreTest, Load_CorruptFile_EmptyCredentials) {
    writeConfig("{ this is not json");

    auto credentials = store_->load();

    EXPECT_FALSE(credentials.serviceId.has_value());
    EXPECT_FALSE(credentials.secretToken.has_value());
}

TEST_F(FileCredentialStoreTest, Load_NonStringValuesIgnored) {
    writeConfig(R"({"service_id": 42, "secret_token": "s3cr3t"})");

    auto credentials = store_->load();

    EXPECT_FALSE(credentials.serviceId.has_value());
    EXPECT_EQ(credentials.secretToken, std::optional<std::string>("s3cr3t"));
}

TEST_F(FileCredentialStoreTest, GetPath_ConfigJsonInsideDirectory) {
    EXPECT_EQ(store_->getPath(), (configDir_ / "config.json").string());
}

// ============================================================================
// ТЕСТЫ: save
// ============================================================================

TEST_F(FileCredentialStoreTest, Save_CreatesDirectoryAndFile) {
    store_->save(std::string("service-123"), std::string("s3cr3t"));

    EXPECT_TRUE(fs::exists(configDir_ / "config.json"));
    EXPECT_EQ(readConfig(), nlohmann::json({{"service_id", "service-123"}, {"secret_token", "s3cr3t"}}));

    auto credentials = store_->load();
    EXPECT_TRUE(credentials.isComplete());
    EXPECT_EQ(credentials.serviceId, std::optional<std::string>("service-123"));
}

TEST_F(FileCredentialStoreTest, Save_SingleField_KeepsOtherField) {
    store_->save(std::string("service-123"), std::nullopt);
    store_->save(std::nullopt, std::string("s3cr3t"));

    auto credentials = store_->load();
    EXPECT_EQ(credentials.serviceId, std::optional<std::string>("service-123"));
    EXPECT_EQ(credentials.secretToken, std::optional<std::string>("s3cr3t"));
}

TEST_F(FileCredentialStoreTest, Save_OverwritesExistingValue) {
    store_->save(std::string("old"), std::string("token"));
    store_->save(std::string("new"), std::nullopt);

    auto credentials = store_->load();
    EXPECT_EQ(credentials.serviceId, std::optional<std::string>("new"));
    EXPECT_EQ(credentials.secretToken, std::optional<std::string>("token"));
}

TEST_F(FileCredentialStoreTest, Save_OverCorruptFile_Replaces) {
    writeConfig("garbage");

    store_->save(std::string("service-123"), std::nullopt);

    EXPECT_EQ(readConfig(), nlohmann::json({{"service_id", "service-123"}}));
}
