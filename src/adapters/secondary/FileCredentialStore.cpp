#include "adapters/secondary/FileCredentialStore.hpp"
#include <nlohmann/json.hpp>
#include <filesystem>
#include <fstream>
#include <stdexcept>

namespace nimbasms::adapters::secondary {

namespace fs = std::filesystem;

namespace {

std::optional<std::string> stringField(const nlohmann::json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || !it->is_string()) {
        return std::nullopt;
    }
    return it->get<std::string>();
}

} // namespace

FileCredentialStore::FileCredentialStore(std::string configDir)
    : configDir_(std::move(configDir))
{}

std::string FileCredentialStore::getPath() const {
    return (fs::path(configDir_) / "config.json").string();
}

domain::Credentials FileCredentialStore::load() {
    std::ifstream file(getPath());
    if (!file) {
        return {};
    }

    auto j = nlohmann::json::parse(file, nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
        return {};
    }

    domain::Credentials credentials;
    credentials.serviceId = stringField(j, "service_id");
    credentials.secretToken = stringField(j, "secret_token");
    return credentials;
}

void FileCredentialStore::save(
    const std::optional<std::string>& serviceId,
    const std::optional<std::string>& secretToken
) {
    auto current = load();
    if (serviceId) current.serviceId = serviceId;
    if (secretToken) current.secretToken = secretToken;

    nlohmann::json j = nlohmann::json::object();
    if (current.serviceId) j["service_id"] = *current.serviceId;
    if (current.secretToken) j["secret_token"] = *current.secretToken;

    std::error_code ec;
    fs::create_directories(configDir_, ec);
    if (ec) {
        throw std::runtime_error("Cannot create config directory " + configDir_ + ": " + ec.message());
    }

    std::ofstream file(getPath(), std::ios::trunc);
    if (!file) {
        throw std::runtime_error("Cannot write " + getPath());
    }
    file << j.dump(2) << "\n";
    if (!file) {
        throw std::runtime_error("Failed to write " + getPath());
    }
}

} // namespace nimbasms::adapters::secondary
