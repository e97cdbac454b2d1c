#include "common/secret_loader.hpp"

#include "common/config_loader.hpp"

#include <array>
#include <cstdlib>
#include <fstream>

namespace voicetoken {
namespace common {

namespace {

constexpr std::array<const char*, 4> kRequiredKeys{
    "MEDIA_SERVER_URL", "MEDIA_SERVER_API_KEY", "MEDIA_SERVER_API_SECRET", "SECRET_KEYS"};

bool EnvSet(const char* name) {
    const char* value = std::getenv(name);
    return value != nullptr && *value != '\0';
}

} // namespace

StatusOr<MediaSecrets> SecretLoader::LoadFile(const std::string& path) {
    std::ifstream ifs(path);
    if (!ifs.is_open()) {
        return Status::NotFound("secret document not found: " + path);
    }
    auto doc = nlohmann::json::parse(ifs, nullptr, false);
    if (doc.is_discarded()) {
        return Status::InvalidArgument("secret document is not valid JSON: " + path);
    }
    auto result = FromJson(doc);
    if (!result.IsOk()) {
        return result.GetStatus().WithContext(path);
    }
    return result;
}

StatusOr<MediaSecrets> SecretLoader::FromJson(const nlohmann::json& doc) {
    if (!doc.is_object()) {
        return Status::InvalidArgument("secret document must be a JSON object");
    }

    std::string missing;
    for (const char* key : kRequiredKeys) {
        auto it = doc.find(key);
        if (it == doc.end() || !it->is_string()) {
            missing += missing.empty() ? key : std::string(", ") + key;
        }
    }
    if (!missing.empty()) {
        return Status::InvalidArgument("secret document is missing required keys: " + missing);
    }

    MediaSecrets secrets;
    secrets.media_url = doc["MEDIA_SERVER_URL"].get<std::string>();
    secrets.media_api_key = doc["MEDIA_SERVER_API_KEY"].get<std::string>();
    secrets.media_api_secret = doc["MEDIA_SERVER_API_SECRET"].get<std::string>();
    secrets.api_keys = SplitList(doc["SECRET_KEYS"].get<std::string>());
    return StatusOr<MediaSecrets>(std::move(secrets));
}

void SecretLoader::Apply(const MediaSecrets& secrets, AppConfig& config) {
    if (!EnvSet("MEDIA_SERVER_URL")) {
        config.media.url = secrets.media_url;
    }
    if (!EnvSet("MEDIA_SERVER_API_KEY")) {
        config.media.api_key = secrets.media_api_key;
    }
    if (!EnvSet("MEDIA_SERVER_API_SECRET")) {
        config.media.api_secret = secrets.media_api_secret;
    }
    if (!EnvSet("SECRET_KEYS")) {
        config.key_store.static_keys = secrets.api_keys;
    }
}

} // namespace common
} // namespace voicetoken
