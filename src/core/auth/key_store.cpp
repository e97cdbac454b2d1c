#include "core/auth/key_store.hpp"

#include <nlohmann/json.hpp>

namespace voicetoken {
namespace core {

using voicetoken::common::Status;
using voicetoken::common::StatusOr;

StaticKeyStore::StaticKeyStore(const std::vector<std::string>& keys) {
    for (std::size_t i = 0; i < keys.size(); ++i) {
        if (keys[i].empty()) {
            continue;
        }
        // 重复的 key 保留第一次出现的序号
        records_.emplace(keys[i], AuthorizationRecord{std::to_string(i + 1)});
    }
}

StatusOr<AuthorizationRecord> StaticKeyStore::Lookup(const std::string& credential) {
    auto it = records_.find(credential);
    if (it == records_.end()) {
        return Status::NotFound("API key not in allow-list");
    }
    return StatusOr<AuthorizationRecord>(it->second);
}

StatusOr<AuthorizationRecord> ParseAuthorizationRecord(const std::string& raw) {
    auto json = nlohmann::json::parse(raw, nullptr, false);
    if (json.is_discarded() || !json.is_object()) {
        return Status::Internal("malformed authorization record");
    }

    AuthorizationRecord record;
    auto it = json.find("user_id");
    if (it != json.end()) {
        if (it->is_string()) {
            record.user_id = it->get<std::string>();
        } else if (it->is_number_integer()) {
            record.user_id = std::to_string(it->get<std::int64_t>());
        } else if (!it->is_null()) {
            return Status::Internal("malformed authorization record: user_id has unexpected type");
        }
    }
    return StatusOr<AuthorizationRecord>(std::move(record));
}

} // namespace core
} // namespace voicetoken
