#include "core/auth/redis_key_store.hpp"

#include <openssl/evp.h>

#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace voicetoken {
namespace core {

using voicetoken::common::Status;
using voicetoken::common::StatusCode;
using voicetoken::common::StatusOr;

RedisKeyStore::RedisKeyStore(std::shared_ptr<voicetoken::cache::RedisClient> redis,
                             std::string prefix,
                             bool hash_keys)
    : redis_(std::move(redis)), prefix_(std::move(prefix)), hash_keys_(hash_keys) {}

StatusOr<AuthorizationRecord> RedisKeyStore::Lookup(const std::string& credential) {
    std::string key;
    try {
        key = KeyFor(credential);
    } catch (const std::exception& ex) {
        return Status::Internal(ex.what());
    }

    auto resp = redis_->Get(key);
    if (!resp.IsOk()) {
        if (resp.GetStatus().Code() == StatusCode::kNotFound) {
            return Status::NotFound("API key not found");
        }
        return resp.GetStatus();
    }
    return ParseAuthorizationRecord(resp.Value());
}

std::string RedisKeyStore::KeyFor(const std::string& credential) const {
    if (!hash_keys_) {
        return prefix_ + credential;
    }
    return prefix_ + Sha256Hex(credential);
}

std::string Sha256Hex(const std::string& input) {
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int length = 0;
    if (EVP_Digest(input.data(), input.size(), digest, &length, EVP_sha256(), nullptr) != 1) {
        throw std::runtime_error("EVP_Digest(sha256) failed");
    }

    // 转换为十六进制字符串
    std::stringstream ss;
    for (unsigned int i = 0; i < length; ++i) {
        ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(digest[i]);
    }
    return ss.str();
}

} // namespace core
} // namespace voicetoken
