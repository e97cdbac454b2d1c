#pragma once

#include "cache/redis_client.hpp"
#include "core/auth/key_store.hpp"

#include <memory>
#include <string>

namespace voicetoken {
namespace core {

// 以 Redis 为权威存储的 API Key 白名单
// 记录位于 <prefix><credential> (hash_keys 时为 <prefix><sha256(credential)>)
class RedisKeyStore : public KeyStore {
public:
    RedisKeyStore(std::shared_ptr<voicetoken::cache::RedisClient> redis,
                  std::string prefix,
                  bool hash_keys);

    voicetoken::common::StatusOr<AuthorizationRecord> Lookup(const std::string& credential) override;

    // 计算 credential 对应的存储键
    std::string KeyFor(const std::string& credential) const;

private:
    std::shared_ptr<voicetoken::cache::RedisClient> redis_;
    std::string prefix_;
    bool hash_keys_;
};

// 小写十六进制 SHA-256 摘要
std::string Sha256Hex(const std::string& input);

} // namespace core
} // namespace voicetoken
