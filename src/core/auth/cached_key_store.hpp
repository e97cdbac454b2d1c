#pragma once

#include "common/config.hpp"
#include "core/auth/key_store.hpp"

#include <chrono>
#include <functional>
#include <memory>
#include <shared_mutex>
#include <string>
#include <unordered_map>

namespace voicetoken {
namespace core {

// 带过期时间的进程内校验缓存, 包装权威 KeyStore
// 存储故障时默认不使用缓存结果; serve_stale_on_error 开启后,
// 过期不超过一个 ttl 的正向记录可以兜底
class CachedKeyStore : public KeyStore {
public:
    using TimePoint = std::chrono::steady_clock::time_point;
    using Clock = std::function<TimePoint()>;

    // 构造函数
    // primary: 权威存储
    // clock: 可注入的时钟, 为空时使用 steady_clock
    CachedKeyStore(std::shared_ptr<KeyStore> primary,
                   const voicetoken::common::KeyCacheConfig& config,
                   Clock clock = nullptr);

    voicetoken::common::StatusOr<AuthorizationRecord> Lookup(const std::string& credential) override;

    std::size_t Size() const;

private:
    struct Entry {
        bool found = false;
        AuthorizationRecord record;
        TimePoint expires_at;
    };

    void Put(const std::string& credential, Entry entry);
    void Erase(const std::string& credential);
    // 调用方需持有写锁
    void EvictLocked(TimePoint now);

    std::shared_ptr<KeyStore> primary_;
    voicetoken::common::KeyCacheConfig config_;
    Clock clock_;

    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, Entry> entries_;
};

} // namespace core
} // namespace voicetoken
