#include "core/auth/cached_key_store.hpp"

#include "common/logger.hpp"

#include <mutex>

namespace voicetoken {
namespace core {

using voicetoken::common::Status;
using voicetoken::common::StatusCode;
using voicetoken::common::StatusOr;

CachedKeyStore::CachedKeyStore(std::shared_ptr<KeyStore> primary,
                               const voicetoken::common::KeyCacheConfig& config,
                               Clock clock)
    : primary_(std::move(primary)), config_(config), clock_(std::move(clock)) {
    if (!clock_) {
        clock_ = [] { return std::chrono::steady_clock::now(); };
    }
}

// 读逻辑: 先读缓存, 未命中或过期再读权威存储并回填
StatusOr<AuthorizationRecord> CachedKeyStore::Lookup(const std::string& credential) {
    const TimePoint now = clock_();
    Entry cached;
    bool has_cached = false;
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        auto it = entries_.find(credential);
        if (it != entries_.end()) {
            cached = it->second;
            has_cached = true;
        }
    }
    if (has_cached && cached.expires_at > now) {
        if (cached.found) {
            return StatusOr<AuthorizationRecord>(cached.record);
        }
        return Status::NotFound("API key not found (cached)");
    }

    auto result = primary_->Lookup(credential);
    if (result.IsOk()) {
        Put(credential, Entry{true, result.Value(), now + std::chrono::milliseconds(config_.ttl_ms)});
        return result;
    }

    if (result.GetStatus().Code() == StatusCode::kNotFound) {
        if (config_.negative_ttl_ms > 0) {
            Put(credential, Entry{false, {}, now + std::chrono::milliseconds(config_.negative_ttl_ms)});
        } else {
            Erase(credential);
        }
        return result;
    }

    // 存储故障
    const auto stale_limit = cached.expires_at + std::chrono::milliseconds(config_.ttl_ms);
    if (config_.serve_stale_on_error && has_cached && cached.found && stale_limit > now) {
        VOICETOKEN_LOG_WARN("[KeyCache] store lookup failed, serving stale entry: {}",
                            result.GetStatus().Message());
        return StatusOr<AuthorizationRecord>(cached.record);
    }
    return result;
}

std::size_t CachedKeyStore::Size() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return entries_.size();
}

void CachedKeyStore::Put(const std::string& credential, Entry entry) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    if (entries_.find(credential) == entries_.end()) {
        EvictLocked(clock_());
    }
    entries_[credential] = std::move(entry);
}

void CachedKeyStore::Erase(const std::string& credential) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    entries_.erase(credential);
}

void CachedKeyStore::EvictLocked(TimePoint now) {
    const std::size_t capacity = config_.max_entries > 0 ? static_cast<std::size_t>(config_.max_entries) : 1;
    if (entries_.size() < capacity) {
        return;
    }
    // 先清理彻底过期 (超过兜底窗口) 的条目
    const auto grace = std::chrono::milliseconds(config_.serve_stale_on_error ? config_.ttl_ms : 0);
    for (auto it = entries_.begin(); it != entries_.end();) {
        if (it->second.expires_at + grace <= now) {
            it = entries_.erase(it);
        } else {
            ++it;
        }
    }
    // 仍然已满时淘汰最早过期的条目
    while (entries_.size() >= capacity) {
        auto oldest = entries_.begin();
        for (auto it = entries_.begin(); it != entries_.end(); ++it) {
            if (it->second.expires_at < oldest->second.expires_at) {
                oldest = it;
            }
        }
        entries_.erase(oldest);
    }
}

} // namespace core
} // namespace voicetoken
