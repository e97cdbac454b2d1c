#include "core/auth/cached_key_store.hpp"
#include "unit/test_fakes.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <memory>

using voicetoken::common::KeyCacheConfig;
using voicetoken::common::Status;
using voicetoken::common::StatusCode;
using voicetoken::core::CachedKeyStore;
using voicetoken::testing::FakeKeyStore;

class CachedKeyStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        primary_ = std::make_shared<FakeKeyStore>();
        primary_->Add("abc123", "7");
        now_ = std::chrono::steady_clock::time_point{} + std::chrono::hours(1);
    }

    std::unique_ptr<CachedKeyStore> MakeCache(const KeyCacheConfig& config) {
        return std::make_unique<CachedKeyStore>(primary_, config, [this] { return now_; });
    }

    void Advance(std::chrono::milliseconds delta) {
        now_ += delta;
    }

    std::shared_ptr<FakeKeyStore> primary_;
    std::chrono::steady_clock::time_point now_;
};

TEST_F(CachedKeyStoreTest, PositiveHitWithinTtl) {
    KeyCacheConfig config;
    config.ttl_ms = 1000;
    auto cache = MakeCache(config);

    ASSERT_TRUE(cache->Lookup("abc123").IsOk());
    Advance(std::chrono::milliseconds(500));
    auto hit = cache->Lookup("abc123");
    ASSERT_TRUE(hit.IsOk());
    EXPECT_EQ(hit.Value().user_id, "7");
    EXPECT_EQ(primary_->lookups.load(), 1);

    Advance(std::chrono::milliseconds(600));
    ASSERT_TRUE(cache->Lookup("abc123").IsOk());
    EXPECT_EQ(primary_->lookups.load(), 2);
}

TEST_F(CachedKeyStoreTest, RevocationVisibleAfterTtl) {
    KeyCacheConfig config;
    config.ttl_ms = 1000;
    auto cache = MakeCache(config);

    ASSERT_TRUE(cache->Lookup("abc123").IsOk());
    primary_->Remove("abc123");
    Advance(std::chrono::milliseconds(1001));
    EXPECT_EQ(cache->Lookup("abc123").GetStatus().Code(), StatusCode::kNotFound);
}

TEST_F(CachedKeyStoreTest, NegativeResultsNotCachedByDefault) {
    KeyCacheConfig config;
    config.ttl_ms = 1000;
    auto cache = MakeCache(config);

    EXPECT_EQ(cache->Lookup("missing").GetStatus().Code(), StatusCode::kNotFound);
    EXPECT_EQ(cache->Lookup("missing").GetStatus().Code(), StatusCode::kNotFound);
    EXPECT_EQ(primary_->lookups.load(), 2);
    EXPECT_EQ(cache->Size(), 0u);
}

TEST_F(CachedKeyStoreTest, NegativeTtlCachesMisses) {
    KeyCacheConfig config;
    config.ttl_ms = 1000;
    config.negative_ttl_ms = 200;
    auto cache = MakeCache(config);

    EXPECT_EQ(cache->Lookup("missing").GetStatus().Code(), StatusCode::kNotFound);
    primary_->Add("missing");
    EXPECT_EQ(cache->Lookup("missing").GetStatus().Code(), StatusCode::kNotFound);
    EXPECT_EQ(primary_->lookups.load(), 1);

    Advance(std::chrono::milliseconds(201));
    EXPECT_TRUE(cache->Lookup("missing").IsOk());
}

TEST_F(CachedKeyStoreTest, StoreFailurePropagatesByDefault) {
    KeyCacheConfig config;
    config.ttl_ms = 1000;
    auto cache = MakeCache(config);

    ASSERT_TRUE(cache->Lookup("abc123").IsOk());
    Advance(std::chrono::milliseconds(1500));
    primary_->FailWith(Status::DeadlineExceeded("timeout"));
    EXPECT_EQ(cache->Lookup("abc123").GetStatus().Code(), StatusCode::kDeadlineExceeded);
}

TEST_F(CachedKeyStoreTest, ServeStaleOnErrorIsBounded) {
    KeyCacheConfig config;
    config.ttl_ms = 1000;
    config.serve_stale_on_error = true;
    auto cache = MakeCache(config);

    ASSERT_TRUE(cache->Lookup("abc123").IsOk());
    primary_->FailWith(Status::Unavailable("connection refused"));

    Advance(std::chrono::milliseconds(1500));
    auto stale = cache->Lookup("abc123");
    ASSERT_TRUE(stale.IsOk());
    EXPECT_EQ(stale.Value().user_id, "7");

    Advance(std::chrono::milliseconds(600));
    EXPECT_EQ(cache->Lookup("abc123").GetStatus().Code(), StatusCode::kUnavailable);

    // 未缓存过的 key 不会因兜底而通过
    EXPECT_EQ(cache->Lookup("never-seen").GetStatus().Code(), StatusCode::kUnavailable);
}

TEST_F(CachedKeyStoreTest, EvictsWhenFull) {
    KeyCacheConfig config;
    config.ttl_ms = 10000;
    config.max_entries = 2;
    auto cache = MakeCache(config);
    primary_->Add("k1");
    primary_->Add("k2");
    primary_->Add("k3");

    ASSERT_TRUE(cache->Lookup("k1").IsOk());
    Advance(std::chrono::milliseconds(10));
    ASSERT_TRUE(cache->Lookup("k2").IsOk());
    Advance(std::chrono::milliseconds(10));
    ASSERT_TRUE(cache->Lookup("k3").IsOk());
    EXPECT_EQ(cache->Size(), 2u);

    // k1 最早过期, 已被淘汰
    const int before = primary_->lookups.load();
    ASSERT_TRUE(cache->Lookup("k3").IsOk());
    EXPECT_EQ(primary_->lookups.load(), before);
    ASSERT_TRUE(cache->Lookup("k1").IsOk());
    EXPECT_EQ(primary_->lookups.load(), before + 1);
}
