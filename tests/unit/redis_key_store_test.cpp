#include <gtest/gtest.h>

#include "cache/redis_client.hpp"
#include "common/config.hpp"
#include "core/auth/redis_key_store.hpp"
#include "unit/redis_seed.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>

#include <chrono>
#include <cstdlib>
#include <memory>

using voicetoken::common::StatusCode;
using voicetoken::core::ParseAuthorizationRecord;
using voicetoken::core::RedisKeyStore;

using voicetoken::testing::RedisConfigFromEnv;

TEST(AuthorizationRecordTest, ParsesUserId) {
    auto as_string = ParseAuthorizationRecord(R"({"user_id":"u-17","plan":"pro"})");
    ASSERT_TRUE(as_string.IsOk());
    EXPECT_EQ(as_string.Value().user_id, "u-17");

    auto as_number = ParseAuthorizationRecord(R"({"user_id":17})");
    ASSERT_TRUE(as_number.IsOk());
    EXPECT_EQ(as_number.Value().user_id, "17");

    auto without = ParseAuthorizationRecord("{}");
    ASSERT_TRUE(without.IsOk());
    EXPECT_TRUE(without.Value().user_id.empty());
}

TEST(AuthorizationRecordTest, MalformedRecordIsInternalError) {
    EXPECT_EQ(ParseAuthorizationRecord("not json").GetStatus().Code(), StatusCode::kInternal);
    EXPECT_EQ(ParseAuthorizationRecord("[1,2]").GetStatus().Code(), StatusCode::kInternal);
    EXPECT_EQ(ParseAuthorizationRecord("\"abc\"").GetStatus().Code(), StatusCode::kInternal);
    EXPECT_EQ(ParseAuthorizationRecord(R"({"user_id":[1]})").GetStatus().Code(), StatusCode::kInternal);
}

TEST(RedisKeyStoreTest, KeyLayout) {
    auto redis = std::make_shared<voicetoken::cache::RedisClient>(voicetoken::common::RedisConfig{});
    RedisKeyStore plain(redis, "voicetoken:apikey:", false);
    EXPECT_EQ(plain.KeyFor("abc123"), "voicetoken:apikey:abc123");

    RedisKeyStore hashed(redis, "voicetoken:apikey:", true);
    EXPECT_EQ(hashed.KeyFor("abc"),
              "voicetoken:apikey:ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST(RedisKeyStoreTest, UnresponsiveServerFailsWithinBound) {
    // 只 listen 不 accept: TCP 握手由内核完成, 之后没有任何响应
    boost::asio::io_context ioc;
    boost::asio::ip::tcp::acceptor acceptor(
        ioc, boost::asio::ip::tcp::endpoint(boost::asio::ip::make_address("127.0.0.1"), 0));

    voicetoken::common::RedisConfig cfg;
    cfg.host = "127.0.0.1";
    cfg.port = acceptor.local_endpoint().port();
    cfg.pool_size = 1;
    cfg.connection_timeout_ms = 200;
    cfg.socket_timeout_ms = 200;
    auto redis = std::make_shared<voicetoken::cache::RedisClient>(cfg);
    RedisKeyStore store(redis, "voicetoken:apikey:", false);

    const auto start = std::chrono::steady_clock::now();
    auto result = store.Lookup("abc123");
    const auto elapsed = std::chrono::steady_clock::now() - start;

    ASSERT_FALSE(result.IsOk());
    EXPECT_NE(result.GetStatus().Code(), StatusCode::kNotFound);
    EXPECT_LT(elapsed, std::chrono::seconds(2));
}

TEST(RedisKeyStoreTest, LiveLookup) {
    auto redis = std::make_shared<voicetoken::cache::RedisClient>(RedisConfigFromEnv());
    auto ping = redis->Ping();
    if (!ping.IsOk()) {
        GTEST_SKIP() << "Redis not reachable: " << ping.Message();
    }

    RedisKeyStore store(redis, "voicetoken:test:apikey:", true);
    const std::string key = store.KeyFor("live-key");
    voicetoken::testing::RedisSeeder seeder(RedisConfigFromEnv());
    seeder.Put(key, R"({"user_id":"live-user"})");

    auto found = store.Lookup("live-key");
    ASSERT_TRUE(found.IsOk()) << found.GetStatus().Message();
    EXPECT_EQ(found.Value().user_id, "live-user");

    EXPECT_EQ(store.Lookup("live-key-other").GetStatus().Code(), StatusCode::kNotFound);

    seeder.Remove(key);
    EXPECT_EQ(store.Lookup("live-key").GetStatus().Code(), StatusCode::kNotFound);

    seeder.Put(key, "garbage");
    EXPECT_EQ(store.Lookup("live-key").GetStatus().Code(), StatusCode::kInternal);
    seeder.Remove(key);
}
