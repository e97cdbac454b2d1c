#pragma once

#include "common/status.hpp"
#include "common/status_or.hpp"

#include <string>
#include <unordered_map>
#include <vector>

namespace voicetoken {
namespace core {

// 授权记录, 存在即代表 API Key 有效
struct AuthorizationRecord {
    std::string user_id;    // 可选, 透传到 agent 调度元数据
};

// API Key 查询能力
// Lookup 语义: OK 为有效记录, kNotFound 为不存在, 其他状态码为存储故障
class KeyStore {
public:
    virtual ~KeyStore() = default;

    virtual voicetoken::common::StatusOr<AuthorizationRecord> Lookup(const std::string& credential) = 0;
};

// 进程内静态白名单 (Redis 关闭时使用)
class StaticKeyStore : public KeyStore {
public:
    // user_id 取该 key 在列表中的序号 (从 1 开始)
    explicit StaticKeyStore(const std::vector<std::string>& keys);

    voicetoken::common::StatusOr<AuthorizationRecord> Lookup(const std::string& credential) override;

    std::size_t Size() const { return records_.size(); }

private:
    std::unordered_map<std::string, AuthorizationRecord> records_;
};

// 解析存储中的记录值; 必须是 JSON 对象, 否则视为格式错误 (kInternal)
voicetoken::common::StatusOr<AuthorizationRecord> ParseAuthorizationRecord(const std::string& raw);

} // namespace core
} // namespace voicetoken
