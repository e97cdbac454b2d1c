#pragma once

#include "common/status.hpp"
#include "common/status_or.hpp"
#include "core/auth/key_store.hpp"

#include <memory>
#include <string>

namespace voicetoken {
namespace core {

enum class Verdict {
    kAuthorized,
    kUnauthorized,
};

struct ValidationResult {
    Verdict verdict = Verdict::kUnauthorized;
    AuthorizationRecord record;     // 仅在 kAuthorized 时有效

    bool Authorized() const { return verdict == Verdict::kAuthorized; }
};

// API Key 校验器
// 返回 OK + verdict 表示得出结论; 非 OK 状态即为校验器故障 (存储不可达/超时/记录格式错误)
class KeyValidator {
public:
    explicit KeyValidator(std::shared_ptr<KeyStore> store);

    voicetoken::common::StatusOr<ValidationResult> Validate(const std::string& credential) const;

private:
    std::shared_ptr<KeyStore> store_;
};

} // namespace core
} // namespace voicetoken
