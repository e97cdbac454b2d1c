#include "core/auth/key_validator.hpp"

#include "common/logger.hpp"

namespace voicetoken {
namespace core {

using voicetoken::common::Status;
using voicetoken::common::StatusCode;
using voicetoken::common::StatusOr;

KeyValidator::KeyValidator(std::shared_ptr<KeyStore> store)
    : store_(std::move(store)) {}

StatusOr<ValidationResult> KeyValidator::Validate(const std::string& credential) const {
    // 缺失或为空的 key 直接拒绝, 不访问存储
    if (credential.empty()) {
        return StatusOr<ValidationResult>(ValidationResult{Verdict::kUnauthorized, {}});
    }

    auto lookup = store_->Lookup(credential);
    if (lookup.IsOk()) {
        return StatusOr<ValidationResult>(ValidationResult{Verdict::kAuthorized, std::move(lookup).Value()});
    }

    const auto& status = lookup.GetStatus();
    if (status.Code() == StatusCode::kNotFound) {
        VOICETOKEN_LOG_WARN("[KeyValidator] rejected key {}", voicetoken::common::RedactSecret(credential));
        return StatusOr<ValidationResult>(ValidationResult{Verdict::kUnauthorized, {}});
    }

    VOICETOKEN_LOG_ERROR("[KeyValidator] key store failure ({}): {}",
                         voicetoken::common::StatusCodeToString(status.Code()), status.Message());
    return status;
}

} // namespace core
} // namespace voicetoken
