#pragma once

#include <string>
#include <utility>

namespace voicetoken {
namespace common {

// 状态码, 数值与 gRPC 保持一致
enum class StatusCode {
    kOk = 0,
    kInvalidArgument = 3,
    kDeadlineExceeded = 4,
    kNotFound = 5,
    kFailedPrecondition = 9,
    kInternal = 13,
    kUnavailable = 14,
    kUnauthenticated = 16,
};

// 表示操作结果的状态
class Status {
public:
    Status() = default;
    Status(StatusCode code, std::string message)
        : code_(code), message_(std::move(message)) {}

    static Status OK() {
        return Status(StatusCode::kOk, "");
    }
    static Status InvalidArgument(std::string message) {
        return Status(StatusCode::kInvalidArgument, std::move(message));
    }
    static Status DeadlineExceeded(std::string message) {
        return Status(StatusCode::kDeadlineExceeded, std::move(message));
    }
    static Status NotFound(std::string message) {
        return Status(StatusCode::kNotFound, std::move(message));
    }
    static Status FailedPrecondition(std::string message) {
        return Status(StatusCode::kFailedPrecondition, std::move(message));
    }
    static Status Internal(std::string message) {
        return Status(StatusCode::kInternal, std::move(message));
    }
    static Status Unavailable(std::string message) {
        return Status(StatusCode::kUnavailable, std::move(message));
    }
    static Status Unauthenticated(std::string message) {
        return Status(StatusCode::kUnauthenticated, std::move(message));
    }

    bool IsOk() const {
        return code_ == StatusCode::kOk;
    }
    StatusCode Code() const {
        return code_;
    }
    const std::string& Message() const {
        return message_;
    }

    // 在原有消息前追加上下文
    Status WithContext(const std::string& context) const {
        if (IsOk()) {
            return *this;
        }
        return Status(code_, context + ": " + message_);
    }

private:
    StatusCode code_ = StatusCode::kOk;
    std::string message_;
};

inline std::string StatusCodeToString(StatusCode code) {
    switch (code) {
        case StatusCode::kOk:
            return "OK";
        case StatusCode::kInvalidArgument:
            return "Invalid Argument";
        case StatusCode::kDeadlineExceeded:
            return "Deadline Exceeded";
        case StatusCode::kNotFound:
            return "Not Found";
        case StatusCode::kFailedPrecondition:
            return "Failed Precondition";
        case StatusCode::kInternal:
            return "Internal";
        case StatusCode::kUnavailable:
            return "Unavailable";
        case StatusCode::kUnauthenticated:
            return "Unauthenticated";
    }
    return "Unknown";
}

inline std::string ToString(const Status& status) {
    if (status.IsOk()) {
        return "OK";
    }
    return StatusCodeToString(status.Code()) + ": " + status.Message();
}

} // namespace common
} // namespace voicetoken
