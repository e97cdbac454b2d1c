#pragma once

#include "core/auth/key_store.hpp"
#include "media/http_transport.hpp"
#include "media/media_service.hpp"

#include <atomic>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace voicetoken {
namespace testing {

// 可编程的 KeyStore 替身
class FakeKeyStore : public voicetoken::core::KeyStore {
public:
    void Add(const std::string& credential, const std::string& user_id = "") {
        std::lock_guard<std::mutex> lock(mutex_);
        records_[credential] = voicetoken::core::AuthorizationRecord{user_id};
    }

    void Remove(const std::string& credential) {
        std::lock_guard<std::mutex> lock(mutex_);
        records_.erase(credential);
    }

    // 设置后所有查询都返回该状态
    void FailWith(const voicetoken::common::Status& status) {
        std::lock_guard<std::mutex> lock(mutex_);
        failure_ = status;
    }

    void Recover() {
        std::lock_guard<std::mutex> lock(mutex_);
        failure_.reset();
    }

    voicetoken::common::StatusOr<voicetoken::core::AuthorizationRecord> Lookup(const std::string& credential) override {
        ++lookups;
        std::lock_guard<std::mutex> lock(mutex_);
        if (failure_) {
            return *failure_;
        }
        auto it = records_.find(credential);
        if (it == records_.end()) {
            return voicetoken::common::Status::NotFound("not found");
        }
        return voicetoken::common::StatusOr<voicetoken::core::AuthorizationRecord>(it->second);
    }

    std::atomic<int> lookups{0};

private:
    std::mutex mutex_;
    std::map<std::string, voicetoken::core::AuthorizationRecord> records_;
    std::optional<voicetoken::common::Status> failure_;
};

// 记录调用的媒体服务替身
class FakeMediaService : public voicetoken::media::MediaSessionService {
public:
    voicetoken::common::Status CreateRoom(const voicetoken::media::SessionGrant& grant) override {
        std::lock_guard<std::mutex> lock(mutex_);
        created.push_back(grant);
        return create_status;
    }

    voicetoken::common::StatusOr<std::string> IssueToken(const voicetoken::media::SessionGrant& grant) override {
        std::lock_guard<std::mutex> lock(mutex_);
        issued.push_back(grant);
        if (!issue_status.IsOk()) {
            return issue_status;
        }
        return voicetoken::common::StatusOr<std::string>("token-for-" + grant.room_name);
    }

    voicetoken::common::Status create_status = voicetoken::common::Status::OK();
    voicetoken::common::Status issue_status = voicetoken::common::Status::OK();
    std::vector<voicetoken::media::SessionGrant> created;
    std::vector<voicetoken::media::SessionGrant> issued;

private:
    std::mutex mutex_;
};

// 记录请求并返回预设响应的 HTTP 传输替身
class FakeHttpTransport : public voicetoken::media::HttpTransport {
public:
    voicetoken::common::StatusOr<voicetoken::media::HttpReply> Send(
        const voicetoken::media::HttpEndpoint& endpoint,
        const voicetoken::media::HttpCall& call) override {
        std::lock_guard<std::mutex> lock(mutex_);
        endpoints.push_back(endpoint);
        calls.push_back(call);
        if (!status.IsOk()) {
            return status;
        }
        return voicetoken::common::StatusOr<voicetoken::media::HttpReply>(reply);
    }

    static std::string Header(const voicetoken::media::HttpCall& call, const std::string& name) {
        for (const auto& header : call.headers) {
            if (header.first == name) {
                return header.second;
            }
        }
        return "";
    }

    voicetoken::common::Status status = voicetoken::common::Status::OK();
    voicetoken::media::HttpReply reply{200, "{}"};
    std::vector<voicetoken::media::HttpEndpoint> endpoints;
    std::vector<voicetoken::media::HttpCall> calls;

private:
    std::mutex mutex_;
};

} // namespace testing
} // namespace voicetoken
