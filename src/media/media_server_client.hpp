#pragma once

#include "common/config.hpp"
#include "media/http_transport.hpp"
#include "media/media_service.hpp"

#include <memory>
#include <string>

namespace voicetoken {
namespace media {

// 媒体服务器客户端
// 房间创建走 HTTP (Twirp JSON) 接口, 以短期 roomCreate 令牌鉴权; 访问令牌本地签发
class MediaServerClient : public MediaSessionService {
public:
    MediaServerClient(const voicetoken::common::MediaConfig& config,
                      std::shared_ptr<HttpTransport> transport);

    voicetoken::common::Status CreateRoom(const SessionGrant& grant) override;
    voicetoken::common::StatusOr<std::string> IssueToken(const SessionGrant& grant) override;

private:
    voicetoken::common::Status CheckCredentials() const;

    voicetoken::common::MediaConfig config_;
    std::shared_ptr<HttpTransport> transport_;
};

} // namespace media
} // namespace voicetoken
