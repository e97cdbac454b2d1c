#include "core/session/token_service.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cctype>

namespace voicetoken {
namespace core {

using voicetoken::common::Status;
using voicetoken::common::StatusOr;

TokenService::TokenService(std::shared_ptr<KeyValidator> validator,
                           std::shared_ptr<SessionIssuer> issuer)
    : validator_(std::move(validator)), issuer_(std::move(issuer)) {}

StatusOr<IssuedSession> TokenService::RequestToken(const std::string& credential,
                                                   const std::string& body) const {
    auto validation = validator_->Validate(credential);
    if (!validation.IsOk()) {
        return validation.GetStatus().WithContext("key validation");
    }
    if (!validation.Value().Authorized()) {
        return Status::Unauthenticated("invalid or missing API key");
    }

    auto command = ParseIssueBody(body);
    if (!command.IsOk()) {
        return command.GetStatus();
    }
    command.Value().user_id = validation.Value().record.user_id;

    return issuer_->Issue(command.Value());
}

StatusOr<IssueCommand> ParseIssueBody(const std::string& body) {
    IssueCommand command;
    const bool blank = std::all_of(body.begin(), body.end(), [](unsigned char c) { return std::isspace(c); });
    if (blank) {
        return StatusOr<IssueCommand>(std::move(command));
    }

    auto json = nlohmann::json::parse(body, nullptr, false);
    if (json.is_discarded() || !json.is_object()) {
        return Status::InvalidArgument("request body must be a JSON object");
    }

    auto agent = json.find("agent_name");
    if (agent != json.end() && !agent->is_null()) {
        if (!agent->is_string()) {
            return Status::InvalidArgument("agent_name must be a string");
        }
        command.agent_name = agent->get<std::string>();
    }

    auto customer = json.find("customer");
    if (customer != json.end() && !customer->is_null()) {
        if (!customer->is_object()) {
            return Status::InvalidArgument("customer must be an object");
        }
        auto name = customer->find("name");
        auto email = customer->find("email");
        if (name == customer->end() || !name->is_string() || email == customer->end() || !email->is_string()) {
            return Status::InvalidArgument("customer requires string name and email");
        }
        command.customer = CustomerInfo{name->get<std::string>(), email->get<std::string>()};
    }
    return StatusOr<IssueCommand>(std::move(command));
}

} // namespace core
} // namespace voicetoken
