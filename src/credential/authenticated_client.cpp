#include "credential/authenticated_client.hpp"
#include "core/utils.hpp"

#include <nlohmann/json.hpp>

#include <format>

namespace rulegate {

bool is_token_rejected(int status, std::string_view body) {
    if (status == 401) return true;
    if (status != 200) return false;

    const auto doc = nlohmann::json::parse(body, nullptr, false);
    if (doc.is_discarded() || !doc.is_object()) return false;

    const auto code = doc.find("code");
    if (code == doc.end() || !code->is_number_integer() || code->get<int64_t>() != 401) {
        return false;
    }
    const auto message = doc.find("message");
    if (message == doc.end() || !message->is_string()) return false;
    return utils::to_lower(message->get<std::string>()).find("unauthorized") != std::string::npos;
}

AuthenticatedUpstreamClient::AuthenticatedUpstreamClient(
    std::shared_ptr<IUpstreamClient> inner,
    std::shared_ptr<CredentialManager> credentials)
    : inner_(std::move(inner)), credentials_(std::move(credentials)) {}

Result<UpstreamResponse> AuthenticatedUpstreamClient::send(const UpstreamRequest& request) {
    auto token = credentials_->get_valid_token();
    if (token.is_error()) return token.forward_error<UpstreamResponse>();

    UpstreamRequest authed = request;
    set_header(authed.headers, "authorization", token.value());

    auto first = inner_->send(authed);
    if (first.is_error() || !is_token_rejected(first.value().status, first.value().body)) return first;

    utils::log::info(std::format("Upstream rejected token on {} {}, re-authenticating",
        request.method, request.path));
    credentials_->invalidate(token.value());
    retries_.fetch_add(1, std::memory_order_relaxed);

    auto renewed = credentials_->get_valid_token();
    if (renewed.is_error()) return renewed.forward_error<UpstreamResponse>();

    set_header(authed.headers, "authorization", renewed.value());
    return inner_->send(authed);
}

} // namespace rulegate
