// LIQUIDSTAKE - RPC Client Implementation
// Copyright (c) 2024 LIQUIDSTAKE Developers
// MIT License

#include "liquidstake/rpc/client.h"
#include "liquidstake/util/logging.h"

#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace liquidstake {
namespace rpc {

// ============================================================================
// Endpoint Parsing
// ============================================================================

bool ParseEndpoint(const std::string& endpoint, RPCClientConfig& config) {
    std::string rest = endpoint;
    size_t scheme = rest.find("://");
    if (scheme != std::string::npos) {
        std::string name = rest.substr(0, scheme);
        std::transform(name.begin(), name.end(), name.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        if (name != "http") {
            return false;
        }
        rest.erase(0, scheme + 3);
    }
    while (!rest.empty() && rest.back() == '/') {
        rest.pop_back();
    }

    size_t colon = rest.rfind(':');
    if (rest.find('/') != std::string::npos || colon == std::string::npos || colon == 0) {
        return false;
    }
    std::string digits = rest.substr(colon + 1);
    if (digits.empty() || digits.size() > 5 ||
        !std::all_of(digits.begin(), digits.end(),
                     [](unsigned char c) { return std::isdigit(c); })) {
        return false;
    }
    unsigned long port = std::stoul(digits);
    if (port == 0 || port > 65535) {
        return false;
    }

    config.host = rest.substr(0, colon);
    config.port = static_cast<uint16_t>(port);
    return true;
}

// ============================================================================
// RPCClient
// ============================================================================

RPCClient::RPCClient() = default;

RPCClient::RPCClient(const RPCClientConfig& config) : config_(config) {}

void RPCClient::SetConfig(const RPCClientConfig& config) {
    std::lock_guard<std::mutex> lock(callMutex_);
    config_ = config;
}

std::optional<std::string> RPCClient::Exchange(const std::string& body) {
    Socket socket = Socket::Connect(config_.host, config_.port, config_.connectTimeout,
                                    config_.requestTimeout, lastError_);
    if (!socket.IsOpen()) {
        return std::nullopt;
    }

    std::string authorization;
    if (!config_.rpcUser.empty()) {
        authorization = BasicAuthorization(config_.rpcUser, config_.rpcPassword);
    }
    if (!socket.SendAll(FormatHTTPRequest(config_.host, config_.port, body, authorization))) {
        lastError_ = "connection closed while sending the request";
        return std::nullopt;
    }

    std::string raw;
    // Replies carry whole snapshots; allow more than the server accepts
    if (!socket.ReadMessage(16 * 1024 * 1024, raw)) {
        lastError_ = "no complete reply from " + config_.host;
        return std::nullopt;
    }
    return raw;
}

RPCResponse RPCClient::Fail(int code, const std::string& message, const JSONValue& id) {
    ++totalErrors_;
    lastErrorCode_ = code;
    lastError_ = message;
    return RPCResponse::Error(code, message, id);
}

RPCResponse RPCClient::Call(const std::string& method, const JSONValue& params) {
    std::lock_guard<std::mutex> lock(callMutex_);
    ++totalCalls_;

    RPCRequest request(method, params, JSONValue(GenerateId()));
    const JSONValue& id = request.GetId();

    std::optional<std::string> raw = Exchange(request.ToJSON());
    if (!raw) {
        LOG_DEBUG(util::LogCategory::RPC) << method << ": " << lastError_;
        return Fail(ErrorCode::NETWORK_ERROR, lastError_, id);
    }

    std::optional<HTTPMessage> reply = ParseHTTPMessage(*raw);
    int status = reply ? reply->StatusCode() : -1;
    if (status < 0) {
        return Fail(ErrorCode::NETWORK_ERROR, "Invalid HTTP response", id);
    }
    if (status == 401 || status == 403) {
        return Fail(ErrorCode::UNAUTHORIZED,
                    "Authorization failed (HTTP " + std::to_string(status) + ")", id);
    }

    std::optional<RPCResponse> response;
    if (auto document = JSONValue::TryParse(reply->body)) {
        response = RPCResponse::FromValue(*document);
    }
    if (!response) {
        return Fail(ErrorCode::PARSE_ERROR,
                    "Invalid JSON response (HTTP " + std::to_string(status) + ")", id);
    }

    if (response->IsError()) {
        ++totalErrors_;
        lastErrorCode_ = response->GetErrorCode();
        lastError_ = response->GetErrorMessage();
    } else {
        lastErrorCode_ = 0;
        lastError_.clear();
    }
    return *response;
}

JSONValue RPCClient::CallForResult(const std::string& method, const JSONValue& params) {
    RPCResponse response = Call(method, params);
    if (response.IsError()) {
        throw std::runtime_error(response.GetErrorMessage());
    }
    return response.GetResult();
}

} // namespace rpc
} // namespace liquidstake
