// LIQUIDSTAKE - JSON-RPC 2.0 Envelopes
// Copyright (c) 2024 LIQUIDSTAKE Developers
// MIT License
//
// Request and response envelopes plus the error codes the daemon returns.
// Staking rejections use STAKING_ERROR with the error name in data.error.

#ifndef LIQUIDSTAKE_RPC_PROTOCOL_H
#define LIQUIDSTAKE_RPC_PROTOCOL_H

#include "liquidstake/rpc/json.h"

#include <optional>
#include <string>
#include <vector>

namespace liquidstake {
namespace rpc {

// ============================================================================
// Error Codes
// ============================================================================

namespace ErrorCode {
    constexpr int PARSE_ERROR = -32700;
    constexpr int INVALID_REQUEST = -32600;
    constexpr int METHOD_NOT_FOUND = -32601;
    constexpr int INVALID_PARAMS = -32602;
    constexpr int INTERNAL_ERROR = -32603;

    /// Daemon is not ready for the call (e.g. stop requested)
    constexpr int SERVER_ERROR = -32000;
    constexpr int RATE_LIMITED = -32003;
    constexpr int UNAUTHORIZED = -32010;
    /// Caller is locked out after repeated bad credentials
    constexpr int FORBIDDEN = -32011;

    /// Client side only: the daemon could not be reached
    constexpr int NETWORK_ERROR = -10;

    /// A staking operation was rejected; data carries the error name
    constexpr int STAKING_ERROR = -40;
    /// Persisting state after a successful operation failed
    constexpr int STORAGE_ERROR = -41;
}

// ============================================================================
// Request
// ============================================================================

class RPCRequest {
public:
    RPCRequest() = default;
    RPCRequest(std::string method, JSONValue params = JSONValue(), JSONValue id = JSONValue());

    const std::string& GetMethod() const { return name_; }
    const JSONValue& GetParams() const { return args_; }
    const JSONValue& GetId() const { return tag_; }

    /// Requests without an id are notifications and get no response
    bool IsNotification() const { return tag_.IsNull(); }

    /// Named argument; null when params is not an object or lacks it
    const JSONValue& GetParam(const std::string& name) const { return args_[name]; }
    /// Positional argument; null when params is not an array or is short
    const JSONValue& GetParam(size_t index) const { return args_[index]; }

    bool HasParam(const std::string& name) const { return args_.HasKey(name); }
    bool HasParam(size_t index) const { return args_.IsArray() && index < args_.Size(); }

    JSONValue ToValue() const;
    std::string ToJSON() const { return ToValue().ToJSON(); }

    /// Validates the 2.0 envelope: version, string method, structured params
    static std::optional<RPCRequest> FromValue(const JSONValue& value);
    static std::optional<RPCRequest> Parse(const std::string& text);

private:
    std::string name_;
    JSONValue args_;
    JSONValue tag_;
};

// ============================================================================
// Response
// ============================================================================

class RPCResponse {
public:
    static RPCResponse Success(JSONValue result, JSONValue id);
    static RPCResponse Error(int code, std::string message, JSONValue id,
                             JSONValue data = JSONValue());

    bool IsError() const { return failed_; }
    const JSONValue& GetResult() const { return payload_; }
    int GetErrorCode() const { return code_; }
    const std::string& GetErrorMessage() const { return message_; }
    const JSONValue& GetErrorData() const { return detail_; }
    const JSONValue& GetId() const { return tag_; }

    JSONValue ToValue() const;
    std::string ToJSON() const { return ToValue().ToJSON(); }

    /// Rebuild a response received from a server
    static std::optional<RPCResponse> FromValue(const JSONValue& value);

private:
    bool failed_{false};
    JSONValue payload_;
    int code_{0};
    std::string message_;
    JSONValue detail_;
    JSONValue tag_;
};

/// A JSON array of responses, as returned for a batch
std::string EncodeBatch(const std::vector<RPCResponse>& responses);

inline RPCResponse InvalidParams(const std::string& message, const JSONValue& id) {
    return RPCResponse::Error(ErrorCode::INVALID_PARAMS, message, id);
}

} // namespace rpc
} // namespace liquidstake

#endif // LIQUIDSTAKE_RPC_PROTOCOL_H
