// LIQUIDSTAKE - JSON-RPC 2.0 Envelopes Implementation
// Copyright (c) 2024 LIQUIDSTAKE Developers
// MIT License

#include "liquidstake/rpc/protocol.h"

#include <utility>

namespace liquidstake {
namespace rpc {

namespace {
const char* const VERSION = "2.0";
}

// ============================================================================
// Request
// ============================================================================

RPCRequest::RPCRequest(std::string method, JSONValue params, JSONValue id)
    : name_(std::move(method)), args_(std::move(params)), tag_(std::move(id)) {}

JSONValue RPCRequest::ToValue() const {
    JSONValue envelope;
    envelope["jsonrpc"] = VERSION;
    envelope["method"] = name_;
    if (!args_.IsNull()) {
        envelope["params"] = args_;
    }
    if (!tag_.IsNull()) {
        envelope["id"] = tag_;
    }
    return envelope;
}

std::optional<RPCRequest> RPCRequest::FromValue(const JSONValue& value) {
    if (value["jsonrpc"].GetString() != VERSION || !value["method"].IsString()) {
        return std::nullopt;
    }
    const JSONValue& params = value["params"];
    if (!params.IsNull() && !params.IsArray() && !params.IsObject()) {
        return std::nullopt;
    }
    return RPCRequest(value["method"].GetString(), params, value["id"]);
}

std::optional<RPCRequest> RPCRequest::Parse(const std::string& text) {
    auto value = JSONValue::TryParse(text);
    if (!value) {
        return std::nullopt;
    }
    return FromValue(*value);
}

// ============================================================================
// Response
// ============================================================================

RPCResponse RPCResponse::Success(JSONValue result, JSONValue id) {
    RPCResponse response;
    response.payload_ = std::move(result);
    response.tag_ = std::move(id);
    return response;
}

RPCResponse RPCResponse::Error(int code, std::string message, JSONValue id, JSONValue data) {
    RPCResponse response;
    response.failed_ = true;
    response.code_ = code;
    response.message_ = std::move(message);
    response.detail_ = std::move(data);
    response.tag_ = std::move(id);
    return response;
}

JSONValue RPCResponse::ToValue() const {
    JSONValue envelope;
    envelope["jsonrpc"] = VERSION;
    envelope["id"] = tag_;
    if (!failed_) {
        envelope["result"] = payload_;
        return envelope;
    }

    JSONValue& error = envelope["error"];
    error["code"] = code_;
    error["message"] = message_;
    if (!detail_.IsNull()) {
        error["data"] = detail_;
    }
    return envelope;
}

std::optional<RPCResponse> RPCResponse::FromValue(const JSONValue& value) {
    if (!value.IsObject()) {
        return std::nullopt;
    }
    const JSONValue& error = value["error"];
    if (error.IsNull()) {
        if (!value.HasKey("result")) {
            return std::nullopt;
        }
        return Success(value["result"], value["id"]);
    }
    if (!error["code"].IsInt()) {
        return std::nullopt;
    }
    return Error(static_cast<int>(error["code"].GetInt()),
                 error["message"].GetString("Unknown error"), value["id"], error["data"]);
}

std::string EncodeBatch(const std::vector<RPCResponse>& responses) {
    JSONValue batch{JSONValue::Array()};
    for (const RPCResponse& response : responses) {
        batch.Push(response.ToValue());
    }
    return batch.ToJSON();
}

} // namespace rpc
} // namespace liquidstake
