// LIQUIDSTAKE - RPC Client
// Copyright (c) 2024 LIQUIDSTAKE Developers
// MIT License
//
// JSON-RPC 2.0 client over HTTP, used by reward-claimer to reach the
// daemon. One TCP connection per call.

#ifndef LIQUIDSTAKE_RPC_CLIENT_H
#define LIQUIDSTAKE_RPC_CLIENT_H

#include "liquidstake/rpc/server.h"

#include <atomic>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>

namespace liquidstake {
namespace rpc {

// ============================================================================
// RPC Client Configuration
// ============================================================================

struct RPCClientConfig {
    /// Server hostname or IP
    std::string host{"127.0.0.1"};

    /// Server port
    uint16_t port{8645};

    /// RPC username
    std::string rpcUser;

    /// RPC password
    std::string rpcPassword;

    /// Connection timeout (seconds)
    int connectTimeout{5};

    /// Request timeout (seconds)
    int requestTimeout{30};
};

/**
 * Fill host and port from "http://host:port[/]" or "host:port".
 * @return false if the endpoint is malformed or uses another scheme
 */
bool ParseEndpoint(const std::string& endpoint, RPCClientConfig& config);

// ============================================================================
// RPC Client
// ============================================================================

class RPCClient {
public:
    RPCClient();
    explicit RPCClient(const RPCClientConfig& config);

    // Non-copyable
    RPCClient(const RPCClient&) = delete;
    RPCClient& operator=(const RPCClient&) = delete;

    void SetConfig(const RPCClientConfig& config);
    const RPCClientConfig& GetConfig() const { return config_; }

    /**
     * Call an RPC method. Transport failures come back as NETWORK_ERROR
     * responses; this never throws for I/O errors.
     */
    RPCResponse Call(const std::string& method, const JSONValue& params = JSONValue());

    /// Call and return the result
    /// @throws std::runtime_error carrying the error message on failure
    JSONValue CallForResult(const std::string& method,
                            const JSONValue& params = JSONValue());

    const std::string& GetLastError() const { return lastError_; }
    int GetLastErrorCode() const { return lastErrorCode_; }

    uint64_t GetTotalCalls() const { return totalCalls_; }
    uint64_t GetTotalErrors() const { return totalErrors_; }

private:
    /// Raw HTTP reply to one request, or nullopt with lastError_ set
    std::optional<std::string> Exchange(const std::string& body);

    int64_t GenerateId() { return nextId_++; }

    RPCResponse Fail(int code, const std::string& message, const JSONValue& id);

    RPCClientConfig config_;
    std::mutex callMutex_;

    std::string lastError_;
    int lastErrorCode_{0};

    std::atomic<int64_t> nextId_{1};
    std::atomic<uint64_t> totalCalls_{0};
    std::atomic<uint64_t> totalErrors_{0};
};

} // namespace rpc
} // namespace liquidstake

#endif // LIQUIDSTAKE_RPC_CLIENT_H
