// LIQUIDSTAKE - RPC Server
// Copyright (c) 2024 LIQUIDSTAKE Developers
// MIT License
//
// JSON-RPC 2.0 over HTTP for the staking daemon.
//
// Connections are accepted and served one at a time on the server thread,
// so handlers never run concurrently. Callers authenticate with HTTP Basic
// credentials (the cookie file by default); each client address has a
// request budget per minute and is locked out after repeated bad logins.

#ifndef LIQUIDSTAKE_RPC_SERVER_H
#define LIQUIDSTAKE_RPC_SERVER_H

#include "liquidstake/rpc/http.h"
#include "liquidstake/rpc/json.h"
#include "liquidstake/rpc/protocol.h"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

namespace liquidstake {
namespace rpc {

// ============================================================================
// Methods
// ============================================================================

/// Who is calling
struct RPCContext {
    std::string clientAddress;
    /// Empty unless the caller authenticated
    std::string username;
    bool isLocal{false};
};

using RPCHandler = std::function<RPCResponse(const RPCRequest&, const RPCContext&)>;

struct RPCMethod {
    std::string name;
    std::string category;
    std::string description;
    RPCHandler handler;
    /// Mutating commands are refused to unauthenticated callers
    bool requiresAuth{false};
    std::vector<std::string> argNames;
};

// ============================================================================
// Client Limits
// ============================================================================

/**
 * Per-address request budget and failed-login lockout. Budgets reset every
 * minute; five failed logins within a minute lock the address for five
 * minutes.
 */
class ClientLimiter {
public:
    using Clock = std::chrono::steady_clock;

    static constexpr size_t MAX_FAILED_LOGINS = 5;
    static constexpr std::chrono::seconds FAILURE_WINDOW{60};
    static constexpr std::chrono::seconds LOCKOUT{300};

    explicit ClientLimiter(size_t requestsPerMinute) : budget_(requestsPerMinute) {}

    void SetBudget(size_t requestsPerMinute);

    /// Count one request; false once the address has used its budget
    bool AllowRequest(const std::string& address, Clock::time_point now = Clock::now());

    bool IsLockedOut(const std::string& address, Clock::time_point now = Clock::now());

    /// @return true if this failure locked the address
    bool RecordFailedLogin(const std::string& address, Clock::time_point now = Clock::now());

    void RecordLogin(const std::string& address);

    /// Forget addresses idle for longer than a lockout
    void Prune(Clock::time_point now = Clock::now());

    size_t TrackedClients() const;

private:
    struct Usage {
        Clock::time_point windowStart;
        size_t requests{0};
    };
    struct Failures {
        Clock::time_point firstFailure;
        Clock::time_point lastFailure;
        size_t count{0};
        std::optional<Clock::time_point> lockedUntil;
    };

    mutable std::mutex mutex_;
    size_t budget_;
    std::unordered_map<std::string, Usage> usage_;
    std::unordered_map<std::string, Failures> failures_;
};

// ============================================================================
// Server
// ============================================================================

struct RPCServerConfig {
    std::string bindAddress{"127.0.0.1"};
    uint16_t port{8645};

    /// Basic credentials; empty user admits only loopback callers
    std::string rpcUser;
    std::string rpcPassword;

    int listenBacklog{64};
    /// Seconds a client may take to send its request
    int requestTimeout{30};

    bool enableRateLimiting{true};
    size_t maxRequestsPerMinute{600};

    /// Headers included
    size_t maxRequestSize{1024 * 1024};
};

class RPCServer {
public:
    RPCServer() : RPCServer(RPCServerConfig()) {}
    explicit RPCServer(const RPCServerConfig& config);
    ~RPCServer();

    RPCServer(const RPCServer&) = delete;
    RPCServer& operator=(const RPCServer&) = delete;

    void SetConfig(const RPCServerConfig& config);
    const RPCServerConfig& GetConfig() const { return config_; }

    /// Bind, listen and start the server thread
    bool Start();

    /// Stop accepting and join the server thread
    void Stop();

    bool IsRunning() const { return running_.load(); }

    void RegisterMethod(const RPCMethod& method);
    void UnregisterMethod(const std::string& name);
    bool HasMethod(const std::string& name) const;
    std::optional<RPCMethod> GetMethod(const std::string& name) const;
    /// Sorted by name
    std::vector<RPCMethod> GetMethods() const;

    /// Dispatch one request; handler exceptions become INTERNAL_ERROR
    RPCResponse HandleRequest(const RPCRequest& request, const RPCContext& context);

    /// Dispatch a raw body (single or batch); empty result for notifications
    std::string HandleRawRequest(const std::string& body, const RPCContext& context);

    uint64_t GetTotalRequests() const { return totalRequests_.load(); }
    uint64_t GetTotalErrors() const { return totalErrors_.load(); }

private:
    void AcceptLoop();
    void ServeConnection(Socket client);

    /// HTTP status and body for one authenticated exchange
    std::pair<int, std::string> Respond(const HTTPMessage& message, RPCContext& context);

    bool CheckCredentials(const HTTPMessage& message, std::string& username) const;

    RPCResponse Count(RPCResponse response);

    RPCServerConfig config_;
    ClientLimiter limiter_;

    std::map<std::string, RPCMethod> methods_;
    mutable std::mutex methodsMutex_;

    std::atomic<bool> running_{false};
    std::atomic<int> listenFd_{-1};
    std::thread acceptThread_;

    std::atomic<uint64_t> totalRequests_{0};
    std::atomic<uint64_t> totalErrors_{0};
};

// ============================================================================
// Credentials
// ============================================================================

/**
 * Random password for RPC authentication.
 *
 * @param bytes Random bytes drawn; the result is twice as many hex characters
 * @throws std::runtime_error if the random generator fails
 */
std::string GenerateRPCPassword(size_t bytes = 32);

/**
 * Write "__cookie__:<password>" to cookiePath, readable by the owner only.
 * @return The password, or nullopt if the file could not be written
 */
std::optional<std::string> GenerateRPCCookie(const std::string& cookiePath);

} // namespace rpc
} // namespace liquidstake

#endif // LIQUIDSTAKE_RPC_SERVER_H
