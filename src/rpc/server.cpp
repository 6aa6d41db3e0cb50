// LIQUIDSTAKE - RPC Server Implementation
// Copyright (c) 2024 LIQUIDSTAKE Developers
// MIT License

#include "liquidstake/rpc/server.h"
#include "liquidstake/core/hex.h"
#include "liquidstake/crypto/hash.h"
#include "liquidstake/util/logging.h"

#include <cerrno>
#include <cstring>
#include <fstream>
#include <iterator>
#include <stdexcept>
#include <utility>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <sys/stat.h>
#include <unistd.h>

namespace liquidstake {
namespace rpc {

namespace {

std::string ErrorBody(int code, const std::string& message) {
    return RPCResponse::Error(code, message, JSONValue()).ToJSON();
}

} // namespace

// ============================================================================
// ClientLimiter
// ============================================================================

void ClientLimiter::SetBudget(size_t requestsPerMinute) {
    std::lock_guard<std::mutex> lock(mutex_);
    budget_ = requestsPerMinute;
}

bool ClientLimiter::AllowRequest(const std::string& address, Clock::time_point now) {
    std::lock_guard<std::mutex> lock(mutex_);
    Usage& usage = usage_[address];
    if (usage.requests == 0 || now - usage.windowStart >= std::chrono::minutes(1)) {
        usage.windowStart = now;
        usage.requests = 0;
    }
    if (usage.requests >= budget_) {
        return false;
    }
    ++usage.requests;
    return true;
}

bool ClientLimiter::IsLockedOut(const std::string& address, Clock::time_point now) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = failures_.find(address);
    if (it == failures_.end() || !it->second.lockedUntil) {
        return false;
    }
    if (now < *it->second.lockedUntil) {
        return true;
    }
    failures_.erase(it);
    return false;
}

bool ClientLimiter::RecordFailedLogin(const std::string& address, Clock::time_point now) {
    std::lock_guard<std::mutex> lock(mutex_);
    Failures& failures = failures_[address];
    if (failures.count == 0 || now - failures.firstFailure >= FAILURE_WINDOW) {
        failures.firstFailure = now;
        failures.count = 0;
    }
    failures.lastFailure = now;
    if (++failures.count < MAX_FAILED_LOGINS) {
        return false;
    }

    failures.lockedUntil = now + LOCKOUT;
    LOG_WARN(util::LogCategory::RPC) << "Locking out " << address << " for "
                                     << LOCKOUT.count() << "s after " << failures.count
                                     << " failed logins";
    return true;
}

void ClientLimiter::RecordLogin(const std::string& address) {
    std::lock_guard<std::mutex> lock(mutex_);
    failures_.erase(address);
}

void ClientLimiter::Prune(Clock::time_point now) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto it = usage_.begin(); it != usage_.end();) {
        it = now - it->second.windowStart >= LOCKOUT ? usage_.erase(it) : std::next(it);
    }
    for (auto it = failures_.begin(); it != failures_.end();) {
        bool locked = it->second.lockedUntil && now < *it->second.lockedUntil;
        bool stale = now - it->second.lastFailure >= LOCKOUT;
        it = !locked && stale ? failures_.erase(it) : std::next(it);
    }
}

size_t ClientLimiter::TrackedClients() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return usage_.size() + failures_.size();
}

// ============================================================================
// RPCServer
// ============================================================================

RPCServer::RPCServer(const RPCServerConfig& config)
    : config_(config), limiter_(config.maxRequestsPerMinute) {}

RPCServer::~RPCServer() {
    Stop();
}

void RPCServer::SetConfig(const RPCServerConfig& config) {
    config_ = config;
    limiter_.SetBudget(config.maxRequestsPerMinute);
}

bool RPCServer::Start() {
    if (running_.load()) {
        return true;
    }

    struct sockaddr_in addr;
    std::memset(&addr, 0, sizeof(addr));
    addr.sin_family = AF_INET;
    addr.sin_port = htons(config_.port);
    if (config_.bindAddress.empty() || config_.bindAddress == "0.0.0.0") {
        addr.sin_addr.s_addr = htonl(INADDR_ANY);
    } else if (inet_pton(AF_INET, config_.bindAddress.c_str(), &addr.sin_addr) != 1) {
        LOG_ERROR(util::LogCategory::RPC) << "Invalid RPC bind address " << config_.bindAddress;
        return false;
    }

    int fd = ::socket(AF_INET, SOCK_STREAM, 0);
    if (fd < 0) {
        LOG_ERROR(util::LogCategory::RPC) << "Cannot create RPC socket: " << std::strerror(errno);
        return false;
    }
    int reuse = 1;
    setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &reuse, sizeof(reuse));

    if (::bind(fd, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) != 0 ||
        ::listen(fd, config_.listenBacklog) != 0) {
        LOG_ERROR(util::LogCategory::RPC) << "Cannot listen on " << config_.bindAddress << ":"
                                          << config_.port << ": " << std::strerror(errno);
        ::close(fd);
        return false;
    }

    listenFd_.store(fd);
    running_.store(true);
    acceptThread_ = std::thread(&RPCServer::AcceptLoop, this);

    LOG_INFO(util::LogCategory::RPC) << "RPC server listening on " << config_.bindAddress
                                     << ":" << config_.port;
    return true;
}

void RPCServer::Stop() {
    if (!running_.exchange(false)) {
        return;
    }
    int fd = listenFd_.exchange(-1);
    if (fd >= 0) {
        // Wakes the blocked accept()
        ::shutdown(fd, SHUT_RDWR);
    }
    if (acceptThread_.joinable()) {
        acceptThread_.join();
    }
    if (fd >= 0) {
        ::close(fd);
    }
    LOG_INFO(util::LogCategory::RPC) << "RPC server stopped after " << totalRequests_.load()
                                     << " requests";
}

void RPCServer::RegisterMethod(const RPCMethod& method) {
    std::lock_guard<std::mutex> lock(methodsMutex_);
    methods_[method.name] = method;
}

void RPCServer::UnregisterMethod(const std::string& name) {
    std::lock_guard<std::mutex> lock(methodsMutex_);
    methods_.erase(name);
}

bool RPCServer::HasMethod(const std::string& name) const {
    std::lock_guard<std::mutex> lock(methodsMutex_);
    return methods_.find(name) != methods_.end();
}

std::optional<RPCMethod> RPCServer::GetMethod(const std::string& name) const {
    std::lock_guard<std::mutex> lock(methodsMutex_);
    auto it = methods_.find(name);
    if (it == methods_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<RPCMethod> RPCServer::GetMethods() const {
    std::lock_guard<std::mutex> lock(methodsMutex_);
    std::vector<RPCMethod> methods;
    methods.reserve(methods_.size());
    for (const auto& entry : methods_) {
        methods.push_back(entry.second);
    }
    return methods;
}

// ============================================================================
// Dispatch
// ============================================================================

RPCResponse RPCServer::Count(RPCResponse response) {
    if (response.IsError()) {
        ++totalErrors_;
    }
    return response;
}

RPCResponse RPCServer::HandleRequest(const RPCRequest& request, const RPCContext& context) {
    ++totalRequests_;
    const JSONValue& id = request.GetId();

    std::optional<RPCMethod> method = GetMethod(request.GetMethod());
    if (!method) {
        return Count(RPCResponse::Error(ErrorCode::METHOD_NOT_FOUND,
                                        "Method not found: " + request.GetMethod(), id));
    }
    if (method->requiresAuth && context.username.empty()) {
        return Count(RPCResponse::Error(ErrorCode::UNAUTHORIZED, "Authentication required", id));
    }

    LOG_DEBUG(util::LogCategory::RPC) << request.GetMethod() << " from "
                                      << context.clientAddress;
    try {
        return Count(method->handler(request, context));
    } catch (const std::exception& e) {
        LOG_ERROR(util::LogCategory::RPC) << request.GetMethod() << " threw: " << e.what();
        return Count(RPCResponse::Error(ErrorCode::INTERNAL_ERROR, e.what(), id));
    }
}

std::string RPCServer::HandleRawRequest(const std::string& body, const RPCContext& context) {
    if (config_.enableRateLimiting && !limiter_.AllowRequest(context.clientAddress)) {
        return ErrorBody(ErrorCode::RATE_LIMITED, "Rate limit exceeded");
    }

    auto document = JSONValue::TryParse(body);
    if (!document) {
        return ErrorBody(ErrorCode::PARSE_ERROR, "Parse error");
    }

    if (!document->IsArray()) {
        auto request = RPCRequest::FromValue(*document);
        if (!request) {
            return ErrorBody(ErrorCode::INVALID_REQUEST, "Invalid Request");
        }
        RPCResponse response = HandleRequest(*request, context);
        return request->IsNotification() ? std::string() : response.ToJSON();
    }

    if (document->Size() == 0) {
        return ErrorBody(ErrorCode::INVALID_REQUEST, "Empty batch");
    }
    std::vector<RPCResponse> responses;
    for (const JSONValue& entry : document->Items()) {
        auto request = RPCRequest::FromValue(entry);
        if (!request) {
            responses.push_back(RPCResponse::Error(ErrorCode::INVALID_REQUEST,
                                                   "Invalid Request", JSONValue()));
            continue;
        }
        RPCResponse response = HandleRequest(*request, context);
        if (!request->IsNotification()) {
            responses.push_back(std::move(response));
        }
    }
    return responses.empty() ? std::string() : EncodeBatch(responses);
}

// ============================================================================
// Transport
// ============================================================================

void RPCServer::AcceptLoop() {
    auto lastPrune = ClientLimiter::Clock::now();

    while (running_.load()) {
        int fd = listenFd_.load();
        if (fd < 0) {
            break;
        }
        Socket client(::accept(fd, nullptr, nullptr));
        if (!client.IsOpen()) {
            if (running_.load()) {
                LOG_WARN(util::LogCategory::RPC) << "accept failed: " << std::strerror(errno);
            }
            continue;
        }

        ServeConnection(std::move(client));

        auto now = ClientLimiter::Clock::now();
        if (now - lastPrune >= ClientLimiter::LOCKOUT) {
            limiter_.Prune(now);
            lastPrune = now;
        }
    }
}

void RPCServer::ServeConnection(Socket client) {
    client.SetTimeouts(config_.requestTimeout, config_.requestTimeout);

    RPCContext context;
    context.clientAddress = client.PeerAddress();
    context.isLocal = context.clientAddress == "127.0.0.1" || context.clientAddress == "::1";

    std::string raw;
    if (!client.ReadMessage(config_.maxRequestSize, raw)) {
        client.SendAll(FormatHTTPResponse(400, "Bad Request", "text/plain"));
        return;
    }
    auto message = ParseHTTPMessage(raw);
    if (!message || !message->IsPost()) {
        client.SendAll(FormatHTTPResponse(400, "Bad Request", "text/plain"));
        return;
    }

    std::pair<int, std::string> reply = Respond(*message, context);
    if (!client.SendAll(FormatHTTPResponse(reply.first, reply.second))) {
        LOG_DEBUG(util::LogCategory::RPC) << context.clientAddress
                                          << " disconnected before the reply";
    }
}

std::pair<int, std::string> RPCServer::Respond(const HTTPMessage& message, RPCContext& context) {
    if (config_.rpcUser.empty()) {
        // No credentials configured: loopback callers are trusted
        if (context.isLocal) {
            context.username = "__local__";
        }
    } else {
        if (limiter_.IsLockedOut(context.clientAddress)) {
            return {403, ErrorBody(ErrorCode::FORBIDDEN, "Too many failed logins, try later")};
        }
        if (!CheckCredentials(message, context.username)) {
            bool locked = limiter_.RecordFailedLogin(context.clientAddress);
            return {401, ErrorBody(ErrorCode::UNAUTHORIZED,
                                   locked ? "Locked out after repeated failed logins"
                                          : "Unauthorized")};
        }
        limiter_.RecordLogin(context.clientAddress);
    }

    std::string body = HandleRawRequest(message.body, context);
    if (body.empty()) {
        return {204, body};
    }
    return {200, body};
}

bool RPCServer::CheckCredentials(const HTTPMessage& message, std::string& username) const {
    auto credentials = ParseBasicAuthorization(message.Header("authorization"));
    if (!credentials) {
        return false;
    }
    // Compare both so timing does not reveal which one differs
    bool userOk = ConstantTimeCompare(credentials->first, config_.rpcUser);
    bool passwordOk = ConstantTimeCompare(credentials->second, config_.rpcPassword);
    if (!userOk || !passwordOk) {
        return false;
    }
    username = credentials->first;
    return true;
}

// ============================================================================
// Credentials
// ============================================================================

std::string GenerateRPCPassword(size_t bytes) {
    return BytesToHex(GetRandomBytes(bytes));
}

std::optional<std::string> GenerateRPCCookie(const std::string& cookiePath) {
    std::string password = GenerateRPCPassword();

    {
        std::ofstream out(cookiePath, std::ios::out | std::ios::trunc);
        out << "__cookie__:" << password;
        out.close();
        if (!out) {
            LOG_ERROR(util::LogCategory::RPC) << "Cannot write RPC cookie " << cookiePath;
            return std::nullopt;
        }
    }
    if (::chmod(cookiePath.c_str(), S_IRUSR | S_IWUSR) != 0) {
        LOG_WARN(util::LogCategory::RPC) << "Cannot restrict RPC cookie permissions: "
                                         << std::strerror(errno);
    }

    LOG_INFO(util::LogCategory::RPC) << "RPC cookie written to " << cookiePath;
    return password;
}

} // namespace rpc
} // namespace liquidstake
