// LIQUIDSTAKE - HTTP Transport
// Copyright (c) 2024 LIQUIDSTAKE Developers
// MIT License
//
// The small HTTP/1.1 subset JSON-RPC needs: one request per connection,
// Content-Length framing, Basic authorization.

#ifndef LIQUIDSTAKE_RPC_HTTP_H
#define LIQUIDSTAKE_RPC_HTTP_H

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <utility>

namespace liquidstake {
namespace rpc {

// ============================================================================
// Messages
// ============================================================================

struct HTTPMessage {
    /// "POST / HTTP/1.1" or "HTTP/1.1 200 OK"
    std::string startLine;
    /// Header names are lower-cased
    std::map<std::string, std::string> headers;
    std::string body;

    /// Header value, or empty if absent
    std::string Header(const std::string& name) const;

    bool IsPost() const { return startLine.compare(0, 5, "POST ") == 0; }

    /// Status code of a response, or -1 if the start line is not one
    int StatusCode() const;
};

/// Split a complete message into start line, headers and body
std::optional<HTTPMessage> ParseHTTPMessage(const std::string& raw);

std::string FormatHTTPRequest(const std::string& host, uint16_t port,
                              const std::string& body, const std::string& authorization);

std::string FormatHTTPResponse(int status, const std::string& body,
                               const std::string& contentType = "application/json");

// ============================================================================
// Basic Authorization
// ============================================================================

std::string EncodeBase64(const std::string& input);

/// @return nullopt on characters outside the base64 alphabet
std::optional<std::string> DecodeBase64(const std::string& input);

/// "Basic " + base64(user:password)
std::string BasicAuthorization(const std::string& user, const std::string& password);

/// User and password from a Basic authorization header
std::optional<std::pair<std::string, std::string>>
ParseBasicAuthorization(const std::string& header);

// ============================================================================
// Socket
// ============================================================================

/// Owns a connected stream socket
class Socket {
public:
    Socket() = default;
    explicit Socket(int fd) : fd_(fd) {}
    ~Socket() { Close(); }

    Socket(Socket&& other) noexcept : fd_(other.fd_) { other.fd_ = -1; }
    Socket& operator=(Socket&& other) noexcept;

    Socket(const Socket&) = delete;
    Socket& operator=(const Socket&) = delete;

    bool IsOpen() const { return fd_ >= 0; }
    int Fd() const { return fd_; }
    void Close();

    void SetTimeouts(int sendSeconds, int receiveSeconds);

    /// @return false if the peer went away first
    bool SendAll(const std::string& data);

    /**
     * Read one message framed by Content-Length (absent means no body).
     * @return false on error, timeout, early close or when limit is exceeded
     */
    bool ReadMessage(size_t limit, std::string& raw);

    /// Address of the peer as text, or "unknown"
    std::string PeerAddress() const;

    /**
     * Connect to host:port, trying each resolved address in turn.
     * @param[out] error Why the connection failed
     */
    static Socket Connect(const std::string& host, uint16_t port,
                          int connectTimeout, int requestTimeout, std::string& error);

private:
    int fd_{-1};
};

} // namespace rpc
} // namespace liquidstake

#endif // LIQUIDSTAKE_RPC_HTTP_H
