// LIQUIDSTAKE - HTTP Transport Implementation
// Copyright (c) 2024 LIQUIDSTAKE Developers
// MIT License

#include "liquidstake/rpc/http.h"
#include "liquidstake/util/logging.h"

#include <openssl/evp.h>

#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <vector>

#include <arpa/inet.h>
#include <netdb.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

namespace liquidstake {
namespace rpc {

namespace {

const char* const CRLF = "\r\n";

std::string Lower(std::string text) {
    for (char& c : text) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return text;
}

std::string Trim(const std::string& text) {
    size_t begin = text.find_first_not_of(" \t");
    if (begin == std::string::npos) {
        return "";
    }
    size_t end = text.find_last_not_of(" \t");
    return text.substr(begin, end - begin + 1);
}

const char* ReasonPhrase(int status) {
    switch (status) {
        case 200: return "OK";
        case 204: return "No Content";
        case 400: return "Bad Request";
        case 401: return "Unauthorized";
        case 403: return "Forbidden";
        case 413: return "Payload Too Large";
        case 500: return "Internal Server Error";
        default:  return "Unknown";
    }
}

/// Declared body length of a header block, 0 if absent, nullopt if malformed
std::optional<size_t> ContentLength(const std::string& head) {
    std::string lowered = Lower(head);
    size_t at = lowered.find("\r\ncontent-length:");
    if (at == std::string::npos) {
        return size_t(0);
    }
    at += std::strlen("\r\ncontent-length:");
    size_t end = lowered.find(CRLF, at);
    std::string digits = Trim(lowered.substr(at, end == std::string::npos ? std::string::npos
                                                                           : end - at));
    if (digits.empty() || digits.size() > 12 ||
        digits.find_first_not_of("0123456789") != std::string::npos) {
        return std::nullopt;
    }
    return static_cast<size_t>(std::strtoull(digits.c_str(), nullptr, 10));
}

} // namespace

// ============================================================================
// Messages
// ============================================================================

std::string HTTPMessage::Header(const std::string& name) const {
    auto it = headers.find(Lower(name));
    return it == headers.end() ? std::string() : it->second;
}

int HTTPMessage::StatusCode() const {
    // "HTTP/1.1 200 OK"
    if (startLine.compare(0, 5, "HTTP/") != 0) {
        return -1;
    }
    size_t space = startLine.find(' ');
    if (space == std::string::npos || startLine.size() < space + 4) {
        return -1;
    }
    int code = 0;
    for (size_t i = space + 1; i < space + 4; ++i) {
        if (!std::isdigit(static_cast<unsigned char>(startLine[i]))) {
            return -1;
        }
        code = code * 10 + (startLine[i] - '0');
    }
    return code;
}

std::optional<HTTPMessage> ParseHTTPMessage(const std::string& raw) {
    size_t headEnd = raw.find("\r\n\r\n");
    if (headEnd == std::string::npos) {
        return std::nullopt;
    }

    HTTPMessage message;
    message.body = raw.substr(headEnd + 4);

    size_t lineEnd = raw.find(CRLF);
    message.startLine = raw.substr(0, lineEnd);
    if (message.startLine.empty()) {
        return std::nullopt;
    }

    size_t cursor = lineEnd;
    while (cursor < headEnd) {
        cursor += 2;
        size_t next = raw.find(CRLF, cursor);
        std::string line = raw.substr(cursor, next - cursor);
        cursor = next;

        size_t colon = line.find(':');
        if (colon == std::string::npos) {
            continue;
        }
        message.headers[Lower(Trim(line.substr(0, colon)))] = Trim(line.substr(colon + 1));
    }
    return message;
}

std::string FormatHTTPRequest(const std::string& host, uint16_t port,
                              const std::string& body, const std::string& authorization) {
    std::string out = "POST / HTTP/1.1\r\n";
    out += "Host: " + host + ":" + std::to_string(port) + CRLF;
    out += "Content-Type: application/json\r\n";
    out += "Content-Length: " + std::to_string(body.size()) + CRLF;
    if (!authorization.empty()) {
        out += "Authorization: " + authorization + CRLF;
    }
    out += "Connection: close\r\n\r\n";
    out += body;
    return out;
}

std::string FormatHTTPResponse(int status, const std::string& body,
                               const std::string& contentType) {
    std::string out = "HTTP/1.1 " + std::to_string(status) + " " + ReasonPhrase(status) + CRLF;
    if (status == 401) {
        out += "WWW-Authenticate: Basic realm=\"liquidstaked\"\r\n";
    }
    out += "Content-Type: " + contentType + CRLF;
    out += "Content-Length: " + std::to_string(body.size()) + CRLF;
    out += "Connection: close\r\n\r\n";
    out += body;
    return out;
}

// ============================================================================
// Basic Authorization
// ============================================================================

std::string EncodeBase64(const std::string& input) {
    if (input.empty()) {
        return "";
    }
    std::vector<unsigned char> out(4 * ((input.size() + 2) / 3) + 1);
    int written = EVP_EncodeBlock(out.data(),
                                  reinterpret_cast<const unsigned char*>(input.data()),
                                  static_cast<int>(input.size()));
    return std::string(reinterpret_cast<const char*>(out.data()), static_cast<size_t>(written));
}

std::optional<std::string> DecodeBase64(const std::string& input) {
    std::string compact;
    for (char c : input) {
        if (!std::isspace(static_cast<unsigned char>(c))) {
            compact += c;
        }
    }
    if (compact.empty()) {
        return std::string();
    }
    if (compact.size() % 4 != 0) {
        return std::nullopt;
    }

    std::vector<unsigned char> out(compact.size() / 4 * 3);
    int written = EVP_DecodeBlock(out.data(),
                                  reinterpret_cast<const unsigned char*>(compact.data()),
                                  static_cast<int>(compact.size()));
    if (written < 0) {
        return std::nullopt;
    }
    // EVP_DecodeBlock counts the padding as decoded zero bytes
    size_t padding = 0;
    if (compact[compact.size() - 1] == '=') ++padding;
    if (compact[compact.size() - 2] == '=') ++padding;
    return std::string(reinterpret_cast<const char*>(out.data()),
                       static_cast<size_t>(written) - padding);
}

std::string BasicAuthorization(const std::string& user, const std::string& password) {
    return "Basic " + EncodeBase64(user + ":" + password);
}

std::optional<std::pair<std::string, std::string>>
ParseBasicAuthorization(const std::string& header) {
    if (Lower(header.substr(0, 6)) != "basic ") {
        return std::nullopt;
    }
    auto decoded = DecodeBase64(header.substr(6));
    if (!decoded) {
        return std::nullopt;
    }
    size_t colon = decoded->find(':');
    if (colon == std::string::npos) {
        return std::nullopt;
    }
    return std::make_pair(decoded->substr(0, colon), decoded->substr(colon + 1));
}

// ============================================================================
// Socket
// ============================================================================

Socket& Socket::operator=(Socket&& other) noexcept {
    if (this != &other) {
        Close();
        fd_ = other.fd_;
        other.fd_ = -1;
    }
    return *this;
}

void Socket::Close() {
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
}

void Socket::SetTimeouts(int sendSeconds, int receiveSeconds) {
    struct timeval send{sendSeconds, 0};
    struct timeval receive{receiveSeconds, 0};
    if (setsockopt(fd_, SOL_SOCKET, SO_SNDTIMEO, &send, sizeof(send)) != 0 ||
        setsockopt(fd_, SOL_SOCKET, SO_RCVTIMEO, &receive, sizeof(receive)) != 0) {
        LOG_DEBUG(util::LogCategory::RPC) << "Socket timeouts not applied: "
                                          << std::strerror(errno);
    }
}

bool Socket::SendAll(const std::string& data) {
    const char* cursor = data.data();
    size_t left = data.size();
    while (left > 0) {
        ssize_t n = ::send(fd_, cursor, left, MSG_NOSIGNAL);
        if (n <= 0) {
            return false;
        }
        cursor += n;
        left -= static_cast<size_t>(n);
    }
    return true;
}

bool Socket::ReadMessage(size_t limit, std::string& raw) {
    std::optional<size_t> total;
    char chunk[4096];

    while (!total || raw.size() < *total) {
        ssize_t n = ::recv(fd_, chunk, sizeof(chunk), 0);
        if (n <= 0) {
            return false;
        }
        raw.append(chunk, static_cast<size_t>(n));
        if (raw.size() > limit) {
            return false;
        }

        if (!total) {
            size_t headEnd = raw.find("\r\n\r\n");
            if (headEnd == std::string::npos) {
                continue;
            }
            auto length = ContentLength(raw.substr(0, headEnd + 2));
            if (!length || headEnd + 4 + *length > limit) {
                return false;
            }
            total = headEnd + 4 + *length;
        }
    }
    raw.resize(*total);
    return true;
}

std::string Socket::PeerAddress() const {
    struct sockaddr_storage addr;
    socklen_t len = sizeof(addr);
    if (getpeername(fd_, reinterpret_cast<struct sockaddr*>(&addr), &len) != 0) {
        return "unknown";
    }
    char text[INET6_ADDRSTRLEN] = {0};
    const void* where = addr.ss_family == AF_INET6
        ? static_cast<const void*>(&reinterpret_cast<struct sockaddr_in6*>(&addr)->sin6_addr)
        : static_cast<const void*>(&reinterpret_cast<struct sockaddr_in*>(&addr)->sin_addr);
    if (inet_ntop(addr.ss_family, where, text, sizeof(text)) == nullptr) {
        return "unknown";
    }
    return text;
}

Socket Socket::Connect(const std::string& host, uint16_t port,
                       int connectTimeout, int requestTimeout, std::string& error) {
    struct addrinfo hints;
    std::memset(&hints, 0, sizeof(hints));
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    struct addrinfo* found = nullptr;
    std::string service = std::to_string(port);
    int rc = getaddrinfo(host.c_str(), service.c_str(), &hints, &found);
    if (rc != 0) {
        error = "cannot resolve " + host + ": " + gai_strerror(rc);
        return Socket();
    }

    error = "cannot connect to " + host + ":" + service;
    Socket socket;
    for (struct addrinfo* p = found; p != nullptr; p = p->ai_next) {
        Socket candidate(::socket(p->ai_family, p->ai_socktype, p->ai_protocol));
        if (!candidate.IsOpen()) {
            continue;
        }
        // SO_SNDTIMEO also bounds connect() on Linux
        candidate.SetTimeouts(connectTimeout, requestTimeout);
        if (::connect(candidate.Fd(), p->ai_addr, p->ai_addrlen) == 0) {
            candidate.SetTimeouts(requestTimeout, requestTimeout);
            socket = std::move(candidate);
            break;
        }
        error = "cannot connect to " + host + ":" + service + ": " + std::strerror(errno);
    }
    freeaddrinfo(found);
    return socket;
}

} // namespace rpc
} // namespace liquidstake
