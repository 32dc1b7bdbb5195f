// VFACE - RPC Server Implementation
// Copyright (c) 2024 VFACE Developers
// MIT License

#include "vface/rpc/server.h"
#include "vface/core/hex.h"
#include "vface/util/logging.h"

#include <openssl/crypto.h>

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <sstream>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

namespace vface {
namespace rpc {

bool ConstantTimeEquals(const std::string& a, const std::string& b) {
    return a.size() == b.size() && CRYPTO_memcmp(a.data(), b.data(), a.size()) == 0;
}

std::optional<std::string> DecodeBase64(const std::string& encoded) {
    std::string urlSafe;
    urlSafe.reserve(encoded.size());
    for (char c : encoded) {
        if (c == '=') {
            break;
        }
        if (std::isspace(static_cast<unsigned char>(c))) {
            continue;
        }
        if (c == '-' || c == '_') {
            return std::nullopt;
        }
        urlSafe.push_back(c == '+' ? '-' : c == '/' ? '_' : c);
    }
    return Base64UrlDecode(urlSafe);
}

// ============================================================================
// Messages
// ============================================================================

RPCRequest::RPCRequest(std::string method, JSONValue params, JSONValue id)
    : method_(std::move(method)), params_(std::move(params)), id_(std::move(id)) {}

const JSONValue& RPCRequest::GetArg(size_t index, const std::string& name) const {
    if (params_.IsObject()) {
        return params_[name];
    }
    if (params_.IsArray()) {
        return params_[index];
    }
    return JSONValue::Null();
}

std::optional<RPCRequest> RPCRequest::FromJSON(const JSONValue& value) {
    const JSONValue& version = value["jsonrpc"];
    const JSONValue& method = value["method"];
    const JSONValue& params = value["params"];
    if (!value.IsObject() || !version.IsString() || version.GetString() != "2.0" ||
        !method.IsString()) {
        return std::nullopt;
    }
    if (!params.IsNull() && !params.IsArray() && !params.IsObject()) {
        return std::nullopt;
    }
    return RPCRequest(method.GetString(), params, value["id"]);
}

std::optional<RPCRequest> RPCRequest::Parse(const std::string& json) {
    auto value = JSONValue::TryParse(json);
    return value ? FromJSON(*value) : std::nullopt;
}

RPCResponse RPCResponse::Success(JSONValue result, JSONValue id) {
    RPCResponse response;
    response.result_ = std::move(result);
    response.id_ = std::move(id);
    return response;
}

RPCResponse RPCResponse::Error(int code, std::string message, JSONValue id, JSONValue data) {
    RPCResponse response;
    response.isError_ = true;
    response.errorCode_ = code;
    response.errorMessage_ = std::move(message);
    response.errorData_ = std::move(data);
    response.id_ = std::move(id);
    return response;
}

JSONValue RPCResponse::ToJSONValue() const {
    JSONValue::Object envelope;
    envelope["jsonrpc"] = "2.0";
    envelope["id"] = id_;
    if (!isError_) {
        envelope["result"] = result_;
        return JSONValue(std::move(envelope));
    }

    JSONValue::Object error;
    error["code"] = errorCode_;
    error["message"] = errorMessage_;
    if (!errorData_.IsNull()) {
        error["data"] = errorData_;
    }
    envelope["error"] = JSONValue(std::move(error));
    return JSONValue(std::move(envelope));
}

// ============================================================================
// Dispatch
// ============================================================================

void RPCServer::RegisterMethod(RPCMethod method) {
    std::lock_guard<std::mutex> lock(methodsMutex_);
    std::string name = method.name;
    methods_[name] = std::move(method);
}

bool RPCServer::HasMethod(const std::string& name) const {
    std::lock_guard<std::mutex> lock(methodsMutex_);
    return methods_.count(name) != 0;
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

RPCResponse RPCServer::HandleRequest(const RPCRequest& request, const RPCContext& context) {
    RPCMethod method;
    {
        std::lock_guard<std::mutex> lock(methodsMutex_);
        auto it = methods_.find(request.GetMethod());
        if (it == methods_.end()) {
            return RPCResponse::Error(RPCErrorCode::METHOD_NOT_FOUND,
                                      "Method not found: " + request.GetMethod(),
                                      request.GetId());
        }
        method = it->second;
    }

    if (method.requiresAuth && context.username.empty()) {
        return RPCResponse::Error(RPCErrorCode::UNAUTHORIZED,
                                  method.name + " requires an authenticated caller",
                                  request.GetId());
    }

    try {
        return method.handler(request, context);
    } catch (const RPCParamError& e) {
        return RPCResponse::Error(RPCErrorCode::INVALID_PARAMS, e.what(), request.GetId());
    } catch (const std::exception& e) {
        LOG_ERROR(util::LogCategory::RPC) << method.name << " failed: " << e.what();
        return RPCResponse::Error(RPCErrorCode::INTERNAL_ERROR, e.what(), request.GetId());
    }
}

std::string RPCServer::HandleRawRequest(const std::string& body, const RPCContext& context) {
    if (config_.enableRateLimiting && !WithinRateLimit(context.clientAddress)) {
        return RPCResponse::Error(RPCErrorCode::RATE_LIMITED, "Rate limit exceeded",
                                  JSONValue()).ToJSON();
    }

    auto parsed = JSONValue::TryParse(body);
    if (!parsed) {
        return RPCResponse::Error(RPCErrorCode::PARSE_ERROR, "Parse error", JSONValue()).ToJSON();
    }

    auto answer = [&](const JSONValue& item) -> std::optional<JSONValue> {
        auto request = RPCRequest::FromJSON(item);
        if (!request) {
            return RPCResponse::Error(RPCErrorCode::INVALID_REQUEST, "Invalid Request",
                                      JSONValue()).ToJSONValue();
        }
        RPCResponse response = HandleRequest(*request, context);
        if (request->IsNotification()) {
            return std::nullopt;
        }
        return response.ToJSONValue();
    };

    if (!parsed->IsArray()) {
        auto single = answer(*parsed);
        return single ? single->ToJSON() : std::string();
    }
    if (parsed->Size() == 0) {
        return RPCResponse::Error(RPCErrorCode::INVALID_REQUEST, "Empty batch",
                                  JSONValue()).ToJSON();
    }

    JSONValue::Array replies;
    for (size_t i = 0; i < parsed->Size(); ++i) {
        if (auto reply = answer((*parsed)[i])) {
            replies.push_back(std::move(*reply));
        }
    }
    return replies.empty() ? std::string() : JSONValue(std::move(replies)).ToJSON();
}

bool RPCServer::Authorize(const std::string& authorization, RPCContext& context) const {
    if (config_.rpcUser.empty()) {
        // Loopback callers act as the operator when no credentials are configured
        if (context.isLocal) {
            context.username = "__local__";
        }
        return true;
    }
    if (authorization.compare(0, 6, "Basic ") != 0) {
        return false;
    }
    auto decoded = DecodeBase64(authorization.substr(6));
    size_t colon = decoded ? decoded->find(':') : std::string::npos;
    if (colon == std::string::npos) {
        return false;
    }

    std::string user = decoded->substr(0, colon);
    // Both comparisons run so timing does not show which part was wrong
    bool userOk = ConstantTimeEquals(user, config_.rpcUser);
    bool passOk = ConstantTimeEquals(decoded->substr(colon + 1), config_.rpcPassword);
    if (!userOk || !passOk) {
        return false;
    }
    context.username = user;
    return true;
}

bool RPCServer::WithinRateLimit(const std::string& clientAddress) {
    return WithinRateLimit(clientAddress, std::chrono::steady_clock::now());
}

bool RPCServer::WithinRateLimit(const std::string& clientAddress,
                                std::chrono::steady_clock::time_point now) {
    const auto length = std::chrono::minutes(1);
    std::lock_guard<std::mutex> lock(windowsMutex_);

    // Drop clients that have been quiet for a whole window
    if (now - lastPrune_ >= length) {
        for (auto it = windows_.begin(); it != windows_.end();) {
            if (now - it->second.start >= length) {
                it = windows_.erase(it);
            } else {
                ++it;
            }
        }
        lastPrune_ = now;
    }

    auto inserted = windows_.emplace(clientAddress, Window{now, 0});
    Window& window = inserted.first->second;
    if (now - window.start >= length) {
        window = Window{now, 0};
    }
    return window.requests++ < config_.maxRequestsPerMinute;
}

size_t RPCServer::TrackedClientCount() const {
    std::lock_guard<std::mutex> lock(windowsMutex_);
    return windows_.size();
}

std::chrono::milliseconds AcceptRetryDelay(int error) {
    switch (error) {
        case EINTR:
        case ECONNABORTED:
        case EAGAIN:
            return std::chrono::milliseconds(0);
        case EMFILE:
        case ENFILE:
        case ENOBUFS:
        case ENOMEM:
            return std::chrono::milliseconds(100);
        default:
            return std::chrono::milliseconds(10);
    }
}

// ============================================================================
// HTTP Transport
// ============================================================================

namespace {

struct HttpRequest {
    std::string method;
    std::map<std::string, std::string> headers;
    std::string body;
};

const char* StatusText(int status) {
    switch (status) {
        case 200: return "OK";
        case 204: return "No Content";
        case 400: return "Bad Request";
        case 401: return "Unauthorized";
        case 405: return "Method Not Allowed";
        case 413: return "Payload Too Large";
        case 503: return "Service Unavailable";
        default:  return "Error";
    }
}

std::string HttpReply(int status, const std::string& body, const std::string& extraHeaders = "") {
    std::ostringstream out;
    out << "HTTP/1.1 " << status << " " << StatusText(status) << "\r\n"
        << extraHeaders
        << "Content-Type: " << (status == 200 ? "application/json" : "text/plain") << "\r\n"
        << "Content-Length: " << body.size() << "\r\n"
        << "Connection: close\r\n\r\n"
        << body;
    return out.str();
}

void SendAll(int socket, const std::string& data) {
    size_t sent = 0;
    while (sent < data.size()) {
        ssize_t n = send(socket, data.data() + sent, data.size() - sent, MSG_NOSIGNAL);
        if (n <= 0) {
            return;
        }
        sent += static_cast<size_t>(n);
    }
}

std::string Lower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

/// Split "METHOD target VERSION" and "Name: value" lines
bool ParseHead(const std::string& head, HttpRequest& request) {
    std::istringstream lines(head);
    std::string line;
    if (!std::getline(lines, line)) {
        return false;
    }
    request.method = line.substr(0, line.find(' '));

    while (std::getline(lines, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        size_t colon = line.find(':');
        if (colon == std::string::npos) {
            continue;
        }
        size_t start = line.find_first_not_of(' ', colon + 1);
        request.headers[Lower(line.substr(0, colon))] =
            start == std::string::npos ? "" : line.substr(start);
    }
    return !request.method.empty();
}

/**
 * Read headers and a Content-Length body. Returns 0 on success or the
 * HTTP status to answer with; -1 when the peer went away silently.
 */
int ReadHttpRequest(int socket, size_t limit, HttpRequest& request) {
    std::string raw;
    size_t headEnd = std::string::npos;
    size_t total = 0;
    char chunk[8192];

    while (headEnd == std::string::npos || raw.size() < total) {
        ssize_t n = recv(socket, chunk, sizeof(chunk), 0);
        if (n <= 0) {
            return raw.empty() ? -1 : 400;
        }
        raw.append(chunk, static_cast<size_t>(n));
        if (raw.size() > limit) {
            return 413;
        }
        if (headEnd != std::string::npos) {
            continue;
        }
        headEnd = raw.find("\r\n\r\n");
        if (headEnd == std::string::npos) {
            continue;
        }
        if (!ParseHead(raw.substr(0, headEnd), request)) {
            return 400;
        }
        auto length = request.headers.find("content-length");
        char* end = nullptr;
        unsigned long long bodySize =
            length == request.headers.end() ? 0 : std::strtoull(length->second.c_str(), &end, 10);
        if (length != request.headers.end() && (end == length->second.c_str() || *end != '\0')) {
            return 400;
        }
        if (bodySize > limit) {
            return 413;
        }
        total = headEnd + 4 + static_cast<size_t>(bodySize);
        if (total > limit) {
            return 413;
        }
    }
    request.body = raw.substr(headEnd + 4, total - headEnd - 4);
    return 0;
}

std::string PeerAddress(int socket) {
    sockaddr_in addr{};
    socklen_t len = sizeof(addr);
    char text[INET_ADDRSTRLEN] = {0};
    if (getpeername(socket, reinterpret_cast<sockaddr*>(&addr), &len) == 0) {
        inet_ntop(AF_INET, &addr.sin_addr, text, sizeof(text));
    }
    return text;
}

} // namespace

RPCServer::~RPCServer() {
    Stop();
}

bool RPCServer::Start() {
    if (running_.load()) {
        return true;
    }

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(config_.port);
    if (config_.bindAddress.empty() || config_.bindAddress == "0.0.0.0") {
        addr.sin_addr.s_addr = INADDR_ANY;
    } else if (inet_pton(AF_INET, config_.bindAddress.c_str(), &addr.sin_addr) != 1) {
        LOG_ERROR(util::LogCategory::RPC) << "Invalid rpcbind address " << config_.bindAddress;
        return false;
    }

    int fd = socket(AF_INET, SOCK_STREAM, 0);
    if (fd < 0) {
        LOG_ERROR(util::LogCategory::RPC) << "socket: " << std::strerror(errno);
        return false;
    }
    int reuse = 1;
    setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &reuse, sizeof(reuse));
    if (bind(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0 ||
        listen(fd, static_cast<int>(config_.maxConnections)) < 0) {
        LOG_ERROR(util::LogCategory::RPC) << "Cannot listen on " << config_.bindAddress << ":"
                                          << config_.port << ": " << std::strerror(errno);
        close(fd);
        return false;
    }

    util::ThreadPool::Config pool;
    pool.numThreads = std::max<size_t>(1, config_.threadPoolSize);
    pool.maxQueueSize = config_.maxConnections;
    pool.name = "rpc";
    workers_ = std::make_unique<util::ThreadPool>(pool);

    listenSocket_ = fd;
    running_.store(true);
    acceptThread_ = std::thread(&RPCServer::AcceptLoop, this);

    LOG_INFO(util::LogCategory::RPC) << "Listening on " << config_.bindAddress << ":"
                                     << config_.port << " (" << pool.numThreads << " workers)";
    return true;
}

void RPCServer::Stop() {
    if (!running_.exchange(false)) {
        return;
    }
    // shutdown() wakes the blocked accept(); close() alone does not on Linux
    shutdown(listenSocket_, SHUT_RDWR);
    close(listenSocket_);
    listenSocket_ = -1;

    if (acceptThread_.joinable()) {
        acceptThread_.join();
    }
    workers_->Shutdown();
    workers_.reset();
    LOG_INFO(util::LogCategory::RPC) << "RPC server stopped";
}

void RPCServer::AcceptLoop() {
    while (running_.load()) {
        int client = accept(listenSocket_, nullptr, nullptr);
        if (client < 0) {
            int error = errno;
            if (!running_.load()) {
                continue;
            }
            auto delay = AcceptRetryDelay(error);
            if (delay.count() > 0) {
                LOG_WARN(util::LogCategory::RPC) << "accept: " << std::strerror(error);
                std::this_thread::sleep_for(delay);
            }
            continue;
        }
        if (!workers_->TryExecute([this, client] { ServeConnection(client); })) {
            LOG_WARN(util::LogCategory::RPC) << "Worker queue full, rejecting connection";
            SendAll(client, HttpReply(503, "Server busy"));
            close(client);
        }
    }
}

void RPCServer::ServeConnection(int socket) {
    timeval timeout{};
    timeout.tv_sec = config_.requestTimeoutSeconds;
    setsockopt(socket, SOL_SOCKET, SO_RCVTIMEO, &timeout, sizeof(timeout));

    HttpRequest http;
    int status = ReadHttpRequest(socket, config_.maxRequestSize, http);
    RPCContext context;
    context.clientAddress = PeerAddress(socket);
    context.isLocal = context.clientAddress == "127.0.0.1";

    std::string reply;
    if (status > 0) {
        reply = HttpReply(status, StatusText(status));
    } else if (status == 0 && http.method != "POST") {
        reply = HttpReply(405, "JSON-RPC requires POST", "Allow: POST\r\n");
    } else if (status == 0 && !Authorize(http.headers["authorization"], context)) {
        LOG_WARN(util::LogCategory::RPC) << "Rejected credentials from " << context.clientAddress;
        reply = HttpReply(401, "Unauthorized", "WWW-Authenticate: Basic realm=\"vface\"\r\n");
    } else if (status == 0) {
        std::string body = HandleRawRequest(http.body, context);
        reply = body.empty() ? HttpReply(204, "") : HttpReply(200, body);
    }

    if (!reply.empty()) {
        SendAll(socket, reply);
    }
    close(socket);
}

} // namespace rpc
} // namespace vface
