// VFACE - RPC Server
// Copyright (c) 2024 VFACE Developers
// MIT License
//
// JSON-RPC 2.0 over HTTP/1.1 POST for the registry daemon. One request per
// connection; connections are served on a bounded worker pool. When
// rpcuser is set every request needs matching Basic credentials.

#ifndef VFACE_RPC_SERVER_H
#define VFACE_RPC_SERVER_H

#include "vface/util/json.h"
#include "vface/util/threadpool.h"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

namespace vface {
namespace rpc {

using util::JSONValue;

namespace RPCErrorCode {
    // JSON-RPC 2.0
    constexpr int PARSE_ERROR = -32700;
    constexpr int INVALID_REQUEST = -32600;
    constexpr int METHOD_NOT_FOUND = -32601;
    constexpr int INVALID_PARAMS = -32602;
    constexpr int INTERNAL_ERROR = -32603;

    // Transport
    constexpr int NOT_READY = -32001;
    constexpr int RATE_LIMITED = -32003;
    constexpr int UNAUTHORIZED = -32010;
    constexpr int SERVER_BUSY = -32011;

    // Registry error kinds; Validation maps to INVALID_PARAMS
    constexpr int CONFLICT = -40;
    constexpr int NOT_FOUND = -41;
    constexpr int AUTHORIZATION = -42;
    constexpr int REPLAY = -43;
    constexpr int INTEGRITY = -44;
    constexpr int INFRASTRUCTURE = -45;
}

/// Thrown by argument parsers; dispatch answers with INVALID_PARAMS
class RPCParamError : public std::runtime_error {
public:
    explicit RPCParamError(const std::string& message) : std::runtime_error(message) {}
};

// ============================================================================
// Messages
// ============================================================================

class RPCRequest {
public:
    RPCRequest() = default;
    RPCRequest(std::string method, JSONValue params = JSONValue(), JSONValue id = JSONValue());

    const std::string& GetMethod() const { return method_; }
    const JSONValue& GetId() const { return id_; }

    /// Without an id nothing is sent back
    bool IsNotification() const { return id_.IsNull(); }

    /**
     * Argument by name when params is an object, by position when it is
     * an array. Null when absent.
     */
    const JSONValue& GetArg(size_t index, const std::string& name) const;

    /// nullopt unless the text is a single JSON-RPC 2.0 request object
    static std::optional<RPCRequest> Parse(const std::string& json);
    static std::optional<RPCRequest> FromJSON(const JSONValue& value);

private:
    std::string method_;
    JSONValue params_;
    JSONValue id_;
};

class RPCResponse {
public:
    static RPCResponse Success(JSONValue result, JSONValue id);
    static RPCResponse Error(int code, std::string message, JSONValue id,
                             JSONValue data = JSONValue());

    bool IsError() const { return isError_; }
    const JSONValue& GetResult() const { return result_; }
    int GetErrorCode() const { return errorCode_; }
    const std::string& GetErrorMessage() const { return errorMessage_; }
    const JSONValue& GetErrorData() const { return errorData_; }
    const JSONValue& GetId() const { return id_; }

    JSONValue ToJSONValue() const;
    std::string ToJSON() const { return ToJSONValue().ToJSON(); }

private:
    bool isError_{false};
    JSONValue result_;
    int errorCode_{0};
    std::string errorMessage_;
    JSONValue errorData_;
    JSONValue id_;
};

// ============================================================================
// Methods
// ============================================================================

struct RPCContext {
    std::string clientAddress;
    /// Set once Basic credentials matched, or for loopback callers when no
    /// credentials are configured
    std::string username;
    bool isLocal{false};
};

using RPCHandler = std::function<RPCResponse(const RPCRequest&, const RPCContext&)>;

struct RPCMethod {
    std::string name;
    std::string category;
    std::string description;
    RPCHandler handler;
    bool requiresAuth{false};
    std::vector<std::string> argNames;
    std::vector<std::string> argDescriptions;
};

// ============================================================================
// Server
// ============================================================================

struct RPCServerConfig {
    std::string bindAddress{"127.0.0.1"};
    uint16_t port{8645};

    /// Empty disables authentication
    std::string rpcUser;
    std::string rpcPassword;

    size_t threadPoolSize{4};
    /// Listen backlog and worker queue bound
    size_t maxConnections{128};

    bool enableRateLimiting{true};
    size_t maxRequestsPerMinute{600};

    /// Headers plus body
    size_t maxRequestSize{1024 * 1024};
    int requestTimeoutSeconds{30};
};

class RPCServer {
public:
    RPCServer() = default;
    explicit RPCServer(RPCServerConfig config) : config_(std::move(config)) {}
    ~RPCServer();

    RPCServer(const RPCServer&) = delete;
    RPCServer& operator=(const RPCServer&) = delete;

    /// Only before Start()
    void SetConfig(const RPCServerConfig& config) { config_ = config; }

    /// Bind, listen and start accepting; false on socket errors
    bool Start();

    /// Close the listener, then let queued connections finish
    void Stop();

    bool IsRunning() const { return running_.load(); }

    void RegisterMethod(RPCMethod method);
    bool HasMethod(const std::string& name) const;
    std::vector<RPCMethod> GetMethods() const;

    RPCResponse HandleRequest(const RPCRequest& request, const RPCContext& context);

    /**
     * Dispatch a request body, single or batch.
     * @return Response body; empty when nothing needs answering
     */
    std::string HandleRawRequest(const std::string& body, const RPCContext& context);

    /**
     * Count a request against the client's one-minute window. Windows idle
     * for a full minute are evicted.
     */
    bool WithinRateLimit(const std::string& clientAddress,
                         std::chrono::steady_clock::time_point now);

    /// Clients with a live rate-limit window
    size_t TrackedClientCount() const;

private:
    void AcceptLoop();
    void ServeConnection(int socket);

    bool Authorize(const std::string& authorization, RPCContext& context) const;
    bool WithinRateLimit(const std::string& clientAddress);

    RPCServerConfig config_;

    std::map<std::string, RPCMethod> methods_;
    mutable std::mutex methodsMutex_;

    std::atomic<bool> running_{false};
    int listenSocket_{-1};
    std::thread acceptThread_;
    std::unique_ptr<util::ThreadPool> workers_;

    struct Window {
        std::chrono::steady_clock::time_point start;
        size_t requests{0};
    };
    std::unordered_map<std::string, Window> windows_;
    std::chrono::steady_clock::time_point lastPrune_;
    mutable std::mutex windowsMutex_;
};

/// Compares every byte regardless of where the first mismatch is
bool ConstantTimeEquals(const std::string& a, const std::string& b);

/// How long the accept loop waits after accept() fails with error
std::chrono::milliseconds AcceptRetryDelay(int error);

/// Padded base64 as used by Basic auth; nullopt on characters outside the alphabet
std::optional<std::string> DecodeBase64(const std::string& encoded);

} // namespace rpc
} // namespace vface

#endif // VFACE_RPC_SERVER_H
