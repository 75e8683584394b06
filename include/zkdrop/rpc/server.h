// ZKDROP - RPC Server
// Copyright (c) 2024 ZKDROP Developers
// MIT License
//
// JSON-RPC 2.0 dispatcher for the airdrop service.
//
// The server is transport-independent: an embedding process hands it raw
// request bodies together with the authenticated caller, and writes back
// the returned response text.

#ifndef ZKDROP_RPC_SERVER_H
#define ZKDROP_RPC_SERVER_H

#include <zkdrop/core/types.h>

#include <atomic>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace zkdrop {
namespace rpc {

// ============================================================================
// JSON Value - Simple JSON representation
// ============================================================================

/**
 * Represents a JSON value.
 * Supports: null, bool, int64, double, string, array, object
 */
class JSONValue {
public:
    enum class Type {
        Null,
        Bool,
        Int,
        Double,
        String,
        Array,
        Object
    };
    
    using Array = std::vector<JSONValue>;
    using Object = std::map<std::string, JSONValue>;
    
    JSONValue() : type_(Type::Null) {}
    JSONValue(std::nullptr_t) : type_(Type::Null) {}
    JSONValue(bool value) : type_(Type::Bool), boolValue_(value) {}
    JSONValue(int value) : type_(Type::Int), intValue_(value) {}
    JSONValue(int64_t value) : type_(Type::Int), intValue_(value) {}
    /// Values above INT64_MAX become decimal strings
    JSONValue(uint64_t value);
    JSONValue(double value) : type_(Type::Double), doubleValue_(value) {}
    JSONValue(const char* value) : type_(Type::String), stringValue_(value) {}
    JSONValue(const std::string& value) : type_(Type::String), stringValue_(value) {}
    JSONValue(std::string&& value) : type_(Type::String), stringValue_(std::move(value)) {}
    JSONValue(const Array& value) : type_(Type::Array), arrayValue_(value) {}
    JSONValue(Array&& value) : type_(Type::Array), arrayValue_(std::move(value)) {}
    JSONValue(const Object& value) : type_(Type::Object), objectValue_(value) {}
    JSONValue(Object&& value) : type_(Type::Object), objectValue_(std::move(value)) {}
    
    Type GetType() const { return type_; }
    bool IsNull() const { return type_ == Type::Null; }
    bool IsBool() const { return type_ == Type::Bool; }
    bool IsInt() const { return type_ == Type::Int; }
    bool IsDouble() const { return type_ == Type::Double; }
    bool IsNumber() const { return type_ == Type::Int || type_ == Type::Double; }
    bool IsString() const { return type_ == Type::String; }
    bool IsArray() const { return type_ == Type::Array; }
    bool IsObject() const { return type_ == Type::Object; }
    
    // Value getters (with defaults)
    bool GetBool(bool defaultValue = false) const;
    int64_t GetInt(int64_t defaultValue = 0) const;
    double GetDouble(double defaultValue = 0.0) const;
    const std::string& GetString() const;
    const Array& GetArray() const;
    const Object& GetObject() const;
    
    // Object access
    bool HasKey(const std::string& key) const;
    const JSONValue& operator[](const std::string& key) const;
    JSONValue& operator[](const std::string& key);
    
    // Array access
    size_t Size() const;
    const JSONValue& operator[](size_t index) const;
    void Push(const JSONValue& value);
    void Push(JSONValue&& value);
    
    bool operator==(const JSONValue& other) const;
    bool operator!=(const JSONValue& other) const { return !(*this == other); }
    
    std::string ToJSON(bool pretty = false, int indent = 0) const;
    
    /// Throws std::runtime_error on malformed input
    static JSONValue Parse(const std::string& json);
    static std::optional<JSONValue> TryParse(const std::string& json);
    
    static const JSONValue& Null() { return nullValue_; }

private:
    Type type_;
    bool boolValue_{false};
    int64_t intValue_{0};
    double doubleValue_{0.0};
    std::string stringValue_;
    Array arrayValue_;
    Object objectValue_;
    
    static const JSONValue nullValue_;
    static const Array emptyArray_;
    static const Object emptyObject_;
    static const std::string emptyString_;
};

// ============================================================================
// RPC Error Codes (JSON-RPC 2.0 standard + airdrop)
// ============================================================================

namespace ErrorCode {
    // Standard JSON-RPC 2.0 errors
    constexpr int PARSE_ERROR = -32700;
    constexpr int INVALID_REQUEST = -32600;
    constexpr int METHOD_NOT_FOUND = -32601;
    constexpr int INVALID_PARAMS = -32602;
    constexpr int INTERNAL_ERROR = -32603;
    
    // Airdrop errors, one per AirdropError value
    constexpr int UNAUTHORIZED = -1;
    constexpr int INVALID_NULLIFIER = -2;
    constexpr int INVALID_AIRDROP = -3;
    constexpr int INVALID_PROOF = -4;
    constexpr int TRANSFER_FAILED = -5;
    constexpr int STORAGE_ERROR = -6;
}

// ============================================================================
// RPC Request
// ============================================================================

class RPCRequest {
public:
    RPCRequest() = default;
    RPCRequest(const std::string& method, const JSONValue& params = JSONValue(),
               const JSONValue& id = JSONValue());
    
    const std::string& GetMethod() const { return method_; }
    const JSONValue& GetParams() const { return params_; }
    const JSONValue& GetId() const { return id_; }
    
    /// A request without an id expects no response
    bool IsNotification() const { return id_.IsNull(); }
    
    /// Positional parameter (array params)
    const JSONValue& GetParam(size_t index) const;
    
    /// Named parameter (object params)
    const JSONValue& GetParam(const std::string& name) const;
    
    bool HasParam(const std::string& name) const;
    bool HasParam(size_t index) const;
    
    std::string ToJSON() const;
    
    static std::optional<RPCRequest> FromJSON(const JSONValue& value);
    static std::optional<RPCRequest> Parse(const std::string& json);

private:
    std::string method_;
    JSONValue params_;
    JSONValue id_;
};

// ============================================================================
// RPC Response
// ============================================================================

class RPCResponse {
public:
    static RPCResponse Success(const JSONValue& result, const JSONValue& id);
    
    static RPCResponse Error(int code, const std::string& message,
                             const JSONValue& id, const JSONValue& data = JSONValue());
    
    bool IsError() const { return isError_; }
    const JSONValue& GetResult() const { return result_; }
    int GetErrorCode() const { return errorCode_; }
    const std::string& GetErrorMessage() const { return errorMessage_; }
    const JSONValue& GetErrorData() const { return errorData_; }
    const JSONValue& GetId() const { return id_; }
    
    JSONValue ToJSONValue() const;
    std::string ToJSON() const;
    
    static std::string BatchToJSON(const std::vector<RPCResponse>& responses);

private:
    bool isError_{false};
    JSONValue result_;
    int errorCode_{0};
    std::string errorMessage_;
    JSONValue errorData_;
    JSONValue id_;
};

// ============================================================================
// RPC Method Handler
// ============================================================================

/**
 * Context passed to RPC method handlers.
 */
struct RPCContext {
    /// Authenticated principal making the call; becomes the manager of
    /// airdrops it creates
    Address caller;
    
    /// Peer description for logs
    std::string clientAddress;
};

using RPCHandler = std::function<RPCResponse(const RPCRequest&, const RPCContext&)>;

struct RPCMethod {
    std::string name;
    std::string category;
    std::string description;
    RPCHandler handler;
    std::vector<std::string> argNames;
    std::vector<std::string> argDescriptions;
};

// ============================================================================
// RPC Server
// ============================================================================

/**
 * Method registry and request dispatcher.
 * 
 * Handlers signal malformed parameters by throwing std::invalid_argument,
 * which becomes INVALID_PARAMS; any other std::exception becomes
 * INTERNAL_ERROR.
 */
class RPCServer {
public:
    RPCServer() = default;
    
    RPCServer(const RPCServer&) = delete;
    RPCServer& operator=(const RPCServer&) = delete;
    
    // === Method Registration ===
    
    void RegisterMethod(const RPCMethod& method);
    void UnregisterMethod(const std::string& name);
    bool HasMethod(const std::string& name) const;
    std::optional<RPCMethod> GetMethod(const std::string& name) const;
    std::vector<RPCMethod> GetMethods() const;
    std::vector<RPCMethod> GetMethodsByCategory(const std::string& category) const;
    
    // === Request Handling ===
    
    RPCResponse HandleRequest(const RPCRequest& request, const RPCContext& context);
    
    /**
     * Process a single request or a batch.
     * @return Response text; empty when every request was a notification
     */
    std::string HandleRawRequest(const std::string& json, const RPCContext& context);
    
    // === Statistics ===
    
    uint64_t GetTotalRequests() const { return totalRequests_.load(); }
    uint64_t GetTotalErrors() const { return totalErrors_.load(); }

private:
    std::map<std::string, RPCMethod> methods_;
    mutable std::mutex methodsMutex_;
    
    std::atomic<uint64_t> totalRequests_{0};
    std::atomic<uint64_t> totalErrors_{0};
};

// ============================================================================
// Helper Functions
// ============================================================================

inline RPCResponse ParseError(const JSONValue& id = JSONValue()) {
    return RPCResponse::Error(ErrorCode::PARSE_ERROR, "Parse error", id);
}

inline RPCResponse InvalidRequest(const JSONValue& id = JSONValue()) {
    return RPCResponse::Error(ErrorCode::INVALID_REQUEST, "Invalid Request", id);
}

inline RPCResponse MethodNotFound(const std::string& method, const JSONValue& id) {
    return RPCResponse::Error(ErrorCode::METHOD_NOT_FOUND,
                              "Method not found: " + method, id);
}

inline RPCResponse InvalidParams(const std::string& message, const JSONValue& id) {
    return RPCResponse::Error(ErrorCode::INVALID_PARAMS, message, id);
}

inline RPCResponse InternalError(const std::string& message, const JSONValue& id) {
    return RPCResponse::Error(ErrorCode::INTERNAL_ERROR, message, id);
}

} // namespace rpc
} // namespace zkdrop

#endif // ZKDROP_RPC_SERVER_H
