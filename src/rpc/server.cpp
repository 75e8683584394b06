// ZKDROP - RPC Server Implementation
// Copyright (c) 2024 ZKDROP Developers
// MIT License

#include <zkdrop/rpc/server.h>
#include <zkdrop/util/logging.h>

#include <cctype>
#include <functional>
#include <iomanip>
#include <limits>
#include <sstream>
#include <stdexcept>

namespace zkdrop {
namespace rpc {

// ============================================================================
// Static Members
// ============================================================================

const JSONValue JSONValue::nullValue_;
const JSONValue::Array JSONValue::emptyArray_;
const JSONValue::Object JSONValue::emptyObject_;
const std::string JSONValue::emptyString_;

namespace {

/// Nesting limit for parsed documents
constexpr size_t MAX_DEPTH = 64;

void AppendUtf8(std::string& out, uint32_t cp) {
    if (cp < 0x80) {
        out += static_cast<char>(cp);
    } else if (cp < 0x800) {
        out += static_cast<char>(0xC0 | (cp >> 6));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else if (cp < 0x10000) {
        out += static_cast<char>(0xE0 | (cp >> 12));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else {
        out += static_cast<char>(0xF0 | (cp >> 18));
        out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    }
}

void WriteEscaped(std::ostringstream& ss, const std::string& str) {
    ss << '"';
    for (char c : str) {
        switch (c) {
            case '"': ss << "\\\""; break;
            case '\\': ss << "\\\\"; break;
            case '\b': ss << "\\b"; break;
            case '\f': ss << "\\f"; break;
            case '\n': ss << "\\n"; break;
            case '\r': ss << "\\r"; break;
            case '\t': ss << "\\t"; break;
            default:
                if (static_cast<unsigned char>(c) < 32) {
                    ss << "\\u" << std::hex << std::setw(4) << std::setfill('0')
                       << static_cast<int>(c) << std::dec;
                } else {
                    ss << c;
                }
        }
    }
    ss << '"';
}

} // namespace

// ============================================================================
// JSONValue Implementation
// ============================================================================

JSONValue::JSONValue(uint64_t value) {
    if (value > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
        type_ = Type::String;
        stringValue_ = std::to_string(value);
    } else {
        type_ = Type::Int;
        intValue_ = static_cast<int64_t>(value);
    }
}

bool JSONValue::GetBool(bool defaultValue) const {
    if (type_ == Type::Bool) return boolValue_;
    return defaultValue;
}

int64_t JSONValue::GetInt(int64_t defaultValue) const {
    if (type_ == Type::Int) return intValue_;
    if (type_ == Type::Double) return static_cast<int64_t>(doubleValue_);
    return defaultValue;
}

double JSONValue::GetDouble(double defaultValue) const {
    if (type_ == Type::Double) return doubleValue_;
    if (type_ == Type::Int) return static_cast<double>(intValue_);
    return defaultValue;
}

const std::string& JSONValue::GetString() const {
    if (type_ == Type::String) return stringValue_;
    return emptyString_;
}

const JSONValue::Array& JSONValue::GetArray() const {
    if (type_ == Type::Array) return arrayValue_;
    return emptyArray_;
}

const JSONValue::Object& JSONValue::GetObject() const {
    if (type_ == Type::Object) return objectValue_;
    return emptyObject_;
}

bool JSONValue::HasKey(const std::string& key) const {
    if (type_ != Type::Object) return false;
    return objectValue_.count(key) > 0;
}

const JSONValue& JSONValue::operator[](const std::string& key) const {
    if (type_ != Type::Object) return nullValue_;
    auto it = objectValue_.find(key);
    if (it == objectValue_.end()) return nullValue_;
    return it->second;
}

JSONValue& JSONValue::operator[](const std::string& key) {
    if (type_ != Type::Object) {
        type_ = Type::Object;
        objectValue_.clear();
    }
    return objectValue_[key];
}

size_t JSONValue::Size() const {
    if (type_ == Type::Array) return arrayValue_.size();
    if (type_ == Type::Object) return objectValue_.size();
    return 0;
}

const JSONValue& JSONValue::operator[](size_t index) const {
    if (type_ != Type::Array || index >= arrayValue_.size()) return nullValue_;
    return arrayValue_[index];
}

void JSONValue::Push(const JSONValue& value) {
    if (type_ != Type::Array) {
        type_ = Type::Array;
        arrayValue_.clear();
    }
    arrayValue_.push_back(value);
}

void JSONValue::Push(JSONValue&& value) {
    if (type_ != Type::Array) {
        type_ = Type::Array;
        arrayValue_.clear();
    }
    arrayValue_.push_back(std::move(value));
}

bool JSONValue::operator==(const JSONValue& other) const {
    if (type_ != other.type_) return false;
    switch (type_) {
        case Type::Null: return true;
        case Type::Bool: return boolValue_ == other.boolValue_;
        case Type::Int: return intValue_ == other.intValue_;
        case Type::Double: return doubleValue_ == other.doubleValue_;
        case Type::String: return stringValue_ == other.stringValue_;
        case Type::Array: return arrayValue_ == other.arrayValue_;
        case Type::Object: return objectValue_ == other.objectValue_;
    }
    return false;
}

std::string JSONValue::ToJSON(bool pretty, int indent) const {
    std::ostringstream ss;
    std::string indentStr(indent * 2, ' ');
    std::string childIndent((indent + 1) * 2, ' ');
    
    switch (type_) {
        case Type::Null:
            ss << "null";
            break;
            
        case Type::Bool:
            ss << (boolValue_ ? "true" : "false");
            break;
            
        case Type::Int:
            ss << intValue_;
            break;
            
        case Type::Double:
            ss << std::setprecision(15) << doubleValue_;
            break;
            
        case Type::String:
            WriteEscaped(ss, stringValue_);
            break;
        
        case Type::Array: {
            if (arrayValue_.empty()) {
                ss << "[]";
            } else if (pretty) {
                ss << "[\n";
                for (size_t i = 0; i < arrayValue_.size(); ++i) {
                    ss << childIndent << arrayValue_[i].ToJSON(true, indent + 1);
                    if (i + 1 < arrayValue_.size()) ss << ",";
                    ss << "\n";
                }
                ss << indentStr << "]";
            } else {
                ss << "[";
                for (size_t i = 0; i < arrayValue_.size(); ++i) {
                    if (i > 0) ss << ",";
                    ss << arrayValue_[i].ToJSON(false, 0);
                }
                ss << "]";
            }
            break;
        }
        
        case Type::Object: {
            if (objectValue_.empty()) {
                ss << "{}";
            } else if (pretty) {
                ss << "{\n";
                size_t i = 0;
                for (const auto& [key, value] : objectValue_) {
                    ss << childIndent;
                    WriteEscaped(ss, key);
                    ss << ": " << value.ToJSON(true, indent + 1);
                    if (++i < objectValue_.size()) ss << ",";
                    ss << "\n";
                }
                ss << indentStr << "}";
            } else {
                ss << "{";
                size_t i = 0;
                for (const auto& [key, value] : objectValue_) {
                    if (i++ > 0) ss << ",";
                    WriteEscaped(ss, key);
                    ss << ":" << value.ToJSON(false, 0);
                }
                ss << "}";
            }
            break;
        }
    }
    
    return ss.str();
}

JSONValue JSONValue::Parse(const std::string& json) {
    auto result = TryParse(json);
    if (!result) {
        throw std::runtime_error("JSON parse error");
    }
    return std::move(*result);
}

std::optional<JSONValue> JSONValue::TryParse(const std::string& json) {
    size_t pos = 0;
    size_t depth = 0;
    
    auto skipWhitespace = [&]() {
        while (pos < json.size() && std::isspace(static_cast<unsigned char>(json[pos]))) ++pos;
    };
    
    auto parseHex4 = [&]() -> std::optional<uint32_t> {
        if (pos + 4 > json.size()) return std::nullopt;
        uint32_t value = 0;
        for (size_t i = 0; i < 4; ++i) {
            char c = json[pos++];
            value <<= 4;
            if (c >= '0' && c <= '9') value |= static_cast<uint32_t>(c - '0');
            else if (c >= 'a' && c <= 'f') value |= static_cast<uint32_t>(c - 'a' + 10);
            else if (c >= 'A' && c <= 'F') value |= static_cast<uint32_t>(c - 'A' + 10);
            else return std::nullopt;
        }
        return value;
    };
    
    std::function<std::optional<JSONValue>()> parseValue;
    
    auto parseString = [&]() -> std::optional<std::string> {
        if (pos >= json.size() || json[pos] != '"') return std::nullopt;
        ++pos;
        
        std::string result;
        while (pos < json.size() && json[pos] != '"') {
            char c = json[pos];
            if (static_cast<unsigned char>(c) < 32) return std::nullopt;
            if (c != '\\') {
                result += c;
                ++pos;
                continue;
            }
            if (++pos >= json.size()) return std::nullopt;
            char esc = json[pos++];
            switch (esc) {
                case '"': result += '"'; break;
                case '\\': result += '\\'; break;
                case '/': result += '/'; break;
                case 'b': result += '\b'; break;
                case 'f': result += '\f'; break;
                case 'n': result += '\n'; break;
                case 'r': result += '\r'; break;
                case 't': result += '\t'; break;
                case 'u': {
                    auto cp = parseHex4();
                    if (!cp) return std::nullopt;
                    uint32_t codepoint = *cp;
                    if (codepoint >= 0xD800 && codepoint <= 0xDBFF) {
                        // High surrogate must be followed by a low one
                        if (pos + 2 > json.size() || json[pos] != '\\' || json[pos + 1] != 'u') {
                            return std::nullopt;
                        }
                        pos += 2;
                        auto low = parseHex4();
                        if (!low || *low < 0xDC00 || *low > 0xDFFF) return std::nullopt;
                        codepoint = 0x10000 + ((codepoint - 0xD800) << 10) + (*low - 0xDC00);
                    } else if (codepoint >= 0xDC00 && codepoint <= 0xDFFF) {
                        return std::nullopt;
                    }
                    AppendUtf8(result, codepoint);
                    break;
                }
                default: return std::nullopt;
            }
        }
        if (pos >= json.size()) return std::nullopt;
        ++pos;  // closing quote
        return result;
    };
    
    auto parseNumber = [&]() -> std::optional<JSONValue> {
        size_t start = pos;
        bool isFloat = false;
        
        if (json[pos] == '-') ++pos;
        
        size_t digitsStart = pos;
        while (pos < json.size() && std::isdigit(static_cast<unsigned char>(json[pos]))) ++pos;
        if (pos == digitsStart) return std::nullopt;
        
        if (pos < json.size() && json[pos] == '.') {
            isFloat = true;
            ++pos;
            size_t fracStart = pos;
            while (pos < json.size() && std::isdigit(static_cast<unsigned char>(json[pos]))) ++pos;
            if (pos == fracStart) return std::nullopt;
        }
        
        if (pos < json.size() && (json[pos] == 'e' || json[pos] == 'E')) {
            isFloat = true;
            ++pos;
            if (pos < json.size() && (json[pos] == '+' || json[pos] == '-')) ++pos;
            size_t expStart = pos;
            while (pos < json.size() && std::isdigit(static_cast<unsigned char>(json[pos]))) ++pos;
            if (pos == expStart) return std::nullopt;
        }
        
        std::string numStr = json.substr(start, pos - start);
        try {
            if (!isFloat) {
                return JSONValue(static_cast<int64_t>(std::stoll(numStr)));
            }
        } catch (const std::out_of_range&) {
            // Integer too wide for int64; keep it as a double
        }
        try {
            return JSONValue(std::stod(numStr));
        } catch (const std::out_of_range&) {
            return std::nullopt;
        }
    };
    
    auto parseArray = [&]() -> std::optional<JSONValue> {
        ++pos;  // '['
        Array arr;
        skipWhitespace();
        
        if (pos < json.size() && json[pos] == ']') {
            ++pos;
            return JSONValue(std::move(arr));
        }
        
        while (true) {
            auto val = parseValue();
            if (!val) return std::nullopt;
            arr.push_back(std::move(*val));
            
            skipWhitespace();
            if (pos >= json.size()) return std::nullopt;
            
            if (json[pos] == ']') {
                ++pos;
                return JSONValue(std::move(arr));
            }
            if (json[pos] != ',') return std::nullopt;
            ++pos;
        }
    };
    
    auto parseObject = [&]() -> std::optional<JSONValue> {
        ++pos;  // '{'
        Object obj;
        skipWhitespace();
        
        if (pos < json.size() && json[pos] == '}') {
            ++pos;
            return JSONValue(std::move(obj));
        }
        
        while (true) {
            skipWhitespace();
            auto key = parseString();
            if (!key) return std::nullopt;
            
            skipWhitespace();
            if (pos >= json.size() || json[pos] != ':') return std::nullopt;
            ++pos;
            
            auto val = parseValue();
            if (!val) return std::nullopt;
            obj[*key] = std::move(*val);
            
            skipWhitespace();
            if (pos >= json.size()) return std::nullopt;
            
            if (json[pos] == '}') {
                ++pos;
                return JSONValue(std::move(obj));
            }
            if (json[pos] != ',') return std::nullopt;
            ++pos;
        }
    };
    
    parseValue = [&]() -> std::optional<JSONValue> {
        skipWhitespace();
        if (pos >= json.size()) return std::nullopt;
        
        char c = json[pos];
        
        if (json.compare(pos, 4, "null") == 0) {
            pos += 4;
            return JSONValue();
        }
        if (json.compare(pos, 4, "true") == 0) {
            pos += 4;
            return JSONValue(true);
        }
        if (json.compare(pos, 5, "false") == 0) {
            pos += 5;
            return JSONValue(false);
        }
        if (c == '"') {
            auto str = parseString();
            if (!str) return std::nullopt;
            return JSONValue(std::move(*str));
        }
        if (c == '[' || c == '{') {
            if (++depth > MAX_DEPTH) return std::nullopt;
            auto nested = (c == '[') ? parseArray() : parseObject();
            --depth;
            return nested;
        }
        if (c == '-' || std::isdigit(static_cast<unsigned char>(c))) return parseNumber();
        
        return std::nullopt;
    };
    
    auto result = parseValue();
    if (!result) return std::nullopt;
    
    skipWhitespace();
    if (pos != json.size()) return std::nullopt;  // trailing characters
    
    return result;
}

// ============================================================================
// RPCRequest Implementation
// ============================================================================

RPCRequest::RPCRequest(const std::string& method, const JSONValue& params,
                       const JSONValue& id)
    : method_(method), params_(params), id_(id) {}

const JSONValue& RPCRequest::GetParam(size_t index) const {
    if (params_.IsArray()) {
        return params_[index];
    }
    return JSONValue::Null();
}

const JSONValue& RPCRequest::GetParam(const std::string& name) const {
    if (params_.IsObject()) {
        return params_[name];
    }
    return JSONValue::Null();
}

bool RPCRequest::HasParam(const std::string& name) const {
    return params_.IsObject() && params_.HasKey(name);
}

bool RPCRequest::HasParam(size_t index) const {
    return params_.IsArray() && index < params_.Size();
}

std::string RPCRequest::ToJSON() const {
    JSONValue::Object obj;
    obj["jsonrpc"] = "2.0";
    obj["method"] = method_;
    if (!params_.IsNull()) {
        obj["params"] = params_;
    }
    if (!id_.IsNull()) {
        obj["id"] = id_;
    }
    return JSONValue(std::move(obj)).ToJSON();
}

std::optional<RPCRequest> RPCRequest::FromJSON(const JSONValue& obj) {
    if (!obj.IsObject()) return std::nullopt;
    
    if (!obj["jsonrpc"].IsString() || obj["jsonrpc"].GetString() != "2.0") {
        return std::nullopt;
    }
    if (!obj["method"].IsString()) return std::nullopt;
    
    const JSONValue& params = obj["params"];
    if (!params.IsNull() && !params.IsArray() && !params.IsObject()) {
        return std::nullopt;
    }
    
    const JSONValue& id = obj["id"];
    if (!id.IsNull() && !id.IsString() && !id.IsNumber()) {
        return std::nullopt;
    }
    
    return RPCRequest(obj["method"].GetString(), params, id);
}

std::optional<RPCRequest> RPCRequest::Parse(const std::string& json) {
    auto parsed = JSONValue::TryParse(json);
    if (!parsed) return std::nullopt;
    return FromJSON(*parsed);
}

// ============================================================================
// RPCResponse Implementation
// ============================================================================

RPCResponse RPCResponse::Success(const JSONValue& result, const JSONValue& id) {
    RPCResponse resp;
    resp.isError_ = false;
    resp.result_ = result;
    resp.id_ = id;
    return resp;
}

RPCResponse RPCResponse::Error(int code, const std::string& message,
                               const JSONValue& id, const JSONValue& data) {
    RPCResponse resp;
    resp.isError_ = true;
    resp.errorCode_ = code;
    resp.errorMessage_ = message;
    resp.errorData_ = data;
    resp.id_ = id;
    return resp;
}

JSONValue RPCResponse::ToJSONValue() const {
    JSONValue::Object obj;
    obj["jsonrpc"] = "2.0";
    
    if (isError_) {
        JSONValue::Object error;
        error["code"] = errorCode_;
        error["message"] = errorMessage_;
        if (!errorData_.IsNull()) {
            error["data"] = errorData_;
        }
        obj["error"] = JSONValue(std::move(error));
    } else {
        obj["result"] = result_;
    }
    
    obj["id"] = id_;
    return JSONValue(std::move(obj));
}

std::string RPCResponse::ToJSON() const {
    return ToJSONValue().ToJSON();
}

std::string RPCResponse::BatchToJSON(const std::vector<RPCResponse>& responses) {
    JSONValue::Array arr;
    arr.reserve(responses.size());
    for (const auto& resp : responses) {
        arr.push_back(resp.ToJSONValue());
    }
    return JSONValue(std::move(arr)).ToJSON();
}

// ============================================================================
// RPCServer Implementation
// ============================================================================

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
    return methods_.count(name) > 0;
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
    std::vector<RPCMethod> result;
    result.reserve(methods_.size());
    for (const auto& [name, method] : methods_) {
        result.push_back(method);
    }
    return result;
}

std::vector<RPCMethod> RPCServer::GetMethodsByCategory(const std::string& category) const {
    std::lock_guard<std::mutex> lock(methodsMutex_);
    std::vector<RPCMethod> result;
    for (const auto& [name, method] : methods_) {
        if (method.category == category) {
            result.push_back(method);
        }
    }
    return result;
}

RPCResponse RPCServer::HandleRequest(const RPCRequest& request, const RPCContext& context) {
    ++totalRequests_;
    
    auto method = GetMethod(request.GetMethod());
    if (!method) {
        ++totalErrors_;
        LOG_DEBUG(util::LogCategory::RPC) << "Unknown method " << request.GetMethod()
                                          << " from " << context.clientAddress;
        return MethodNotFound(request.GetMethod(), request.GetId());
    }
    
    RPCResponse response;
    try {
        response = method->handler(request, context);
    } catch (const std::invalid_argument& e) {
        response = InvalidParams(e.what(), request.GetId());
    } catch (const std::exception& e) {
        LOG_ERROR(util::LogCategory::RPC) << "Handler for " << request.GetMethod()
                                          << " threw: " << e.what();
        response = InternalError(e.what(), request.GetId());
    }
    
    if (response.IsError()) {
        ++totalErrors_;
        LOG_DEBUG(util::LogCategory::RPC) << request.GetMethod() << " failed ("
                                          << response.GetErrorCode() << "): "
                                          << response.GetErrorMessage();
    }
    return response;
}

std::string RPCServer::HandleRawRequest(const std::string& json, const RPCContext& context) {
    auto parsed = JSONValue::TryParse(json);
    if (!parsed) {
        return ParseError().ToJSON();
    }
    
    if (!parsed->IsArray()) {
        auto req = RPCRequest::FromJSON(*parsed);
        if (!req) {
            return InvalidRequest().ToJSON();
        }
        RPCResponse response = HandleRequest(*req, context);
        if (req->IsNotification()) {
            return "";
        }
        return response.ToJSON();
    }
    
    if (parsed->Size() == 0) {
        return InvalidRequest().ToJSON();
    }
    
    std::vector<RPCResponse> responses;
    for (const auto& item : parsed->GetArray()) {
        auto req = RPCRequest::FromJSON(item);
        if (!req) {
            responses.push_back(InvalidRequest());
            continue;
        }
        RPCResponse response = HandleRequest(*req, context);
        if (!req->IsNotification()) {
            responses.push_back(std::move(response));
        }
    }
    
    if (responses.empty()) {
        return "";
    }
    return RPCResponse::BatchToJSON(responses);
}

} // namespace rpc
} // namespace zkdrop
