#include "core/error_codes.h"

#include <iomanip>
#include <sstream>
#include <unordered_map>

namespace camilla_remote {

// Error code to string mapping
static const std::unordered_map<ErrorCode, const char*> kErrorCodeStrings = {
    {ErrorCode::OK, "OK"},

    // DSP engine
    {ErrorCode::ENGINE_CONNECTION_FAILED, "ENGINE_CONNECTION_FAILED"},
    {ErrorCode::ENGINE_TIMEOUT, "ENGINE_TIMEOUT"},
    {ErrorCode::ENGINE_REQUEST_FAILED, "ENGINE_REQUEST_FAILED"},
    {ErrorCode::ENGINE_PROTOCOL_ERROR, "ENGINE_PROTOCOL_ERROR"},
    {ErrorCode::ENGINE_NOT_CONNECTED, "ENGINE_NOT_CONNECTED"},

    // Pipeline schema
    {ErrorCode::SCHEMA_INVALID_CONFIG, "SCHEMA_INVALID_CONFIG"},
    {ErrorCode::SCHEMA_MISSING_FIELD, "SCHEMA_MISSING_FIELD"},
    {ErrorCode::SCHEMA_UNKNOWN_FILTER, "SCHEMA_UNKNOWN_FILTER"},
    {ErrorCode::SCHEMA_CHANNEL_OUT_OF_RANGE, "SCHEMA_CHANNEL_OUT_OF_RANGE"},
    {ErrorCode::SCHEMA_REJECTED_BY_ENGINE, "SCHEMA_REJECTED_BY_ENGINE"},

    // Live control
    {ErrorCode::CONTROL_BALANCE_UNAVAILABLE, "CONTROL_BALANCE_UNAVAILABLE"},
    {ErrorCode::CONTROL_INVALID_ACTION, "CONTROL_INVALID_ACTION"},
    {ErrorCode::CONTROL_NOT_STARTED, "CONTROL_NOT_STARTED"},
    {ErrorCode::CONTROL_ACTION_FAILED, "CONTROL_ACTION_FAILED"},

    // IPC/ZeroMQ
    {ErrorCode::IPC_INVALID_COMMAND, "IPC_INVALID_COMMAND"},
    {ErrorCode::IPC_INVALID_PARAMS, "IPC_INVALID_PARAMS"},
    {ErrorCode::IPC_PROTOCOL_ERROR, "IPC_PROTOCOL_ERROR"},
    {ErrorCode::IPC_BIND_FAILED, "IPC_BIND_FAILED"},

    // Configuration
    {ErrorCode::CONFIG_FILE_NOT_FOUND, "CONFIG_FILE_NOT_FOUND"},
    {ErrorCode::CONFIG_PARSE_ERROR, "CONFIG_PARSE_ERROR"},
    {ErrorCode::CONFIG_INVALID_MENU, "CONFIG_INVALID_MENU"},
    {ErrorCode::CONFIG_INVALID_VALUE, "CONFIG_INVALID_VALUE"},

    // Internal
    {ErrorCode::INTERNAL_INVARIANT_VIOLATION, "INTERNAL_INVARIANT_VIOLATION"},
    {ErrorCode::INTERNAL_UNKNOWN, "INTERNAL_UNKNOWN"},
};

// String to error code mapping (reverse lookup)
static const std::unordered_map<std::string, ErrorCode> kStringToErrorCode = [] {
    std::unordered_map<std::string, ErrorCode> reverse;
    for (const auto& entry : kErrorCodeStrings) {
        reverse.emplace(entry.second, entry.first);
    }
    return reverse;
}();

const char* errorCodeToString(ErrorCode code) {
    auto it = kErrorCodeStrings.find(code);
    if (it != kErrorCodeStrings.end()) {
        return it->second;
    }
    return "UNKNOWN_ERROR";
}

const char* getErrorCategory(ErrorCode code) {
    if (code == ErrorCode::OK) {
        return "ok";
    }
    if (isEngineError(code)) {
        return "engine";
    }
    if (isSchemaError(code)) {
        return "schema";
    }
    if (isControlError(code)) {
        return "control";
    }
    if (isIpcError(code)) {
        return "ipc_zeromq";
    }
    if (isConfigError(code)) {
        return "config";
    }
    return "internal";
}

std::string errorCodeToHex(ErrorCode code) {
    std::ostringstream oss;
    oss << "0x" << std::hex << std::setfill('0') << std::setw(4) << static_cast<uint32_t>(code);
    return oss.str();
}

ErrorCode stringToErrorCode(const std::string& str) {
    auto it = kStringToErrorCode.find(str);
    if (it != kStringToErrorCode.end()) {
        return it->second;
    }
    return ErrorCode::INTERNAL_UNKNOWN;
}

}  // namespace camilla_remote
