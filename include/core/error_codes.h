#ifndef ERROR_CODES_H
#define ERROR_CODES_H

#include <cstdint>
#include <stdexcept>
#include <string>

namespace camilla_remote {

/**
 * @brief Error codes for the remote control daemon.
 *
 * Categories use upper 4 bits of the low 16 (0xF000 mask):
 * - 0x1xxx: DSP engine transport
 * - 0x2xxx: Pipeline schema
 * - 0x3xxx: Live control
 * - 0x4xxx: IPC/ZeroMQ control surface
 * - 0x5xxx: Configuration file
 * - 0xFxxx: Internal (reserved)
 */
enum class ErrorCode : uint32_t {
    OK = 0,

    // DSP engine (0x1000)
    ENGINE_CONNECTION_FAILED = 0x1001,
    ENGINE_TIMEOUT = 0x1002,
    ENGINE_REQUEST_FAILED = 0x1003,
    ENGINE_PROTOCOL_ERROR = 0x1004,
    ENGINE_NOT_CONNECTED = 0x1005,

    // Pipeline schema (0x2000)
    SCHEMA_INVALID_CONFIG = 0x2001,
    SCHEMA_MISSING_FIELD = 0x2002,
    SCHEMA_UNKNOWN_FILTER = 0x2003,
    SCHEMA_CHANNEL_OUT_OF_RANGE = 0x2004,
    SCHEMA_REJECTED_BY_ENGINE = 0x2005,

    // Live control (0x3000)
    CONTROL_BALANCE_UNAVAILABLE = 0x3001,
    CONTROL_INVALID_ACTION = 0x3002,
    CONTROL_NOT_STARTED = 0x3003,
    CONTROL_ACTION_FAILED = 0x3004,

    // IPC/ZeroMQ (0x4000)
    IPC_INVALID_COMMAND = 0x4001,
    IPC_INVALID_PARAMS = 0x4002,
    IPC_PROTOCOL_ERROR = 0x4003,
    IPC_BIND_FAILED = 0x4004,

    // Configuration (0x5000)
    CONFIG_FILE_NOT_FOUND = 0x5001,
    CONFIG_PARSE_ERROR = 0x5002,
    CONFIG_INVALID_MENU = 0x5003,
    CONFIG_INVALID_VALUE = 0x5004,

    // Internal (0xF000)
    INTERNAL_INVARIANT_VIOLATION = 0xF001,
    INTERNAL_UNKNOWN = 0xF002,
};

/**
 * @brief Convert ErrorCode to string representation.
 * @return String name (e.g., "ENGINE_TIMEOUT"), or "UNKNOWN_ERROR" for unknown codes
 */
const char* errorCodeToString(ErrorCode code);

/**
 * @brief Get the category name for an error code.
 * @return Category name (e.g., "engine"), or "internal" for unknown codes
 */
const char* getErrorCategory(ErrorCode code);

/**
 * @brief Convert ErrorCode to hex string (e.g., "0x1002").
 */
std::string errorCodeToHex(ErrorCode code);

/**
 * @brief Convert string to ErrorCode enum.
 * @return Corresponding ErrorCode, or INTERNAL_UNKNOWN if not found
 */
ErrorCode stringToErrorCode(const std::string& str);

// Category check helpers
constexpr bool isEngineError(ErrorCode code) {
    return (static_cast<uint32_t>(code) & 0xF000) == 0x1000;
}
constexpr bool isSchemaError(ErrorCode code) {
    return (static_cast<uint32_t>(code) & 0xF000) == 0x2000;
}
constexpr bool isControlError(ErrorCode code) {
    return (static_cast<uint32_t>(code) & 0xF000) == 0x3000;
}
constexpr bool isIpcError(ErrorCode code) {
    return (static_cast<uint32_t>(code) & 0xF000) == 0x4000;
}
constexpr bool isConfigError(ErrorCode code) {
    return (static_cast<uint32_t>(code) & 0xF000) == 0x5000;
}
constexpr bool isInternalError(ErrorCode code) {
    return (static_cast<uint32_t>(code) & 0xF000) == 0xF000;
}

/**
 * @brief Base exception carrying an ErrorCode.
 */
class RemoteError : public std::runtime_error {
   public:
    RemoteError(ErrorCode code, const std::string& message)
        : std::runtime_error(message), code_(code) {}

    ErrorCode code() const {
        return code_;
    }

   private:
    ErrorCode code_;
};

// A pipeline description is structurally or semantically invalid.
class SchemaError : public RemoteError {
   public:
    explicit SchemaError(const std::string& message,
                         ErrorCode code = ErrorCode::SCHEMA_INVALID_CONFIG)
        : RemoteError(code, message) {}
};

// Communication with the live engine failed.
class EngineError : public RemoteError {
   public:
    explicit EngineError(const std::string& message,
                         ErrorCode code = ErrorCode::ENGINE_REQUEST_FAILED)
        : RemoteError(code, message) {}
};

// A control action cannot be applied to the current live state.
class ControlError : public RemoteError {
   public:
    explicit ControlError(const std::string& message,
                          ErrorCode code = ErrorCode::CONTROL_INVALID_ACTION)
        : RemoteError(code, message) {}
};

// Programming error: menu and catalog disagree.
class InvariantViolation : public RemoteError {
   public:
    explicit InvariantViolation(const std::string& message)
        : RemoteError(ErrorCode::INTERNAL_INVARIANT_VIOLATION, message) {}
};

}  // namespace camilla_remote

#endif  // ERROR_CODES_H
