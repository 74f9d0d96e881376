#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

#include "callbridge/callbridge_abi.h"

namespace callbridge {

enum class ErrorKind {
    MalformedMessage,
    UnsupportedValueKind,
    InvalidHandle,
    DuplicateHandle,
    NativeFailure,
    Cancelled,
    InvalidArgument,
    BridgeClosed,
};

const char* error_kind_name(ErrorKind kind);

class BridgeError : public std::runtime_error {
   public:
    BridgeError(ErrorKind kind, const std::string& message)
        : std::runtime_error(format_message(kind, message)), kind_(kind), diagnostic_(message) {}

    BridgeError(ErrorKind kind, callbridge_status status, const std::string& diagnostic)
        : std::runtime_error(format_message(kind, diagnostic)),
          kind_(kind),
          native_status_(status),
          diagnostic_(diagnostic) {}

    ErrorKind kind() const { return kind_; }
    callbridge_status native_status() const { return native_status_; }

    // Message as supplied by the native runtime (or the bridge), without the kind prefix.
    const std::string& diagnostic() const { return diagnostic_; }

    // Handle context for InvalidHandle / DuplicateHandle. 0 when unknown.
    uint64_t handle() const { return handle_; }
    callbridge_object_kind object_kind() const { return object_kind_; }

    static BridgeError invalid_handle(uint64_t handle, callbridge_object_kind kind, const std::string& detail);
    static BridgeError duplicate_handle(uint64_t handle, callbridge_object_kind kind, uint64_t pointer);

   private:
    static std::string format_message(ErrorKind kind, const std::string& message) {
        return std::string(error_kind_name(kind)) + ": " + message;
    }

    ErrorKind kind_;
    callbridge_status native_status_ = CALLBRIDGE_OK;
    std::string diagnostic_;
    uint64_t handle_ = 0;
    callbridge_object_kind object_kind_ = CALLBRIDGE_OBJECT_INVALID;
};

}  // namespace callbridge
