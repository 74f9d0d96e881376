#include "callbridge/BridgeError.hpp"

#include <sstream>

#include "callbridge/WireValue.hpp"

namespace callbridge {

const char* error_kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::MalformedMessage:
            return "MalformedMessage";
        case ErrorKind::UnsupportedValueKind:
            return "UnsupportedValueKind";
        case ErrorKind::InvalidHandle:
            return "InvalidHandle";
        case ErrorKind::DuplicateHandle:
            return "DuplicateHandle";
        case ErrorKind::NativeFailure:
            return "NativeFailure";
        case ErrorKind::Cancelled:
            return "Cancelled";
        case ErrorKind::InvalidArgument:
            return "InvalidArgument";
        case ErrorKind::BridgeClosed:
            return "BridgeClosed";
    }
    return "UnknownError";
}

BridgeError BridgeError::invalid_handle(uint64_t handle, callbridge_object_kind kind, const std::string& detail) {
    std::ostringstream ss;
    ss << "handle " << handle << " (" << object_kind_name(kind) << ") " << detail;
    BridgeError err(ErrorKind::InvalidHandle, ss.str());
    err.handle_ = handle;
    err.object_kind_ = kind;
    return err;
}

BridgeError BridgeError::duplicate_handle(uint64_t handle, callbridge_object_kind kind, uint64_t pointer) {
    std::ostringstream ss;
    ss << "native pointer 0x" << std::hex << pointer << std::dec << " (" << object_kind_name(kind)
       << ") is already registered as live handle " << handle;
    BridgeError err(ErrorKind::DuplicateHandle, ss.str());
    err.handle_ = handle;
    err.object_kind_ = kind;
    return err;
}

}  // namespace callbridge
