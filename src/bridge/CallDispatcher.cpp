#include "callbridge/CallDispatcher.hpp"

#include "callbridge/BridgeError.hpp"
#include "callbridge/Log.hpp"

namespace callbridge {

const char* selector_name(Selector selector) {
    switch (selector) {
        case Selector::CallFunction:
            return "call_function";
        case Selector::CallFunctionParse:
            return "call_function_parse";
        case Selector::CallFunctionStream:
            return "call_function_stream";
        case Selector::CallObjectConstructor:
            return "call_object_constructor";
        case Selector::CallObjectMethod:
            return "call_object_method";
        case Selector::CallObjectMethodAsync:
            return "call_object_method_async";
        case Selector::DestroyObject:
            return "destroy_object";
    }
    return "unknown";
}

bool is_async_selector(Selector selector) {
    return selector == Selector::CallFunction || selector == Selector::CallFunctionParse ||
        selector == Selector::CallFunctionStream || selector == Selector::CallObjectMethodAsync;
}

static ErrorKind error_kind_for(callbridge_status status) {
    switch (status) {
        case CALLBRIDGE_MALFORMED_MESSAGE:
            return ErrorKind::MalformedMessage;
        case CALLBRIDGE_UNSUPPORTED_VALUE_KIND:
            return ErrorKind::UnsupportedValueKind;
        case CALLBRIDGE_INVALID_HANDLE:
            return ErrorKind::InvalidHandle;
        case CALLBRIDGE_CANCELLED:
            return ErrorKind::Cancelled;
        default:
            return ErrorKind::NativeFailure;
    }
}

CallDispatcher::CallDispatcher(const callbridge_native_api* api) : api_(api) {
    if (!api_) {
        throw BridgeError(ErrorKind::InvalidArgument, "native API table is null");
    }
    if (api_->abi_version >> 16 != CALLBRIDGE_ABI_VERSION_MAJOR) {
        throw BridgeError(ErrorKind::InvalidArgument,
            "native runtime ABI major version " + std::to_string(api_->abi_version >> 16) +
                " does not match bridge ABI " + std::to_string(CALLBRIDGE_ABI_VERSION_MAJOR));
    }
}

std::string CallDispatcher::version() const {
    const char* v = api_->version ? api_->version() : nullptr;
    if (!v) {
        throw BridgeError(ErrorKind::NativeFailure, "native runtime did not report a version");
    }
    return std::string(v);
}

Bytes CallDispatcher::take_buffer(callbridge_buffer& buffer) const {
    Bytes out;
    if (buffer.data && buffer.length > 0) {
        out.assign(buffer.data, buffer.data + buffer.length);
    }
    if (buffer.data && api_->free_buffer) {
        api_->free_buffer(buffer);
    }
    buffer.data = nullptr;
    buffer.length = 0;
    return out;
}

void CallDispatcher::raise(Selector selector, callbridge_status status, callbridge_buffer& error) const {
    Bytes raw = take_buffer(error);
    std::string diagnostic(raw.begin(), raw.end());
    if (diagnostic.empty()) {
        diagnostic = std::string(selector_name(selector)) + " failed with native status " + std::to_string(status);
    }
    CALLBRIDGE_DEBUG("dispatch", selector_name(selector) << " -> status " << status << ": " << diagnostic);
    throw BridgeError(error_kind_for(status), status, diagnostic);
}

callbridge_runtime CallDispatcher::require_runtime() const {
    callbridge_runtime rt = runtime_.load();
    if (!rt) {
        throw BridgeError(ErrorKind::BridgeClosed, "dispatcher is not bound to a native runtime");
    }
    return rt;
}

callbridge_runtime CallDispatcher::create_runtime(const RuntimeOptions& options,
    callbridge_result_callback on_result,
    callbridge_tick_callback on_tick,
    void* user_data) const {
    callbridge_runtime rt = nullptr;
    callbridge_buffer error{nullptr, 0};
    callbridge_status status = api_->create_runtime(options.root_path.c_str(),
        options.src_files_json.c_str(),
        options.env_vars_json.c_str(),
        on_result,
        on_tick,
        user_data,
        &rt,
        &error);
    if (status != CALLBRIDGE_OK) {
        Bytes raw = take_buffer(error);
        throw BridgeError(ErrorKind::NativeFailure, status,
            raw.empty() ? "failed to create native runtime" : std::string(raw.begin(), raw.end()));
    }
    take_buffer(error);
    if (!rt) {
        throw BridgeError(ErrorKind::NativeFailure, "failed to create native runtime - returned null handle");
    }
    return rt;
}

void CallDispatcher::destroy_runtime(callbridge_runtime runtime) const {
    if (runtime && api_->destroy_runtime) {
        api_->destroy_runtime(runtime);
    }
}

Bytes CallDispatcher::invoke(Selector selector, const Bytes& request, uint32_t call_id) const {
    callbridge_runtime rt = require_runtime();
    if (is_async_selector(selector) && call_id == 0) {
        throw BridgeError(ErrorKind::InvalidArgument, std::string(selector_name(selector)) + " needs a call id");
    }

    callbridge_buffer result{nullptr, 0};
    callbridge_buffer error{nullptr, 0};
    callbridge_status status = CALLBRIDGE_GENERIC_FAILURE;
    const uint8_t* req = request.data();
    size_t len = request.size();

    CALLBRIDGE_TRACE("dispatch", selector_name(selector) << " (" << len << " bytes, call " << call_id << ")");

    switch (selector) {
        case Selector::CallFunction:
            status = api_->call_function(rt, req, len, call_id, &error);
            break;
        case Selector::CallFunctionParse:
            status = api_->call_function_parse(rt, req, len, call_id, &error);
            break;
        case Selector::CallFunctionStream:
            status = api_->call_function_stream(rt, req, len, call_id, &error);
            break;
        case Selector::CallObjectConstructor:
            status = api_->call_object_constructor(rt, req, len, &result, &error);
            break;
        case Selector::CallObjectMethod:
            status = api_->call_object_method(rt, req, len, &result, &error);
            break;
        case Selector::CallObjectMethodAsync:
            status = api_->call_object_method_async(rt, req, len, call_id, &error);
            break;
        case Selector::DestroyObject:
            status = api_->destroy_object(rt, req, len, &error);
            break;
    }

    if (status != CALLBRIDGE_OK) {
        take_buffer(result);
        raise(selector, status, error);
    }
    take_buffer(error);
    return take_buffer(result);
}

bool CallDispatcher::cancel(uint32_t call_id) const {
    callbridge_runtime rt = require_runtime();
    bool cancelled = false;
    callbridge_status status = api_->cancel_function_call(rt, call_id, &cancelled);
    if (status != CALLBRIDGE_OK) {
        throw BridgeError(error_kind_for(status), status,
            "cancel_function_call(" + std::to_string(call_id) + ") failed with native status " +
                std::to_string(status));
    }
    return cancelled;
}

}  // namespace callbridge
