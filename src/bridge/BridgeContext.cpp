#include "callbridge/BridgeContext.hpp"

#include <exception>
#include <mutex>

#include "callbridge/BridgeError.hpp"
#include "callbridge/Log.hpp"
#include "callbridge/WireCodec.hpp"

namespace callbridge {

BridgeContext::BridgeContext(const callbridge_native_api* api, const RuntimeOptions& options)
    : dispatcher_(api),
      channel_([this](CallbackMessage& msg) { callbacks_.on_native_callback(msg); }),
      callbacks_(dispatcher_, hooks_for(this)) {
    open(options);
}

BridgeContext::BridgeContext(std::unique_ptr<NativeLibrary> library, const RuntimeOptions& options)
    : library_(std::move(library)),
      dispatcher_(library_->api()),
      channel_([this](CallbackMessage& msg) { callbacks_.on_native_callback(msg); }),
      callbacks_(dispatcher_, hooks_for(this)) {
    open(options);
}

CallbackHooks BridgeContext::hooks_for(BridgeContext* self) {
    CallbackHooks hooks;
    hooks.map_value = [self](const WireValue& value, uint32_t call_id) { return self->to_host(value, call_id); };
    hooks.native_cancel = [self](uint32_t call_id) { return self->native_cancel(call_id); };
    return hooks;
}

void BridgeContext::open(const RuntimeOptions& options) {
    channel_.start();
    callbridge_runtime rt = dispatcher_.create_runtime(options, &BridgeContext::on_result,
        &BridgeContext::on_tick, this);
    dispatcher_.bind(rt);
    CALLBRIDGE_DEBUG("context", "native runtime created (root '" << options.root_path << "')");
}

BridgeContext::~BridgeContext() {
    close();
    // The consumer may still be running a close() started from a callback.
    channel_.stop();
}

std::unique_ptr<BridgeContext> BridgeContext::from_config(const BridgeConfig& config) {
    if (!config.log_level.empty()) {
        auto lvl = log::parse_level(config.log_level);
        if (lvl) {
            log::set_level(*lvl);
        } else {
            CALLBRIDGE_WARN("context", "unknown log_level '" << config.log_level << "' in config");
        }
    }

    if (config.native_library.empty()) {
        throw BridgeError(ErrorKind::InvalidArgument, "config does not name a native_library");
    }

    auto library = std::make_unique<NativeLibrary>(config.native_library);

    std::map<std::string, std::string> files;
    if (!config.root_path.empty()) {
        files = load_source_files(config.root_path, config.source_extension);
    }

    RuntimeOptions options = options_for(config.root_path, files, config.env);
    return std::unique_ptr<BridgeContext>(new BridgeContext(std::move(library), options));
}

RuntimeOptions BridgeContext::options_for(const std::string& root_path,
    const std::map<std::string, std::string>& files,
    const std::map<std::string, std::string>& env) {
    RuntimeOptions options;
    options.root_path = root_path;
    options.src_files_json = to_json_object(files);
    options.env_vars_json = to_json_object(env);
    return options;
}

std::string BridgeContext::version() const {
    return dispatcher_.version();
}

// ============================================================================
// Reverse callbacks (any runtime thread)
// ============================================================================

void BridgeContext::on_result(void* user_data, uint32_t call_id, int is_done, callbridge_call_status status,
    const uint8_t* data, size_t length) {
    auto* self = static_cast<BridgeContext*>(user_data);
    if (!self) return;

    // Nothing may unwind into the runtime.
    try {
        CallbackMessage msg;
        msg.call_id = call_id;
        msg.event = is_done ? CallbackEvent::Final : CallbackEvent::Partial;
        msg.status = status;
        if (data && length > 0) {
            msg.payload.assign(data, data + length);
        }
        self->channel_.post(std::move(msg));
    } catch (const std::exception& e) {
        CALLBRIDGE_ERROR("context", "failed to queue result for call " << call_id << ": " << e.what());
    }
}

void BridgeContext::on_tick(void* user_data, uint32_t call_id) {
    auto* self = static_cast<BridgeContext*>(user_data);
    if (!self) return;

    try {
        CallbackMessage msg;
        msg.call_id = call_id;
        msg.event = CallbackEvent::Tick;
        self->channel_.post(std::move(msg));
    } catch (const std::exception& e) {
        CALLBRIDGE_ERROR("context", "failed to queue tick for call " << call_id << ": " << e.what());
    }
}

// ============================================================================
// Validation and translation
// ============================================================================

void BridgeContext::require_open() const {
    if (closed_.load()) {
        throw BridgeError(ErrorKind::BridgeClosed, "bridge context has been closed");
    }
}

RawObjectRef BridgeContext::reference(const ObjectHandle& object) const {
    registry_.resolve(object.handle, object.kind);
    return RawObjectRef{object.kind, object.handle};
}

RawObjectRef BridgeContext::to_native(const RawObjectRef& reference) const {
    return registry_.resolve(reference.pointer, reference.kind);
}

KwargsMap BridgeContext::to_native(const KwargsMap& kwargs) const {
    KwargsMap out;
    out.reserve(kwargs.size());
    for (const auto& entry : kwargs) {
        if (const auto* ref = std::get_if<RawObjectRef>(&entry.value)) {
            out.push_back(MapEntry{entry.key, to_native(*ref)});
        } else {
            out.push_back(entry);
        }
    }
    return out;
}

RawObjectRef BridgeContext::to_host(const RawObjectRef& native, uint32_t creation_call_id) {
    // Objects handed out by the runtime join the registry the first time they are seen.
    Handle h = registry_.adopt(native.kind, native.pointer, creation_call_id);
    return RawObjectRef{native.kind, h};
}

WireValue BridgeContext::to_host(const WireValue& value, uint32_t creation_call_id) {
    if (const auto* ref = std::get_if<RawObjectRef>(&value)) {
        return to_host(*ref, creation_call_id);
    }
    return value;
}

// ============================================================================
// Objects
// ============================================================================

ObjectHandle BridgeContext::construct_object(ObjectKind kind, const KwargsMap& kwargs) {
    ObjectConstructorRequest request;
    request.kind = kind;
    request.kwargs = kwargs;

    return handle_of(wire::decode_raw_object(call_object_constructor(wire::encode(request))));
}

Bytes BridgeContext::call_object_constructor(const Bytes& request) {
    std::shared_lock<std::shared_mutex> lock(lifecycle_mutex_);
    require_open();

    ObjectConstructorRequest decoded = wire::decode_object_constructor(request);
    decoded.kwargs = to_native(decoded.kwargs);

    Bytes result = dispatcher_.invoke(Selector::CallObjectConstructor, wire::encode(decoded));
    RawObjectRef native = wire::decode_raw_object(result);

    Handle h = registry_.register_object(native.kind, native.pointer);
    CALLBRIDGE_DEBUG("context", "constructed " << object_kind_name(native.kind) << " as handle " << h);
    return wire::encode(RawObjectRef{native.kind, h});
}

WireValue BridgeContext::call_object_method(const ObjectHandle& object, const std::string& method,
    const KwargsMap& kwargs) {
    ObjectMethodRequest request;
    request.object = RawObjectRef{object.kind, object.handle};
    request.method_name = method;
    request.kwargs = kwargs;

    return wire::decode_value(call_object_method(wire::encode(request)));
}

Bytes BridgeContext::call_object_method(const Bytes& request) {
    std::shared_lock<std::shared_mutex> lock(lifecycle_mutex_);
    require_open();

    ObjectMethodRequest decoded = wire::decode_object_method(request);
    decoded.object = to_native(decoded.object);
    decoded.kwargs = to_native(decoded.kwargs);

    Bytes result = dispatcher_.invoke(Selector::CallObjectMethod, wire::encode(decoded));
    return wire::encode(to_host(wire::decode_value(result)));
}

CallHandle BridgeContext::call_object_method_async(const ObjectHandle& object, const std::string& method,
    const KwargsMap& kwargs) {
    std::shared_lock<std::shared_mutex> lock(lifecycle_mutex_);
    require_open();

    ObjectMethodRequest request;
    request.object = registry_.resolve(object.handle, object.kind);
    request.method_name = method;
    request.kwargs = to_native(kwargs);

    return callbacks_.start(Selector::CallObjectMethodAsync, wire::encode(request));
}

bool BridgeContext::dispose(Handle handle) {
    std::shared_lock<std::shared_mutex> lock(lifecycle_mutex_);
    return dispose_locked(handle);
}

bool BridgeContext::dispose_locked(Handle handle) {
    auto ref = registry_.invalidate(handle);
    if (!ref) return false;

    // Runtime already gone; nothing left to destroy on the native side.
    if (!dispatcher_.runtime()) return true;

    dispatcher_.invoke(Selector::DestroyObject, wire::encode(*ref));
    CALLBRIDGE_TRACE("context", "disposed handle " << handle);
    return true;
}

// ============================================================================
// Functions
// ============================================================================

CallHandle BridgeContext::start_function(Selector selector, const std::string& name, const KwargsMap& kwargs,
    const EnvVars& env, PartialSink on_partial, TickSink on_tick) {
    std::shared_lock<std::shared_mutex> lock(lifecycle_mutex_);
    require_open();
    if (name.empty()) {
        throw BridgeError(ErrorKind::InvalidArgument, "function name must not be empty");
    }

    FunctionCallRequest request;
    request.function_name = name;
    request.kwargs = to_native(kwargs);
    request.env = env;

    return callbacks_.start(selector, wire::encode(request), std::move(on_partial), std::move(on_tick));
}

CallHandle BridgeContext::call_function(const std::string& name, const KwargsMap& kwargs, const EnvVars& env) {
    return start_function(Selector::CallFunction, name, kwargs, env);
}

CallHandle BridgeContext::call_function_parse(const std::string& name, const KwargsMap& kwargs,
    const EnvVars& env) {
    return start_function(Selector::CallFunctionParse, name, kwargs, env);
}

CallHandle BridgeContext::call_function_stream(const std::string& name, const KwargsMap& kwargs,
    const EnvVars& env, PartialSink on_partial, TickSink on_tick) {
    return start_function(Selector::CallFunctionStream, name, kwargs, env, std::move(on_partial),
        std::move(on_tick));
}

// ============================================================================
// Teardown
// ============================================================================

bool BridgeContext::native_cancel(uint32_t call_id) {
    std::shared_lock<std::shared_mutex> lock(lifecycle_mutex_);
    if (closed_.load()) return false;
    return dispatcher_.cancel(call_id);
}

void BridgeContext::close() {
    // Calls arriving from now on fail fast; the lock waits for those already inside.
    closed_.store(true);
    {
        std::unique_lock<std::shared_mutex> lock(lifecycle_mutex_);
        if (torn_down_) return;
        torn_down_ = true;

        auto live = registry_.live_handles();
        if (!live.empty()) {
            CALLBRIDGE_DEBUG("context", "disposing " << live.size() << " live object(s)");
        }
        for (Handle h : live) {
            try {
                dispose_locked(h);
            } catch (const BridgeError& e) {
                CALLBRIDGE_WARN("context", "destroy of handle " << h << " failed: " << e.what());
            }
        }

        // destroy_runtime cancels whatever is still running and delivers the
        // final callbacks before it returns.
        callbridge_runtime rt = dispatcher_.runtime();
        dispatcher_.bind(nullptr);
        dispatcher_.destroy_runtime(rt);
    }

    channel_.stop();
    callbacks_.shutdown("bridge context closed");
}

}  // namespace callbridge
