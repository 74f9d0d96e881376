#include "callbridge/BridgeClient.hpp"

#include <exception>
#include <sstream>

#include "callbridge/BridgeError.hpp"
#include "callbridge/Log.hpp"

namespace callbridge {

// ============================================================================
// Conversions
// ============================================================================

static WireValue to_wire(const Arg& value, const BridgeContext& context) {
    if (std::holds_alternative<std::monostate>(value)) return WireValue{};
    if (auto s = std::get_if<std::string>(&value)) return WireValue{*s};
    if (auto i = std::get_if<int64_t>(&value)) return WireValue{*i};
    if (auto b = std::get_if<bool>(&value)) return WireValue{*b};
    if (auto d = std::get_if<double>(&value)) return WireValue{WireFloat{*d}};
    const auto& h = std::get<ObjectHandle>(value);
    return WireValue{context.reference(h)};
}

KwargsMap to_kwargs(const Args& args, const BridgeContext& context) {
    KwargsMap out;
    out.reserve(args.size());
    for (const auto& arg : args) {
        out.push_back(MapEntry{arg.name, to_wire(arg.value, context)});
    }
    return out;
}

std::map<std::string, Arg> to_map(const Args& args) {
    std::map<std::string, Arg> out;
    for (const auto& arg : args) {
        out.emplace(arg.name, arg.value);
    }
    return out;
}

Arg from_wire(const WireValue& value, const BridgeContext& context) {
    if (std::holds_alternative<std::monostate>(value)) return Arg{};
    if (auto s = std::get_if<std::string>(&value)) return Arg{*s};
    if (auto i = std::get_if<int64_t>(&value)) return Arg{*i};
    if (auto b = std::get_if<bool>(&value)) return Arg{*b};
    if (auto f = std::get_if<WireFloat>(&value)) return Arg{f->value};
    ObjectHandle h = BridgeContext::handle_of(std::get<RawObjectRef>(value));
    context.reference(h);
    return Arg{h};
}

Args from_kwargs(const KwargsMap& kwargs, const BridgeContext& context) {
    Args out;
    out.reserve(kwargs.size());
    for (const auto& entry : kwargs) {
        out.push_back(NamedArg{entry.key, from_wire(entry.value, context)});
    }
    return out;
}

std::string arg_to_string(const Arg& value) {
    std::ostringstream ss;
    if (std::holds_alternative<std::monostate>(value)) {
        ss << "null";
    } else if (auto s = std::get_if<std::string>(&value)) {
        ss << '"' << *s << '"';
    } else if (auto i = std::get_if<int64_t>(&value)) {
        ss << *i;
    } else if (auto b = std::get_if<bool>(&value)) {
        ss << (*b ? "true" : "false");
    } else if (auto d = std::get_if<double>(&value)) {
        ss << *d;
    } else if (auto h = std::get_if<ObjectHandle>(&value)) {
        ss << "<" << object_kind_name(h->kind) << " #" << h->handle << ">";
    }
    return ss.str();
}

// ============================================================================
// Awaiting
// ============================================================================

WireValue await_outcome(BridgeContext& context, const CallHandle& handle, const CallOptions& options) {
    const uint32_t call_id = handle.call_id;

    CancellationRegistration registration =
        options.token.on_cancel([&context, call_id]() { context.cancel(call_id); });

    bool timed_out = false;
    if (options.timeout.count() > 0 && !handle.wait_for(options.timeout)) {
        CALLBRIDGE_DEBUG("client", "call " << call_id << " exceeded " << options.timeout.count() << " ms");
        timed_out = context.cancel(call_id);
    }

    const CallOutcome& outcome = handle.wait();
    registration.reset();

    if (timed_out && outcome.status == CallStatus::Cancelled) {
        throw BridgeError(ErrorKind::Cancelled, CALLBRIDGE_CANCELLED,
            "call " + std::to_string(call_id) + " timed out after " + std::to_string(options.timeout.count()) +
                " ms");
    }
    return outcome.value_or_throw();
}

// ============================================================================
// BridgeClient
// ============================================================================

void BridgeClient::add_request_interceptor(RequestInterceptor interceptor) {
    std::lock_guard<std::mutex> lock(interceptors_mutex_);
    request_interceptors_.push_back(std::move(interceptor));
}

void BridgeClient::add_response_interceptor(ResponseInterceptor interceptor) {
    std::lock_guard<std::mutex> lock(interceptors_mutex_);
    response_interceptors_.push_back(std::move(interceptor));
}

Args BridgeClient::intercept_request(const std::string& function_name, const Args& args) {
    std::vector<RequestInterceptor> interceptors;
    {
        std::lock_guard<std::mutex> lock(interceptors_mutex_);
        interceptors = request_interceptors_;
    }

    Args effective = args;
    for (auto& interceptor : interceptors) {
        interceptor(function_name, effective);
    }
    return effective;
}

void BridgeClient::intercept_response(const std::string& function_name, const Arg& result) {
    std::vector<ResponseInterceptor> interceptors;
    {
        std::lock_guard<std::mutex> lock(interceptors_mutex_);
        interceptors = response_interceptors_;
    }

    for (auto& interceptor : interceptors) {
        interceptor(function_name, result);
    }
}

void BridgeClient::set_value(const std::string& key, Arg value) {
    std::lock_guard<std::mutex> lock(values_mutex_);
    values_[key] = std::move(value);
}

Arg BridgeClient::get_value(const std::string& key) const {
    return try_get_value(key).value_or(Arg{});
}

std::optional<Arg> BridgeClient::try_get_value(const std::string& key) const {
    std::lock_guard<std::mutex> lock(values_mutex_);
    auto it = values_.find(key);
    if (it == values_.end()) return std::nullopt;
    return it->second;
}

bool BridgeClient::contains_value(const std::string& key) const {
    std::lock_guard<std::mutex> lock(values_mutex_);
    return values_.count(key) != 0;
}

void BridgeClient::clear_values() {
    std::lock_guard<std::mutex> lock(values_mutex_);
    values_.clear();
}

CallHandle BridgeClient::submit(Selector selector, const std::string& function_name, const Args& args,
    const CallOptions& options, PartialSink on_partial, TickSink on_tick) {
    if (options.token.cancelled()) {
        throw BridgeError(ErrorKind::Cancelled, CALLBRIDGE_CANCELLED,
            "call to " + function_name + " was cancelled before it started");
    }

    Args effective = intercept_request(function_name, args);
    KwargsMap kwargs = to_kwargs(effective, context_);

    switch (selector) {
        case Selector::CallFunction:
            return context_.call_function(function_name, kwargs, options.env);
        case Selector::CallFunctionParse:
            return context_.call_function_parse(function_name, kwargs, options.env);
        case Selector::CallFunctionStream:
            return context_.call_function_stream(function_name, kwargs, options.env, std::move(on_partial),
                std::move(on_tick));
        default:
            break;
    }
    throw BridgeError(ErrorKind::InvalidArgument,
        std::string(selector_name(selector)) + " is not a function entry point");
}

Arg BridgeClient::finish(const std::string& function_name, const CallHandle& handle, const CallOptions& options) {
    Arg result = from_wire(await_outcome(context_, handle, options), context_);
    intercept_response(function_name, result);
    return result;
}

Arg BridgeClient::call(const std::string& function_name, const Args& args, const CallOptions& options) {
    CallHandle handle = submit(Selector::CallFunction, function_name, args, options);
    return finish(function_name, handle, options);
}

std::future<Arg> BridgeClient::call_async(const std::string& function_name, const Args& args,
    const CallOptions& options) {
    CallHandle handle = submit(Selector::CallFunction, function_name, args, options);
    return std::async(std::launch::deferred,
        [this, function_name, handle, options]() { return finish(function_name, handle, options); });
}

Arg BridgeClient::parse(const std::string& function_name, const Args& args, const CallOptions& options) {
    CallHandle handle = submit(Selector::CallFunctionParse, function_name, args, options);
    return finish(function_name, handle, options);
}

Arg BridgeClient::stream(const std::string& function_name, const Args& args, ChunkSink on_chunk,
    const CallOptions& options, std::function<void()> on_tick) {
    PartialSink partial;
    if (on_chunk) {
        partial = [this, on_chunk](const WireValue& chunk) { on_chunk(from_wire(chunk, context_)); };
    }
    CallHandle handle = submit(Selector::CallFunctionStream, function_name, args, options, std::move(partial),
        std::move(on_tick));
    return finish(function_name, handle, options);
}

NativeObject BridgeClient::construct(ObjectKind kind, const Args& args) {
    ObjectHandle h = context_.construct_object(kind, to_kwargs(args, context_));
    return NativeObject(context_, h);
}

NativeObject BridgeClient::create_collector(const std::string& name) {
    return construct(CALLBRIDGE_OBJECT_COLLECTOR, {{"name", Arg{name}}});
}

NativeObject BridgeClient::create_type_builder() {
    return construct(CALLBRIDGE_OBJECT_TYPE_BUILDER);
}

// ============================================================================
// NativeObject
// ============================================================================

NativeObject::~NativeObject() {
    try {
        dispose();
    } catch (const std::exception& e) {
        CALLBRIDGE_WARN("client", "finalizing handle " << handle_.handle << " failed: " << e.what());
    }
}

NativeObject::NativeObject(NativeObject&& other) noexcept : context_(other.context_), handle_(other.handle_) {
    other.context_ = nullptr;
    other.handle_ = ObjectHandle{};
}

NativeObject& NativeObject::operator=(NativeObject&& other) noexcept {
    if (this != &other) {
        try {
            dispose();
        } catch (const std::exception& e) {
            CALLBRIDGE_WARN("client", "finalizing handle " << handle_.handle << " failed: " << e.what());
        }
        context_ = other.context_;
        handle_ = other.handle_;
        other.context_ = nullptr;
        other.handle_ = ObjectHandle{};
    }
    return *this;
}

void NativeObject::dispose() {
    if (!context_) return;
    context_->dispose(handle_.handle);
}

bool NativeObject::valid() const {
    return context_ && context_->registry().is_live(handle_.handle);
}

Arg NativeObject::call(const std::string& method, const Args& args) {
    if (!context_) {
        throw BridgeError::invalid_handle(handle_.handle, handle_.kind, "belongs to an empty object wrapper");
    }
    WireValue result = context_->call_object_method(handle_, method, to_kwargs(args, *context_));
    return from_wire(result, *context_);
}

std::future<Arg> NativeObject::call_async(const std::string& method, const Args& args, const CallOptions& options) {
    if (!context_) {
        throw BridgeError::invalid_handle(handle_.handle, handle_.kind, "belongs to an empty object wrapper");
    }
    BridgeContext* context = context_;
    CallHandle handle = context->call_object_method_async(handle_, method, to_kwargs(args, *context));
    return std::async(std::launch::deferred, [context, handle, options]() {
        return from_wire(await_outcome(*context, handle, options), *context);
    });
}

NativeObject NativeObject::call_object(const std::string& method, const Args& args) {
    Arg result = call(method, args);
    auto h = std::get_if<ObjectHandle>(&result);
    if (!h) {
        throw BridgeError(ErrorKind::UnsupportedValueKind,
            method + " returned " + arg_to_string(result) + " instead of an object");
    }
    return NativeObject(*context_, *h);
}

}  // namespace callbridge
