#pragma once

#include <chrono>
#include <functional>
#include <future>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "callbridge/BridgeContext.hpp"
#include "callbridge/Cancellation.hpp"

namespace callbridge {

// Host-side argument value. Objects travel as handles, never as pointers.
using Arg = std::variant<std::monostate, std::string, int64_t, bool, double, ObjectHandle>;

struct NamedArg {
    std::string name;
    Arg value;
};

using Args = std::vector<NamedArg>;

// Object handles are checked against the registry; a disposed handle raises
// InvalidHandle before anything is encoded.
KwargsMap to_kwargs(const Args& args, const BridgeContext& context);

// Any range of (name, Arg) pairs, e.g. std::map<std::string, Arg>. Keeps the
// range's iteration order.
template <typename PairRange>
Args to_args(const PairRange& pairs) {
    Args out;
    for (const auto& kv : pairs) {
        out.push_back(NamedArg{kv.first, Arg{kv.second}});
    }
    return out;
}

template <typename PairRange>
KwargsMap to_kwargs(const PairRange& pairs, const BridgeContext& context) {
    return to_kwargs(to_args(pairs), context);
}

// The first occurrence of a repeated name wins.
std::map<std::string, Arg> to_map(const Args& args);

// References must name live handles of this context.
Arg from_wire(const WireValue& value, const BridgeContext& context);
Args from_kwargs(const KwargsMap& kwargs, const BridgeContext& context);

std::string arg_to_string(const Arg& value);

struct CallOptions {
    EnvVars env;
    CancellationToken token;

    // Zero waits forever. On expiry the call is cancelled like any other.
    std::chrono::milliseconds timeout{0};
};

// Waits for the outcome, forwarding token cancellation and the timeout to the
// context. Raises the failure as BridgeError.
WireValue await_outcome(BridgeContext& context, const CallHandle& handle, const CallOptions& options);

class NativeObject;

/**
 * BridgeClient - typed entry point for host code
 *
 * Converts Args to wire kwargs, runs interceptors and waits on the outcome.
 * It keeps no call state of its own; everything lives in the context.
 */
class BridgeClient {
   public:
    using RequestInterceptor = std::function<void(const std::string& function_name, Args& args)>;
    using ResponseInterceptor = std::function<void(const std::string& function_name, const Arg& result)>;
    using ChunkSink = std::function<void(const Arg& chunk)>;

    explicit BridgeClient(BridgeContext& context) : context_(context) {}

    Arg call(const std::string& function_name, const Args& args = {}, const CallOptions& options = {});

    // The request is submitted before this returns; get() on the future is
    // the only place the caller waits.
    std::future<Arg> call_async(const std::string& function_name, const Args& args = {},
        const CallOptions& options = {});

    Arg parse(const std::string& function_name, const Args& args = {}, const CallOptions& options = {});

    // on_chunk runs on the callback dispatch thread. A chunk handler that
    // throws fails the call.
    Arg stream(const std::string& function_name, const Args& args, ChunkSink on_chunk,
        const CallOptions& options = {}, std::function<void()> on_tick = nullptr);

    NativeObject construct(ObjectKind kind, const Args& args = {});
    NativeObject create_collector(const std::string& name);
    NativeObject create_type_builder();

    void add_request_interceptor(RequestInterceptor interceptor);
    void add_response_interceptor(ResponseInterceptor interceptor);

    // Values shared by whoever holds the client, e.g. interceptors. Never sent
    // to the runtime.
    void set_value(const std::string& key, Arg value);
    Arg get_value(const std::string& key) const;  // null when absent
    std::optional<Arg> try_get_value(const std::string& key) const;
    bool contains_value(const std::string& key) const;
    void clear_values();

    BridgeContext& context() { return context_; }

   private:
    Args intercept_request(const std::string& function_name, const Args& args);
    void intercept_response(const std::string& function_name, const Arg& result);
    CallHandle submit(Selector selector, const std::string& function_name, const Args& args,
        const CallOptions& options, PartialSink on_partial = nullptr, TickSink on_tick = nullptr);
    Arg finish(const std::string& function_name, const CallHandle& handle, const CallOptions& options);

    BridgeContext& context_;

    std::mutex interceptors_mutex_;
    std::vector<RequestInterceptor> request_interceptors_;
    std::vector<ResponseInterceptor> response_interceptors_;

    mutable std::mutex values_mutex_;
    std::map<std::string, Arg> values_;
};

// Owns one native object. Disposes it on destruction; the context must
// outlive the wrapper.
class NativeObject {
   public:
    NativeObject() = default;
    NativeObject(BridgeContext& context, ObjectHandle handle) : context_(&context), handle_(handle) {}
    ~NativeObject();

    NativeObject(NativeObject&& other) noexcept;
    NativeObject& operator=(NativeObject&& other) noexcept;

    NativeObject(const NativeObject&) = delete;
    NativeObject& operator=(const NativeObject&) = delete;

    Arg call(const std::string& method, const Args& args = {});
    std::future<Arg> call_async(const std::string& method, const Args& args = {}, const CallOptions& options = {});

    // For methods that hand back a new object owned by the caller.
    NativeObject call_object(const std::string& method, const Args& args = {});

    // Idempotent.
    void dispose();

    bool valid() const;
    const ObjectHandle& handle() const { return handle_; }
    ObjectKind kind() const { return handle_.kind; }

   private:
    BridgeContext* context_ = nullptr;
    ObjectHandle handle_;
};

}  // namespace callbridge
