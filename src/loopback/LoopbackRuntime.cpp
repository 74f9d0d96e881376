#include "callbridge/LoopbackRuntime.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstring>
#include <deque>
#include <map>
#include <mutex>
#include <nlohmann/json.hpp>
#include <string>
#include <thread>
#include <unordered_map>

#include "LoopbackObjects.hpp"
#include "callbridge/BridgeError.hpp"
#include "callbridge/WireCodec.hpp"
#include "uv.h"

#ifndef CALLBRIDGE_VERSION
#define CALLBRIDGE_VERSION "dev"
#endif

using json = nlohmann::json;
using namespace callbridge;
using callbridge::loopback::Failure;

// ============================================================================
// Runtime State
// ============================================================================

namespace {

enum class JobKind {
    Function,
    Parse,
    Stream,
    Method,
};

struct Job {
    callbridge_runtime runtime = nullptr;
    uint32_t call_id = 0;
    JobKind kind = JobKind::Function;
    FunctionCallRequest function;
    ObjectMethodRequest method;
    bool cancelled = false;  // guarded by the runtime's calls_mutex
    uv_work_t req;
};

struct Outcome {
    callbridge_call_status status = CALLBRIDGE_CALL_SUCCESS;
    Bytes payload;
};

}  // namespace

struct callbridge_runtime_s {
    std::string root_path;
    std::map<std::string, std::string> files;
    std::map<std::string, std::string> env;

    callbridge_result_callback on_result = nullptr;
    callbridge_tick_callback on_tick = nullptr;
    void* user_data = nullptr;

    // Loop thread owns the loop; submissions reach it through wake.
    uv_loop_t* loop = nullptr;
    uv_async_t wake;
    std::thread loop_thread;

    std::mutex submit_mutex;
    std::deque<Job*> submissions;
    bool closing = false;

    std::mutex calls_mutex;
    std::condition_variable calls_cv;
    std::unordered_map<uint32_t, Job*> calls;

    loopback::ObjectTable objects;
};

// ============================================================================
// Helpers
// ============================================================================

static callbridge_buffer make_buffer(const uint8_t* data, size_t length) {
    callbridge_buffer buf{nullptr, 0};
    if (length == 0) return buf;
    buf.data = new uint8_t[length];
    std::memcpy(buf.data, data, length);
    buf.length = length;
    return buf;
}

static void set_error(callbridge_buffer* error, const std::string& message) {
    if (!error) return;
    *error = make_buffer(reinterpret_cast<const uint8_t*>(message.data()), message.size());
}

static void set_result(callbridge_buffer* result, const Bytes& bytes) {
    if (!result) return;
    *result = make_buffer(bytes.data(), bytes.size());
}

static callbridge_status status_for(const BridgeError& e) {
    switch (e.kind()) {
        case ErrorKind::MalformedMessage:
            return CALLBRIDGE_MALFORMED_MESSAGE;
        case ErrorKind::UnsupportedValueKind:
            return CALLBRIDGE_UNSUPPORTED_VALUE_KIND;
        default:
            return CALLBRIDGE_GENERIC_FAILURE;
    }
}

static Outcome success(const WireValue& value) {
    Outcome out;
    out.payload = wire::encode(value);
    return out;
}

static Outcome failure(const std::string& message) {
    Outcome out;
    out.status = CALLBRIDGE_CALL_ERROR;
    out.payload.assign(message.begin(), message.end());
    return out;
}

static Outcome cancelled(uint32_t call_id) {
    Outcome out;
    out.status = CALLBRIDGE_CALL_CANCELLED;
    std::string msg = "call " + std::to_string(call_id) + " cancelled";
    out.payload.assign(msg.begin(), msg.end());
    return out;
}

static bool is_cancelled(callbridge_runtime rt, const Job& job) {
    std::lock_guard<std::mutex> lock(rt->calls_mutex);
    return job.cancelled;
}

static void deliver(callbridge_runtime rt, uint32_t call_id, bool done, const Outcome& out) {
    rt->on_result(rt->user_data, call_id, done ? 1 : 0, out.status, out.payload.data(), out.payload.size());
}

// Removes the call so later cancels report it finished, then sends the one
// final result.
static void finish(callbridge_runtime rt, Job& job, const Outcome& out) {
    {
        std::lock_guard<std::mutex> lock(rt->calls_mutex);
        rt->calls.erase(job.call_id);
    }
    deliver(rt, job.call_id, true, out);
}

// ============================================================================
// Functions
// ============================================================================

static bool is_known_function(const std::string& name) {
    return name == "echo" || name == "parse" || name == "sleep" || name == "fail" || name == "count" ||
        name == "source_file" || name == "env";
}

// Lenient: text that is not a JSON scalar comes back as the raw string.
static WireValue parse_text(const std::string& text) {
    json j = json::parse(text, nullptr, false);
    if (j.is_discarded()) return WireValue{text};
    if (j.is_null()) return WireValue{};
    if (j.is_boolean()) return WireValue{j.get<bool>()};
    if (j.is_number_integer()) return WireValue{j.get<int64_t>()};
    if (j.is_number_float()) return WireValue{WireFloat{j.get<double>()}};
    if (j.is_string()) return WireValue{j.get<std::string>()};
    throw Failure(CALLBRIDGE_GENERIC_FAILURE, "cannot parse a JSON " + std::string(j.type_name()) + " into a value");
}

static void record_in_collector(callbridge_runtime rt, const FunctionCallRequest& request) {
    const WireValue* v = find_kwarg(request.kwargs, "collector");
    const RawObjectRef* ref = v ? std::get_if<RawObjectRef>(v) : nullptr;
    if (!ref) return;

    auto object = rt->objects.find(*ref);
    auto* collector = dynamic_cast<loopback::Collector*>(object.get());
    if (!collector) {
        throw Failure(CALLBRIDGE_INVALID_ARG, "'collector' argument is not a Collector");
    }

    loopback::LogRecord rec;
    rec.function_name = request.function_name;
    for (const auto& entry : request.kwargs) {
        if (entry.key != "collector") rec.args.push_back(entry);
    }
    collector->record(std::move(rec));
}

static Outcome run_sleep(callbridge_runtime rt, Job& job) {
    int64_t ms = loopback::int_arg(job.function.kwargs, "ms", 0);
    std::unique_lock<std::mutex> lock(rt->calls_mutex);
    bool woke = rt->calls_cv.wait_for(lock, std::chrono::milliseconds(ms), [&job]() { return job.cancelled; });
    lock.unlock();
    if (woke) return cancelled(job.call_id);
    return success(WireValue{ms});
}

static Outcome run_count(callbridge_runtime rt, Job& job) {
    int64_t to = loopback::int_arg(job.function.kwargs, "to", 3);
    int64_t delay = loopback::int_arg(job.function.kwargs, "delay_ms", 0);

    for (int64_t i = 1; i <= to; ++i) {
        if (delay > 0) {
            std::unique_lock<std::mutex> lock(rt->calls_mutex);
            rt->calls_cv.wait_for(lock, std::chrono::milliseconds(delay), [&job]() { return job.cancelled; });
        }
        if (is_cancelled(rt, job)) return cancelled(job.call_id);

        if (job.kind == JobKind::Stream) {
            if (rt->on_tick) rt->on_tick(rt->user_data, job.call_id);
            deliver(rt, job.call_id, false, success(WireValue{i}));
        }
    }
    return success(WireValue{to});
}

static Outcome run_function(callbridge_runtime rt, Job& job) {
    const FunctionCallRequest& req = job.function;
    record_in_collector(rt, req);

    if (job.kind == JobKind::Parse || req.function_name == "parse") {
        return success(parse_text(loopback::string_arg(req.kwargs, "text")));
    }
    if (req.function_name == "echo") {
        const WireValue* v = find_kwarg(req.kwargs, "value");
        return success(v ? *v : WireValue{});
    }
    if (req.function_name == "sleep") {
        return run_sleep(rt, job);
    }
    if (req.function_name == "fail") {
        const WireValue* v = find_kwarg(req.kwargs, "message");
        const std::string* s = v ? std::get_if<std::string>(v) : nullptr;
        return failure(s ? *s : "requested failure");
    }
    if (req.function_name == "count") {
        return run_count(rt, job);
    }
    if (req.function_name == "source_file") {
        const std::string& path = loopback::string_arg(req.kwargs, "path");
        auto it = rt->files.find(path);
        if (it == rt->files.end()) return failure("no source file '" + path + "'");
        return success(WireValue{it->second});
    }
    if (req.function_name == "env") {
        const std::string& name = loopback::string_arg(req.kwargs, "name");
        // Per-call variables shadow the runtime's.
        for (const auto& kv : req.env) {
            if (kv.first == name) return success(WireValue{kv.second});
        }
        auto it = rt->env.find(name);
        if (it != rt->env.end()) return success(WireValue{it->second});
        return success(WireValue{});
    }
    return failure("unknown function '" + req.function_name + "'");
}

// ============================================================================
// Worker Pool
// ============================================================================

static void run_job(uv_work_t* req) {
    Job* job = static_cast<Job*>(req->data);
    callbridge_runtime rt = job->runtime;

    if (is_cancelled(rt, *job)) {
        finish(rt, *job, cancelled(job->call_id));
        return;
    }

    Outcome out;
    try {
        if (job->kind == JobKind::Method) {
            auto object = rt->objects.find(job->method.object);
            out = success(object->call(rt->objects, job->method.method_name, job->method.kwargs));
        } else {
            out = run_function(rt, *job);
        }
    } catch (const std::exception& e) {
        out = failure(e.what());
    }
    finish(rt, *job, out);
}

static void after_job(uv_work_t* req, int status) {
    (void)status;
    delete static_cast<Job*>(req->data);
}

// Loop thread. uv_queue_work may only be called from here.
static void on_wake(uv_async_t* handle) {
    callbridge_runtime rt = static_cast<callbridge_runtime>(handle->data);

    std::deque<Job*> batch;
    bool closing = false;
    {
        std::lock_guard<std::mutex> lock(rt->submit_mutex);
        batch.swap(rt->submissions);
        closing = rt->closing;
    }

    for (Job* job : batch) {
        if (closing) {
            finish(rt, *job, cancelled(job->call_id));
            delete job;
            continue;
        }
        job->req.data = job;
        int r = uv_queue_work(rt->loop, &job->req, run_job, after_job);
        if (r != 0) {
            finish(rt, *job, failure(std::string("failed to queue work: ") + uv_strerror(r)));
            delete job;
        }
    }

    if (closing) {
        // Loop exits once queued work has run its after_job.
        uv_close(reinterpret_cast<uv_handle_t*>(&rt->wake), nullptr);
    }
}

static callbridge_status submit(callbridge_runtime rt, Job* job, callbridge_buffer* error) {
    {
        std::lock_guard<std::mutex> lock(rt->calls_mutex);
        if (rt->calls.count(job->call_id)) {
            set_error(error, "call id " + std::to_string(job->call_id) + " is already in flight");
            delete job;
            return CALLBRIDGE_INVALID_ARG;
        }
        rt->calls[job->call_id] = job;
    }

    std::lock_guard<std::mutex> lock(rt->submit_mutex);
    if (rt->closing) {
        {
            std::lock_guard<std::mutex> calls_lock(rt->calls_mutex);
            rt->calls.erase(job->call_id);
        }
        delete job;
        set_error(error, "runtime is shutting down");
        return CALLBRIDGE_CLOSING;
    }
    rt->submissions.push_back(job);
    uv_async_send(&rt->wake);
    return CALLBRIDGE_OK;
}

// ============================================================================
// API Implementation - Lifecycle
// ============================================================================

static const char* api_version(void) {
    return CALLBRIDGE_VERSION;
}

static bool parse_string_map(const char* text, std::map<std::string, std::string>& out, std::string& error) {
    if (!text || !*text) return true;
    try {
        json j = json::parse(text);
        if (!j.is_object()) {
            error = "expected a JSON object";
            return false;
        }
        for (auto it = j.begin(); it != j.end(); ++it) {
            if (!it.value().is_string()) {
                error = "value of '" + it.key() + "' is not a string";
                return false;
            }
            out[it.key()] = it.value().get<std::string>();
        }
        return true;
    } catch (const json::exception& e) {
        error = e.what();
        return false;
    }
}

static callbridge_status api_create_runtime(const char* root_path,
    const char* src_files_json,
    const char* env_vars_json,
    callbridge_result_callback on_result,
    callbridge_tick_callback on_tick,
    void* user_data,
    callbridge_runtime* result,
    callbridge_buffer* error) {
    if (!on_result || !result) {
        set_error(error, "create_runtime needs a result callback and an output pointer");
        return CALLBRIDGE_INVALID_ARG;
    }

    auto* rt = new callbridge_runtime_s;
    rt->root_path = root_path ? root_path : "";
    rt->on_result = on_result;
    rt->on_tick = on_tick;
    rt->user_data = user_data;

    std::string err;
    if (!parse_string_map(src_files_json, rt->files, err)) {
        set_error(error, "invalid source files: " + err);
        delete rt;
        return CALLBRIDGE_INVALID_ARG;
    }
    if (!parse_string_map(env_vars_json, rt->env, err)) {
        set_error(error, "invalid environment: " + err);
        delete rt;
        return CALLBRIDGE_INVALID_ARG;
    }

    rt->loop = new uv_loop_t;
    uv_loop_init(rt->loop);
    rt->wake.data = rt;
    uv_async_init(rt->loop, &rt->wake, on_wake);
    rt->loop_thread = std::thread([rt]() { uv_run(rt->loop, UV_RUN_DEFAULT); });

    *result = rt;
    return CALLBRIDGE_OK;
}

static void api_destroy_runtime(callbridge_runtime rt) {
    if (!rt) return;

    // Refuse new work first, then cancel everything already accepted.
    {
        std::lock_guard<std::mutex> lock(rt->submit_mutex);
        rt->closing = true;
        uv_async_send(&rt->wake);
    }

    {
        std::lock_guard<std::mutex> lock(rt->calls_mutex);
        for (auto& kv : rt->calls) {
            kv.second->cancelled = true;
        }
    }
    rt->calls_cv.notify_all();

    if (rt->loop_thread.joinable()) rt->loop_thread.join();

    uv_loop_close(rt->loop);
    delete rt->loop;
    rt->objects.clear();
    delete rt;
}

// ============================================================================
// API Implementation - Function Calls
// ============================================================================

static callbridge_status start_function(callbridge_runtime rt, JobKind kind, const uint8_t* request, size_t length,
    uint32_t call_id, callbridge_buffer* error) {
    if (!rt || call_id == 0) {
        set_error(error, "a runtime and a non-zero call id are required");
        return CALLBRIDGE_INVALID_ARG;
    }

    auto* job = new Job;
    job->runtime = rt;
    job->call_id = call_id;
    job->kind = kind;
    try {
        job->function = wire::decode_function_call(request, length);
    } catch (const BridgeError& e) {
        delete job;
        set_error(error, e.diagnostic());
        return status_for(e);
    }

    if (!is_known_function(job->function.function_name)) {
        set_error(error, "unknown function '" + job->function.function_name + "'");
        delete job;
        return CALLBRIDGE_UNKNOWN_FUNCTION;
    }

    return submit(rt, job, error);
}

static callbridge_status api_call_function(callbridge_runtime rt, const uint8_t* request, size_t length,
    uint32_t call_id, callbridge_buffer* error) {
    return start_function(rt, JobKind::Function, request, length, call_id, error);
}

static callbridge_status api_call_function_parse(callbridge_runtime rt, const uint8_t* request, size_t length,
    uint32_t call_id, callbridge_buffer* error) {
    return start_function(rt, JobKind::Parse, request, length, call_id, error);
}

static callbridge_status api_call_function_stream(callbridge_runtime rt, const uint8_t* request, size_t length,
    uint32_t call_id, callbridge_buffer* error) {
    return start_function(rt, JobKind::Stream, request, length, call_id, error);
}

static callbridge_status api_cancel_function_call(callbridge_runtime rt, uint32_t call_id, bool* cancelled) {
    if (!rt) return CALLBRIDGE_INVALID_ARG;

    bool hit = false;
    {
        std::lock_guard<std::mutex> lock(rt->calls_mutex);
        auto it = rt->calls.find(call_id);
        if (it != rt->calls.end() && !it->second->cancelled) {
            it->second->cancelled = true;
            hit = true;
        }
    }
    if (hit) rt->calls_cv.notify_all();
    if (cancelled) *cancelled = hit;
    return CALLBRIDGE_OK;
}

// ============================================================================
// API Implementation - Objects
// ============================================================================

static callbridge_status api_call_object_constructor(callbridge_runtime rt, const uint8_t* request, size_t length,
    callbridge_buffer* result, callbridge_buffer* error) {
    if (!rt) return CALLBRIDGE_INVALID_ARG;
    try {
        ObjectConstructorRequest req = wire::decode_object_constructor(request, length);
        auto object = rt->objects.construct(req.kind, req.kwargs);
        set_result(result, wire::encode(RawObjectRef{object->kind(), object->pointer()}));
        return CALLBRIDGE_OK;
    } catch (const BridgeError& e) {
        set_error(error, e.diagnostic());
        return status_for(e);
    } catch (const Failure& f) {
        set_error(error, f.what());
        return f.status;
    } catch (const std::exception& e) {
        set_error(error, e.what());
        return CALLBRIDGE_GENERIC_FAILURE;
    }
}

static callbridge_status api_call_object_method(callbridge_runtime rt, const uint8_t* request, size_t length,
    callbridge_buffer* result, callbridge_buffer* error) {
    if (!rt) return CALLBRIDGE_INVALID_ARG;
    try {
        ObjectMethodRequest req = wire::decode_object_method(request, length);
        auto object = rt->objects.find(req.object);
        WireValue value = object->call(rt->objects, req.method_name, req.kwargs);
        set_result(result, wire::encode(value));
        return CALLBRIDGE_OK;
    } catch (const BridgeError& e) {
        set_error(error, e.diagnostic());
        return status_for(e);
    } catch (const Failure& f) {
        set_error(error, f.what());
        return f.status;
    } catch (const std::exception& e) {
        set_error(error, e.what());
        return CALLBRIDGE_GENERIC_FAILURE;
    }
}

static callbridge_status api_call_object_method_async(callbridge_runtime rt, const uint8_t* request, size_t length,
    uint32_t call_id, callbridge_buffer* error) {
    if (!rt || call_id == 0) {
        set_error(error, "a runtime and a non-zero call id are required");
        return CALLBRIDGE_INVALID_ARG;
    }

    auto* job = new Job;
    job->runtime = rt;
    job->call_id = call_id;
    job->kind = JobKind::Method;
    try {
        job->method = wire::decode_object_method(request, length);
        rt->objects.find(job->method.object);
    } catch (const BridgeError& e) {
        delete job;
        set_error(error, e.diagnostic());
        return status_for(e);
    } catch (const Failure& f) {
        delete job;
        set_error(error, f.what());
        return f.status;
    }

    return submit(rt, job, error);
}

static callbridge_status api_destroy_object(callbridge_runtime rt, const uint8_t* raw_object, size_t length,
    callbridge_buffer* error) {
    if (!rt) return CALLBRIDGE_INVALID_ARG;
    try {
        rt->objects.destroy(wire::decode_raw_object(raw_object, length));
        return CALLBRIDGE_OK;
    } catch (const BridgeError& e) {
        set_error(error, e.diagnostic());
        return status_for(e);
    } catch (const Failure& f) {
        set_error(error, f.what());
        return f.status;
    }
}

static void api_free_buffer(callbridge_buffer buffer) {
    delete[] buffer.data;
}

// ============================================================================
// API Table
// ============================================================================

static callbridge_native_api g_api = {};
static std::once_flag g_api_once;

static void init_api_table() {
    g_api.abi_version = CALLBRIDGE_ABI_VERSION;
    g_api.version = api_version;
    g_api.create_runtime = api_create_runtime;
    g_api.destroy_runtime = api_destroy_runtime;
    g_api.call_function = api_call_function;
    g_api.call_function_parse = api_call_function_parse;
    g_api.call_function_stream = api_call_function_stream;
    g_api.cancel_function_call = api_cancel_function_call;
    g_api.call_object_constructor = api_call_object_constructor;
    g_api.call_object_method = api_call_object_method;
    g_api.call_object_method_async = api_call_object_method_async;
    g_api.destroy_object = api_destroy_object;
    g_api.free_buffer = api_free_buffer;
}

extern "C" const callbridge_native_api* callbridge_loopback_api(void) {
    std::call_once(g_api_once, init_api_table);
    return &g_api;
}
