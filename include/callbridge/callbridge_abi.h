// callbridge_abi.h - callbridge Native Runtime ABI v1.0.0
//
// This header is the stable C boundary between the host-side bridge and a
// natively-compiled runtime. A runtime library exports a single symbol,
// callbridge_native_api_v1, returning a table of entry points.
// Only flat byte buffers and integers cross this boundary.

#ifndef CALLBRIDGE_ABI_H
#define CALLBRIDGE_ABI_H

#include <stdbool.h>
#include <stddef.h>
#include <stdint.h>

#ifdef __cplusplus
extern "C" {
#endif

// ============================================================================
// Version Information
// ============================================================================

#define CALLBRIDGE_ABI_VERSION_MAJOR 1
#define CALLBRIDGE_ABI_VERSION_MINOR 0
#define CALLBRIDGE_ABI_VERSION_PATCH 0

#define CALLBRIDGE_ABI_VERSION \
    ((CALLBRIDGE_ABI_VERSION_MAJOR << 16) | (CALLBRIDGE_ABI_VERSION_MINOR << 8) | CALLBRIDGE_ABI_VERSION_PATCH)

// ============================================================================
// Opaque Handle Types
// ============================================================================

// A runtime instance created by create_runtime. Never dereferenced by the host.
typedef struct callbridge_runtime_s* callbridge_runtime;

// ============================================================================
// Status Codes
// ============================================================================

typedef enum {
    CALLBRIDGE_OK = 0,
    CALLBRIDGE_INVALID_ARG,
    CALLBRIDGE_MALFORMED_MESSAGE,
    CALLBRIDGE_UNSUPPORTED_VALUE_KIND,
    CALLBRIDGE_INVALID_HANDLE,
    CALLBRIDGE_UNKNOWN_FUNCTION,
    CALLBRIDGE_UNKNOWN_METHOD,
    CALLBRIDGE_UNSUPPORTED_OBJECT,
    CALLBRIDGE_GENERIC_FAILURE,
    CALLBRIDGE_CANCELLED,
    CALLBRIDGE_CLOSING,
} callbridge_status;

// Status carried by the reverse callback for one call-ID.
typedef enum {
    CALLBRIDGE_CALL_SUCCESS = 0,
    CALLBRIDGE_CALL_ERROR = 1,
    CALLBRIDGE_CALL_CANCELLED = 2,
} callbridge_call_status;

// Object families a runtime can construct. 0 is never a valid kind.
typedef enum {
    CALLBRIDGE_OBJECT_INVALID = 0,
    CALLBRIDGE_OBJECT_COLLECTOR = 1,
    CALLBRIDGE_OBJECT_FUNCTION_LOG = 2,
    CALLBRIDGE_OBJECT_USAGE = 3,
    CALLBRIDGE_OBJECT_TYPE_BUILDER = 4,
    CALLBRIDGE_OBJECT_CLASS_BUILDER = 5,
    CALLBRIDGE_OBJECT_ENUM_BUILDER = 6,
} callbridge_object_kind;

// ============================================================================
// Buffers
// ============================================================================

// A buffer allocated by the runtime. The host copies it and hands it back
// through free_buffer. data may be NULL when length is 0.
typedef struct {
    uint8_t* data;
    size_t length;
} callbridge_buffer;

// ============================================================================
// Callback Signatures (runtime -> host)
// ============================================================================

// Delivered from any runtime thread. is_done == 0 marks a partial (streaming)
// result; exactly one is_done != 0 delivery ends the call. For
// CALLBRIDGE_CALL_ERROR the payload is a UTF-8 diagnostic. The payload is only
// valid for the duration of the callback.
typedef void (*callbridge_result_callback)(
    void* user_data,
    uint32_t call_id,
    int is_done,
    callbridge_call_status status,
    const uint8_t* data,
    size_t length);

// Progress notification for streaming calls.
typedef void (*callbridge_tick_callback)(
    void* user_data,
    uint32_t call_id);

// ============================================================================
// Core API Structure
// ============================================================================

typedef struct callbridge_native_api_s {
    uint32_t abi_version;

    // Owned by the runtime library; never freed by the host.
    const char* (*version)(void);

    // ------------------------------------------------------------------------
    // Runtime Lifecycle
    // ------------------------------------------------------------------------

    // src_files_json: {"relative/path": "contents", ...}
    // env_vars_json:  {"KEY": "VALUE", ...}
    callbridge_status (*create_runtime)(const char* root_path,
        const char* src_files_json,
        const char* env_vars_json,
        callbridge_result_callback on_result,
        callbridge_tick_callback on_tick,
        void* user_data,
        callbridge_runtime* result,
        callbridge_buffer* error);

    // Cancels in-flight work and waits for it to finish. Every pending call
    // receives its final callback before this returns.
    void (*destroy_runtime)(callbridge_runtime runtime);

    // ------------------------------------------------------------------------
    // Function Calls (asynchronous, completion via on_result)
    // ------------------------------------------------------------------------

    callbridge_status (*call_function)(callbridge_runtime runtime,
        const uint8_t* request, size_t length,
        uint32_t call_id,
        callbridge_buffer* error);

    callbridge_status (*call_function_parse)(callbridge_runtime runtime,
        const uint8_t* request, size_t length,
        uint32_t call_id,
        callbridge_buffer* error);

    callbridge_status (*call_function_stream)(callbridge_runtime runtime,
        const uint8_t* request, size_t length,
        uint32_t call_id,
        callbridge_buffer* error);

    // Advisory. *cancelled is set to true when the call was still running.
    callbridge_status (*cancel_function_call)(callbridge_runtime runtime,
        uint32_t call_id,
        bool* cancelled);

    // ------------------------------------------------------------------------
    // Objects
    // ------------------------------------------------------------------------

    callbridge_status (*call_object_constructor)(callbridge_runtime runtime,
        const uint8_t* request, size_t length,
        callbridge_buffer* result,
        callbridge_buffer* error);

    callbridge_status (*call_object_method)(callbridge_runtime runtime,
        const uint8_t* request, size_t length,
        callbridge_buffer* result,
        callbridge_buffer* error);

    callbridge_status (*call_object_method_async)(callbridge_runtime runtime,
        const uint8_t* request, size_t length,
        uint32_t call_id,
        callbridge_buffer* error);

    // raw_object is an encoded raw object reference message.
    callbridge_status (*destroy_object)(callbridge_runtime runtime,
        const uint8_t* raw_object, size_t length,
        callbridge_buffer* error);

    void (*free_buffer)(callbridge_buffer buffer);
} callbridge_native_api;

// Every runtime library must export this function.
typedef const callbridge_native_api* (*callbridge_native_entry_func)(void);

#define CALLBRIDGE_NATIVE_ENTRY_SYMBOL "callbridge_native_api_v1"

// Platform-specific export macro
#ifdef _WIN32
#define CALLBRIDGE_NATIVE_EXPORT __declspec(dllexport)
#else
#define CALLBRIDGE_NATIVE_EXPORT __attribute__((visibility("default")))
#endif

// Runtime entry macro
#define CALLBRIDGE_NATIVE_INIT()                            \
    CALLBRIDGE_NATIVE_EXPORT const callbridge_native_api* \
    callbridge_native_api_v1(void)

#ifdef __cplusplus
}
#endif

#endif  // CALLBRIDGE_ABI_H
