// Shared-module entry point for the loopback runtime, loadable through
// NativeLibrary like any other runtime library.
#include "callbridge/LoopbackRuntime.hpp"

extern "C" CALLBRIDGE_NATIVE_INIT() {
    return callbridge_loopback_api();
}
