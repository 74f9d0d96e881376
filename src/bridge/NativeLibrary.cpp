#include "callbridge/NativeLibrary.hpp"

#include "callbridge/BridgeError.hpp"
#include "callbridge/Log.hpp"

#ifdef _WIN32
#include <windows.h>
#else
#include <dlfcn.h>
#endif

namespace callbridge {

static void close_library(void* handle) {
    if (!handle) return;
#ifdef _WIN32
    FreeLibrary(static_cast<HMODULE>(handle));
#else
    dlclose(handle);
#endif
}

NativeLibrary::NativeLibrary(const std::string& path) : path_(path) {
    // Load the shared library
#ifdef _WIN32
    HMODULE handle = LoadLibraryA(path.c_str());
    if (!handle) {
        DWORD err = GetLastError();
        throw BridgeError(ErrorKind::NativeFailure,
            "failed to load native runtime: " + path + " (Error: " + std::to_string(err) + ")");
    }

    auto entry = (callbridge_native_entry_func)GetProcAddress(handle, CALLBRIDGE_NATIVE_ENTRY_SYMBOL);
    handle_ = handle;
#else
    void* handle = dlopen(path.c_str(), RTLD_NOW | RTLD_LOCAL);
    if (!handle) {
        throw BridgeError(ErrorKind::NativeFailure,
            std::string("failed to load native runtime: ") + path + " (" + dlerror() + ")");
    }
    handle_ = handle;

    dlerror();  // Clear any existing error

    auto entry = (callbridge_native_entry_func)dlsym(handle, CALLBRIDGE_NATIVE_ENTRY_SYMBOL);

    const char* dlsym_error = dlerror();
    if (dlsym_error) {
        close_library(handle_);
        handle_ = nullptr;
        throw BridgeError(ErrorKind::NativeFailure,
            std::string("failed to find ") + CALLBRIDGE_NATIVE_ENTRY_SYMBOL + ": " + dlsym_error);
    }
#endif

    if (!entry) {
        close_library(handle_);
        handle_ = nullptr;
        throw BridgeError(ErrorKind::NativeFailure,
            std::string("native runtime missing ") + CALLBRIDGE_NATIVE_ENTRY_SYMBOL + ": " + path);
    }

    api_ = entry();
    if (!api_) {
        close_library(handle_);
        handle_ = nullptr;
        throw BridgeError(ErrorKind::NativeFailure, "native runtime returned no API table: " + path);
    }

    CALLBRIDGE_DEBUG("native", "loaded " << path << " (ABI " << (api_->abi_version >> 16) << "."
            << ((api_->abi_version >> 8) & 0xFF) << ")");
}

NativeLibrary::~NativeLibrary() {
    close_library(handle_);
}

std::string NativeLibrary::platform_file_name(const std::string& base_name) {
#if defined(_WIN32)
    return base_name + ".dll";
#elif defined(__APPLE__)
    return "lib" + base_name + ".dylib";
#else
    return "lib" + base_name + ".so";
#endif
}

}  // namespace callbridge
