#pragma once

#include <string>

#include "callbridge/callbridge_abi.h"

namespace callbridge {

// A dynamically loaded runtime library. Unloaded on destruction, so it must
// outlive every BridgeContext built from its API table.
class NativeLibrary {
   public:
    explicit NativeLibrary(const std::string& path);
    ~NativeLibrary();

    NativeLibrary(const NativeLibrary&) = delete;
    NativeLibrary& operator=(const NativeLibrary&) = delete;

    const callbridge_native_api* api() const { return api_; }
    const std::string& path() const { return path_; }

    // Platform file name for a library base name, e.g. "foo" -> "libfoo.so".
    static std::string platform_file_name(const std::string& base_name);

   private:
    std::string path_;
    void* handle_ = nullptr;
    const callbridge_native_api* api_ = nullptr;
};

}  // namespace callbridge
