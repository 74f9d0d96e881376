#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "callbridge/WireValue.hpp"

namespace callbridge {

// Wire format version carried in every message header
constexpr uint8_t WIRE_FORMAT_VERSION = 1;

constexpr uint32_t WIRE_MAX_STRING_BYTES = 16u * 1024u * 1024u;

enum class MessageKind : uint8_t {
    FunctionCall = 1,
    ObjectConstructor = 2,
    ObjectMethod = 3,
    RawObject = 4,
    Kwargs = 5,
    Value = 6,
};

// Little-endian writer
class ByteWriter {
   public:
    Bytes data;

    void write_u8(uint8_t val);
    void write_u32(uint32_t val);
    void write_u64(uint64_t val);
    void write_string(const std::string& str);

    void write_header(MessageKind kind);
    void write_value(const WireValue& value);
    void write_raw_object(const RawObjectRef& ref);
    void write_kwargs(const KwargsMap& kwargs);
    void write_env(const EnvVars& env);
};

// Bounds-checked reader. Every read throws BridgeError(MalformedMessage)
// instead of running past the end of the buffer.
class ByteReader {
   public:
    ByteReader(const uint8_t* d, size_t s) : data(d), size(s) {}
    explicit ByteReader(const Bytes& bytes) : data(bytes.data()), size(bytes.size()) {}

    uint8_t read_u8();
    uint32_t read_u32();
    uint64_t read_u64();
    std::string read_string();

    void read_header(MessageKind expected);
    WireValue read_value();
    RawObjectRef read_raw_object();
    KwargsMap read_kwargs();
    EnvVars read_env();

    // Throws unless every byte has been consumed.
    void expect_end();

    size_t remaining() const { return size - pos; }

   private:
    void check_available(size_t n);

    const uint8_t* data;
    size_t size;
    size_t pos = 0;
};

namespace wire {

Bytes encode(const WireValue& value);
Bytes encode(const KwargsMap& kwargs);
Bytes encode(const RawObjectRef& ref);
Bytes encode(const FunctionCallRequest& request);
Bytes encode(const ObjectConstructorRequest& request);
Bytes encode(const ObjectMethodRequest& request);

WireValue decode_value(const uint8_t* data, size_t size);
KwargsMap decode_kwargs(const uint8_t* data, size_t size);
RawObjectRef decode_raw_object(const uint8_t* data, size_t size);
FunctionCallRequest decode_function_call(const uint8_t* data, size_t size);
ObjectConstructorRequest decode_object_constructor(const uint8_t* data, size_t size);
ObjectMethodRequest decode_object_method(const uint8_t* data, size_t size);

inline WireValue decode_value(const Bytes& b) { return decode_value(b.data(), b.size()); }
inline KwargsMap decode_kwargs(const Bytes& b) { return decode_kwargs(b.data(), b.size()); }
inline RawObjectRef decode_raw_object(const Bytes& b) { return decode_raw_object(b.data(), b.size()); }
inline FunctionCallRequest decode_function_call(const Bytes& b) { return decode_function_call(b.data(), b.size()); }
inline ObjectConstructorRequest decode_object_constructor(const Bytes& b) {
    return decode_object_constructor(b.data(), b.size());
}
inline ObjectMethodRequest decode_object_method(const Bytes& b) { return decode_object_method(b.data(), b.size()); }

}  // namespace wire

}  // namespace callbridge
