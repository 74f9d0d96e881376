#include "callbridge/WireCodec.hpp"

#include <cstring>

#include "callbridge/BridgeError.hpp"

namespace callbridge {

// Smallest encoding of one kwargs entry: empty key (4) + null tag (1)
static const size_t MIN_KWARG_ENTRY_BYTES = 5;
// Smallest encoding of one env entry: two empty strings
static const size_t MIN_ENV_ENTRY_BYTES = 8;

static BridgeError malformed(const std::string& what) {
    return BridgeError(ErrorKind::MalformedMessage, what);
}

// ============================================================================
// ByteWriter
// ============================================================================

void ByteWriter::write_u8(uint8_t val) {
    data.push_back(val);
}

void ByteWriter::write_u32(uint32_t val) {
    data.push_back(static_cast<uint8_t>(val & 0xFF));
    data.push_back(static_cast<uint8_t>((val >> 8) & 0xFF));
    data.push_back(static_cast<uint8_t>((val >> 16) & 0xFF));
    data.push_back(static_cast<uint8_t>((val >> 24) & 0xFF));
}

void ByteWriter::write_u64(uint64_t val) {
    for (int i = 0; i < 8; i++) {
        data.push_back(static_cast<uint8_t>((val >> (i * 8)) & 0xFF));
    }
}

void ByteWriter::write_string(const std::string& str) {
    if (str.size() > WIRE_MAX_STRING_BYTES) {
        throw BridgeError(ErrorKind::InvalidArgument,
            "string of " + std::to_string(str.size()) + " bytes exceeds the wire limit");
    }
    write_u32(static_cast<uint32_t>(str.size()));
    data.insert(data.end(), str.begin(), str.end());
}

void ByteWriter::write_header(MessageKind kind) {
    write_u8(WIRE_FORMAT_VERSION);
    write_u8(static_cast<uint8_t>(kind));
}

void ByteWriter::write_raw_object(const RawObjectRef& ref) {
    write_u8(static_cast<uint8_t>(ref.kind));
    write_u64(ref.pointer);
}

void ByteWriter::write_value(const WireValue& value) {
    WireTag tag = tag_of(value);
    write_u8(static_cast<uint8_t>(tag));

    switch (tag) {
        case WireTag::Null:
            break;
        case WireTag::String:
            write_string(std::get<std::string>(value));
            break;
        case WireTag::Int:
            write_u64(static_cast<uint64_t>(std::get<int64_t>(value)));
            break;
        case WireTag::Bool:
            write_u8(std::get<bool>(value) ? 1 : 0);
            break;
        case WireTag::Float: {
            double d = std::get<WireFloat>(value).value;
            uint64_t bits;
            std::memcpy(&bits, &d, sizeof(double));
            write_u64(bits);
            break;
        }
        case WireTag::Object:
            write_raw_object(std::get<RawObjectRef>(value));
            break;
    }
}

void ByteWriter::write_kwargs(const KwargsMap& kwargs) {
    write_u32(static_cast<uint32_t>(kwargs.size()));
    for (const auto& entry : kwargs) {
        write_string(entry.key);
        write_value(entry.value);
    }
}

void ByteWriter::write_env(const EnvVars& env) {
    write_u32(static_cast<uint32_t>(env.size()));
    for (const auto& kv : env) {
        write_string(kv.first);
        write_string(kv.second);
    }
}

// ============================================================================
// ByteReader
// ============================================================================

void ByteReader::check_available(size_t n) {
    if (n > size - pos) {
        throw malformed("unexpected end of data (need " + std::to_string(n) + " bytes at offset " +
            std::to_string(pos) + ", have " + std::to_string(size - pos) + ")");
    }
}

uint8_t ByteReader::read_u8() {
    check_available(1);
    return data[pos++];
}

uint32_t ByteReader::read_u32() {
    check_available(4);
    uint32_t val = static_cast<uint32_t>(data[pos]) | (static_cast<uint32_t>(data[pos + 1]) << 8) |
        (static_cast<uint32_t>(data[pos + 2]) << 16) | (static_cast<uint32_t>(data[pos + 3]) << 24);
    pos += 4;
    return val;
}

uint64_t ByteReader::read_u64() {
    check_available(8);
    uint64_t val = 0;
    for (int i = 0; i < 8; i++) {
        val |= static_cast<uint64_t>(data[pos++]) << (i * 8);
    }
    return val;
}

std::string ByteReader::read_string() {
    uint32_t len = read_u32();
    if (len > WIRE_MAX_STRING_BYTES) {
        throw malformed("string too large (" + std::to_string(len) + " bytes)");
    }
    check_available(len);
    std::string str(reinterpret_cast<const char*>(data + pos), len);
    pos += len;
    return str;
}

void ByteReader::read_header(MessageKind expected) {
    uint8_t version = read_u8();
    if (version != WIRE_FORMAT_VERSION) {
        throw malformed("unsupported wire format version " + std::to_string(version));
    }
    uint8_t kind = read_u8();
    if (kind != static_cast<uint8_t>(expected)) {
        throw malformed("expected message kind " + std::to_string(static_cast<int>(expected)) + ", got " +
            std::to_string(kind));
    }
}

RawObjectRef ByteReader::read_raw_object() {
    uint8_t kind = read_u8();
    if (!is_known_object_kind(kind)) {
        throw malformed("unknown object kind " + std::to_string(kind));
    }
    RawObjectRef ref;
    ref.kind = static_cast<ObjectKind>(kind);
    ref.pointer = read_u64();
    return ref;
}

WireValue ByteReader::read_value() {
    uint8_t tag = read_u8();

    switch (static_cast<WireTag>(tag)) {
        case WireTag::Null:
            return std::monostate{};
        case WireTag::String:
            return read_string();
        case WireTag::Int:
            return static_cast<int64_t>(read_u64());
        case WireTag::Bool: {
            uint8_t b = read_u8();
            if (b > 1) throw malformed("invalid boolean byte " + std::to_string(b));
            return b == 1;
        }
        case WireTag::Float: {
            uint64_t bits = read_u64();
            double d;
            std::memcpy(&d, &bits, sizeof(double));
            return WireFloat{d};
        }
        case WireTag::Object:
            return read_raw_object();
    }

    throw BridgeError(ErrorKind::UnsupportedValueKind, "unknown value tag " + std::to_string(tag));
}

KwargsMap ByteReader::read_kwargs() {
    uint32_t count = read_u32();
    if (static_cast<uint64_t>(count) * MIN_KWARG_ENTRY_BYTES > remaining()) {
        throw malformed("kwargs count " + std::to_string(count) + " exceeds remaining data");
    }
    KwargsMap kwargs;
    kwargs.reserve(count);
    for (uint32_t i = 0; i < count; i++) {
        MapEntry entry;
        entry.key = read_string();
        entry.value = read_value();
        kwargs.push_back(std::move(entry));
    }
    return kwargs;
}

EnvVars ByteReader::read_env() {
    uint32_t count = read_u32();
    if (static_cast<uint64_t>(count) * MIN_ENV_ENTRY_BYTES > remaining()) {
        throw malformed("env count " + std::to_string(count) + " exceeds remaining data");
    }
    EnvVars env;
    env.reserve(count);
    for (uint32_t i = 0; i < count; i++) {
        std::string key = read_string();
        std::string value = read_string();
        env.emplace_back(std::move(key), std::move(value));
    }
    return env;
}

void ByteReader::expect_end() {
    if (pos != size) {
        throw malformed(std::to_string(size - pos) + " trailing bytes after message");
    }
}

// ============================================================================
// Message encode / decode
// ============================================================================

namespace wire {

Bytes encode(const WireValue& value) {
    ByteWriter w;
    w.write_header(MessageKind::Value);
    w.write_value(value);
    return std::move(w.data);
}

Bytes encode(const KwargsMap& kwargs) {
    ByteWriter w;
    w.write_header(MessageKind::Kwargs);
    w.write_kwargs(kwargs);
    return std::move(w.data);
}

Bytes encode(const RawObjectRef& ref) {
    ByteWriter w;
    w.write_header(MessageKind::RawObject);
    w.write_raw_object(ref);
    return std::move(w.data);
}

Bytes encode(const FunctionCallRequest& request) {
    ByteWriter w;
    w.write_header(MessageKind::FunctionCall);
    w.write_string(request.function_name);
    w.write_kwargs(request.kwargs);
    w.write_env(request.env);
    return std::move(w.data);
}

Bytes encode(const ObjectConstructorRequest& request) {
    ByteWriter w;
    w.write_header(MessageKind::ObjectConstructor);
    w.write_u8(static_cast<uint8_t>(request.kind));
    w.write_kwargs(request.kwargs);
    return std::move(w.data);
}

Bytes encode(const ObjectMethodRequest& request) {
    ByteWriter w;
    w.write_header(MessageKind::ObjectMethod);
    w.write_raw_object(request.object);
    w.write_string(request.method_name);
    w.write_kwargs(request.kwargs);
    return std::move(w.data);
}

// Each decoder builds into locals and only returns once the whole buffer has
// been consumed, so a failure never leaves a half-filled result behind.

WireValue decode_value(const uint8_t* data, size_t size) {
    ByteReader r(data, size);
    r.read_header(MessageKind::Value);
    WireValue value = r.read_value();
    r.expect_end();
    return value;
}

KwargsMap decode_kwargs(const uint8_t* data, size_t size) {
    ByteReader r(data, size);
    r.read_header(MessageKind::Kwargs);
    KwargsMap kwargs = r.read_kwargs();
    r.expect_end();
    return kwargs;
}

RawObjectRef decode_raw_object(const uint8_t* data, size_t size) {
    ByteReader r(data, size);
    r.read_header(MessageKind::RawObject);
    RawObjectRef ref = r.read_raw_object();
    r.expect_end();
    return ref;
}

FunctionCallRequest decode_function_call(const uint8_t* data, size_t size) {
    ByteReader r(data, size);
    r.read_header(MessageKind::FunctionCall);
    FunctionCallRequest request;
    request.function_name = r.read_string();
    request.kwargs = r.read_kwargs();
    request.env = r.read_env();
    r.expect_end();
    return request;
}

ObjectConstructorRequest decode_object_constructor(const uint8_t* data, size_t size) {
    ByteReader r(data, size);
    r.read_header(MessageKind::ObjectConstructor);
    uint8_t kind = r.read_u8();
    if (!is_known_object_kind(kind)) {
        throw malformed("unknown object kind " + std::to_string(kind));
    }
    ObjectConstructorRequest request;
    request.kind = static_cast<ObjectKind>(kind);
    request.kwargs = r.read_kwargs();
    r.expect_end();
    return request;
}

ObjectMethodRequest decode_object_method(const uint8_t* data, size_t size) {
    ByteReader r(data, size);
    r.read_header(MessageKind::ObjectMethod);
    ObjectMethodRequest request;
    request.object = r.read_raw_object();
    request.method_name = r.read_string();
    request.kwargs = r.read_kwargs();
    r.expect_end();
    return request;
}

}  // namespace wire

}  // namespace callbridge
