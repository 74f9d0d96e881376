#pragma once

#include <cstdint>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include "callbridge/callbridge_abi.h"

namespace callbridge {

using Bytes = std::vector<uint8_t>;
using ObjectKind = callbridge_object_kind;

const char* object_kind_name(ObjectKind kind);
bool is_known_object_kind(uint8_t raw);

// (kind, native pointer). The pointer is a lookup key only.
struct RawObjectRef {
    ObjectKind kind = CALLBRIDGE_OBJECT_INVALID;
    uint64_t pointer = 0;

    bool operator==(const RawObjectRef& other) const {
        return kind == other.kind && pointer == other.pointer;
    }
    bool operator!=(const RawObjectRef& other) const { return !(*this == other); }
};

// Float payload compared by bit pattern so NaN values round-trip equal.
struct WireFloat {
    double value = 0.0;

    WireFloat() = default;
    WireFloat(double v) : value(v) {}

    bool operator==(const WireFloat& other) const;
    bool operator!=(const WireFloat& other) const { return !(*this == other); }
};

// Tagged union. The variant index is the tag.
using WireValue = std::variant<std::monostate, std::string, int64_t, bool, WireFloat, RawObjectRef>;

enum class WireTag : uint8_t {
    Null = 0x00,
    String = 0x01,
    Int = 0x02,
    Bool = 0x03,
    Float = 0x04,
    Object = 0x05,
};

WireTag tag_of(const WireValue& value);
const char* wire_tag_name(WireTag tag);
std::string wire_value_to_string(const WireValue& value);

struct MapEntry {
    std::string key;
    WireValue value;

    bool operator==(const MapEntry& other) const { return key == other.key && value == other.value; }
    bool operator!=(const MapEntry& other) const { return !(*this == other); }
};

using KwargsMap = std::vector<MapEntry>;
using EnvVars = std::vector<std::pair<std::string, std::string>>;

struct FunctionCallRequest {
    std::string function_name;
    KwargsMap kwargs;
    EnvVars env;

    bool operator==(const FunctionCallRequest& other) const {
        return function_name == other.function_name && kwargs == other.kwargs && env == other.env;
    }
};

struct ObjectConstructorRequest {
    ObjectKind kind = CALLBRIDGE_OBJECT_INVALID;
    KwargsMap kwargs;

    bool operator==(const ObjectConstructorRequest& other) const {
        return kind == other.kind && kwargs == other.kwargs;
    }
};

struct ObjectMethodRequest {
    RawObjectRef object;
    std::string method_name;
    KwargsMap kwargs;

    bool operator==(const ObjectMethodRequest& other) const {
        return object == other.object && method_name == other.method_name && kwargs == other.kwargs;
    }
};

// Linear lookup; returns nullptr when the key is absent. First match wins.
const WireValue* find_kwarg(const KwargsMap& kwargs, const std::string& key);

}  // namespace callbridge
