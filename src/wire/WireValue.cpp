#include "callbridge/WireValue.hpp"

#include <cstring>
#include <sstream>

namespace callbridge {

const char* object_kind_name(ObjectKind kind) {
    switch (kind) {
        case CALLBRIDGE_OBJECT_COLLECTOR:
            return "Collector";
        case CALLBRIDGE_OBJECT_FUNCTION_LOG:
            return "FunctionLog";
        case CALLBRIDGE_OBJECT_USAGE:
            return "Usage";
        case CALLBRIDGE_OBJECT_TYPE_BUILDER:
            return "TypeBuilder";
        case CALLBRIDGE_OBJECT_CLASS_BUILDER:
            return "ClassBuilder";
        case CALLBRIDGE_OBJECT_ENUM_BUILDER:
            return "EnumBuilder";
        case CALLBRIDGE_OBJECT_INVALID:
            break;
    }
    return "Invalid";
}

bool is_known_object_kind(uint8_t raw) {
    return raw >= CALLBRIDGE_OBJECT_COLLECTOR && raw <= CALLBRIDGE_OBJECT_ENUM_BUILDER;
}

bool WireFloat::operator==(const WireFloat& other) const {
    uint64_t a;
    uint64_t b;
    std::memcpy(&a, &value, sizeof(double));
    std::memcpy(&b, &other.value, sizeof(double));
    return a == b;
}

WireTag tag_of(const WireValue& value) {
    switch (value.index()) {
        case 0:
            return WireTag::Null;
        case 1:
            return WireTag::String;
        case 2:
            return WireTag::Int;
        case 3:
            return WireTag::Bool;
        case 4:
            return WireTag::Float;
        default:
            return WireTag::Object;
    }
}

const char* wire_tag_name(WireTag tag) {
    switch (tag) {
        case WireTag::Null:
            return "null";
        case WireTag::String:
            return "string";
        case WireTag::Int:
            return "int";
        case WireTag::Bool:
            return "bool";
        case WireTag::Float:
            return "float";
        case WireTag::Object:
            return "object";
    }
    return "unknown";
}

std::string wire_value_to_string(const WireValue& value) {
    std::ostringstream ss;
    if (std::holds_alternative<std::monostate>(value)) {
        ss << "null";
    } else if (auto s = std::get_if<std::string>(&value)) {
        ss << '"' << *s << '"';
    } else if (auto i = std::get_if<int64_t>(&value)) {
        ss << *i;
    } else if (auto b = std::get_if<bool>(&value)) {
        ss << (*b ? "true" : "false");
    } else if (auto f = std::get_if<WireFloat>(&value)) {
        ss << f->value;
    } else if (auto r = std::get_if<RawObjectRef>(&value)) {
        ss << "<" << object_kind_name(r->kind) << " 0x" << std::hex << r->pointer << ">";
    }
    return ss.str();
}

const WireValue* find_kwarg(const KwargsMap& kwargs, const std::string& key) {
    for (const auto& entry : kwargs) {
        if (entry.key == key) return &entry.value;
    }
    return nullptr;
}

}  // namespace callbridge
