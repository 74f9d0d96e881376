#include "LoopbackObjects.hpp"

#include <sstream>

namespace callbridge {
namespace loopback {

const std::string& string_arg(const KwargsMap& kwargs, const std::string& key) {
    const WireValue* v = find_kwarg(kwargs, key);
    const std::string* s = v ? std::get_if<std::string>(v) : nullptr;
    if (!s) {
        throw Failure(CALLBRIDGE_INVALID_ARG, "missing string argument '" + key + "'");
    }
    return *s;
}

int64_t int_arg(const KwargsMap& kwargs, const std::string& key, int64_t fallback) {
    const WireValue* v = find_kwarg(kwargs, key);
    if (!v || std::holds_alternative<std::monostate>(*v)) return fallback;
    const int64_t* i = std::get_if<int64_t>(v);
    if (!i) {
        throw Failure(CALLBRIDGE_INVALID_ARG, "argument '" + key + "' must be an integer");
    }
    return *i;
}

// ============================================================================
// Object / ObjectTable
// ============================================================================

WireValue Object::call(ObjectTable& table, const std::string& method, const KwargsMap& kwargs) {
    std::lock_guard<std::mutex> lock(mutex_);
    return invoke(table, method, kwargs);
}

Failure Object::unknown_method(const std::string& method) const {
    return Failure(CALLBRIDGE_UNKNOWN_METHOD,
        std::string(object_kind_name(kind_)) + " has no method '" + method + "'");
}

std::shared_ptr<Object> ObjectTable::construct(ObjectKind kind, const KwargsMap& kwargs) {
    std::shared_ptr<Object> object;
    switch (kind) {
        case CALLBRIDGE_OBJECT_COLLECTOR: {
            const WireValue* name = find_kwarg(kwargs, "name");
            const std::string* s = name ? std::get_if<std::string>(name) : nullptr;
            object = std::make_shared<Collector>(s ? *s : std::string("default"));
            break;
        }
        case CALLBRIDGE_OBJECT_TYPE_BUILDER:
            object = std::make_shared<TypeBuilder>();
            break;
        default:
            throw Failure(CALLBRIDGE_UNSUPPORTED_OBJECT,
                std::string("objects of kind ") + object_kind_name(kind) + " cannot be constructed directly");
    }
    add(object);
    return object;
}

RawObjectRef ObjectTable::add(std::shared_ptr<Object> object) {
    RawObjectRef ref{object->kind(), object->pointer()};
    std::lock_guard<std::mutex> lock(mutex_);
    objects_[ref.pointer] = std::move(object);
    return ref;
}

std::shared_ptr<Object> ObjectTable::find(const RawObjectRef& ref) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = objects_.find(ref.pointer);
    if (it == objects_.end() || it->second->kind() != ref.kind) {
        std::ostringstream ss;
        ss << object_kind_name(ref.kind) << " 0x" << std::hex << ref.pointer << " is not a live object";
        throw Failure(CALLBRIDGE_INVALID_HANDLE, ss.str());
    }
    return it->second;
}

void ObjectTable::destroy(const RawObjectRef& ref) {
    std::shared_ptr<Object> doomed = find(ref);
    std::lock_guard<std::mutex> lock(mutex_);
    objects_.erase(ref.pointer);
}

size_t ObjectTable::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return objects_.size();
}

void ObjectTable::clear() {
    std::unordered_map<uint64_t, std::shared_ptr<Object>> doomed;
    std::lock_guard<std::mutex> lock(mutex_);
    doomed.swap(objects_);
}

// ============================================================================
// FunctionLog
// ============================================================================

WireValue FunctionLog::invoke(ObjectTable&, const std::string& method, const KwargsMap& kwargs) {
    if (method == "function_name") {
        return WireValue{record_.function_name};
    }
    if (method == "arg_count") {
        return WireValue{static_cast<int64_t>(record_.args.size())};
    }
    if (method == "arg") {
        const WireValue* v = find_kwarg(record_.args, string_arg(kwargs, "name"));
        return v ? *v : WireValue{};
    }
    throw unknown_method(method);
}

// ============================================================================
// Collector
// ============================================================================

void Collector::record(LogRecord record) {
    std::lock_guard<std::mutex> lock(mutex_);
    logs_.push_back(std::move(record));
}

WireValue Collector::invoke(ObjectTable& table, const std::string& method, const KwargsMap& kwargs) {
    if (method == "name") {
        return WireValue{name_};
    }
    if (method == "count") {
        return WireValue{static_cast<int64_t>(logs_.size())};
    }
    if (method == "add") {
        LogRecord rec;
        rec.function_name = string_arg(kwargs, "function_name");
        for (const auto& entry : kwargs) {
            if (entry.key != "function_name") rec.args.push_back(entry);
        }
        logs_.push_back(std::move(rec));
        return WireValue{static_cast<int64_t>(logs_.size())};
    }
    if (method == "last") {
        if (logs_.empty()) return WireValue{};
        // Each call hands out a fresh FunctionLog owned by the caller.
        return WireValue{table.add(std::make_shared<FunctionLog>(logs_.back()))};
    }
    if (method == "clear") {
        logs_.clear();
        return WireValue{};
    }
    throw unknown_method(method);
}

// ============================================================================
// ClassBuilder / TypeBuilder
// ============================================================================

WireValue ClassBuilder::invoke(ObjectTable&, const std::string& method, const KwargsMap& kwargs) {
    std::lock_guard<std::mutex> lock(*shape_mutex_);
    if (method == "name") {
        return WireValue{shape_->name};
    }
    if (method == "property_count") {
        return WireValue{static_cast<int64_t>(shape_->properties.size())};
    }
    if (method == "add_property") {
        const std::string& name = string_arg(kwargs, "name");
        for (const auto& p : shape_->properties) {
            if (p == name) {
                throw Failure(CALLBRIDGE_INVALID_ARG, "class " + shape_->name + " already has property " + name);
            }
        }
        shape_->properties.push_back(name);
        return WireValue{static_cast<int64_t>(shape_->properties.size())};
    }
    throw unknown_method(method);
}

WireValue TypeBuilder::invoke(ObjectTable& table, const std::string& method, const KwargsMap& kwargs) {
    if (method == "add_class") {
        const std::string& name = string_arg(kwargs, "name");
        std::shared_ptr<ClassShape> shape;
        {
            std::lock_guard<std::mutex> lock(*shapes_mutex_);
            for (const auto& c : classes_) {
                if (c->name == name) {
                    throw Failure(CALLBRIDGE_INVALID_ARG, "class " + name + " is already defined");
                }
            }
            shape = std::make_shared<ClassShape>();
            shape->name = name;
            classes_.push_back(shape);
        }
        return WireValue{table.add(std::make_shared<ClassBuilder>(shape, shapes_mutex_))};
    }

    std::lock_guard<std::mutex> lock(*shapes_mutex_);
    if (method == "class_count") {
        return WireValue{static_cast<int64_t>(classes_.size())};
    }
    if (method == "describe") {
        // "Person{name,age};Pet{}"
        std::string out;
        for (size_t i = 0; i < classes_.size(); ++i) {
            if (i > 0) out += ";";
            out += classes_[i]->name + "{";
            for (size_t j = 0; j < classes_[i]->properties.size(); ++j) {
                if (j > 0) out += ",";
                out += classes_[i]->properties[j];
            }
            out += "}";
        }
        return WireValue{out};
    }
    throw unknown_method(method);
}

}  // namespace loopback
}  // namespace callbridge
