#pragma once

#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>

#include "callbridge/WireValue.hpp"
#include "callbridge/callbridge_abi.h"

namespace callbridge {
namespace loopback {

// Raised inside the runtime and turned into a status code at the ABI edge.
struct Failure : public std::runtime_error {
    callbridge_status status;

    Failure(callbridge_status s, const std::string& message) : std::runtime_error(message), status(s) {}
};

const std::string& string_arg(const KwargsMap& kwargs, const std::string& key);
int64_t int_arg(const KwargsMap& kwargs, const std::string& key, int64_t fallback);

class ObjectTable;

class Object {
   public:
    explicit Object(ObjectKind kind) : kind_(kind) {}
    virtual ~Object() = default;

    ObjectKind kind() const { return kind_; }
    uint64_t pointer() const { return reinterpret_cast<uint64_t>(this); }

    // Serialized per object.
    WireValue call(ObjectTable& table, const std::string& method, const KwargsMap& kwargs);

   protected:
    virtual WireValue invoke(ObjectTable& table, const std::string& method, const KwargsMap& kwargs) = 0;

    Failure unknown_method(const std::string& method) const;

    std::mutex mutex_;

   private:
    ObjectKind kind_;
};

// Every object the runtime has handed out and not yet seen destroyed.
class ObjectTable {
   public:
    std::shared_ptr<Object> construct(ObjectKind kind, const KwargsMap& kwargs);

    RawObjectRef add(std::shared_ptr<Object> object);

    // Throws Failure(INVALID_HANDLE) for pointers not in the table or a kind mismatch.
    std::shared_ptr<Object> find(const RawObjectRef& ref) const;
    void destroy(const RawObjectRef& ref);

    size_t size() const;
    void clear();

   private:
    mutable std::mutex mutex_;
    std::unordered_map<uint64_t, std::shared_ptr<Object>> objects_;
};

struct LogRecord {
    std::string function_name;
    KwargsMap args;
};

class FunctionLog : public Object {
   public:
    explicit FunctionLog(LogRecord record) : Object(CALLBRIDGE_OBJECT_FUNCTION_LOG), record_(std::move(record)) {}

   protected:
    WireValue invoke(ObjectTable& table, const std::string& method, const KwargsMap& kwargs) override;

   private:
    LogRecord record_;
};

// Records every function call it is passed to as the "collector" argument.
class Collector : public Object {
   public:
    explicit Collector(std::string name) : Object(CALLBRIDGE_OBJECT_COLLECTOR), name_(std::move(name)) {}

    void record(LogRecord record);

   protected:
    WireValue invoke(ObjectTable& table, const std::string& method, const KwargsMap& kwargs) override;

   private:
    std::string name_;
    std::vector<LogRecord> logs_;
};

struct ClassShape {
    std::string name;
    std::vector<std::string> properties;
};

class ClassBuilder : public Object {
   public:
    ClassBuilder(std::shared_ptr<ClassShape> shape, std::shared_ptr<std::mutex> shape_mutex)
        : Object(CALLBRIDGE_OBJECT_CLASS_BUILDER), shape_(std::move(shape)), shape_mutex_(std::move(shape_mutex)) {}

   protected:
    WireValue invoke(ObjectTable& table, const std::string& method, const KwargsMap& kwargs) override;

   private:
    std::shared_ptr<ClassShape> shape_;
    std::shared_ptr<std::mutex> shape_mutex_;
};

// Class shapes are shared with the ClassBuilders it hands out, so they
// survive the builders being destroyed.
class TypeBuilder : public Object {
   public:
    TypeBuilder() : Object(CALLBRIDGE_OBJECT_TYPE_BUILDER), shapes_mutex_(std::make_shared<std::mutex>()) {}

   protected:
    WireValue invoke(ObjectTable& table, const std::string& method, const KwargsMap& kwargs) override;

   private:
    std::vector<std::shared_ptr<ClassShape>> classes_;
    std::shared_ptr<std::mutex> shapes_mutex_;
};

}  // namespace loopback
}  // namespace callbridge
