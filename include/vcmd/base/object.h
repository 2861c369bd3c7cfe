#pragma once

#include "types.h"
#include <vcmd/result.hpp>
#include <atomic>
#include <memory>
#include <type_traits>

namespace vcmd {
namespace base {

class Object : public std::enable_shared_from_this<Object> {
public:
    using Ptr = std::shared_ptr<Object>;

    virtual ~Object() = default;

    // Guards against double-shutdown, then calls onShutdown().
    Result<void> shutdown() {
        if (_shutdownCalled) return Ok();
        _shutdownCalled = true;
        return onShutdown();
    }

    ObjectId id() const { return _id; }

    virtual const char* typeName() const { return "Object"; }

    template<typename T>
    std::shared_ptr<T> sharedAs() {
        static_assert(std::is_base_of_v<Object, T>, "T must derive from Object");
        return std::dynamic_pointer_cast<T>(shared_from_this());
    }

    Object(const Object&) = delete;
    Object& operator=(const Object&) = delete;

protected:
    Object() : _id(nextId()) {}

    virtual Result<void> onShutdown() { return Ok(); }

private:
    static ObjectId nextId() {
        static std::atomic<ObjectId> counter{1};
        return counter++;
    }

    bool _shutdownCalled = false;
    ObjectId _id;
};

} // namespace base
} // namespace vcmd
