#pragma once

#include "object.h"
#include "event.h"
#include <vcmd/result.hpp>

namespace vcmd {
namespace base {

class EventListener : public virtual Object {
public:
    using Ptr = std::shared_ptr<EventListener>;

    virtual ~EventListener() = default;

    // Ok(true) if consumed, Ok(false) if not, Err on failure.
    virtual Result<bool> onEvent(const Event& event) = 0;
};

} // namespace base
} // namespace vcmd
