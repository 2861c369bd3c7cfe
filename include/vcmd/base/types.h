#pragma once

#include <cstdint>

namespace vcmd {
namespace base {

using ObjectId = uint64_t;

} // namespace base
} // namespace vcmd
