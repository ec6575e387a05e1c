#pragma once

#include <amc/vector.hpp>

namespace waypoint {

template <class T>
using vector = amc::vector<T>;

}  // namespace waypoint
