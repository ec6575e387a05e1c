#pragma once

// IWYU pragma: begin_exports
#include "waypoint/path-params.hpp"
#include "waypoint/router-config.hpp"
#include "waypoint/router-error.hpp"
#include "waypoint/router.hpp"
// IWYU pragma: end_exports
