#pragma once

// Core types and structures
#include "core/types.hpp"
#include "core/outline.hpp"
#include "core/placement.hpp"
#include "core/scene_registry.hpp"
#include "core/clock.hpp"

// Geometry algorithms
#include "geometry/kernel.hpp"

// Constraints
#include "constraints/canvas_bounds.hpp"
#include "constraints/overlap.hpp"

// Placement search and the run driver
#include "search/placement_search.hpp"
#include "session/session.hpp"

// Input / output
#include "io/catalogue.hpp"
#include "io/run_params.hpp"
#include "io/summary.hpp"

// Rendering
#include "render/renderer.hpp"
#include "render/svg_renderer.hpp"

// Random number generation
#include "random/rng.hpp"
