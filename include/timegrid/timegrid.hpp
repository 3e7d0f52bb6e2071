#pragma once

/**
 * @file timegrid.hpp
 * @brief Main header for the timegrid arrangement geometry library
 *
 * timegrid maps musical time to pixels on an arrangement surface and runs the
 * drag and trim gestures that move and resize track blocks on it. Conversions
 * are pure functions of an explicit TempoContext; gesture sessions return
 * live geometry and committed results, and the owner applies them.
 */

#include "timegrid/core/Config.hpp"
#include "timegrid/core/GridSnapper.hpp"
#include "timegrid/core/TempoContext.hpp"
#include "timegrid/core/TimeMath.hpp"
#include "timegrid/core/TrackGeometry.hpp"
#include "timegrid/core/TrackOperations.hpp"
#include "timegrid/core/TypeIds.hpp"
#include "timegrid/core/WidthCalculator.hpp"
#include "timegrid/gesture/DragSession.hpp"
#include "timegrid/gesture/GestureTypes.hpp"
#include "timegrid/gesture/ResizeSession.hpp"
#include "timegrid/gesture/TrackGestureController.hpp"

/**
 * @brief Current version of timegrid
 */
constexpr const char* TIMEGRID_VERSION = "0.1.0";
