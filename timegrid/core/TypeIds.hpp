#pragma once

namespace timegrid {

// Track identifiers
using TrackId = int;
constexpr TrackId INVALID_TRACK_ID = -1;

}  // namespace timegrid
