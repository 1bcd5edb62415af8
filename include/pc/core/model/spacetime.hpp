// File: include/pc/core/model/spacetime.hpp
#pragma once

#include <vector>

#include "pc/core/types.hpp"

namespace pc {

// Units policy:
// - Distances in metres (WGS84 ellipsoid geodesic)
// - Durations in seconds
// - Causal speed c = 1 m/s, so intervals are in metres as well

// Geodesic surface distance. Exactly 0 for identical coordinates.
double spatial_distance(const GeoPoint& a, const GeoPoint& b);
double spatial_distance(const Event& a, const Event& b);

// |t_a - t_b| in seconds.
double temporal_distance(TimestampNs a, TimestampNs b);
double temporal_distance(const Event& a, const Event& b);

// sqrt(spatial^2 - temporal^2). +infinity when temporal > spatial: nobody
// walking at 1 m/s could have been at both events.
double spacelike_interval(double spatial_m, double temporal_s);
double spacelike_interval(const Event& a, const Event& b);

// Largest pairwise value over distinct pairs; 0 for fewer than two events.
// Used for reporting the extent of a cluster only.
double maximum_spatial_distance(const std::vector<Event>& events);
double maximum_temporal_distance(const std::vector<Event>& events);

}  // namespace pc
