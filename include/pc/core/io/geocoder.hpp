// File: include/pc/core/io/geocoder.hpp
#pragma once

#include <string>

#include "pc/core/status.hpp"
#include "pc/core/types.hpp"

namespace pc {

// Coordinates -> human-readable place name. Reporting only: never consulted
// while clustering.
class IGeocoder {
 public:
  virtual ~IGeocoder() = default;

  virtual Result<std::string> place_name(const GeoPoint& p) = 0;

  virtual std::string name() const = 0;
};

}  // namespace pc
