// File: src/core/model/spacetime.cpp
#include "pc/core/model/spacetime.hpp"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <limits>

namespace pc {
namespace {

// WGS84
constexpr double kSemiMajorM = 6378137.0;
constexpr double kFlattening = 1.0 / 298.257223563;
constexpr double kSemiMinorM = (1.0 - kFlattening) * kSemiMajorM;
constexpr double kMeanRadiusM = 6371008.8;

constexpr double kPi = 3.14159265358979323846;
constexpr int kMaxIterations = 200;
constexpr double kLambdaEpsilon = 1e-12;

double deg_to_rad(double deg) { return deg * kPi / 180.0; }

// Spherical fallback for the nearly antipodal pairs where Vincenty diverges.
double great_circle_m(const GeoPoint& a, const GeoPoint& b) {
  const double phi1 = deg_to_rad(a.latitude);
  const double phi2 = deg_to_rad(b.latitude);
  const double dphi = phi2 - phi1;
  const double dlambda = deg_to_rad(b.longitude - a.longitude);

  const double s = std::sin(dphi / 2.0);
  const double t = std::sin(dlambda / 2.0);
  const double h = s * s + std::cos(phi1) * std::cos(phi2) * t * t;
  return 2.0 * kMeanRadiusM * std::asin(std::min(1.0, std::sqrt(h)));
}

// Vincenty inverse formula on the WGS84 ellipsoid.
double vincenty_m(const GeoPoint& a, const GeoPoint& b) {
  const double L = deg_to_rad(b.longitude - a.longitude);
  const double U1 = std::atan((1.0 - kFlattening) * std::tan(deg_to_rad(a.latitude)));
  const double U2 = std::atan((1.0 - kFlattening) * std::tan(deg_to_rad(b.latitude)));
  const double sinU1 = std::sin(U1);
  const double cosU1 = std::cos(U1);
  const double sinU2 = std::sin(U2);
  const double cosU2 = std::cos(U2);

  double lambda = L;
  double sin_sigma = 0.0;
  double cos_sigma = 0.0;
  double sigma = 0.0;
  double cos_sq_alpha = 0.0;
  double cos_2sigma_m = 0.0;

  bool converged = false;
  for (int i = 0; i < kMaxIterations; ++i) {
    const double sin_lambda = std::sin(lambda);
    const double cos_lambda = std::cos(lambda);

    const double p = cosU2 * sin_lambda;
    const double q = cosU1 * sinU2 - sinU1 * cosU2 * cos_lambda;
    sin_sigma = std::sqrt(p * p + q * q);
    if (sin_sigma == 0.0) return 0.0;  // coincident points

    cos_sigma = sinU1 * sinU2 + cosU1 * cosU2 * cos_lambda;
    sigma = std::atan2(sin_sigma, cos_sigma);

    const double sin_alpha = cosU1 * cosU2 * sin_lambda / sin_sigma;
    cos_sq_alpha = 1.0 - sin_alpha * sin_alpha;
    // Both points on the equator: cos_sq_alpha == 0.
    cos_2sigma_m = cos_sq_alpha != 0.0 ? cos_sigma - 2.0 * sinU1 * sinU2 / cos_sq_alpha : 0.0;

    const double C = kFlattening / 16.0 * cos_sq_alpha * (4.0 + kFlattening * (4.0 - 3.0 * cos_sq_alpha));
    const double lambda_prev = lambda;
    lambda = L + (1.0 - C) * kFlattening * sin_alpha *
                     (sigma + C * sin_sigma *
                                  (cos_2sigma_m + C * cos_sigma * (-1.0 + 2.0 * cos_2sigma_m * cos_2sigma_m)));

    if (std::abs(lambda - lambda_prev) < kLambdaEpsilon) {
      converged = true;
      break;
    }
  }

  if (!converged) return great_circle_m(a, b);

  const double a2 = kSemiMajorM * kSemiMajorM;
  const double b2 = kSemiMinorM * kSemiMinorM;
  const double u_sq = cos_sq_alpha * (a2 - b2) / b2;
  const double A = 1.0 + u_sq / 16384.0 * (4096.0 + u_sq * (-768.0 + u_sq * (320.0 - 175.0 * u_sq)));
  const double B = u_sq / 1024.0 * (256.0 + u_sq * (-128.0 + u_sq * (74.0 - 47.0 * u_sq)));
  const double c2 = cos_2sigma_m * cos_2sigma_m;
  const double delta_sigma =
      B * sin_sigma *
      (cos_2sigma_m + B / 4.0 *
                          (cos_sigma * (-1.0 + 2.0 * c2) -
                           B / 6.0 * cos_2sigma_m * (-3.0 + 4.0 * sin_sigma * sin_sigma) * (-3.0 + 4.0 * c2)));

  return kSemiMinorM * A * (sigma - delta_sigma);
}

}  // namespace

double spatial_distance(const GeoPoint& a, const GeoPoint& b) {
  if (a == b) return 0.0;
  // Canonical argument order makes f(a,b) == f(b,a) bit for bit.
  return (b < a) ? vincenty_m(b, a) : vincenty_m(a, b);
}

double spatial_distance(const Event& a, const Event& b) {
  return spatial_distance(a.position(), b.position());
}

double temporal_distance(TimestampNs a, TimestampNs b) {
  // Unsigned after ordering: instants centuries apart overflow int64_t.
  const std::uint64_t d = (a.ns > b.ns)
                              ? static_cast<std::uint64_t>(a.ns) - static_cast<std::uint64_t>(b.ns)
                              : static_cast<std::uint64_t>(b.ns) - static_cast<std::uint64_t>(a.ns);
  return static_cast<double>(d) / static_cast<double>(kNsPerSecond);
}

double temporal_distance(const Event& a, const Event& b) {
  return temporal_distance(a.timestamp(), b.timestamp());
}

double spacelike_interval(double spatial_m, double temporal_s) {
  if (temporal_s > spatial_m) return std::numeric_limits<double>::infinity();
  return std::sqrt(spatial_m * spatial_m - temporal_s * temporal_s);
}

double spacelike_interval(const Event& a, const Event& b) {
  return spacelike_interval(spatial_distance(a, b), temporal_distance(a, b));
}

double maximum_spatial_distance(const std::vector<Event>& events) {
  double best = 0.0;
  for (std::size_t i = 0; i < events.size(); ++i) {
    for (std::size_t j = i + 1; j < events.size(); ++j) {
      best = std::max(best, spatial_distance(events[i], events[j]));
    }
  }
  return best;
}

double maximum_temporal_distance(const std::vector<Event>& events) {
  double best = 0.0;
  for (std::size_t i = 0; i < events.size(); ++i) {
    for (std::size_t j = i + 1; j < events.size(); ++j) {
      best = std::max(best, temporal_distance(events[i], events[j]));
    }
  }
  return best;
}

}  // namespace pc
