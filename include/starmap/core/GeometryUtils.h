#pragma once

#include "Types.h"

#include <cstddef>

namespace starmap {

/// Pure geometry used by route rendering, hit testing and editing.
/// None of these functions fail: degenerate input yields a defined result.
namespace geometry {

/// Result of locating the polyline segment nearest to a query point
struct SegmentHit {
    int segmentIndex = -1;        ///< Segment i joins path[i] and path[i+1]; -1 if path has < 2 points
    float distance = 0.0f;        ///< Distance from query point to closestPoint
    Point closestPoint{0, 0};     ///< Closest point on that segment
};

/// Distance from a point to the closed segment [a, b]
/// The projection parameter is clamped to [0, 1]; a == b degrades to |p - a|
/// @param outClosestPoint Output: closest point on the segment
float distancePointToSegment(const Point& p, const Point& a, const Point& b, Point& outClosestPoint);

/// Distance from a point to the closed segment [a, b]
float distancePointToSegment(const Point& p, const Point& a, const Point& b);

/// Sum of consecutive Euclidean distances; 0 for fewer than 2 points
float polylineLength(const Polyline& points);

/// Segment of a polyline nearest to a point (lowest index wins ties)
SegmentHit nearestSegment(const Point& point, const Polyline& path);

/// Reduce a dense stroke to at most targetCount points by uniform index stride
/// First and last input points are always kept. Input no longer than
/// targetCount is returned unchanged; targetCount < 2 is treated as 2.
Polyline decimate(const Polyline& points, size_t targetCount);

/// Moving-average smoothing over a window centred on each interior point
/// The window is truncated at the ends. First and last points are copied
/// unchanged so the path still meets its anchors.
Polyline smooth(const Polyline& points, int window);

/// Number of interpolated samples emitted between consecutive control points
constexpr int DEFAULT_SPLINE_SAMPLES = 12;

/// Full render path from start anchor through shape points to end anchor
/// - no shape points: {start, end}
/// - otherwise: uniform Catmull-Rom spline through every control point,
///   end anchors duplicated as phantom neighbours
/// Control points appear verbatim in the output, so output.front() == start
/// and output.back() == end exactly.
Polyline evaluatePath(const Point& start, const Polyline& shapePoints, const Point& end,
                      int samplesPerSegment = DEFAULT_SPLINE_SAMPLES);

}  // namespace geometry

namespace constants {

/// Floating-point comparison tolerance
constexpr float EPSILON = 1e-6f;

/// Squared segment length below which a segment is treated as a point
constexpr float EPSILON_LEN2 = 1e-12f;

}  // namespace constants

}  // namespace starmap
