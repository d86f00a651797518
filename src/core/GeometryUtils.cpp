#include "starmap/core/GeometryUtils.h"

#include <algorithm>
#include <cmath>

namespace starmap::geometry {

float distancePointToSegment(const Point& p, const Point& a, const Point& b, Point& outClosestPoint) {
    float dx = b.x - a.x;
    float dy = b.y - a.y;
    float len2 = dx * dx + dy * dy;

    float t = 0.0f;
    if (len2 > constants::EPSILON_LEN2) {
        t = std::clamp(((p.x - a.x) * dx + (p.y - a.y) * dy) / len2, 0.0f, 1.0f);
    }

    outClosestPoint = {a.x + t * dx, a.y + t * dy};

    float distX = p.x - outClosestPoint.x;
    float distY = p.y - outClosestPoint.y;
    return std::sqrt(distX * distX + distY * distY);
}

float distancePointToSegment(const Point& p, const Point& a, const Point& b) {
    Point closest;
    return distancePointToSegment(p, a, b, closest);
}

float polylineLength(const Polyline& points) {
    float total = 0.0f;
    for (size_t i = 1; i < points.size(); ++i) {
        total += points[i - 1].distanceTo(points[i]);
    }
    return total;
}

SegmentHit nearestSegment(const Point& point, const Polyline& path) {
    SegmentHit hit;
    for (size_t i = 0; i + 1 < path.size(); ++i) {
        Point closest;
        float dist = distancePointToSegment(point, path[i], path[i + 1], closest);
        if (hit.segmentIndex < 0 || dist < hit.distance) {
            hit.segmentIndex = static_cast<int>(i);
            hit.distance = dist;
            hit.closestPoint = closest;
        }
    }
    return hit;
}

Polyline decimate(const Polyline& points, size_t targetCount) {
    targetCount = std::max<size_t>(targetCount, 2);
    if (points.size() <= targetCount) {
        return points;
    }

    // n > targetCount, so the rounded stride indices are strictly increasing
    Polyline result;
    result.reserve(targetCount);
    const double stride = static_cast<double>(points.size() - 1) / static_cast<double>(targetCount - 1);
    for (size_t i = 0; i < targetCount; ++i) {
        auto index = static_cast<size_t>(std::lround(static_cast<double>(i) * stride));
        result.push_back(points[std::min(index, points.size() - 1)]);
    }
    result.back() = points.back();
    return result;
}

Polyline smooth(const Polyline& points, int window) {
    Polyline result = points;
    if (window <= 1 || points.size() < 3) {
        return result;
    }

    const int half = window / 2;
    const int last = static_cast<int>(points.size()) - 1;
    for (int i = 1; i < last; ++i) {
        int from = std::max(0, i - half);
        int to = std::min(last, i + half);

        float sumX = 0.0f;
        float sumY = 0.0f;
        for (int j = from; j <= to; ++j) {
            sumX += points[static_cast<size_t>(j)].x;
            sumY += points[static_cast<size_t>(j)].y;
        }
        float count = static_cast<float>(to - from + 1);
        result[static_cast<size_t>(i)] = {sumX / count, sumY / count};
    }
    return result;
}

namespace {

// Uniform Catmull-Rom between p1 and p2, tangents from the neighbours
Point catmullRom(const Point& p0, const Point& p1, const Point& p2, const Point& p3, float t) {
    float t2 = t * t;
    float t3 = t2 * t;
    return {
        0.5f * (2.0f * p1.x + (p2.x - p0.x) * t +
                (2.0f * p0.x - 5.0f * p1.x + 4.0f * p2.x - p3.x) * t2 +
                (3.0f * p1.x - p0.x - 3.0f * p2.x + p3.x) * t3),
        0.5f * (2.0f * p1.y + (p2.y - p0.y) * t +
                (2.0f * p0.y - 5.0f * p1.y + 4.0f * p2.y - p3.y) * t2 +
                (3.0f * p1.y - p0.y - 3.0f * p2.y + p3.y) * t3)
    };
}

}  // namespace

Polyline evaluatePath(const Point& start, const Polyline& shapePoints, const Point& end,
                      int samplesPerSegment) {
    if (shapePoints.empty()) {
        return {start, end};
    }

    Polyline controls;
    controls.reserve(shapePoints.size() + 2);
    controls.push_back(start);
    controls.insert(controls.end(), shapePoints.begin(), shapePoints.end());
    controls.push_back(end);

    const int samples = std::max(1, samplesPerSegment);
    const size_t last = controls.size() - 1;

    Polyline path;
    path.reserve(last * static_cast<size_t>(samples) + 1);
    for (size_t i = 0; i < last; ++i) {
        const Point& p0 = controls[i == 0 ? 0 : i - 1];
        const Point& p1 = controls[i];
        const Point& p2 = controls[i + 1];
        const Point& p3 = controls[std::min(i + 2, last)];

        path.push_back(p1);
        for (int s = 1; s < samples; ++s) {
            float t = static_cast<float>(s) / static_cast<float>(samples);
            path.push_back(catmullRom(p0, p1, p2, p3, t));
        }
    }
    path.push_back(end);
    return path;
}

}  // namespace starmap::geometry
