#pragma once

#include "../core/GeometryUtils.h"
#include "../model/RouteAttributes.h"

#include <cstddef>
#include <string>

namespace starmap {

/// Tunables for route editing and interaction
///
/// Example usage:
/// @code
/// EditorOptions options = EditorOptions::createDefault();
/// options.systemSnapRadius = 30.0f;
/// RouteInteractionController controller(document, options);
/// @endcode
struct EditorOptions {
    // === Hit testing (world units) ===
    float systemSnapRadius = 20.0f;      ///< Click within this distance snaps to a system
    float routeHitThreshold = 6.0f;      ///< Click within this distance of a rendered path hits the route
    float shapePointHitRadius = 8.0f;    ///< Click within this distance hits a shape point

    // === Freehand reshape ===
    size_t decimateTarget = 20;          ///< Max points kept from a raw stroke
    int smoothingWindow = 3;             ///< Moving-average window applied after decimation

    // === Rendering ===
    int splineSamples = geometry::DEFAULT_SPLINE_SAMPLES;  ///< Samples per span of the Catmull-Rom path

    // === New routes ===
    int defaultRouteClass = RouteAttributes::DEFAULT_CLASS;

    static EditorOptions createDefault() { return {}; }

    /// Clamp every field into its valid range
    void sanitize();

    /// Serialize to a JSON string
    std::string toJson() const;

    /// Parse options; unknown or missing keys keep their defaults, values are sanitized
    /// @param options Output options, untouched on failure
    /// @return true if parsing succeeded
    static bool fromJson(const std::string& json, EditorOptions& options);

    /// @return true if the file was read and parsed
    static bool loadFromFile(const std::string& path, EditorOptions& options);
    static bool saveToFile(const EditorOptions& options, const std::string& path);
};

}  // namespace starmap
