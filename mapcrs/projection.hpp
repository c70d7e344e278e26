/**
 * Copyright (c) 2024 Melown Technologies SE
 *
 * Redistribution and use in source and binary forms, with or without
 * modification, are permitted provided that the following conditions are met:
 *
 * *  Redistributions of source code must retain the above copyright notice,
 *    this list of conditions and the following disclaimer.
 *
 * *  Redistributions in binary form must reproduce the above copyright
 *    notice, this list of conditions and the following disclaimer in the
 *    documentation and/or other materials provided with the distribution.
 *
 * THIS SOFTWARE IS PROVIDED BY THE COPYRIGHT HOLDERS AND CONTRIBUTORS "AS IS"
 * AND ANY EXPRESS OR IMPLIED WARRANTIES, INCLUDING, BUT NOT LIMITED TO, THE
 * IMPLIED WARRANTIES OF MERCHANTABILITY AND FITNESS FOR A PARTICULAR PURPOSE
 * ARE DISCLAIMED.  IN NO EVENT SHALL THE COPYRIGHT HOLDER OR CONTRIBUTORS BE
 * LIABLE FOR ANY DIRECT, INDIRECT, INCIDENTAL, SPECIAL, EXEMPLARY, OR
 * CONSEQUENTIAL DAMAGES (INCLUDING, BUT NOT LIMITED TO, PROCUREMENT OF
 * SUBSTITUTE GOODS OR SERVICES; LOSS OF USE, DATA, OR PROFITS; OR BUSINESS
 * INTERRUPTION) HOWEVER CAUSED AND ON ANY THEORY OF LIABILITY, WHETHER IN
 * CONTRACT, STRICT LIABILITY, OR TORT (INCLUDING NEGLIGENCE OR OTHERWISE)
 * ARISING IN ANY WAY OUT OF THE USE OF THIS SOFTWARE, EVEN IF ADVISED OF THE
 * POSSIBILITY OF SUCH DAMAGE.
 */

#ifndef mapcrs_projection_hpp_included_
#define mapcrs_projection_hpp_included_

#include <string>
#include <memory>
#include <stdexcept>
#include <functional>

#include "math/geometry_core.hpp"

#include "./projdef.hpp"

// forward declaration
class OGRSpatialReference;

namespace mapcrs {

struct ProjectionError : public std::runtime_error {
    ProjectionError(const std::string &msg) : std::runtime_error(msg) {}
};

/** Maps map resolution (units per pixel) at given point to resolution
 *  corrected for distortion of the projection.
 */
typedef std::function<double(double resolution, const math::Point2 &point)>
    PointResolution;

/** Projection object derived from a registry entry.
 *
 *  Immutable; registry replaces it as a whole when its definition changes.
 */
class Projection {
public:
    typedef std::shared_ptr<const Projection> pointer;

    /** Builds projection from definition. Throws ProjectionError when the
     *  definition cannot be parsed.
     */
    Projection(const ProjectionDefinition &def
               , const PointResolution &pointResolution = PointResolution());

    const ProjectionDefinition& definition() const { return def_; }
    const std::string& code() const { return def_.code; }
    AxisOrientation axis() const { return def_.axis; }

    bool isGeographic() const;

    /** Linear unit in meters, 1.0 for geographic systems.
     */
    double metersPerUnit() const;

    /** Point resolution. Uses custom function if set, geodesic correction
     *  otherwise.
     */
    double pointResolution(double resolution, const math::Point2 &point)
        const;

    /** Has custom point resolution function?
     */
    bool customPointResolution() const { return bool(pointResolution_); }

    const OGRSpatialReference& reference() const { return *sr_; }

private:
    ProjectionDefinition def_;
    std::shared_ptr<OGRSpatialReference> sr_;
    PointResolution pointResolution_;
};

} // namespace mapcrs

#endif // mapcrs_projection_hpp_included_
