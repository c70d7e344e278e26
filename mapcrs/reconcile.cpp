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

#include <cmath>
#include <algorithm>

#include "dbglog/dbglog.hpp"

#include "./reconcile.hpp"
#include "./transform.hpp"

namespace mapcrs {

namespace {

inline bool closer(double value, double near, double far, double eps)
{
    return (std::abs(value - near) + eps) < std::abs(value - far);
}

/** Compares declared box with geographic extents. Throws ProjectionError or
 *  UnknownCrs when either transformation fails.
 */
Outcome check(const TransformFacade &transform
              , const ReconciliationInput &input
              , const BoundingBox &bbox
              , const ReconcilerOptions &options)
{
    // geographic extents as the current definition sees them
    const auto extents(transform.transformExtent
                       (input.geographicExtents, options.referenceCrs
                        , input.projectRef));

    LOG(info1) << std::fixed << "Geographic extents in " << input.projectRef
               << ": " << extents << ", declared: " << bbox.extents << ".";

    if (swappedAxes(extents, bbox.extents, options.tolerance)) {
        return Outcome::swappedProximity;
    }

    // declared box as the current definition sees it
    const auto geoExtents(transform.transformExtent
                          (bbox.extents, input.projectRef
                           , options.referenceCrs));

    LOG(info1) << std::fixed << "Declared box in " << options.referenceCrs
               << ": " << geoExtents << ", geographic: "
               << input.geographicExtents << ".";

    if (!intersects(geoExtents, input.geographicExtents)) {
        return Outcome::swappedIntersection;
    }

    return Outcome::accepted;
}

} // namespace

ReconcilerOptions::ReconcilerOptions()
    : tolerance(1e-9), referenceCrs(Crs84Code)
{}

bool swappedAxes(const math::Extents2 &c, const math::Extents2 &d
                 , double tolerance)
{
    const auto eps(tolerance * std::max({ 1.0
                    , std::abs(d.ll(0)), std::abs(d.ll(1))
                    , std::abs(d.ur(0)), std::abs(d.ur(1)) }));

    return (closer(c.ll(0), d.ll(1), d.ll(0), eps)
            && closer(c.ll(1), d.ll(0), d.ll(1), eps)
            && closer(c.ur(0), d.ur(1), d.ur(0), eps)
            && closer(c.ur(1), d.ur(0), d.ur(1), eps));
}

bool intersects(const math::Extents2 &a, const math::Extents2 &b)
{
    return ((a.ll(0) <= b.ur(0)) && (a.ur(0) >= b.ll(0))
            && (a.ll(1) <= b.ur(1)) && (a.ur(1) >= b.ll(1)));
}

bool patched(Outcome outcome)
{
    return ((outcome == Outcome::swappedProximity)
            || (outcome == Outcome::swappedIntersection));
}

Outcome reconcile(const ReconciliationInput &input
                  , ProjectionRegistry &registry
                  , const ReconcilerOptions &options)
{
    if (input.projectRef.empty()) {
        LOG(info2) << "No project CRS configured, axis order not checked.";
        return Outcome::skipped;
    }

    const TransformFacade transform(registry);

    for (const auto &bbox : input.boundingBoxes) {
        if (bbox.crs != input.projectRef) { continue; }

        const auto def(registry.lookup(input.projectRef));
        if (!def) {
            LOG(warn2) << "Project CRS <" << input.projectRef
                       << "> is not registered, axis order not checked.";
            return Outcome::skipped;
        }

        if (def->axis == AxisOrientation::enu) {
            LOG(info2) << "Project CRS <" << input.projectRef
                       << "> declares east-north axis order.";
            return Outcome::declaredEnu;
        }

        Outcome outcome;
        try {
            outcome = check(transform, input, bbox, options);
        } catch (const ProjectionError &e) {
            LOG(warn2) << "Ignoring bounding box " << bbox << ": "
                       << e.what();
            continue;
        } catch (const UnknownCrs &e) {
            LOG(warn2) << "Ignoring bounding box " << bbox << ": "
                       << e.what();
            continue;
        }

        if (patched(outcome)) {
            LOG(info3) << "Project CRS <" << input.projectRef
                       << "> has north-east axis order (" << outcome
                       << ").";
            registry.commit(input.projectRef
                            , withAxis(input.projectParams
                                       , AxisOrientation::neu));
        } else {
            LOG(info3) << "Project CRS <" << input.projectRef
                       << "> axis order confirmed.";
        }
        return outcome;
    }

    LOG(info2) << "No usable bounding box in <" << input.projectRef
               << ">, axis order not checked.";
    return Outcome::skipped;
}

} // namespace mapcrs
