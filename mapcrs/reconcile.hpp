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

#ifndef mapcrs_reconcile_hpp_included_
#define mapcrs_reconcile_hpp_included_

#include <string>

#include "math/geometry_core.hpp"

#include "utility/enum-io.hpp"

#include "./registry.hpp"
#include "./capabilities.hpp"

namespace mapcrs {

/** Everything the axis order reconciliation needs.
 */
struct ReconciliationInput {
    /** Project CRS code. Empty disables reconciliation.
     */
    std::string projectRef;

    /** Base proj definition of the project CRS (no axis override).
     */
    std::string projectParams;

    /** Root layer bounding boxes in document order.
     */
    BoundingBoxes boundingBoxes;

    /** Root layer geographic extents in reference CRS (west, south, east,
     *  north).
     */
    math::Extents2 geographicExtents;

    ReconciliationInput() : geographicExtents(math::InvalidExtents{}) {}
};

struct ReconcilerOptions {
    /** Relative tolerance of the proximity test. Scaled by the magnitude of
     *  the declared bounding box coordinates.
     */
    double tolerance;

    /** Code of the geographic reference CRS, must be registered.
     */
    std::string referenceCrs;

    ReconcilerOptions();
};

enum class Outcome {
    /** nothing to reconcile: no CRS, no matching box, nothing usable */
    skipped
    /** project CRS explicitly declares east-north axis order */
    , declaredEnu
    /** current axis order confirmed */
    , accepted
    /** patched: swapped coordinates are closer */
    , swappedProximity
    /** patched: declared box does not intersect geographic extents */
    , swappedIntersection
};

/** Checks axis order of project CRS against capabilities extents and
 *  flags it as north-east in the registry when they disagree.
 *
 *  The registry is modified (via commit) at most once. Never throws on
 *  transformation or geometry problems; a bounding box that cannot be
 *  transformed is ignored.
 */
Outcome reconcile(const ReconciliationInput &input
                  , ProjectionRegistry &registry
                  , const ReconcilerOptions &options = ReconcilerOptions());

/** Proximity test. True if every coordinate of candidate extents is
 *  closer to its pairwise swapped counterpart in declared extents (E0~B1,
 *  E1~B0, E2~B3, E3~B2) than to its direct counterpart.
 *
 *  Exact ties are not swapped. Nearly square extents near the origin are
 *  inherently ambiguous.
 */
bool swappedAxes(const math::Extents2 &candidate
                 , const math::Extents2 &declared
                 , double tolerance);

/** Closed rectangle intersection (touching extents intersect).
 */
bool intersects(const math::Extents2 &a, const math::Extents2 &b);

bool patched(Outcome outcome);

UTILITY_GENERATE_ENUM_IO(Outcome,
    ((skipped))
    ((declaredEnu))
    ((accepted))
    ((swappedProximity))
    ((swappedIntersection))
)

} // namespace mapcrs

#endif // mapcrs_reconcile_hpp_included_
