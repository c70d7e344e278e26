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

#ifndef mapcrs_pointresolution_hpp_included_
#define mapcrs_pointresolution_hpp_included_

#include "math/geometry_core.hpp"

#include "./projection.hpp"

namespace mapcrs {

/** Default point resolution.
 *
 *  Geographic projections: resolution is returned as is.
 *
 *  Projected systems: a cross with arms of given resolution centered at
 *  point is converted into WGS84 and the mean geodesic length of its arms
 *  is returned in units of the projection.
 *
 *  Throws ProjectionError if the cross cannot be converted.
 */
double geodesicPointResolution(const Projection &projection
                               , double resolution
                               , const math::Point2 &point);

/** Point resolution function that does no geodesic adjustment; displayed
 *  scales stay round numbers.
 */
PointResolution identityPointResolution();

} // namespace mapcrs

#endif // mapcrs_pointresolution_hpp_included_
