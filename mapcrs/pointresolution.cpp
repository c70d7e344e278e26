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

#include <GeographicLib/Geodesic.hpp>

#include "dbglog/dbglog.hpp"

#include "./pointresolution.hpp"
#include "./csconvertor.hpp"

namespace mapcrs {

namespace {

/** Geodesic distance between two lon/lat points.
 */
double distance(const math::Point2 &a, const math::Point2 &b)
{
    double s12(0.0);
    GeographicLib::Geodesic::WGS84().Inverse(a(1), a(0), b(1), b(0), s12);
    return s12;
}

} // namespace

double geodesicPointResolution(const Projection &projection
                               , double resolution
                               , const math::Point2 &point)
{
    if (projection.isGeographic()) { return resolution; }

    const CsConvertor conv(projection, Projection(crs84()));

    const auto half(resolution / 2.0);
    const auto width(distance(conv(math::Point2(point(0) - half, point(1)))
                              , conv(math::Point2(point(0) + half, point(1)))));
    const auto height(distance(conv(math::Point2(point(0), point(1) - half))
                               , conv(math::Point2(point(0), point(1) + half))));

    const auto pr(((width + height) / 2.0) / projection.metersPerUnit());
    LOG(debug) << "Point resolution of " << projection.code()
               << " at " << point << ": " << resolution << " -> " << pr
               << ".";
    return pr;
}

PointResolution identityPointResolution()
{
    return [](double resolution, const math::Point2&) -> double
    {
        return resolution;
    };
}

} // namespace mapcrs
