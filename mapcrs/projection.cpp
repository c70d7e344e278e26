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

#include <ogr_spatialref.h>

#include "dbglog/dbglog.hpp"

#include "./projection.hpp"
#include "./pointresolution.hpp"
#include "./detail/srs.hpp"

namespace mapcrs {

Projection::Projection(const ProjectionDefinition &def
                       , const PointResolution &pointResolution)
    : def_(def), sr_(std::make_shared<OGRSpatialReference>())
    , pointResolution_(pointResolution)
{
    detail::import(*sr_, def_);
    LOG(info1) << "Built projection " << def_ << " (axis: "
               << def_.axis << ").";
}

bool Projection::isGeographic() const
{
    return sr_->IsGeographic();
}

double Projection::metersPerUnit() const
{
    if (sr_->IsGeographic()) { return 1.0; }
    return sr_->GetLinearUnits();
}

double Projection::pointResolution(double resolution
                                   , const math::Point2 &point) const
{
    if (pointResolution_) { return pointResolution_(resolution, point); }
    return geodesicPointResolution(*this, resolution, point);
}

} // namespace mapcrs
