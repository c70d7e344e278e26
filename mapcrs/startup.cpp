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

#include <stdexcept>

#include "dbglog/dbglog.hpp"

#include "./startup.hpp"
#include "./pointresolution.hpp"

namespace mapcrs {

namespace {

ReconciliationInput seed(ProjectionRegistry &registry
                         , const ProjectConfig &config)
{
    for (const auto &item : config.projections) {
        registry.defineIfUnknown(item.first, item.second);
    }

    const auto &projection(config.projection);
    registry.defineIfUnknown(projection.ref, projection.proj4);

    // same as EPSG:4326 but always east-north
    const auto ref(crs84());
    registry.define(ref.code, ref.params);

    ReconciliationInput input;
    input.projectRef = projection.ref;
    input.projectParams = projection.proj4;
    return input;
}

void disableGeodesicScale(ProjectionRegistry &registry
                          , const ProjectionConfig &projection)
{
    if (projection.ref.empty()) { return; }

    registry.defineIfUnknown(projection.ref, projection.proj4);
    registry.setPointResolution(projection.ref, identityPointResolution());
}

} // namespace

ReconciliationInput loadCapabilitiesAndConfig(ProjectionRegistry &registry
                                              , const ProjectConfig &config
                                              , const Capabilities &caps)
{
    auto input(seed(registry, config));
    input.boundingBoxes = caps.layer.boundingBoxes;
    if (caps.layer.geographicExtents) {
        input.geographicExtents = *caps.layer.geographicExtents;
    }
    return input;
}

ReconciliationInput
loadCapabilitiesAndConfig(ProjectionRegistry &registry
                          , const ProjectConfig &config
                          , const boost::filesystem::path &capabilitiesPath)
{
    Capabilities caps;
    try {
        caps = loadCapabilities(capabilitiesPath);
    } catch (const ParseError &e) {
        LOG(warn3) << "Malformed capabilities " << capabilitiesPath
                   << ", axis order will not be checked: " << e.what();
        return seed(registry, config);
    } catch (const std::runtime_error &e) {
        LOG(warn3) << "Unable to read capabilities " << capabilitiesPath
                   << ", axis order will not be checked: " << e.what();
        return seed(registry, config);
    }

    return loadCapabilitiesAndConfig(registry, config, caps);
}

void disableGeodesicScale(ProjectionRegistry &registry
                          , const ProjectConfig &config)
{
    disableGeodesicScale(registry, config.projection);
    if (config.qgisProjectProjection) {
        disableGeodesicScale(registry, *config.qgisProjectProjection);
    }
}

} // namespace mapcrs
