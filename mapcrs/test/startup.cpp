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

#include <fstream>

#include <boost/test/unit_test.hpp>
#include <boost/filesystem.hpp>

#include "mapcrs/startup.hpp"
#include "mapcrs/transform.hpp"

namespace fs = boost::filesystem;

namespace {

const std::string lambert93
("+proj=lcc +lat_0=46.5 +lon_0=3 +lat_1=49 +lat_2=44 +x_0=700000"
 " +y_0=6600000 +ellps=GRS80 +towgs84=0,0,0,0,0,0,0 +units=m +no_defs");

mapcrs::ProjectConfig config()
{
    mapcrs::ProjectConfig config;
    config.projection.ref = "EPSG:2154";
    config.projection.proj4 = lambert93;
    config.qgisProjectProjection = mapcrs::ProjectionConfig();
    config.qgisProjectProjection->ref = "EPSG:2154";
    config.qgisProjectProjection->proj4 = lambert93;
    config.projections["EPSG:4326"] = "+proj=longlat +datum=WGS84 +no_defs";
    return config;
}

mapcrs::Capabilities capabilities(const math::Extents2 &declared)
{
    mapcrs::Capabilities caps;
    caps.version = "1.3.0";
    caps.layer.name = "root";
    caps.layer.geographicExtents = math::Extents2(-5, 41, 10, 51);
    caps.layer.boundingBoxes.emplace_back("EPSG:2154", declared);
    return caps;
}

struct TemporaryFile {
    fs::path path;

    TemporaryFile(const std::string &content)
        : path(fs::temp_directory_path() / fs::unique_path())
    {
        std::ofstream f(path.string());
        f << content;
    }

    ~TemporaryFile() {
        boost::system::error_code ec;
        fs::remove(path, ec);
    }
};

} // namespace

BOOST_AUTO_TEST_CASE(mapcrs_startup_seed)
{
    mapcrs::ProjectionRegistry registry;

    // already known definition is kept
    registry.define("EPSG:4326", "+proj=longlat +ellps=WGS84 +no_defs");

    const auto input(mapcrs::loadCapabilitiesAndConfig
                     (registry, config()
                      , capabilities(math::Extents2(700000, 6600000
                                                    , 1200000, 7200000))));

    BOOST_CHECK_EQUAL(input.projectRef, "EPSG:2154");
    BOOST_CHECK_EQUAL(input.projectParams, lambert93);
    BOOST_CHECK_EQUAL(input.boundingBoxes.size(), 1);
    BOOST_CHECK_EQUAL(input.geographicExtents.ll(0), -5);

    BOOST_CHECK(registry.has("CRS:84"));
    BOOST_CHECK_EQUAL(registry.lookup("EPSG:2154")->params, lambert93);
    BOOST_CHECK_EQUAL(registry.lookup("EPSG:4326")->params
                      , "+proj=longlat +ellps=WGS84 +no_defs");
}

BOOST_AUTO_TEST_CASE(mapcrs_startup_full)
{
    mapcrs::ProjectionRegistry registry;
    const auto cfg(config());

    const auto input(mapcrs::loadCapabilitiesAndConfig
                     (registry, cfg
                      , capabilities(math::Extents2(6600000, 700000
                                                    , 7200000, 1200000))));
    BOOST_CHECK_EQUAL(mapcrs::reconcile(input, registry)
                      , mapcrs::Outcome::swappedProximity);
    mapcrs::disableGeodesicScale(registry, cfg);

    const auto proj(registry.projection("EPSG:2154"));
    BOOST_CHECK_EQUAL(proj->axis(), mapcrs::AxisOrientation::neu);
    BOOST_CHECK(proj->customPointResolution());
    BOOST_CHECK_EQUAL(proj->pointResolution(2.5, math::Point2(0, 0)), 2.5);

    const mapcrs::TransformFacade transform(registry);
    const auto p(transform.transformPoint(math::Point2(3, 46.5)
                                          , "CRS:84", "EPSG:2154"));
    BOOST_CHECK_SMALL(p(0) - 6600000, 1e-3);
    BOOST_CHECK_SMALL(p(1) - 700000, 1e-3);
}

BOOST_AUTO_TEST_CASE(mapcrs_startup_unconfigured)
{
    mapcrs::ProjectionRegistry registry;
    mapcrs::ProjectConfig cfg;

    const auto input(mapcrs::loadCapabilitiesAndConfig
                     (registry, cfg
                      , capabilities(math::Extents2(6600000, 700000
                                                    , 7200000, 1200000))));
    BOOST_CHECK_EQUAL(mapcrs::reconcile(input, registry)
                      , mapcrs::Outcome::skipped);

    // nothing to disable
    mapcrs::disableGeodesicScale(registry, cfg);
    BOOST_CHECK_EQUAL(registry.codes().size(), 1);
}

BOOST_AUTO_TEST_CASE(mapcrs_startup_malformed_capabilities)
{
    const TemporaryFile caps("<WMS_Capabilities version=\"1.3.0\">"
                             "<Capability/></WMS_Capabilities>");

    mapcrs::ProjectionRegistry registry;
    const auto input(mapcrs::loadCapabilitiesAndConfig
                     (registry, config(), caps.path));

    // registry is seeded, there is just nothing to reconcile with
    BOOST_CHECK(input.boundingBoxes.empty());
    BOOST_CHECK(registry.has("EPSG:2154"));
    BOOST_CHECK(registry.has("CRS:84"));
    BOOST_CHECK_EQUAL(mapcrs::reconcile(input, registry)
                      , mapcrs::Outcome::skipped);
}

BOOST_AUTO_TEST_CASE(mapcrs_startup_capabilities_file)
{
    const TemporaryFile caps(R"XXX(<?xml version="1.0" encoding="UTF-8"?>
<WMS_Capabilities version="1.3.0">
 <Capability>
  <Layer>
   <Name>root</Name>
   <EX_GeographicBoundingBox>
    <westBoundLongitude>-5</westBoundLongitude>
    <eastBoundLongitude>10</eastBoundLongitude>
    <southBoundLatitude>41</southBoundLatitude>
    <northBoundLatitude>51</northBoundLatitude>
   </EX_GeographicBoundingBox>
   <BoundingBox CRS="EPSG:2154" minx="6600000" miny="700000"
                maxx="7200000" maxy="1200000"/>
  </Layer>
 </Capability>
</WMS_Capabilities>
)XXX");

    mapcrs::ProjectionRegistry registry;
    const auto input(mapcrs::loadCapabilitiesAndConfig
                     (registry, config(), caps.path));
    BOOST_CHECK_EQUAL(input.boundingBoxes.size(), 1);
    BOOST_CHECK_EQUAL(mapcrs::reconcile(input, registry)
                      , mapcrs::Outcome::swappedProximity);
}

BOOST_AUTO_TEST_CASE(mapcrs_startup_missing_capabilities)
{
    const auto missing(fs::temp_directory_path() / fs::unique_path());

    mapcrs::ProjectionRegistry registry;
    const auto input(mapcrs::loadCapabilitiesAndConfig
                     (registry, config(), missing));

    BOOST_CHECK(input.boundingBoxes.empty());
    BOOST_CHECK_EQUAL(input.projectRef, "EPSG:2154");
    BOOST_CHECK(registry.has("EPSG:2154"));
    BOOST_CHECK(registry.has("CRS:84"));
    BOOST_CHECK_EQUAL(mapcrs::reconcile(input, registry)
                      , mapcrs::Outcome::skipped);
}
