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

#include <sstream>

#include <boost/test/unit_test.hpp>

#include "mapcrs/capabilities.hpp"

namespace {

const std::string wms130(R"XXX(<?xml version="1.0" encoding="UTF-8"?>
<WMS_Capabilities xmlns="http://www.opengis.net/wms" version="1.3.0">
 <Service><Name>WMS</Name><Title>montpellier</Title></Service>
 <Capability>
  <Layer>
   <Name>montpellier</Name>
   <Title>Montpellier - Transports</Title>
   <CRS>EPSG:2154</CRS>
   <CRS>EPSG:4326</CRS>
   <EX_GeographicBoundingBox>
    <westBoundLongitude>3.55326</westBoundLongitude>
    <eastBoundLongitude>4.2</eastBoundLongitude>
    <southBoundLatitude>43.4</southBoundLatitude>
    <northBoundLatitude>43.81</northBoundLatitude>
   </EX_GeographicBoundingBox>
   <BoundingBox CRS="EPSG:2154" minx="759249" miny="6271520"
                maxx="781949" maxy="6308000"/>
   <BoundingBox CRS="EPSG:4326" minx="43.4" miny="3.55326"
                maxx="43.81" maxy="4.2"/>
   <Layer>
    <Name>bus</Name>
    <Title>Bus</Title>
   </Layer>
  </Layer>
 </Capability>
</WMS_Capabilities>
)XXX");

const std::string wms130ns(R"XXX(<?xml version="1.0" encoding="UTF-8"?>
<wms:WMS_Capabilities xmlns:wms="http://www.opengis.net/wms" version="1.3.0">
 <wms:Capability>
  <wms:Layer>
   <wms:Name>root</wms:Name>
   <wms:EX_GeographicBoundingBox>
    <wms:westBoundLongitude>-5</wms:westBoundLongitude>
    <wms:eastBoundLongitude>10</wms:eastBoundLongitude>
    <wms:southBoundLatitude>41</wms:southBoundLatitude>
    <wms:northBoundLatitude>51</wms:northBoundLatitude>
   </wms:EX_GeographicBoundingBox>
   <wms:BoundingBox CRS="EPSG:2154" minx="700000,5" miny="6600000"
                    maxx="1200000" maxy="7200000"/>
  </wms:Layer>
 </wms:Capability>
</wms:WMS_Capabilities>
)XXX");

const std::string wms111(R"XXX(<?xml version="1.0" encoding="UTF-8"?>
<WMT_MS_Capabilities version="1.1.1">
 <Capability>
  <Layer>
   <Name>root</Name>
   <SRS>EPSG:2154 EPSG:3857</SRS>
   <LatLonBoundingBox minx="-5" miny="41" maxx="10" maxy="51"/>
   <BoundingBox SRS="EPSG:2154" minx="700000" miny="6600000"
                maxx="1200000" maxy="7200000"/>
  </Layer>
 </Capability>
</WMT_MS_Capabilities>
)XXX");

} // namespace

BOOST_AUTO_TEST_CASE(mapcrs_capabilities_wms130)
{
    const auto caps(mapcrs::parseCapabilities(wms130));
    BOOST_CHECK_EQUAL(caps.version, "1.3.0");

    const auto &layer(caps.layer);
    BOOST_CHECK_EQUAL(layer.name, "montpellier");
    BOOST_CHECK_EQUAL(layer.title, "Montpellier - Transports");
    BOOST_REQUIRE_EQUAL(layer.crs.size(), 2);
    BOOST_CHECK_EQUAL(layer.crs[0], "EPSG:2154");

    // document order is kept, numbers are taken as they are
    BOOST_REQUIRE_EQUAL(layer.boundingBoxes.size(), 2);
    const auto &first(layer.boundingBoxes[0]);
    BOOST_CHECK_EQUAL(first.crs, "EPSG:2154");
    BOOST_CHECK_EQUAL(first.extents.ll(0), 759249);
    BOOST_CHECK_EQUAL(first.extents.ll(1), 6271520);
    BOOST_CHECK_EQUAL(first.extents.ur(0), 781949);
    BOOST_CHECK_EQUAL(first.extents.ur(1), 6308000);

    const auto &second(layer.boundingBoxes[1]);
    BOOST_CHECK_EQUAL(second.crs, "EPSG:4326");
    BOOST_CHECK_EQUAL(second.extents.ll(0), 43.4);
    BOOST_CHECK_EQUAL(second.extents.ll(1), 3.55326);

    BOOST_REQUIRE(layer.geographicExtents);
    BOOST_CHECK_EQUAL(layer.geographicExtents->ll(0), 3.55326);
    BOOST_CHECK_EQUAL(layer.geographicExtents->ll(1), 43.4);
    BOOST_CHECK_EQUAL(layer.geographicExtents->ur(0), 4.2);
    BOOST_CHECK_EQUAL(layer.geographicExtents->ur(1), 43.81);

    BOOST_REQUIRE_EQUAL(layer.layers.size(), 1);
    BOOST_CHECK_EQUAL(layer.layers[0].name, "bus");
    BOOST_CHECK(layer.layers[0].boundingBoxes.empty());
    BOOST_CHECK(!layer.layers[0].geographicExtents);
}

BOOST_AUTO_TEST_CASE(mapcrs_capabilities_namespaced)
{
    const auto caps(mapcrs::parseCapabilities(wms130ns));
    BOOST_CHECK_EQUAL(caps.layer.name, "root");
    BOOST_REQUIRE_EQUAL(caps.layer.boundingBoxes.size(), 1);

    // decimal comma
    BOOST_CHECK_EQUAL(caps.layer.boundingBoxes[0].extents.ll(0), 700000.5);

    BOOST_REQUIRE(caps.layer.geographicExtents);
    BOOST_CHECK_EQUAL(caps.layer.geographicExtents->ll(0), -5);
    BOOST_CHECK_EQUAL(caps.layer.geographicExtents->ur(1), 51);
}

BOOST_AUTO_TEST_CASE(mapcrs_capabilities_wms111)
{
    std::istringstream is(wms111);
    const auto caps(mapcrs::loadCapabilities(is));
    BOOST_CHECK_EQUAL(caps.version, "1.1.1");

    BOOST_REQUIRE_EQUAL(caps.layer.crs.size(), 2);
    BOOST_CHECK_EQUAL(caps.layer.crs[1], "EPSG:3857");

    BOOST_REQUIRE_EQUAL(caps.layer.boundingBoxes.size(), 1);
    BOOST_CHECK_EQUAL(caps.layer.boundingBoxes[0].crs, "EPSG:2154");

    BOOST_REQUIRE(caps.layer.geographicExtents);
    BOOST_CHECK_EQUAL(caps.layer.geographicExtents->ll(0), -5);
    BOOST_CHECK_EQUAL(caps.layer.geographicExtents->ll(1), 41);
    BOOST_CHECK_EQUAL(caps.layer.geographicExtents->ur(0), 10);
    BOOST_CHECK_EQUAL(caps.layer.geographicExtents->ur(1), 51);
}

BOOST_AUTO_TEST_CASE(mapcrs_capabilities_malformed)
{
    using mapcrs::parseCapabilities;
    using mapcrs::ParseError;

    // not xml at all
    BOOST_CHECK_THROW(parseCapabilities("<WMS_Capabilities><Capab")
                      , ParseError);

    // not capabilities
    BOOST_CHECK_THROW(parseCapabilities("<html><body/></html>"), ParseError);

    // no root layer
    BOOST_CHECK_THROW(parseCapabilities
                      ("<WMS_Capabilities version=\"1.3.0\">"
                       "<Capability><Request/></Capability>"
                       "</WMS_Capabilities>")
                      , ParseError);

    // no bounding boxes
    BOOST_CHECK_THROW(parseCapabilities
                      ("<WMS_Capabilities version=\"1.3.0\">"
                       "<Capability><Layer><Name>x</Name>"
                       "<EX_GeographicBoundingBox>"
                       "<westBoundLongitude>0</westBoundLongitude>"
                       "<eastBoundLongitude>1</eastBoundLongitude>"
                       "<southBoundLatitude>0</southBoundLatitude>"
                       "<northBoundLatitude>1</northBoundLatitude>"
                       "</EX_GeographicBoundingBox>"
                       "</Layer></Capability></WMS_Capabilities>")
                      , ParseError);

    // no geographic extents
    BOOST_CHECK_THROW(parseCapabilities
                      ("<WMS_Capabilities version=\"1.3.0\">"
                       "<Capability><Layer><Name>x</Name>"
                       "<BoundingBox CRS=\"EPSG:2154\" minx=\"0\""
                       " miny=\"0\" maxx=\"1\" maxy=\"1\"/>"
                       "</Layer></Capability></WMS_Capabilities>")
                      , ParseError);

    // broken number
    BOOST_CHECK_THROW(parseCapabilities
                      ("<WMS_Capabilities version=\"1.3.0\">"
                       "<Capability><Layer><Name>x</Name>"
                       "<BoundingBox CRS=\"EPSG:2154\" minx=\"zero\""
                       " miny=\"0\" maxx=\"1\" maxy=\"1\"/>"
                       "</Layer></Capability></WMS_Capabilities>")
                      , ParseError);
}

BOOST_AUTO_TEST_CASE(mapcrs_capabilities_broken_child_box)
{
    const auto caps(mapcrs::parseCapabilities(R"XXX(<?xml version="1.0"?>
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
   <BoundingBox CRS="EPSG:2154" minx="700000" miny="6600000"
                maxx="1200000" maxy="7200000"/>
   <Layer>
    <Name>child</Name>
    <BoundingBox minx="0" miny="0" maxx="1" maxy="1"/>
    <BoundingBox CRS="EPSG:4326" minx="north" miny="0" maxx="1" maxy="1"/>
    <BoundingBox CRS="EPSG:3857" minx="0" miny="0" maxx="1" maxy="1"/>
    <EX_GeographicBoundingBox>
     <westBoundLongitude>west</westBoundLongitude>
    </EX_GeographicBoundingBox>
   </Layer>
  </Layer>
 </Capability>
</WMS_Capabilities>
)XXX"));

    // root layer is intact
    BOOST_REQUIRE_EQUAL(caps.layer.boundingBoxes.size(), 1);
    BOOST_CHECK_EQUAL(caps.layer.boundingBoxes[0].crs, "EPSG:2154");
    BOOST_CHECK(caps.layer.geographicExtents);

    // only the well formed child box survives
    BOOST_REQUIRE_EQUAL(caps.layer.layers.size(), 1);
    const auto &child(caps.layer.layers[0]);
    BOOST_CHECK_EQUAL(child.name, "child");
    BOOST_REQUIRE_EQUAL(child.boundingBoxes.size(), 1);
    BOOST_CHECK_EQUAL(child.boundingBoxes[0].crs, "EPSG:3857");
    BOOST_CHECK(!child.geographicExtents);
}

BOOST_AUTO_TEST_CASE(mapcrs_capabilities_broken_root_box)
{
    // root layer stays strict
    BOOST_CHECK_THROW(mapcrs::parseCapabilities
                      ("<WMS_Capabilities version=\"1.3.0\">"
                       "<Capability><Layer><Name>x</Name>"
                       "<EX_GeographicBoundingBox>"
                       "<westBoundLongitude>0</westBoundLongitude>"
                       "<eastBoundLongitude>1</eastBoundLongitude>"
                       "<southBoundLatitude>0</southBoundLatitude>"
                       "<northBoundLatitude>1</northBoundLatitude>"
                       "</EX_GeographicBoundingBox>"
                       "<BoundingBox CRS=\"EPSG:4326\" minx=\"0\" miny=\"0\""
                       " maxx=\"1\"/>"
                       "</Layer></Capability></WMS_Capabilities>")
                      , mapcrs::ParseError);
}
