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

#ifndef mapcrs_capabilities_hpp_included_
#define mapcrs_capabilities_hpp_included_

#include <string>
#include <vector>
#include <iostream>
#include <stdexcept>

#include <boost/optional.hpp>
#include <boost/filesystem/path.hpp>

#include "math/geometry_core.hpp"

namespace mapcrs {

struct ParseError : public std::runtime_error {
    ParseError(const std::string &msg) : std::runtime_error(msg) {}
};

/** CRS-tagged extents as advertised by server.
 *
 *  Extents hold minx, miny, maxx, maxy in document order: whether the first
 *  coordinate is east or north depends on the CRS axis order.
 */
struct BoundingBox {
    std::string crs;
    math::Extents2 extents;

    BoundingBox() : extents(math::InvalidExtents{}) {}
    BoundingBox(const std::string &crs, const math::Extents2 &extents)
        : crs(crs), extents(extents)
    {}
};

typedef std::vector<BoundingBox> BoundingBoxes;

struct Layer {
    std::string name;
    std::string title;

    /** Supported CRS codes.
     */
    std::vector<std::string> crs;

    BoundingBoxes boundingBoxes;

    /** West, south, east, north in CRS:84.
     */
    boost::optional<math::Extents2> geographicExtents;

    std::vector<Layer> layers;
};

/** Parsed WMS capabilities document, reduced to layer extents.
 */
struct Capabilities {
    std::string version;

    /** Root layer.
     */
    Layer layer;
};

/** Parses WMS capabilities (1.3.0 or 1.1.x) XML document.
 *
 *  Throws ParseError if the document is not well formed XML, has no root
 *  layer or the root layer lacks bounding boxes or geographic extents.
 */
Capabilities parseCapabilities(const std::string &xml);

Capabilities loadCapabilities(std::istream &in
                              , const boost::filesystem::path &path
                              = "UNKNOWN");

Capabilities loadCapabilities(const boost::filesystem::path &path);

template<typename CharT, typename Traits>
inline std::basic_ostream<CharT, Traits>&
operator<<(std::basic_ostream<CharT, Traits> &os, const BoundingBox &bbox)
{
    return os << bbox.crs << " [" << bbox.extents << "]";
}

} // namespace mapcrs

#endif // mapcrs_capabilities_hpp_included_
