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

#include <memory>
#include <cstring>
#include <fstream>
#include <sstream>
#include <algorithm>

#include <boost/lexical_cast.hpp>
#include <boost/algorithm/string/trim.hpp>
#include <boost/algorithm/string/split.hpp>
#include <boost/algorithm/string/classification.hpp>

#include <cpl_minixml.h>
#include <cpl_error.h>

#include "dbglog/dbglog.hpp"

#include "./capabilities.hpp"

namespace ba = boost::algorithm;

namespace mapcrs {

namespace {

typedef std::unique_ptr< ::CPLXMLNode, decltype(&::CPLDestroyXMLNode)>
    XmlTree;

inline bool isElement(const ::CPLXMLNode *node, const char *name)
{
    return (node->eType == CXT_Element) && !std::strcmp(node->pszValue, name);
}

inline std::string text(const ::CPLXMLNode *node)
{
    return ba::trim_copy(std::string(::CPLGetXMLValue(node, nullptr, "")));
}

/** Returns attribute or child element value, throws if missing.
 */
std::string value(const ::CPLXMLNode *node, const char *name
                  , const char *what)
{
    const char *v(::CPLGetXMLValue(node, name, nullptr));
    if (!v) {
        LOGTHROW(err1, ParseError)
            << "Missing <" << name << "> in " << what << ".";
    }
    return v;
}

double asDouble(std::string raw, const char *name, const char *what)
{
    ba::trim(raw);
    // some servers use decimal comma
    std::replace(raw.begin(), raw.end(), ',', '.');
    try {
        return boost::lexical_cast<double>(raw);
    } catch (const boost::bad_lexical_cast&) {
        LOGTHROW(err1, ParseError)
            << "Value <" << raw << "> of <" << name << "> in " << what
            << " is not a real number.";
    }
    return .0;
}

double number(const ::CPLXMLNode *node, const char *name, const char *what)
{
    return asDouble(value(node, name, what), name, what);
}

BoundingBox parseBoundingBox(const ::CPLXMLNode *node)
{
    BoundingBox bbox;

    // 1.3.0 uses CRS, older versions SRS
    if (const char *crs = ::CPLGetXMLValue(node, "CRS", nullptr)) {
        bbox.crs = crs;
    } else if (const char *srs = ::CPLGetXMLValue(node, "SRS", nullptr)) {
        bbox.crs = srs;
    } else {
        LOGTHROW(err1, ParseError)
            << "BoundingBox without CRS.";
    }

    bbox.extents = math::Extents2
        (number(node, "minx", "BoundingBox")
         , number(node, "miny", "BoundingBox")
         , number(node, "maxx", "BoundingBox")
         , number(node, "maxy", "BoundingBox"));
    return bbox;
}

math::Extents2 parseGeographicBoundingBox(const ::CPLXMLNode *node)
{
    const char *what("EX_GeographicBoundingBox");
    return math::Extents2(number(node, "westBoundLongitude", what)
                          , number(node, "southBoundLatitude", what)
                          , number(node, "eastBoundLongitude", what)
                          , number(node, "northBoundLatitude", what));
}

math::Extents2 parseLatLonBoundingBox(const ::CPLXMLNode *node)
{
    const char *what("LatLonBoundingBox");
    return math::Extents2(number(node, "minx", what)
                          , number(node, "miny", what)
                          , number(node, "maxx", what)
                          , number(node, "maxy", what));
}

/** Parses single layer element. Malformed boxes are fatal only in strict
 *  mode (root layer), nested layers just drop them.
 */
template <typename T, typename Parser>
bool parseElement(T &out, Parser parser, const ::CPLXMLNode *node
                  , const Layer &layer, bool strict)
{
    if (strict) {
        out = parser(node);
        return true;
    }

    try {
        out = parser(node);
        return true;
    } catch (const ParseError &e) {
        LOG(warn2) << "Skipping malformed <" << node->pszValue
                   << "> in layer <" << layer.name << ">: " << e.what();
    }
    return false;
}

void parseLayer(Layer &layer, const ::CPLXMLNode *node, bool strict)
{
    boost::optional<math::Extents2> latLon;

    for (auto child(node->psChild); child; child = child->psNext) {
        if (child->eType != CXT_Element) { continue; }

        if (isElement(child, "Name")) {
            layer.name = text(child);
        } else if (isElement(child, "Title")) {
            layer.title = text(child);
        } else if (isElement(child, "CRS") || isElement(child, "SRS")) {
            // 1.1.x allows space separated list
            std::vector<std::string> codes;
            const auto list(text(child));
            ba::split(codes, list, ba::is_space(), ba::token_compress_on);
            for (const auto &code : codes) {
                if (!code.empty()) { layer.crs.push_back(code); }
            }
        } else if (isElement(child, "BoundingBox")) {
            BoundingBox bbox;
            if (parseElement(bbox, &parseBoundingBox, child, layer, strict)) {
                layer.boundingBoxes.push_back(bbox);
            }
        } else if (isElement(child, "EX_GeographicBoundingBox")) {
            math::Extents2 extents(math::InvalidExtents{});
            if (parseElement(extents, &parseGeographicBoundingBox, child
                             , layer, strict))
            {
                layer.geographicExtents = extents;
            }
        } else if (isElement(child, "LatLonBoundingBox")) {
            math::Extents2 extents(math::InvalidExtents{});
            if (parseElement(extents, &parseLatLonBoundingBox, child
                             , layer, strict))
            {
                latLon = extents;
            }
        } else if (isElement(child, "Layer")) {
            layer.layers.emplace_back();
            parseLayer(layer.layers.back(), child, false);
        }
    }

    if (!layer.geographicExtents && latLon) {
        layer.geographicExtents = latLon;
    }
}

::CPLXMLNode* findRoot(::CPLXMLNode *tree)
{
    for (auto node(tree); node; node = node->psNext) {
        if (isElement(node, "WMS_Capabilities")
            || isElement(node, "WMT_MS_Capabilities"))
        {
            return node;
        }
    }
    return nullptr;
}

} // namespace

Capabilities parseCapabilities(const std::string &xml)
{
    ::CPLErrorReset();
    XmlTree tree(::CPLParseXMLString(xml.c_str()), &::CPLDestroyXMLNode);
    if (!tree) {
        LOGTHROW(err1, ParseError)
            << "Unable to parse capabilities document: <"
            << ::CPLGetLastErrorMsg() << ">.";
    }

    // get rid of wms: and other prefixes
    ::CPLStripXMLNamespace(tree.get(), nullptr, TRUE);

    auto *root(findRoot(tree.get()));
    if (!root) {
        LOGTHROW(err1, ParseError)
            << "Document is not a WMS capabilities document.";
    }

    Capabilities caps;
    caps.version = ::CPLGetXMLValue(root, "version", "");

    auto *capability(::CPLGetXMLNode(root, "Capability"));
    if (!capability) {
        LOGTHROW(err1, ParseError)
            << "Capabilities document without Capability element.";
    }

    const auto *layer(::CPLGetXMLNode(capability, "Layer"));
    if (!layer) {
        LOGTHROW(err1, ParseError)
            << "Capabilities document without root layer.";
    }

    parseLayer(caps.layer, layer, true);

    if (caps.layer.boundingBoxes.empty()) {
        LOGTHROW(err1, ParseError)
            << "Root layer <" << caps.layer.name
            << "> has no bounding box.";
    }

    if (!caps.layer.geographicExtents) {
        LOGTHROW(err1, ParseError)
            << "Root layer <" << caps.layer.name
            << "> has no geographic bounding box.";
    }

    LOG(info2) << "Parsed WMS " << caps.version << " capabilities, root layer <"
               << caps.layer.name << "> with "
               << caps.layer.boundingBoxes.size() << " bounding box(es).";
    return caps;
}

Capabilities loadCapabilities(std::istream &in
                              , const boost::filesystem::path &path)
{
    LOG(info1) << "Loading capabilities from " << path << ".";
    std::ostringstream os;
    os << in.rdbuf();
    return parseCapabilities(os.str());
}

Capabilities loadCapabilities(const boost::filesystem::path &path)
{
    std::ifstream f;
    f.exceptions(std::ios::badbit | std::ios::failbit);
    try {
        f.open(path.string(), std::ios_base::in);
    } catch (const std::exception &e) {
        LOGTHROW(err1, std::runtime_error)
            << "Unable to open capabilities file " << path << ".";
    }
    f.exceptions(std::ios::badbit);
    auto caps(loadCapabilities(f, path));
    f.close();
    return caps;
}

} // namespace mapcrs
