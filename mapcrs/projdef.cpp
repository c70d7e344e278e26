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

#include <vector>

#include <boost/range/iterator_range.hpp>
#include <boost/algorithm/string/split.hpp>
#include <boost/algorithm/string/classification.hpp>
#include <boost/algorithm/string/predicate.hpp>

#include "./projdef.hpp"

namespace ba = boost::algorithm;

namespace mapcrs {

namespace {

typedef boost::iterator_range<std::string::const_iterator> SubString;
typedef std::vector<SubString> Args;
typedef std::pair<SubString, SubString> KeyValue;

inline KeyValue splitArgument(const SubString &arg)
{
    auto b(std::begin(arg));
    auto e(std::end(arg));
    for (auto i(b); i != e; ++i) {
        if (*i == '=') {
            return KeyValue(SubString(b, i), SubString(std::next(i), e));
        }
    }
    return KeyValue(SubString(b, e), SubString());
}

inline Args splitParams(const std::string &params)
{
    Args args;
    ba::split(args, params, ba::is_any_of(" \t\v\r\n\f")
              , ba::token_compress_on);
    return args;
}

inline bool isAxis(const SubString &arg)
{
    return ba::equals(splitArgument(arg).first, "+axis");
}

} // namespace

const char *Crs84Code("CRS:84");

ProjectionDefinition crs84()
{
    return { Crs84Code, "+proj=longlat +datum=WGS84 +no_defs +type=crs" };
}

ProjectionDefinition::ProjectionDefinition(const std::string &code
                                           , const std::string &params)
    : code(code), params(params), axis(axisOrientation(params))
{}

AxisOrientation axisOrientation(const std::string &params)
{
    // last occurrence wins, same as in proj itself
    auto axis(AxisOrientation::unknown);
    for (const auto &arg : splitParams(params)) {
        if (!isAxis(arg)) { continue; }

        const auto value(splitArgument(arg).second);
        if (ba::iequals(value, "enu")) {
            axis = AxisOrientation::enu;
        } else if (ba::iequals(value, "neu")) {
            axis = AxisOrientation::neu;
        } else {
            axis = AxisOrientation::unknown;
        }
    }
    return axis;
}

std::string withAxis(const std::string &params, AxisOrientation axis)
{
    std::string out;
    for (const auto &arg : splitParams(params)) {
        if (arg.empty() || isAxis(arg)) { continue; }
        if (!out.empty()) { out.push_back(' '); }
        out.append(std::begin(arg), std::end(arg));
    }

    const char *token(nullptr);
    switch (axis) {
    case AxisOrientation::enu: token = "+axis=enu"; break;
    case AxisOrientation::neu: token = "+axis=neu"; break;
    case AxisOrientation::unknown: break;
    }

    if (token) {
        if (!out.empty()) { out.push_back(' '); }
        out.append(token);
    }

    return out;
}

} // namespace mapcrs
