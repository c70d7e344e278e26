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

#ifndef mapcrs_projdef_hpp_included_
#define mapcrs_projdef_hpp_included_

#include <string>
#include <iostream>

#include "utility/enum-io.hpp"

namespace mapcrs {

/** Order of the first two axes of a coordinate reference system.
 *
 *  enu: (east, north), neu: (north, east), unknown: not declared by the
 *  definition.
 */
enum class AxisOrientation { enu, neu, unknown };

/** Single projection registry entry.
 */
struct ProjectionDefinition {
    /** CRS authority code (e.g. "EPSG:2154") or local alias.
     */
    std::string code;

    /** Proj parameter string, may carry "+axis=" override.
     */
    std::string params;

    /** Derived from params.
     */
    AxisOrientation axis;

    ProjectionDefinition() : axis(AxisOrientation::unknown) {}
    ProjectionDefinition(const std::string &code, const std::string &params);
};

/** Extracts axis orientation from proj parameter string.
 *
 *  "+axis=enu" -> enu, "+axis=neu" -> neu, anything else -> unknown.
 */
AxisOrientation axisOrientation(const std::string &params);

/** Returns params with any "+axis=" token removed and given axis order
 *  appended. Passing AxisOrientation::unknown just removes the token.
 *
 *  withAxis(withAxis(p, a), a) == withAxis(p, a)
 */
std::string withAxis(const std::string &params, AxisOrientation axis);

/** Reference geographic CRS code: WGS84 in (longitude, latitude) order.
 */
extern const char *Crs84Code;

/** Reference geographic CRS definition.
 */
ProjectionDefinition crs84();

UTILITY_GENERATE_ENUM_IO(AxisOrientation,
    ((enu))
    ((neu))
    ((unknown))
)

template<typename CharT, typename Traits>
inline std::basic_ostream<CharT, Traits>&
operator<<(std::basic_ostream<CharT, Traits> &os
           , const ProjectionDefinition &def)
{
    return os << def.code << " <" << def.params << ">";
}

} // namespace mapcrs

#endif // mapcrs_projdef_hpp_included_
