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

#ifndef mapcrs_config_hpp_included_
#define mapcrs_config_hpp_included_

#include <string>
#include <iostream>

#include <boost/optional.hpp>
#include <boost/filesystem/path.hpp>

#include "./registry.hpp"

namespace mapcrs {

struct ProjectionConfig {
    /** CRS code, empty means unconfigured.
     */
    std::string ref;

    /** Base proj parameter string, without axis override.
     */
    std::string proj4;
};

/** Project configuration, subset relevant to projections.
 */
struct ProjectConfig {
    /** Map projection (options.projection).
     */
    ProjectionConfig projection;

    /** Projection of the QGIS project (options.qgisProjectProjection).
     */
    boost::optional<ProjectionConfig> qgisProjectProjection;

    /** Additional known projections (projections).
     */
    ProjectionRegistry::Definitions projections;
};

/** Parses project configuration from JSON text.
 *
 *  Throws std::runtime_error on malformed document.
 */
ProjectConfig parseConfig(const std::string &json);

ProjectConfig loadConfig(std::istream &in
                         , const boost::filesystem::path &path = "UNKNOWN");

ProjectConfig loadConfig(const boost::filesystem::path &path);

} // namespace mapcrs

#endif // mapcrs_config_hpp_included_
