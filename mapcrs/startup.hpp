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

#ifndef mapcrs_startup_hpp_included_
#define mapcrs_startup_hpp_included_

#include <boost/filesystem/path.hpp>

#include "./registry.hpp"
#include "./config.hpp"
#include "./capabilities.hpp"
#include "./reconcile.hpp"

namespace mapcrs {

/** Startup, first phase: seeds registry and collects reconciliation input.
 *
 *  Registers (if not known yet) every configured projection, then the
 *  project projection; CRS:84 is always (re)defined.
 */
ReconciliationInput loadCapabilitiesAndConfig(ProjectionRegistry &registry
                                              , const ProjectConfig &config
                                              , const Capabilities &caps);

/** Same as above but loads capabilities from file.
 *
 *  Malformed, missing or unreadable capabilities are tolerated: returned
 *  input has no bounding boxes and reconciliation is then skipped.
 */
ReconciliationInput
loadCapabilitiesAndConfig(ProjectionRegistry &registry
                          , const ProjectConfig &config
                          , const boost::filesystem::path &capabilitiesPath);

/** Startup, last phase: makes sure map and QGIS project projections are
 *  registered and turns off geodesic point resolution for them.
 */
void disableGeodesicScale(ProjectionRegistry &registry
                          , const ProjectConfig &config);

} // namespace mapcrs

#endif // mapcrs_startup_hpp_included_
