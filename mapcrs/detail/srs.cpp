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

#include <string>

#include <ogr_spatialref.h>
#include <cpl_error.h>

#include "dbglog/dbglog.hpp"

#include "../projection.hpp"
#include "./srs.hpp"

namespace mapcrs { namespace detail {

void import(OGRSpatialReference &sr, const ProjectionDefinition &def)
{
    if (def.params.empty()) {
        LOGTHROW(err1, ProjectionError)
            << "Empty proj definition for <" << def.code << ">.";
    }

    auto err(sr.importFromProj4(def.params.c_str()));
    if (err != OGRERR_NONE) {
        LOGTHROW(err1, ProjectionError)
            << "Error parsing proj definition of <" << def.code
            << ">: <" << err << "> (input = " << def.params << "): <"
            << ::CPLGetLastErrorMsg() << ">.";
    }

#if GDAL_VERSION_NUM >= 3000000
    // coordinates are in the order declared by the definition, proj strings
    // are east-north unless they say otherwise
    sr.SetAxisMappingStrategy(OAMS_AUTHORITY_COMPLIANT);
#endif
}

} } // namespace mapcrs::detail
