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

#ifndef mapcrs_transform_hpp_included_
#define mapcrs_transform_hpp_included_

#include <string>

#include "math/geometry_core.hpp"

#include "./registry.hpp"
#include "./csconvertor.hpp"

namespace mapcrs {

/** Coordinate transformations between registered CRS codes.
 *
 *  Always uses current registry content, i.e. results for the project CRS
 *  are valid only after axis order reconciliation has been run.
 *
 *  Throws UnknownCrs if either code is not registered and ProjectionError
 *  when transformation fails.
 */
class TransformFacade {
public:
    TransformFacade(const ProjectionRegistry &registry)
        : registry_(registry)
    {}

    math::Point2 transformPoint(const math::Point2 &point
                                , const std::string &src
                                , const std::string &dst) const;

    math::Extents2 transformExtent(const math::Extents2 &extents
                                   , const std::string &src
                                   , const std::string &dst) const;

    /** Convertor between two codes, no-op one if codes are the same.
     */
    CsConvertor convertor(const std::string &src
                          , const std::string &dst) const;

private:
    const ProjectionRegistry &registry_;
};

} // namespace mapcrs

#endif // mapcrs_transform_hpp_included_
