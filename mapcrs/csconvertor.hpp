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

#ifndef mapcrs_csconvertor_hpp_included_
#define mapcrs_csconvertor_hpp_included_

#include <memory>

#include "math/geometry_core.hpp"

#include "./projection.hpp"

namespace mapcrs {

/** Converts coordinates between two projections. Coordinates are in the
 *  axis order of the respective projection definition.
 */
class CsConvertor {
public:
    /** Throws ProjectionError when transformation cannot be set up.
     */
    CsConvertor(const Projection &from, const Projection &to);

    /** Creates no-op CS convertor. No conversion takes place.
     */
    CsConvertor();

    /** Throws ProjectionError when point cannot be converted.
     */
    math::Point2 operator()(const math::Point2 &p) const;

    // return extents containing original extents
    math::Extents2 operator()(const math::Extents2 &e) const;

    CsConvertor inverse() const;

    /** False for no-op convertor.
     */
    operator bool() const;

    class Impl;

private:
    CsConvertor(const std::shared_ptr<Impl> &trans);
    std::shared_ptr<Impl> trans_;
};

// inline method implementation

inline math::Extents2 CsConvertor::operator()(const math::Extents2 &e) const
{
    math::Extents2 res(operator()( ll(e) ));
    update(res, operator()( ul(e) ));
    update(res, operator()( ur(e) ));
    update(res, operator()( lr(e) ));
    return res;
}

} // namespace mapcrs

#endif // mapcrs_csconvertor_hpp_included_
