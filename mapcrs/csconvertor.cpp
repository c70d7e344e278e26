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

#include <cmath>
#include <string>
#include <stdexcept>

#include <boost/noncopyable.hpp>

#include <ogr_spatialref.h>
#include <cpl_error.h>

#include "dbglog/dbglog.hpp"

#include "./csconvertor.hpp"

namespace mapcrs {

class CsConvertor::Impl : boost::noncopyable
{
public:
    typedef std::shared_ptr<Impl> pointer;
    virtual ~Impl() {}

    virtual math::Point2 convert(const math::Point2 &p) const = 0;

    virtual pointer inverse() const = 0;

    virtual operator bool() const { return true; };
};

class NoOpConvertor : public CsConvertor::Impl
{
public:
    virtual math::Point2 convert(const math::Point2 &p) const { return p; }

    virtual pointer inverse() const {
        return std::make_shared<NoOpConvertor>();
    }

    virtual operator bool() const { return false; };
};

namespace {

std::unique_ptr< ::OGRCoordinateTransformation>
initOgr(const OGRSpatialReference &from, const std::string &fromName
        , const OGRSpatialReference &to, const std::string &toName)
{
    std::unique_ptr< ::OGRCoordinateTransformation> trans
        (::OGRCreateCoordinateTransformation
         (const_cast<OGRSpatialReference*>(&from)
          , const_cast<OGRSpatialReference*>(&to)));

    if (!trans) {
        LOGTHROW(err1, ProjectionError)
            << "Cannot initialize coordinate system transformation ("
            << fromName <<  " -> " << toName << "): <"
            << ::CPLGetLastErrorMsg() << ">.";
    }
    return trans;
}

class OgrImpl : public CsConvertor::Impl
{
public:
    OgrImpl(const Projection &from, const Projection &to)
        : fromName_(from.code()), toName_(to.code())
        , trans_(initOgr(from.reference(), fromName_
                         , to.reference(), toName_))
    {}

    OgrImpl(const OGRSpatialReference &from, const std::string &fromName
            , const OGRSpatialReference &to, const std::string &toName)
        : fromName_(fromName), toName_(toName)
        , trans_(initOgr(from, fromName_, to, toName_))
    {}

    virtual math::Point2 convert(const math::Point2 &p) const {
        double x(p(0)), y(p(1));
        if (!(trans_->Transform(1, &x, &y))
            || !std::isfinite(x) || !std::isfinite(y))
        {
            LOGTHROW(err1, ProjectionError)
                << "Cannot convert point " << std::fixed << p
                << " between coordinate systems (" << fromName_
                << " -> " << toName_ << "): <"
                << ::CPLGetLastErrorMsg() << ">.";
        }
        return { x, y };
    }

    virtual pointer inverse() const {
        return std::make_shared<OgrImpl>
            (*trans_->GetTargetCS(), toName_
             , *trans_->GetSourceCS(), fromName_);
    }

private:
    std::string fromName_;
    std::string toName_;
    std::unique_ptr< ::OGRCoordinateTransformation> trans_;
};

} // namespace

CsConvertor::CsConvertor(const Projection &from, const Projection &to)
    : trans_(std::make_shared<OgrImpl>(from, to))
{
    LOG(debug) << "Coordinate system transformation ("
               << from.code() << " -> " << to.code() << ").";
}

CsConvertor::CsConvertor()
    : trans_(std::make_shared<NoOpConvertor>())
{}

CsConvertor::CsConvertor(const std::shared_ptr<Impl> &trans)
    : trans_(trans)
{}

math::Point2 CsConvertor::operator()(const math::Point2 &p) const
{
    return trans_->convert(p);
}

CsConvertor CsConvertor::inverse() const
{
    return CsConvertor(trans_->inverse());
}

CsConvertor::operator bool() const
{
    return bool(*trans_);
}

} // namespace mapcrs
