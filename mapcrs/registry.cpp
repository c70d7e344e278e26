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

#include <proj.h>

#include "dbglog/dbglog.hpp"

#include "./registry.hpp"

namespace mapcrs {

ProjectionRegistry::ProjectionRegistry()
    : generation_()
{
    LOG(info1) << "Projection registry using PROJ "
               << ::proj_info().release << ".";
}

ProjectionRegistry::ProjectionRegistry(const Definitions &definitions)
    : ProjectionRegistry()
{
    for (const auto &item : definitions) {
        define(item.first, item.second);
    }
}

void ProjectionRegistry::define(const std::string &code
                                , const std::string &params)
{
    auto &e(table_[code]);
    e.definition = ProjectionDefinition(code, params);
    cache_.erase(code);

    LOG(info2) << "Defined projection " << e.definition << ".";
}

bool ProjectionRegistry::defineIfUnknown(const std::string &code
                                         , const std::string &params)
{
    if (code.empty() || has(code)) { return false; }
    define(code, params);
    return true;
}

boost::optional<ProjectionDefinition>
ProjectionRegistry::lookup(const std::string &code) const
{
    auto ftable(table_.find(code));
    if (ftable == table_.end()) { return boost::none; }
    return ftable->second.definition;
}

bool ProjectionRegistry::has(const std::string &code) const
{
    return table_.find(code) != table_.end();
}

std::vector<std::string> ProjectionRegistry::codes() const
{
    std::vector<std::string> out;
    for (const auto &item : table_) { out.push_back(item.first); }
    return out;
}

const ProjectionRegistry::Entry&
ProjectionRegistry::entry(const std::string &code) const
{
    auto ftable(table_.find(code));
    if (ftable == table_.end()) {
        LOGTHROW(err1, UnknownCrs)
            << "Unknown CRS <" << code << ">.";
    }
    return ftable->second;
}

Projection::pointer
ProjectionRegistry::projection(const std::string &code) const
{
    auto fcache(cache_.find(code));
    if (fcache != cache_.end()) { return fcache->second; }

    const auto &e(entry(code));
    Projection::pointer proj(std::make_shared<Projection>
                             (e.definition, e.pointResolution));
    cache_.insert(Cache::value_type(code, proj));
    return proj;
}

void ProjectionRegistry::rebuildAll()
{
    ++generation_;
    LOG(info2) << "Rebuilding all projections (generation "
               << generation_ << ").";

    cache_.clear();
    for (const auto &item : table_) {
        try {
            projection(item.first);
        } catch (const ProjectionError &e) {
            LOG(warn2)
                << "Projection <" << item.first
                << "> left unbuilt: " << e.what();
        }
    }
}

void ProjectionRegistry::commit(const std::string &code
                                , const std::string &params)
{
    LOG(info3) << "Committing projection <" << code << "> as <"
               << params << ">.";
    define(code, params);
    rebuildAll();
}

void ProjectionRegistry::setPointResolution
(const std::string &code, const PointResolution &pointResolution)
{
    auto ftable(table_.find(code));
    if (ftable == table_.end()) {
        LOGTHROW(err1, UnknownCrs)
            << "Cannot set point resolution of unknown CRS <"
            << code << ">.";
    }

    ftable->second.pointResolution = pointResolution;
    cache_.erase(code);
}

} // namespace mapcrs
