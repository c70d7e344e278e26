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

#ifndef mapcrs_registry_hpp_included_
#define mapcrs_registry_hpp_included_

#include <map>
#include <string>
#include <vector>
#include <stdexcept>

#include <boost/optional.hpp>

#include "./projdef.hpp"
#include "./projection.hpp"

namespace mapcrs {

struct UnknownCrs : public std::runtime_error {
    UnknownCrs(const std::string &msg) : std::runtime_error(msg) {}
};

/** Table of projection definitions and projections derived from them.
 *
 *  One instance per session, handed by reference to everything that
 *  needs projections. Lifecycle: seeded at startup, patched at most once by
 *  axis order reconciliation, read-only afterwards.
 */
class ProjectionRegistry {
public:
    /** code -> proj parameter string
     */
    typedef std::map<std::string, std::string> Definitions;

    ProjectionRegistry();

    /** Seeds registry with given table.
     */
    explicit ProjectionRegistry(const Definitions &definitions);

    /** Registers definition, replaces any existing one for the same code.
     *  Cached projection for code is dropped.
     */
    void define(const std::string &code, const std::string &params);

    /** Registers definition only if code is not known yet. Empty code is
     *  ignored. Returns true if registered.
     */
    bool defineIfUnknown(const std::string &code, const std::string &params);

    boost::optional<ProjectionDefinition>
    lookup(const std::string &code) const;

    bool has(const std::string &code) const;

    std::vector<std::string> codes() const;

    /** Returns projection for given code, builds it on first use.
     *
     *  Throws UnknownCrs if code is not registered and ProjectionError if
     *  its definition cannot be parsed.
     */
    Projection::pointer projection(const std::string &code) const;

    /** Drops all cached projections and rebuilds them from the table.
     *  Definitions that fail to build are left unbuilt.
     */
    void rebuildAll();

    /** Replaces definition for code and rebuilds everything. Use whenever
     *  an axis property changes.
     */
    void commit(const std::string &code, const std::string &params);

    /** Forces custom point resolution function for code. Kept across
     *  rebuilds. Throws UnknownCrs if code is not registered.
     */
    void setPointResolution(const std::string &code
                            , const PointResolution &pointResolution);

    /** Number of rebuilds so far.
     */
    unsigned int generation() const { return generation_; }

private:
    struct Entry {
        ProjectionDefinition definition;
        PointResolution pointResolution;
    };

    typedef std::map<std::string, Entry> Table;
    typedef std::map<std::string, Projection::pointer> Cache;

    const Entry& entry(const std::string &code) const;

    Table table_;
    mutable Cache cache_;
    unsigned int generation_;
};

} // namespace mapcrs

#endif // mapcrs_registry_hpp_included_
