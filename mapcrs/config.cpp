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

#include <fstream>
#include <sstream>
#include <stdexcept>

#include "dbglog/dbglog.hpp"

#include "jsoncpp/json.hpp"
#include "jsoncpp/as.hpp"

#include "./config.hpp"

namespace mapcrs {

namespace {

void parse(ProjectionConfig &projection, const Json::Value &value)
{
    Json::check(value, Json::objectValue);
    Json::get(projection.ref, value, "ref");

    // proj4 may be missing for unconfigured projection
    if (value.isMember("proj4")) {
        Json::get(projection.proj4, value, "proj4");
    }
}

void parse(ProjectConfig &config, const Json::Value &value)
{
    const auto &options(Json::check(value["options"], Json::objectValue));
    parse(config.projection, options["projection"]);

    if (options.isMember("qgisProjectProjection")) {
        config.qgisProjectProjection = ProjectionConfig();
        parse(*config.qgisProjectProjection
              , options["qgisProjectProjection"]);
    }

    if (value.isMember("projections")) {
        const auto &projections
            (Json::check(value["projections"], Json::objectValue));
        for (const auto &code : projections.getMemberNames()) {
            std::string params;
            Json::get(params, projections, code.c_str());
            config.projections[code] = params;
        }
    }
}

} // namespace

ProjectConfig loadConfig(std::istream &in
                         , const boost::filesystem::path &path)
{
    LOG(info1) << "Loading project configuration from " << path << ".";

    Json::Value content;
    Json::Reader reader;
    if (!reader.parse(in, content)) {
        LOGTHROW(err2, std::runtime_error)
            << "Unable to parse project configuration " << path << ": "
            << reader.getFormattedErrorMessages() << ".";
    }

    ProjectConfig config;
    try {
        parse(config, content);
    } catch (const std::exception &e) {
        LOGTHROW(err2, std::runtime_error)
            << "Invalid project configuration " << path << ": "
            << e.what();
    }

    LOG(info2) << "Project projection: <" << config.projection.ref
               << "> <" << config.projection.proj4 << ">.";
    return config;
}

ProjectConfig parseConfig(const std::string &json)
{
    std::istringstream is(json);
    return loadConfig(is);
}

ProjectConfig loadConfig(const boost::filesystem::path &path)
{
    std::ifstream f;
    f.exceptions(std::ios::badbit | std::ios::failbit);
    try {
        f.open(path.string(), std::ios_base::in);
    } catch (const std::exception &e) {
        LOGTHROW(err1, std::runtime_error)
            << "Unable to open project configuration " << path << ".";
    }
    f.exceptions(std::ios::badbit);
    auto config(loadConfig(f, path));
    f.close();
    return config;
}

} // namespace mapcrs
