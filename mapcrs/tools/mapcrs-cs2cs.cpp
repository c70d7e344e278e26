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

#include <cstdlib>
#include <string>
#include <iostream>

#include "dbglog/dbglog.hpp"

#include "service/cmdline.hpp"
#include "utility/gccversion.hpp"
#include "utility/buildsys.hpp"

#include "mapcrs/startup.hpp"
#include "mapcrs/transform.hpp"

namespace po = boost::program_options;
namespace fs = boost::filesystem;

namespace {

class Cs2Cs : public service::Cmdline
{
public:
    Cs2Cs()
        : Cmdline("mapcrs-cs2cs", BUILD_TARGET_VERSION
                  , service::DISABLE_EXCESSIVE_LOGGING)
    {
    }

private:
    virtual void configuration(po::options_description &cmdline
                               , po::options_description &config
                               , po::positional_options_description &pd)
        UTILITY_OVERRIDE;

    virtual void configure(const po::variables_map &vars)
        UTILITY_OVERRIDE;

    virtual bool help(std::ostream &out, const std::string &what) const
        UTILITY_OVERRIDE;

    virtual int run() UTILITY_OVERRIDE;

    fs::path config_;
    fs::path capabilities_;
    std::string src_;
    std::string dst_;
};

void Cs2Cs::configuration(po::options_description &cmdline
                          , po::options_description &config
                          , po::positional_options_description &pd)
{
    cmdline.add_options()
        ("config", po::value(&config_)->required()
         , "Project configuration (JSON).")
        ("capabilities", po::value(&capabilities_)->required()
         , "WMS capabilities document (XML).")
        ("src", po::value(&src_)->required()
         , "Source CRS code.")
        ("dst", po::value(&dst_)->required()
         , "Destination CRS code.")
    ;

    pd
        .add("src", 1)
        .add("dst", 1)
        ;

    (void) config;
}

void Cs2Cs::configure(const po::variables_map &vars)
{
    (void) vars;
}

bool Cs2Cs::help(std::ostream &out, const std::string &what) const
{
    if (what.empty()) {
        out << R"RAW(mapcrs-cs2cs: converts "x y" pairs read from stdin
between two registered CRS codes after axis order reconciliation
)RAW";
    }
    return false;
}

int Cs2Cs::run()
{
    const auto config(mapcrs::loadConfig(config_));

    mapcrs::ProjectionRegistry registry;
    mapcrs::reconcile(mapcrs::loadCapabilitiesAndConfig
                      (registry, config, capabilities_)
                      , registry);
    mapcrs::disableGeodesicScale(registry, config);

    const mapcrs::TransformFacade transform(registry);
    const auto conv(transform.convertor(src_, dst_));

    double x, y;
    while (std::cin >> x >> y) {
        const auto res(conv(math::Point2(x, y)));
        std::cout << std::fixed << res(0)
                  << " " << res(1)
                  << std::endl;
    }

    return EXIT_SUCCESS;
}

} // namespace

int main(int argc, char *argv[])
{
    return Cs2Cs()(argc, argv);
}
