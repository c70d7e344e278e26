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

namespace po = boost::program_options;
namespace fs = boost::filesystem;

namespace {

class Reconcile : public service::Cmdline
{
public:
    Reconcile()
        : Cmdline("mapcrs-reconcile", BUILD_TARGET_VERSION
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
    mapcrs::ReconcilerOptions options_;
};

void Reconcile::configuration(po::options_description &cmdline
                              , po::options_description &config
                              , po::positional_options_description &pd)
{
    cmdline.add_options()
        ("config", po::value(&config_)->required()
         , "Project configuration (JSON).")
        ("capabilities", po::value(&capabilities_)->required()
         , "WMS capabilities document (XML).")
        ("tolerance", po::value(&options_.tolerance)
         ->default_value(options_.tolerance)
         , "Relative tolerance of axis order proximity test.")
    ;

    pd
        .add("config", 1)
        .add("capabilities", 1)
        ;

    (void) config;
}

void Reconcile::configure(const po::variables_map &vars)
{
    (void) vars;
}

bool Reconcile::help(std::ostream &out, const std::string &what) const
{
    if (what.empty()) {
        out << R"RAW(mapcrs-reconcile: checks axis order of project CRS
against WMS capabilities and prints resulting projection definition
)RAW";
    }
    return false;
}

int Reconcile::run()
{
    const auto config(mapcrs::loadConfig(config_));

    mapcrs::ProjectionRegistry registry;
    const auto input(mapcrs::loadCapabilitiesAndConfig
                     (registry, config, capabilities_));
    const auto outcome(mapcrs::reconcile(input, registry, options_));
    mapcrs::disableGeodesicScale(registry, config);

    std::cout << "outcome: " << outcome << std::endl;
    if (const auto def = registry.lookup(input.projectRef)) {
        std::cout << "projection: " << def->code
                  << "\naxis: " << def->axis
                  << "\nparams: " << def->params
                  << std::endl;
    }

    return EXIT_SUCCESS;
}

} // namespace

int main(int argc, char *argv[])
{
    return Reconcile()(argc, argv);
}
