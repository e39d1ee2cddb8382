#pragma once
///@file

#include "sdbg/util/configuration.hh"

#include <vector>

namespace sdbg {

/**
 * Forwards to every `Config` registered with `GlobalConfig::Register`,
 * so that configuration files and `--option` reach settings wherever
 * they are defined.
 */
struct GlobalConfig : public AbstractConfig
{
    static std::vector<Config *> & configRegistrations();

    bool set(const std::string & name, const std::string & value) override;

    void convertToArgs(Args & args, const std::string & category) override;

    /**
     * Register a `Config` at static initialisation time:
     *
     *   static GlobalConfig::Register rSettings(&settings);
     */
    struct Register
    {
        Register(Config * config);
    };
};

extern GlobalConfig globalConfig;

} // namespace sdbg
