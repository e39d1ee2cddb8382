#include "sdbg/util/config-global.hh"

#include <algorithm>

namespace sdbg {

std::vector<Config *> & GlobalConfig::configRegistrations()
{
    static std::vector<Config *> configs;
    return configs;
}

bool GlobalConfig::set(const std::string & name, const std::string & value)
{
    auto & configs = configRegistrations();
    return std::any_of(configs.begin(), configs.end(), [&](Config * config) { return config->set(name, value); });
}

void GlobalConfig::convertToArgs(Args & args, const std::string & category)
{
    for (auto * config : configRegistrations())
        config->convertToArgs(args, category);
}

GlobalConfig globalConfig;

GlobalConfig::Register::Register(Config * config)
{
    configRegistrations().push_back(config);
}

} // namespace sdbg
