#include "sdbg/util/configuration.hh"
#include "sdbg/util/args.hh"
#include "sdbg/util/file-system.hh"
#include "sdbg/util/logging.hh"
#include "sdbg/util/strings.hh"

namespace sdbg {

void AbstractConfig::applyConfig(const std::string & contents, const std::string & origin)
{
    for (auto & rawLine : tokenizeString<Strings>(contents, "\n")) {
        auto line = rawLine.substr(0, rawLine.find('#'));

        auto words = tokenizeString<std::vector<std::string>>(line);
        if (words.empty())
            continue;
        if (words.size() < 2 || words[1] != "=")
            throw UsageError("syntax error in configuration line '%s' in '%s'", trim(line), origin);

        auto value = concatStringsSep(" ", std::vector<std::string>(words.begin() + 2, words.end()));
        if (!set(words[0], value))
            unknownSettings.insert_or_assign(words[0], value);
    }
}

void AbstractConfig::warnUnknownSettings()
{
    for (auto & [name, value] : unknownSettings)
        warn("unknown setting '%s'", name);
}

bool Config::set(const std::string & name, const std::string & value)
{
    auto i = byName.find(name);
    if (i == byName.end())
        return false;
    i->second->set(value);
    return true;
}

void Config::addSetting(AbstractSetting * setting)
{
    byName.emplace(setting->name, setting);

    /* A value may have been assigned before the setting existed. */
    if (auto i = unknownSettings.find(setting->name); i != unknownSettings.end()) {
        setting->set(i->second);
        unknownSettings.erase(i);
    }
}

void Config::convertToArgs(Args & args, const std::string & category)
{
    for (auto & [name, setting] : byName)
        setting->convertToArg(args, category);
}

AbstractSetting::AbstractSetting(const std::string & name, const std::string & description)
    : name(name)
    , description(stripIndentation(description))
{
}

void AbstractSetting::convertToArg(Args & args, const std::string & category)
{
    args.addFlag({
        .longName = name,
        .description = fmt("Set the `%s` setting.", name),
        .category = category,
        .labels = {"value"},
        .handler = {[this](std::string s) { set(s); }},
    });
}

template<typename T>
T BaseSetting<T>::parse(const std::string & str) const
{
    static_assert(std::is_integral_v<T>);
    if (auto n = string2Int<T>(str))
        return *n;
    throw UsageError("setting '%s' has invalid value '%s'", name, str);
}

template<typename T>
std::string BaseSetting<T>::to_string() const
{
    static_assert(std::is_integral_v<T>);
    return std::to_string(value);
}

template<typename T>
void BaseSetting<T>::convertToArg(Args & args, const std::string & category)
{
    AbstractSetting::convertToArg(args, category);
}

template<>
bool BaseSetting<bool>::parse(const std::string & str) const
{
    if (str == "true" || str == "yes" || str == "1")
        return true;
    if (str == "false" || str == "no" || str == "0")
        return false;
    throw UsageError("Boolean setting '%s' has invalid value '%s'", name, str);
}

template<>
std::string BaseSetting<bool>::to_string() const
{
    return value ? "true" : "false";
}

template<>
void BaseSetting<bool>::convertToArg(Args & args, const std::string & category)
{
    for (bool enable : {true, false})
        args.addFlag({
            .longName = (enable ? "" : "no-") + name,
            .description = fmt("%s the `%s` setting.", enable ? "Enable" : "Disable", name),
            .category = category,
            .handler = {[this, enable]() { value = enable; }},
        });
}

template<>
std::string BaseSetting<std::string>::parse(const std::string & str) const
{
    return str;
}

template<>
std::string BaseSetting<std::string>::to_string() const
{
    return value;
}

template<>
std::optional<std::string> BaseSetting<std::optional<std::string>>::parse(const std::string & str) const
{
    if (str.empty())
        return std::nullopt;
    return str;
}

template<>
std::string BaseSetting<std::optional<std::string>>::to_string() const
{
    return value.value_or("");
}

template class BaseSetting<bool>;
template class BaseSetting<unsigned int>;
template class BaseSetting<std::string>;
template class BaseSetting<std::optional<std::string>>;

OptionalPathSetting::OptionalPathSetting(
    Config * config, const std::optional<Path> & def, const std::string & name, const std::string & description)
    : BaseSetting<std::optional<Path>>(def, name, description)
{
    config->addSetting(this);
}

std::optional<Path> OptionalPathSetting::parse(const std::string & str) const
{
    if (str.empty())
        return std::nullopt;
    return absPath(str);
}

} // namespace sdbg
