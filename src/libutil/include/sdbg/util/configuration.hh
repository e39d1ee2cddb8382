#pragma once
///@file

#include "sdbg/util/types.hh"

#include <map>
#include <optional>

namespace sdbg {

/**
 * Runtime configuration of stupid-dbg.
 *
 * Settings are members of a `Config` subclass that register themselves
 * with it on construction:
 *
 *   struct MySettings : Config
 *   {
 *       Setting<std::string> prompt{this, "dbg> ", "prompt", "The REPL prompt."};
 *   };
 *
 * They can then be assigned by name from `stupid-dbg.conf`, from the
 * `SDBG_CONFIG` environment variable, from `--option name value` or
 * from the `--<name>` flag generated for each setting.
 */

class Args;
class AbstractSetting;

class AbstractConfig
{
protected:
    /**
     * Assignments that no setting claimed, by name.
     */
    StringMap unknownSettings;

public:

    virtual ~AbstractConfig() = default;

    /**
     * @return false if there is no setting called `name`.
     * @throws UsageError if `value` is not valid for the setting.
     */
    virtual bool set(const std::string & name, const std::string & value) = 0;

    /**
     * Apply the `name = value` lines in `contents`. `#` starts a
     * comment, blank lines are ignored, and the words after `=` are
     * joined with single spaces. Unknown names are kept for
     * `warnUnknownSettings()`.
     *
     * @param origin Where `contents` came from, for error messages.
     * @throws UsageError on a malformed line or an invalid value.
     */
    void applyConfig(const std::string & contents, const std::string & origin = "<unknown>");

    void warnUnknownSettings();

    /**
     * Add a `--<name>` flag to `args` for every setting, plus
     * `--no-<name>` for booleans.
     */
    virtual void convertToArgs(Args & args, const std::string & category) = 0;
};

class Config : public AbstractConfig
{
    friend class AbstractSetting;

    std::map<std::string, AbstractSetting *> byName;

public:

    bool set(const std::string & name, const std::string & value) override;

    void addSetting(AbstractSetting * setting);

    void convertToArgs(Args & args, const std::string & category) override;
};

class AbstractSetting
{
public:

    const std::string name;

    /**
     * Markdown, with the indentation of the source literal removed.
     */
    const std::string description;

    virtual ~AbstractSetting() = default;

    /**
     * Parse `str` and make it the new value.
     *
     * @throws UsageError if `str` does not parse.
     */
    virtual void set(const std::string & str) = 0;

    virtual std::string to_string() const = 0;

    virtual void convertToArg(Args & args, const std::string & category);

protected:

    AbstractSetting(const std::string & name, const std::string & description);
};

/**
 * A setting holding a `T`. Implemented for `bool`, `unsigned int`,
 * `std::string` and `std::optional<std::string>`.
 */
template<typename T>
class BaseSetting : public AbstractSetting
{
protected:

    T value;

    virtual T parse(const std::string & str) const;

public:

    const T defaultValue;

    BaseSetting(const T & def, const std::string & name, const std::string & description)
        : AbstractSetting(name, description)
        , value(def)
        , defaultValue(def)
    {
    }

    operator const T &() const
    {
        return value;
    }

    const T & get() const
    {
        return value;
    }

    void assign(const T & v)
    {
        value = v;
    }

    void set(const std::string & str) override
    {
        value = parse(str);
    }

    std::string to_string() const override;

    void convertToArg(Args & args, const std::string & category) override;
};

template<>
bool BaseSetting<bool>::parse(const std::string & str) const;
template<>
std::string BaseSetting<bool>::to_string() const;
template<>
void BaseSetting<bool>::convertToArg(Args & args, const std::string & category);
template<>
std::string BaseSetting<std::string>::parse(const std::string & str) const;
template<>
std::string BaseSetting<std::string>::to_string() const;
template<>
std::optional<std::string> BaseSetting<std::optional<std::string>>::parse(const std::string & str) const;
template<>
std::string BaseSetting<std::optional<std::string>>::to_string() const;

extern template class BaseSetting<bool>;
extern template class BaseSetting<unsigned int>;
extern template class BaseSetting<std::string>;
extern template class BaseSetting<std::optional<std::string>>;

template<typename T>
class Setting : public BaseSetting<T>
{
public:
    Setting(Config * config, const T & def, const std::string & name, const std::string & description)
        : BaseSetting<T>(def, name, description)
    {
        config->addSetting(this);
    }
};

/**
 * A path that may be unset. Values are made absolute and normalised,
 * and the empty string unsets it.
 */
class OptionalPathSetting : public BaseSetting<std::optional<Path>>
{
public:

    OptionalPathSetting(
        Config * config, const std::optional<Path> & def, const std::string & name, const std::string & description);

    std::optional<Path> parse(const std::string & str) const override;
};

} // namespace sdbg
