#pragma once
///@file

#include <map>
#include <optional>

#include <nlohmann/json_fwd.hpp>

#include "awsctx/util/types.hh"

namespace awsctx {

/**
 * A configuration is a collection of uniquely named settings. Each
 * `Setting` holds a typed value, its default, a description and the
 * origin of the current value, and registers itself with the `Config`
 * it is declared in:
 *
 *   struct MySettings : Config
 *   {
 *       Setting<unsigned int> timeout{this, 30, "timeout", "Seconds to wait."};
 *   };
 *
 * Settings are set from `name = value` lines (see `applyConfig()`), by
 * name (see `set()`), or directly from code.
 */

class AbstractSetting;

class AbstractConfig
{
protected:

    struct UnknownSetting
    {
        std::string value;
        std::string origin;
    };

    /**
     * Settings that were set before anything registered them. A
     * setting registered later picks up its value from here.
     */
    std::map<std::string, UnknownSetting> unknownSettings;

public:

    /**
     * Origin of a value that nobody has set.
     */
    static constexpr std::string_view defaultOrigin = "default";

    /**
     * Origin of a value assigned from code.
     */
    static constexpr std::string_view codeOrigin = "<code>";

    /**
     * Parse `value` and assign it to the setting called `name`,
     * recording `origin` as where it came from.
     *
     * @return Whether the setting is known.
     */
    virtual bool set(const std::string & name, const std::string & value, std::string_view origin = codeOrigin) = 0;

    struct SettingInfo
    {
        std::string value;
        std::string description;
        std::string origin;
    };

    /**
     * Add the registered settings to `res`; with `overriddenOnly`,
     * only those that no longer have their default origin.
     */
    virtual void getSettings(std::map<std::string, SettingInfo> & res, bool overriddenOnly = false) const = 0;

    /**
     * Parse the configuration in `contents` and apply it. `path` names
     * the source in error messages and origins, and is the base for
     * relative `include` directives.
     */
    void applyConfig(const std::string & contents, const std::string & path = "<unknown>");

    virtual nlohmann::json toJSON() = 0;

    /**
     * Log a warning for each setting that was set but never
     * registered.
     */
    void warnUnknownSettings();

    virtual ~AbstractConfig() = default;
};

class Config : public AbstractConfig
{
    std::map<std::string, AbstractSetting *> _settings;

public:

    bool set(const std::string & name, const std::string & value, std::string_view origin = codeOrigin) override;

    void addSetting(AbstractSetting * setting);

    void getSettings(std::map<std::string, SettingInfo> & res, bool overriddenOnly = false) const override;

    nlohmann::json toJSON() override;
};

class AbstractSetting
{
    friend class Config;

public:

    const std::string name;
    const std::string description;

    /**
     * Where the current value came from: a configuration file,
     * `codeOrigin` or `defaultOrigin`.
     */
    std::string origin{AbstractConfig::defaultOrigin};

    bool isOverridden() const
    {
        return origin != AbstractConfig::defaultOrigin;
    }

protected:

    AbstractSetting(const std::string & name, const std::string & description);

    virtual ~AbstractSetting() = default;

    virtual void set(const std::string & value) = 0;

    virtual std::string to_string() const = 0;

    virtual nlohmann::json toJSON() const = 0;
};

/**
 * A setting of type T.
 */
template<typename T>
class BaseSetting : public AbstractSetting
{
protected:

    T value;
    const T defaultValue;

    /**
     * Parse the string into a `T`. Throws `UsageError` if `str` is not
     * a valid value.
     */
    virtual T parse(const std::string & str) const;

public:

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

    template<typename U>
    bool operator==(const U & v2) const
    {
        return value == v2;
    }

    template<typename U>
    void operator=(const U & v)
    {
        assign(v);
    }

    void assign(const T & v)
    {
        value = v;
        origin = AbstractConfig::codeOrigin;
    }

    /**
     * Restore the default value and origin.
     */
    void reset()
    {
        value = defaultValue;
        origin = AbstractConfig::defaultOrigin;
    }

    void set(const std::string & str) override final
    {
        value = parse(str);
    }

    std::string to_string() const override;

    nlohmann::json toJSON() const override;
};

template<typename T>
std::ostream & operator<<(std::ostream & str, const BaseSetting<T> & opt)
{
    return str << static_cast<const T &>(opt);
}

template<typename T>
class Setting : public BaseSetting<T>
{
public:
    Setting(Config * options, const T & def, const std::string & name, const std::string & description)
        : BaseSetting<T>(def, name, description)
    {
        options->addSetting(this);
    }

    void operator=(const T & v)
    {
        this->assign(v);
    }
};

/**
 * A setting holding a path. Values are made absolute and normalised
 * (e.g. "/foo//bar/" becomes "/foo/bar"), with a leading `~` expanded
 * to the home directory. The empty string is rejected.
 */
class PathSetting : public BaseSetting<Path>
{
public:

    PathSetting(Config * options, const Path & def, const std::string & name, const std::string & description);

    Path parse(const std::string & str) const override;

    void operator=(const Path & v)
    {
        this->assign(v);
    }
};

} // namespace awsctx
