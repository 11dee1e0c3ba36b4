#include "awsctx/util/configuration.hh"
#include "awsctx/util/config-impl.hh"
#include "awsctx/util/file-system.hh"
#include "awsctx/util/logging.hh"
#include "awsctx/util/strings.hh"
#include "awsctx/util/users.hh"

#include <set>

#include <nlohmann/json.hpp>

namespace awsctx {

bool Config::set(const std::string & name, const std::string & value, std::string_view origin)
{
    auto i = _settings.find(name);
    if (i == _settings.end())
        return false;
    i->second->set(value);
    i->second->origin = origin;
    return true;
}

void Config::addSetting(AbstractSetting * setting)
{
    _settings.emplace(setting->name, setting);

    if (auto i = unknownSettings.find(setting->name); i != unknownSettings.end()) {
        setting->set(i->second.value);
        setting->origin = i->second.origin;
        unknownSettings.erase(i);
    }
}

void AbstractConfig::warnUnknownSettings()
{
    for (const auto & [name, s] : unknownSettings)
        warn("unknown setting '%s' in '%s'", name, s.origin);
}

void Config::getSettings(std::map<std::string, SettingInfo> & res, bool overriddenOnly) const
{
    for (const auto & [name, setting] : _settings)
        if (!overriddenOnly || setting->isOverridden())
            res.emplace(name, SettingInfo{setting->to_string(), setting->description, setting->origin});
}

struct ConfigLine
{
    std::string name;
    std::string value;
    std::string origin;
};

/**
 * Split `contents` into `name = value` assignments, following
 * `include` and `!include` directives relative to `path`.
 */
static void parseConfigFiles(const std::string & contents, const std::string & path, std::vector<ConfigLine> & res)
{
    for (auto & rawLine : tokenizeString<Strings>(contents, "\n")) {
        auto line = rawLine;
        if (auto hash = line.find('#'); hash != line.npos)
            line = std::string(line, 0, hash);

        auto tokens = tokenizeString<std::vector<std::string>>(line);
        if (tokens.empty())
            continue;

        if (tokens[0] == "include" || tokens[0] == "!include") {
            if (tokens.size() != 2)
                throw UsageError("syntax error in configuration line '%s' in '%s'", line, path);
            auto included = (std::filesystem::path(path).parent_path() / tokens[1]).lexically_normal();
            if (pathExists(included))
                parseConfigFiles(readFile(included), included.string(), res);
            else if (tokens[0] == "include")
                throw Error("file '%s' included from '%s' not found", included.string(), path);
            continue;
        }

        if (tokens.size() < 2 || tokens[1] != "=")
            throw UsageError("syntax error in configuration line '%s' in '%s'", line, path);

        res.push_back({
            .name = tokens[0],
            .value = concatStringsSep(" ", Strings(tokens.begin() + 2, tokens.end())),
            .origin = path,
        });
    }
}

void AbstractConfig::applyConfig(const std::string & contents, const std::string & path)
{
    std::vector<ConfigLine> lines;

    parseConfigFiles(contents, path, lines);

    for (const auto & line : lines) {
        try {
            if (!set(line.name, line.value, line.origin))
                unknownSettings.insert_or_assign(line.name, UnknownSetting{line.value, line.origin});
        } catch (Error & e) {
            e.addTrace("while applying setting '%s' from '%s'", line.name, line.origin);
            throw;
        }
    }
}

nlohmann::json Config::toJSON()
{
    auto res = nlohmann::json::object();
    for (const auto & [name, setting] : _settings)
        res.emplace(name, setting->toJSON());
    return res;
}

AbstractSetting::AbstractSetting(const std::string & name, const std::string & description)
    : name(name)
    , description(stripIndentation(description))
{
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

/* An empty value unsets an optional setting. */
template<>
std::optional<std::string> BaseSetting<std::optional<std::string>>::parse(const std::string & str) const
{
    return str.empty() ? std::nullopt : std::optional<std::string>{str};
}

template<>
std::string BaseSetting<std::optional<std::string>>::to_string() const
{
    return value.value_or("");
}

template<>
bool BaseSetting<bool>::parse(const std::string & str) const
{
    static const std::set<std::string> truthy{"true", "yes", "1"}, falsy{"false", "no", "0"};
    if (truthy.count(str))
        return true;
    if (falsy.count(str))
        return false;
    throw UsageError("setting '%s' expects a boolean, got '%s'", name, str);
}

template<>
std::string BaseSetting<bool>::to_string() const
{
    return value ? "true" : "false";
}

template class BaseSetting<int>;
template class BaseSetting<unsigned int>;
template class BaseSetting<long>;
template class BaseSetting<unsigned long>;
template class BaseSetting<bool>;
template class BaseSetting<std::string>;
template class BaseSetting<std::optional<std::string>>;

PathSetting::PathSetting(Config * options, const Path & def, const std::string & name, const std::string & description)
    : BaseSetting<Path>(def, name, description)
{
    options->addSetting(this);
}

Path PathSetting::parse(const std::string & str) const
{
    if (str == "")
        throw UsageError("setting '%s' is a path and paths cannot be empty", name);

    auto p = std::filesystem::absolute(expandTilde(str)).lexically_normal().string();
    while (p.size() > 1 && p.back() == '/')
        p.pop_back();
    return p;
}

} // namespace awsctx
