#include "corvus/options.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <stdexcept>
#include <system_error>

#include <nlohmann/json.hpp>

namespace corvus::config
{
namespace
{
namespace fs = std::filesystem;

constexpr const char *kConfigDirectoryName = "corvus";
constexpr const char *kDefaultsFileName = "defaults.json";

std::string lowercase(const std::string &value)
{
    std::string lowered;
    lowered.reserve(value.size());
    for (char ch : value)
        lowered.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(ch))));
    return lowered;
}

bool parseBool(const std::string &value, bool fallback)
{
    const std::string lowered = lowercase(value);
    if (lowered == "true" || lowered == "yes" || lowered == "on" || lowered == "1")
        return true;
    if (lowered == "false" || lowered == "no" || lowered == "off" || lowered == "0")
        return false;
    return fallback;
}

std::int64_t parseInteger(const std::string &value, std::int64_t fallback)
{
    try
    {
        std::size_t consumed = 0;
        std::int64_t parsed = std::stoll(value, &consumed, 0);
        if (consumed == value.size())
            return parsed;
    }
    catch (const std::invalid_argument &)
    {
    }
    catch (const std::out_of_range &)
    {
    }
    return fallback;
}

nlohmann::json toJson(const OptionValue &value)
{
    switch (value.type())
    {
    case OptionValueType::Boolean:
        return value.toBool();
    case OptionValueType::Integer:
        return value.toInteger();
    case OptionValueType::String:
        return value.toString();
    case OptionValueType::StringList:
        return value.toStringList();
    case OptionValueType::None:
        break;
    }
    return nullptr;
}

OptionValue fromJson(const nlohmann::json &json)
{
    if (json.is_boolean())
        return OptionValue(json.get<bool>());
    if (json.is_number_integer())
        return OptionValue(json.get<std::int64_t>());
    if (json.is_string())
        return OptionValue(json.get<std::string>());
    if (json.is_array())
    {
        std::vector<std::string> items;
        for (const auto &item : json)
        {
            if (item.is_string())
                items.push_back(item.get<std::string>());
        }
        return OptionValue(std::move(items));
    }
    return OptionValue();
}

fs::path detectConfigRoot()
{
    if (const char *xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg)
        return fs::path(xdg) / kConfigDirectoryName;
    if (const char *home = std::getenv("HOME"); home && *home)
        return fs::path(home) / ".config" / kConfigDirectoryName;
    return fs::path(".config") / kConfigDirectoryName;
}

void assignError(std::string *errorMessage, std::string text)
{
    if (errorMessage)
        *errorMessage = std::move(text);
}

} // namespace

OptionValue::OptionValue(bool value)
    : value(value)
{
}

OptionValue::OptionValue(std::int64_t value)
    : value(value)
{
}

OptionValue::OptionValue(std::string value)
    : value(std::move(value))
{
}

OptionValue::OptionValue(std::vector<std::string> value)
    : value(std::move(value))
{
}

OptionValueType OptionValue::type() const noexcept
{
    if (std::holds_alternative<bool>(value))
        return OptionValueType::Boolean;
    if (std::holds_alternative<std::int64_t>(value))
        return OptionValueType::Integer;
    if (std::holds_alternative<std::string>(value))
        return OptionValueType::String;
    if (std::holds_alternative<std::vector<std::string>>(value))
        return OptionValueType::StringList;
    return OptionValueType::None;
}

bool OptionValue::isNull() const noexcept
{
    return std::holds_alternative<std::monostate>(value);
}

bool OptionValue::toBool(bool fallback) const noexcept
{
    if (const auto *flag = std::get_if<bool>(&value))
        return *flag;
    if (const auto *number = std::get_if<std::int64_t>(&value))
        return *number != 0;
    if (const auto *text = std::get_if<std::string>(&value))
        return parseBool(*text, fallback);
    return fallback;
}

std::int64_t OptionValue::toInteger(std::int64_t fallback) const noexcept
{
    if (const auto *number = std::get_if<std::int64_t>(&value))
        return *number;
    if (const auto *flag = std::get_if<bool>(&value))
        return *flag ? 1 : 0;
    if (const auto *text = std::get_if<std::string>(&value))
        return parseInteger(*text, fallback);
    return fallback;
}

std::string OptionValue::toString(const std::string &fallback) const
{
    if (const auto *text = std::get_if<std::string>(&value))
        return *text;
    if (const auto *flag = std::get_if<bool>(&value))
        return *flag ? "true" : "false";
    if (const auto *number = std::get_if<std::int64_t>(&value))
        return std::to_string(*number);
    return fallback;
}

std::vector<std::string> OptionValue::toStringList() const
{
    if (const auto *list = std::get_if<std::vector<std::string>>(&value))
        return *list;
    if (const auto *text = std::get_if<std::string>(&value))
        return {*text};
    return {};
}

OptionRegistry::OptionRegistry(std::string appId)
    : id(std::move(appId))
{
}

void OptionRegistry::registerOption(const OptionDefinition &definition)
{
    definitions[definition.key] = definition;
    auto it = overrides.find(definition.key);
    if (it != overrides.end())
        it->second = coerce(definition, it->second);
}

bool OptionRegistry::hasOption(const std::string &key) const noexcept
{
    return definitions.find(key) != definitions.end();
}

void OptionRegistry::set(const std::string &key, const OptionValue &value)
{
    if (const OptionDefinition *definition = findDefinition(key))
        overrides[key] = coerce(*definition, value);
}

void OptionRegistry::reset(const std::string &key)
{
    overrides.erase(key);
}

void OptionRegistry::resetToDefaults() noexcept
{
    overrides.clear();
}

OptionValue OptionRegistry::get(const std::string &key) const
{
    if (auto it = overrides.find(key); it != overrides.end())
        return it->second;
    if (const OptionDefinition *definition = findDefinition(key))
        return definition->defaultValue;
    return OptionValue();
}

bool OptionRegistry::getBool(const std::string &key, bool fallback) const
{
    return get(key).toBool(fallback);
}

std::int64_t OptionRegistry::getInteger(const std::string &key, std::int64_t fallback) const
{
    return get(key).toInteger(fallback);
}

std::string OptionRegistry::getString(const std::string &key, const std::string &fallback) const
{
    return get(key).toString(fallback);
}

std::vector<std::string> OptionRegistry::getStringList(const std::string &key) const
{
    return get(key).toStringList();
}

bool OptionRegistry::loadFromFile(const std::filesystem::path &filePath, std::string *errorMessage)
{
    std::ifstream in(filePath);
    if (!in)
    {
        assignError(errorMessage, "cannot open '" + filePath.string() + "'");
        return false;
    }

    nlohmann::json data;
    try
    {
        in >> data;
    }
    catch (const nlohmann::json::parse_error &error)
    {
        assignError(errorMessage, "cannot parse '" + filePath.string() + "': " + error.what());
        return false;
    }

    if (!data.is_object())
    {
        assignError(errorMessage, "'" + filePath.string() + "' does not contain a JSON object");
        return false;
    }

    for (const auto &[key, jsonValue] : data.items())
    {
        const OptionDefinition *definition = findDefinition(key);
        if (!definition)
            continue;
        OptionValue parsed = fromJson(jsonValue);
        overrides[key] = parsed.isNull() ? definition->defaultValue : coerce(*definition, parsed);
    }
    return true;
}

bool OptionRegistry::saveToFile(const std::filesystem::path &filePath, std::string *errorMessage) const
{
    nlohmann::json data = nlohmann::json::object();
    for (const auto &[key, definition] : definitions)
        data[key] = toJson(get(key));

    std::error_code ec;
    if (filePath.has_parent_path())
        fs::create_directories(filePath.parent_path(), ec);

    std::ofstream out(filePath);
    if (!out)
    {
        assignError(errorMessage, "cannot write '" + filePath.string() + "'");
        return false;
    }
    out << data.dump(2) << '\n';
    if (!out)
    {
        assignError(errorMessage, "cannot write '" + filePath.string() + "'");
        return false;
    }
    return true;
}

bool OptionRegistry::loadDefaults(std::string *errorMessage)
{
    const fs::path path = defaultOptionsPath();
    std::error_code ec;
    if (!fs::exists(path, ec))
        return false;
    return loadFromFile(path, errorMessage);
}

bool OptionRegistry::saveDefaults(std::string *errorMessage) const
{
    return saveToFile(defaultOptionsPath(), errorMessage);
}

std::filesystem::path OptionRegistry::defaultOptionsPath() const
{
    return configRoot() / id / kDefaultsFileName;
}

std::vector<OptionDefinition> OptionRegistry::listRegisteredOptions() const
{
    std::vector<OptionDefinition> result;
    result.reserve(definitions.size());
    for (const auto &[key, definition] : definitions)
        result.push_back(definition);
    std::sort(result.begin(), result.end(),
              [](const OptionDefinition &a, const OptionDefinition &b) { return a.key < b.key; });
    return result;
}

std::filesystem::path OptionRegistry::configRoot()
{
    static const fs::path root = detectConfigRoot();
    return root;
}

const OptionDefinition *OptionRegistry::findDefinition(const std::string &key) const
{
    auto it = definitions.find(key);
    return it == definitions.end() ? nullptr : &it->second;
}

OptionValue OptionRegistry::coerce(const OptionDefinition &definition, const OptionValue &value)
{
    switch (definition.kind)
    {
    case OptionKind::Boolean:
        return OptionValue(value.toBool(definition.defaultValue.toBool()));
    case OptionKind::Integer:
        return OptionValue(value.toInteger(definition.defaultValue.toInteger()));
    case OptionKind::String:
        return OptionValue(value.toString(definition.defaultValue.toString()));
    case OptionKind::StringList:
        return OptionValue(value.toStringList());
    }
    return value;
}

} // namespace corvus::config
