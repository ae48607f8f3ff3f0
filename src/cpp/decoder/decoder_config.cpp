#include "decoder_config.hpp"

#include <cctype>
#include <fstream>
#include <iterator>

#include "errors.hpp"

namespace amroute
{

namespace
{

// Flat-object lookups only: the config has no nesting.

std::optional<size_t> findJsonValue(const std::string& json, const std::string& key)
{
    std::string search = "\"" + key + "\"";
    size_t pos = json.find(search);
    if (pos == std::string::npos)
        return std::nullopt;
    pos = json.find(':', pos + search.size());
    if (pos == std::string::npos)
        throw ConfigError("Missing ':' after config key: " + key);
    pos++;
    while (pos < json.size() && std::isspace(static_cast<unsigned char>(json[pos]))) pos++;
    if (pos >= json.size())
        throw ConfigError("Missing value for config key: " + key);
    return pos;
}

std::string readJsonToken(const std::string& json, size_t pos)
{
    size_t end = pos;
    while (end < json.size() && json[end] != ',' && json[end] != '}'
           && !std::isspace(static_cast<unsigned char>(json[end])))
        end++;
    return json.substr(pos, end - pos);
}

std::optional<int64_t> readJsonInt(const std::string& json, const std::string& key)
{
    auto pos = findJsonValue(json, key);
    if (!pos) return std::nullopt;
    std::string token = readJsonToken(json, *pos);
    try
    {
        size_t used = 0;
        int64_t value = std::stoll(token, &used);
        if (used != token.size())
            throw ConfigError("Failed to parse integer value for " + key + ": " + token);
        return value;
    }
    catch (const std::logic_error&)
    {
        throw ConfigError("Failed to parse integer value for " + key + ": " + token);
    }
}

std::optional<float> readJsonFloat(const std::string& json, const std::string& key)
{
    auto pos = findJsonValue(json, key);
    if (!pos) return std::nullopt;
    std::string token = readJsonToken(json, *pos);
    try
    {
        size_t used = 0;
        float value = std::stof(token, &used);
        if (used != token.size())
            throw ConfigError("Failed to parse float value for " + key + ": " + token);
        return value;
    }
    catch (const std::logic_error&)
    {
        throw ConfigError("Failed to parse float value for " + key + ": " + token);
    }
}

std::optional<bool> readJsonBool(const std::string& json, const std::string& key)
{
    auto pos = findJsonValue(json, key);
    if (!pos) return std::nullopt;
    std::string token = readJsonToken(json, *pos);
    if (token == "true") return true;
    if (token == "false") return false;
    throw ConfigError("Failed to parse boolean value for " + key + ": " + token);
}

std::optional<std::string> readJsonString(const std::string& json, const std::string& key)
{
    auto pos = findJsonValue(json, key);
    if (!pos) return std::nullopt;
    if (json[*pos] != '"')
        throw ConfigError("Expected a string value for config key: " + key);
    size_t end = json.find('"', *pos + 1);
    if (end == std::string::npos)
        throw ConfigError("Unterminated string for config key: " + key);
    return json.substr(*pos + 1, end - *pos - 1);
}

} // anonymous namespace

DecoderConfig parseDecoderConfig(const std::string& json)
{
    DecoderConfig config;

    if (auto v = readJsonString(json, "env_name")) config.env_name = *v;
    if (auto v = readJsonInt(json, "embedding_dim")) config.embedding_dim = *v;
    if (auto v = readJsonInt(json, "num_heads")) config.num_heads = *v;
    if (auto v = readJsonFloat(json, "tanh_clipping")) config.tanh_clipping = *v;
    if (auto v = readJsonBool(json, "mask_inner")) config.mask_inner = *v;
    if (auto v = readJsonBool(json, "mask_logits")) config.mask_logits = *v;
    if (auto v = readJsonBool(json, "normalize")) config.normalize = *v;
    if (auto v = readJsonFloat(json, "softmax_temp")) config.softmax_temp = *v;

    if (config.embedding_dim <= 0 || config.num_heads <= 0)
        throw ConfigError("embedding_dim and num_heads must be positive");
    if (config.softmax_temp <= 0.0f)
        throw ConfigError("softmax_temp must be positive");

    return config;
}

DecoderConfig loadDecoderConfig(const std::string& path)
{
    std::ifstream cf(path);
    if (!cf) throw ConfigError("Failed to open config: " + path);
    std::string json((std::istreambuf_iterator<char>(cf)), std::istreambuf_iterator<char>());
    return parseDecoderConfig(json);
}

} // namespace amroute
