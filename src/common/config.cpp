#include "common/config.hpp"
#include <stdexcept>

namespace backtail {

Config::Config(const std::string& filePath)
{
    try {
        root_ = YAML::LoadFile(filePath);
        spdlog::info("Config: loaded configuration from {}", filePath);
    } catch (const YAML::BadFile& e) {
        spdlog::error("Config: failed to load configuration file {}: {}", filePath, e.what());
        throw std::runtime_error("Config: cannot open file: " + filePath);
    } catch (const YAML::ParserException& e) {
        spdlog::error("Config: failed to parse configuration file {}: {}", filePath, e.what());
        throw std::runtime_error("Config: cannot parse file: " + filePath);
    }
}

Config Config::fromString(const std::string& text)
{
    Config c;
    try {
        c.root_ = YAML::Load(text);
    } catch (const YAML::ParserException& e) {
        spdlog::error("Config: failed to parse inline configuration: {}", e.what());
        throw std::runtime_error("Config: cannot parse inline configuration");
    }
    return c;
}

bool Config::has(const std::string& parentKey,
                 const std::string& key) const
{
    if (!root_.IsMap())
        return false;
    const YAML::Node parent = root_[parentKey];
    if (!parent.IsMap())
        return false;
    const YAML::Node node = parent[key];
    return node.IsDefined() && !node.IsNull();
}

std::string Config::getString(const std::string& parentKey,
                              const std::string& key) const
{
    try {
        return root_[parentKey][key].as<std::string>();
    } catch (const YAML::Exception& e) {
        spdlog::error("Config: error decoding string [{}][{}]: {}", parentKey, key, e.what());
        throw std::runtime_error("Config: missing or bad type for [" +
                                 parentKey + "][" + key + "]");
    }
}

} // namespace backtail
