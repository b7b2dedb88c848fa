#pragma once
#include <yaml-cpp/yaml.h>
#include <spdlog/spdlog.h>
#include <stdexcept>
#include <string>

namespace backtail {

class Config {
public:
    // 空配置，所有 getOr 都返回默认值
    Config() = default;

    // 从文件加载
    explicit Config(const std::string& filePath);

    // 从 YAML 文本加载
    static Config fromString(const std::string& text);

    bool has(const std::string& parentKey, const std::string& key) const;

    // 必填项：缺失或类型错误时抛 std::runtime_error
    std::string getString(const std::string& parentKey,
                          const std::string& key) const;

    // 可选项：缺失返回 fallback，存在但类型错误仍然抛
    template <typename T>
    T getOr(const std::string& parentKey,
            const std::string& key,
            const T& fallback) const
    {
        if (!has(parentKey, key))
            return fallback;
        try {
            return root_[parentKey][key].as<T>();
        } catch (const YAML::Exception& e) {
            spdlog::error("Config: error decoding [{}][{}]: {}", parentKey, key, e.what());
            throw std::runtime_error("Config: missing or bad type for [" +
                                     parentKey + "][" + key + "]");
        }
    }

private:
    YAML::Node root_;
};

} // namespace backtail
