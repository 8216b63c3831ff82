#include "crr/foundation/config_manager.hpp"

#include <cstdlib>
#include <set>

namespace crr::foundation {

RpcResult<void> ConfigManager::load(const std::filesystem::path& path) {
    std::lock_guard lock(mutex_);
    try {
        auto root = YAML::LoadFile(path.string());
        entries_.clear();
        flatten("", root);
        return RpcResult<void>::ok();
    } catch (const YAML::BadFile&) {
        return RpcResult<void>::err(
            RpcError(ErrorCode::ConfigLoadFailed, "failed to open config file: " + path.string()));
    } catch (const YAML::ParserException& e) {
        return RpcResult<void>::err(
            RpcError(ErrorCode::ConfigLoadFailed, std::string("YAML parse error: ") + e.what()));
    }
}

RpcResult<void> ConfigManager::loadString(std::string_view yaml) {
    std::lock_guard lock(mutex_);
    try {
        auto root = YAML::Load(std::string(yaml));
        entries_.clear();
        flatten("", root);
        return RpcResult<void>::ok();
    } catch (const YAML::ParserException& e) {
        return RpcResult<void>::err(
            RpcError(ErrorCode::ConfigLoadFailed, std::string("YAML parse error: ") + e.what()));
    }
}

std::size_t ConfigManager::applyEnvironment(const std::vector<EnvBinding>& bindings) {
    std::vector<std::string_view> changed;
    {
        std::lock_guard lock(mutex_);
        for (const auto& binding : bindings) {
            const char* raw = std::getenv(std::string(binding.variable).c_str());
            if (raw == nullptr || *raw == '\0') {
                continue;
            }
            entries_[std::string(binding.key)] = YAML::Node(std::string(raw));
            changed.push_back(binding.key);
        }
    }
    for (auto key : changed) {
        notifyWatchers(key);
    }
    return changed.size();
}

void ConfigManager::watch(std::string_view key, ConfigWatchCallback callback) {
    std::lock_guard lock(mutex_);
    watchers_[std::string(key)].push_back(std::move(callback));
}

bool ConfigManager::hasKey(std::string_view key) const {
    std::lock_guard lock(mutex_);
    return entries_.count(std::string(key)) > 0;
}

std::vector<std::string> ConfigManager::childrenOf(std::string_view prefix) const {
    std::string head = std::string(prefix) + ".";
    std::set<std::string> names;
    {
        std::lock_guard lock(mutex_);
        for (const auto& [key, node] : entries_) {
            if (key.compare(0, head.size(), head) != 0) {
                continue;
            }
            auto rest = key.substr(head.size());
            names.insert(rest.substr(0, rest.find('.')));
        }
    }
    return {names.begin(), names.end()};
}

void ConfigManager::flatten(const std::string& prefix, const YAML::Node& node) {
    if (node.IsMap()) {
        for (auto it = node.begin(); it != node.end(); ++it) {
            auto childKey = it->first.as<std::string>();
            auto fullKey = prefix.empty() ? childKey : prefix + "." + childKey;
            flatten(fullKey, it->second);
        }
    } else if (!prefix.empty()) {
        entries_[prefix] = YAML::Clone(node);
    }
}

void ConfigManager::notifyWatchers(std::string_view key) {
    std::vector<ConfigWatchCallback> callbacks;
    {
        std::lock_guard lock(mutex_);
        auto it = watchers_.find(std::string(key));
        if (it != watchers_.end()) {
            callbacks = it->second;
        }
    }
    for (auto& cb : callbacks) {
        cb(key);
    }
}

RpcResult<void> loadConfig(ConfigManager& config, const std::filesystem::path& defaultPath) {
    std::filesystem::path path = defaultPath;
    if (const char* env = std::getenv("CRR_CONFIG_PATH"); env != nullptr && *env != '\0') {
        path = env;
    }
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        return RpcResult<void>::ok();
    }
    return config.load(path);
}

} // namespace crr::foundation
