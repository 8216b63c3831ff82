#pragma once

/// @file config_manager.hpp
/// @brief YAML configuration with dotted-key access and environment overlay.

#include <filesystem>
#include <functional>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include <yaml-cpp/yaml.h>

#include "crr/foundation/rpc_result.hpp"

namespace crr::foundation {

/// Callback invoked when a watched configuration key changes.
using ConfigWatchCallback = std::function<void(std::string_view key)>;

/// Binds an environment variable to a dotted configuration key.
struct EnvBinding {
    std::string_view variable;
    std::string_view key;
};

/// Flattened YAML configuration store.
///
/// Nested maps become dotted keys ("circuit_breaker.reset_timeout_ms").
/// Environment variables bound through applyEnvironment() are stored as
/// YAML scalars, so `get<int>` on "30000" read from the environment works
/// the same as on a number read from a file.
class ConfigManager {
public:
    ConfigManager() = default;

    /// Load configuration from a YAML file, replacing current entries.
    /// @return Success or ConfigLoadFailed.
    RpcResult<void> load(const std::filesystem::path& path);

    /// Load configuration from YAML text, replacing current entries.
    RpcResult<void> loadString(std::string_view yaml);

    /// Overlay every bound environment variable that is set.
    /// @return Number of keys overridden.
    std::size_t applyEnvironment(const std::vector<EnvBinding>& bindings);

    /// Typed value by dotted key.
    /// @return The value or ConfigKeyNotFound / ConfigTypeMismatch.
    template <typename T>
    RpcResult<T> get(std::string_view key) const;

    /// Typed value, or @p fallback when the key is missing.
    /// A present key of the wrong type is still an error.
    template <typename T>
    RpcResult<T> getOr(std::string_view key, T fallback) const;

    /// Set a value and notify watchers of @p key.
    template <typename T>
    void set(std::string_view key, const T& value);

    void watch(std::string_view key, ConfigWatchCallback callback);

    [[nodiscard]] bool hasKey(std::string_view key) const;

    /// Distinct child names directly under @p prefix.
    /// For keys "services.auth-service.timeout_ms" and
    /// "services.billing-service.tier", childrenOf("services") yields
    /// {"auth-service", "billing-service"}.
    [[nodiscard]] std::vector<std::string> childrenOf(std::string_view prefix) const;

private:
    void flatten(const std::string& prefix, const YAML::Node& node);
    void notifyWatchers(std::string_view key);

    mutable std::mutex mutex_;
    std::unordered_map<std::string, YAML::Node> entries_;
    std::unordered_map<std::string, std::vector<ConfigWatchCallback>> watchers_;
};

/// Load @p config from CRR_CONFIG_PATH if set, otherwise @p defaultPath.
/// A missing file is not an error: built-in defaults apply.
RpcResult<void> loadConfig(ConfigManager& config, const std::filesystem::path& defaultPath);

// --- Template implementations ---

template <typename T>
RpcResult<T> ConfigManager::get(std::string_view key) const {
    std::lock_guard lock(mutex_);
    auto it = entries_.find(std::string(key));
    if (it == entries_.end()) {
        return RpcResult<T>::err(
            RpcError(ErrorCode::ConfigKeyNotFound,
                     "config key not found: " + std::string(key)));
    }
    try {
        return RpcResult<T>::ok(it->second.as<T>());
    } catch (const YAML::BadConversion&) {
        return RpcResult<T>::err(
            RpcError(ErrorCode::ConfigTypeMismatch,
                     "type mismatch for key: " + std::string(key)));
    }
}

template <typename T>
RpcResult<T> ConfigManager::getOr(std::string_view key, T fallback) const {
    auto value = get<T>(key);
    if (!value && value.error().code() == ErrorCode::ConfigKeyNotFound) {
        return RpcResult<T>::ok(std::move(fallback));
    }
    return value;
}

template <typename T>
void ConfigManager::set(std::string_view key, const T& value) {
    {
        std::lock_guard lock(mutex_);
        entries_[std::string(key)] = YAML::Node(value);
    }
    notifyWatchers(key);
}

} // namespace crr::foundation
