/// @file resilience_settings.cpp
/// @brief Built-in defaults and the YAML / environment loader.

#include "crr/resilience/resilience_settings.hpp"

#include "crr/foundation/resilience_logger.hpp"

namespace crr::resilience {

using namespace std::chrono_literals;
using foundation::ConfigManager;
using foundation::LogCategory;

namespace {

using Millis = std::chrono::milliseconds;

RpcError invalid(const std::string& key, const std::string& why) {
    return RpcError(ErrorCode::ConfigInvalidValue, key + ": " + why);
}

/// Reads @p key into @p target when present. Returns false and stores the
/// error when the key exists with an unusable value.
class Reader {
public:
    explicit Reader(const ConfigManager& config) : config_(config) {}

    template <typename T>
    bool read(const std::string& key, T& target) {
        if (failed_ || !config_.hasKey(key)) {
            return false;
        }
        auto value = config_.get<T>(key);
        if (!value) {
            fail(value.error());
            return false;
        }
        target = value.value();
        return true;
    }

    template <typename T>
    bool read(const std::string& key, std::optional<T>& target) {
        T value{};
        if (read(key, value)) {
            target = value;
            return true;
        }
        return false;
    }

    bool readMillis(const std::string& key, Millis& target) {
        int64_t raw = 0;
        if (!read(key, raw)) {
            return false;
        }
        if (raw < 0) {
            fail(invalid(key, "must not be negative"));
            return false;
        }
        target = Millis{raw};
        return true;
    }

    bool readMillis(const std::string& key, std::optional<Millis>& target) {
        Millis value{0};
        if (readMillis(key, value)) {
            target = value;
            return true;
        }
        return false;
    }

    void fail(RpcError error) {
        if (!failed_) {
            error_ = std::move(error);
            failed_ = true;
        }
    }

    [[nodiscard]] bool failed() const { return failed_; }
    [[nodiscard]] const RpcError& error() const { return error_; }
    [[nodiscard]] const ConfigManager& config() const { return config_; }

private:
    const ConfigManager& config_;
    bool failed_ = false;
    RpcError error_;
};

void readOverrides(Reader& in, const std::string& prefix, CircuitBreakerOverrides& out) {
    in.readMillis(prefix + ".timeout_ms", out.timeout);
    in.read(prefix + ".error_threshold_percentage", out.errorThresholdPercentage);
    in.readMillis(prefix + ".reset_timeout_ms", out.resetTimeout);
    in.read(prefix + ".volume_threshold", out.volumeThreshold);
    in.readMillis(prefix + ".rolling_count_timeout_ms", out.rollingCountTimeout);
    in.read(prefix + ".rolling_count_buckets", out.rollingCountBuckets);
    in.read(prefix + ".enabled", out.enabled);
    in.read(prefix + ".max_concurrent_calls", out.maxConcurrentCalls);

    if (out.errorThresholdPercentage &&
        (*out.errorThresholdPercentage < 0.0 || *out.errorThresholdPercentage > 100.0)) {
        in.fail(invalid(prefix + ".error_threshold_percentage", "must be within [0, 100]"));
    }
    if (out.rollingCountBuckets && *out.rollingCountBuckets == 0) {
        in.fail(invalid(prefix + ".rolling_count_buckets", "must be positive"));
    }
}

void readRecovery(Reader& in, const std::string& prefix, RecoveryStrategy& out) {
    std::string type;
    if (in.read(prefix + ".type", type)) {
        auto parsed = parseRecoveryType(type);
        if (!parsed) {
            in.fail(invalid(prefix + ".type", "unknown recovery type '" + type + "'"));
            return;
        }
        out.type = *parsed;
    }
    in.readMillis(prefix + ".base_delay_ms", out.baseDelay);
    in.readMillis(prefix + ".max_delay_ms", out.maxDelay);
    in.read(prefix + ".multiplier", out.multiplier);
    in.read(prefix + ".max_attempts", out.maxAttempts);
}

} // namespace

ResilienceSettings ResilienceSettings::defaults() {
    ResilienceSettings s;

    s.services["auth-service"] = CircuitBreakerOverrides{
        .timeout = 2000ms, .errorThresholdPercentage = 40.0,
        .resetTimeout = 30000ms, .volumeThreshold = 5u};
    s.services["billing-service"] = CircuitBreakerOverrides{
        .timeout = 8000ms, .errorThresholdPercentage = 60.0,
        .resetTimeout = 120000ms, .volumeThreshold = 3u};
    s.services["deploy-service"] = CircuitBreakerOverrides{
        .timeout = 15000ms, .errorThresholdPercentage = 70.0,
        .resetTimeout = 300000ms, .volumeThreshold = 2u};
    s.services["monitor-service"] = CircuitBreakerOverrides{
        .timeout = 10000ms, .errorThresholdPercentage = 80.0,
        .resetTimeout = 180000ms, .volumeThreshold = 5u};

    s.operations[OperationType::HealthCheck] = CircuitBreakerOverrides{
        .timeout = 3000ms, .errorThresholdPercentage = 30.0,
        .resetTimeout = 15000ms, .volumeThreshold = 3u};
    s.operations[OperationType::DatabaseQuery] = CircuitBreakerOverrides{
        .timeout = 10000ms, .errorThresholdPercentage = 40.0, .resetTimeout = 60000ms};
    s.operations[OperationType::HttpRequest] = CircuitBreakerOverrides{
        .timeout = 30000ms, .errorThresholdPercentage = 60.0, .resetTimeout = 90000ms};

    s.recovery[std::string(kDefaultRecoveryKey)] =
        RecoveryStrategy{RecoveryType::ExponentialBackoff, 1000ms, 60000ms, 2.0, 5, {}};
    s.recovery["auth-service"] =
        RecoveryStrategy{RecoveryType::ExponentialBackoff, 500ms, 30000ms, 1.5, 3, {}};
    s.recovery["billing-service"] =
        RecoveryStrategy{RecoveryType::LinearBackoff, 2000ms, 120000ms, 1.0, 3, {}};
    s.recovery["deploy-service"] =
        RecoveryStrategy{RecoveryType::ExponentialBackoff, 5000ms, 300000ms, 2.0, 2, {}};
    s.recovery["monitor-service"] =
        RecoveryStrategy{RecoveryType::Immediate, 1000ms, 60000ms, 1.0, 10, {}};

    s.timeouts = TimeoutConfig::defaults();
    return s;
}

std::vector<foundation::EnvBinding> environmentBindings() {
    return {
        {"CIRCUIT_BREAKER_ENABLED", "circuit_breaker.enabled"},
        {"CIRCUIT_BREAKER_ERROR_THRESHOLD", "circuit_breaker.error_threshold_percentage"},
        {"CIRCUIT_BREAKER_RESET_TIMEOUT", "circuit_breaker.reset_timeout_ms"},
        {"CIRCUIT_BREAKER_VOLUME_THRESHOLD", "circuit_breaker.volume_threshold"},
        {"CIRCUIT_BREAKER_ROLLING_WINDOW", "circuit_breaker.rolling_count_timeout_ms"},
        {"CIRCUIT_BREAKER_ROLLING_BUCKETS", "circuit_breaker.rolling_count_buckets"},
        {"CIRCUIT_BREAKER_MONITORING", "monitoring.enabled"},
        {"CIRCUIT_BREAKER_METRICS_INTERVAL", "monitoring.metrics_interval_ms"},
        {"CIRCUIT_BREAKER_HEALTH_INTERVAL", "monitoring.health_check_interval_ms"},
        {"CIRCUIT_BREAKER_ALERT_THRESHOLD", "monitoring.alert_threshold"},
        {"RABBITMQ_DEFAULT_TIMEOUT", "timeouts.default_ms"},
        {"ENABLE_TIMEOUT_SCALING", "timeouts.enable_scaling"},
        {"PRODUCTION_TIMEOUT_SCALE", "timeouts.production_scale"},
        {"DEVELOPMENT_TIMEOUT_SCALE", "timeouts.development_scale"},
        {"NODE_ENV", "environment"},
    };
}

foundation::RpcResult<ResilienceSettings> settingsFromConfig(const ConfigManager& config) {
    auto s = ResilienceSettings::defaults();
    Reader in(config);

    // Global breaker defaults.
    in.read("circuit_breaker.enabled", s.enabled);
    CircuitBreakerOverrides global;
    readOverrides(in, "circuit_breaker", global);
    global.enabled.reset();
    global.applyTo(s.defaults);

    // Monitoring.
    in.read("monitoring.enabled", s.monitoring.enabled);
    in.readMillis("monitoring.metrics_interval_ms", s.monitoring.metricsInterval);
    in.readMillis("monitoring.health_check_interval_ms", s.monitoring.healthCheckInterval);
    in.read("monitoring.alert_threshold", s.monitoring.alertThreshold);
    s.defaults.enableMonitoring = s.monitoring.enabled;

    // Timeouts.
    auto& t = s.timeouts;
    in.readMillis("timeouts.default_ms", t.defaultTimeout);
    in.readMillis("timeouts.health_check_ms", t.healthCheckTimeout);
    in.readMillis("timeouts.database_ms", t.databaseTimeout);
    in.readMillis("timeouts.http_ms", t.httpTimeout);
    in.readMillis("timeouts.critical_ms", t.criticalTimeout);
    in.readMillis("timeouts.standard_ms", t.standardTimeout);
    in.readMillis("timeouts.non_critical_ms", t.nonCriticalTimeout);
    in.readMillis("timeouts.minimum_ms", t.minimumTimeout);
    in.read("timeouts.enable_scaling", t.enableScaling);
    in.read("timeouts.production_scale", t.productionScale);
    in.read("timeouts.development_scale", t.developmentScale);
    in.read("timeouts.test_scale", t.testScale);
    std::string environment;
    if (in.read("environment", environment)) {
        t.environment = parseEnvironment(environment);
    }
    if (config.hasKey("timeouts.default_ms")) {
        s.defaults.timeout = t.defaultTimeout;
    }

    // Per-service breaker and timeout entries.
    for (const auto& name : config.childrenOf("services")) {
        auto prefix = "services." + name;
        auto service = normalizeServiceName(name);
        readOverrides(in, prefix, s.services[service]);

        auto& entry = t.services[service];
        std::string tier;
        if (in.read(prefix + ".tier", tier)) {
            auto parsed = parseServiceTier(tier);
            if (!parsed) {
                in.fail(invalid(prefix + ".tier", "unknown tier '" + tier + "'"));
            } else {
                entry.tier = *parsed;
            }
        }
        if (s.services[service].timeout) {
            entry.timeout = s.services[service].timeout;
        }
    }

    // Per-operation overrides.
    for (const auto& name : config.childrenOf("operations")) {
        auto op = parseOperationType(name);
        if (!op) {
            in.fail(invalid("operations." + name, "unknown operation"));
            break;
        }
        readOverrides(in, "operations." + name, s.operations[*op]);
    }

    // Recovery strategies.
    for (const auto& name : config.childrenOf("recovery")) {
        auto key = name == kDefaultRecoveryKey ? name : normalizeServiceName(name);
        auto it = s.recovery.find(key);
        if (it == s.recovery.end()) {
            it = s.recovery.emplace(key, s.recovery[std::string(kDefaultRecoveryKey)]).first;
        }
        readRecovery(in, "recovery." + name, it->second);
    }

    if (in.failed()) {
        return foundation::RpcResult<ResilienceSettings>::err(in.error());
    }
    return foundation::RpcResult<ResilienceSettings>::ok(std::move(s));
}

foundation::RpcResult<ResilienceSettings> loadSettings(const std::filesystem::path& defaultPath) {
    ConfigManager config;
    auto loaded = foundation::loadConfig(config, defaultPath);
    if (!loaded) {
        return foundation::RpcResult<ResilienceSettings>::err(loaded.error());
    }
    auto overridden = config.applyEnvironment(environmentBindings());
    if (overridden > 0) {
        CRR_LOG_INFO(LogCategory::Config,
                     std::to_string(overridden) + " setting(s) taken from the environment");
    }
    return settingsFromConfig(config);
}

} // namespace crr::resilience
