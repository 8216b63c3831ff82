#pragma once

/// @file metrics_types.hpp
/// @brief Snapshots, alerts and derived analytics produced by the metrics collector.

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "crr/foundation/types.hpp"
#include "crr/resilience/circuit_breaker_types.hpp"

namespace crr::resilience {

// ── Alerts ──────────────────────────────────────────────────────────────────

enum class AlertType : uint8_t { StateChange, HighErrorRate, HighResponseTime, Recovery };

[[nodiscard]] constexpr std::string_view toString(AlertType t) {
    switch (t) {
        case AlertType::StateChange:      return "state_change";
        case AlertType::HighErrorRate:    return "high_error_rate";
        case AlertType::HighResponseTime: return "high_response_time";
        case AlertType::Recovery:         return "recovery";
    }
    return "unknown";
}

enum class AlertSeverity : uint8_t { Info, Warning, Error };

[[nodiscard]] constexpr std::string_view toString(AlertSeverity s) {
    switch (s) {
        case AlertSeverity::Info:    return "info";
        case AlertSeverity::Warning: return "warning";
        case AlertSeverity::Error:   return "error";
    }
    return "unknown";
}

/// "info", "warning" or "error"; anything else is nullopt.
[[nodiscard]] std::optional<AlertSeverity> parseAlertSeverity(std::string_view name);

struct Alert {
    /// "<key>-<type>-<epoch ms>", e.g. "auth-service-high-error-rate-1700000000000".
    std::string id;
    AlertType type = AlertType::StateChange;
    AlertSeverity severity = AlertSeverity::Info;
    /// Breaker key string the alert is about.
    std::string service;
    std::string message;
    std::map<std::string, std::string> metadata;
    foundation::WallTime timestamp{};
};

// ── Snapshots ───────────────────────────────────────────────────────────────

struct ServiceSnapshot {
    CircuitBreakerMetrics metrics;
    CircuitBreakerHealth health;
};

struct StateDistribution {
    std::size_t closed = 0;
    std::size_t open = 0;
    std::size_t halfOpen = 0;
};

struct HealthDistribution {
    std::size_t healthy = 0;
    std::size_t degraded = 0;
    std::size_t unhealthy = 0;
};

/// Sums over every breaker in one snapshot.
struct AggregatedTotals {
    uint64_t totalRequests = 0;
    uint64_t totalSuccesses = 0;
    uint64_t totalFailures = 0;
    uint64_t totalRejections = 0;
    double overallErrorPercentage = 0.0;
    /// Mean over breakers whose average latency is non-zero.
    double averageResponseTime = 0.0;
};

/// Point-in-time view of every breaker.
struct MetricsSnapshot {
    foundation::WallTime timestamp{};
    std::size_t totalCircuitBreakers = 0;
    StateDistribution stateDistribution;
    HealthDistribution healthDistribution;
    /// Keyed by breaker key string.
    std::map<std::string, ServiceSnapshot> services;
    AggregatedTotals aggregated;
};

// ── Derived analytics ───────────────────────────────────────────────────────

enum class Trend : uint8_t { Increasing, Decreasing, Stable };

[[nodiscard]] constexpr std::string_view toString(Trend t) {
    switch (t) {
        case Trend::Increasing: return "increasing";
        case Trend::Decreasing: return "decreasing";
        case Trend::Stable:     return "stable";
    }
    return "unknown";
}

struct ErrorRatePoint {
    foundation::WallTime timestamp{};
    double errorRate = 0.0;
};

struct ErrorRateTrend {
    double current = 0.0;
    Trend trend = Trend::Stable;
    /// current - previous, in percentage points.
    double change = 0.0;
    std::vector<ErrorRatePoint> history;
};

struct ResponseTimePercentiles {
    double p50 = 0.0;
    double p95 = 0.0;
    double p99 = 0.0;
    double average = 0.0;
    std::size_t count = 0;
};

/// Metrics of one key averaged over the snapshots falling in one bucket.
struct MetricsBucket {
    foundation::WallTime bucketStart{};
    foundation::WallTime bucketEnd{};
    CircuitBreakerMetrics metrics;
};

enum class IssueSeverity : uint8_t { Low, Medium, High };

[[nodiscard]] constexpr std::string_view toString(IssueSeverity s) {
    switch (s) {
        case IssueSeverity::Low:    return "low";
        case IssueSeverity::Medium: return "medium";
        case IssueSeverity::High:   return "high";
    }
    return "unknown";
}

struct SummaryIssue {
    std::string service;
    std::string issue;
    IssueSeverity severity = IssueSeverity::Low;
    std::string recommendation;
};

struct SummaryOverview {
    std::size_t totalServices = 0;
    std::size_t healthyServices = 0;
    std::size_t degradedServices = 0;
    std::size_t unhealthyServices = 0;
    std::size_t openCircuitBreakers = 0;
};

struct TrendSummary {
    Trend trend = Trend::Stable;
    double change = 0.0;
};

struct SummaryReport {
    SummaryOverview overview;
    /// Most severe first, at most 10.
    std::vector<SummaryIssue> topIssues;
    std::vector<Alert> recentAlerts;
    std::map<std::string, TrendSummary> trends;
};

} // namespace crr::resilience
