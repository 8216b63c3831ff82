#pragma once

/// @file resilience_runtime.hpp
/// @brief Owns and wires every resilience component for one process.

#include <cstddef>
#include <memory>

#include "crr/foundation/rpc_result.hpp"
#include "crr/foundation/task_scheduler.hpp"
#include "crr/foundation/types.hpp"
#include "crr/resilience/breaker_config.hpp"
#include "crr/resilience/circuit_breaker_registry.hpp"
#include "crr/resilience/health_aggregator.hpp"
#include "crr/resilience/message_transport.hpp"
#include "crr/resilience/metrics_collector.hpp"
#include "crr/resilience/recovery_scheduler.hpp"
#include "crr/resilience/resilience_admin.hpp"
#include "crr/resilience/resilience_settings.hpp"
#include "crr/resilience/resilient_dispatcher.hpp"
#include "crr/resilience/service_fallbacks.hpp"
#include "crr/resilience/timeout_resolver.hpp"

namespace crr::resilience {

struct RuntimeOptions {
    /// Pool size for wrapped calls, probes and periodic work.
    std::size_t workerThreads = 4;
    foundation::SteadyClockFn clock = foundation::systemSteadyClock();
    foundation::WallClockFn wallClock = foundation::systemWallClock();
};

/// The component graph:
///
///   TaskScheduler ─┬─ CircuitBreakerRegistry ─┬─ RecoveryScheduler
///                  │                          ├─ MetricsCollector
///                  │                          ├─ HealthAggregator
///                  │                          └─ ResilientDispatcher ── IMessageTransport
///                  └─ timers for recovery, collection and health checks
///
/// Usage:
/// @code
///   auto settings = loadSettings("config/resilience.yaml");
///   auto runtime = ResilienceRuntime::create(settings.value(), transport);
///   (void)runtime.value()->start();
///   auto reply = runtime.value()->dispatcher().request({"capsule.commands", "auth.login", body});
/// @endcode
class ResilienceRuntime {
public:
    /// Build every component from @p settings.
    /// @return InvalidArgument when @p transport is null or workerThreads is 0.
    [[nodiscard]] static foundation::RpcResult<std::unique_ptr<ResilienceRuntime>> create(
        ResilienceSettings settings,
        std::shared_ptr<IMessageTransport> transport,
        RuntimeOptions options = {});

    /// Only create() can name the key.
    class ConstructionKey {
        friend class ResilienceRuntime;
        ConstructionKey() = default;
    };

    struct Impl;
    ResilienceRuntime(ConstructionKey key, std::unique_ptr<Impl> impl);

    /// Stops timers, drains the pool and joins in-flight calls before
    /// components are released.
    ~ResilienceRuntime();

    ResilienceRuntime(const ResilienceRuntime&) = delete;
    ResilienceRuntime& operator=(const ResilienceRuntime&) = delete;

    // ── Lifecycle ───────────────────────────────────────────────────────

    /// Start metrics collection and periodic health checks.
    [[nodiscard]] foundation::RpcResult<void> start();

    void stop();

    [[nodiscard]] bool isRunning() const noexcept;

    // ── Components ──────────────────────────────────────────────────────

    [[nodiscard]] ResilientDispatcher& dispatcher() noexcept;
    [[nodiscard]] ResilienceAdmin& admin() noexcept;
    [[nodiscard]] CircuitBreakerRegistry& registry() noexcept;
    [[nodiscard]] MetricsCollector& metrics() noexcept;
    [[nodiscard]] HealthAggregator& health() noexcept;
    [[nodiscard]] RecoveryScheduler& recovery() noexcept;
    [[nodiscard]] const TimeoutResolver& timeouts() const noexcept;
    [[nodiscard]] const BreakerConfigProvider& configs() const noexcept;
    [[nodiscard]] foundation::TaskScheduler& scheduler() noexcept;

private:
    std::unique_ptr<Impl> impl_;
};

} // namespace crr::resilience
