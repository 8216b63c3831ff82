/// @file resilience_runtime.cpp
/// @brief Construction order, start/stop and teardown of the component graph.

#include "crr/resilience/resilience_runtime.hpp"

#include <atomic>

#include "crr/foundation/resilience_logger.hpp"

namespace crr::resilience {

using foundation::LogCategory;
using foundation::LogContext;
using foundation::LogLevel;
using foundation::ResilienceLogger;

// Members are declared in dependency order and destroyed in reverse.
struct ResilienceRuntime::Impl {
    Impl(ResilienceSettings settings, std::shared_ptr<IMessageTransport> transport,
         RuntimeOptions options)
        : configs(std::move(settings)),
          timeouts(configs.settings().timeouts),
          scheduler(options.workerThreads, "crr"),
          registry(configs, scheduler, options.clock, options.wallClock),
          fallbacks(timeouts, options.wallClock),
          dispatcher(std::move(transport), registry, timeouts, fallbacks, options.clock),
          recovery(registry, scheduler),
          metrics(registry, scheduler, configs.monitoring(), options.wallClock),
          health(registry, scheduler, options.wallClock),
          admin(registry, metrics, health, recovery, timeouts) {}

    BreakerConfigProvider configs;
    TimeoutResolver timeouts;
    foundation::TaskScheduler scheduler;
    CircuitBreakerRegistry registry;
    ServiceFallbacks fallbacks;
    ResilientDispatcher dispatcher;
    RecoveryScheduler recovery;
    MetricsCollector metrics;
    HealthAggregator health;
    ResilienceAdmin admin;

    std::atomic<bool> running{false};
};

foundation::RpcResult<std::unique_ptr<ResilienceRuntime>> ResilienceRuntime::create(
    ResilienceSettings settings, std::shared_ptr<IMessageTransport> transport,
    RuntimeOptions options)
{
    using Result = foundation::RpcResult<std::unique_ptr<ResilienceRuntime>>;
    if (!transport) {
        return Result::err(RpcError(ErrorCode::InvalidArgument, "message transport is required"));
    }
    if (options.workerThreads == 0) {
        return Result::err(RpcError(ErrorCode::InvalidArgument, "workerThreads must be positive"));
    }

    LogContext ctx;
    ctx.extra["enabled"] = settings.enabled ? "true" : "false";
    ctx.extra["environment"] = std::string(toString(settings.timeouts.environment));
    ctx.extra["services"] = std::to_string(settings.services.size());
    ctx.extra["workers"] = std::to_string(options.workerThreads);

    auto impl = std::make_unique<Impl>(std::move(settings), std::move(transport), std::move(options));
    ResilienceLogger::instance().logWithContext(LogLevel::Info, LogCategory::Core,
                                                "resilience runtime created", ctx);
    return Result::ok(std::make_unique<ResilienceRuntime>(ConstructionKey{}, std::move(impl)));
}

ResilienceRuntime::ResilienceRuntime(ConstructionKey /*key*/, std::unique_ptr<Impl> impl)
    : impl_(std::move(impl)) {}

ResilienceRuntime::~ResilienceRuntime() {
    if (!impl_) {
        return;
    }
    stop();
    impl_->scheduler.shutdown();
}

// ── Lifecycle ───────────────────────────────────────────────────────────────

foundation::RpcResult<void> ResilienceRuntime::start() {
    if (impl_->running.exchange(true)) {
        return foundation::RpcResult<void>::ok();
    }

    auto collecting = impl_->metrics.start();
    if (!collecting) {
        impl_->running = false;
        return collecting;
    }
    auto checking = impl_->health.start();
    if (!checking) {
        impl_->metrics.stop();
        impl_->running = false;
        return checking;
    }
    CRR_LOG_INFO(LogCategory::Core, "resilience runtime started");
    return foundation::RpcResult<void>::ok();
}

void ResilienceRuntime::stop() {
    if (!impl_->running.exchange(false)) {
        return;
    }
    impl_->health.stop();
    impl_->metrics.stop();
    CRR_LOG_INFO(LogCategory::Core, "resilience runtime stopped");
}

bool ResilienceRuntime::isRunning() const noexcept {
    return impl_->running.load();
}

// ── Components ──────────────────────────────────────────────────────────────

ResilientDispatcher& ResilienceRuntime::dispatcher() noexcept { return impl_->dispatcher; }
ResilienceAdmin& ResilienceRuntime::admin() noexcept { return impl_->admin; }
CircuitBreakerRegistry& ResilienceRuntime::registry() noexcept { return impl_->registry; }
MetricsCollector& ResilienceRuntime::metrics() noexcept { return impl_->metrics; }
HealthAggregator& ResilienceRuntime::health() noexcept { return impl_->health; }
RecoveryScheduler& ResilienceRuntime::recovery() noexcept { return impl_->recovery; }
const TimeoutResolver& ResilienceRuntime::timeouts() const noexcept { return impl_->timeouts; }
const BreakerConfigProvider& ResilienceRuntime::configs() const noexcept { return impl_->configs; }
foundation::TaskScheduler& ResilienceRuntime::scheduler() noexcept { return impl_->scheduler; }

} // namespace crr::resilience
