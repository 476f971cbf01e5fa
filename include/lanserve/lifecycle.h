#pragma once
// ═══════════════════════════════════════════════════════════════════
//  lanserve/lifecycle.h — Download limit, active-transfer drain and
//  graceful shutdown
// ═══════════════════════════════════════════════════════════════════
//
//  auto life = std::make_shared<lifecycle::Lifecycle>(options.count);
//  lifecycle::InterruptWatcher interrupts(life->signal);   // SIGINT/SIGTERM
//  server.start([&](const std::string& err) {
//      life->signal.raise(lifecycle::Trigger::ServerError, err);
//  });
//  auto outcome = lifecycle::ShutdownCoordinator(life, 30s).run(server);
//
// ═══════════════════════════════════════════════════════════════════

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>

namespace lanserve::http { class Server; }

namespace lanserve::lifecycle {

enum class Trigger {
    Interrupt,      // SIGINT / SIGTERM
    ServerError,    // the accept loop failed
    LimitReached,   // the configured number of downloads completed
};

std::string describe(Trigger trigger);

// ═══════════════════════════════════════════
//  ShutdownSignal — one-shot, non-blocking to raise
// ═══════════════════════════════════════════
class ShutdownSignal {
public:
    // Returns true for the raise that actually fired; every later raise
    // is a no-op returning false. Never blocks on a waiter.
    bool raise(Trigger trigger, std::string detail = "");

    bool raised() const { return raised_.load(std::memory_order_acquire); }

    // Block until raised; returns the winning trigger
    Trigger wait();

    // Bounded wait; std::nullopt on timeout
    std::optional<Trigger> waitFor(std::chrono::milliseconds timeout);

    std::optional<Trigger> trigger() const;
    std::string detail() const;

private:
    std::atomic<bool> raised_{false};
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::optional<Trigger> trigger_;
    std::string detail_;
};

// ═══════════════════════════════════════════
//  ActiveTransfers — in-flight count with "wait until idle"
// ═══════════════════════════════════════════
class ActiveTransfers {
public:
    // RAII registration: counts one transfer for its lifetime
    class Guard {
    public:
        explicit Guard(ActiveTransfers& owner) : owner_(&owner) { owner_->add(); }
        ~Guard() { if (owner_) owner_->done(); }

        Guard(Guard&& other) noexcept : owner_(other.owner_) { other.owner_ = nullptr; }
        Guard(const Guard&) = delete;
        Guard& operator=(const Guard&) = delete;
        Guard& operator=(Guard&&) = delete;

    private:
        ActiveTransfers* owner_;
    };

    Guard track() { return Guard(*this); }

    std::size_t count() const;

    // True when the count reached zero before the timeout elapsed
    bool waitIdle(std::chrono::milliseconds timeout);

private:
    void add();
    void done();

    mutable std::mutex mutex_;
    std::condition_variable idle_;
    std::size_t active_ = 0;
};

// ═══════════════════════════════════════════
//  TransferLimit — counts successful downloads
// ═══════════════════════════════════════════
class TransferLimit {
public:
    struct Completion {
        std::uint64_t completed = 0;
        std::optional<std::uint64_t> remaining;   // nullopt when unlimited
        bool limitReached = false;
    };

    // max == 0 means unlimited
    TransferLimit(std::uint64_t max, ShutdownSignal& signal) : max_(max), signal_(signal) {}

    // Call once per transfer that streamed its whole body. Raises the
    // shutdown signal when the count reaches (or concurrently passes) max.
    Completion recordCompletion();

    std::uint64_t max() const { return max_; }
    std::uint64_t completed() const { return completed_.load(); }
    bool unlimited() const { return max_ == 0; }

    // Remaining downloads for display, clamped at zero
    std::optional<std::uint64_t> remaining() const;

private:
    const std::uint64_t max_;
    std::atomic<std::uint64_t> completed_{0};
    ShutdownSignal& signal_;
};

// ═══════════════════════════════════════════
//  Lifecycle — the shared state every request handler sees
// ═══════════════════════════════════════════
struct Lifecycle {
    explicit Lifecycle(std::uint64_t maxDownloads) : limit(maxDownloads, signal) {}

    Lifecycle(const Lifecycle&) = delete;
    Lifecycle& operator=(const Lifecycle&) = delete;

    ShutdownSignal  signal;
    ActiveTransfers active;
    TransferLimit   limit;
};

// ═══════════════════════════════════════════
//  InterruptWatcher — turns SIGINT/SIGTERM into a shutdown trigger
// ═══════════════════════════════════════════
class InterruptWatcher {
public:
    explicit InterruptWatcher(ShutdownSignal& signal);
    ~InterruptWatcher();

    InterruptWatcher(const InterruptWatcher&) = delete;
    InterruptWatcher& operator=(const InterruptWatcher&) = delete;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

// ═══════════════════════════════════════════
//  ShutdownCoordinator — wait for a trigger, stop accepting, drain
// ═══════════════════════════════════════════
class ShutdownCoordinator {
public:
    struct Outcome {
        Trigger     trigger;
        std::string detail;
        bool        drained;   // false when the timeout cut the drain short
    };

    ShutdownCoordinator(std::shared_ptr<Lifecycle> lifecycle, std::chrono::milliseconds drainTimeout)
        : lifecycle_(std::move(lifecycle)), drainTimeout_(drainTimeout) {}

    // Blocks until the shutdown signal fires, closes the listener and
    // waits (bounded) for in-flight transfers. Never throws for a
    // timeout; abandoning stragglers is a normal outcome.
    Outcome run(http::Server& server);

    // Same, with the "stop accepting" step supplied by the caller
    template <typename StopAccepting>
    Outcome runWith(StopAccepting&& stopAccepting) {
        auto trigger = lifecycle_->signal.wait();
        announce(trigger);
        stopAccepting();
        return drain(trigger);
    }

private:
    void announce(Trigger trigger) const;
    Outcome drain(Trigger trigger) const;

    std::shared_ptr<Lifecycle> lifecycle_;
    std::chrono::milliseconds drainTimeout_;
};

} // namespace lanserve::lifecycle
