// ═══════════════════════════════════════════════════════════════════
//  src/lifecycle.cpp — Shutdown signal, drain, SIGINT/SIGTERM watcher
// ═══════════════════════════════════════════════════════════════════

#include "lanserve/lifecycle.h"

#include "lanserve/console.h"
#include "lanserve/http.h"

#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>

#include <csignal>
#include <thread>

namespace lanserve::lifecycle {

namespace net = boost::asio;

std::string describe(Trigger trigger) {
    switch (trigger) {
        case Trigger::Interrupt:    return "interrupt";
        case Trigger::ServerError:  return "server error";
        case Trigger::LimitReached: return "download limit reached";
    }
    return "unknown";
}

// ── ShutdownSignal ──

bool ShutdownSignal::raise(Trigger trigger, std::string detail) {
    if (raised_.exchange(true, std::memory_order_acq_rel)) {
        return false;
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        trigger_ = trigger;
        detail_ = std::move(detail);
    }
    cv_.notify_all();
    return true;
}

Trigger ShutdownSignal::wait() {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait(lock, [this] { return trigger_.has_value(); });
    return *trigger_;
}

std::optional<Trigger> ShutdownSignal::waitFor(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    if (!cv_.wait_for(lock, timeout, [this] { return trigger_.has_value(); })) {
        return std::nullopt;
    }
    return trigger_;
}

std::optional<Trigger> ShutdownSignal::trigger() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return trigger_;
}

std::string ShutdownSignal::detail() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return detail_;
}

// ── ActiveTransfers ──

std::size_t ActiveTransfers::count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return active_;
}

bool ActiveTransfers::waitIdle(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    return idle_.wait_for(lock, timeout, [this] { return active_ == 0; });
}

void ActiveTransfers::add() {
    std::lock_guard<std::mutex> lock(mutex_);
    ++active_;
}

void ActiveTransfers::done() {
    bool idle = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (active_ > 0) --active_;
        idle = active_ == 0;
    }
    if (idle) idle_.notify_all();
}

// ── TransferLimit ──

TransferLimit::Completion TransferLimit::recordCompletion() {
    Completion result;
    result.completed = completed_.fetch_add(1, std::memory_order_acq_rel) + 1;

    if (max_ == 0) {
        return result;
    }

    result.remaining = result.completed >= max_ ? 0 : max_ - result.completed;
    if (result.completed >= max_) {
        result.limitReached = true;
        signal_.raise(Trigger::LimitReached);
    }
    return result;
}

std::optional<std::uint64_t> TransferLimit::remaining() const {
    if (max_ == 0) return std::nullopt;
    auto done = completed_.load();
    return done >= max_ ? 0 : max_ - done;
}

// ── InterruptWatcher ──

struct InterruptWatcher::Impl {
    explicit Impl(ShutdownSignal& signal)
        : signals(ioc, SIGINT, SIGTERM) {
        signals.async_wait([&signal](const boost::system::error_code& ec, int number) {
            if (ec) return;  // operation_aborted on teardown
            signal.raise(Trigger::Interrupt, number == SIGTERM ? "SIGTERM" : "SIGINT");
        });
        worker = std::thread([this] { ioc.run(); });
    }

    ~Impl() {
        ioc.stop();
        if (worker.joinable()) worker.join();
    }

    net::io_context ioc{1};
    net::signal_set signals;
    std::thread worker;
};

InterruptWatcher::InterruptWatcher(ShutdownSignal& signal)
    : impl_(std::make_unique<Impl>(signal)) {}

InterruptWatcher::~InterruptWatcher() = default;

// ── ShutdownCoordinator ──

ShutdownCoordinator::Outcome ShutdownCoordinator::run(http::Server& server) {
    return runWith([&server] { server.close(); });
}

void ShutdownCoordinator::announce(Trigger trigger) const {
    auto detail = lifecycle_->signal.detail();
    switch (trigger) {
        case Trigger::Interrupt:
            console::info("Received", detail.empty() ? "interrupt" : detail, "- shutting down...");
            break;
        case Trigger::ServerError:
            console::error("Server error:", detail, "- shutting down...");
            break;
        case Trigger::LimitReached:
            console::info("Download limit reached, shutting down...");
            break;
    }
}

ShutdownCoordinator::Outcome ShutdownCoordinator::drain(Trigger trigger) const {
    auto active = lifecycle_->active.count();
    if (active > 0) {
        console::info("Waiting for", active, "active download(s) to finish...");
    }

    Outcome outcome{trigger, lifecycle_->signal.detail(), lifecycle_->active.waitIdle(drainTimeout_)};
    if (outcome.drained) {
        console::success("All downloads completed");
    } else {
        console::warn("Shutdown timeout reached,", lifecycle_->active.count(),
                      "download(s) abandoned");
    }
    return outcome;
}

} // namespace lanserve::lifecycle
