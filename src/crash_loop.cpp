#include "crash_loop.hpp"

#include "crash.hpp"
#include "log.hpp"

#include <chrono>
#include <stdexcept>
#include <utility>

namespace hb {

CrashLoop::CrashLoop(CrashRoundScheduler& scheduler)
    : scheduler_(scheduler) {}

CrashLoop::~CrashLoop() {
    join();
    std::lock_guard<std::mutex> lock(mutex_);
    if (failure_) {
        Log::warning("crash-loop", "destroyed with an unreported failure");
    }
}

void CrashLoop::start() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (worker_.joinable()) {
        throw std::logic_error("crash loop already started");
    }
    stopping_ = false;
    running_ = true;
    failure_ = nullptr;
    worker_ = std::thread(&CrashLoop::run, this);
}

void CrashLoop::stop() {
    join();
    std::exception_ptr failure;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        std::swap(failure, failure_);
    }
    if (failure) {
        std::rethrow_exception(failure);
    }
}

bool CrashLoop::running() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return running_;
}

void CrashLoop::join() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopping_ = true;
    }
    wake_.notify_all();
    if (worker_.joinable()) {
        worker_.join();
    }
}

void CrashLoop::run() {
    using Clock = CrashRoundScheduler::Clock;
    try {
        scheduler_.start(Clock::now());
        for (;;) {
            auto deadline = scheduler_.nextDeadline();
            {
                std::unique_lock<std::mutex> lock(mutex_);
                if (deadline == CrashRoundScheduler::TimePoint::max()) {
                    wake_.wait_for(lock, scheduler_.config().tickInterval, [this] { return stopping_; });
                } else {
                    wake_.wait_until(lock, deadline, [this] { return stopping_; });
                }
                if (stopping_) {
                    break;
                }
            }
            scheduler_.advance(Clock::now());
        }
    } catch (const std::exception& e) {
        Log::error("crash-loop", "stopped: ", e.what());
        std::lock_guard<std::mutex> lock(mutex_);
        failure_ = std::current_exception();
    }
    std::lock_guard<std::mutex> lock(mutex_);
    running_ = false;
}

} // namespace hb
