#pragma once

#include <condition_variable>
#include <exception>
#include <mutex>
#include <thread>

namespace hb {

class CrashRoundScheduler;

// The one thread that owns crash timing: starts the scheduler, then sleeps
// until each deadline and advances it with steady_clock::now().
class CrashLoop {
public:
    explicit CrashLoop(CrashRoundScheduler& scheduler);
    ~CrashLoop();

    CrashLoop(const CrashLoop&) = delete;
    CrashLoop& operator=(const CrashLoop&) = delete;

    void start();

    // Joins the worker. Rethrows whatever ended the loop early.
    void stop();

    bool running() const;

private:
    void run();
    void join();

    CrashRoundScheduler& scheduler_;
    std::thread worker_;
    mutable std::mutex mutex_;
    std::condition_variable wake_;
    bool stopping_ = false;
    bool running_ = false;
    std::exception_ptr failure_;
};

} // namespace hb
