#pragma once

#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/thread_pool.hpp>

#include <atomic>
#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <string>

namespace acerelay::util {

// Runs `work` on the worker pool every `interval`, timed by a steady_timer on
// the io_context. The next tick is armed only after the current one returns,
// so ticks never overlap. A tick that throws is logged and the task carries
// on. Create through std::make_shared.
class PeriodicTask : public std::enable_shared_from_this<PeriodicTask> {
public:
    using Work = std::function<void()>;

    PeriodicTask(std::string name,
                 boost::asio::io_context& io,
                 boost::asio::thread_pool& workers,
                 std::chrono::milliseconds interval,
                 Work work);

    void start(std::chrono::milliseconds initialDelay = std::chrono::milliseconds{0});
    void stop();

    [[nodiscard]] std::size_t runs() const noexcept { return runs_.load(); }
    [[nodiscard]] bool stopped() const noexcept { return stopped_.load(); }
    [[nodiscard]] const std::string& name() const noexcept { return name_; }

private:
    void schedule(std::chrono::milliseconds delay);
    void runOnce();

    std::string name_;
    boost::asio::thread_pool& workers_;
    std::chrono::milliseconds interval_;
    Work work_;

    std::mutex timerMutex_;
    boost::asio::steady_timer timer_;
    std::atomic<bool> stopped_{false};
    std::atomic<std::size_t> runs_{0};
};

} // namespace acerelay::util
