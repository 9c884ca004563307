#include "acerelay/util/PeriodicTask.hpp"
#include "acerelay/util/Logging.hpp"

#include <boost/asio/post.hpp>

#include <exception>
#include <utility>

namespace acerelay::util {

PeriodicTask::PeriodicTask(std::string name,
                           boost::asio::io_context& io,
                           boost::asio::thread_pool& workers,
                           std::chrono::milliseconds interval,
                           Work work)
    : name_(std::move(name))
    , workers_(workers)
    , interval_(interval)
    , work_(std::move(work))
    , timer_(io) {}

void PeriodicTask::start(std::chrono::milliseconds initialDelay) {
    stopped_ = false;
    log(LogLevel::debug, "Starting background task " + name_);
    schedule(initialDelay);
}

void PeriodicTask::stop() {
    if (stopped_.exchange(true)) {
        return;
    }
    std::scoped_lock lock(timerMutex_);
    timer_.cancel();
    log(LogLevel::debug, "Stopped background task " + name_);
}

void PeriodicTask::schedule(std::chrono::milliseconds delay) {
    std::scoped_lock lock(timerMutex_);
    if (stopped_) {
        return;
    }
    timer_.expires_after(delay);
    timer_.async_wait([self = shared_from_this()](const boost::system::error_code& ec) {
        if (ec || self->stopped_) {
            return;
        }
        boost::asio::post(self->workers_, [self]() { self->runOnce(); });
    });
}

void PeriodicTask::runOnce() {
    if (stopped_) {
        return;
    }
    try {
        work_();
    } catch (const std::exception& ex) {
        log(LogLevel::error, "Background task " + name_ + " failed: " + ex.what());
    }
    ++runs_;
    schedule(interval_);
}

} // namespace acerelay::util
