#pragma once

#include "acerelay/quality/QualityTracker.hpp"
#include "acerelay/relay/StreamRelay.hpp"

#include <boost/asio/thread_pool.hpp>

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <mutex>

namespace acerelay::service {

// Background sweep that plays every content id whose quality is still
// unknown or at the minimum so the tracker gets fresh observations.
class QualityCheckService {
public:
    struct Timing {
        int attemptsPerCandidate{3};
        std::chrono::milliseconds betweenAttempts{std::chrono::seconds{1}};
        std::chrono::milliseconds betweenCandidates{std::chrono::seconds{10}};
    };

    QualityCheckService(quality::QualityTracker& tracker,
                        relay::StreamRelay& relay,
                        boost::asio::thread_pool& workers,
                        Timing timing);
    QualityCheckService(quality::QualityTracker& tracker,
                        relay::StreamRelay& relay,
                        boost::asio::thread_pool& workers);
    ~QualityCheckService();

    QualityCheckService(const QualityCheckService&) = delete;
    QualityCheckService& operator=(const QualityCheckService&) = delete;

    // False when a sweep is already running.
    bool start();
    // Cancels the running sweep and waits for it to finish its current call.
    void stop();

    [[nodiscard]] bool running() const;
    [[nodiscard]] std::size_t lastSweepChecked() const;

private:
    void sweep();
    // False when cancelled during the wait.
    bool waitFor(std::chrono::milliseconds duration);

    quality::QualityTracker& tracker_;
    relay::StreamRelay& relay_;
    boost::asio::thread_pool& workers_;
    Timing timing_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    bool running_{false};
    bool cancelled_{false};
    std::size_t lastSweepChecked_{0};
};

} // namespace acerelay::service
