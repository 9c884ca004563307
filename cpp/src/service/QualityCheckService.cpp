#include "acerelay/service/QualityCheckService.hpp"
#include "acerelay/model/ContentId.hpp"
#include "acerelay/util/Logging.hpp"

#include <boost/asio/post.hpp>

#include <exception>
#include <string>

namespace acerelay::service {

QualityCheckService::QualityCheckService(quality::QualityTracker& tracker,
                                         relay::StreamRelay& relay,
                                         boost::asio::thread_pool& workers,
                                         Timing timing)
    : tracker_(tracker)
    , relay_(relay)
    , workers_(workers)
    , timing_(timing) {}

QualityCheckService::QualityCheckService(quality::QualityTracker& tracker,
                                         relay::StreamRelay& relay,
                                         boost::asio::thread_pool& workers)
    : QualityCheckService(tracker, relay, workers, Timing{}) {}

QualityCheckService::~QualityCheckService() {
    stop();
}

bool QualityCheckService::start() {
    {
        std::scoped_lock lock(mutex_);
        if (running_) {
            return false;
        }
        running_ = true;
        cancelled_ = false;
    }
    boost::asio::post(workers_, [this]() { sweep(); });
    return true;
}

void QualityCheckService::stop() {
    std::unique_lock lock(mutex_);
    cancelled_ = true;
    cv_.notify_all();
    cv_.wait(lock, [this] { return !running_; });
}

bool QualityCheckService::running() const {
    std::scoped_lock lock(mutex_);
    return running_;
}

std::size_t QualityCheckService::lastSweepChecked() const {
    std::scoped_lock lock(mutex_);
    return lastSweepChecked_;
}

bool QualityCheckService::waitFor(std::chrono::milliseconds duration) {
    std::unique_lock lock(mutex_);
    return !cv_.wait_for(lock, duration, [this] { return cancelled_; });
}

void QualityCheckService::sweep() {
    const auto candidates = tracker_.candidatesForCheck();
    util::log(util::LogLevel::info, "Quality check started for " + std::to_string(candidates.size()) + " streams");

    std::size_t checked = 0;
    bool cancelled = false;
    for (const auto& contentId : candidates) {
        {
            std::scoped_lock lock(mutex_);
            cancelled = cancelled_;
        }
        if (cancelled) {
            break;
        }
        ++checked;
        util::log(util::LogLevel::info,
                  "Checking stream " + model::shortId(contentId) + " (" + std::to_string(checked) + "/" +
                      std::to_string(candidates.size()) + ")");
        for (int attempt = 0; attempt < timing_.attemptsPerCandidate && !cancelled; ++attempt) {
            try {
                auto response = relay_.relayManifest(contentId);
                if (response.status >= 400) {
                    util::log(util::LogLevel::warn,
                              "Quality check of " + model::shortId(contentId) + " got HTTP " +
                                  std::to_string(response.status));
                }
            } catch (const std::exception& ex) {
                util::log(util::LogLevel::error, "Quality check of " + model::shortId(contentId) + " failed: " + ex.what());
            }
            cancelled = !waitFor(timing_.betweenAttempts);
        }
        if (cancelled || !waitFor(timing_.betweenCandidates)) {
            cancelled = true;
            break;
        }
    }

    util::log(util::LogLevel::info,
              std::string(cancelled ? "Quality check cancelled after " : "Quality check finished, ") +
                  std::to_string(checked) + " streams checked");

    std::scoped_lock lock(mutex_);
    lastSweepChecked_ = checked;
    running_ = false;
    cv_.notify_all();
}

} // namespace acerelay::service
