#pragma once

#include "RetryExecutor.hpp"
#include "Transport.hpp"

#include <deque>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

namespace http_notifier::test {

// Scripted transport: replays queued responses in order and records every request.
class MockTransport : public Transport {
public:
    MockTransport& respond(long status, std::string body = {}, std::vector<std::string> headers = {}) {
        HttpResponse r;
        r.status = status;
        r.body = std::move(body);
        r.headers = std::move(headers);
        std::lock_guard<std::mutex> lk(mutex_);
        script_.push_back(std::move(r));
        return *this;
    }

    MockTransport& failTransport(std::string error) {
        HttpResponse r;
        r.error = std::move(error);
        std::lock_guard<std::mutex> lk(mutex_);
        script_.push_back(std::move(r));
        return *this;
    }

    HttpResponse send(const HttpRequest& request, const RequestPolicy&) override {
        std::lock_guard<std::mutex> lk(mutex_);
        requests_.push_back(request);
        if (script_.empty()) {
            HttpResponse r;
            r.error = "mock: script exhausted";
            return r;
        }
        HttpResponse r = std::move(script_.front());
        script_.pop_front();
        return r;
    }

    std::vector<HttpRequest> requests() const {
        std::lock_guard<std::mutex> lk(mutex_);
        return requests_;
    }

    size_t calls() const {
        std::lock_guard<std::mutex> lk(mutex_);
        return requests_.size();
    }

private:
    mutable std::mutex mutex_;
    std::deque<HttpResponse> script_;
    std::vector<HttpRequest> requests_;
};

// Records requested delays instead of sleeping.
struct RecordingSleeper {
    std::vector<double> delays;

    SleepFn fn() {
        return [this](double seconds) {
            delays.push_back(seconds);
            return true;
        };
    }
};

} // namespace http_notifier::test
