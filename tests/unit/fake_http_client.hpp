#pragma once
#include <map>
#include <memory>
#include <mutex>
#include <string>

#include "../../src/engine/stages/asset_localizer.hpp"
#include "../../src/network/http/http_client.hpp"

namespace Ar5iv {
namespace Testing {

// In-memory web shared by every client a factory hands out.
class FakeWeb {
public:
    void serve(const std::string& url,
               const std::string& body,
               const std::string& content_type  = "text/html; charset=utf-8",
               const std::string& effective_url = "") {
        Network::Http::Response res;
        res.success       = true;
        res.status_code   = 200;
        res.body          = body;
        res.content_type  = content_type;
        res.effective_url = effective_url.empty() ? url : effective_url;
        std::lock_guard<std::mutex> lock(mutex_);
        routes_[url] = res;
    }

    void fail(const std::string& url, const std::string& error = "Timeout was reached") {
        Network::Http::Response res;
        res.success    = false;
        res.error      = error;
        res.error_type = Network::Http::ErrorType::Timeout;
        std::lock_guard<std::mutex> lock(mutex_);
        routes_[url] = res;
    }

    Network::Http::Response get(const std::string& url) {
        std::lock_guard<std::mutex> lock(mutex_);
        hits_[url]++;
        auto it = routes_.find(url);
        if (it != routes_.end())
            return it->second;

        Network::Http::Response res;
        res.success       = false;
        res.status_code   = 404;
        res.error         = "HTTP 404";
        res.error_type    = Network::Http::ErrorType::Http;
        res.effective_url = url;
        return res;
    }

    int hits(const std::string& url) {
        std::lock_guard<std::mutex> lock(mutex_);
        return hits_[url];
    }

    int total_hits() {
        std::lock_guard<std::mutex> lock(mutex_);
        int total = 0;
        for (const auto& [url, count] : hits_)
            total += count;
        return total;
    }

    void record_timeout(long seconds) {
        std::lock_guard<std::mutex> lock(mutex_);
        timeout_ = seconds;
    }

    void record_user_agent(const std::string& agent) {
        std::lock_guard<std::mutex> lock(mutex_);
        user_agent_ = agent;
    }

    long timeout() {
        std::lock_guard<std::mutex> lock(mutex_);
        return timeout_;
    }

    std::string user_agent() {
        std::lock_guard<std::mutex> lock(mutex_);
        return user_agent_;
    }

    Engine::ClientFactory factory();

private:
    std::mutex                                     mutex_;
    std::map<std::string, Network::Http::Response> routes_;
    std::map<std::string, int>                     hits_;
    long                                           timeout_ = 0;
    std::string                                    user_agent_;
};

class FakeHttpClient : public Network::Http::HttpClient {
public:
    explicit FakeHttpClient(FakeWeb& web) : web_(web) {
    }

    void set_timeout(long seconds) override {
        web_.record_timeout(seconds);
    }
    void set_user_agent(const std::string& agent) override {
        web_.record_user_agent(agent);
    }
    Network::Http::Response get(const std::string& url) override {
        return web_.get(url);
    }

private:
    FakeWeb& web_;
};

inline Engine::ClientFactory FakeWeb::factory() {
    return [this]() { return std::make_unique<FakeHttpClient>(*this); };
}

}  // namespace Testing
}  // namespace Ar5iv
