#pragma once
#include <curl/curl.h>
#include <memory>
#include <string>

#include "http_client.hpp"

namespace Ar5iv {
namespace Network {
namespace Http {

class CurlClient : public HttpClient {
public:
    CurlClient();
    ~CurlClient() override = default;
    CurlClient(const CurlClient&)            = delete;
    CurlClient& operator=(const CurlClient&) = delete;

    void     set_timeout(long seconds) override;
    void     set_user_agent(const std::string& agent) override;
    Response get(const std::string& url) override;

private:
    struct Request {
        std::string url;
        long        timeout_seconds = 30;
        std::string user_agent;
    };

    struct RequestContext {
        std::string* body         = nullptr;
        std::string* content_type = nullptr;
    };

    struct CurlDeleter {
        void operator()(CURL* curl) const noexcept {
            if (curl)
                curl_easy_cleanup(curl);
        }
    };

    std::unique_ptr<CURL, CurlDeleter> curl_;
    long                               timeout_seconds_;
    std::string                        user_agent_;

    Response perform(const Request& req);

    Response create_error_response(const std::string& msg) const;
    CURLcode perform_curl_request(CURL*              curl,
                                  const Request&     req,
                                  RequestContext&    ctx,
                                  long&              out_response_code,
                                  std::string&       out_effective_url) const;
    Response handle_response(CURLcode           res,
                             long               response_code,
                             const std::string& effective_url,
                             std::string&       body,
                             std::string&       content_type) const;
    Request  create_request(const std::string& url) const;

    // Callbacks must be static. userp is guaranteed to be RequestContext*.
    static size_t write_callback(void* contents, size_t size, size_t nmemb, void* userp);
    static size_t header_callback(char* buffer, size_t size, size_t nitems, void* userp);
};

}  // namespace Http
}  // namespace Network
}  // namespace Ar5iv
