#include "curl_client.hpp"
#include <algorithm>
#include <cctype>
#include <string_view>

#include "../../core/types/constants.hpp"

namespace Ar5iv {
namespace Network {
namespace Http {

namespace {

constexpr std::string_view CONTENT_TYPE_HEADER = "content-type:";

inline std::string_view trim_view(std::string_view s) {
    size_t first = s.find_first_not_of(" \t\r\n");
    if (first == std::string_view::npos)
        return {};
    size_t last = s.find_last_not_of(" \t\r\n");
    return s.substr(first, last - first + 1);
}

bool istarts_with(std::string_view text, std::string_view prefix) {
    if (text.size() < prefix.size())
        return false;
    return std::equal(prefix.begin(), prefix.end(), text.begin(), [](char c1, char c2) {
        return std::tolower(static_cast<unsigned char>(c1))
               == std::tolower(static_cast<unsigned char>(c2));
    });
}

ErrorType map_curl_code_to_error_type(CURLcode code) {
    switch (code) {
        case CURLE_OPERATION_TIMEDOUT:
            return ErrorType::Timeout;
        case CURLE_COULDNT_CONNECT:
        case CURLE_COULDNT_RESOLVE_HOST:
        case CURLE_RECV_ERROR:
        case CURLE_SEND_ERROR:
            return ErrorType::Network;
        default:
            return ErrorType::Other;
    }
}

}  // namespace

size_t CurlClient::write_callback(void* contents, size_t size, size_t nmemb, void* userp) {
    auto* ctx = static_cast<CurlClient::RequestContext*>(userp);
    if (!ctx || !ctx->body)
        return 0;

    size_t total = size * nmemb;
    ctx->body->append(static_cast<const char*>(contents), total);
    return total;
}

size_t CurlClient::header_callback(char* buffer, size_t size, size_t nitems, void* userp) {
    auto* ctx = static_cast<CurlClient::RequestContext*>(userp);
    if (!ctx || !ctx->content_type)
        return size * nitems;

    std::string_view header(buffer, size * nitems);
    if (!istarts_with(header, CONTENT_TYPE_HEADER))
        return size * nitems;

    // Redirect hops each carry their own header; the last one wins.
    *ctx->content_type = std::string(trim_view(header.substr(CONTENT_TYPE_HEADER.size())));
    return size * nitems;
}

Response CurlClient::create_error_response(const std::string& msg) const {
    Response r;
    r.success     = false;
    r.error       = msg;
    r.error_type  = ErrorType::Other;
    r.status_code = static_cast<long>(HTTPCode::NetworkError);
    return r;
}

CURLcode CurlClient::perform_curl_request(CURL*           curl,
                                          const Request&  req,
                                          RequestContext& ctx,
                                          long&           out_response_code,
                                          std::string&    out_effective_url) const {
    curl_easy_reset(curl);
    curl_easy_setopt(curl, CURLOPT_URL, req.url.c_str());
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &ctx);
    curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, header_callback);
    curl_easy_setopt(curl, CURLOPT_HEADERDATA, &ctx);
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, req.timeout_seconds);
    curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);

    if (!req.user_agent.empty())
        curl_easy_setopt(curl, CURLOPT_USERAGENT, req.user_agent.c_str());

    CURLcode cres = curl_easy_perform(curl);
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &out_response_code);
    char* eff_url_ptr = nullptr;
    curl_easy_getinfo(curl, CURLINFO_EFFECTIVE_URL, &eff_url_ptr);
    out_effective_url = eff_url_ptr ? std::string(eff_url_ptr) : req.url;
    return cres;
}

Response CurlClient::handle_response(CURLcode           res,
                                     long               response_code,
                                     const std::string& effective_url,
                                     std::string&       body,
                                     std::string&       content_type) const {
    Response response;
    response.effective_url = effective_url;
    response.status_code   = response_code;
    response.content_type  = content_type;

    if (res != CURLE_OK) {
        response.success     = false;
        response.error       = curl_easy_strerror(res);
        response.error_type  = map_curl_code_to_error_type(res);
        response.status_code = static_cast<long>(HTTPCode::NetworkError);
        return response;
    }

    response.body    = std::move(body);
    response.success = (response.status_code >= static_cast<long>(HTTPCode::Ok)
                        && response.status_code < static_cast<long>(MaxCode::ClientError));
    if (!response.success) {
        response.error      = "HTTP " + std::to_string(response.status_code);
        response.error_type = ErrorType::Http;
    }
    return response;
}

CurlClient::Request CurlClient::create_request(const std::string& url) const {
    Request req;
    req.url             = url;
    req.timeout_seconds = timeout_seconds_;
    req.user_agent      = user_agent_;
    return req;
}

CurlClient::CurlClient()
    : curl_(curl_easy_init()),
      timeout_seconds_(Core::Constants::REQUEST_TIMEOUT_SECONDS),
      user_agent_(Core::Constants::USER_AGENT) {
}

void CurlClient::set_timeout(long seconds) {
    timeout_seconds_ = seconds;
}

void CurlClient::set_user_agent(const std::string& agent) {
    user_agent_ = agent;
}

Response CurlClient::perform(const Request& req) {
    if (!curl_)
        return create_error_response("Failed to initialize CURL handle");

    std::string    body_buffer;
    std::string    content_type;
    std::string    effective_url;
    RequestContext ctx{&body_buffer, &content_type};

    long     response_code = 0;
    CURLcode res = perform_curl_request(curl_.get(), req, ctx, response_code, effective_url);
    return handle_response(res, response_code, effective_url, body_buffer, content_type);
}

Response CurlClient::get(const std::string& url) {
    return perform(create_request(url));
}

}  // namespace Http
}  // namespace Network
}  // namespace Ar5iv
