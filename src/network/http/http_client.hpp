#pragma once
#include <string>

namespace Ar5iv {
namespace Network {
namespace Http {

enum class ErrorType { None, Network, Timeout, Http, Other };

enum class HTTPCode { NetworkError = 0, Ok = 200 };

enum class MaxCode { ClientError = 400 };

struct Response {
    std::string effective_url;
    long        status_code = 0;
    std::string content_type;
    std::string body;
    std::string error;
    bool        success    = false;
    ErrorType   error_type = ErrorType::None;
};

// One blocking attempt per call; failures are reported in the Response.
class HttpClient {
public:
    virtual ~HttpClient() = default;

    virtual void     set_timeout(long seconds)                 = 0;
    virtual void     set_user_agent(const std::string& agent) = 0;
    virtual Response get(const std::string& url)               = 0;
};

}  // namespace Http
}  // namespace Network
}  // namespace Ar5iv
