#pragma once
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace relcheck {

constexpr const char* DEFAULT_USER_AGENT = "relcheck-update-checker";

struct HttpRequest {
    std::string url;
    std::vector<std::pair<std::string, std::string>> headers;
    bool follow_redirects = true;
};

struct HttpResponse {
    long status_code = 0;
    std::map<std::string, std::string> headers;
    std::string body;

    std::optional<std::string> header(const std::string& name) const;
};

class HttpTransport {
public:
    virtual ~HttpTransport() = default;
    virtual HttpResponse get(const HttpRequest& request) = 0;
};

class CurlTransport : public HttpTransport {
public:
    explicit CurlTransport(std::string user_agent = DEFAULT_USER_AGENT);

    HttpResponse get(const HttpRequest& request) override;

private:
    std::string user_agent_;
};

} // namespace relcheck
