#include "http_client.hpp"
#include "errors.hpp"
#include "utils.hpp"
#include <curl/curl.h>
#include <mutex>

namespace {
    size_t WriteCallback(void* contents, size_t size, size_t nmemb, std::string* userp) {
        userp->append((char*)contents, size * nmemb);
        return size * nmemb;
    }

    size_t HeaderCallback(char* buffer, size_t size, size_t nitems, void* userdata) {
        auto* headers = static_cast<std::map<std::string, std::string>*>(userdata);
        std::string header(buffer, size * nitems);

        // A new status line starts a new header block (redirects, 100-continue).
        if (header.rfind("HTTP/", 0) == 0) {
            headers->clear();
            return size * nitems;
        }

        size_t colon = header.find(':');
        if (colon == std::string::npos) {
            return size * nitems;
        }

        std::string name = relcheck::utils::toLower(header.substr(0, colon));
        std::string value = header.substr(colon + 1);
        value.erase(0, value.find_first_not_of(" \n\r\t"));
        value.erase(value.find_last_not_of(" \n\r\t") + 1);

        (*headers)[name] = value;
        return size * nitems;
    }
}

namespace relcheck {

std::optional<std::string> HttpResponse::header(const std::string& name) const {
    auto it = headers.find(utils::toLower(name));
    if (it == headers.end()) {
        return std::nullopt;
    }
    return it->second;
}

CurlTransport::CurlTransport(std::string user_agent) : user_agent_(std::move(user_agent)) {
    // curl_easy_init() would otherwise run the global init lazily on a worker thread.
    static std::once_flag curl_init_flag;
    std::call_once(curl_init_flag, []() {
        CURLcode res = curl_global_init(CURL_GLOBAL_DEFAULT);
        if (res != CURLE_OK) {
            throw TransportError(std::string("Failed to initialize CURL: ") + curl_easy_strerror(res));
        }
    });
}

HttpResponse CurlTransport::get(const HttpRequest& request) {
    CURL* curl = curl_easy_init();
    if (!curl) {
        throw TransportError("Failed to initialize CURL");
    }

    HttpResponse response;

    curl_easy_setopt(curl, CURLOPT_URL, request.url.c_str());
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, WriteCallback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response.body);
    curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, HeaderCallback);
    curl_easy_setopt(curl, CURLOPT_HEADERDATA, &response.headers);
    curl_easy_setopt(curl, CURLOPT_USERAGENT, user_agent_.c_str());
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, request.follow_redirects ? 1L : 0L);

    struct curl_slist* headers = NULL;
    for (const auto& [name, value] : request.headers) {
        headers = curl_slist_append(headers, (name + ": " + value).c_str());
    }
    if (headers) {
        curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
    }

    CURLcode res = curl_easy_perform(curl);

    if (headers) {
        curl_slist_free_all(headers);
    }

    if (res != CURLE_OK) {
        curl_easy_cleanup(curl);
        throw TransportError("There was an error during the execution of the request to " +
                             request.url + ": " + curl_easy_strerror(res));
    }

    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &response.status_code);
    curl_easy_cleanup(curl);

    return response;
}

} // namespace relcheck
