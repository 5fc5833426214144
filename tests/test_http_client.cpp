#include <catch2/catch.hpp>
#include <thread>
#include <vector>
#include "http_client.hpp"

using namespace relcheck;

TEST_CASE("Response headers", "[http]") {
    HttpResponse response;
    response.headers["location"] = "https://github.com/o/r/releases/tag/v1.0";

    CHECK(response.header("Location") == std::optional<std::string>("https://github.com/o/r/releases/tag/v1.0"));
    CHECK(response.header("LOCATION").has_value());
    CHECK_FALSE(response.header("content-type").has_value());
}

TEST_CASE("Curl transports can be created from several threads", "[http]") {
    std::vector<std::thread> threads;
    std::vector<int> created(4, 0);

    for (size_t i = 0; i < created.size(); ++i) {
        threads.emplace_back([&created, i]() {
            CurlTransport transport("relcheck-tests");
            created[i] = 1;
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    for (int value : created) {
        CHECK(value == 1);
    }
    CHECK_NOTHROW(CurlTransport());
}
