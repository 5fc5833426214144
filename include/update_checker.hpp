#pragma once
#include "http_client.hpp"
#include "logger.hpp"
#include "version.hpp"
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

namespace relcheck {

constexpr const char* GITHUB_API_VERSION = "2022-11-28";

// The checker must outlive any check it started.
class UpdateChecker {
public:
    enum class State {
        NotChecked,
        Checking,
        Resolved,
        Failed
    };

    UpdateChecker(const std::string& author, const std::string& name,
                  const std::string& current_version, bool auto_notify, Logger logger);
    UpdateChecker(const std::string& author, const std::string& name,
                  const std::string& current_version, bool auto_notify, Logger logger,
                  const std::string& token);
    ~UpdateChecker();

    UpdateChecker(const UpdateChecker&) = delete;
    UpdateChecker& operator=(const UpdateChecker&) = delete;

    std::future<void> check();
    void notify();

    // Placeholders: @name, @latestVersion, @currentVersion
    void setMessage(std::optional<std::string> message);

    void setTransport(std::shared_ptr<HttpTransport> transport);

    bool updateAvailable() const;
    std::optional<std::string> latestVersion() const;
    std::optional<Version> latestRelease() const;
    std::optional<std::string> updateMessage() const;
    State state() const;

    const Version& currentVersion() const { return current_version_; }
    const std::string& repoName() const { return repo_name_; }
    const std::string& uri() const { return uri_; }
    bool usesToken() const { return token_.has_value(); }

private:
    void run(std::promise<void> promise);
    Version fetchFromRedirect(HttpTransport& transport) const;
    Version fetchFromApi(HttpTransport& transport) const;
    void compareAndStore(const Version& latest);
    std::optional<std::string> renderMessage() const;

    std::string repo_name_;
    Version current_version_;
    std::string uri_;
    std::optional<std::string> token_;
    bool auto_notify_;
    Logger logger_;

    mutable std::mutex mutex_;
    std::shared_ptr<HttpTransport> transport_;
    std::optional<Version> latest_version_;
    bool update_available_ = false;
    std::optional<std::string> message_;
    State state_ = State::NotChecked;

    std::mutex worker_mutex_;
    std::thread worker_;
};

} // namespace relcheck
