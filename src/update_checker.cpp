#include "update_checker.hpp"
#include "errors.hpp"
#include "utils.hpp"
#include <nlohmann/json.hpp>
#include <system_error>

namespace {
    const std::string GITHUB_URL = "https://github.com/";
    const std::string GITHUB_API_URL = "https://api.github.com/repos/";

    // A tag that is not a version is bad release data, not a local mistake.
    relcheck::Version parseTag(const std::string& tag, bool prerelease) {
        std::string name = relcheck::utils::stripVersionPrefix(relcheck::utils::lastPathSegment(tag));
        try {
            return relcheck::Version(name, prerelease);
        } catch (const relcheck::VersionFormatError& e) {
            throw relcheck::MissingTagDataError("Release tag '" + tag + "' is not a version: " + e.what());
        }
    }
}

namespace relcheck {

UpdateChecker::UpdateChecker(const std::string& author, const std::string& name,
                             const std::string& current_version, bool auto_notify, Logger logger)
    : repo_name_(name),
      current_version_(utils::stripVersionPrefix(current_version)),
      uri_(GITHUB_URL + author + "/" + name + "/releases/latest"),
      auto_notify_(auto_notify),
      logger_(std::move(logger)),
      transport_(std::make_shared<CurlTransport>()) {
    if (auto_notify_ && !logger_) {
        throw MissingLoggerError("No logger provided with autoNotify set to true. Please provide a logger!");
    }
}

UpdateChecker::UpdateChecker(const std::string& author, const std::string& name,
                             const std::string& current_version, bool auto_notify, Logger logger,
                             const std::string& token)
    : repo_name_(name),
      current_version_(utils::stripVersionPrefix(current_version)),
      uri_(GITHUB_API_URL + author + "/" + name + "/releases/latest"),
      token_(token),
      auto_notify_(auto_notify),
      logger_(std::move(logger)),
      transport_(std::make_shared<CurlTransport>()) {
    if (auto_notify_ && !logger_) {
        throw MissingLoggerError("No logger provided with autoNotify set to true. Please provide a logger!");
    }
}

UpdateChecker::~UpdateChecker() {
    std::lock_guard<std::mutex> worker_lock(worker_mutex_);
    if (!worker_.joinable()) {
        return;
    }
    // Destroyed from its own logger callback: the thread cannot join itself.
    if (worker_.get_id() == std::this_thread::get_id()) {
        worker_.detach();
    } else {
        worker_.join();
    }
}

std::future<void> UpdateChecker::check() {
    std::lock_guard<std::mutex> worker_lock(worker_mutex_);

    if (worker_.joinable() && worker_.get_id() == std::this_thread::get_id()) {
        throw UsageError("check() cannot be called from the logger of a running check of " + repo_name_);
    }

    State previous = State::NotChecked;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ == State::Checking) {
            throw CheckInProgressError("A check of " + repo_name_ + " is already running");
        }
        previous = state_;
        state_ = State::Checking;
    }

    std::promise<void> promise;
    std::future<void> future = promise.get_future();

    try {
        if (worker_.joinable()) {
            worker_.join();
        }
        worker_ = std::thread(&UpdateChecker::run, this, std::move(promise));
    } catch (const std::system_error&) {
        std::lock_guard<std::mutex> lock(mutex_);
        state_ = previous;
        throw;
    }

    return future;
}

void UpdateChecker::run(std::promise<void> promise) {
    std::shared_ptr<HttpTransport> transport;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        transport = transport_;
    }

    std::optional<Version> latest;
    try {
        latest = token_ ? fetchFromApi(*transport) : fetchFromRedirect(*transport);
    } catch (...) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            state_ = State::Failed;
        }
        promise.set_exception(std::current_exception());
        return;
    }

    // The result is stored even if the auto notification throws; the
    // logger's exception still reaches the caller through the future.
    try {
        compareAndStore(*latest);
        promise.set_value();
    } catch (...) {
        promise.set_exception(std::current_exception());
    }
}

Version UpdateChecker::fetchFromRedirect(HttpTransport& transport) const {
    HttpRequest request;
    request.url = uri_;
    request.follow_redirects = false;

    HttpResponse response = transport.get(request);

    if (response.status_code == 404) {
        throw RepositoryNotFoundError("Could not connect to " + repo_name_ +
                                      ". The repository is private, if so use an access token, or it does not exist.");
    }

    auto location = response.header("Location");
    if (!location || location->empty()) {
        throw MissingTagDataError("No version found in the response from " + uri_);
    }

    return parseTag(*location, false);
}

Version UpdateChecker::fetchFromApi(HttpTransport& transport) const {
    HttpRequest request;
    request.url = uri_;
    request.headers = {
        {"Accept", "application/vnd.github+json"},
        {"Authorization", "Bearer " + *token_},
        {"X-GitHub-Api-Version", GITHUB_API_VERSION}
    };

    HttpResponse response = transport.get(request);

    if (response.status_code != 200 || response.body.empty()) {
        throw RepositoryNotFoundError("Could not get release data of " + repo_name_ + " (HTTP " +
                                      std::to_string(response.status_code) +
                                      "). The repository does not exist or the token cannot read its releases.");
    }

    auto json = nlohmann::json::parse(response.body, nullptr, false);
    if (json.is_discarded() || !json.is_object()) {
        throw MissingTagDataError("Release data of " + repo_name_ + " is not a JSON object");
    }

    auto tag_name = json.find("tag_name");
    if (tag_name == json.end() || !tag_name->is_string()) {
        throw MissingTagDataError("Missing required field: tag_name");
    }

    bool prerelease = false;
    auto prerelease_field = json.find("prerelease");
    if (prerelease_field != json.end() && prerelease_field->is_boolean()) {
        prerelease = prerelease_field->get<bool>();
    }

    return parseTag(tag_name->get<std::string>(), prerelease);
}

void UpdateChecker::compareAndStore(const Version& latest) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        latest_version_ = latest;
        update_available_ = current_version_.compare(latest) < 0;
        state_ = State::Resolved;
    }

    if (auto_notify_) {
        notify();
    }
}

void UpdateChecker::notify() {
    std::optional<std::string> message;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!latest_version_) {
            throw NoPriorCheckError("There is no version to compare to. No check has completed yet.");
        }
        if (!logger_) {
            throw NoLoggerError("There is no logger provided!");
        }
        message = renderMessage();
    }

    if (message) {
        logger_(*message);
    }
}

// Expects mutex_ to be held.
std::optional<std::string> UpdateChecker::renderMessage() const {
    if (!latest_version_ || !update_available_) {
        return std::nullopt;
    }

    if (!message_) {
        return "There is a newer version of " + repo_name_ + " (" + latest_version_->raw() +
               ")! Current version: " + current_version_.raw();
    }

    std::string message = utils::replaceAll(*message_, "@name", repo_name_);
    message = utils::replaceAll(message, "@latestVersion", latest_version_->raw());
    return utils::replaceAll(message, "@currentVersion", current_version_.raw());
}

void UpdateChecker::setMessage(std::optional<std::string> message) {
    std::lock_guard<std::mutex> lock(mutex_);
    message_ = std::move(message);
}

void UpdateChecker::setTransport(std::shared_ptr<HttpTransport> transport) {
    if (!transport) {
        throw UsageError("An HTTP transport is required");
    }
    std::lock_guard<std::mutex> lock(mutex_);
    transport_ = std::move(transport);
}

bool UpdateChecker::updateAvailable() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return update_available_;
}

std::optional<std::string> UpdateChecker::latestVersion() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!latest_version_) {
        return std::nullopt;
    }
    return latest_version_->raw();
}

std::optional<Version> UpdateChecker::latestRelease() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return latest_version_;
}

std::optional<std::string> UpdateChecker::updateMessage() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return renderMessage();
}

UpdateChecker::State UpdateChecker::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

} // namespace relcheck
