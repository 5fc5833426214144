#include <iostream>
#include <string>
#include <memory>
#include <optional>
#include <vector>
#include "config.hpp"
#include "errors.hpp"
#include "logger.hpp"
#include "update_checker.hpp"
#include "utils.hpp"
#include "version.hpp"

using namespace relcheck;

namespace {
    constexpr int EXIT_UP_TO_DATE = 0;
    constexpr int EXIT_ERROR = 1;
    constexpr int EXIT_UPDATE_AVAILABLE = 2;
}

void printHelp() {
    std::cout << "relcheck " << RELCHECK_VERSION << "\n\n"
              << "Usage: relcheck <command> [options]\n\n"
              << "Commands:\n"
              << "  check <author> <repo> <version>   Check a GitHub repository for a newer release\n"
              << "    --token <token>                 Use the GitHub API (needed for private repositories)\n"
              << "    --message <template>            Custom update message (@name, @latestVersion, @currentVersion)\n"
              << "    --quiet                         Only report through the exit code\n"
              << "  compare <version> <version>       Compare two version strings\n"
              << "  config [options]                  Configure defaults\n"
              << "    --token <token>                 Set the default GitHub token\n"
              << "    --message <template>            Set the default update message\n"
              << "    --auto-notify <on|off>          Print the update message as soon as the check resolves\n"
              << "  help                              Show this help message\n"
              << "  Global options:\n"
              << "    --config <path>                 Specify custom config file location\n\n"
              << "Exit codes for check: 0 up to date, 2 update available, 1 error.\n";
}

int runCheck(int argc, char* argv[], const Config& config) {
    std::vector<std::string> positional;
    std::string token = config.token;
    std::string message = config.message;
    bool quiet = false;

    for (int i = 2; i < argc; i++) {
        std::string option = argv[i];
        if (option == "--quiet") {
            quiet = true;
        }
        else if (option == "--token" && i + 1 < argc) {
            token = argv[++i];
        }
        else if (option == "--message" && i + 1 < argc) {
            message = argv[++i];
        }
        else if (option == "--config" && i + 1 < argc) {
            ++i;
        }
        else {
            positional.push_back(option);
        }
    }

    if (positional.size() != 3) {
        std::cerr << "Error: check requires <author> <repo> <version>\n";
        return EXIT_ERROR;
    }

    Logger logger = quiet ? Logger() : consoleLogger();
    bool auto_notify = config.auto_notify && !quiet;

    std::unique_ptr<UpdateChecker> checker;
    if (token.empty()) {
        checker = std::make_unique<UpdateChecker>(positional[0], positional[1], positional[2],
                                                  auto_notify, logger);
    } else {
        checker = std::make_unique<UpdateChecker>(positional[0], positional[1], positional[2],
                                                  auto_notify, logger, token);
    }

    checker->setTransport(std::make_shared<CurlTransport>(config.user_agent));
    if (!message.empty()) {
        checker->setMessage(message);
    }

    checker->check().get();

    if (!quiet) {
        if (!auto_notify) {
            checker->notify();
        }
        if (!checker->updateAvailable()) {
            std::cout << checker->repoName() << " is up to date (" << checker->currentVersion().raw()
                      << ", latest " << checker->latestVersion().value_or("?") << ").\n";
        }
    }

    return checker->updateAvailable() ? EXIT_UPDATE_AVAILABLE : EXIT_UP_TO_DATE;
}

int runCompare(int argc, char* argv[]) {
    if (argc < 4) {
        std::cerr << "Error: compare requires two versions\n";
        return EXIT_ERROR;
    }

    Version a(utils::stripVersionPrefix(argv[2]));
    Version b(utils::stripVersionPrefix(argv[3]));

    int result = a.compare(b);
    const char* relation = result < 0 ? "<" : (result > 0 ? ">" : "=");

    std::cout << a.raw() << " " << relation << " " << b.raw()
              << " (" << toString(a.kind()) << ", " << toString(b.kind()) << ")\n";
    return EXIT_UP_TO_DATE;
}

int runConfig(int argc, char* argv[], Config& config, const std::string& configPath) {
    for (int i = 2; i < argc; i++) {
        std::string option = argv[i];
        if (option == "--token" && i + 1 < argc) {
            config.token = argv[++i];
        }
        else if (option == "--message" && i + 1 < argc) {
            config.message = argv[++i];
        }
        else if (option == "--auto-notify" && i + 1 < argc) {
            std::string value = utils::toLower(argv[++i]);
            if (value != "on" && value != "off") {
                std::cerr << "Error: --auto-notify expects on or off\n";
                return EXIT_ERROR;
            }
            config.auto_notify = value == "on";
        }
        else if (option == "--config" && i + 1 < argc) {
            ++i;
        }
    }

    config.save(configPath);
    std::cout << "Configuration saved to " << configPath << "\n";
    return EXIT_UP_TO_DATE;
}

int main(int argc, char* argv[]) {
    if (argc < 2) {
        printHelp();
        return EXIT_ERROR;
    }

    std::string command = argv[1];
    if (command == "help" || command == "--help") {
        printHelp();
        return EXIT_UP_TO_DATE;
    }

    int status = EXIT_ERROR;

    try {
        if (command == "compare") {
            status = runCompare(argc, argv);
        }
        else {
            // Check for custom config path
            std::string configPath;
            for (int i = 1; i < argc - 1; i++) {
                if (std::string(argv[i]) == "--config") {
                    configPath = argv[i + 1];
                    break;
                }
            }
            if (configPath.empty()) {
                configPath = Config::getConfigPath();
            }

            auto config = Config::load(configPath);

            if (command == "check") {
                status = runCheck(argc, argv, config);
            }
            else if (command == "config") {
                status = runConfig(argc, argv, config, configPath);
            }
            else {
                printHelp();
            }
        }
    }
    catch (const VersionFormatError& e) {
        std::cerr << "Error: " << e.what() << "\n";
    }
    catch (const RepositoryNotFoundError& e) {
        std::cerr << "Error: Repository not found - " << e.what() << "\n";
    }
    catch (const TransportError& e) {
        std::cerr << "Network error: " << e.what() << "\n";
    }
    catch (const CheckError& e) {
        std::cerr << "Error reading release data: " << e.what() << "\n";
    }
    catch (const ConfigError& e) {
        std::cerr << "Config error: " << e.what() << "\n";
    }
    catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
    }

    return status;
}
