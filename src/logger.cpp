#include "logger.hpp"
#include <iostream>

namespace relcheck {

Logger consoleLogger() {
    return [](const std::string& message) {
        std::cout << message << std::endl;
    };
}

} // namespace relcheck
