#pragma once
#include <functional>
#include <string>

namespace relcheck {

// Sink for informational messages. An empty Logger means "no logger".
using Logger = std::function<void(const std::string&)>;

// Writes each message on its own line to std::cout.
Logger consoleLogger();

} // namespace relcheck
