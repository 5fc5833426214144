#pragma once
#include <stdexcept>
#include <string>

namespace relcheck {

class UpdateError : public std::runtime_error {
public:
    explicit UpdateError(const std::string& message) : std::runtime_error(message) {}
};

// Raised when a version string does not have the int.int.int...(-snapshot/dev) shape.
class VersionFormatError : public UpdateError {
public:
    explicit VersionFormatError(const std::string& message) : UpdateError(message) {}
};

class ConfigError : public UpdateError {
public:
    explicit ConfigError(const std::string& message) : UpdateError(message) {}
};

// Misuse of the checker by the calling code. Retrying does not help.
class UsageError : public UpdateError {
public:
    explicit UsageError(const std::string& message) : UpdateError(message) {}
};

class MissingLoggerError : public UsageError {
public:
    explicit MissingLoggerError(const std::string& message) : UsageError(message) {}
};

class NoPriorCheckError : public UsageError {
public:
    explicit NoPriorCheckError(const std::string& message) : UsageError(message) {}
};

class NoLoggerError : public UsageError {
public:
    explicit NoLoggerError(const std::string& message) : UsageError(message) {}
};

class CheckInProgressError : public UsageError {
public:
    explicit CheckInProgressError(const std::string& message) : UsageError(message) {}
};

// Failures of a single check against GitHub. The caller may try again later.
class CheckError : public UpdateError {
public:
    explicit CheckError(const std::string& message) : UpdateError(message) {}
};

class RepositoryNotFoundError : public CheckError {
public:
    explicit RepositoryNotFoundError(const std::string& message) : CheckError(message) {}
};

class MissingTagDataError : public CheckError {
public:
    explicit MissingTagDataError(const std::string& message) : CheckError(message) {}
};

class TransportError : public CheckError {
public:
    explicit TransportError(const std::string& message) : CheckError(message) {}
};

} // namespace relcheck
