#pragma once
#include <string>
#include <string_view>

namespace relcheck {

constexpr std::string_view RELCHECK_VERSION = "1.0.0";

enum class VersionKind {
    Release,
    Snapshot,
    Dev
};

VersionKind parseKind(const std::string& raw, bool force_prerelease = false);

std::string_view suffix(VersionKind kind);
std::string_view toString(VersionKind kind);

class Version {
public:
    explicit Version(std::string raw, bool force_prerelease = false);

    int compare(const Version& other) const;

    const std::string& raw() const { return raw_; }
    const std::string& numeric() const { return numeric_; }
    VersionKind kind() const { return kind_; }

    bool operator==(const Version& other) const { return compare(other) == 0; }
    bool operator!=(const Version& other) const { return compare(other) != 0; }
    bool operator<(const Version& other) const { return compare(other) < 0; }
    bool operator>(const Version& other) const { return compare(other) > 0; }
    bool operator<=(const Version& other) const { return compare(other) <= 0; }
    bool operator>=(const Version& other) const { return compare(other) >= 0; }

private:
    std::string raw_;
    std::string numeric_;
    VersionKind kind_;
};

} // namespace relcheck
