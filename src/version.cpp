#include "version.hpp"
#include "errors.hpp"
#include "utils.hpp"
#include <algorithm>
#include <regex>
#include <vector>

namespace {
    const std::regex& numericPattern() {
        static const std::regex pattern(R"(\d+(?:\.\d+)*)");
        return pattern;
    }

    const std::regex& suffixedPattern() {
        static const std::regex pattern(R"((\d+(?:\.\d+)*)-?(?:snapshot|dev))", std::regex::icase);
        return pattern;
    }

    const std::regex& prereleasePattern() {
        static const std::regex pattern(R"((\d+(?:\.\d+)*)-[0-9A-Za-z.]+)");
        return pattern;
    }

    // Returns the numeric part of raw, or an empty string if raw is malformed.
    std::string numericPart(const std::string& raw, bool force_prerelease) {
        if (std::regex_match(raw, numericPattern())) {
            return raw;
        }

        std::smatch match;
        if (std::regex_match(raw, match, suffixedPattern())) {
            return match[1].str();
        }
        if (force_prerelease && std::regex_match(raw, match, prereleasePattern())) {
            return match[1].str();
        }
        return "";
    }

    std::string_view trimLeadingZeros(std::string_view component) {
        size_t first = component.find_first_not_of('0');
        return first == std::string_view::npos ? std::string_view("0") : component.substr(first);
    }

    // Components are digit strings of any length, so compare them without
    // converting to a fixed-width integer.
    int compareComponents(std::string_view a, std::string_view b) {
        a = trimLeadingZeros(a);
        b = trimLeadingZeros(b);
        if (a.size() != b.size()) {
            return a.size() < b.size() ? -1 : 1;
        }
        int result = a.compare(b);
        return result < 0 ? -1 : (result > 0 ? 1 : 0);
    }
}

namespace relcheck {

// "snapshot" wins over "dev"; a forced pre-release is Dev unless the string says snapshot.
VersionKind parseKind(const std::string& raw, bool force_prerelease) {
    std::string lower = utils::toLower(raw);

    if (utils::endsWith(lower, suffix(VersionKind::Snapshot))) {
        return VersionKind::Snapshot;
    }
    if (utils::endsWith(lower, suffix(VersionKind::Dev)) || force_prerelease) {
        return VersionKind::Dev;
    }
    return VersionKind::Release;
}

std::string_view suffix(VersionKind kind) {
    switch (kind) {
        case VersionKind::Snapshot: return "snapshot";
        case VersionKind::Dev: return "dev";
        case VersionKind::Release: break;
    }
    return "";
}

std::string_view toString(VersionKind kind) {
    switch (kind) {
        case VersionKind::Snapshot: return "snapshot";
        case VersionKind::Dev: return "dev";
        case VersionKind::Release: break;
    }
    return "release";
}

Version::Version(std::string raw, bool force_prerelease)
    : raw_(std::move(raw)), kind_(parseKind(raw_, force_prerelease)) {
    numeric_ = numericPart(raw_, force_prerelease);
    if (numeric_.empty()) {
        throw VersionFormatError("Invalid version format '" + raw_ +
                                 "'. Supported format is: int.int.int...(-snapshot/dev)");
    }
}

int Version::compare(const Version& other) const {
    std::vector<std::string> ours = utils::splitString(numeric_, '.');
    std::vector<std::string> theirs = utils::splitString(other.numeric_, '.');

    size_t length = std::max(ours.size(), theirs.size());
    for (size_t i = 0; i < length; ++i) {
        std::string_view a = i < ours.size() ? std::string_view(ours[i]) : std::string_view("0");
        std::string_view b = i < theirs.size() ? std::string_view(theirs[i]) : std::string_view("0");

        int result = compareComponents(a, b);
        if (result != 0) {
            return result;
        }
    }

    return 0;
}

} // namespace relcheck
