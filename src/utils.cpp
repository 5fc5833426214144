#include "utils.hpp"
#include <algorithm>
#include <cctype>
#include <sstream>

namespace relcheck::utils {

std::vector<std::string> splitString(const std::string& str, char delim) {
    std::vector<std::string> tokens;
    std::stringstream ss(str);
    std::string token;
    while (std::getline(ss, token, delim)) {
        tokens.push_back(token);
    }
    return tokens;
}

std::string toLower(std::string str) {
    std::transform(str.begin(), str.end(), str.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return str;
}

bool endsWith(std::string_view str, std::string_view suffix) {
    return str.size() >= suffix.size() &&
           str.compare(str.size() - suffix.size(), suffix.size(), suffix) == 0;
}

std::string stripVersionPrefix(const std::string& version) {
    if (!version.empty() && version[0] == 'v') {
        return version.substr(1);
    }
    return version;
}

std::string lastPathSegment(const std::string& path) {
    std::vector<std::string> parts = splitString(path, '/');
    while (!parts.empty() && parts.back().empty()) {
        parts.pop_back();
    }
    return parts.empty() ? "" : parts.back();
}

std::string replaceAll(std::string str, const std::string& from, const std::string& to) {
    if (from.empty()) {
        return str;
    }

    size_t pos = 0;
    while ((pos = str.find(from, pos)) != std::string::npos) {
        str.replace(pos, from.length(), to);
        pos += to.length();
    }
    return str;
}

}
