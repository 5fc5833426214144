#pragma once
#include <string>
#include <string_view>
#include <vector>

namespace relcheck::utils {
    std::vector<std::string> splitString(const std::string& str, char delim);
    std::string toLower(std::string str);
    bool endsWith(std::string_view str, std::string_view suffix);
    std::string stripVersionPrefix(const std::string& version);
    std::string lastPathSegment(const std::string& path);

    std::string replaceAll(std::string str, const std::string& from, const std::string& to);
}
