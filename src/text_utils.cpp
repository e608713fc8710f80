#include "speccle/text_utils.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <iterator>
#include <sstream>

namespace speccle {

std::string trim(std::string value) {
    auto notSpace = [](unsigned char c) { return !std::isspace(c); };
    value.erase(value.begin(), std::find_if(value.begin(), value.end(), notSpace));
    value.erase(std::find_if(value.rbegin(), value.rend(), notSpace).base(), value.end());
    return value;
}

std::string toLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return value;
}

std::vector<std::string> split(const std::string& input, char delimiter) {
    std::vector<std::string> out;
    std::stringstream ss(input);
    std::string token;
    while (std::getline(ss, token, delimiter)) {
        out.push_back(token);
    }
    return out;
}

std::vector<std::string> splitWhitespace(const std::string& input) {
    std::vector<std::string> out;
    std::istringstream ss(input);
    std::string token;
    while (ss >> token) {
        out.push_back(token);
    }
    return out;
}

bool startsWith(const std::string& value, const std::string& prefix) {
    return value.rfind(prefix, 0) == 0;
}

std::string readFileFirstLine(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        return {};
    }

    std::string line;
    std::getline(file, line);
    return trim(line);
}

std::string readFileContents(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        return {};
    }
    return std::string(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
}

} // namespace speccle
