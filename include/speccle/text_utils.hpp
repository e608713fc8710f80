#pragma once

#include <string>
#include <vector>

namespace speccle {

std::string trim(std::string value);
std::string toLower(std::string value);
std::vector<std::string> split(const std::string& input, char delimiter);

// Splits on runs of whitespace, dropping empty tokens.
std::vector<std::string> splitWhitespace(const std::string& input);

bool startsWith(const std::string& value, const std::string& prefix);

// Empty string when the file is missing or unreadable.
std::string readFileFirstLine(const std::string& path);
std::string readFileContents(const std::string& path);

} // namespace speccle
