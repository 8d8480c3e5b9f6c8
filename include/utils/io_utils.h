#pragma once

#include <string>
#include <vector>
#include <iostream>

namespace utils {
    // Non-empty lines of a file, trailing '\r' removed. Throws if the file can't be opened.
    void readLines(const std::string& filePath, std::vector<std::string>& lines);
    void readLines(std::istream& is, std::vector<std::string>& lines);

    void writeFile(const std::string& filePath, const std::string& content);
    void makeExecutable(const std::string& filePath);
}
