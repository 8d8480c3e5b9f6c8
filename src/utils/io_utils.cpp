#include "utils/io_utils.h"
#include "fmt/format.h"

#include <filesystem>
#include <fstream>
#include <stdexcept>

namespace fs = std::filesystem;

namespace utils {
    void readLines(const std::string& filePath, std::vector<std::string>& lines) {
        std::ifstream inputFile(filePath);

        if (!inputFile.is_open()) {
            throw std::runtime_error(fmt::format("Can't open file {}", filePath));
        }

        readLines(inputFile, lines);
    }

    void readLines(std::istream& is, std::vector<std::string>& lines) {
        while (is) {
            std::string line;
            std::getline(is, line);

            if (line.size() > 0 && line.back() == '\r') {
                line.pop_back();
            }

            if (line.size() > 0) {
                lines.push_back(line);
            }
        }
    }

    void writeFile(const std::string& filePath, const std::string& content) {
        std::ofstream outputFile(filePath, std::ios::binary | std::ios::trunc);

        if (!outputFile.is_open()) {
            throw std::runtime_error(fmt::format("Can't open file {}", filePath));
        }

        outputFile.write(content.c_str(), static_cast<std::streamsize>(content.size()));
        outputFile.flush();
        if (!outputFile) {
            throw std::runtime_error(fmt::format("Can't write file {}", filePath));
        }
    }

    void makeExecutable(const std::string& filePath) {
        std::error_code errorCode;
        fs::permissions(
            filePath,
            fs::perms::owner_exec | fs::perms::group_exec | fs::perms::others_exec,
            fs::perm_options::add,
            errorCode
        );

        if (errorCode) {
            throw std::runtime_error(fmt::format("Can't make {} executable: {}", filePath, errorCode.message()));
        }
    }
}
