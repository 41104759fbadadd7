//
// Created by gregorian-rayne on 10/12/26.
//

#ifndef PPA_FILE_UTILS_HPP
#define PPA_FILE_UTILS_HPP

/**
 * @file file_utils.hpp
 * @brief Reading Python sources and writing reports.
 *
 * A missing path is reported as NotFound, anything else that stops the
 * read or write as IoError, so callers can tell a bad path from bad code.
 */

#include "ppa/error.hpp"
#include "ppa/result.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <string_view>

namespace ppa::file_utils {

    namespace fs = std::filesystem;

    inline Result<std::string, Error> read_file(const fs::path& path) {
        std::error_code ec;
        if (!fs::exists(path, ec)) {
            return Result<std::string, Error>::failure(
                Error::not_found("File not found", path.string())
            );
        }
        if (fs::is_directory(path, ec)) {
            return Result<std::string, Error>::failure(
                Error::io_error("Path is a directory", path.string())
            );
        }

        std::ifstream file(path, std::ios::binary);
        if (!file) {
            return Result<std::string, Error>::failure(
                Error::io_error("Failed to open file", path.string())
            );
        }

        std::ostringstream oss;
        oss << file.rdbuf();

        if (file.bad()) {
            return Result<std::string, Error>::failure(
                Error::io_error("Failed to read file", path.string())
            );
        }

        return Result<std::string, Error>::success(oss.str());
    }

    inline Result<void, Error> write_file(const fs::path& path, const std::string_view content) {
        if (const auto parent = path.parent_path(); !parent.empty()) {
            std::error_code ec;
            fs::create_directories(parent, ec);
            if (ec) {
                return Result<void, Error>::failure(
                    Error::io_error("Failed to create directory", parent.string())
                );
            }
        }

        std::ofstream file(path, std::ios::binary);
        if (!file) {
            return Result<void, Error>::failure(
                Error::io_error("Failed to open file for writing", path.string())
            );
        }

        file.write(content.data(), static_cast<std::streamsize>(content.size()));
        if (!file) {
            return Result<void, Error>::failure(
                Error::io_error("Failed to write file", path.string())
            );
        }

        return Result<void, Error>::success();
    }

}  // namespace ppa::file_utils

#endif //PPA_FILE_UTILS_HPP
