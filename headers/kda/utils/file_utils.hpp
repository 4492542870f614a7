//
// Created by gregorian-rayne on 2/12/26.
//

#ifndef KDA_FILE_UTILS_HPP
#define KDA_FILE_UTILS_HPP

/**
 * @file file_utils.hpp
 * @brief File system utilities.
 *
 * Reading and writing of whole files. All operations use
 * Result<T, Error> for error handling.
 */

#include "kda/result.hpp"
#include "kda/error.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <string_view>

namespace kda::file_utils {

    namespace fs = std::filesystem;

    /**
     * Reads an entire file into a string.
     *
     * @param path Path to the file.
     * @return The file contents or an error.
     */
    inline Result<std::string> read_file(const fs::path& path) {
        if (std::error_code ec; !fs::exists(path, ec)) {
            return Result<std::string>::failure(
                Error::not_found("File not found", path.string())
            );
        }

        std::ifstream file(path, std::ios::binary);
        if (!file) {
            return Result<std::string>::failure(
                Error::io_error("Failed to open file", path.string())
            );
        }

        std::ostringstream oss;
        oss << file.rdbuf();

        if (file.bad()) {
            return Result<std::string>::failure(
                Error::io_error("Failed to read file", path.string())
            );
        }

        return Result<std::string>::success(oss.str());
    }

    /**
     * Returns the sibling path used while writing path atomically.
     */
    inline fs::path temporary_path_for(const fs::path& path) {
        fs::path temp = path;
        temp += ".tmp";
        return temp;
    }

    /**
     * Writes content so that readers see either the old file or the
     * complete new one.
     *
     * The content goes to a sibling "<path>.tmp" file that is renamed over
     * path once it is fully written and closed. On any failure the
     * temporary file is removed and path is left untouched.
     *
     * @param path Destination file.
     * @param content Bytes to write.
     * @return Success or an IoError naming the failing path.
     */
    inline Result<void> write_file_atomic(const fs::path& path, const std::string_view content) {
        const auto parent = path.parent_path();
        if (std::error_code ec; !parent.empty() && !fs::exists(parent, ec)) {
            fs::create_directories(parent, ec);
            if (ec) {
                return Result<void>::failure(
                    Error::io_error("Failed to create directory", parent.string())
                );
            }
        }

        const auto temp = temporary_path_for(path);
        auto discard = [&temp] {
            std::error_code ignored;
            fs::remove(temp, ignored);
        };

        {
            std::ofstream file(temp, std::ios::binary | std::ios::trunc);
            if (!file) {
                return Result<void>::failure(
                    Error::io_error("Failed to open file for writing", temp.string())
                );
            }

            file.write(content.data(), static_cast<std::streamsize>(content.size()));
            file.flush();

            if (!file) {
                file.close();
                discard();
                return Result<void>::failure(
                    Error::io_error("Failed to write file", temp.string())
                );
            }
        }

        std::error_code ec;
        fs::rename(temp, path, ec);
        if (ec) {
            discard();
            return Result<void>::failure(
                Error::io_error("Failed to move file into place: " + ec.message(), path.string())
            );
        }

        return Result<void>::success();
    }

}  // namespace kda::file_utils

#endif //KDA_FILE_UTILS_HPP
