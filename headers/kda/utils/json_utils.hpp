//
// Created by gregorian-rayne on 2/12/26.
//

#ifndef KDA_JSON_UTILS_HPP
#define KDA_JSON_UTILS_HPP

/**
 * @file json_utils.hpp
 * @brief JSON helpers on top of nlohmann/json.
 *
 * Parse failures are converted to ParseError results; nothing here
 * lets a nlohmann exception escape.
 */

#include "kda/result.hpp"
#include "kda/error.hpp"
#include "kda/utils/file_utils.hpp"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <string>
#include <string_view>

namespace kda::json_utils {

    namespace fs = std::filesystem;
    using json = nlohmann::json;

    /**
     * Parses a JSON string.
     *
     * @param content The JSON text.
     * @return The parsed value or a ParseError.
     */
    inline Result<json> parse(std::string_view content) {
        try {
            return Result<json>::success(json::parse(content));
        } catch (const json::parse_error& e) {
            return Result<json>::failure(
                Error::parse_error("JSON parse error", e.what())
            );
        }
    }

    /**
     * Reads and parses a JSON file.
     */
    inline Result<json> read_file(const fs::path& path) {
        auto content = file_utils::read_file(path);
        if (content.is_err()) {
            return Result<json>::failure(content.error());
        }

        auto parsed = parse(content.value());
        if (parsed.is_err()) {
            return Result<json>::failure(parsed.error().with_context(path.string()));
        }
        return parsed;
    }

    /**
     * Serializes a value; indent < 0 gives compact output.
     */
    inline Result<std::string> dump(const json& data, const int indent = 2) {
        try {
            return Result<std::string>::success(indent >= 0 ? data.dump(indent) : data.dump());
        } catch (const json::type_error& e) {
            return Result<std::string>::failure(
                Error::internal_error("JSON serialization error", e.what())
            );
        }
    }

    /**
     * Writes a JSON value to a file atomically.
     */
    inline Result<void> write_file(const fs::path& path, const json& data, const int indent = 2) {
        auto text = dump(data, indent);
        if (text.is_err()) {
            return Result<void>::failure(text.error());
        }
        return file_utils::write_file_atomic(path, text.value() + "\n");
    }

}  // namespace kda::json_utils

#endif //KDA_JSON_UTILS_HPP
