//
// Created by gregorian-rayne on 2/13/26.
//

#include "kda/core/config.hpp"
#include "kda/utils/file_utils.hpp"

#include <toml++/toml.h>

#include <algorithm>
#include <array>
#include <cmath>
#include <cstdint>
#include <sstream>
#include <type_traits>

namespace kda::core
{
    namespace {

        template <typename T>
        Result<void> read_value(const toml::table& root,
                                const std::string_view section,
                                const std::string_view key,
                                T& out) {
            const auto node = root[section][key];
            if (!node) {
                return Result<void>::success();
            }

            if constexpr (std::is_same_v<T, int>) {
                if (const auto value = node.value<std::int64_t>()) {
                    out = static_cast<int>(*value);
                    return Result<void>::success();
                }
            } else {
                if (const auto value = node.value<T>()) {
                    out = *value;
                    return Result<void>::success();
                }
            }

            return Result<void>::failure(
                Error::config_error("Invalid value type", std::string(section) + "." + std::string(key))
            );
        }

        Result<void> read_all(const toml::table& root, Config& config) {
            auto& analysis = config.analysis;
            auto& visual = config.visualization;
            auto& output = config.output;

            for (const auto& result : {
                     read_value(root, "analysis", "enable_cycle_detection", analysis.enable_cycle_detection),
                     read_value(root, "analysis", "enable_topological_sorting", analysis.enable_topological_sorting),
                     read_value(root, "analysis", "enable_missing_dependency_check", analysis.enable_missing_dependency_check),
                     read_value(root, "analysis", "deduplicate_cycles", analysis.deduplicate_cycles),
                     read_value(root, "analysis", "reject_duplicate_names", analysis.reject_duplicate_names),
                     read_value(root, "visualization", "max_strength", visual.max_strength),
                     read_value(root, "visualization", "min_strength_for_visibility", visual.min_strength_for_visibility),
                     read_value(root, "visualization", "cluster_detection", visual.cluster_detection),
                     read_value(root, "visualization", "cycle_detection", visual.cycle_detection),
                     read_value(root, "visualization", "deduplicate_cycles", visual.deduplicate_cycles),
                     read_value(root, "visualization", "strong_dependency_ratio", visual.strong_dependency_ratio),
                     read_value(root, "output", "rankdir", output.rankdir),
                     read_value(root, "output", "json_indent", output.json_indent),
                 }) {
                if (result.is_err()) {
                    return result;
                }
            }
            return Result<void>::success();
        }

        const char* bool_str(const bool value) {
            return value ? "true" : "false";
        }

    }  // namespace

    Result<Config> Config::load_from_file(const std::filesystem::path& path) {
        const auto content = file_utils::read_file(path);
        if (content.is_err()) {
            return Result<Config>::failure(content.error());
        }

        auto config = load_from_string(content.value());
        if (config.is_err()) {
            return Result<Config>::failure(config.error().with_context(path.string()));
        }
        return config;
    }

    Result<Config> Config::load_from_string(const std::string_view content) {
        try {
            const auto tbl = toml::parse(content);
            Config config;

            if (auto read = read_all(tbl, config); read.is_err()) {
                return Result<Config>::failure(read.error());
            }

            if (auto validation = config.validate(); validation.is_err()) {
                return Result<Config>::failure(validation.error());
            }

            return Result<Config>::success(std::move(config));

        } catch (const toml::parse_error& err) {
            std::ostringstream where;
            where << "line " << err.source().begin.line << ", column " << err.source().begin.column;
            return Result<Config>::failure(
                Error::parse_error("Failed to parse TOML configuration: " + std::string(err.description()),
                                   where.str())
            );
        }
    }

    Result<void> Config::validate() const {
        if (!std::isfinite(visualization.max_strength) || visualization.max_strength <= 0.0) {
            return Result<void>::failure(
                Error::config_error("max_strength must be a positive finite number", "visualization.max_strength")
            );
        }
        if (std::isnan(visualization.min_strength_for_visibility) || visualization.min_strength_for_visibility < 0.0) {
            return Result<void>::failure(
                Error::config_error("min_strength_for_visibility must be a non-negative number",
                                    "visualization.min_strength_for_visibility")
            );
        }
        // Written as a negated range check so NaN fails it too
        if (!(visualization.strong_dependency_ratio >= 0.0 && visualization.strong_dependency_ratio <= 1.0)) {
            return Result<void>::failure(
                Error::config_error("strong_dependency_ratio must be within [0, 1]",
                                    "visualization.strong_dependency_ratio")
            );
        }

        constexpr std::array<std::string_view, 4> directions{"LR", "RL", "TB", "BT"};
        if (std::ranges::find(directions, output.rankdir) == directions.end()) {
            return Result<void>::failure(
                Error::config_error("rankdir must be one of LR, RL, TB, BT", "output.rankdir")
            );
        }

        return Result<void>::success();
    }

    std::string Config::to_string() const {
        std::ostringstream ss;

        ss << "[analysis]\n";
        ss << "enable_cycle_detection = " << bool_str(analysis.enable_cycle_detection) << "\n";
        ss << "enable_topological_sorting = " << bool_str(analysis.enable_topological_sorting) << "\n";
        ss << "enable_missing_dependency_check = " << bool_str(analysis.enable_missing_dependency_check) << "\n";
        ss << "deduplicate_cycles = " << bool_str(analysis.deduplicate_cycles) << "\n";
        ss << "reject_duplicate_names = " << bool_str(analysis.reject_duplicate_names) << "\n\n";

        ss << "[visualization]\n";
        ss << "max_strength = " << visualization.max_strength << "\n";
        ss << "min_strength_for_visibility = " << visualization.min_strength_for_visibility << "\n";
        ss << "cluster_detection = " << bool_str(visualization.cluster_detection) << "\n";
        ss << "cycle_detection = " << bool_str(visualization.cycle_detection) << "\n";
        ss << "deduplicate_cycles = " << bool_str(visualization.deduplicate_cycles) << "\n";
        ss << "strong_dependency_ratio = " << visualization.strong_dependency_ratio << "\n\n";

        ss << "[output]\n";
        ss << "rankdir = \"" << output.rankdir << "\"\n";
        ss << "json_indent = " << output.json_indent << "\n";

        return ss.str();
    }

    Result<void> Config::save_to_file(const std::filesystem::path& path) const {
        return file_utils::write_file_atomic(path, to_string());
    }

}  // namespace kda::core
