//
// Created by gregorian-rayne on 2/13/26.
//

#ifndef KDA_CONFIG_HPP
#define KDA_CONFIG_HPP

/**
 * @file config.hpp
 * @brief Analyzer configuration loaded from TOML.
 *
 * Example:
 * @code
 *     [analysis]
 *     enable_cycle_detection = true
 *     deduplicate_cycles = true
 *     reject_duplicate_names = false
 *
 *     [visualization]
 *     max_strength = 10.0
 *     min_strength_for_visibility = 0.5
 *
 *     [output]
 *     rankdir = "LR"
 * @endcode
 *
 * Keys that are absent keep their defaults. A key with a value of the
 * wrong type is a ConfigError.
 */

#include "kda/analyzers/dependency_analyzer.hpp"
#include "kda/analyzers/enhanced_analyzer.hpp"
#include "kda/result.hpp"

#include <filesystem>
#include <string>
#include <string_view>

namespace kda::core {

    /**
     * Options for rendered output.
     */
    struct OutputConfig {
        /// Graphviz rank direction: LR, RL, TB or BT
        std::string rankdir = "LR";

        /// JSON indentation; negative for compact output
        int json_indent = 2;
    };

    /**
     * Complete configuration. Owned by the caller and passed by reference.
     */
    struct Config {
        analyzers::AnalyzerOptions analysis;
        analyzers::EnhancedOptions visualization;
        OutputConfig output;

        /**
         * Loads and validates a configuration file.
         */
        [[nodiscard]] static Result<Config> load_from_file(const std::filesystem::path& path);

        /**
         * Parses and validates TOML text.
         */
        [[nodiscard]] static Result<Config> load_from_string(std::string_view content);

        [[nodiscard]] static Config default_config() {
            return Config{};
        }

        /**
         * Checks value ranges; the first violation is reported.
         */
        [[nodiscard]] Result<void> validate() const;

        /**
         * Serializes the configuration back to TOML.
         */
        [[nodiscard]] std::string to_string() const;

        /**
         * Writes to_string() to path atomically.
         */
        [[nodiscard]] Result<void> save_to_file(const std::filesystem::path& path) const;
    };

}  // namespace kda::core

#endif //KDA_CONFIG_HPP
