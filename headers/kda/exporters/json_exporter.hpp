//
// Created by gregorian-rayne on 2/15/26.
//

#ifndef KDA_JSON_EXPORTER_HPP
#define KDA_JSON_EXPORTER_HPP

/**
 * @file json_exporter.hpp
 * @brief Versioned JSON documents for analysis results.
 *
 * Every document carries "schema_version" and "kda_version" when
 * metadata is enabled, so consumers can reject layouts they do not know.
 * Object keys are emitted in nlohmann's sorted order; arrays keep
 * component input order.
 */

#include "kda/analyzers/dependency_analyzer.hpp"
#include "kda/analyzers/enhanced_analyzer.hpp"
#include "kda/result.hpp"

#include <nlohmann/json.hpp>

#include <filesystem>

namespace kda::exporters {

    struct JsonExportOptions {
        /// schema_version, kda_version and generated_at
        bool include_metadata = true;

        /// Negative for single-line output
        int indent = 2;
    };

    [[nodiscard]] nlohmann::json to_json(
        const analyzers::DependencyAnalysisResult& result,
        const JsonExportOptions& options = {}
    );

    /**
     * Serializes an enhanced analysis, including its statistics under
     * "statistics".
     */
    [[nodiscard]] nlohmann::json to_json(
        const analyzers::EnhancedDependencyAnalysis& analysis,
        const JsonExportOptions& options = {}
    );

    [[nodiscard]] nlohmann::json to_json(const analyzers::DependencyStatistics& statistics);

    /**
     * Writes to_json(result) to path atomically.
     */
    [[nodiscard]] Result<void> write_json(
        const analyzers::DependencyAnalysisResult& result,
        const std::filesystem::path& path,
        const JsonExportOptions& options = {}
    );

    [[nodiscard]] Result<void> write_json(
        const analyzers::EnhancedDependencyAnalysis& analysis,
        const std::filesystem::path& path,
        const JsonExportOptions& options = {}
    );

}  // namespace kda::exporters

#endif //KDA_JSON_EXPORTER_HPP
