//
// Created by gregorian-rayne on 2/15/26.
//

#ifndef KDA_EXPORTER_HPP
#define KDA_EXPORTER_HPP

/**
 * @file exporter.hpp
 * @brief Common interface over the report, DOT and JSON writers.
 *
 * The CLI picks an exporter by name or by output file extension:
 * - text  (.txt)         report_generator.hpp
 * - dot   (.dot, .gv)    dot_exporter.hpp
 * - json  (.json)        json_exporter.hpp
 *
 * Writes to a file are atomic.
 */

#include "kda/analyzers/dependency_analyzer.hpp"
#include "kda/error.hpp"
#include "kda/exporters/report_generator.hpp"
#include "kda/result.hpp"

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace kda::exporters
{
    enum class ExportFormat {
        Text,
        Dot,
        Json
    };

    struct ExportOptions {
        std::string rankdir = "LR";
        int json_indent = 2;
        bool include_metadata = true;
        ReportOrder report_order = ReportOrder::Topological;    // text reports only
    };

    /**
     * Interface for all exporters.
     */
    class IExporter {
    public:
        virtual ~IExporter() = default;

        [[nodiscard]] virtual ExportFormat format() const noexcept = 0;

        /**
         * Returns the file extension for this format, with the dot.
         */
        [[nodiscard]] virtual std::string_view file_extension() const noexcept = 0;

        [[nodiscard]] virtual std::string_view format_name() const noexcept = 0;

        /**
         * Renders the analysis.
         */
        [[nodiscard]] virtual Result<std::string, Error> export_to_string(
            const analyzers::DependencyAnalysisResult& result,
            const ExportOptions& options
        ) const = 0;

        /**
         * Renders the analysis and writes it to path atomically.
         */
        [[nodiscard]] Result<void, Error> export_to_file(
            const std::filesystem::path& path,
            const analyzers::DependencyAnalysisResult& result,
            const ExportOptions& options
        ) const;
    };

    /**
     * Factory for creating exporters.
     */
    class ExporterFactory {
    public:
        [[nodiscard]] static std::unique_ptr<IExporter> create(ExportFormat format);

        /**
         * Chooses the exporter from the file extension.
         *
         * @return The exporter, or InvalidArgument for an unknown extension.
         */
        [[nodiscard]] static Result<std::unique_ptr<IExporter>, Error> create_for_file(
            const std::filesystem::path& path
        );

        [[nodiscard]] static std::vector<ExportFormat> available_formats();
    };

    [[nodiscard]] std::string_view format_to_string(ExportFormat format) noexcept;

    /**
     * Parses "text", "dot" or "json", case-insensitively.
     */
    [[nodiscard]] std::optional<ExportFormat> string_to_format(std::string_view str) noexcept;

    class TextExporter : public IExporter {
    public:
        [[nodiscard]] ExportFormat format() const noexcept override { return ExportFormat::Text; }
        [[nodiscard]] std::string_view file_extension() const noexcept override { return ".txt"; }
        [[nodiscard]] std::string_view format_name() const noexcept override { return "Text"; }

        [[nodiscard]] Result<std::string, Error> export_to_string(
            const analyzers::DependencyAnalysisResult& result,
            const ExportOptions& options
        ) const override;
    };

    class DotExporter : public IExporter {
    public:
        [[nodiscard]] ExportFormat format() const noexcept override { return ExportFormat::Dot; }
        [[nodiscard]] std::string_view file_extension() const noexcept override { return ".dot"; }
        [[nodiscard]] std::string_view format_name() const noexcept override { return "Graphviz DOT"; }

        [[nodiscard]] Result<std::string, Error> export_to_string(
            const analyzers::DependencyAnalysisResult& result,
            const ExportOptions& options
        ) const override;
    };

    class JsonExporter : public IExporter {
    public:
        [[nodiscard]] ExportFormat format() const noexcept override { return ExportFormat::Json; }
        [[nodiscard]] std::string_view file_extension() const noexcept override { return ".json"; }
        [[nodiscard]] std::string_view format_name() const noexcept override { return "JSON"; }

        [[nodiscard]] Result<std::string, Error> export_to_string(
            const analyzers::DependencyAnalysisResult& result,
            const ExportOptions& options
        ) const override;
    };

}  // namespace kda::exporters

#endif //KDA_EXPORTER_HPP
