//
// Created by gregorian-rayne on 2/15/26.
//

#include "kda/exporters/exporter.hpp"
#include "kda/exporters/dot_exporter.hpp"
#include "kda/exporters/json_exporter.hpp"
#include "kda/exporters/report_generator.hpp"
#include "kda/utils/file_utils.hpp"
#include "kda/utils/json_utils.hpp"
#include "kda/utils/string_utils.hpp"

namespace kda::exporters
{
    Result<void, Error> IExporter::export_to_file(const std::filesystem::path& path,
                                                  const analyzers::DependencyAnalysisResult& result,
                                                  const ExportOptions& options) const {
        auto content = export_to_string(result, options);
        if (content.is_err()) {
            return Result<void, Error>::failure(content.error());
        }
        return file_utils::write_file_atomic(path, content.value());
    }

    Result<std::string, Error> TextExporter::export_to_string(const analyzers::DependencyAnalysisResult& result,
                                                              const ExportOptions& options) const {
        return Result<std::string, Error>::success(generate_report(result, options.report_order));
    }

    Result<std::string, Error> DotExporter::export_to_string(const analyzers::DependencyAnalysisResult& result,
                                                             const ExportOptions& options) const {
        DotOptions dot_options;
        dot_options.rankdir = options.rankdir;
        return Result<std::string, Error>::success(render_dot(result.graph, dot_options));
    }

    Result<std::string, Error> JsonExporter::export_to_string(const analyzers::DependencyAnalysisResult& result,
                                                              const ExportOptions& options) const {
        JsonExportOptions json_options;
        json_options.include_metadata = options.include_metadata;
        json_options.indent = options.json_indent;
        return json_utils::dump(to_json(result, json_options), options.json_indent);
    }

    std::unique_ptr<IExporter> ExporterFactory::create(const ExportFormat format) {
        switch (format) {
        case ExportFormat::Dot:
            return std::make_unique<DotExporter>();
        case ExportFormat::Json:
            return std::make_unique<JsonExporter>();
        case ExportFormat::Text:
        default:
            return std::make_unique<TextExporter>();
        }
    }

    Result<std::unique_ptr<IExporter>, Error> ExporterFactory::create_for_file(const std::filesystem::path& path) {
        const std::string ext = string_utils::to_lower(path.extension().string());

        if (ext == ".txt") {
            return Result<std::unique_ptr<IExporter>, Error>::success(create(ExportFormat::Text));
        }
        if (ext == ".dot" || ext == ".gv") {
            return Result<std::unique_ptr<IExporter>, Error>::success(create(ExportFormat::Dot));
        }
        if (ext == ".json") {
            return Result<std::unique_ptr<IExporter>, Error>::success(create(ExportFormat::Json));
        }

        return Result<std::unique_ptr<IExporter>, Error>::failure(
            Error::invalid_argument("Unknown output file extension: " + ext, path.string())
        );
    }

    std::vector<ExportFormat> ExporterFactory::available_formats() {
        return {ExportFormat::Text, ExportFormat::Dot, ExportFormat::Json};
    }

    std::string_view format_to_string(const ExportFormat format) noexcept {
        switch (format) {
        case ExportFormat::Text: return "text";
        case ExportFormat::Dot: return "dot";
        case ExportFormat::Json: return "json";
        }
        return "unknown";
    }

    std::optional<ExportFormat> string_to_format(const std::string_view str) noexcept {
        const std::string lower = string_utils::to_lower(str);
        if (lower == "text" || lower == "txt") return ExportFormat::Text;
        if (lower == "dot" || lower == "graphviz") return ExportFormat::Dot;
        if (lower == "json") return ExportFormat::Json;
        return std::nullopt;
    }

}  // namespace kda::exporters
