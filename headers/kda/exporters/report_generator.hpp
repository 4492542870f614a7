//
// Created by gregorian-rayne on 2/14/26.
//

#ifndef KDA_REPORT_GENERATOR_HPP
#define KDA_REPORT_GENERATOR_HPP

/**
 * @file report_generator.hpp
 * @brief Plain-text dependency report.
 *
 * Layout:
 * @code
 *     Dependency Analysis Report
 *     ================================
 *
 *     Total Components: 3
 *
 *     Components with no dependencies:
 *       - mm
 *
 *     Missing dependencies:
 *       None
 *
 *     Dependency counts:
 *       sched: 0 dependents
 *       mm: 2 dependents
 *
 *     Topological order:
 *       1. sched
 *       2. mm
 *
 *     Cycles detected:
 *       None
 * @endcode
 *
 * With ReportOrder::Build the order section is headed "Build order:" and
 * lists dependencies first.
 */

#include "kda/analyzers/dependency_analyzer.hpp"
#include "kda/result.hpp"

#include <filesystem>
#include <string>

namespace kda::exporters {

    /// Which of the two orders the report lists
    enum class ReportOrder {
        Topological,    // dependents first
        Build           // dependencies first
    };

    /**
     * Renders the report. Components are listed in input order.
     */
    [[nodiscard]] std::string generate_report(
        const analyzers::DependencyAnalysisResult& result,
        ReportOrder order = ReportOrder::Topological
    );

    /**
     * Writes generate_report(result, order) to path atomically.
     *
     * @return IoError when the file cannot be written; any previous file
     *         at path is left untouched.
     */
    [[nodiscard]] Result<void> write_report(
        const analyzers::DependencyAnalysisResult& result,
        const std::filesystem::path& path,
        ReportOrder order = ReportOrder::Topological
    );

}  // namespace kda::exporters

#endif //KDA_REPORT_GENERATOR_HPP
