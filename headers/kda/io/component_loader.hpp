//
// Created by gregorian-rayne on 2/12/26.
//

#ifndef KDA_COMPONENT_LOADER_HPP
#define KDA_COMPONENT_LOADER_HPP

/**
 * @file component_loader.hpp
 * @brief Reads extractor output (JSON) into components.
 *
 * Two layouts are accepted:
 *
 * A plain component list
 * @code
 *     [
 *       {"name": "sched", "dependencies": ["mm", "irq"], "type": "process_management"},
 *       {"name": "mm", "dependencies": []}
 *     ]
 * @endcode
 *
 * or a kernel structure with explicit, typed edges
 * @code
 *     {
 *       "components": [{"name": "sched"}, {"name": "mm"}],
 *       "dependencies": [{"from": "sched", "to": "mm", "type": "function_call", "count": 3}]
 *     }
 * @endcode
 *
 * When "dependencies" is absent from the object form, the edges are
 * derived from each component's own dependency list.
 */

#include "kda/result.hpp"
#include "kda/types.hpp"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <filesystem>
#include <string_view>
#include <vector>

namespace kda::io {

    /**
     * Converts parsed JSON into a kernel structure.
     *
     * @return The structure, or a ParseError naming the offending entry.
     */
    [[nodiscard]] Result<KernelStructure> parse_kernel_structure(const nlohmann::json& document);

    /**
     * Parses JSON text into a kernel structure.
     */
    [[nodiscard]] Result<KernelStructure> parse_kernel_structure_text(std::string_view text);

    /**
     * Reads a kernel structure from a JSON file.
     */
    [[nodiscard]] Result<KernelStructure> load_kernel_structure(const std::filesystem::path& path);

    /**
     * Reads only the component list from a JSON file.
     */
    [[nodiscard]] Result<std::vector<Component>> load_components(const std::filesystem::path& path);

    /**
     * Counts explicit edges whose (from, to) pair appears in no component's
     * dependency list. Structural analysis sees only the component lists,
     * so these edges are invisible to it.
     */
    [[nodiscard]] std::size_t count_undeclared_edges(const KernelStructure& structure);

}  // namespace kda::io

#endif //KDA_COMPONENT_LOADER_HPP
