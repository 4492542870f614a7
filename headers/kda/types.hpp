//
// Created by gregorian-rayne on 2/9/26.
//

#ifndef KDA_TYPES_HPP
#define KDA_TYPES_HPP

/**
 * @file types.hpp
 * @brief Input data handed to the analyzer by the kernel extractor.
 *
 * - Component: a named unit of kernel source with declared dependencies
 * - ModuleDependency: an explicit, typed edge between two modules
 * - KernelStructure: components plus explicit edges (enhanced analysis input)
 */

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace kda {

    /**
     * Kernel subsystem a component was extracted from.
     */
    enum class ComponentType {
        Driver,
        FileSystem,
        Network,
        MemoryManagement,
        ProcessManagement,
        Security,
        Virtualization,
        DeviceTree,
        Module,
        Other
    };

    [[nodiscard]] const char* to_string(ComponentType type) noexcept;

    /**
     * Parses a component type name ("driver", "file_system", ...).
     * Matching is case-insensitive; unknown names yield std::nullopt.
     */
    [[nodiscard]] std::optional<ComponentType> parse_component_type(std::string_view name) noexcept;

    /**
     * A named unit of kernel source code.
     *
     * Dependency names are kept verbatim and may reference components
     * that are not part of the analysed set.
     */
    struct Component {
        std::string name;
        std::vector<std::string> dependencies;
        ComponentType type = ComponentType::Other;
        std::optional<std::string> description;
    };

    /**
     * Directed dependency between two modules.
     */
    struct ModuleDependency {
        std::string from;
        std::string to;
        std::string dependency_type = "depends_on";
        std::size_t count = 1;

        bool operator==(const ModuleDependency& other) const = default;
    };

    /**
     * Components together with explicit dependency edges.
     *
     * The same (from, to) pair may appear several times; every
     * occurrence adds one unit of dependency strength.
     */
    struct KernelStructure {
        std::vector<Component> components;
        std::vector<ModuleDependency> dependencies;
    };

    /**
     * Derives a KernelStructure whose edges are the components' declared
     * dependency lists, in component and list order.
     */
    [[nodiscard]] KernelStructure make_kernel_structure(std::vector<Component> components);

}  // namespace kda

#endif //KDA_TYPES_HPP
