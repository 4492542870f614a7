//
// Created by gregorian-rayne on 2/9/26.
//

#include "kda/types.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <utility>

namespace kda {

    namespace {

        struct TypeName {
            ComponentType type;
            std::string_view name;
        };

        constexpr std::array<TypeName, 10> TYPE_NAMES = {{
            {ComponentType::Driver, "driver"},
            {ComponentType::FileSystem, "file_system"},
            {ComponentType::Network, "network"},
            {ComponentType::MemoryManagement, "memory_management"},
            {ComponentType::ProcessManagement, "process_management"},
            {ComponentType::Security, "security"},
            {ComponentType::Virtualization, "virtualization"},
            {ComponentType::DeviceTree, "device_tree"},
            {ComponentType::Module, "module"},
            {ComponentType::Other, "other"},
        }};

        bool iequals(const std::string_view a, const std::string_view b) noexcept {
            return a.size() == b.size() &&
                   std::equal(a.begin(), a.end(), b.begin(), [](const unsigned char x, const unsigned char y) {
                       return std::tolower(x) == std::tolower(y);
                   });
        }

    }  // namespace

    const char* to_string(const ComponentType type) noexcept {
        for (const auto& [t, name] : TYPE_NAMES) {
            if (t == type) {
                return name.data();
            }
        }
        return "other";
    }

    std::optional<ComponentType> parse_component_type(const std::string_view name) noexcept {
        for (const auto& [t, n] : TYPE_NAMES) {
            if (iequals(n, name)) {
                return t;
            }
        }
        // "filesystem" is what the extractor emits for FileSystem
        if (iequals(name, "filesystem")) {
            return ComponentType::FileSystem;
        }
        return std::nullopt;
    }

    KernelStructure make_kernel_structure(std::vector<Component> components) {
        KernelStructure structure;
        for (const auto& component : components) {
            for (const auto& dep : component.dependencies) {
                structure.dependencies.push_back({component.name, dep, "depends_on", 1});
            }
        }
        structure.components = std::move(components);
        return structure;
    }

}  // namespace kda
