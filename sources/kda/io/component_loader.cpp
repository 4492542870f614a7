//
// Created by gregorian-rayne on 2/12/26.
//

#include "kda/io/component_loader.hpp"
#include "kda/utils/json_utils.hpp"

#include <set>
#include <string>
#include <utility>

namespace kda::io
{
    using json = nlohmann::json;

    namespace {

        Result<std::string> required_string(const json& entry, const char* key, const std::string& where) {
            if (!entry.contains(key) || !entry[key].is_string()) {
                return Result<std::string>::failure(
                    Error::parse_error(std::string("Missing or non-string \"") + key + "\"", where)
                );
            }
            auto value = entry[key].get<std::string>();
            if (value.empty()) {
                return Result<std::string>::failure(
                    Error::parse_error(std::string("Empty \"") + key + "\"", where)
                );
            }
            return Result<std::string>::success(std::move(value));
        }

        Result<Component> parse_component(const json& entry, const std::size_t index) {
            const std::string where = "components[" + std::to_string(index) + "]";

            if (!entry.is_object()) {
                return Result<Component>::failure(Error::parse_error("Component must be an object", where));
            }

            auto name = required_string(entry, "name", where);
            if (name.is_err()) {
                return Result<Component>::failure(name.error());
            }

            Component component;
            component.name = std::move(name).value();

            if (entry.contains("dependencies")) {
                const auto& deps = entry["dependencies"];
                if (!deps.is_array()) {
                    return Result<Component>::failure(
                        Error::parse_error("\"dependencies\" must be an array", where)
                    );
                }
                for (const auto& dep : deps) {
                    if (!dep.is_string()) {
                        return Result<Component>::failure(
                            Error::parse_error("Dependency names must be strings", where)
                        );
                    }
                    component.dependencies.push_back(dep.get<std::string>());
                }
            }

            if (entry.contains("type")) {
                if (!entry["type"].is_string()) {
                    return Result<Component>::failure(Error::parse_error("\"type\" must be a string", where));
                }
                const auto type_name = entry["type"].get<std::string>();
                const auto type = parse_component_type(type_name);
                if (!type) {
                    return Result<Component>::failure(
                        Error::parse_error("Unknown component type: " + type_name, where)
                    );
                }
                component.type = *type;
            }

            if (entry.contains("description") && entry["description"].is_string()) {
                component.description = entry["description"].get<std::string>();
            }

            return Result<Component>::success(std::move(component));
        }

        Result<ModuleDependency> parse_edge(const json& entry, const std::size_t index) {
            const std::string where = "dependencies[" + std::to_string(index) + "]";

            if (!entry.is_object()) {
                return Result<ModuleDependency>::failure(Error::parse_error("Dependency must be an object", where));
            }

            auto from = required_string(entry, "from", where);
            if (from.is_err()) {
                return Result<ModuleDependency>::failure(from.error());
            }
            auto to = required_string(entry, "to", where);
            if (to.is_err()) {
                return Result<ModuleDependency>::failure(to.error());
            }

            ModuleDependency edge;
            edge.from = std::move(from).value();
            edge.to = std::move(to).value();

            if (entry.contains("type") && entry["type"].is_string()) {
                edge.dependency_type = entry["type"].get<std::string>();
            }
            if (entry.contains("count")) {
                if (!entry["count"].is_number_unsigned()) {
                    return Result<ModuleDependency>::failure(
                        Error::parse_error("\"count\" must be a non-negative integer", where)
                    );
                }
                edge.count = entry["count"].get<std::size_t>();
            }

            return Result<ModuleDependency>::success(std::move(edge));
        }

        Result<std::vector<Component>> parse_component_list(const json& list) {
            std::vector<Component> components;
            components.reserve(list.size());

            std::size_t index = 0;
            for (const auto& entry : list) {
                auto component = parse_component(entry, index++);
                if (component.is_err()) {
                    return Result<std::vector<Component>>::failure(component.error());
                }
                components.push_back(std::move(component).value());
            }
            return Result<std::vector<Component>>::success(std::move(components));
        }

    }  // namespace

    Result<KernelStructure> parse_kernel_structure(const json& document) {
        if (document.is_array()) {
            auto components = parse_component_list(document);
            if (components.is_err()) {
                return Result<KernelStructure>::failure(components.error());
            }
            return Result<KernelStructure>::success(make_kernel_structure(std::move(components).value()));
        }

        if (!document.is_object() || !document.contains("components") || !document["components"].is_array()) {
            return Result<KernelStructure>::failure(
                Error::parse_error("Expected a component array or an object with a \"components\" array")
            );
        }

        auto components = parse_component_list(document["components"]);
        if (components.is_err()) {
            return Result<KernelStructure>::failure(components.error());
        }

        if (!document.contains("dependencies")) {
            return Result<KernelStructure>::success(make_kernel_structure(std::move(components).value()));
        }

        const auto& edges = document["dependencies"];
        if (!edges.is_array()) {
            return Result<KernelStructure>::failure(Error::parse_error("\"dependencies\" must be an array"));
        }

        KernelStructure structure;
        structure.components = std::move(components).value();

        std::size_t index = 0;
        for (const auto& entry : edges) {
            auto edge = parse_edge(entry, index++);
            if (edge.is_err()) {
                return Result<KernelStructure>::failure(edge.error());
            }
            structure.dependencies.push_back(std::move(edge).value());
        }

        return Result<KernelStructure>::success(std::move(structure));
    }

    Result<KernelStructure> parse_kernel_structure_text(const std::string_view text) {
        return json_utils::parse(text).and_then([](const json& document) {
            return parse_kernel_structure(document);
        });
    }

    Result<KernelStructure> load_kernel_structure(const std::filesystem::path& path) {
        auto document = json_utils::read_file(path);
        if (document.is_err()) {
            return Result<KernelStructure>::failure(document.error());
        }

        auto structure = parse_kernel_structure(document.value());
        if (structure.is_err()) {
            return Result<KernelStructure>::failure(structure.error().with_context(path.string()));
        }
        return structure;
    }

    Result<std::vector<Component>> load_components(const std::filesystem::path& path) {
        return load_kernel_structure(path).map([](const KernelStructure& structure) {
            return structure.components;
        });
    }

    std::size_t count_undeclared_edges(const KernelStructure& structure) {
        std::set<std::pair<std::string, std::string>> declared;
        for (const auto& component : structure.components) {
            for (const auto& dep : component.dependencies) {
                declared.emplace(component.name, dep);
            }
        }

        std::size_t undeclared = 0;
        for (const auto& edge : structure.dependencies) {
            if (!declared.contains({edge.from, edge.to})) {
                ++undeclared;
            }
        }
        return undeclared;
    }

}  // namespace kda::io
