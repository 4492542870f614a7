//
// Created by gregorian-rayne on 2/9/26.
//

#ifndef KDA_VERSION_HPP
#define KDA_VERSION_HPP

/**
 * @file version.hpp
 * @brief Kernel Dependency Analyzer version information.
 */

namespace kda {

    /**
     * Major version number.
     * Incremented for breaking API changes.
     */
    constexpr int VERSION_MAJOR = 0;

    /**
     * Minor version number.
     * Incremented for new features with backward compatibility.
     */
    constexpr int VERSION_MINOR = 3;

    /**
     * Patch version number.
     */
    constexpr int VERSION_PATCH = 0;

    /**
     * Full version string in "major.minor.patch" format.
     */
    constexpr auto VERSION_STRING = "0.3.0";

    /**
     * Version of the JSON document layout written by the exporters.
     */
    constexpr auto JSON_SCHEMA_VERSION = "1.0.0";

    constexpr auto PROJECT_NAME = "Kernel Dependency Analyzer";

    /**
     * Short project name for CLI usage.
     */
    constexpr auto PROJECT_SHORT_NAME = "kda";

}  // namespace kda

#endif //KDA_VERSION_HPP
