//
// Created by gregorian-rayne on 2/9/26.
//

#ifndef KDA_KDA_HPP
#define KDA_KDA_HPP

/**
 * @file kda.hpp
 * @brief Main header for the Kernel Dependency Analyzer library.
 *
 * Include this header for general usage, or include specific
 * headers for more targeted dependencies.
 */

#include "version.hpp"
#include "error.hpp"
#include "result.hpp"
#include "types.hpp"
#include "graph/dependency_graph.hpp"
#include "graph/graph_builder.hpp"
#include "graph/graph_algorithms.hpp"
#include "analyzers/dependency_analyzer.hpp"
#include "analyzers/enhanced_analyzer.hpp"

#endif //KDA_KDA_HPP
