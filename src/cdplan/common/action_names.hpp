/**
 * @file action_names.hpp
 */
#pragma once
#include "cdplan/common/common.hpp"
#include "cdplan/common/pipeline_graph.hpp"

namespace cdplan
{

/**
 * @brief Replace every character outside `[A-Za-z0-9.@_-]` with '_'.
 *
 * A multi-byte UTF-8 character is replaced by a single '_'.
 */
std::string sanitize_name(const std::string& name);

/**
 * @brief Name of the action for a node, relative to a shared parent.
 *
 * @details
 * The ids on the path from just below `shared_parent` down to `node` are
 * sanitized and joined with '.'.
 */
std::string action_name(const PipelineGraph& graph, NodeIdx node, NodeIdx shared_parent);

} // namespace cdplan
