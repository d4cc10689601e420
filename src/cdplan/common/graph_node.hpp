/**
 * @file graph_node.hpp
 * @brief Nodes of the layered deployment graph and their payloads.
 */
#pragma once
#include "cdplan/common/common.hpp"
#include "cdplan/common/blueprint.hpp"
#include "cdplan/common/pipeline_enums.hpp"

namespace cdplan
{

// ============================================================================
// Node payloads
// ============================================================================

/// A plain grouping of nodes.
struct GroupData
{
};

/// The nodes that deploy one stack (its assets, change set and so on).
struct StackGroupData
{
    StackDeploymentPtr stack;
};

/// The pipeline updates itself.
struct SelfUpdateData
{
};

/// Publish a group of assets of one asset type.
struct PublishAssetsData
{
    std::vector<StackAsset> assets;
};

/// Create a change set for a stack.
struct PrepareData
{
    StackDeploymentPtr stack;
};

/// Execute a previously created change set.
struct ExecuteData
{
    StackDeploymentPtr stack;
    bool capture_outputs{false};
};

/// Run a user-defined step.
struct StepData
{
    StepPtr step;

    /// True for the step that synthesizes the cloud assembly.
    bool is_build_step{false};
};

/**
 * @brief Payload of a graph node.
 *
 * @details
 * `std::monostate` stands for a node without payload. Only leaf nodes with a
 * schedulable payload (self-update, publish-assets, prepare, execute, step)
 * may appear in tranches; the others are a structural defect at scheduling
 * time.
 */
using NodeData = std::variant<
    std::monostate,
    GroupData,
    StackGroupData,
    SelfUpdateData,
    PublishAssetsData,
    PrepareData,
    ExecuteData,
    StepData>;

/**
 * @brief Short name of a payload kind, for messages and configuration.
 */
const char* node_kind_name(const NodeData& data) noexcept;

/**
 * @brief Whether a payload marks its node as a container.
 */
inline bool is_container_data(const NodeData& data) noexcept
{
    return std::holds_alternative<GroupData>(data) || std::holds_alternative<StackGroupData>(data);
}

// ============================================================================
// GraphNode
// ============================================================================

/**
 * @brief A node in the PipelineGraph arena.
 *
 * @details
 * The parent is stored as an index into the arena; the root's parent is
 * `PipelineGraph::npos`. Children are listed in declaration order.
 */
struct GraphNode
{
    std::string id;
    NodeIdx parent;
    std::vector<NodeIdx> children;
    NodeData data;

    bool is_container() const noexcept
    {
        return !children.empty() || is_container_data(data);
    }
};

} // namespace cdplan
