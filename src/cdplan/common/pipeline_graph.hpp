/**
 * @file pipeline_graph.hpp
 */
#pragma once
#include "cdplan/common/common.hpp"
#include "cdplan/common/graph_node.hpp"
#include "cdplan/common/pipeline_enums.hpp"
#include "cdplan/common/pipeline_errors.hpp"

namespace cdplan
{

/**
 * @brief An ordered set of leaf nodes with no dependencies among them.
 */
using Tranche = std::vector<NodeIdx>;

/**
 * @brief The layered deployment graph consumed by the pipeline engine.
 *
 * @details
 * `PipelineGraph` is an arena of `GraphNode`s addressed by `NodeIdx`. Node 0
 * is the root. Parent links are indices, so every ancestor walk is a plain
 * loop over the arena and cannot recurse through a cycle.
 *
 * The children of the root are the top-level containers; each of them maps
 * onto one or more pipeline stages. For every top-level container the graph
 * stores its leaves already layered into tranches (the layering itself is
 * done upstream).
 *
 * @par Index requirements
 * Nodes are appended; a node's parent always has a smaller index than the
 * node itself.
 *
 * @par Thread safety
 * - No internal synchronization.
 * - Concurrent reads (const methods) are safe if no concurrent writes occur.
 */
class PipelineGraph
{
public:
    /// Parent index of the root node.
    static constexpr NodeIdx npos = std::numeric_limits<NodeIdx>::max();

    /**
     * @brief Construct a graph containing only the root.
     * @param root_id Id of the root node.
     */
    explicit PipelineGraph(std::string root_id = "Pipeline");

    NodeIdx root() const noexcept { return 0; }

    size_t node_count() const noexcept { return m_nodes.size(); }

    /**
     * @brief Append a node.
     * @param parent Index of the parent node.
     * @param id Node id; must be non-empty, must not contain '/', and must be
     *        unique among the parent's children.
     * @param data Node payload.
     * @return Index of the new node.
     * @throw StructuralError if the parent does not exist, is a leaf with a
     *        schedulable payload, or the id is invalid or taken.
     */
    NodeIdx add_node(NodeIdx parent, std::string id, NodeData data);

    /**
     * @brief Access a node.
     * @throw StructuralError if the index is out of range.
     */
    const GraphNode& node(NodeIdx idx) const;

    /**
     * @brief Find a child by id.
     * @return The child index, or nullopt.
     */
    std::optional<NodeIdx> find_child(NodeIdx parent, const std::string& id) const;

    /**
     * @brief Resolve a '/'-separated path relative to a node.
     * @return The node index, or nullopt if any segment is missing.
     */
    std::optional<NodeIdx> find_path(NodeIdx from, const std::string& path) const;

    /**
     * @brief Nodes from the root down to `idx`, both included.
     */
    std::vector<NodeIdx> root_path(NodeIdx idx) const;

    /**
     * @brief Nodes from just below `up_to` down to `idx`, both ends included.
     *
     * @details
     * If `up_to` is not an ancestor of `idx` the path starts at the root.
     */
    std::vector<NodeIdx> ancestor_path(NodeIdx idx, NodeIdx up_to) const;

    /**
     * @brief The deepest node that is a strict ancestor of every given node.
     *
     * @details
     * For a single node this is its parent.
     *
     * @throw StructuralError if `nodes` is empty, a single node is the root,
     *        or the nodes share no parent below the root's level.
     */
    NodeIdx common_ancestor(const std::vector<NodeIdx>& nodes) const;

    /**
     * @brief Whether `ancestor` is a strict ancestor of `idx`.
     */
    bool is_descendant(NodeIdx idx, NodeIdx ancestor) const;

    /**
     * @brief '/'-joined ids from below the root down to `idx`, for messages.
     *
     * The path is the one find_path() accepts from the root; the root itself
     * renders as its own id.
     */
    std::string path_string(NodeIdx idx) const;

    /**
     * @brief Children of the root in declaration order.
     */
    const std::vector<NodeIdx>& top_level() const noexcept { return m_nodes[0].children; }

    /**
     * @brief Store the layered leaves of a top-level container.
     * @throw StructuralError if `container` is not a child of the root, or a
     *        tranche refers to a node outside the container.
     */
    void set_sorted_leaves(NodeIdx container, std::vector<Tranche> tranches);

    /**
     * @brief The layered leaves of a top-level container.
     * @return The tranches; empty if none were stored.
     */
    const std::vector<Tranche>& sorted_leaves(NodeIdx container) const;

    /**
     * @brief The file set holding the synthesized cloud assembly, if known.
     */
    const FileSetPtr& cloud_assembly_file_set() const noexcept { return m_cloud_assembly; }

    void set_cloud_assembly_file_set(FileSetPtr file_set) { m_cloud_assembly = std::move(file_set); }

private:
    void check_index(NodeIdx idx) const;

    std::vector<GraphNode> m_nodes;

    /// Tranches per top-level container.
    std::unordered_map<NodeIdx, std::vector<Tranche>> m_sorted_leaves;

    FileSetPtr m_cloud_assembly;
};

} // namespace cdplan
