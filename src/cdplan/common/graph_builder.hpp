/**
 * @file graph_builder.hpp
 * @brief GraphBuilder assembles a PipelineGraph from path-addressed nodes.
 */
#pragma once
#include "cdplan/common/common.hpp"
#include "cdplan/common/pipeline_graph.hpp"

namespace cdplan
{

/**
 * @brief Builder that addresses nodes by '/'-separated path.
 *
 * @details
 * GraphBuilder wraps the index-based PipelineGraph with a path-based API,
 * which is what hand-written graphs and description files use.
 *
 * @par Usage
 * 1. Create a GraphBuilder with the root id.
 * 2. Add containers and leaves via add_node(); the empty path is the root.
 * 3. Add tranches to top-level containers via add_tranche(), in order. Leaf
 *    paths are relative to the container.
 * 4. Optionally name the cloud assembly file set.
 * 5. Call build() to produce the immutable PipelineGraph.
 *
 * @par Thread Safety
 * - No internal synchronization.
 */
class GraphBuilder
{
public:
    explicit GraphBuilder(std::string root_id = "Pipeline");

    /**
     * @brief Add a node under the node at `parent_path`.
     * @return Index of the new node.
     * @throw StructuralError if the parent path does not resolve, or the node
     *        cannot be added there.
     */
    NodeIdx add_node(const std::string& parent_path, std::string id, NodeData data);

    /**
     * @brief Shorthand for add_node() with a GroupData payload.
     */
    NodeIdx add_group(const std::string& parent_path, std::string id)
    {
        return add_node(parent_path, std::move(id), GroupData{});
    }

    /**
     * @brief Resolve a path from the root.
     * @throw StructuralError if the path does not resolve.
     */
    NodeIdx resolve(const std::string& path) const;

    /**
     * @brief Append a tranche to a top-level container.
     * @param container_path Path of the top-level container.
     * @param leaf_paths Leaf paths relative to the container.
     * @throw StructuralError if a path does not resolve or a leaf was already
     *        placed in a tranche of this container.
     */
    void add_tranche(const std::string& container_path, const std::vector<std::string>& leaf_paths);

    void set_cloud_assembly_file_set(FileSetPtr file_set);

    /**
     * @brief Produce the graph.
     * @throw AlreadyBuiltError on a second call.
     */
    std::shared_ptr<const PipelineGraph> build();

    size_t node_count() const noexcept { return m_graph ? m_graph->node_count() : 0; }

private:
    std::unique_ptr<PipelineGraph> m_graph;
    std::map<NodeIdx, std::vector<Tranche>> m_tranches;
    std::map<NodeIdx, std::unordered_set<NodeIdx>> m_placed;
};

} // namespace cdplan
