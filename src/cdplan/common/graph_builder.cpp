#include "cdplan/common/graph_builder.hpp"

namespace cdplan
{

GraphBuilder::GraphBuilder(std::string root_id)
    : m_graph{std::make_unique<PipelineGraph>(std::move(root_id))}
    , m_tranches{}
    , m_placed{}
{}

NodeIdx GraphBuilder::resolve(const std::string& path) const
{
    if (!m_graph)
    {
        throw AlreadyBuiltError("GraphBuilder has already been built");
    }
    auto idx = m_graph->find_path(m_graph->root(), path);
    if (!idx)
    {
        throw StructuralError("No node at path '" + path + "'");
    }
    return *idx;
}

NodeIdx GraphBuilder::add_node(const std::string& parent_path, std::string id, NodeData data)
{
    NodeIdx parent = resolve(parent_path);
    return m_graph->add_node(parent, std::move(id), std::move(data));
}

void GraphBuilder::add_tranche(const std::string& container_path, const std::vector<std::string>& leaf_paths)
{
    NodeIdx container = resolve(container_path);
    if (m_graph->node(container).parent != m_graph->root())
    {
        throw StructuralError("Tranches belong to top-level nodes, got '" + container_path + "'");
    }

    Tranche tranche;
    tranche.reserve(leaf_paths.size());
    auto& placed = m_placed[container];
    for (const auto& leaf_path : leaf_paths)
    {
        auto leaf = m_graph->find_path(container, leaf_path);
        if (!leaf || *leaf == container)
        {
            throw StructuralError(
                "No node '" + leaf_path + "' inside '" + container_path + "'");
        }
        if (!placed.insert(*leaf).second)
        {
            throw StructuralError(
                "Node '" + m_graph->path_string(*leaf) + "' appears in more than one tranche");
        }
        tranche.push_back(*leaf);
    }
    m_tranches[container].push_back(std::move(tranche));
}

void GraphBuilder::set_cloud_assembly_file_set(FileSetPtr file_set)
{
    if (!m_graph)
    {
        throw AlreadyBuiltError("GraphBuilder has already been built");
    }
    m_graph->set_cloud_assembly_file_set(std::move(file_set));
}

std::shared_ptr<const PipelineGraph> GraphBuilder::build()
{
    if (!m_graph)
    {
        throw AlreadyBuiltError("GraphBuilder has already been built");
    }

    for (auto& [container, tranches] : m_tranches)
    {
        m_graph->set_sorted_leaves(container, std::move(tranches));
    }
    m_tranches.clear();
    m_placed.clear();

    // Release ownership; the builder cannot be reused.
    return std::shared_ptr<const PipelineGraph>(std::move(m_graph));
}

} // namespace cdplan
