/**
 * @file pipeline_graph.cpp
 */
#include "cdplan/common/pipeline_graph.hpp"

#include <algorithm>
#include <sstream>

namespace cdplan
{

// ============================================================================
// Payload names
// ============================================================================

namespace
{

struct KindNameVisitor
{
    const char* operator()(const std::monostate&) const noexcept { return "none"; }
    const char* operator()(const GroupData&) const noexcept { return "group"; }
    const char* operator()(const StackGroupData&) const noexcept { return "stack-group"; }
    const char* operator()(const SelfUpdateData&) const noexcept { return "self-update"; }
    const char* operator()(const PublishAssetsData&) const noexcept { return "publish-assets"; }
    const char* operator()(const PrepareData&) const noexcept { return "prepare"; }
    const char* operator()(const ExecuteData&) const noexcept { return "execute"; }
    const char* operator()(const StepData&) const noexcept { return "step"; }
};

const std::vector<Tranche> no_tranches{};

} // namespace

const char* node_kind_name(const NodeData& data) noexcept
{
    return std::visit(KindNameVisitor{}, data);
}

// ============================================================================
// Constructor
// ============================================================================

PipelineGraph::PipelineGraph(std::string root_id)
{
    m_nodes.push_back(GraphNode{std::move(root_id), npos, {}, GroupData{}});
}

// ============================================================================
// Node management
// ============================================================================

void PipelineGraph::check_index(NodeIdx idx) const
{
    if (idx >= m_nodes.size())
    {
        throw StructuralError(
            "Node index " + std::to_string(idx) + " does not exist");
    }
}

NodeIdx PipelineGraph::add_node(NodeIdx parent, std::string id, NodeData data)
{
    check_index(parent);

    if (id.empty())
    {
        throw StructuralError("Node id under '" + path_string(parent) + "' must not be empty");
    }
    if (id.find('/') != std::string::npos)
    {
        throw StructuralError("Node id '" + id + "' must not contain '/'");
    }

    const GraphNode& parent_node = m_nodes[parent];
    if (parent_node.children.empty()
        && !is_container_data(parent_node.data)
        && !std::holds_alternative<std::monostate>(parent_node.data))
    {
        throw StructuralError(
            "Cannot add '" + id + "' under '" + path_string(parent) +
            "': it is a " + node_kind_name(parent_node.data) + " leaf");
    }
    if (find_child(parent, id))
    {
        throw StructuralError(
            "Duplicate node id '" + id + "' under '" + path_string(parent) + "'");
    }

    NodeIdx idx = m_nodes.size();
    m_nodes.push_back(GraphNode{std::move(id), parent, {}, std::move(data)});
    m_nodes[parent].children.push_back(idx);
    return idx;
}

const GraphNode& PipelineGraph::node(NodeIdx idx) const
{
    check_index(idx);
    return m_nodes[idx];
}

std::optional<NodeIdx> PipelineGraph::find_child(NodeIdx parent, const std::string& id) const
{
    check_index(parent);
    for (NodeIdx child : m_nodes[parent].children)
    {
        if (m_nodes[child].id == id)
        {
            return child;
        }
    }
    return std::nullopt;
}

std::optional<NodeIdx> PipelineGraph::find_path(NodeIdx from, const std::string& path) const
{
    NodeIdx current = from;
    std::stringstream ss(path);
    std::string segment;
    while (std::getline(ss, segment, '/'))
    {
        if (segment.empty())
        {
            continue;
        }
        auto child = find_child(current, segment);
        if (!child)
        {
            return std::nullopt;
        }
        current = *child;
    }
    return current;
}

// ============================================================================
// Ancestry
// ============================================================================

std::vector<NodeIdx> PipelineGraph::root_path(NodeIdx idx) const
{
    check_index(idx);
    std::vector<NodeIdx> path;
    for (NodeIdx x = idx; x != npos; x = m_nodes[x].parent)
    {
        path.push_back(x);
    }
    std::reverse(path.begin(), path.end());
    return path;
}

std::vector<NodeIdx> PipelineGraph::ancestor_path(NodeIdx idx, NodeIdx up_to) const
{
    check_index(idx);
    std::vector<NodeIdx> path{idx};
    NodeIdx x = idx;
    while (m_nodes[x].parent != npos && m_nodes[x].parent != up_to)
    {
        x = m_nodes[x].parent;
        path.push_back(x);
    }
    std::reverse(path.begin(), path.end());
    return path;
}

NodeIdx PipelineGraph::common_ancestor(const std::vector<NodeIdx>& nodes) const
{
    if (nodes.empty())
    {
        throw StructuralError("Cannot find common ancestor between an empty set of nodes");
    }

    std::vector<std::vector<NodeIdx>> paths;
    paths.reserve(nodes.size());
    for (NodeIdx idx : nodes)
    {
        paths.push_back(root_path(idx));
    }

    if (paths.size() == 1)
    {
        const auto& path = paths[0];
        if (path.size() < 2)
        {
            throw StructuralError(
                "Cannot find ancestor of node without ancestor: '" + m_nodes[path[0]].id + "'");
        }
        return path[path.size() - 2];
    }

    // Advance while every path continues with the same node.
    size_t depth = 0;
    auto all_share_next = [&]() {
        for (const auto& path : paths)
        {
            if (path.size() < depth + 2 || paths[0].size() < depth + 2 || path[depth + 1] != paths[0][depth + 1])
            {
                return false;
            }
        }
        return true;
    };
    while (all_share_next())
    {
        ++depth;
    }

    for (const auto& path : paths)
    {
        if (path.size() < depth + 2)
        {
            std::ostringstream oss;
            oss << "Could not determine a shared parent between nodes:";
            for (NodeIdx idx : nodes)
            {
                oss << " '" << path_string(idx) << "'";
            }
            throw StructuralError(oss.str());
        }
    }
    return paths[0][depth];
}

bool PipelineGraph::is_descendant(NodeIdx idx, NodeIdx ancestor) const
{
    check_index(idx);
    for (NodeIdx x = m_nodes[idx].parent; x != npos; x = m_nodes[x].parent)
    {
        if (x == ancestor)
        {
            return true;
        }
    }
    return false;
}

std::string PipelineGraph::path_string(NodeIdx idx) const
{
    if (idx >= m_nodes.size())
    {
        return "<node " + std::to_string(idx) + ">";
    }
    if (idx == root())
    {
        return m_nodes[idx].id;
    }
    auto path = ancestor_path(idx, root());
    std::string result;
    for (NodeIdx x : path)
    {
        if (!result.empty())
        {
            result += '/';
        }
        result += m_nodes[x].id;
    }
    return result;
}

// ============================================================================
// Tranches
// ============================================================================

void PipelineGraph::set_sorted_leaves(NodeIdx container, std::vector<Tranche> tranches)
{
    check_index(container);
    if (m_nodes[container].parent != root())
    {
        throw StructuralError(
            "Tranches can only be set on top-level nodes, got '" + path_string(container) + "'");
    }
    for (const auto& tranche : tranches)
    {
        for (NodeIdx leaf : tranche)
        {
            check_index(leaf);
            if (!is_descendant(leaf, container))
            {
                throw StructuralError(
                    "Node '" + path_string(leaf) + "' is not inside '" + path_string(container) + "'");
            }
        }
    }
    m_sorted_leaves[container] = std::move(tranches);
}

const std::vector<Tranche>& PipelineGraph::sorted_leaves(NodeIdx container) const
{
    auto it = m_sorted_leaves.find(container);
    if (it == m_sorted_leaves.end())
    {
        return no_tranches;
    }
    return it->second;
}

} // namespace cdplan
