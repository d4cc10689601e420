#include "cdplan/common/action_names.hpp"

namespace cdplan
{

namespace
{

bool is_allowed(char c) noexcept
{
    return (c >= 'A' && c <= 'Z')
        || (c >= 'a' && c <= 'z')
        || (c >= '0' && c <= '9')
        || c == '.' || c == '@' || c == '-' || c == '_';
}

bool is_continuation_byte(char c) noexcept
{
    return (static_cast<unsigned char>(c) & 0xC0) == 0x80;
}

} // namespace

std::string sanitize_name(const std::string& name)
{
    std::string result;
    result.reserve(name.size());
    for (size_t i = 0; i < name.size(); ++i)
    {
        const char c = name[i];
        if (is_allowed(c))
        {
            result += c;
            continue;
        }
        result += '_';
        // One replacement per UTF-8 code point.
        while (i + 1 < name.size() && is_continuation_byte(name[i + 1]))
        {
            ++i;
        }
    }
    return result;
}

std::string action_name(const PipelineGraph& graph, NodeIdx node, NodeIdx shared_parent)
{
    std::string result;
    for (NodeIdx idx : graph.ancestor_path(node, shared_parent))
    {
        if (!result.empty())
        {
            result += '.';
        }
        result += sanitize_name(graph.node(idx).id);
    }
    return result;
}

} // namespace cdplan
