#include "cdplan/engine/custom_action_step.hpp"
#include "cdplan/common/pipeline_errors.hpp"

namespace cdplan
{

CustomActionStep::CustomActionStep(std::string id, Props props)
    : ActionStep(std::move(id))
    , m_props{std::move(props)}
{
    if (m_props.category.empty() || m_props.provider.empty())
    {
        throw ValidationError("Action step '" + this->id() + "' needs a category and a provider");
    }
    if (m_props.run_orders_consumed < 1)
    {
        throw ValidationError("Action step '" + this->id() + "' must consume at least one run order");
    }
    if (m_props.output)
    {
        configure_primary_output(*m_props.output);
    }
}

ProduceResult CustomActionStep::produce(const ProduceContext& context)
{
    CustomActionConfig config;
    config.category = m_props.category;
    config.provider = m_props.provider;
    config.configuration = m_props.configuration;
    for (const auto& input : m_props.inputs)
    {
        config.inputs.push_back(context.artifacts.to_pipeline(input));
    }
    if (primary_output())
    {
        config.outputs.push_back(context.artifacts.to_pipeline(primary_output()));
    }

    context.stage.add_action(PlannedAction{context.action_name, context.run_order, std::move(config)});

    ProduceResult result;
    result.run_orders_consumed = m_props.run_orders_consumed;
    return result;
}

std::string CustomActionStep::describe() const
{
    return "CustomActionStep(" + id() + ", " + m_props.category + "/" + m_props.provider + ")";
}

} // namespace cdplan
