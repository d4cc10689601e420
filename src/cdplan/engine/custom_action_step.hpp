/**
 * @file custom_action_step.hpp
 */
#pragma once
#include "cdplan/engine/action_producer.hpp"

namespace cdplan
{

/**
 * @brief A step that adds one action of an arbitrary provider.
 *
 * @details
 * Source actions are the typical use: they have no input, produce the
 * pipeline's first artifact, and therefore become its fallback artifact.
 */
class CustomActionStep : public ActionStep
{
public:
    struct Props
    {
        /// Action category, e.g. `Source`, `Test`, `Invoke`.
        std::string category;

        /// Action provider, e.g. `CodeStarSourceConnection`.
        std::string provider;

        std::map<std::string, std::string> configuration;
        std::vector<FileSetPtr> inputs;

        /// Id of the produced file set, if any.
        std::optional<std::string> output;

        int run_orders_consumed{1};
    };

    CustomActionStep(std::string id, Props props);

    ProduceResult produce(const ProduceContext& context) override;

    const Props& props() const noexcept { return m_props; }

    std::string describe() const override;

private:
    Props m_props;
};

} // namespace cdplan
