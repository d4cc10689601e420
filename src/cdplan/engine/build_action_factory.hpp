/**
 * @file build_action_factory.hpp
 * @brief Turns scripted steps into build projects and build actions.
 */
#pragma once
#include "cdplan/engine/action_producer.hpp"

namespace cdplan
{

/**
 * @brief Producer that runs a ScriptStep (or BuildStep) in a build project.
 *
 * @details
 * produce() creates one BuildProject and one build action, and consumes one
 * run order. The project settings are the build defaults from the context,
 * overlaid with the step's own settings (for a BuildStep), overlaid with the
 * step's environment variables.
 *
 * The step's input becomes the action's main input. Without one, the
 * context's fallback artifact is used; without either, production fails.
 *
 * The project runs under the step's role when a BuildStep supplies one, and
 * under a new role named `<construct id>Role` otherwise.
 */
class BuildActionFactory : public IActionProducer
{
public:
    struct Options
    {
        /// Resource the project must depend on, e.g. an attached policy.
        PolicyPtr additional_dependable;

        /// Pass the build spec through the cloud assembly.
        bool build_spec_via_assembly{false};
    };

    /**
     * @brief Create a factory for a step.
     * @param construct_id Identifier of the build project.
     * @param step The step to run; a BuildStep contributes its extra settings.
     * @param options Customizations not available on the step itself.
     */
    static std::shared_ptr<BuildActionFactory> from_script_step(
        std::string construct_id,
        std::shared_ptr<const ScriptStep> step,
        Options options);

    static std::shared_ptr<BuildActionFactory> from_script_step(
        std::string construct_id,
        std::shared_ptr<const ScriptStep> step)
    {
        return from_script_step(std::move(construct_id), std::move(step), Options{});
    }

    /**
     * @throw ValidationError if `step` is null.
     */
    BuildActionFactory(std::string construct_id, std::shared_ptr<const ScriptStep> step, Options options);

    ProduceResult produce(const ProduceContext& context) override;

    const std::string& construct_id() const noexcept { return m_construct_id; }

private:
    std::string m_construct_id;
    std::shared_ptr<const ScriptStep> m_step;
    Options m_options;
};

} // namespace cdplan
