/**
 * @file deployment_actions.hpp
 * @brief Producers for manual approvals and change set actions.
 */
#pragma once
#include "cdplan/engine/action_producer.hpp"

namespace cdplan
{

/**
 * @brief Produces a manual approval action; consumes one run order.
 */
class ManualApprovalProducer : public IActionProducer
{
public:
    explicit ManualApprovalProducer(std::shared_ptr<const ManualApprovalStep> step);

    ProduceResult produce(const ProduceContext& context) override;

private:
    std::shared_ptr<const ManualApprovalStep> m_step;
};

/**
 * @brief Produces a create-or-replace change set action; consumes one run order.
 */
class CreateChangeSetProducer : public IActionProducer
{
public:
    struct Props
    {
        StackDeploymentPtr stack;
        std::string change_set_name;

        /// Artifact holding the cloud assembly.
        ArtifactPtr template_artifact;

        /// Template configuration path inside the cloud assembly, if any.
        std::optional<std::string> template_configuration_path;

        /// Target region and account when they differ from the pipeline's.
        std::optional<std::string> region;
        std::optional<std::string> account;
    };

    explicit CreateChangeSetProducer(Props props);

    ProduceResult produce(const ProduceContext& context) override;

private:
    Props m_props;
};

/**
 * @brief Produces an execute change set action; consumes one run order.
 */
class ExecuteChangeSetProducer : public IActionProducer
{
public:
    struct Props
    {
        StackDeploymentPtr stack;
        std::string change_set_name;
        std::optional<std::string> region;
        std::optional<std::string> account;

        /// Namespace the stack outputs are exported under, if captured.
        std::optional<std::string> variables_namespace;
    };

    explicit ExecuteChangeSetProducer(Props props);

    ProduceResult produce(const ProduceContext& context) override;

private:
    Props m_props;
};

} // namespace cdplan
