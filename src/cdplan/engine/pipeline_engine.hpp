/**
 * @file pipeline_engine.hpp
 * @brief PipelineEngine: compiles a layered graph into a PipelinePlan.
 */
#pragma once
#include "cdplan/common/common.hpp"
#include "cdplan/common/build_options.hpp"
#include "cdplan/common/docker_credential.hpp"
#include "cdplan/common/pipeline_graph.hpp"
#include "cdplan/common/self_mutation_barrier.hpp"
#include "cdplan/engine/action_producer.hpp"
#include "cdplan/engine/deployment_engine.hpp"
#include "cdplan/engine/pipeline_plan.hpp"
#include "cdplan/engine/resource_cache.hpp"

namespace cdplan
{

/**
 * @brief Settings of a PipelineEngine.
 */
struct EngineProps
{
    /// Name of the pipeline; derived project names are only set when present.
    std::optional<std::string> pipeline_name;

    bool cross_account_keys{false};

    /// Version of the deployment CLI tools; latest when unset.
    std::optional<std::string> cli_version;

    /// Whether the pipeline updates itself. Controls the initial barrier state.
    bool self_mutation{true};

    /// Run the self-update build in privileged mode.
    bool pipeline_uses_docker_assets{false};

    /// Defaults for every build project.
    std::optional<BuildOptions> build_defaults;

    /// Defaults for asset publishing projects, over `build_defaults`.
    std::optional<BuildOptions> asset_publishing_build_defaults;

    /// Defaults for the self-update project, over `build_defaults`.
    std::optional<BuildOptions> self_mutation_build_defaults;

    /// Pass publishing build specs through the cloud assembly.
    bool single_publisher_per_asset_type{false};

    std::vector<DockerCredential> docker_credentials;

    /// Account and region of the pipeline.
    std::string account{"${AWS::AccountId}"};
    std::string region{"${AWS::Region}"};

    /// Stack that holds the pipeline itself; deployed by the self-update.
    std::string pipeline_stack_name{"PipelineStack"};

    /// Cloud assembly directory, relative to the checked out input.
    std::string assembly_path{"cdk.out"};

    /// Bucket holding the pipeline's artifacts.
    std::string artifact_bucket{"${ArtifactsBucket}"};
};

/**
 * @brief Compiles a layered pipeline graph into stages and actions.
 *
 * @details
 * Every top-level container of the graph becomes one stage, or several
 * stages named `<id>.1`, `<id>.2`, ... when its scheduled leaves do not fit
 * into one stage. Leaves become actions in tranche order: all leaves of a
 * tranche start at the same run order, and the next tranche starts after the
 * longest of them.
 *
 * @par Lifecycle
 * - Constructed with EngineProps.
 * - build_deployment() is called exactly once.
 * - On failure no plan is exposed; the engine cannot be built again.
 *
 * @par Thread Safety
 * - Not thread-safe. Build from one thread, then read.
 */
class PipelineEngine : public IDeploymentEngine
{
public:
    /// Maximum number of actions in one stage.
    static constexpr size_t max_actions_per_stage = 50;

    explicit PipelineEngine(EngineProps props);

    /**
     * @brief Compile the graph.
     * @throw AlreadyBuiltError if called more than once.
     * @throw StructuralError if the graph is not laid out as containers of
     *        schedulable leaves.
     * @throw UnsupportedStepError for a step the engine cannot run.
     * @throw ValidationError for inconsistent node contents.
     */
    void build_deployment(std::shared_ptr<const PipelineGraph> graph) override;

    bool is_built() const noexcept override { return m_pipeline != nullptr; }

    /**
     * @brief The compiled pipeline.
     * @throw NotBuiltError before a successful build_deployment().
     */
    const PipelinePlan& pipeline() const;

    /**
     * @brief The project that synthesizes the cloud assembly.
     * @throw NotBuiltError if none was produced.
     */
    BuildProjectPtr synth_project() const;

    bool has_synth_project() const noexcept { return m_synth_project != nullptr; }

    /**
     * @brief Shared asset publishing roles.
     * @throw NotBuiltError before a successful build_deployment().
     */
    const ResourceCache& resources() const;

    const EngineProps& props() const noexcept { return m_props; }

    /**
     * @brief Build type of a node, or nullopt for nodes that never get a
     *        build project.
     */
    static std::optional<BuildProjectType> node_type_from_node(const GraphNode& node);

    /**
     * @brief Build defaults for a project type.
     *
     * @details
     * Layers, later ones winning: built-in defaults, `build_defaults`, the
     * type-specific defaults, then Docker registry logins for the type's
     * credential usage.
     */
    BuildOptions build_defaults_for(BuildProjectType type) const;

private:
    /// Mutable state of a single compilation.
    struct CompilerState
    {
        const PipelineGraph& graph;
        PipelinePlan& pipeline;
        ResourceCache& resources;

        /// Artifact of the first step primary output; input of last resort.
        ArtifactPtr fallback_artifact;

        SelfMutationBarrier barrier;

        BuildProjectPtr synth_project;
    };

    void stages_and_actions_from_graph(CompilerState& state) const;

    ActionProducerPtr action_from_node(NodeIdx idx, CompilerState& state) const;
    ActionProducerPtr action_from_step(NodeIdx idx, const StepData& data, const CompilerState& state) const;
    ActionProducerPtr self_mutate_action(CompilerState& state) const;
    ActionProducerPtr publish_assets_action(NodeIdx idx, const PublishAssetsData& data, CompilerState& state) const;
    ActionProducerPtr create_change_set_action(const PrepareData& data, CompilerState& state) const;
    ActionProducerPtr execute_change_set_action(const ExecuteData& data) const;

    void post_process_node(NodeIdx idx, const ProduceResult& result, CompilerState& state) const;

    std::string cli_install_suffix() const;

    EngineProps m_props;
    bool m_build_started{false};
    std::shared_ptr<const PipelineGraph> m_graph;
    std::unique_ptr<PipelinePlan> m_pipeline;
    std::unique_ptr<ResourceCache> m_resources;
    BuildProjectPtr m_synth_project;
};

} // namespace cdplan
