/**
 * @file action_producer.hpp
 * @brief IActionProducer interface, its context and its result.
 */
#pragma once
#include "cdplan/common/common.hpp"
#include "cdplan/common/blueprint.hpp"
#include "cdplan/common/build_options.hpp"
#include "cdplan/engine/artifact_map.hpp"
#include "cdplan/engine/build_project.hpp"
#include "cdplan/engine/pipeline_plan.hpp"

namespace cdplan
{

class ResourceCache;

/**
 * @brief Everything a producer needs to add its action(s) to a stage.
 */
struct ProduceContext
{
    /// Stage to add actions to.
    PlannedStage& stage;

    /// Name for the (first) action, unique within the stage.
    std::string action_name;

    /// Run order for the (first) action.
    int run_order;

    /// The pipeline being built; for registering roles and projects.
    PipelinePlan& pipeline;

    /// File set to artifact mapping of the pipeline.
    ArtifactMap& artifacts;

    /// Input to use when the step names none; may be null.
    ArtifactPtr fallback_artifact;

    /// Build defaults, if this node may produce a build project.
    std::optional<BuildOptions> build_defaults;

    /// True while the pipeline's self-update has not been scheduled yet.
    bool before_self_mutation;

    /// Shared roles per asset type, read-only.
    const ResourceCache& resources;
};

/**
 * @brief What a producer reports back.
 */
struct ProduceResult
{
    /**
     * @brief Number of run orders the produced actions occupy.
     * @details Nodes scheduled after this one in later tranches start at
     *          `run_order + run_orders_consumed` at the earliest.
     */
    int run_orders_consumed{1};

    /**
     * @brief The build project created, if any.
     */
    BuildProjectPtr project;
};

/**
 * @brief Interface for anything that turns into pipeline actions.
 *
 * @details
 * Producers are created per graph node by the engine, or are steps that know
 * how to add their own actions (see `ActionStep`). produce() is called once,
 * with the stage, name and run order the engine assigned.
 */
class IActionProducer
{
public:
    virtual ~IActionProducer() = default;

    /**
     * @brief Add the action(s) to `context.stage`.
     * @param context Where and when the actions go.
     * @return Run orders consumed and the build project, if any.
     */
    virtual ProduceResult produce(const ProduceContext& context) = 0;
};

using ActionProducerPtr = std::shared_ptr<IActionProducer>;

/**
 * @brief Base class for steps that produce their own actions.
 *
 * @details
 * The engine hands such steps to the stage directly instead of translating
 * them.
 */
class ActionStep : public Step, public IActionProducer
{
protected:
    explicit ActionStep(std::string id)
        : Step(std::move(id))
    {}
};

} // namespace cdplan
