#include "cdplan/config/pipeline_config.hpp"
#include "cdplan/common/graph_builder.hpp"
#include "cdplan/common/pipeline_errors.hpp"
#include "cdplan/engine/custom_action_step.hpp"

#include <spdlog/spdlog.h>
#include <yaml-cpp/yaml.h>

namespace cdplan
{

namespace
{

// ============================================================================
// Node access helpers
// ============================================================================

/// Only call on nodes that exist; missing keys have no position.
std::string where(const std::string& path, const YAML::Node& node)
{
    const YAML::Mark mark = node.Mark();
    if (mark.is_null())
    {
        return path;
    }
    return path + " (line " + std::to_string(mark.line + 1) + ")";
}

void expect_map(const YAML::Node& node, const std::string& path)
{
    if (!node.IsMap())
    {
        throw ConfigurationError(where(path, node) + ": expected a mapping");
    }
}

void expect_sequence(const YAML::Node& node, const std::string& path)
{
    if (!node.IsSequence())
    {
        throw ConfigurationError(where(path, node) + ": expected a sequence");
    }
}

template <typename T>
T as(const YAML::Node& node, const std::string& path)
{
    try
    {
        return node.as<T>();
    }
    catch (const YAML::Exception& e)
    {
        throw ConfigurationError(where(path, node) + ": " + e.msg);
    }
}

YAML::Node require(const YAML::Node& map, const std::string& key, const std::string& path)
{
    YAML::Node value = map[key];
    if (!value)
    {
        throw ConfigurationError(where(path, map) + ": missing required key '" + key + "'");
    }
    return value;
}

std::string read_string(const YAML::Node& map, const std::string& key, const std::string& path)
{
    return as<std::string>(require(map, key, path), path + "." + key);
}

std::optional<std::string> optional_string(const YAML::Node& map, const std::string& key, const std::string& path)
{
    YAML::Node value = map[key];
    if (!value)
    {
        return std::nullopt;
    }
    return as<std::string>(value, path + "." + key);
}

template <typename T>
T read_or(const YAML::Node& map, const std::string& key, const std::string& path, T fallback)
{
    YAML::Node value = map[key];
    if (!value)
    {
        return fallback;
    }
    return as<T>(value, path + "." + key);
}

std::vector<std::string> string_list(const YAML::Node& map, const std::string& key, const std::string& path)
{
    std::vector<std::string> result;
    YAML::Node value = map[key];
    if (!value)
    {
        return result;
    }
    const std::string list_path = path + "." + key;
    expect_sequence(value, list_path);
    for (size_t i = 0; i < value.size(); ++i)
    {
        result.push_back(as<std::string>(value[i], list_path + "[" + std::to_string(i) + "]"));
    }
    return result;
}

std::map<std::string, std::string> string_map(const YAML::Node& map, const std::string& key, const std::string& path)
{
    std::map<std::string, std::string> result;
    YAML::Node value = map[key];
    if (!value)
    {
        return result;
    }
    const std::string map_path = path + "." + key;
    expect_map(value, map_path);
    for (const auto& entry : value)
    {
        const auto name = as<std::string>(entry.first, map_path);
        result[name] = as<std::string>(entry.second, map_path + "." + name);
    }
    return result;
}

// ============================================================================
// Enumerations
// ============================================================================

CredentialUsage parse_usage(const YAML::Node& node, const std::string& path)
{
    const auto text = as<std::string>(node, path);
    for (auto usage : {CredentialUsage::Synth, CredentialUsage::SelfUpdate, CredentialUsage::AssetPublishing})
    {
        if (text == to_string(usage))
        {
            return usage;
        }
    }
    throw ConfigurationError(
        where(path, node) + ": unknown credential usage '" + text +
        "'; expected synth, self-update or asset-publishing");
}

AssetType parse_asset_type(const YAML::Node& node, const std::string& path)
{
    const auto text = as<std::string>(node, path);
    if (text == to_string(AssetType::File))
    {
        return AssetType::File;
    }
    if (text == to_string(AssetType::DockerImage))
    {
        return AssetType::DockerImage;
    }
    throw ConfigurationError(
        where(path, node) + ": unknown asset type '" + text + "'; expected file or docker-image");
}

// ============================================================================
// ConfigReader
// ============================================================================

class ConfigReader
{
public:
    PipelineConfig read(const YAML::Node& root);

private:
    EngineProps read_engine(const YAML::Node& node, const std::string& path) const;
    BuildOptions read_build_options(const YAML::Node& node, const std::string& path) const;
    PolicyStatement read_statement(const YAML::Node& node, const std::string& path) const;
    DockerCredential read_docker_credential(const YAML::Node& node, const std::string& path) const;
    void read_stacks(const YAML::Node& node, const std::string& path);
    StackAsset read_asset(const YAML::Node& node, const std::string& path) const;
    void read_graph_node(GraphBuilder& builder, const YAML::Node& node, const std::string& parent_path,
                         const std::string& path);
    NodeData read_node_data(const YAML::Node& node, const std::string& kind, const std::string& default_step_id,
                            const std::string& path);
    StepPtr read_step(const YAML::Node& node, const std::string& default_id, const std::string& path);
    ScriptStep::Props read_script_props(const YAML::Node& node, const std::string& path) const;

    StackDeploymentPtr stack_ref(const YAML::Node& map, const std::string& path) const;
    FileSetPtr output_of(const YAML::Node& node, const std::string& path) const;

    PipelineConfig m_config;
};

PipelineConfig ConfigReader::read(const YAML::Node& root)
{
    if (!root)
    {
        throw ConfigurationError("Pipeline description is empty");
    }
    expect_map(root, "$");

    if (YAML::Node pipeline = root["pipeline"])
    {
        m_config.engine = read_engine(pipeline, "pipeline");
    }
    if (YAML::Node stacks = root["stacks"])
    {
        read_stacks(stacks, "stacks");
    }

    const YAML::Node graph = require(root, "graph", "$");
    expect_map(graph, "graph");

    GraphBuilder builder(read_or<std::string>(graph, "id", "graph", "Pipeline"));
    const YAML::Node nodes = require(graph, "nodes", "graph");
    expect_sequence(nodes, "graph.nodes");
    for (size_t i = 0; i < nodes.size(); ++i)
    {
        read_graph_node(builder, nodes[i], "", "graph.nodes[" + std::to_string(i) + "]");
    }

    if (YAML::Node assembly = graph["cloud_assembly"])
    {
        builder.set_cloud_assembly_file_set(output_of(assembly, "graph.cloud_assembly"));
    }

    m_config.graph = builder.build();

    SPDLOG_DEBUG("Loaded pipeline description: {} stacks, {} steps, {} graph nodes",
        m_config.stacks.size(), m_config.steps.size(), m_config.graph->node_count());
    return std::move(m_config);
}

EngineProps ConfigReader::read_engine(const YAML::Node& node, const std::string& path) const
{
    expect_map(node, path);

    EngineProps props;
    props.pipeline_name = optional_string(node, "name", path);
    props.cross_account_keys = read_or(node, "cross_account_keys", path, props.cross_account_keys);
    props.cli_version = optional_string(node, "cli_version", path);
    props.self_mutation = read_or(node, "self_mutation", path, props.self_mutation);
    props.pipeline_uses_docker_assets =
        read_or(node, "pipeline_uses_docker_assets", path, props.pipeline_uses_docker_assets);
    props.single_publisher_per_asset_type =
        read_or(node, "single_publisher_per_asset_type", path, props.single_publisher_per_asset_type);
    props.account = read_or(node, "account", path, props.account);
    props.region = read_or(node, "region", path, props.region);
    props.pipeline_stack_name = read_or(node, "pipeline_stack_name", path, props.pipeline_stack_name);
    props.assembly_path = read_or(node, "assembly_path", path, props.assembly_path);
    props.artifact_bucket = read_or(node, "artifact_bucket", path, props.artifact_bucket);

    if (YAML::Node defaults = node["build_defaults"])
    {
        props.build_defaults = read_build_options(defaults, path + ".build_defaults");
    }
    if (YAML::Node defaults = node["asset_publishing_build_defaults"])
    {
        props.asset_publishing_build_defaults =
            read_build_options(defaults, path + ".asset_publishing_build_defaults");
    }
    if (YAML::Node defaults = node["self_mutation_build_defaults"])
    {
        props.self_mutation_build_defaults = read_build_options(defaults, path + ".self_mutation_build_defaults");
    }

    if (YAML::Node credentials = node["docker_credentials"])
    {
        const std::string list_path = path + ".docker_credentials";
        expect_sequence(credentials, list_path);
        for (size_t i = 0; i < credentials.size(); ++i)
        {
            props.docker_credentials.push_back(
                read_docker_credential(credentials[i], list_path + "[" + std::to_string(i) + "]"));
        }
    }
    return props;
}

BuildOptions ConfigReader::read_build_options(const YAML::Node& node, const std::string& path) const
{
    expect_map(node, path);

    BuildOptions options;
    options.build_environment.build_image = optional_string(node, "build_image", path);
    options.build_environment.compute_type = optional_string(node, "compute_type", path);
    if (YAML::Node privileged = node["privileged"])
    {
        options.build_environment.privileged = as<bool>(privileged, path + ".privileged");
    }
    options.build_environment.environment_variables = string_map(node, "environment_variables", path);
    options.partial_build_spec.pre_build_commands = string_list(node, "pre_build_commands", path);

    if (YAML::Node statements = node["role_policy"])
    {
        const std::string list_path = path + ".role_policy";
        expect_sequence(statements, list_path);
        for (size_t i = 0; i < statements.size(); ++i)
        {
            options.role_policy.push_back(read_statement(statements[i], list_path + "[" + std::to_string(i) + "]"));
        }
    }

    if (YAML::Node vpc = node["vpc"])
    {
        const std::string vpc_path = path + ".vpc";
        expect_map(vpc, vpc_path);
        VpcConfig config;
        config.vpc_id = read_string(vpc, "vpc_id", vpc_path);
        config.subnet_ids = string_list(vpc, "subnet_ids", vpc_path);
        config.security_group_ids = string_list(vpc, "security_group_ids", vpc_path);
        options.vpc = std::move(config);
    }
    return options;
}

PolicyStatement ConfigReader::read_statement(const YAML::Node& node, const std::string& path) const
{
    expect_map(node, path);

    PolicyStatement statement;
    statement.actions = string_list(node, "actions", path);
    statement.resources = string_list(node, "resources", path);
    if (statement.actions.empty())
    {
        throw ConfigurationError(where(path, node) + ": a policy statement needs at least one action");
    }

    if (YAML::Node conditions = node["conditions"])
    {
        const std::string cond_path = path + ".conditions";
        expect_map(conditions, cond_path);
        for (const auto& op : conditions)
        {
            const auto op_name = as<std::string>(op.first, cond_path);
            const std::string op_path = cond_path + "." + op_name;
            expect_map(op.second, op_path);
            for (const auto& key : op.second)
            {
                const auto key_name = as<std::string>(key.first, op_path);
                auto& values = statement.conditions[op_name][key_name];
                if (key.second.IsSequence())
                {
                    values = as<std::vector<std::string>>(key.second, op_path + "." + key_name);
                }
                else
                {
                    values.push_back(as<std::string>(key.second, op_path + "." + key_name));
                }
            }
        }
    }
    return statement;
}

DockerCredential ConfigReader::read_docker_credential(const YAML::Node& node, const std::string& path) const
{
    expect_map(node, path);

    std::set<CredentialUsage> usages;
    if (YAML::Node usage_list = node["usages"])
    {
        expect_sequence(usage_list, path + ".usages");
        for (size_t i = 0; i < usage_list.size(); ++i)
        {
            usages.insert(parse_usage(usage_list[i], path + ".usages[" + std::to_string(i) + "]"));
        }
    }

    if (node["ecr"])
    {
        try
        {
            return DockerCredential::ecr(string_list(node, "ecr", path), std::move(usages));
        }
        catch (const ValidationError& e)
        {
            throw ConfigurationError(where(path, node) + ": " + e.what());
        }
    }
    return DockerCredential::custom_registry(
        read_string(node, "registry", path), read_string(node, "secret_arn", path), std::move(usages));
}

void ConfigReader::read_stacks(const YAML::Node& node, const std::string& path)
{
    expect_sequence(node, path);
    for (size_t i = 0; i < node.size(); ++i)
    {
        const YAML::Node entry = node[i];
        const std::string entry_path = path + "[" + std::to_string(i) + "]";
        expect_map(entry, entry_path);

        auto stack = std::make_shared<StackDeployment>();
        stack->stack_artifact_id = read_string(entry, "id", entry_path);
        stack->stack_name = read_or(entry, "stack_name", entry_path, stack->stack_artifact_id);
        stack->region = optional_string(entry, "region", entry_path);
        stack->account = optional_string(entry, "account", entry_path);
        stack->assume_role_arn = read_string(entry, "assume_role_arn", entry_path);
        stack->execution_role_arn = optional_string(entry, "execution_role_arn", entry_path);
        stack->template_path = read_string(entry, "template_path", entry_path);
        stack->tags = string_map(entry, "tags", entry_path);

        if (!m_config.stacks.emplace(stack->stack_artifact_id, stack).second)
        {
            throw ConfigurationError(
                where(entry_path, entry) + ": duplicate stack id '" + stack->stack_artifact_id + "'");
        }
    }
}

StackAsset ConfigReader::read_asset(const YAML::Node& node, const std::string& path) const
{
    expect_map(node, path);

    StackAsset asset;
    asset.asset_id = read_string(node, "asset_id", path);
    asset.asset_selector = read_string(node, "selector", path);
    asset.asset_manifest_path = read_string(node, "manifest_path", path);
    if (YAML::Node type = node["type"])
    {
        asset.asset_type = parse_asset_type(type, path + ".type");
    }
    asset.publishing_role_arn = optional_string(node, "publishing_role_arn", path);
    return asset;
}

StackDeploymentPtr ConfigReader::stack_ref(const YAML::Node& map, const std::string& path) const
{
    const auto id = read_string(map, "stack", path);
    auto it = m_config.stacks.find(id);
    if (it == m_config.stacks.end())
    {
        throw ConfigurationError(where(path + ".stack", map["stack"]) + ": unknown stack '" + id + "'");
    }
    return it->second;
}

FileSetPtr ConfigReader::output_of(const YAML::Node& node, const std::string& path) const
{
    const auto step_id = as<std::string>(node, path);
    auto it = m_config.steps.find(step_id);
    if (it == m_config.steps.end())
    {
        throw ConfigurationError(
            where(path, node) + ": unknown step '" + step_id + "' (steps must be declared before use)");
    }
    if (!it->second->primary_output())
    {
        throw ConfigurationError(where(path, node) + ": step '" + step_id + "' has no primary output");
    }
    return it->second->primary_output();
}

void ConfigReader::read_graph_node(GraphBuilder& builder, const YAML::Node& node, const std::string& parent_path,
                                   const std::string& path)
{
    expect_map(node, path);

    const auto id = read_string(node, "id", path);
    const auto kind = read_string(node, "kind", path);
    const std::string node_path = parent_path.empty() ? id : parent_path + "/" + id;

    NodeData data = read_node_data(node, kind, id, path);
    try
    {
        builder.add_node(parent_path, id, std::move(data));
    }
    catch (const StructuralError& e)
    {
        throw ConfigurationError(where(path, node) + ": " + e.what());
    }

    if (YAML::Node children = node["children"])
    {
        expect_sequence(children, path + ".children");
        for (size_t i = 0; i < children.size(); ++i)
        {
            read_graph_node(builder, children[i], node_path, path + ".children[" + std::to_string(i) + "]");
        }
    }

    if (YAML::Node tranches = node["tranches"])
    {
        const std::string tranches_path = path + ".tranches";
        if (!parent_path.empty())
        {
            throw ConfigurationError(where(tranches_path, tranches) + ": only top-level nodes have tranches");
        }
        expect_sequence(tranches, tranches_path);
        for (size_t i = 0; i < tranches.size(); ++i)
        {
            const std::string tranche_path = tranches_path + "[" + std::to_string(i) + "]";
            expect_sequence(tranches[i], tranche_path);
            try
            {
                builder.add_tranche(node_path, as<std::vector<std::string>>(tranches[i], tranche_path));
            }
            catch (const StructuralError& e)
            {
                throw ConfigurationError(where(tranche_path, tranches[i]) + ": " + e.what());
            }
        }
    }
}

NodeData ConfigReader::read_node_data(const YAML::Node& node, const std::string& kind,
                                      const std::string& default_step_id, const std::string& path)
{
    if (kind == "group")
    {
        return GroupData{};
    }
    if (kind == "stack-group")
    {
        return StackGroupData{stack_ref(node, path)};
    }
    if (kind == "self-update")
    {
        return SelfUpdateData{};
    }
    if (kind == "publish-assets")
    {
        PublishAssetsData data;
        const YAML::Node assets = require(node, "assets", path);
        expect_sequence(assets, path + ".assets");
        for (size_t i = 0; i < assets.size(); ++i)
        {
            data.assets.push_back(read_asset(assets[i], path + ".assets[" + std::to_string(i) + "]"));
        }
        return data;
    }
    if (kind == "prepare")
    {
        return PrepareData{stack_ref(node, path)};
    }
    if (kind == "execute")
    {
        return ExecuteData{stack_ref(node, path), read_or(node, "capture_outputs", path, false)};
    }
    if (kind == "step")
    {
        StepPtr step = read_step(require(node, "step", path), default_step_id, path + ".step");
        return StepData{std::move(step), read_or(node, "build_step", path, false)};
    }
    throw ConfigurationError(
        where(path + ".kind", node["kind"]) + ": unknown node kind '" + kind +
        "'; expected group, stack-group, self-update, publish-assets, prepare, execute or step");
}

ScriptStep::Props ConfigReader::read_script_props(const YAML::Node& node, const std::string& path) const
{
    ScriptStep::Props props;
    if (YAML::Node input = node["input"])
    {
        props.input = output_of(input, path + ".input");
    }
    if (YAML::Node inputs = node["additional_inputs"])
    {
        const std::string inputs_path = path + ".additional_inputs";
        expect_map(inputs, inputs_path);
        for (const auto& entry : inputs)
        {
            const auto directory = as<std::string>(entry.first, inputs_path);
            props.additional_inputs[directory] = output_of(entry.second, inputs_path + "." + directory);
        }
    }
    props.install_commands = string_list(node, "install_commands", path);
    props.commands = string_list(node, "commands", path);
    props.env = string_map(node, "env", path);
    props.primary_output_directory = optional_string(node, "primary_output_directory", path);
    return props;
}

StepPtr ConfigReader::read_step(const YAML::Node& node, const std::string& default_id, const std::string& path)
{
    expect_map(node, path);

    const auto type = read_string(node, "type", path);
    const auto id = read_or(node, "id", path, default_id);
    if (m_config.steps.count(id))
    {
        throw ConfigurationError(where(path, node) + ": duplicate step id '" + id + "'");
    }

    StepPtr step;
    try
    {
        if (type == "script")
        {
            step = std::make_shared<ScriptStep>(id, read_script_props(node, path));
        }
        else if (type == "build")
        {
            BuildOptions options = read_build_options(node, path);
            BuildStep::BuildProps build;
            build.project_name = optional_string(node, "project_name", path);
            build.build_environment = std::move(options.build_environment);
            build.partial_build_spec = std::move(options.partial_build_spec);
            build.role_policy_statements = std::move(options.role_policy);
            step = std::make_shared<BuildStep>(id, read_script_props(node, path), std::move(build));
        }
        else if (type == "approval")
        {
            step = std::make_shared<ManualApprovalStep>(id, optional_string(node, "comment", path));
        }
        else if (type == "action")
        {
            CustomActionStep::Props props;
            props.category = read_string(node, "category", path);
            props.provider = read_string(node, "provider", path);
            props.configuration = string_map(node, "configuration", path);
            if (YAML::Node inputs = node["inputs"])
            {
                expect_sequence(inputs, path + ".inputs");
                for (size_t i = 0; i < inputs.size(); ++i)
                {
                    props.inputs.push_back(output_of(inputs[i], path + ".inputs[" + std::to_string(i) + "]"));
                }
            }
            props.output = optional_string(node, "output", path);
            props.run_orders_consumed = read_or(node, "run_orders", path, 1);
            step = std::make_shared<CustomActionStep>(id, std::move(props));
        }
        else
        {
            throw ConfigurationError(
                where(path + ".type", node["type"]) + ": unknown step type '" + type +
                "'; expected script, build, approval or action");
        }
    }
    catch (const ValidationError& e)
    {
        throw ConfigurationError(where(path, node) + ": " + e.what());
    }

    m_config.steps.emplace(id, step);
    return step;
}

} // namespace

// ============================================================================
// Entry points
// ============================================================================

PipelineConfig parse_pipeline_config(const std::string& yaml_text)
{
    YAML::Node root;
    try
    {
        root = YAML::Load(yaml_text);
    }
    catch (const YAML::Exception& e)
    {
        throw ConfigurationError(std::string("Failed to parse pipeline description: ") + e.what());
    }
    return ConfigReader{}.read(root);
}

PipelineConfig load_pipeline_config(const std::string& filename)
{
    YAML::Node root;
    try
    {
        root = YAML::LoadFile(filename);
    }
    catch (const YAML::Exception& e)
    {
        throw ConfigurationError("Failed to read pipeline description '" + filename + "': " + e.what());
    }
    spdlog::info("Loading pipeline description {}", filename);
    return ConfigReader{}.read(root);
}

} // namespace cdplan
