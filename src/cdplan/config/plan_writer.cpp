#include "cdplan/config/plan_writer.hpp"

#include <yaml-cpp/yaml.h>

namespace cdplan
{

namespace
{

void write_list(YAML::Emitter& out, const char* key, const std::vector<std::string>& values)
{
    if (values.empty())
    {
        return;
    }
    out << YAML::Key << key << YAML::Value << YAML::BeginSeq;
    for (const auto& value : values)
    {
        out << value;
    }
    out << YAML::EndSeq;
}

void write_map(YAML::Emitter& out, const char* key, const std::map<std::string, std::string>& values)
{
    if (values.empty())
    {
        return;
    }
    out << YAML::Key << key << YAML::Value << YAML::BeginMap;
    for (const auto& [name, value] : values)
    {
        out << YAML::Key << name << YAML::Value << value;
    }
    out << YAML::EndMap;
}

void write_optional(YAML::Emitter& out, const char* key, const std::optional<std::string>& value)
{
    if (value)
    {
        out << YAML::Key << key << YAML::Value << *value;
    }
}

void write_artifacts(YAML::Emitter& out, const char* key, const std::vector<ArtifactPtr>& artifacts)
{
    std::vector<std::string> names;
    for (const auto& artifact : artifacts)
    {
        names.push_back(artifact->name);
    }
    write_list(out, key, names);
}

void write_statement(YAML::Emitter& out, const PolicyStatement& statement)
{
    out << YAML::BeginMap;
    write_list(out, "actions", statement.actions);
    write_list(out, "resources", statement.resources);
    if (!statement.conditions.empty())
    {
        out << YAML::Key << "conditions" << YAML::Value << YAML::BeginMap;
        for (const auto& [op, keys] : statement.conditions)
        {
            out << YAML::Key << op << YAML::Value << YAML::BeginMap;
            for (const auto& [key, values] : keys)
            {
                out << YAML::Key << key << YAML::Value << YAML::Flow << values;
            }
            out << YAML::EndMap;
        }
        out << YAML::EndMap;
    }
    out << YAML::EndMap;
}

// Writes the fields of one action configuration into the open action map.
struct ActionConfigWriter
{
    YAML::Emitter& out;

    void operator()(const BuildActionConfig& config) const
    {
        out << YAML::Key << "type" << YAML::Value << "build";
        out << YAML::Key << "project" << YAML::Value << config.project->construct_id();
        out << YAML::Key << "input" << YAML::Value << config.input->name;
        write_artifacts(out, "extra_inputs", config.extra_inputs);
        write_artifacts(out, "outputs", config.outputs);
        out << YAML::Key << "before_self_mutation" << YAML::Value << config.before_self_mutation;
    }

    void operator()(const ManualApprovalActionConfig& config) const
    {
        out << YAML::Key << "type" << YAML::Value << "manual-approval";
        write_optional(out, "comment", config.comment);
    }

    void operator()(const CreateChangeSetActionConfig& config) const
    {
        out << YAML::Key << "type" << YAML::Value << "create-change-set";
        out << YAML::Key << "change_set_name" << YAML::Value << config.change_set_name;
        out << YAML::Key << "stack_name" << YAML::Value << config.stack_name;
        out << YAML::Key << "template_path" << YAML::Value << config.template_path;
        write_optional(out, "template_configuration", config.template_configuration);
        out << YAML::Key << "admin_permissions" << YAML::Value << config.admin_permissions;
        out << YAML::Key << "role_arn" << YAML::Value << config.role_arn;
        write_optional(out, "deployment_role_arn", config.deployment_role_arn);
        write_optional(out, "region", config.region);
        write_optional(out, "account", config.account);
    }

    void operator()(const ExecuteChangeSetActionConfig& config) const
    {
        out << YAML::Key << "type" << YAML::Value << "execute-change-set";
        out << YAML::Key << "change_set_name" << YAML::Value << config.change_set_name;
        out << YAML::Key << "stack_name" << YAML::Value << config.stack_name;
        out << YAML::Key << "role_arn" << YAML::Value << config.role_arn;
        write_optional(out, "region", config.region);
        write_optional(out, "account", config.account);
        write_optional(out, "variables_namespace", config.variables_namespace);
    }

    void operator()(const CustomActionConfig& config) const
    {
        out << YAML::Key << "type" << YAML::Value << "custom";
        out << YAML::Key << "category" << YAML::Value << config.category;
        out << YAML::Key << "provider" << YAML::Value << config.provider;
        write_map(out, "configuration", config.configuration);
        write_artifacts(out, "inputs", config.inputs);
        write_artifacts(out, "outputs", config.outputs);
    }
};

void write_project(YAML::Emitter& out, const BuildProject& project)
{
    const BuildEnvironment& env = project.environment();

    out << YAML::BeginMap;
    out << YAML::Key << "construct_id" << YAML::Value << project.construct_id();
    write_optional(out, "project_name", project.project_name());
    out << YAML::Key << "role" << YAML::Value << project.role()->name();
    write_optional(out, "build_image", env.build_image);
    write_optional(out, "compute_type", env.compute_type);
    out << YAML::Key << "privileged" << YAML::Value << env.privileged.value_or(false);
    write_map(out, "environment_variables", env.environment_variables);
    write_list(out, "install_commands", project.install_commands());
    write_list(out, "commands", project.commands());
    write_list(out, "pre_build_commands", project.partial_build_spec().pre_build_commands);
    write_list(out, "docker_login_registries", project.partial_build_spec().docker_login_registries);
    if (project.vpc())
    {
        out << YAML::Key << "vpc" << YAML::Value << YAML::BeginMap;
        out << YAML::Key << "vpc_id" << YAML::Value << project.vpc()->vpc_id;
        write_list(out, "subnet_ids", project.vpc()->subnet_ids);
        write_list(out, "security_group_ids", project.vpc()->security_group_ids);
        out << YAML::EndMap;
    }
    if (project.additional_dependable())
    {
        out << YAML::Key << "depends_on" << YAML::Value << project.additional_dependable()->name();
    }
    out << YAML::Key << "build_spec_via_assembly" << YAML::Value << project.build_spec_via_assembly();
    out << YAML::EndMap;
}

void write_role(YAML::Emitter& out, const ResolvedRole& resolved)
{
    const Role& role = *resolved.role;

    out << YAML::BeginMap;
    out << YAML::Key << "name" << YAML::Value << role.name();
    write_list(out, "assumed_by", role.assumed_by());
    out << YAML::Key << "statements" << YAML::Value << YAML::BeginSeq;
    for (const auto& statement : resolved.statements)
    {
        write_statement(out, statement);
    }
    out << YAML::EndSeq;
    if (!role.attached_policies().empty())
    {
        out << YAML::Key << "policies" << YAML::Value << YAML::BeginSeq;
        for (const auto& policy : role.attached_policies())
        {
            out << YAML::BeginMap;
            out << YAML::Key << "name" << YAML::Value << policy->name();
            out << YAML::Key << "statements" << YAML::Value << YAML::BeginSeq;
            for (const auto& statement : policy->statements())
            {
                write_statement(out, statement);
            }
            out << YAML::EndSeq;
            out << YAML::EndMap;
        }
        out << YAML::EndSeq;
    }
    out << YAML::EndMap;
}

} // namespace

std::string plan_to_yaml(const PipelinePlan& plan, const BuildProjectPtr& synth_project)
{
    // Throws before finalize().
    const auto& roles = plan.resolved_roles();

    YAML::Emitter out;
    out << YAML::BeginMap;
    out << YAML::Key << "pipeline" << YAML::Value << YAML::BeginMap;

    write_optional(out, "name", plan.name());
    out << YAML::Key << "cross_account_keys" << YAML::Value << plan.cross_account_keys();
    out << YAML::Key << "restart_execution_on_update" << YAML::Value << plan.restart_execution_on_update();
    out << YAML::Key << "artifact_bucket" << YAML::Value << plan.artifact_bucket_arn();
    if (synth_project)
    {
        out << YAML::Key << "synth_project" << YAML::Value << synth_project->construct_id();
    }

    out << YAML::Key << "stages" << YAML::Value << YAML::BeginSeq;
    for (const auto& stage : plan.stages())
    {
        out << YAML::BeginMap;
        out << YAML::Key << "name" << YAML::Value << stage->name();
        out << YAML::Key << "actions" << YAML::Value << YAML::BeginSeq;
        for (const auto& action : stage->actions())
        {
            out << YAML::BeginMap;
            out << YAML::Key << "name" << YAML::Value << action.name;
            out << YAML::Key << "run_order" << YAML::Value << action.run_order;
            std::visit(ActionConfigWriter{out}, action.config);
            out << YAML::EndMap;
        }
        out << YAML::EndSeq;
        out << YAML::EndMap;
    }
    out << YAML::EndSeq;

    write_artifacts(out, "artifacts", plan.artifacts().artifacts());

    out << YAML::Key << "projects" << YAML::Value << YAML::BeginSeq;
    for (const auto& project : plan.projects())
    {
        write_project(out, *project);
    }
    out << YAML::EndSeq;

    out << YAML::Key << "roles" << YAML::Value << YAML::BeginSeq;
    for (const auto& role : roles)
    {
        write_role(out, role);
    }
    out << YAML::EndSeq;

    out << YAML::EndMap; // pipeline
    out << YAML::EndMap;
    return std::string(out.c_str());
}

} // namespace cdplan
