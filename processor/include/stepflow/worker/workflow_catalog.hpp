#pragma once

#include "stepflow/worker/workflow.hpp"

#include <caf/expected.hpp>

#include <functional>
#include <map>
#include <string>
#include <vector>

namespace stepflow {
namespace worker {

// Inputs shared by the built-in workflow definitions
struct WorkflowParams {
    std::string project_id;
    std::string project_dir;
};

/**
 * Named workflow definitions.
 *
 * Built-ins:
 * - check_status: reports that the worker is able to run workflows
 * - project_inventory: copies the project into the run's work directory,
 *   lists files with size and MD5 checksum and writes a manifest
 */
class WorkflowCatalog {
public:
    using Builder = std::function<Workflow(const WorkflowParams&)>;

    WorkflowCatalog();

    // Replaces an existing definition with the same name
    void add(const std::string& name, Builder builder);

    bool contains(const std::string& name) const;
    std::vector<std::string> names() const;

    // Unknown names and definitions that fail validation yield caf::sec::invalid_argument
    caf::expected<Workflow> build(const std::string& name, const WorkflowParams& params) const;

private:
    std::map<std::string, Builder> builders_;
};

Workflow make_check_status_workflow(const WorkflowParams& params);
Workflow make_project_inventory_workflow(const WorkflowParams& params);

} // namespace worker
} // namespace stepflow
