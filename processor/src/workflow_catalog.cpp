#include "stepflow/worker/workflow_catalog.hpp"
#include "stepflow/worker/fs_operations.hpp"

#include <caf/error.hpp>
#include <caf/sec.hpp>

#include <memory>
#include <stdexcept>

namespace stepflow {
namespace worker {

WorkflowCatalog::WorkflowCatalog() {
    add("check_status", make_check_status_workflow);
    add("project_inventory", make_project_inventory_workflow);
}

void WorkflowCatalog::add(const std::string& name, Builder builder) {
    if (!builder) {
        throw std::invalid_argument("Workflow builder for \"" + name + "\" is empty");
    }
    builders_[name] = std::move(builder);
}

bool WorkflowCatalog::contains(const std::string& name) const {
    return builders_.count(name) > 0;
}

std::vector<std::string> WorkflowCatalog::names() const {
    std::vector<std::string> result;
    for (const auto& entry : builders_) {
        result.push_back(entry.first);
    }
    return result;
}

caf::expected<Workflow> WorkflowCatalog::build(const std::string& name, const WorkflowParams& params) const {
    auto it = builders_.find(name);
    if (it == builders_.end()) {
        return caf::make_error(caf::sec::invalid_argument, "Unknown workflow: " + name);
    }

    try {
        return it->second(params);
    } catch (const WorkflowValidationError& e) {
        return caf::make_error(caf::sec::invalid_argument, std::string("Invalid workflow definition: ") + e.what());
    } catch (const std::invalid_argument& e) {
        return caf::make_error(caf::sec::invalid_argument, std::string(e.what()));
    }
}

Workflow make_check_status_workflow(const WorkflowParams& params) {
    auto report_status = make_operation("report_status", {"project_id"}, [](const ArgumentValues& args) {
        return OperationResult::success(Value::tuple({
            Value::of("running"),
            require_argument(args, "project_id")
        }));
    });

    return Workflow(
        "check_status",
        "1.0",
        "Check Status",
        {
            Step("status", "Report worker status", report_status,
                 {{"project_id", Value::of(params.project_id)}},
                 {"status", "project_id"},
                 {"status"})
        },
        "Reports that the worker can execute workflows");
}

Workflow make_project_inventory_workflow(const WorkflowParams& params) {
    if (params.project_dir.empty()) {
        throw std::invalid_argument("Workflow project_inventory requires a project directory");
    }

    return Workflow(
        "project_inventory",
        "1.0",
        "Project Inventory",
        {
            Step("copy_files", "Copy project files", std::make_shared<CopyProjectFilesOperation>(),
                 {
                     {"source_dir", Value::of(params.project_dir)},
                     {"destination_dir", WorkDirPath({"files"}, true)}
                 },
                 {"file_count"},
                 {"file_count"}),
            Step("list_files", "List local files", std::make_shared<ListLocalFilesOperation>(),
                 {{"directory", WorkDirPath({"files"})}},
                 {"files"},
                 {"files"}),
            Step("files_table", "Format files table", std::make_shared<FilesTableOperation>(),
                 {{"files", StepOutput("list_files", "files")}},
                 {"table"},
                 {"table"}),
            Step("write_manifest", "Write manifest", std::make_shared<WriteJsonFileOperation>(),
                 {
                     {"path", WorkDirPath({"manifest", "files.json"})},
                     {"content", StepOutput("list_files", "files")}
                 },
                 // The path points into the run root, which is removed after the run
                 // unless kept, so it is a return and not an output.
                 {"manifest_path"})
        },
        "Copies the project into the work directory and lists its files with checksums");
}

} // namespace worker
} // namespace stepflow
