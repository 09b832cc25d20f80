#include "stepflow/worker/feedback.hpp"

#include <fstream>
#include <stdexcept>

namespace stepflow {
namespace worker {

using json = nlohmann::json;

namespace {

json named_values_to_json(const NamedValues& values) {
    json object = json::object();
    for (const auto& [name, value] : values) {
        object[name] = value.to_json();
    }
    return object;
}

std::string dump_document(const json& document) {
    // std::map backed objects keep keys sorted
    return document.dump(2, ' ', false, json::error_handler_t::replace);
}

} // namespace

const StepFeedback* FeedbackDocument::find_step(const std::string& step_id) const {
    for (const auto& step : steps) {
        if (step.id == step_id) {
            return &step;
        }
    }
    return nullptr;
}

json FeedbackDocument::to_json() const {
    json document;
    document["feedback_version"] = feedback_version;
    document["workflow_version"] = workflow_version;
    document["workflow_id"] = workflow_id;
    document["workflow_name"] = workflow_name;

    document["steps"] = json::array();
    for (const auto& step : steps) {
        document["steps"].push_back({
            {"id", step.id},
            {"name", step.name},
            {"stage", static_cast<int>(step.stage)},
            {"returns", named_values_to_json(step.returns)}
        });
    }

    document["outputs"] = json::object();
    for (const auto& [step_id, values] : outputs) {
        document["outputs"][step_id] = named_values_to_json(values);
    }

    if (error) {
        document["error"] = *error;
    }
    if (error_stack) {
        document["error_stack"] = *error_stack;
    }

    return document;
}

void write_feedback(const FeedbackDocument& feedback, const FeedbackSink& sink) {
    switch (sink.kind()) {
        case FeedbackSink::Kind::none:
            return;

        case FeedbackSink::Kind::stream: {
            std::ostream& out = *sink.output_stream();
            out << dump_document(feedback.to_json()) << std::endl;
            if (!out) {
                throw std::runtime_error("Failed to write feedback to stream");
            }
            return;
        }

        case FeedbackSink::Kind::file: {
            std::ofstream file(sink.path(), std::ios::trunc);
            if (!file.is_open()) {
                throw std::runtime_error("Failed to open feedback file for writing: " + sink.path().string());
            }
            file << dump_document(feedback.to_json()) << '\n';
            if (!file) {
                throw std::runtime_error("Failed to write feedback file: " + sink.path().string());
            }
            return;
        }
    }
}

} // namespace worker
} // namespace stepflow
