#pragma once

#include "stepflow/worker/core.hpp"
#include "stepflow/worker/value.hpp"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <map>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace stepflow {
namespace worker {

constexpr const char* FEEDBACK_VERSION = "2.0";

struct StepFeedback {
    std::string id;
    std::string name;
    Stage stage = Stage::not_started;
    NamedValues returns;    // empty unless stage == completed
};

/**
 * Structured record of one workflow run.
 *
 * Holds the real return values; to_json() produces the persisted form, where
 * values without a JSON representation become "<non-serializable: ...>".
 */
struct FeedbackDocument {
    std::string feedback_version = FEEDBACK_VERSION;
    std::string workflow_version;
    std::string workflow_id;
    std::string workflow_name;
    std::vector<StepFeedback> steps;
    std::map<std::string, NamedValues> outputs;
    std::optional<std::string> error;
    std::optional<std::vector<std::string>> error_stack;

    bool has_error() const { return error.has_value(); }

    const StepFeedback* find_step(const std::string& step_id) const;

    nlohmann::json to_json() const;
};

// Where the runner delivers the feedback document once a run ends
class FeedbackSink {
public:
    enum class Kind { none, stream, file };

    static FeedbackSink none() { return FeedbackSink(); }
    static FeedbackSink stream(std::ostream& out) {
        FeedbackSink sink;
        sink.kind_ = Kind::stream;
        sink.stream_ = &out;
        return sink;
    }
    static FeedbackSink file(std::filesystem::path path) {
        FeedbackSink sink;
        sink.kind_ = Kind::file;
        sink.path_ = std::move(path);
        return sink;
    }

    Kind kind() const { return kind_; }
    std::ostream* output_stream() const { return stream_; }
    const std::filesystem::path& path() const { return path_; }

private:
    FeedbackSink() = default;

    Kind kind_ = Kind::none;
    std::ostream* stream_ = nullptr;
    std::filesystem::path path_;
};

// Serializes the document (indent 2, keys sorted) into the sink.
// Throws std::runtime_error when the sink cannot be written.
void write_feedback(const FeedbackDocument& feedback, const FeedbackSink& sink);

} // namespace worker
} // namespace stepflow
