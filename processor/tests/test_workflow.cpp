#include <iostream>
#include <cassert>
#include <functional>
#include <sstream>
#include <string>
#include <vector>
#include "stepflow/worker/runner.hpp"
#include "stepflow/worker/workflow.hpp"
#include <nlohmann/json.hpp>

using namespace stepflow::worker;

namespace {

std::shared_ptr<Operation> keyword_op(const std::string& name, std::vector<std::string> params) {
    return make_operation(name, std::move(params), [](const ArgumentValues&) {
        return OperationResult::success(Value());
    });
}

// Returns the validation error raised while building, fails the test if none was raised
WorkflowValidationError expect_invalid(const std::function<void()>& build) {
    try {
        build();
    } catch (const WorkflowValidationError& e) {
        return e;
    }
    assert(false && "expected WorkflowValidationError");
    return WorkflowValidationError("unreachable", "");
}

bool contains(const std::string& text, const std::string& fragment) {
    return text.find(fragment) != std::string::npos;
}

} // namespace

void test_valid_workflow() {
    std::cout << "Testing valid workflow construction..." << std::endl;

    Workflow workflow("wf", "1.0", "Valid", {
        Step("s1", "Produce", keyword_op("produce", {}), {}, {"x", "y"}, {"x"}),
        Step("s2", "Consume", keyword_op("consume", {"a", "b", "dir"}), {
            {"a", StepOutput("s1", "x")},
            {"b", Value::of(5)},
            {"dir", WorkDirPath({"out"}, true)}
        }, {"z"})
    }, "two steps");

    assert(workflow.id() == "wf");
    assert(workflow.version() == "1.0");
    assert(workflow.name() == "Valid");
    assert(workflow.description() == "two steps");
    assert(workflow.steps().size() == 2);
    assert(workflow.find_step("s2") != nullptr);
    assert(workflow.find_step("missing") == nullptr);

    // Declared order is preserved
    assert(workflow.steps()[0].id == "s1");
    assert(workflow.steps()[1].id == "s2");

    std::cout << "✓ Valid workflow test passed" << std::endl;
}

void test_validation_is_repeatable() {
    std::cout << "Testing repeated validation of one definition..." << std::endl;

    auto double_op = make_operation("double", {"n"}, [](const ArgumentValues& args) {
        return OperationResult::success(Value::of(require_argument(args, "n").as_json().get<int>() * 2));
    });
    std::vector<Step> steps = {
        Step("s1", "Seed", make_operation("seed", std::vector<std::string>{}, [](const ArgumentValues&) {
            return OperationResult::success(Value::tuple({Value::of(21), Value::of("label")}));
        }), {}, {"n", "label"}, {"label"}),
        Step("s2", "Double", double_op, {{"n", StepOutput("s1", "n")}}, {"doubled"}, {"doubled"})
    };

    std::vector<Step> copied = steps;
    Workflow first("repeat", "1.0", "Repeat", steps);
    Workflow second("repeat", "1.0", "Repeat", copied);

    assert(first.steps().size() == second.steps().size());
    for (std::size_t i = 0; i < first.steps().size(); ++i) {
        assert(first.steps()[i].id == second.steps()[i].id);
        assert(first.steps()[i].return_names == second.steps()[i].return_names);
    }
    assert(first.steps()[0].id == "s1");
    assert(first.steps()[1].id == "s2");

    // Validation leaves the definition untouched, so it can be built again
    Workflow third("repeat", "1.0", "Repeat", steps);
    assert(third.steps().size() == 2);

    std::ostringstream out;
    std::ostringstream err;
    Observability::Options options;
    options.metrics_enabled = false;
    options.out = &out;
    options.err = &err;
    WorkflowRunner runner(std::make_shared<Observability>("test_workflow", options));

    auto first_feedback = runner.run(first);
    auto second_feedback = runner.run(second);
    assert(!first_feedback.has_error());
    assert(first_feedback.to_json() == second_feedback.to_json());
    assert(first_feedback.outputs.at("s2").at("doubled").as_json() == 42);

    std::cout << "✓ Repeated validation test passed" << std::endl;
}

void test_empty_workflow_rejected() {
    std::cout << "Testing empty workflow rejection..." << std::endl;

    auto error = expect_invalid([] { Workflow("empty", "1.0", "Empty", {}); });
    assert(std::string(error.what()) == "The workflow \"empty\" should contain at least one step.");
    assert(error.workflow_id() == "empty");

    std::cout << "✓ Empty workflow test passed" << std::endl;
}

void test_non_keyword_parameter_rejected() {
    std::cout << "Testing non keyword parameter rejection..." << std::endl;

    OperationSignature signature;
    signature.parameters.push_back(Parameter{"items", ParameterKind::variadic});
    auto op = make_operation("gather", signature, [](const ArgumentValues&) {
        return OperationResult::success(Value());
    });

    auto error = expect_invalid([&] {
        Workflow("wf", "1.0", "Variadic", {Step("s1", "Gather", op, {{"items", Value::of(1)}})});
    });
    assert(contains(error.what(), "has a non keyword parameter \"items\""));
    assert(error.parameter() == "items");

    signature.parameters[0].kind = ParameterKind::positional_only;
    auto positional = make_operation("first", signature, [](const ArgumentValues&) {
        return OperationResult::success(Value());
    });
    expect_invalid([&] {
        Workflow("wf", "1.0", "Positional", {Step("s1", "First", positional, {{"items", Value::of(1)}})});
    });

    std::cout << "✓ Non keyword parameter test passed" << std::endl;
}

void test_missing_argument_rejected() {
    std::cout << "Testing missing argument rejection..." << std::endl;

    auto error = expect_invalid([] {
        Workflow("wf", "1.0", "Missing", {
            Step("s1", "Needs a and b", keyword_op("needs", {"a", "b"}), {{"a", Value::of(1)}})
        });
    });
    assert(contains(error.what(), "has an argument \"b\" that is not available in the step definition "
                                  "\"arguments\", expected one of ['a']."));
    assert(error.step_id() == "s1");
    assert(error.parameter() == "b");

    std::cout << "✓ Missing argument test passed" << std::endl;
}

void test_unknown_argument_rejected() {
    std::cout << "Testing unknown argument rejection..." << std::endl;

    auto error = expect_invalid([] {
        Workflow("wf", "1.0", "Extra", {
            Step("s1", "Only a", keyword_op("only_a", {"a"}), {{"a", Value::of(1)}, {"extra", Value::of(2)}})
        });
    });
    assert(contains(error.what(), "receives a parameter \"extra\" that is not available in the method "
                                  "definition, expected one of ['a']."));

    std::cout << "✓ Unknown argument test passed" << std::endl;
}

void test_forward_and_unknown_references_rejected() {
    std::cout << "Testing step output references..." << std::endl;

    // Reference to a step that does not exist
    auto missing = expect_invalid([] {
        Workflow("wf", "1.0", "Missing step", {
            Step("s1", "Use", keyword_op("use", {"a"}), {{"a", StepOutput("nope", "x")}})
        });
    });
    assert(contains(missing.what(), "requires a non-existing step return value \"nope.x\" for argument \"a\". "
                                    "Previous step with that id does not exist."));

    // Reference to a later step: only earlier steps are visible
    auto forward = expect_invalid([] {
        Workflow("wf", "1.0", "Forward", {
            Step("s1", "Use", keyword_op("use", {"a"}), {{"a", StepOutput("s2", "x")}}),
            Step("s2", "Produce", keyword_op("produce", {}), {}, {"x"})
        });
    });
    assert(contains(forward.what(), "Previous step with that id does not exist."));

    // Self reference
    expect_invalid([] {
        Workflow("wf", "1.0", "Self", {
            Step("s1", "Use", keyword_op("use", {"a"}), {{"a", StepOutput("s1", "x")}}, {"x"})
        });
    });

    // Existing step without that return name
    auto unknown_return = expect_invalid([] {
        Workflow("wf", "1.0", "Unknown return", {
            Step("s1", "Produce", keyword_op("produce", {}), {}, {"x"}),
            Step("s2", "Use", keyword_op("use", {"a"}), {{"a", StepOutput("s1", "y")}})
        });
    });
    assert(contains(unknown_return.what(), "Previous step with that id found, but returns no value with such name."));
    assert(unknown_return.step_id() == "s2");

    std::cout << "✓ Step output references test passed" << std::endl;
}

void test_structural_checks() {
    std::cout << "Testing structural checks..." << std::endl;

    auto duplicate = expect_invalid([] {
        Workflow("wf", "1.0", "Duplicate", {
            Step("s1", "A", keyword_op("a", {})),
            Step("s1", "B", keyword_op("b", {}))
        });
    });
    assert(contains(duplicate.what(), "more than one step with id \"s1\""));

    auto no_operation = expect_invalid([] {
        Workflow("wf", "1.0", "No op", {Step("s1", "Nothing", nullptr)});
    });
    assert(contains(no_operation.what(), "without an operation"));

    auto repeated_return = expect_invalid([] {
        Workflow("wf", "1.0", "Repeated", {Step("s1", "A", keyword_op("a", {}), {}, {"x", "x"})});
    });
    assert(contains(repeated_return.what(), "declares the return name \"x\" more than once"));

    auto bad_output = expect_invalid([] {
        Workflow("wf", "1.0", "Output", {Step("s1", "A", keyword_op("a", {}), {}, {"x"}, {"y"})});
    });
    assert(contains(bad_output.what(), "with output \"y\" that is not one of its return names ['x']"));

    std::cout << "✓ Structural checks test passed" << std::endl;
}

int main() {
    std::cout << "Running workflow validation tests..." << std::endl;
    std::cout << "===========================================" << std::endl;

    try {
        test_valid_workflow();
        test_validation_is_repeatable();
        test_empty_workflow_rejected();
        test_non_keyword_parameter_rejected();
        test_missing_argument_rejected();
        test_unknown_argument_rejected();
        test_forward_and_unknown_references_rejected();
        test_structural_checks();

        std::cout << "\n===========================================" << std::endl;
        std::cout << "✅ All workflow validation tests passed!" << std::endl;
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "\n❌ Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
}
