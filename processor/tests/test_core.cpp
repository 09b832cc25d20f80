#include <iostream>
#include <cassert>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>
#include <vector>
#include "stepflow/worker/core.hpp"
#include "stepflow/worker/operation.hpp"
#include "stepflow/worker/references.hpp"
#include "stepflow/worker/step.hpp"
#include "stepflow/worker/value.hpp"
#include "stepflow/worker/work_dir.hpp"

using namespace stepflow::worker;
using json = nlohmann::json;

namespace {

struct Connection {
    std::string host;
    int port = 0;
};

} // namespace

void test_value_json() {
    std::cout << "Testing Value JSON alternative..." << std::endl;

    Value number = Value::of(42);
    Value text = Value::of("hello");
    Value object(json{{"a", 1}, {"b", {1, 2, 3}}});

    assert(number.is_json());
    assert(number.as_json() == 42);
    assert(text.as_string() == "hello");
    assert(object.to_json()["b"].size() == 3);
    assert(Value().as_json().is_null());
    assert(Value::of(42) == number);
    assert(Value::of(43) != number);

    bool threw = false;
    try {
        number.as_string();
    } catch (const std::runtime_error&) {
        threw = true;
    }
    assert(threw);

    std::cout << "✓ Value JSON test passed" << std::endl;
}

void test_value_tuple() {
    std::cout << "Testing Value tuple alternative..." << std::endl;

    Value tuple = Value::tuple({Value::of(1), Value::of("two"), Value()});
    assert(tuple.is_tuple());
    assert(tuple.is_sequence());
    assert(tuple.sequence_size() == 3);
    assert(tuple.sequence_at(1).as_string() == "two");
    assert(tuple.to_json() == json::array({1, "two", nullptr}));

    Value array(json::array({"x", "y"}));
    assert(!array.is_tuple());
    assert(array.is_sequence());
    assert(array.sequence_size() == 2);
    assert(array.sequence_at(0).as_string() == "x");

    assert(!Value::of("xy").is_sequence());
    assert(!Value(json{{"k", 1}}).is_sequence());

    std::cout << "✓ Value tuple test passed" << std::endl;
}

void test_value_opaque() {
    std::cout << "Testing Value opaque alternative..." << std::endl;

    auto connection = std::make_shared<Connection>(Connection{"db.local", 5432});
    Value plain = Value::opaque(connection, "Connection");
    Value described = Value::opaque(connection, "Connection", [](const Connection& c) {
        return c.host + ":" + std::to_string(c.port);
    });

    assert(plain.is_opaque());
    assert(plain.to_json() == "<non-serializable: Connection <non-representable>>");
    assert(described.to_json() == "<non-serializable: Connection db.local:5432>");

    auto held = described.as<Connection>();
    assert(held->port == 5432);
    assert(held.get() == connection.get());

    bool threw = false;
    try {
        described.as<std::string>();
    } catch (const std::runtime_error&) {
        threw = true;
    }
    assert(threw);

    // Broken repr still produces a placeholder
    Value broken = Value::opaque(connection, "Connection", [](const Connection&) -> std::string {
        throw std::runtime_error("no repr");
    });
    assert(broken.to_json() == "<non-serializable: Connection <non-representable>>");

    // Nested inside a tuple
    Value tuple = Value::tuple({Value::of(1), described});
    assert(tuple.to_json()[1] == "<non-serializable: Connection db.local:5432>");

    std::cout << "✓ Value opaque test passed" << std::endl;
}

void test_step_output_equality() {
    std::cout << "Testing StepOutput equality..." << std::endl;

    assert(StepOutput("s1", "x") == StepOutput("s1", "x"));
    assert(!(StepOutput("s1", "x") == StepOutput("s1", "y")));
    assert(!(StepOutput("s1", "x") == StepOutput("s2", "x")));

    std::cout << "✓ StepOutput equality test passed" << std::endl;
}

void test_work_dir_path_rejects_escaping_parts() {
    std::cout << "Testing WorkDirPath part validation..." << std::endl;

    const std::vector<std::vector<std::string>> invalid = {
        {},
        {""},
        {"/etc"},
        {"a", ".."},
        {"a/../../b"}
    };

    for (const auto& parts : invalid) {
        bool threw = false;
        try {
            WorkDirPath path(parts);
        } catch (const std::invalid_argument&) {
            threw = true;
        }
        assert(threw);
    }

    WorkDirPath nested({"a", "b/c"});
    assert(nested.parts().size() == 2);
    assert(!nested.mkdir());

    std::cout << "✓ WorkDirPath part validation test passed" << std::endl;
}

void test_work_dir_path_eval() {
    std::cout << "Testing WorkDirPath::eval..." << std::endl;

    auto root = TemporaryDirectory::create();

    WorkDirPath plain({"x", "y.txt"});
    auto plain_path = plain.eval(root.path());
    assert(plain_path == root.path() / "x" / "y.txt");
    assert(!std::filesystem::exists(plain_path));

    WorkDirPath dir({"out", "nested"}, true);
    auto dir_path = dir.eval(root.path());
    assert(std::filesystem::is_directory(dir_path));

    // Idempotent: existing content survives a second evaluation
    {
        std::ofstream file(dir_path / "keep.txt");
        file << "data";
    }
    assert(dir.eval(root.path()) == dir_path);
    assert(std::filesystem::exists(dir_path / "keep.txt"));

    std::cout << "✓ WorkDirPath::eval test passed" << std::endl;
}

void test_temporary_directory_lifecycle() {
    std::cout << "Testing TemporaryDirectory lifecycle..." << std::endl;

    std::filesystem::path removed_path;
    {
        auto dir = TemporaryDirectory::create();
        removed_path = dir.path();
        assert(std::filesystem::is_directory(removed_path));
        assert(removed_path.filename().string().rfind("stepflow-", 0) == 0);
    }
    assert(!std::filesystem::exists(removed_path));

    std::filesystem::path kept_path;
    {
        auto dir = TemporaryDirectory::create();
        dir.keep();
        kept_path = dir.path();
    }
    assert(std::filesystem::is_directory(kept_path));
    std::filesystem::remove_all(kept_path);

    auto first = TemporaryDirectory::create();
    auto second = TemporaryDirectory::create();
    assert(first.path() != second.path());

    std::error_code ec;
    auto explicit_path = first.path();
    assert(first.remove(ec));
    assert(!ec);
    assert(!std::filesystem::exists(explicit_path));

    std::cout << "✓ TemporaryDirectory lifecycle test passed" << std::endl;
}

void test_operation_metrics() {
    std::cout << "Testing operation metrics..." << std::endl;

    auto op = make_operation("divide", {"a", "b"}, [](const ArgumentValues& args) {
        int b = require_argument(args, "b").as_json().get<int>();
        if (b == 0) {
            return OperationResult::error_result(ErrorCode::invalid_input, "division by zero");
        }
        return OperationResult::success(Value::of(require_argument(args, "a").as_json().get<int>() / b));
    });

    assert(op->name() == "divide");
    assert((op->signature().parameter_names() == std::vector<std::string>{"a", "b"}));

    auto ok = op->invoke({{"a", Value::of(6)}, {"b", Value::of(3)}});
    assert(ok.is_success());
    assert(ok.value.as_json() == 2);

    auto failed = op->invoke({{"a", Value::of(6)}, {"b", Value::of(0)}});
    assert(failed.is_error());
    assert(failed.error_code == ErrorCode::invalid_input);

    bool threw = false;
    try {
        op->invoke({{"a", Value::of(6)}});
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);

    auto snapshot = op->metrics();
    assert(snapshot.success_count == 1);
    assert(snapshot.error_count == 2);

    std::cout << "✓ Operation metrics test passed" << std::endl;
}

void test_make_operation_requires_callable() {
    std::cout << "Testing make_operation without callable..." << std::endl;

    bool threw = false;
    try {
        make_operation("empty", {"a"}, FunctionOperation::Function());
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);

    std::cout << "✓ make_operation callable test passed" << std::endl;
}

void test_step_accessors() {
    std::cout << "Testing Step accessors..." << std::endl;

    auto op = make_operation("echo", {"value"}, [](const ArgumentValues& args) {
        return OperationResult::success(require_argument(args, "value"));
    });

    Step step("s1", "Echo", op, {{"value", Value::of(1)}}, {"a", "b"}, {"a"});
    assert(step.operation_name() == "echo");
    assert((step.parameter_names() == std::vector<std::string>{"value"}));
    assert(step.return_arity() == 2);

    Step empty("s2", "No op", nullptr);
    assert(empty.operation_name() == "<none>");
    assert(empty.parameter_names().empty());
    assert(empty.return_arity() == 0);

    std::cout << "✓ Step accessors test passed" << std::endl;
}

void test_error_codes_and_stages() {
    std::cout << "Testing error code and stage strings..." << std::endl;

    assert(error_code_to_string(ErrorCode::return_arity_mismatch) == "RETURN_ARITY_MISMATCH");
    assert(error_code_to_string(ErrorCode::execution_failed) == "EXECUTION_FAILED");
    assert(static_cast<int>(ErrorCode::argument_resolution_failed) == 2005);

    assert(stage_to_string(Stage::not_started) == "not_started");
    assert(stage_to_string(Stage::completed) == "completed");
    assert(static_cast<int>(Stage::running) == 1);

    std::string id = generate_hex_id(8);
    assert(id.size() == 16);
    assert(id.find_first_not_of("0123456789abcdef") == std::string::npos);
    assert(generate_hex_id() != generate_hex_id());

    std::cout << "✓ Error code and stage strings test passed" << std::endl;
}

void test_step_outcome_factories() {
    std::cout << "Testing StepOutcome factories..." << std::endl;

    auto ok = StepOutcome::success({{"x", Value::of(1)}}, 12);
    assert(ok.is_success());
    assert(ok.returns.at("x").as_json() == 1);
    assert(ok.latency_ms == 12);

    auto failed = StepOutcome::error_result(ErrorCode::execution_failed, "boom", {"frame"});
    assert(failed.is_error());
    assert(failed.error_message == "boom");
    assert(failed.error_stack.size() == 1);
    assert(failed.returns.empty());

    std::cout << "✓ StepOutcome factories test passed" << std::endl;
}

int main() {
    std::cout << "Running core tests..." << std::endl;
    std::cout << "===========================================" << std::endl;

    try {
        std::cout << "\n[Value Tests]" << std::endl;
        test_value_json();
        test_value_tuple();
        test_value_opaque();

        std::cout << "\n[Reference Tests]" << std::endl;
        test_step_output_equality();
        test_work_dir_path_rejects_escaping_parts();
        test_work_dir_path_eval();
        test_temporary_directory_lifecycle();

        std::cout << "\n[Operation Tests]" << std::endl;
        test_operation_metrics();
        test_make_operation_requires_callable();
        test_step_accessors();

        std::cout << "\n[Result Type Tests]" << std::endl;
        test_error_codes_and_stages();
        test_step_outcome_factories();

        std::cout << "\n===========================================" << std::endl;
        std::cout << "✅ All core tests passed!" << std::endl;
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "\n❌ Test failed with exception: " << e.what() << std::endl;
        return 1;
    } catch (...) {
        std::cerr << "\n❌ Test failed with unknown exception" << std::endl;
        return 1;
    }
}
