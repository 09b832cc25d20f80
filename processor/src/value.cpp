#include "stepflow/worker/value.hpp"

#include <exception>

namespace stepflow {
namespace worker {

namespace {

std::string opaque_placeholder(const Value::Opaque& handle) {
    std::string text = handle.type_name;
    if (!handle.repr) {
        return "<non-serializable: " + text + " <non-representable>>";
    }
    try {
        text += " " + handle.repr();
    } catch (const std::exception&) {
        text += " <non-representable>";
    }
    return "<non-serializable: " + text + ">";
}

} // namespace

const nlohmann::json& Value::as_json() const {
    if (const auto* json = std::get_if<nlohmann::json>(&data_)) {
        return *json;
    }
    throw std::runtime_error(is_tuple() ? "Value is a tuple, not a JSON value"
                                        : "Value is an opaque object, not a JSON value");
}

const Value::Tuple& Value::as_tuple() const {
    if (const auto* tuple = std::get_if<Tuple>(&data_)) {
        return *tuple;
    }
    throw std::runtime_error("Value is not a tuple");
}

const Value::Opaque& Value::as_opaque() const {
    if (const auto* handle = std::get_if<Opaque>(&data_)) {
        return *handle;
    }
    throw std::runtime_error("Value is not an opaque object");
}

std::string Value::as_string() const {
    const nlohmann::json& json = as_json();
    if (!json.is_string()) {
        throw std::runtime_error("Expected a string value, got " + std::string(json.type_name()));
    }
    return json.get<std::string>();
}

bool Value::is_sequence() const {
    if (is_tuple()) {
        return true;
    }
    return is_json() && as_json().is_array();
}

std::size_t Value::sequence_size() const {
    if (is_tuple()) {
        return as_tuple().size();
    }
    if (is_json() && as_json().is_array()) {
        return as_json().size();
    }
    return 0;
}

Value Value::sequence_at(std::size_t index) const {
    if (is_tuple()) {
        return as_tuple().at(index);
    }
    return Value(as_json().at(index));
}

nlohmann::json Value::to_json() const {
    if (const auto* json = std::get_if<nlohmann::json>(&data_)) {
        return *json;
    }
    if (const auto* tuple = std::get_if<Tuple>(&data_)) {
        nlohmann::json array = nlohmann::json::array();
        for (const auto& item : *tuple) {
            array.push_back(item.to_json());
        }
        return array;
    }
    return opaque_placeholder(std::get<Opaque>(data_));
}

bool Value::operator==(const Value& other) const {
    if (data_.index() != other.data_.index()) {
        return false;
    }
    if (is_json()) {
        return as_json() == other.as_json();
    }
    if (is_tuple()) {
        return as_tuple() == other.as_tuple();
    }
    return as_opaque().object == other.as_opaque().object;
}

} // namespace worker
} // namespace stepflow
