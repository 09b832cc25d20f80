#pragma once

#include <nlohmann/json.hpp>

#include <functional>
#include <memory>
#include <stdexcept>
#include <string>
#include <typeindex>
#include <typeinfo>
#include <utility>
#include <variant>
#include <vector>

namespace stepflow {
namespace worker {

/**
 * Value passed between steps.
 *
 * Holds one of:
 * - a JSON value (literals, strings, paths, numbers, documents)
 * - a tuple of Values (multi-value operation returns)
 * - an opaque C++ object that has no JSON form
 *
 * Opaque values travel between steps untouched; only to_json() needs a
 * representation, and it falls back to a "<non-serializable: ...>" placeholder.
 */
class Value {
public:
    using Tuple = std::vector<Value>;

    struct Opaque {
        std::shared_ptr<const void> object;
        std::type_index type = typeid(void);
        std::string type_name;
        std::function<std::string()> repr;
    };

    Value() : data_(std::in_place_type<nlohmann::json>) {}
    Value(nlohmann::json json) : data_(std::in_place_type<nlohmann::json>, std::move(json)) {}

    template <typename T>
    static Value of(T&& v) {
        return Value(nlohmann::json(std::forward<T>(v)));
    }

    static Value tuple(Tuple items) {
        Value value;
        value.data_.emplace<Tuple>(std::move(items));
        return value;
    }

    template <typename T>
    static Value opaque(std::shared_ptr<T> object, std::string type_name) {
        Opaque handle;
        handle.type = typeid(T);
        handle.type_name = std::move(type_name);
        handle.object = std::shared_ptr<const void>(std::move(object));
        Value value;
        value.data_.emplace<Opaque>(std::move(handle));
        return value;
    }

    // repr is called with the held object when the value is serialized
    template <typename T, typename Repr>
    static Value opaque(std::shared_ptr<T> object, std::string type_name, Repr repr) {
        const T* raw = object.get();
        Value value = opaque(std::move(object), std::move(type_name));
        std::get<Opaque>(value.data_).repr = [raw, repr]() { return std::string(repr(*raw)); };
        return value;
    }

    bool is_json() const { return std::holds_alternative<nlohmann::json>(data_); }
    bool is_tuple() const { return std::holds_alternative<Tuple>(data_); }
    bool is_opaque() const { return std::holds_alternative<Opaque>(data_); }

    const nlohmann::json& as_json() const;
    const Tuple& as_tuple() const;
    const Opaque& as_opaque() const;

    std::string as_string() const;

    template <typename T>
    std::shared_ptr<const T> as() const {
        const Opaque& handle = as_opaque();
        if (handle.type != std::type_index(typeid(T))) {
            throw std::runtime_error("Opaque value holds \"" + handle.type_name +
                                     "\", requested a different type");
        }
        return std::static_pointer_cast<const T>(handle.object);
    }

    // Number of elements when the value is a tuple or a JSON array
    bool is_sequence() const;
    std::size_t sequence_size() const;
    Value sequence_at(std::size_t index) const;

    nlohmann::json to_json() const;

    bool operator==(const Value& other) const;
    bool operator!=(const Value& other) const { return !(*this == other); }

private:
    std::variant<nlohmann::json, Tuple, Opaque> data_;
};

} // namespace worker
} // namespace stepflow
