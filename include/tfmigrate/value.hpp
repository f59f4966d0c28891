#pragma once

/**
 * @file value.hpp
 * @brief Attribute value model shared by the configuration and state representations
 *
 * A Value is a closed sum type: null, boolean, number, string, list, object,
 * or an unresolved expression kept as raw text. Classification and merge code
 * works only on this model, never on a specific tree representation.
 */

#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

#include <nlohmann/json.hpp>

namespace tfmigrate {

struct Null
{
    bool operator==(const Null&) const = default;
};

/**
 * @brief Expression text that is not a pure literal (reference, call, template, ...)
 */
struct Expression
{
    std::string text;

    bool operator==(const Expression&) const = default;
};

struct Value;
struct Member;

using List = std::vector<Value>;
using Object = std::vector<Member>;  ///< Insertion-ordered key/value pairs

struct Value
{
    using Storage = std::variant<Null, bool, double, std::string, Expression, List, Object>;

    Storage data;

    Value() = default;
    Value(bool v) : data(std::in_place_type<bool>, v) {}
    Value(double v) : data(std::in_place_type<double>, v) {}
    Value(int v) : data(std::in_place_type<double>, static_cast<double>(v)) {}
    Value(std::string v) : data(std::in_place_type<std::string>, std::move(v)) {}
    Value(const char* v) : data(std::in_place_type<std::string>, v) {}
    Value(Expression v) : data(std::in_place_type<Expression>, std::move(v)) {}
    Value(List v) : data(std::in_place_type<List>, std::move(v)) {}
    Value(Object v);  // defined where Member is complete

    [[nodiscard]] bool is_null() const noexcept { return std::holds_alternative<Null>(data); }

    [[nodiscard]] const bool* as_bool() const noexcept { return std::get_if<bool>(&data); }
    [[nodiscard]] const double* as_number() const noexcept { return std::get_if<double>(&data); }
    [[nodiscard]] const std::string* as_string() const noexcept
    {
        return std::get_if<std::string>(&data);
    }
    [[nodiscard]] const Expression* as_expression() const noexcept
    {
        return std::get_if<Expression>(&data);
    }
    [[nodiscard]] const List* as_list() const noexcept { return std::get_if<List>(&data); }
    [[nodiscard]] const Object* as_object() const noexcept { return std::get_if<Object>(&data); }

    friend bool operator==(const Value& lhs, const Value& rhs);
};

struct Member
{
    std::string key;
    Value value;

    friend bool operator==(const Member& lhs, const Member& rhs);
};

/// Flat attribute view of one resource, keyed by attribute name
using AttributeMap = std::map<std::string, Value, std::less<>>;

/**
 * Look up an attribute; nullptr when absent
 */
[[nodiscard]] const Value* find_attribute(const AttributeMap& attributes, std::string_view name);

/**
 * True when the attribute exists and is not null
 */
[[nodiscard]] bool is_present(const AttributeMap& attributes, std::string_view name);

/**
 * Literal string value of an attribute, if it has one
 */
[[nodiscard]] std::optional<std::string> string_attribute(const AttributeMap& attributes,
                                                          std::string_view name);

/**
 * Look up an object member; nullptr when absent
 */
[[nodiscard]] const Value* find_member(const Object& object, std::string_view key);

// ============================================================================
// JSON conversion (state documents)
// ============================================================================

/**
 * Convert a JSON value. Numbers become doubles; nothing maps to Expression.
 */
[[nodiscard]] Value from_json(const nlohmann::ordered_json& json);

/**
 * Convert to JSON. Integral numbers are emitted as integers and expressions
 * as their raw text.
 */
[[nodiscard]] nlohmann::ordered_json to_json(const Value& value);

/**
 * Build the flat attribute view of a JSON object (empty for non-objects)
 */
[[nodiscard]] AttributeMap attributes_from_json(const nlohmann::ordered_json& json);

}  // namespace tfmigrate
