/**
 * @file value.cpp
 * @brief Attribute value model and JSON conversion
 */

#include "tfmigrate/value.hpp"

#include <cmath>
#include <cstdint>
#include <limits>
#include <string>

namespace tfmigrate {

Value::Value(Object v)
    : data(std::in_place_type<Object>, std::move(v))
{}

bool operator==(const Value& lhs, const Value& rhs)
{
    return lhs.data == rhs.data;
}

bool operator==(const Member& lhs, const Member& rhs)
{
    return lhs.key == rhs.key && lhs.value == rhs.value;
}

const Value* find_attribute(const AttributeMap& attributes, std::string_view name)
{
    auto it = attributes.find(name);
    if (it == attributes.end()) {
        return nullptr;
    }
    return &it->second;
}

bool is_present(const AttributeMap& attributes, std::string_view name)
{
    const Value* value = find_attribute(attributes, name);
    return value != nullptr && !value->is_null();
}

std::optional<std::string> string_attribute(const AttributeMap& attributes, std::string_view name)
{
    const Value* value = find_attribute(attributes, name);
    if (value == nullptr) {
        return std::nullopt;
    }
    if (const auto* text = value->as_string()) {
        return *text;
    }
    return std::nullopt;
}

const Value* find_member(const Object& object, std::string_view key)
{
    for (const auto& member : object) {
        if (member.key == key) {
            return &member.value;
        }
    }
    return nullptr;
}

Value from_json(const nlohmann::ordered_json& json)
{
    switch (json.type()) {
        case nlohmann::ordered_json::value_t::boolean:
            return Value(json.get<bool>());
        case nlohmann::ordered_json::value_t::number_integer:
        case nlohmann::ordered_json::value_t::number_unsigned:
        case nlohmann::ordered_json::value_t::number_float:
            return Value(json.get<double>());
        case nlohmann::ordered_json::value_t::string:
            return Value(json.get<std::string>());
        case nlohmann::ordered_json::value_t::array: {
            List items;
            items.reserve(json.size());
            for (const auto& item : json) {
                items.push_back(from_json(item));
            }
            return Value(std::move(items));
        }
        case nlohmann::ordered_json::value_t::object: {
            Object members;
            members.reserve(json.size());
            for (const auto& [key, item] : json.items()) {
                members.push_back(Member{.key = key, .value = from_json(item)});
            }
            return Value(std::move(members));
        }
        default:
            return Value{};
    }
}

namespace {

[[nodiscard]] nlohmann::ordered_json number_to_json(double number)
{
    constexpr double kMaxExact = 9007199254740992.0;  // 2^53
    if (std::isfinite(number) && std::trunc(number) == number && std::fabs(number) <= kMaxExact) {
        return static_cast<std::int64_t>(number);
    }
    return number;
}

struct JsonVisitor
{
    nlohmann::ordered_json operator()(const Null&) const { return nullptr; }
    nlohmann::ordered_json operator()(bool v) const { return v; }
    nlohmann::ordered_json operator()(double v) const { return number_to_json(v); }
    nlohmann::ordered_json operator()(const std::string& v) const { return v; }
    nlohmann::ordered_json operator()(const Expression& v) const { return v.text; }

    nlohmann::ordered_json operator()(const List& v) const
    {
        nlohmann::ordered_json array = nlohmann::ordered_json::array();
        for (const auto& item : v) {
            array.push_back(to_json(item));
        }
        return array;
    }

    nlohmann::ordered_json operator()(const Object& v) const
    {
        nlohmann::ordered_json object = nlohmann::ordered_json::object();
        for (const auto& member : v) {
            object[member.key] = to_json(member.value);
        }
        return object;
    }
};

}  // namespace

nlohmann::ordered_json to_json(const Value& value)
{
    return std::visit(JsonVisitor{}, value.data);
}

AttributeMap attributes_from_json(const nlohmann::ordered_json& json)
{
    AttributeMap attributes;
    if (!json.is_object()) {
        return attributes;
    }
    for (const auto& [key, item] : json.items()) {
        attributes.emplace(key, from_json(item));
    }
    return attributes;
}

}  // namespace tfmigrate
