#pragma once

#include "reflect.h"

#include <nlohmann/json.hpp>
#include <optional>
#include <stdexcept>
#include <string>
#include <type_traits>

/**
 * Reflection-based JSON serialization for config aggregates.
 *
 * qlibs/reflect supplies member names at compile time, nlohmann/json does the rest.
 * Enums are written by enumerator name. Reading updates an existing object in place, so keys
 * missing from the JSON keep whatever the object already held (usually its defaults).
 *
 * Example:
 *   struct Playfield { double width = 800.0; double height = 450.0; };
 *   auto j = ReflectSerializer::to_json(Playfield{});
 *   Playfield p;
 *   ReflectSerializer::update_from_json(nlohmann::json{ { "width", 640.0 } }, p);
 */
namespace ReflectSerializer {

template <typename T>
struct is_optional : std::false_type {};
template <typename T>
struct is_optional<std::optional<T>> : std::true_type {};
template <typename T>
inline constexpr bool is_optional_v = is_optional<T>::value;

template <typename E>
std::string enumToString(E value)
{
    return std::string(reflect::enum_name(value));
}

template <typename E>
E enumFromString(const std::string& name)
{
    for (const auto& [enumValue, enumName] : reflect::enumerators<E>) {
        if (enumName == name) {
            return static_cast<E>(enumValue);
        }
    }
    throw std::runtime_error("Invalid enum value: " + name);
}

template <typename T>
nlohmann::json to_json(const T& obj)
{
    nlohmann::json j = nlohmann::json::object();

    reflect::for_each(
        [&](auto I) {
            const auto name = std::string(reflect::member_name<I>(obj));
            const auto& value = reflect::get<I>(obj);

            using MemberType = std::remove_cvref_t<decltype(value)>;

            if constexpr (is_optional_v<MemberType>) {
                // Only include optional fields if they have a value.
                if (value.has_value()) {
                    using InnerType = typename MemberType::value_type;
                    if constexpr (std::is_enum_v<InnerType>) {
                        j[name] = enumToString(*value);
                    }
                    else {
                        j[name] = *value;
                    }
                }
            }
            else if constexpr (std::is_enum_v<MemberType>) {
                j[name] = enumToString(value);
            }
            else {
                j[name] = value;
            }
        },
        obj);

    return j;
}

template <typename T>
void update_from_json(const nlohmann::json& j, T& obj)
{
    if (!j.is_object()) {
        throw std::runtime_error("Expected JSON object, got " + std::string(j.type_name()));
    }

    reflect::for_each(
        [&](auto I) {
            const auto name = std::string(reflect::member_name<I>(obj));
            if (!j.contains(name)) {
                return;
            }
            const auto& field = j.at(name);

            using MemberType = std::remove_reference_t<decltype(reflect::get<I>(obj))>;

            if constexpr (is_optional_v<MemberType>) {
                using InnerType = typename MemberType::value_type;
                if (field.is_null()) {
                    reflect::get<I>(obj) = std::nullopt;
                }
                else if constexpr (std::is_enum_v<InnerType>) {
                    reflect::get<I>(obj) = enumFromString<InnerType>(field.get<std::string>());
                }
                else {
                    reflect::get<I>(obj) = field.get<InnerType>();
                }
            }
            else if constexpr (std::is_enum_v<MemberType>) {
                reflect::get<I>(obj) = enumFromString<MemberType>(field.get<std::string>());
            }
            else {
                // get_to hands the existing member to nested from_json, keeping its defaults.
                field.get_to(reflect::get<I>(obj));
            }
        },
        obj);
}

template <typename T>
T from_json(const nlohmann::json& j)
{
    T obj{};
    update_from_json(j, obj);
    return obj;
}

} // namespace ReflectSerializer
