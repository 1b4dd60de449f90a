#pragma once

#include <nlohmann/json.hpp>

#include <filesystem>
#include <optional>
#include <type_traits>

namespace Persistence::Detail
{
    template <typename T>
    struct FromJsonUnwrapped
    {
        static void fromJson(nlohmann::json const& json, T& value, char const* name)
        {
            if (auto it = json.find(name); it != json.end() && !it->is_null())
                value = it->get<typename T::value_type>();
            else
                value = std::nullopt;
        }
    };

    template <typename T>
    struct ToJsonUnwrapped
    {
        static void toJson(nlohmann::json& json, T const& value, char const* name)
        {
            if (value)
                json[name] = *value;
        }
    };

    // Paths are stored as their generic string form.
    template <>
    struct FromJsonUnwrapped<std::optional<std::filesystem::path>>
    {
        static void fromJson(nlohmann::json const& json, std::optional<std::filesystem::path>& value, char const* name)
        {
            if (auto it = json.find(name); it != json.end() && !it->is_null())
                value = std::filesystem::path{it->get<std::string>()};
            else
                value = std::nullopt;
        }
    };

    template <>
    struct ToJsonUnwrapped<std::optional<std::filesystem::path>>
    {
        static void toJson(nlohmann::json& json, std::optional<std::filesystem::path> const& value, char const* name)
        {
            if (value)
                json[name] = value->generic_string();
        }
    };
}

#define TO_JSON_OPTIONAL_RENAME(JSON, CLASS, MEMBER, JSON_NAME) \
    ::Persistence::Detail::ToJsonUnwrapped<std::decay_t<decltype(CLASS.MEMBER)>>::toJson(JSON, CLASS.MEMBER, JSON_NAME)

#define TO_JSON_OPTIONAL(JSON, CLASS, MEMBER) TO_JSON_OPTIONAL_RENAME(JSON, CLASS, MEMBER, #MEMBER)

#define FROM_JSON_OPTIONAL_RENAME(JSON, CLASS, MEMBER, JSON_NAME) \
    ::Persistence::Detail::FromJsonUnwrapped<std::decay_t<decltype(CLASS.MEMBER)>>::fromJson( \
        JSON, CLASS.MEMBER, JSON_NAME)

#define FROM_JSON_OPTIONAL(JSON, CLASS, MEMBER) FROM_JSON_OPTIONAL_RENAME(JSON, CLASS, MEMBER, #MEMBER)
