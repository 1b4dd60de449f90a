#pragma once

#include <utility/describe.hpp>

#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

namespace Utility
{
    template <typename EnumType>
    std::string enumToString(EnumType const& enumValue)
    {
        char const* result = nullptr;
        boost::mp11::mp_for_each<boost::describe::describe_enumerators<EnumType>>([&result, &enumValue](auto desc) {
            if (enumValue == desc.value)
                result = desc.name;
        });

        if (result == nullptr)
            throw std::invalid_argument("Invalid enum value");
        return result;
    }

    template <typename EnumType>
    std::optional<EnumType> tryEnumFromString(std::string_view str)
    {
        std::optional<EnumType> enumValue{};
        boost::mp11::mp_for_each<boost::describe::describe_enumerators<EnumType>>([&enumValue, &str](auto desc) {
            if (str == desc.name)
                enumValue = desc.value;
        });
        return enumValue;
    }

    template <typename EnumType>
    EnumType enumFromString(std::string_view str)
    {
        const auto enumValue = tryEnumFromString<EnumType>(str);
        if (!enumValue)
            throw std::invalid_argument("Invalid enum string: " + std::string{str});
        return *enumValue;
    }
}
