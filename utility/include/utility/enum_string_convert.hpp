#pragma once

#include <boost/describe/enumerators.hpp>
#include <boost/mp11/algorithm.hpp>

#include <string>
#include <stdexcept>

namespace Utility
{
    /**
     * @brief Returns the name of an enumerator of a described enum.
     *
     * @throws std::invalid_argument if the value is not an enumerator.
     */
    template <typename EnumType>
    std::string enumToString(EnumType const& enumValue)
    {
        char const* result = nullptr;
        boost::mp11::mp_for_each<boost::describe::describe_enumerators<EnumType>>([&result, &enumValue](auto desc) {
            if (enumValue == desc.value)
                result = desc.name;
        });

        if (result == nullptr)
            throw std::invalid_argument("Invalid enum value " + std::to_string(static_cast<long long>(enumValue)));
        return result;
    }
}
