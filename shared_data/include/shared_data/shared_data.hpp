#pragma once

#include <utility/traits_and_concepts/optional.hpp>

#include <boost/describe.hpp>
#include <boost/mp11/algorithm.hpp>
#include <nlohmann/json.hpp>

#include <string>
#include <type_traits>

namespace SharedData
{
    /**
     * @brief Serializes any described struct member by member. Empty optionals are left out.
     */
    template <
        typename T,
        class Bases = boost::describe::describe_bases<T, boost::describe::mod_any_access>,
        class Members = boost::describe::describe_members<T, boost::describe::mod_any_access>,
        class Enable = std::enable_if_t<!std::is_union_v<T>>>
    void to_json(nlohmann::json& j, T const& obj)
    {
        j = nlohmann::json::object();

        boost::mp11::mp_for_each<Bases>([&](auto&& base) {
            using type = typename std::decay_t<decltype(base)>::type;
            to_json(j, static_cast<type const&>(obj));
        });
        boost::mp11::mp_for_each<Members>([&](auto&& memAccessor) {
            using memberType = std::decay_t<decltype(obj.*memAccessor.pointer)>;
            if constexpr (Utility::OptionalType<memberType>)
            {
                if (obj.*memAccessor.pointer)
                    j[memAccessor.name] = *(obj.*memAccessor.pointer);
            }
            else
            {
                j[memAccessor.name] = obj.*memAccessor.pointer;
            }
        });
    }
}
