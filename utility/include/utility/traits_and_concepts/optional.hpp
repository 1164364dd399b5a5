#pragma once

#include <optional>
#include <type_traits>

namespace Utility
{
    template <typename T>
    struct IsOptional : std::false_type
    {};

    template <typename T>
    struct IsOptional<std::optional<T>> : std::true_type
    {};

    /// Matches std::optional of anything, also when cv or reference qualified.
    template <typename T>
    concept OptionalType = IsOptional<std::remove_cvref_t<T>>::value;
}
