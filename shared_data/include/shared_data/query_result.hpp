#pragma once

#include <shared_data/shared_data.hpp>

#include <cstdint>

namespace SharedData
{
    struct QueryResult
    {
        static constexpr std::int64_t unknownSize = -1;

        std::int64_t size{unknownSize};

        bool known() const
        {
            return size != unknownSize;
        }
    };
    BOOST_DESCRIBE_STRUCT(QueryResult, (), (size))
}
