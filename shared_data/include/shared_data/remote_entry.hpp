#pragma once

#include <shared_data/shared_data.hpp>

#include <cstdint>
#include <string>
#include <vector>

namespace SharedData
{
    /**
     * @brief One data row of a remote directory listing.
     */
    struct RemoteEntry
    {
        std::uint64_t size{0};
        std::string name{};
        // All non-empty columns of the row, in order. The size and name are taken from these.
        std::vector<std::string> columns{};

        friend bool operator==(RemoteEntry const& lhs, RemoteEntry const& rhs)
        {
            return lhs.size == rhs.size && lhs.name == rhs.name;
        }
    };
    BOOST_DESCRIBE_STRUCT(RemoteEntry, (), (size, name, columns))
}
