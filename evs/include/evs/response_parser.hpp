#pragma once

#include <shared_data/remote_entry.hpp>

#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace Evs
{
    /**
     * @brief A tag found in a status reply, with its attributes.
     */
    struct StatusElement
    {
        std::string name{};
        std::map<std::string, std::string> attributes{};

        /**
         * @brief Returns the attribute value or std::nullopt if the element does not carry it.
         */
        std::optional<std::string> attribute(std::string const& key) const;
    };

    /**
     * @brief The tags of a status reply, as direct children of a synthetic root element.
     */
    class StatusTree
    {
      public:
        explicit StatusTree(std::vector<StatusElement> elements);

        /**
         * @brief Returns the first element with the given tag name.
         */
        std::optional<StatusElement> find(std::string_view name) const;

        std::vector<StatusElement> const& elements() const;

      private:
        std::vector<StatusElement> elements_;
    };

    /**
     * @brief Extracts every tag-like substring ("<...>") from free text, in order of appearance.
     */
    std::vector<std::string_view> extractTags(std::string_view raw);

    /**
     * @brief Parses the tags found in a status reply.
     *
     * All tags are concatenated below one synthetic root element and read as a XML document.
     *
     * @param raw The complete output of the tool, stdout followed by stderr.
     * @return std::nullopt if there are no tags at all or they do not form a well-formed document.
     */
    std::optional<StatusTree> parseStatusTree(std::string_view raw);

    /**
     * @brief Parses the data rows of a directory listing.
     *
     * Only lines starting with '[' are rows. A row is split at '[' and ']', columns are trimmed and empty columns
     * are dropped. The name is the last column, the size the second one (the first one if the row has only two).
     * All other lines are progress or log output and are skipped.
     */
    std::vector<SharedData::RemoteEntry> parseListing(std::string_view raw);
}
