#include <evs/response_parser.hpp>

#include <utility/algorithm/trim.hpp>
#include <log/log.hpp>

#include <charconv>

namespace Evs
{
    std::vector<std::string_view> extractTags(std::string_view raw)
    {
        std::vector<std::string_view> tags{};
        std::size_t position = 0;
        while (true)
        {
            const auto open = raw.find('<', position);
            if (open == std::string_view::npos)
                break;

            const auto close = raw.find('>', open + 1);
            if (close == std::string_view::npos)
                break;

            // "<>" is not a tag, the next '<' may still start one.
            if (close == open + 1)
            {
                position = open + 1;
                continue;
            }

            tags.push_back(raw.substr(open, close - open + 1));
            position = close + 1;
        }
        return tags;
    }

    namespace
    {
        std::vector<std::string> splitColumns(std::string_view line)
        {
            std::vector<std::string> columns{};
            std::size_t start = 0;
            while (start <= line.size())
            {
                const auto delimiter = line.find_first_of("[]", start);
                const auto end = delimiter == std::string_view::npos ? line.size() : delimiter;
                const auto column = Utility::Algorithm::trim(line.substr(start, end - start));
                if (!column.empty())
                    columns.emplace_back(column);
                if (delimiter == std::string_view::npos)
                    break;
                start = delimiter + 1;
            }
            return columns;
        }

        std::optional<std::uint64_t> parseSize(std::string const& column)
        {
            std::uint64_t size = 0;
            const auto* end = column.data() + column.size();
            const auto [ptr, ec] = std::from_chars(column.data(), end, size);
            if (ec != std::errc{} || ptr != end)
                return std::nullopt;
            return size;
        }
    }

    std::vector<SharedData::RemoteEntry> parseListing(std::string_view raw)
    {
        std::vector<SharedData::RemoteEntry> entries{};

        std::size_t lineStart = 0;
        while (lineStart < raw.size())
        {
            auto lineEnd = raw.find('\n', lineStart);
            if (lineEnd == std::string_view::npos)
                lineEnd = raw.size();
            auto line = raw.substr(lineStart, lineEnd - lineStart);
            lineStart = lineEnd + 1;

            if (!line.empty() && line.back() == '\r')
                line.remove_suffix(1);
            if (!line.starts_with('['))
                continue;

            auto columns = splitColumns(line);
            if (columns.size() < 2)
            {
                Log::debug("Listing row without size and name skipped: '{}'", line);
                continue;
            }

            const auto sizeColumn = columns.size() == 2 ? 0 : 1;
            const auto size = parseSize(columns[sizeColumn]);
            if (!size)
            {
                Log::debug("Listing row with non numeric size skipped: '{}'", line);
                continue;
            }

            entries.push_back(SharedData::RemoteEntry{
                .size = *size,
                .name = columns.back(),
                .columns = std::move(columns),
            });
        }
        return entries;
    }
}
