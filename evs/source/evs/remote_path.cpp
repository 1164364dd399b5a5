#include <evs/remote_path.hpp>

#include <utility/algorithm/trim.hpp>

#include <optional>

namespace Evs
{
    namespace
    {
        std::optional<int> hexValue(char c)
        {
            if (c >= '0' && c <= '9')
                return c - '0';
            if (c >= 'a' && c <= 'f')
                return c - 'a' + 10;
            if (c >= 'A' && c <= 'F')
                return c - 'A' + 10;
            return std::nullopt;
        }
    }

    std::string percentDecode(std::string_view encoded)
    {
        std::string decoded;
        decoded.reserve(encoded.size());
        for (std::size_t i = 0; i < encoded.size(); ++i)
        {
            if (encoded[i] == '%' && i + 2 < encoded.size())
            {
                const auto high = hexValue(encoded[i + 1]);
                const auto low = hexValue(encoded[i + 2]);
                if (high && low)
                {
                    decoded.push_back(static_cast<char>(*high * 16 + *low));
                    i += 2;
                    continue;
                }
            }
            decoded.push_back(encoded[i]);
        }
        return decoded;
    }

    std::string remoteRootFromUrl(std::string_view url)
    {
        auto path = url;
        if (const auto schemeEnd = path.find("://"); schemeEnd != std::string_view::npos)
        {
            path.remove_prefix(schemeEnd + 3);
            const auto authorityEnd = path.find('/');
            if (authorityEnd == std::string_view::npos)
                path = {};
            else
                path.remove_prefix(authorityEnd);
        }

        if (path.starts_with('/'))
            path.remove_prefix(1);
        path = Utility::Algorithm::trimRight(path);

        return percentDecode(path);
    }

    std::string joinRemotePath(std::string_view directory, std::string_view name)
    {
        if (name.starts_with('/') || directory.empty())
            return std::string{name};
        if (directory.ends_with('/'))
            return std::string{directory} + std::string{name};
        return std::string{directory} + "/" + std::string{name};
    }
}
