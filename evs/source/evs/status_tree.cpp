#include <evs/response_parser.hpp>

#include <log/log.hpp>

#include <libxml/parser.h>
#include <libxml/tree.h>

#include <memory>
#include <string>

namespace Evs
{
    namespace
    {
        struct XmlDocumentDeleter
        {
            void operator()(xmlDoc* document) const
            {
                xmlFreeDoc(document);
            }
        };
        using XmlDocument = std::unique_ptr<xmlDoc, XmlDocumentDeleter>;

        struct XmlStringDeleter
        {
            void operator()(xmlChar* str) const
            {
                xmlFree(str);
            }
        };
        using XmlString = std::unique_ptr<xmlChar, XmlStringDeleter>;

        std::string toString(xmlChar const* str)
        {
            if (str == nullptr)
                return {};
            return std::string{reinterpret_cast<char const*>(str)};
        }

        StatusElement readElement(xmlNode* node)
        {
            StatusElement element{.name = toString(node->name)};
            for (xmlAttr* attribute = node->properties; attribute != nullptr; attribute = attribute->next)
            {
                XmlString value{xmlNodeListGetString(node->doc, attribute->children, 1)};
                element.attributes.emplace(toString(attribute->name), toString(value.get()));
            }
            return element;
        }
    }

    std::optional<std::string> StatusElement::attribute(std::string const& key) const
    {
        auto iter = attributes.find(key);
        if (iter == attributes.end())
            return std::nullopt;
        return iter->second;
    }

    StatusTree::StatusTree(std::vector<StatusElement> elements)
        : elements_{std::move(elements)}
    {}

    std::optional<StatusElement> StatusTree::find(std::string_view name) const
    {
        for (auto const& element : elements_)
        {
            if (element.name == name)
                return element;
        }
        return std::nullopt;
    }

    std::vector<StatusElement> const& StatusTree::elements() const
    {
        return elements_;
    }

    std::optional<StatusTree> parseStatusTree(std::string_view raw)
    {
        const auto tags = extractTags(raw);
        if (tags.empty())
            return std::nullopt;

        std::string document = "<root>";
        for (auto const& tag : tags)
        {
            // Declarations and comments are only allowed outside of the root element.
            if (tag.starts_with("<?") || tag.starts_with("<!"))
                continue;
            document += tag;
        }
        document += "</root>";

        XmlDocument doc{xmlReadMemory(
            document.data(),
            static_cast<int>(document.size()),
            "status.xml",
            "UTF-8",
            XML_PARSE_NONET | XML_PARSE_NOERROR | XML_PARSE_NOWARNING)};
        if (!doc)
        {
            Log::debug("Status reply is not well-formed: {}", document);
            return std::nullopt;
        }

        xmlNode* root = xmlDocGetRootElement(doc.get());
        if (root == nullptr)
            return std::nullopt;

        std::vector<StatusElement> elements{};
        for (xmlNode* child = root->children; child != nullptr; child = child->next)
        {
            if (child->type == XML_ELEMENT_NODE)
                elements.push_back(readElement(child));
        }
        return StatusTree{std::move(elements)};
    }
}
