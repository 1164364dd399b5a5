#pragma once

#include <nlohmann/json.hpp>

#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>

#include <compare>
#include <string>

namespace Ids
{
    class Id
    {
      public:
        friend Id generateId();

        Id(Id const&) = default;
        Id(Id&&) = default;
        Id& operator=(Id const&) = default;
        Id& operator=(Id&&) = default;
        ~Id() = default;

        std::string value() const
        {
            return id_;
        }

        /**
         * @brief The first characters of the id, for use in names where the full id is too long.
         */
        std::string prefix(std::size_t length) const
        {
            return id_.substr(0, length);
        }

        friend std::strong_ordering operator<=>(Id const& lhs, Id const& rhs) = default;

        bool isValid() const
        {
            return id_ != "INVALID_ID";
        }

      protected:
        Id() = delete;
        explicit Id(std::string const& id)
            : id_{id}
        {}

      private:
        std::string id_;
    };

    inline Id generateId()
    {
        return Id{boost::uuids::to_string(boost::uuids::random_generator()())};
    }
}

#define DEFINE_ID_TYPE(name) \
    namespace Ids \
    { \
        class name : public Id \
        { \
          public: \
            friend name generate##name(); \
            friend name make##name(std::string const&); \
\
          public: \
            name() \
                : Id{"INVALID_ID"} \
            {} \
            name(Id id) \
                : Id{std::move(id)} \
            {} \
\
          private: \
            name(std::string const& str) \
                : Id{str} \
            {} \
        }; \
\
        inline name generate##name() \
        { \
            return name{generateId().value()}; \
        } \
\
        inline name make##name(std::string const& str) \
        { \
            return name{str}; \
        } \
        inline void to_json(nlohmann::json& j, name const& id) \
        { \
            j = id.value(); \
        } \
        inline void from_json(nlohmann::json const& j, name& id) \
        { \
            id = make##name(j.get<std::string>()); \
        } \
    }
