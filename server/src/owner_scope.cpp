#include "dropslot/server/owner_scope.hpp"

#include <utility>

namespace dropslot::server
{

    namespace
    {
        std::string hex_encode(const std::string &value)
        {
            static constexpr char kHexDigits[] = "0123456789abcdef";
            std::string result;
            result.reserve(value.size() * 2);
            for (const auto ch : value)
            {
                const auto byte = static_cast<unsigned char>(ch);
                result.push_back(kHexDigits[(byte >> 4) & 0x0F]);
                result.push_back(kHexDigits[byte & 0x0F]);
            }
            return result;
        }
    } // namespace

    OwnerScope OwnerScope::public_scope()
    {
        return OwnerScope{};
    }

    OwnerScope OwnerScope::user(std::string user_id)
    {
        OwnerScope scope;
        scope.public_ = false;
        scope.user_id_ = std::move(user_id);
        return scope;
    }

    std::string OwnerScope::storage_key() const
    {
        if (public_)
        {
            return "public";
        }
        return "user-" + hex_encode(user_id_);
    }

    std::string OwnerScope::describe() const
    {
        return public_ ? std::string{"public"} : "user:" + user_id_;
    }

    void to_json(nlohmann::json &json, const OwnerScope &scope)
    {
        json = {{"public", scope.is_public()}};
        if (!scope.is_public())
        {
            json["user"] = scope.user_id();
        }
    }

    void from_json(const nlohmann::json &json, OwnerScope &scope)
    {
        if (json.value("public", true))
        {
            scope = OwnerScope::public_scope();
            return;
        }
        scope = OwnerScope::user(json.at("user").get<std::string>());
    }

} // namespace dropslot::server
