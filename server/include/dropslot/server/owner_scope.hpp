#pragma once

#include <string>

#include <nlohmann/json.hpp>

namespace dropslot::server
{

    /// Who owns an upload session or a share slot: the anonymous public or a single user.
    class OwnerScope
    {
    public:
        OwnerScope() = default;

        static OwnerScope public_scope();
        static OwnerScope user(std::string user_id);

        bool is_public() const noexcept { return public_; }
        const std::string &user_id() const noexcept { return user_id_; }

        // File-system safe key, "public" or "user-<hex of user id>".
        std::string storage_key() const;

        std::string describe() const;

        bool operator==(const OwnerScope &other) const = default;

    private:
        bool public_{true};
        std::string user_id_;
    };

    void to_json(nlohmann::json &json, const OwnerScope &scope);
    void from_json(const nlohmann::json &json, OwnerScope &scope);

} // namespace dropslot::server
