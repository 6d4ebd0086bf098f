#include "dropslot/server/session.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "session_common.hpp"

namespace dropslot::server
{

    void Session::handle_authenticate(const dropslot::protocol::RequestEnvelope &envelope)
    {
        if (authenticated_)
        {
            send_error(dropslot::ErrorCode::Conflict, "Already authenticated", envelope.request_id);
            return;
        }

        try
        {
            const auto request = session_common::parse_request<dropslot::protocol::AuthenticateRequest>(envelope.payload);

            OwnerScope scope = OwnerScope::public_scope();
            if (!request.public_mode)
            {
                if (!UserStore::is_valid_username(request.username))
                {
                    send_error(dropslot::ErrorCode::BadRequest, "Invalid username", envelope.request_id);
                    return;
                }
                if (request.register_user)
                {
                    std::string message;
                    if (!services_.user_store.register_user(request.username, request.password, message))
                    {
                        send_error(dropslot::ErrorCode::Conflict, message, envelope.request_id);
                        return;
                    }
                }
                if (!services_.user_store.authenticate(request.username, request.password))
                {
                    spdlog::warn("Failed login for {} from {}", request.username, remote_endpoint());
                    send_error(dropslot::ErrorCode::AuthenticationFailed, "Invalid credentials", envelope.request_id);
                    return;
                }
                scope = OwnerScope::user(request.username);
            }

            scope_ = scope;
            authenticated_ = true;
            dropslot::protocol::AuthenticateResponse response{
                .success = true,
                .newly_registered = request.register_user && !request.public_mode,
                .identity = scope_.describe(),
            };
            send_ok(response, envelope.request_id);
            spdlog::info("Session authenticated as {} ({})", scope_.describe(), remote_endpoint());
        }
        catch (const ServiceError &error)
        {
            send_service_error(error, envelope.request_id);
        }
        catch (const std::exception &ex)
        {
            spdlog::error("Authentication failed for {}: {}", remote_endpoint(), ex.what());
            send_error(dropslot::ErrorCode::Internal, ex.what(), envelope.request_id);
        }
    }

} // namespace dropslot::server
