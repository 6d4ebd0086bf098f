#include "dropslot/client/session.hpp"

#include <iostream>

#include "dropslot/error_codes.hpp"
#include "dropslot/protocol.hpp"

namespace dropslot::client
{

    bool ClientSession::handle_text(const std::string &text)
    {
        dropslot::protocol::SharePutRequest request{.text = text};
        auto response = rpc(dropslot::protocol::Command::SharePut, request);
        if (response.kind == dropslot::protocol::ResponseKind::Error)
        {
            print_error(response);
            return false;
        }
        std::cout << "OK" << std::endl;
        return true;
    }

    bool ClientSession::handle_show()
    {
        auto response = rpc(dropslot::protocol::Command::ShareGet);
        if (response.kind == dropslot::protocol::ResponseKind::Error)
        {
            print_error(response);
            return false;
        }
        const auto info = response.payload.get<dropslot::protocol::ShareInfo>();
        std::cout << "OK" << std::endl;
        switch (info.kind)
        {
        case dropslot::protocol::ShareKind::Text:
            std::cout << "Text: " << info.text << std::endl;
            break;
        case dropslot::protocol::ShareKind::File:
            std::cout << "File: " << info.name << "  (" << info.size << " bytes)" << std::endl;
            break;
        case dropslot::protocol::ShareKind::Empty:
            std::cout << "Nothing shared" << std::endl;
            break;
        }
        return true;
    }

    bool ClientSession::handle_clear()
    {
        auto response = rpc(dropslot::protocol::Command::ShareClear);
        if (response.kind == dropslot::protocol::ResponseKind::Error)
        {
            print_error(response);
            return false;
        }
        std::cout << "OK" << std::endl;
        return true;
    }

} // namespace dropslot::client
