#include <cstdlib>
#include <iostream>
#include <string>

#include "dropslot/client/config.hpp"
#include "dropslot/client/logger.hpp"
#include "dropslot/client/session.hpp"
#include "dropslot/version.hpp"

int main(int argc, char *argv[])
{
    using dropslot::client::ClientSession;
    using dropslot::client::Logger;

    if (argc == 2 && (std::string(argv[1]) == "--help" || std::string(argv[1]) == "-h"))
    {
        std::cout << "DropSlot client " << dropslot::version() << "\n" << dropslot::client::usage(argv[0]);
        return EXIT_SUCCESS;
    }

    try
    {
        const auto config = dropslot::client::parse_arguments(argc, argv);
        Logger logger(config.log_path);
        ClientSession session(config, std::move(logger));
        return session.run();
    }
    catch (const std::exception &ex)
    {
        std::cerr << "ERROR: " << ex.what() << std::endl;
        return EXIT_FAILURE;
    }
}
