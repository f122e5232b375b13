#include <cstdlib>
#include <exception>
#include <iostream>

#include "filedepot/client/config.hpp"
#include "filedepot/client/session.hpp"
#include "filedepot/client/shell.hpp"
#include "filedepot/logger.hpp"
#include "filedepot/version.hpp"

int main(int argc, char *argv[])
{
    using namespace filedepot::client;

    ClientConfig config;
    try
    {
        config = parse_arguments(argc, argv);
    }
    catch (const std::exception &ex)
    {
        std::cerr << "FileDepot client " << filedepot::version() << "\n"
                  << ex.what() << std::endl;
        return EXIT_FAILURE;
    }

    try
    {
        auto logger = filedepot::make_logger(filedepot::LogConfig{
            .name = "client",
            .file = config.log_path,
        });
        ConsoleProgress progress(std::cout);
        ClientSession session(config, logger, progress);
        Shell shell(session, std::cout);

        try
        {
            session.connect();
        }
        catch (const ClientError &ex)
        {
            std::cout << "ERROR: " << filedepot::to_string(ex.code()) << "\n"
                      << ex.what() << std::endl;
            return EXIT_FAILURE;
        }
        std::cout << "Connected to " << config.host << ":" << config.port << std::endl;

        if (!config.command.empty())
        {
            shell.execute(config.command);
            session.disconnect();
            return shell.last_succeeded() ? EXIT_SUCCESS : EXIT_FAILURE;
        }
        const auto code = shell.run(std::cin);
        session.disconnect();
        logger.flush();
        return code;
    }
    catch (const std::exception &ex)
    {
        std::cerr << "Client failed: " << ex.what() << std::endl;
        return EXIT_FAILURE;
    }
}
