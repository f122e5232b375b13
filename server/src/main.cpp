#include <cstdlib>
#include <iostream>
#include <string>

#include "filedepot/logger.hpp"
#include "filedepot/server/config.hpp"
#include "filedepot/server/server.hpp"
#include "filedepot/version.hpp"

namespace
{

    void print_usage(const char *program_name)
    {
        std::cout << "FileDepot server " << filedepot::version() << "\n"
                  << "Usage: " << program_name
                  << " [--port <PORT>] [--root <DIR>] [--address <ADDRESS>] [--threads <N>]"
                     " [--idle-timeout <seconds>] [--chunk-size <bytes>] [--log <FILE>] [--verbose]\n";
    }

} // namespace

int main(int argc, char *argv[])
{
    using filedepot::server::Server;
    using filedepot::server::ServerConfig;

    for (int i = 1; i < argc; ++i)
    {
        const std::string arg = argv[i];
        if (arg == "--help" || arg == "-h")
        {
            print_usage(argv[0]);
            return EXIT_SUCCESS;
        }
    }

    ServerConfig config;
    try
    {
        config = filedepot::server::parse_arguments(argc, argv);
    }
    catch (const std::exception &ex)
    {
        std::cerr << ex.what() << std::endl;
        print_usage(argv[0]);
        return EXIT_FAILURE;
    }

    try
    {
        auto logger = filedepot::make_logger(filedepot::LogConfig{
            .name = "server",
            .console = true,
            .file = config.log_file,
            .rotate = true,
            .verbose = config.verbose,
        });
        logger.info("server", "Starting FileDepot server ", filedepot::version(), " on ", config.address, ":",
                    config.port);

        Server server(std::move(config), logger);
        server.run();
    }
    catch (const std::exception &ex)
    {
        std::cerr << "Server failed: " << ex.what() << std::endl;
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
