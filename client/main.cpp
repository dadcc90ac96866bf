#include "configuration.hpp"

#include <lark/bot.hpp>
#include <lark/coretasks.hpp>
#include <lark/logging.hpp>
#include <lark/store.hpp>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>

#include <chrono>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <string>

namespace {

auto usage() -> void
{
    std::cerr << "Usage: lark [--config=PATH]\n"
                 "  --config=PATH        - override configuration file\n"
                 "                         (default ~/.config/lark/settings.lua)\n";
}

} // namespace

auto main(int argc, char const* argv[]) -> int
{
    auto config_path = lark::default_settings_path();

    for (int i = 1; i < argc; ++i)
    {
        if (not strncmp("--config=", argv[i], 9))
        {
            config_path = argv[i] + 9;
        }
        else
        {
            usage();
            return EXIT_FAILURE;
        }
    }

    lark::Settings settings;
    try
    {
        settings = lark::load_settings(config_path);
        lark::log::set_level(settings.log_level);
        lark::log::set_file(settings.log_file);
    }
    catch (std::exception const& e)
    {
        std::cerr << config_path << ": " << e.what() << std::endl;
        return EXIT_FAILURE;
    }

    boost::asio::io_context io_context;
    lark::MemoryStore store;

    try
    {
        lark::Bot bot {io_context, std::move(settings), store};
        lark::install_coretasks(bot);

        boost::asio::signal_set signals {io_context, SIGINT, SIGTERM};
        signals.async_wait([&bot](boost::system::error_code const& ec, int const signal) {
            if (ec) return;
            lark::log::info("main", "received signal ", signal, ", quitting");
            bot.quit("Shutting down");
            // give the server a moment to close the connection itself
            bot.schedule(std::chrono::seconds{2}, [&bot]() { bot.shutdown(); });
        });

        boost::asio::co_spawn(io_context, bot.run(), [&signals](std::exception_ptr const e) {
            signals.cancel();
            if (e) std::rethrow_exception(e);
        });
        io_context.run();

        return bot.has_quit() ? EXIT_SUCCESS : EXIT_FAILURE;
    }
    catch (std::exception const& e)
    {
        lark::log::error("main", e.what());
        return EXIT_FAILURE;
    }
}
