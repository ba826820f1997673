#include <memory>
#include <string>
#include <cstdio>
#include <csignal>
#include <cstring>

#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/system/error_code.hpp>

#include "log.h"
#include "config.h"
#include "constants.h"
#include "user_sync.h"
#include "config_sync.h"
#include "node_service.h"
#include "asset_locator.h"
#include "engine_handle.h"
#include "node_messages.h"
#include "registry_engine.h"

namespace
{

void print_usage(const char* prog)
{
    std::fputs("Usage:\n", stdout);
    std::fprintf(stdout, "%s -c <config>  Run with configuration file\n", prog);
    std::fprintf(stdout, "%s config       Dump default configuration\n", prog);
    std::fprintf(stdout, "%s version      Print node and engine versions\n", prog);
    std::fprintf(stdout, "%s test <file>  Check an engine configuration without starting it\n", prog);
}

void print_version()
{
    const xnode::registry_loader loader("");
    std::fprintf(stdout, "node   %s\n", std::string(xnode::constants::version::kNode).c_str());
    std::fprintf(stdout, "engine %s\n", loader.version().c_str());
}

int parse_config_from_file(const std::string& file, xnode::config& cfg)
{
    const auto parsed = xnode::parse_config_with_error(file);
    if (!parsed)
    {
        const auto& error = parsed.error();
        std::fprintf(stderr, "parse config failed path %s reason %s\n", error.path.c_str(), error.reason.c_str());
        return -1;
    }
    cfg = *parsed;
    return 0;
}

bool apply_startup_payload(xnode::node_service& service, const std::string& file)
{
    if (file.empty())
    {
        return true;
    }

    const auto body = xnode::read_text_file(file);
    if (!body)
    {
        LOG_ERROR("read startup payload {} failed {}", file, body.error().reason);
        return false;
    }
    const auto request = xnode::parse_start_request(*body);
    if (!request)
    {
        LOG_ERROR("startup payload {} rejected {}", file, request.error().reason);
        return false;
    }
    const auto started = service.start(*request);
    if (!started)
    {
        LOG_ERROR("startup payload {} failed {} {}", file, xnode::to_string(started.error().kind), started.error().reason);
        return false;
    }
    LOG_INFO("startup payload {} applied engine {}", file, started->version.value_or(""));
    return true;
}

int test_engine_config(const std::string& file)
{
    const auto body = xnode::read_text_file(file);
    if (!body)
    {
        std::fprintf(stderr, "read %s failed %s\n", file.c_str(), body.error().reason.c_str());
        return 1;
    }

    const auto asset_dir = xnode::locate_assets("").value_or("");
    const xnode::engine_handle engine(std::make_shared<xnode::registry_loader>(asset_dir));
    if (auto valid = engine.validate_config(*body); !valid)
    {
        std::fprintf(stderr, "%s invalid %s\n", file.c_str(), valid.error().reason.c_str());
        return 1;
    }
    std::fprintf(stdout, "%s ok\n", file.c_str());
    return 0;
}

bool register_signal(boost::asio::signal_set& signals, const int signal, const char* signal_name)
{
    boost::system::error_code ec;
    signals.add(signal, ec);
    if (!ec)
    {
        return true;
    }
    LOG_ERROR("fatal failed to register {} error {}", signal_name, ec.message());
    return false;
}

int run_with_config(const char* prog, const char* config_path)
{
    xnode::config cfg;
    if (parse_config_from_file(config_path, cfg) != 0)
    {
        print_usage(prog);
        return -1;
    }
    xnode::apply_env_overrides(cfg);

    xnode::init_log(cfg.log.file, cfg.log.level);

    const auto asset_dir = xnode::locate_assets(cfg.engine.asset_dir).value_or("");
    xnode::engine_handle engine(std::make_shared<xnode::registry_loader>(asset_dir));
    xnode::config_sync mirror;
    xnode::user_sync users(engine);
    xnode::node_service service(engine, mirror, users, cfg.engine.api_port);

    LOG_INFO("{} {} engine {} api port {}", prog, xnode::constants::version::kNode, engine.version(), cfg.engine.api_port);

    if (!apply_startup_payload(service, cfg.startup.file))
    {
        xnode::shutdown_log();
        return 1;
    }

    boost::asio::io_context io_context;
    boost::asio::signal_set signals(io_context);
    if (!register_signal(signals, SIGINT, "sigint") || !register_signal(signals, SIGTERM, "sigterm"))
    {
        xnode::shutdown_log();
        return 1;
    }

    signals.async_wait(
        [&io_context](const boost::system::error_code& error, const int signal_number)
        {
            if (error)
            {
                return;
            }
            LOG_INFO("received signal {} shutting down", signal_number);
            io_context.stop();
        });

    io_context.run();

    int code = 0;
    if (auto stopped = service.stop(); !stopped)
    {
        LOG_ERROR("engine stop on shutdown failed {}", stopped.error().reason);
        code = 2;
    }
    LOG_INFO("{} shutdown", prog);
    xnode::shutdown_log();
    return code;
}

}    // namespace

int main(int argc, char** argv)
{
    if (argc < 2)
    {
        print_usage(argv[0]);
        return 1;
    }

    const char* mode = argv[1];
    if (std::strcmp(mode, "version") == 0)
    {
        print_version();
        return 0;
    }

    if (std::strcmp(mode, "config") == 0)
    {
        const std::string default_config = xnode::dump_default_config();
        std::fputs(default_config.c_str(), stdout);
        std::fputc('\n', stdout);
        return 0;
    }

    if (std::strcmp(mode, "test") == 0)
    {
        if (argc <= 2)
        {
            print_usage(argv[0]);
            return -1;
        }
        return test_engine_config(argv[2]);
    }

    if (std::strcmp(mode, "-c") != 0)
    {
        print_usage(argv[0]);
        return -1;
    }

    if (argc <= 2)
    {
        print_usage(argv[0]);
        return -1;
    }
    return run_with_config(argv[0], argv[2]);
}
