/*
 * File: src/ttb_main.cpp
 * Project: TTB Broker Proxy
 * Purpose: ttbproxy command line: list, acquire, release, active, login, logout
 * Notes:
 *  - See DESIGN.md
 *  - Brokers come from the JSON config plus any --url arguments
 *  - Cookies are saved back to the state directory on every run
 * Last updated: 2026-10-18
 */

#include <sys/ioctl.h>
#include <unistd.h>

#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

#include "common/log.hpp"
#include "ttb_config.hpp"
#include "ttb_context.hpp"
#include "ttb_ops.hpp"

namespace
{

void usage()
{
    std::cerr << "usage: ttbproxy [--config FILE] [--url URL[,AKA]]... [--ssl-ignore] [-v|-q]... COMMAND ...\n"
                 "  list [--all] [--projection PATTERN]... [SPEC...]\n"
                 "  acquire [--ticket T] [--force] [--spec SPEC] [TARGET...]\n"
                 "  release [--ticket T] [--force] [--spec SPEC] [TARGET...]\n"
                 "  active [--ticket T] [--spec SPEC] [TARGET...]\n"
                 "  login [--user USER] [--password PASSWORD]\n"
                 "  logout\n";
}

std::size_t terminal_width()
{
    struct winsize ws {};
    if (::ioctl(STDOUT_FILENO, TIOCGWINSZ, &ws) == 0 && ws.ws_col > 0)
        return ws.ws_col;
    return 80;
}

struct Args
{
    std::string config;
    std::vector<std::string> urls;
    bool ssl_ignore = false;
    int verbosity = 0;
    std::string command;
    bool all = false;
    bool force = false;
    std::string ticket;
    std::string spec;
    std::string user;
    std::string password;
    Projection projection;
    std::vector<std::string> rest;
};

Args parse_args(int argc, char **argv)
{
    Args a;
    auto value = [&](int &i, const std::string &flag) -> std::string
    {
        if (i + 1 >= argc)
            throw std::runtime_error(flag + ": missing argument");
        return argv[++i];
    };
    for (int i = 1; i < argc; ++i)
    {
        std::string s = argv[i];
        if (s == "--config")
            a.config = value(i, s);
        else if (s == "--url")
            a.urls.push_back(value(i, s));
        else if (s == "--ssl-ignore")
            a.ssl_ignore = true;
        else if (s == "-v")
            ++a.verbosity;
        else if (s == "-q")
            --a.verbosity;
        else if (s == "--all")
            a.all = true;
        else if (s == "--force")
            a.force = true;
        else if (s == "--ticket")
            a.ticket = value(i, s);
        else if (s == "--spec")
            a.spec = value(i, s);
        else if (s == "--user")
            a.user = value(i, s);
        else if (s == "--password")
            a.password = value(i, s);
        else if (s == "--projection")
            a.projection.push_back(value(i, s));
        else if (s == "-h" || s == "--help")
        {
            a.command = "help";
            return a;
        }
        else if (s.size() > 1 && s.front() == '-')
            throw std::runtime_error(s + ": unknown option");
        else if (a.command.empty())
            a.command = s;
        else
            a.rest.push_back(s);
    }
    return a;
}

ProxyConfig build_config(const Args &a)
{
    ProxyConfig cfg;
    cfg.state_dir = default_state_dir();
    fs::path path = a.config.empty() ? default_config_path() : fs::path(a.config);
    std::error_code ec;
    if (!a.config.empty() || fs::exists(path, ec))
        cfg = load_config(path);
    for (const auto &u : a.urls)
        cfg.brokers.push_back(broker_config_from_arg(u, cfg.timeout));
    if (a.ssl_ignore)
        for (auto &b : cfg.brokers)
            b.tls.mode = TlsPolicy::Mode::skip;
    return cfg;
}

int run(const Args &a)
{
    BrokerContext ctx(build_config(a));
    if (ctx.brokers().empty())
        ttb_log().warn("no brokers configured; use --url or {}", default_config_path().string());

    if (a.command == "list")
    {
        auto targets = select_targets(ctx, a.rest, a.all, a.projection);
        if (a.verbosity < 1 && ::isatty(STDOUT_FILENO) && ::isatty(STDERR_FILENO))
            std::cout << format_table(targets, terminal_width());
        else
            std::cout << format_targets(targets, a.verbosity, a.projection);
    }
    else if (a.command == "acquire")
    {
        int rejected = 0;
        for (const auto &r : acquire_targets(ctx, resolve_targets(ctx, a.rest, a.spec), a.ticket, a.force))
        {
            if (r.second.acquired)
                std::cout << r.first.fullid << ": acquired\n";
            else
            {
                std::cout << r.first.fullid << ": not acquired: " << r.second.message << "\n";
                ++rejected;
            }
        }
        ctx.save_state();
        return rejected ? 2 : 0;
    }
    else if (a.command == "release")
        release_targets(ctx, resolve_targets(ctx, a.rest, a.spec), a.ticket, a.force);
    else if (a.command == "active")
        activate_targets(ctx, resolve_targets(ctx, a.rest, a.spec), a.ticket);
    else if (a.command == "login")
        login_all(ctx, a.user, a.password);
    else if (a.command == "logout")
        logout_all(ctx);
    else
    {
        usage();
        return 1;
    }
    ctx.save_state();
    return 0;
}

} // namespace

int main(int argc, char **argv)
{
    try
    {
        auto args = parse_args(argc, argv);
        if (args.command.empty() || args.command == "help")
        {
            usage();
            return args.command.empty() ? 1 : 0;
        }
        auto level = env_or_empty("TTB_LOG_LEVEL");
        if (!level.empty())
            set_log_level(level);
        else if (args.verbosity >= 2)
            set_log_level("debug");
        else if (args.verbosity == 1)
            set_log_level("info");
        else if (args.verbosity < 0)
            set_log_level("error");
        else
            set_log_level("warn");
        return run(args);
    }
    catch (const std::exception &e)
    {
        std::cerr << "ttbproxy error: " << e.what() << "\n";
        return 1;
    }
}
