#include <cctype>
#include <cstdio>
#include <cstdlib>
#include <functional>
#include <string>
#include <unordered_map>
#include <vector>

#include "ctl/ipc.hpp"
#include "util/constants.hpp"
#include "util/exitcodes.hpp"
#include "util/log.hpp"

namespace
{

static std::string to_lower(std::string s)
{
    for (auto &c : s)
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return s;
}

// --------------------------------------------------------------------
// CLI usage
// --------------------------------------------------------------------
static void print_usage()
{
    std::fprintf(stderr, "Usage:\n"
                         "  framerxctl [--sock <path>] <command> [args]\n"
                         "\n"
                         "Commands:\n"
                         "  stats          print receive counters and frame rate\n"
                         "  reset          drop in-flight frames\n"
                         "  dump on|off    write completed frames to the sink or not\n"
                         "  quit           stop the daemon\n");
}

static int send_one_line(const std::string &sock, const std::string &line)
{
    if (line.empty() || line.find('\n') != std::string::npos)
    {
        print_usage();
        std::fprintf(stderr, "error: command line must be one non-empty line\n");
        return exitc::bad_args;
    }
    std::string reply;
    if (!ipc::send_line(sock, line, &reply))
    {
        std::fprintf(stderr, "error: cannot reach daemon at %s\n", sock.c_str());
        return exitc::no_server;
    }
    if (!reply.empty())
        std::fputs(reply.c_str(), stdout);
    return reply.rfind("ERR", 0) == 0 ? exitc::failure : exitc::ok;
}

static int run_cmd(const std::string                             &cmd,
                   const std::vector<std::string>                &args,
                   const std::function<int(const std::string &)> &send_line)
{
    auto no_args = [&](const char *line) -> int {
        if (args.size() != 1)
        {
            print_usage();
            return exitc::bad_args;
        }
        return send_line(line);
    };

    std::unordered_map<std::string, std::function<int()>> cmd_map = {
        {"stats", [&]() -> int { return no_args("STATS"); }},
        {"reset", [&]() -> int { return no_args("RESET"); }},
        {"dump",
         [&]() -> int {
             if (args.size() != 2)
             {
                 print_usage();
                 return exitc::bad_args;
             }
             std::string v = to_lower(args[1]);
             if (v != "on" && v != "off")
             {
                 std::fprintf(stderr, "error: dump expects 'on' or 'off'\n");
                 return exitc::bad_args;
             }
             return send_line("DUMP " + v);
         }},
        {"quit", [&]() -> int { return no_args("QUIT"); }},
    };

    auto it = cmd_map.find(to_lower(cmd));
    if (it == cmd_map.end())
    {
        std::fprintf(stderr, "Unknown command: %s\n", cmd.c_str());
        print_usage();
        return exitc::bad_args;
    }
    LOG_DEBUG("Running command: %s", cmd.c_str());
    return it->second();
}
}  // namespace

int main(int argc, char **argv)
{
    if (argc < 2)
    {
        print_usage();
        return exitc::bad_args;
    }
    if (const char *log_level = std::getenv("FRAMERX_LOG_LEVEL"))
        framerx::set_log_level_by_name(log_level);

    // default path, FRAMERX_CTL_SOCK, then --sock
    std::string sock = ipc::expand_user(constants::ctl_sock_path());

    std::vector<std::string> args;
    args.reserve(argc - 1);
    for (int i = 1; i < argc; ++i)
    {
        std::string a = argv[i];
        if (a == "--help" || a == "-h")
        {
            print_usage();
            return exitc::ok;
        }
        if (a == "--sock")
        {
            if (i + 1 >= argc)
            {
                print_usage();
                return exitc::bad_args;
            }
            sock = ipc::expand_user(argv[++i]);
        }
        else
        {
            args.push_back(std::move(a));
        }
    }
    if (args.empty())
    {
        print_usage();
        return exitc::bad_args;
    }

    auto sender = [&](const std::string &line) -> int { return send_one_line(sock, line); };
    return run_cmd(args[0], args, sender);
}
