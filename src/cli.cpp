#include "cli.hpp"
#include "config.hpp"
#include "util/log.hpp"

#include <fmt/format.h>

#include <algorithm>

extern "C" {
#include <errno.h>
#include <getopt.h>
}

namespace {

class THelpCmd final : public ICmd {
    const TCommandHandler &Handler;

public:
    THelpCmd(const TCommandHandler &handler)
        : ICmd("help", 0, "[command]", "print help message for command"),
          Handler(handler) {}

    int Execute(const std::vector<std::string> &args) override {
        if (args.empty())
            return Handler.Usage();

        if (!Handler.GetCommands().count(args[0])) {
            fmt::print(stderr, "Unknown command: {}\n", args[0]);
            (void)Handler.Usage();
            return EXIT_USAGE;
        }

        return Handler.Usage(args[0]);
    }
};

}

void ICmd::PrintError(const std::string &step, const TError &error) const {
    L_VERBOSE("{}: {}", step, error);
    fmt::print(stderr, "{}: {}\n", step, error.Message());
}

void ICmd::PrintUsage() const {
    fmt::print("Usage: {} {} {}\n\n{}\n", program_invocation_short_name, Name, Usage, Desc);
    if (!Help.empty())
        fmt::print("\n{}", Help);
}

bool ICmd::ValidArgs(const std::vector<std::string> &args) const {
    if (args.size() < NeedArgs)
        return false;
    return args.empty() || (args[0] != "-h" && args[0] != "--help");
}

TCommandHandler::TCommandHandler() {
    RegisterCommand(std::unique_ptr<ICmd>(new THelpCmd(*this)));
}

void TCommandHandler::RegisterCommand(std::unique_ptr<ICmd> cmd) {
    std::string name = cmd->GetName();
    Commands[name] = std::move(cmd);
}

int TCommandHandler::Usage(const std::string &name) const {
    auto it = Commands.find(name);
    if (it != Commands.end()) {
        it->second->PrintUsage();
        return EXIT_SUCCESS;
    }

    fmt::print("Usage: {} [-v] [-d] [-c <config>] <command> [argument]...\n"
               "\n"
               "Options:\n"
               "  -v              verbose log\n"
               "  -d              debug log\n"
               "  -c <config>     read only this config instead of {} and {}/*.conf\n"
               "\n"
               "Commands:\n",
               program_invocation_short_name, BURROW_CONFIG_PATH, BURROW_CONFIG_DIR);

    size_t width = 8;
    for (auto &cmd: Commands)
        width = std::max(width, cmd.first.size());

    for (auto &cmd: Commands)
        fmt::print("  {:<{}}  {}\n", cmd.first, width, cmd.second->GetDescription());

    fmt::print("\n");
    return EXIT_SUCCESS;
}

int TCommandHandler::HandleCommand(int argc, char *argv[]) {
    TPath configPath;
    TError error;
    int opt;

    OpenLog();

    /* "+" - options end at command name, command arguments are not parsed */
    optind = 1;
    while ((opt = getopt(argc, argv, "+vdc:h")) != -1) {
        switch (opt) {
        case 'v':
            Verbose = true;
            break;
        case 'd':
            Debug = Verbose = true;
            break;
        case 'c':
            configPath = optarg;
            break;
        case 'h':
            return Usage();
        default:
            (void)Usage();
            return EXIT_USAGE;
        }
    }

    if (optind >= argc) {
        (void)Usage();
        return EXIT_USAGE;
    }

    error = ReadConfigs(configPath);
    if (error) {
        fmt::print(stderr, "{}\n", error.Message());
        return EXIT_USAGE;
    }

    std::string name = argv[optind];
    std::vector<std::string> args(argv + optind + 1, argv + argc);

    auto it = Commands.find(name);
    if (it == Commands.end()) {
        fmt::print(stderr, "Unknown command: {}\n", name);
        (void)Usage();
        return EXIT_USAGE;
    }

    ICmd &cmd = *it->second;
    if (!cmd.ValidArgs(args)) {
        cmd.PrintUsage();
        return EXIT_USAGE;
    }

    L_DBG("Command {} with {} arguments", name, args.size());

    return cmd.Execute(args);
}
