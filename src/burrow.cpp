#include "cli.hpp"
#include "config.hpp"
#include "launcher.hpp"
#include "util/http.hpp"
#include "util/log.hpp"

#include <fmt/format.h>

#ifndef BURROW_VERSION
#define BURROW_VERSION "unknown"
#endif

class TRunCmd final : public ICmd {
public:
    TRunCmd() : ICmd("run", 2,
            "<image:tag|skip> <command> [argument]...",
            "run command in ephemeral root, optionally populated from docker image",
            "    image:tag    pull image from registry into root, skip - empty root\n"
            "    command      copied into root at the same path and executed there\n"
            "\n"
            "Exit code is exit code of command, 1 if it was killed by signal or\n"
            "on any error, 2 on usage error.\n")
    {}

    int Execute(const std::vector<std::string> &args) override {
        TRunRequest request;
        int exitCode = EXIT_FAILURE;
        TError error;

        request.Image = args[0];
        request.Command = args[1];
        request.Args.assign(args.begin() + 2, args.end());

        THttpClient::TOptions options;
        options.ConnectTimeout = config().registry().connect_timeout_s();
        options.ReadTimeout = config().registry().read_timeout_s();
        options.VerifyTls = config().registry().verify_tls();

        THttpClient client(options);
        THostIsolation isolation;
        TLauncher launcher(isolation, client);

        error = launcher.Run(request, exitCode);
        if (error) {
            PrintError(fmt::format("Cannot run {} in {}", request.Command, request.Image), error);
            if (error == EError::UsageError) {
                PrintUsage();
                return EXIT_USAGE;
            }
            return EXIT_FAILURE;
        }

        return exitCode;
    }
};

class TVersionCmd final : public ICmd {
public:
    TVersionCmd() : ICmd("version", 0, "", "print version") {}

    int Execute(const std::vector<std::string> &) override {
        fmt::print("{}\n", BURROW_VERSION);
        return EXIT_SUCCESS;
    }
};

int main(int argc, char *argv[]) {
    TCommandHandler handler;
    handler.RegisterCommand<TRunCmd>();
    handler.RegisterCommand<TVersionCmd>();

    return handler.HandleCommand(argc, argv);
}
