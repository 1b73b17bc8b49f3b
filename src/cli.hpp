#pragma once

#include <map>
#include <memory>
#include <string>
#include <vector>

#include "common.hpp"

class ICmd {
protected:
    std::string Name, Usage, Desc, Help;

public:
    /* required positional arguments */
    size_t NeedArgs;

    ICmd(const std::string &name, size_t args, const std::string &usage,
         const std::string &desc, const std::string &help = "")
        : Name(name), Usage(usage), Desc(desc), Help(help), NeedArgs(args) {}
    virtual ~ICmd() {}

    const std::string &GetName() const { return Name; }
    const std::string &GetDescription() const { return Desc; }

    void PrintError(const std::string &step, const TError &error) const;
    void PrintUsage() const;
    bool ValidArgs(const std::vector<std::string> &args) const;

    /* returns process exit code */
    virtual int Execute(const std::vector<std::string> &args) = 0;
};

class TCommandHandler : public TNonCopyable {
public:
    typedef std::map<std::string, std::unique_ptr<ICmd>> TCommands;

    TCommandHandler();

    template <typename TCommand> void RegisterCommand() {
        RegisterCommand(std::unique_ptr<ICmd>(new TCommand()));
    }
    void RegisterCommand(std::unique_ptr<ICmd> cmd);

    /* parses global options, reads config and runs command */
    int HandleCommand(int argc, char *argv[]);

    /* list of commands, or usage of one command if name is known */
    int Usage(const std::string &name = "") const;

    const TCommands &GetCommands() const { return Commands; }

private:
    TCommands Commands;
};
