/*
 * Copyright (c) 2015, AirBitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#ifndef CLI_COMMAND_HPP
#define CLI_COMMAND_HPP

#include "../sidcore/util/Status.hpp"
#include <stdint.h>
#include <string>

/**
 * How much of the core a command needs before it runs.
 */
enum class InitLevel
{
    none = 0,   // Codec only
    context     // SID_Initialize has run, so the log file is open
};

/**
 * Defaults gathered from the options and the config file.
 */
struct Session
{
    std::string callbackPath;
    std::string redirectUri;

    // Seconds from now until new StratisIds expire:
    int64_t lifetime = 0;
    bool lifetimeOk = false;
};

#define COMMAND_PROTO \
    run(Session &session, int argc, char *argv[])

/**
 * A named sid-cli subcommand.
 * Each instance adds itself to the global table when constructed,
 * so commands must live at namespace scope.
 */
class Command
{
public:
    Command(InitLevel level, const char *name, const char *help);
    virtual ~Command();

    virtual sidcore::Status COMMAND_PROTO = 0;

    InitLevel level() const { return level_; }
    const char *name() const { return name_; }
    const char *help() const { return help_; }

    /**
     * Looks up a command by name, returning nullptr if there is none.
     */
    static Command *
    find(const std::string &name);

    /**
     * Writes every command name and its arguments to stdout.
     */
    static void
    list();

private:
    const InitLevel level_;
    const char *const name_;
    const char *const help_;
};

/**
 * Defines and registers a command.
 * The command body follows in curly braces.
 */
#define COMMAND(LEVEL, NAME, TEXT, HELP) \
    struct NAME: public Command { \
        NAME(): Command(LEVEL, TEXT, HELP) {} \
        sidcore::Status COMMAND_PROTO override; \
    } instance##NAME; \
    sidcore::Status NAME::COMMAND_PROTO

std::string
helpString(const Command &command);

#endif
