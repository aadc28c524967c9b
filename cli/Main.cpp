/*
 * Copyright (c) 2014, Airbitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#include "Command.hpp"
#include "../sidcore/http/Uri.hpp"
#include "../sidcore/json/JsonObject.hpp"
#include "../sidcore/util/FileIO.hpp"
#include "../src/SID.h"
#include <iostream>
#include <getopt.h>
#include <stdlib.h>
#include <string.h>

using namespace sidcore;

struct ConfigJson:
    public JsonObject
{
    SID_JSON_STRING(workingDir, "workingDir", nullptr)
    SID_JSON_STRING(callbackPath, "callbackPath", nullptr)
    SID_JSON_STRING(redirectUri, "redirectUri", nullptr)
    SID_JSON_INTEGER(lifetime, "lifetime", 0)
};

static std::string
configPath()
{
    // Mac: ~/Library/Application Support/Sidcore/sid.conf
    // Unix: ~/.config/sidcore/sid.conf
    const char *home = getenv("HOME");
    if (!home || !strlen(home))
        home = "/";

#ifdef MAC_OSX
    return std::string(home) + "/Library/Application Support/Sidcore/sid.conf";
#else
    return std::string(home) + "/.config/sidcore/sid.conf";
#endif
}

/**
 * The main program body.
 */
static Status run(int argc, char *argv[])
{
    // The config file is optional:
    ConfigJson json;
    if (fileExists(configPath()))
        SID_CHECK(json.load(configPath()));

    // Parse out the command-line options:
    std::string workingDir;
    Session session;
    bool wantHelp = false;

    static const struct option long_options[] =
    {
        {"working-dir", required_argument, nullptr, 'd'},
        {"callback",    required_argument, nullptr, 'c'},
        {"redirect",    required_argument, nullptr, 'r'},
        {"lifetime",    required_argument, nullptr, 'l'},
        {"help",        no_argument,       nullptr, 'h'},
        {nullptr, 0, nullptr, 0}
    };
    opterr = 0;
    int c;
    while (-1 != (c = getopt_long(argc, argv, "d:c:r:l:h", long_options, nullptr)))
    {
        switch (c)
        {
        case 'd':
            workingDir = optarg;
            break;
        case 'c':
            session.callbackPath = optarg;
            break;
        case 'r':
            session.redirectUri = optarg;
            break;
        case 'l':
            SID_CHECK(queryIntegerDecode(session.lifetime, optarg));
            session.lifetimeOk = true;
            break;
        case 'h':
            wantHelp = true;
            break;
        case '?':
            if (optopt == 'd')
                return SID_ERROR(SID_CC_Error, "-d requires a working directory");
            else if (optopt == 'c')
                return SID_ERROR(SID_CC_Error, "-c requires a callback path");
            else if (optopt == 'r')
                return SID_ERROR(SID_CC_Error, "-r requires a redirect URI");
            else if (optopt == 'l')
                return SID_ERROR(SID_CC_Error, "-l requires a lifetime in seconds");
            else
                return SID_ERROR(SID_CC_Error, "Unknown option '-" +
                                 std::string(1, static_cast<char>(optopt)) + "'.");
        default:
            return SID_ERROR(SID_CC_Error, "Unexpected option result");
        }
    }

    // Fill in whatever the command line left out:
    if (session.callbackPath.empty() && json.callbackPathOk())
        session.callbackPath = json.callbackPath();
    if (session.redirectUri.empty() && json.redirectUriOk())
        session.redirectUri = json.redirectUri();
    if (!session.lifetimeOk && json.lifetimeOk())
    {
        session.lifetime = json.lifetime();
        session.lifetimeOk = true;
    }

    // At this point, all non-option arguments should be out of the list:
    argc -= optind;
    argv += optind;

    // Find the command:
    if (argc < 1)
    {
        Command::list();
        return Status();
    }
    const auto commandName = argv[0];
    --argc;
    ++argv;

    Command *command = Command::find(commandName);
    if (!command)
        return SID_ERROR(SID_CC_Error,
                         "unknown command " + std::string(commandName));

    // If the user wants help, just print the string and return:
    if (wantHelp)
    {
        std::cout << helpString(*command) << std::endl;
        return Status();
    }

    // Populate the session up to the required level:
    if (InitLevel::context <= command->level())
    {
        if (workingDir.empty())
        {
            if (json.workingDirOk())
                workingDir = json.workingDir();
            else
                return SID_ERROR(SID_CC_Error, "No working directory given, " +
                                 helpString(*command));
        }

        tSID_Error error;
        if (SID_CC_Ok != SID_Initialize(workingDir.c_str(), &error))
            return Status::fromError(error);
    }

    // Invoke the command:
    Status s = command->run(session, argc, argv);

    // Clean up:
    SID_Terminate();
    return s;
}

int main(int argc, char *argv[])
{
    Status s = run(argc, argv);
    if (!s)
        std::cerr << s << std::endl;
    return s ? 0 : 1;
}
