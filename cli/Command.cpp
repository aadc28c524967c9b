/*
 * Copyright (c) 2015, AirBitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#include "Command.hpp"
#include <iostream>
#include <map>

typedef std::map<std::string, Command *> CommandTable;

/**
 * The table is built on first use,
 * since commands in other files may register before this file's statics.
 */
static CommandTable &
commandTable()
{
    static CommandTable table;
    return table;
}

Command::Command(InitLevel level, const char *name, const char *help):
    level_(level),
    name_(name),
    help_(help)
{
    auto &table = commandTable();
    if (!table.insert(CommandTable::value_type(name, this)).second)
        std::cerr << "warning: Duplicate command " << name << std::endl;
}

Command::~Command()
{
}

Command *
Command::find(const std::string &name)
{
    const auto &table = commandTable();
    const auto i = table.find(name);
    return table.end() == i ? nullptr : i->second;
}

void
Command::list()
{
    for (const auto &i: commandTable())
        std::cout << i.first << i.second->help() << std::endl;
}

std::string
helpString(const Command &command)
{
    return std::string("usage: sid-cli [-d <working-dir>] [-c <callback-path>] "
                       "[-r <redirect-uri>] [-l <lifetime>] ") +
           command.name() + command.help();
}
