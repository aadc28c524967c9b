/*
 * Copyright (c) 2015, Airbitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#include "Context.hpp"
#include "util/FileIO.hpp"

namespace sidcore {

std::unique_ptr<Context> gContext;

Context::Context(const std::string &rootDir):
    rootDir_(fileSlashify(rootDir))
{
}

} // namespace sidcore
