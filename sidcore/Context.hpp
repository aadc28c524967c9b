/*
 * Copyright (c) 2015, Airbitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#ifndef SIDCORE_CONTEXT_HPP
#define SIDCORE_CONTEXT_HPP

#include <memory>
#include <string>

namespace sidcore {

/**
 * An object holding app-wide information, such as paths.
 */
class Context
{
public:
    explicit Context(const std::string &rootDir);

    /**
     * The directory the core keeps its files in, with a trailing slash.
     */
    const std::string &rootDir() const { return rootDir_; }

private:
    const std::string rootDir_;
};

/**
 * The global context instance.
 */
extern std::unique_ptr<Context> gContext;

} // namespace sidcore

#endif
