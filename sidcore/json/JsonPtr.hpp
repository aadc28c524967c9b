/*
 * Copyright (c) 2014, AirBitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#ifndef SIDCORE_JSON_JSON_PTR_HPP
#define SIDCORE_JSON_JSON_PTR_HPP

#include "../util/Status.hpp"
#include <jansson.h>
#include <string>

namespace sidcore {

/**
 * Owns a single reference to a jansson value.
 * Ownership can move between pointers, but never be shared.
 */
class JsonPtr
{
public:
    JsonPtr();
    explicit JsonPtr(json_t *root);
    JsonPtr(JsonPtr &&move);
    JsonPtr &operator=(JsonPtr &&move);
    ~JsonPtr();

    JsonPtr(const JsonPtr &) = delete;
    JsonPtr &operator=(const JsonPtr &) = delete;

    /**
     * Drops the current value, taking ownership of a new one.
     */
    void
    reset(json_t *root=nullptr);

    json_t *get() const { return root_; }
    explicit operator bool() const { return root_; }

    /**
     * Replaces the value with the contents of a JSON file.
     */
    Status
    load(const std::string &filename);

    /**
     * Replaces the value with a parsed JSON string.
     */
    Status
    decode(const std::string &data);

    /**
     * Writes the value out with sorted keys.
     */
    std::string
    encode(bool compact=false) const;

protected:
    json_t *root_;
};

} // namespace sidcore

#endif
