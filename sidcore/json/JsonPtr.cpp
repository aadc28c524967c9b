/*
 * Copyright (c) 2014, AirBitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#include "JsonPtr.hpp"
#include "../util/Debug.hpp"
#include "../util/FileIO.hpp"
#include <stdlib.h>
#include <new>

namespace sidcore {

static const size_t dumpFlags = JSON_INDENT(4) | JSON_SORT_KEYS;
static const size_t dumpFlagsCompact = JSON_COMPACT | JSON_SORT_KEYS;

static Status
jsonLoadError(const std::string &what, const json_error_t &error)
{
    return SID_ERROR(SID_CC_JSONError, what + ":" +
                     std::to_string(error.line) + ": " + error.text);
}

JsonPtr::JsonPtr():
    root_(nullptr)
{
}

JsonPtr::JsonPtr(json_t *root):
    root_(root)
{
}

JsonPtr::JsonPtr(JsonPtr &&move):
    root_(move.root_)
{
    move.root_ = nullptr;
}

JsonPtr &
JsonPtr::operator=(JsonPtr &&move)
{
    if (this != &move)
    {
        reset(move.root_);
        move.root_ = nullptr;
    }
    return *this;
}

JsonPtr::~JsonPtr()
{
    reset();
}

void
JsonPtr::reset(json_t *root)
{
    json_t *old = root_;
    root_ = root;
    if (old)
        json_decref(old);
}

Status
JsonPtr::load(const std::string &filename)
{
    SID_DebugLog("Reading JSON file %s", filename.c_str());
    if (!fileExists(filename))
        return SID_ERROR(SID_CC_FileDoesNotExist, "No JSON file " + filename);

    json_error_t error;
    json_t *root = json_load_file(filename.c_str(), 0, &error);
    if (!root)
        return jsonLoadError(filename, error);

    reset(root);
    return Status();
}

Status
JsonPtr::decode(const std::string &data)
{
    json_error_t error;
    json_t *root = json_loadb(data.data(), data.size(), 0, &error);
    if (!root)
        return jsonLoadError("<string>", error);

    reset(root);
    return Status();
}

std::string
JsonPtr::encode(bool compact) const
{
    char *raw = json_dumps(root_, compact ? dumpFlagsCompact : dumpFlags);
    if (!raw)
        throw std::bad_alloc();

    std::string out(raw);
    free(raw);
    return out;
}

} // namespace sidcore
