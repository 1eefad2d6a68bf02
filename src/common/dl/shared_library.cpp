//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "shared_library.hpp"

#include "logging.hpp"

#include <dlfcn.h>
#include <string>

namespace zcli
{
namespace common
{
namespace dl
{

SharedLibrary::Open::Result SharedLibrary::open(const std::string& path)
{
    ::dlerror();  // clear any stale error
    void* const handle = ::dlopen(path.c_str(), RTLD_NOW | RTLD_LOCAL | RTLD_NODELETE);
    if (handle == nullptr)
    {
        const char* const err = ::dlerror();
        return std::string{(err != nullptr) ? err : "unknown dlopen error"};
    }
    getLogger("io")->trace("Opened shared library '{}'.", path);
    return SharedLibrary{handle, path};
}

SharedLibrary::~SharedLibrary()
{
    if (handle_ != nullptr)
    {
        if (::dlclose(handle_) != 0)
        {
            const char* const err = ::dlerror();
            getLogger("io")->warn("Failed to close shared library '{}': {}.", path_, (err != nullptr) ? err : "?");
        }
        handle_ = nullptr;
    }
}

void* SharedLibrary::symbol(const char* const name) const
{
    if (handle_ == nullptr)
    {
        return nullptr;
    }
    ::dlerror();
    return ::dlsym(handle_, name);
}

}  // namespace dl
}  // namespace common
}  // namespace zcli
