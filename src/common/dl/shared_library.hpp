//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef ZCLI_COMMON_DL_SHARED_LIBRARY_HPP_INCLUDED
#define ZCLI_COMMON_DL_SHARED_LIBRARY_HPP_INCLUDED

#include <cetl/cetl.hpp>
#include <cetl/pf17/cetlpf.hpp>

#include <string>
#include <utility>

namespace zcli
{
namespace common
{
namespace dl
{

/// RAII wrapper for a handle of a dynamically loaded library.
///
/// Libraries are opened with `RTLD_NODELETE`, so closing the handle never unmaps the code
/// (functions obtained from the library stay callable).
///
class SharedLibrary final
{
public:
    struct Open final
    {
        using Success = SharedLibrary;
        using Failure = std::string;  // `dlerror` text
        using Result  = cetl::variant<Success, Failure>;
    };
    CETL_NODISCARD static Open::Result open(const std::string& path);

    SharedLibrary(SharedLibrary&& other) noexcept
        : handle_{std::exchange(other.handle_, nullptr)}
        , path_{std::move(other.path_)}
    {
    }

    SharedLibrary& operator=(SharedLibrary&& other) noexcept
    {
        const SharedLibrary old{std::move(*this)};
        handle_ = std::exchange(other.handle_, nullptr);
        path_   = std::move(other.path_);
        return *this;
    }

    // Disallow copy.
    SharedLibrary(const SharedLibrary&)            = delete;
    SharedLibrary& operator=(const SharedLibrary&) = delete;

    ~SharedLibrary();

    /// Looks up an exported symbol.
    ///
    /// @return `nullptr` if there is no such symbol.
    ///
    void* symbol(const char* const name) const;

    const std::string& path() const noexcept
    {
        return path_;
    }

private:
    SharedLibrary(void* const handle, std::string path)
        : handle_{handle}
        , path_{std::move(path)}
    {
    }

    void*       handle_;
    std::string path_;

};  // SharedLibrary

}  // namespace dl
}  // namespace common
}  // namespace zcli

#endif  // ZCLI_COMMON_DL_SHARED_LIBRARY_HPP_INCLUDED
