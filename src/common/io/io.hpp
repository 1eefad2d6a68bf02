//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef ZCLI_COMMON_IO_HPP_INCLUDED
#define ZCLI_COMMON_IO_HPP_INCLUDED

#include <cetl/cetl.hpp>
#include <cetl/pf17/cetlpf.hpp>

#include <cerrno>
#include <cstddef>
#include <string>
#include <utility>

namespace zcli
{
namespace common
{
namespace io
{

/// Wraps a POSIX syscall and retries it if it was interrupted by a signal.
///
/// @return Zero on success, or `errno` of the failed call.
///
template <typename Call>
int posixSyscallError(const Call& call)
{
    while (call() < 0)
    {
        const int error_num = errno;
        if (error_num != EINTR)
        {
            return error_num;
        }
    }
    return 0;
}

/// RAII wrapper for a file descriptor.
///
class OwnFd final
{
public:
    OwnFd()
        : fd_{-1}
    {
    }

    explicit OwnFd(const int fd)
        : fd_{fd}
    {
    }

    OwnFd(OwnFd&& other) noexcept
        : fd_{std::exchange(other.fd_, -1)}
    {
    }

    OwnFd& operator=(OwnFd&& other) noexcept
    {
        const OwnFd old{std::move(*this)};
        fd_ = std::exchange(other.fd_, -1);
        return *this;
    }

    // Disallow copy.
    OwnFd(const OwnFd&)            = delete;
    OwnFd& operator=(const OwnFd&) = delete;

    explicit operator int() const
    {
        return fd_;
    }

    void reset() noexcept;

    ~OwnFd();

private:
    int fd_;

};  // OwnFd

struct OpenForReading final
{
    using Success = OwnFd;
    using Failure = int;  // `errno`
    using Result  = cetl::variant<Success, Failure>;
};
/// Opens an existing file for reading.
///
CETL_NODISCARD OpenForReading::Result openForReading(const std::string& path);

struct ReadAll final
{
    using Success = std::string;
    using Failure = int;  // `errno`
    using Result  = cetl::variant<Success, Failure>;
};
/// Reads everything from the descriptor until the end of file.
///
/// The descriptor is not closed. Nothing is returned if any read fails midway.
///
CETL_NODISCARD ReadAll::Result readAll(const int fd);

}  // namespace io
}  // namespace common
}  // namespace zcli

#endif  // ZCLI_COMMON_IO_HPP_INCLUDED
