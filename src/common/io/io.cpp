//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "io.hpp"

#include "logging.hpp"

#include <array>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <string>
#include <sys/types.h>
#include <unistd.h>

namespace zcli
{
namespace common
{
namespace io
{

void OwnFd::reset() noexcept
{
    if (fd_ >= 0)
    {
        // Do not use `posixSyscallError` here b/c `close` should not be repeated on `EINTR`.
        if (::close(fd_) < 0)
        {
            const int err = errno;
            getLogger("io")->error("Failed to close file descriptor {}: {}.", fd_, std::strerror(err));
        }

        fd_ = -1;
    }
}

OwnFd::~OwnFd()
{
    reset();
}

OpenForReading::Result openForReading(const std::string& path)
{
    int fd = -1;
    if (const auto err = posixSyscallError([&fd, &path] {
            //
            return fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);  // NOLINT(*-vararg)
        }))
    {
        getLogger("io")->debug("Failed to open '{}' (err={}).", path, err);
        return err;
    }
    return OwnFd{fd};
}

ReadAll::Result readAll(const int fd)
{
    constexpr std::size_t            ChunkSize = 4096;
    std::array<char, ChunkSize>      chunk{};
    std::string                      result;

    while (true)
    {
        ssize_t bytes_read = 0;
        if (const auto err = posixSyscallError([fd, &chunk, &bytes_read] {
                //
                return bytes_read = ::read(fd, chunk.data(), chunk.size());
            }))
        {
            getLogger("io")->debug("Failed to read fd={} (err={}).", fd, err);
            return err;
        }
        if (bytes_read == 0)
        {
            break;
        }
        result.append(chunk.data(), static_cast<std::size_t>(bytes_read));
    }
    return result;
}

}  // namespace io
}  // namespace common
}  // namespace zcli
