//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "io/io.hpp"

#include <cetl/pf17/cetlpf.hpp>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <array>
#include <cerrno>
#include <cstdlib>
#include <fcntl.h>
#include <string>
#include <unistd.h>
#include <utility>

namespace
{

using namespace zcli::common::io;  // NOLINT This our main concern here in the unit tests.

using testing::_;
using testing::VariantWith;

// NOLINTBEGIN(cppcoreguidelines-avoid-magic-numbers, readability-magic-numbers)

class TestIo : public testing::Test
{
protected:
    void TearDown() override
    {
        if (!temp_path_.empty())
        {
            ::unlink(temp_path_.c_str());
        }
    }

    std::string makeTempFile(const std::string& content)
    {
        std::string path_template{"/tmp/zcli_io_XXXXXX"};
        const int   fd = ::mkstemp(&path_template[0]);
        EXPECT_THAT(fd, testing::Ge(0));
        EXPECT_THAT(::write(fd, content.data(), content.size()), static_cast<ssize_t>(content.size()));
        ::close(fd);
        temp_path_ = path_template;
        return temp_path_;
    }

    // MARK: Data members:

    // NOLINTBEGIN
    std::string temp_path_;
    // NOLINTEND
};

// MARK: - Tests:

TEST_F(TestIo, open_and_read_file)
{
    // Bigger than a single read chunk.
    const std::string content(10000, 'z');
    const auto        path = makeTempFile(content);

    auto open_result = openForReading(path);
    ASSERT_THAT(open_result, VariantWith<OpenForReading::Success>(_));
    const auto fd = cetl::get<OwnFd>(std::move(open_result));

    EXPECT_THAT(readAll(static_cast<int>(fd)), VariantWith<ReadAll::Success>(content));

    // Already at the end.
    EXPECT_THAT(readAll(static_cast<int>(fd)), VariantWith<ReadAll::Success>(""));
}

TEST_F(TestIo, open_missing_file)
{
    EXPECT_THAT(openForReading("/no/such/dir/file.txt"), VariantWith<OpenForReading::Failure>(ENOENT));
}

TEST_F(TestIo, read_directory_fails)
{
    auto open_result = openForReading("/tmp");
    ASSERT_THAT(open_result, VariantWith<OpenForReading::Success>(_));
    const auto fd = cetl::get<OwnFd>(std::move(open_result));

    EXPECT_THAT(readAll(static_cast<int>(fd)), VariantWith<ReadAll::Failure>(EISDIR));
}

TEST_F(TestIo, own_fd_closes_descriptor)
{
    std::array<int, 2> fds{};
    ASSERT_THAT(::pipe(fds.data()), 0);

    OwnFd read_end{fds[0]};
    {
        OwnFd write_end{fds[1]};
        OwnFd moved{std::move(write_end)};
        EXPECT_THAT(static_cast<int>(write_end), -1);  // NOLINT(bugprone-use-after-move)
        EXPECT_THAT(static_cast<int>(moved), fds[1]);
        EXPECT_THAT(::write(static_cast<int>(moved), "abc", 3), 3);
    }

    // The write end is closed, so reading reaches the end of file.
    EXPECT_THAT(readAll(static_cast<int>(read_end)), VariantWith<ReadAll::Success>("abc"));

    read_end.reset();
    EXPECT_THAT(static_cast<int>(read_end), -1);
    EXPECT_THAT(::fcntl(fds[0], F_GETFD), -1);  // NOLINT(*-vararg)
}

// NOLINTEND(cppcoreguidelines-avoid-magic-numbers, readability-magic-numbers)

}  // namespace
