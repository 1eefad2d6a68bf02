//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "dl/shared_library.hpp"

#include <cetl/pf17/cetlpf.hpp>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <string>
#include <utility>

namespace
{

using namespace zcli::common::dl;  // NOLINT This our main concern here in the unit tests.

using testing::_;
using testing::HasSubstr;
using testing::IsNull;
using testing::NotNull;
using testing::VariantWith;

// MARK: - Tests:

TEST(TestSharedLibrary, open_and_lookup)
{
    auto open_result = SharedLibrary::open(ZCLI_TEST_HEX_PLUGIN);
    ASSERT_THAT(open_result, VariantWith<SharedLibrary::Open::Success>(_));

    auto library = cetl::get<SharedLibrary>(std::move(open_result));
    EXPECT_THAT(library.path(), ZCLI_TEST_HEX_PLUGIN);
    EXPECT_THAT(library.symbol("zcli_register_codecs"), NotNull());
    EXPECT_THAT(library.symbol("zcli_no_such_symbol"), IsNull());

    const SharedLibrary moved{std::move(library)};
    EXPECT_THAT(moved.path(), ZCLI_TEST_HEX_PLUGIN);
    EXPECT_THAT(moved.symbol("zcli_register_codecs"), NotNull());
}

TEST(TestSharedLibrary, open_missing)
{
    EXPECT_THAT(SharedLibrary::open("/no/such/dir/libmissing.so"),
                VariantWith<SharedLibrary::Open::Failure>(HasSubstr("libmissing.so")));
}

}  // namespace
