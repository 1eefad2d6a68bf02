//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef ZCLI_REF_WRAPPER_HPP_INCLUDED
#define ZCLI_REF_WRAPPER_HPP_INCLUDED

namespace zcli
{

/// Lets a test keep a mock, while the code under test owns (and destroys) a handle of it.
///
/// Destruction of the handle is reported to the mock as `deinit()` call.
///
template <typename Interface, typename Reference>
struct RefWrapper : Interface
{
    explicit RefWrapper(Reference& reference)
        : reference_{reference}
    {
    }

    RefWrapper(const RefWrapper& other)          = delete;
    RefWrapper(RefWrapper&&) noexcept            = delete;
    RefWrapper& operator=(const RefWrapper&)     = delete;
    RefWrapper& operator=(RefWrapper&&) noexcept = delete;

    ~RefWrapper() override
    {
        reference_.deinit();
    }

    Reference& reference()
    {
        return reference_;
    }

private:
    Reference& reference_;

};  // RefWrapper

}  // namespace zcli

#endif  // ZCLI_REF_WRAPPER_HPP_INCLUDED
