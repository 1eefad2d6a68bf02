//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef ZCLI_SDK_CODEC_HPP_INCLUDED
#define ZCLI_SDK_CODEC_HPP_INCLUDED

#include "error.hpp"

#include <cetl/cetl.hpp>
#include <cetl/pf17/cetlpf.hpp>

#include <cstdint>
#include <functional>
#include <map>
#include <stdexcept>
#include <string>
#include <vector>

namespace zcli
{
namespace sdk
{

/// Raw bytes as they travel over the Zenoh session.
///
using Payload = std::vector<std::uint8_t>;

/// Converts a human-facing value into wire bytes.
///
/// The key expression is passed along so that an encoder may choose a schema per key.
/// Malformed values are reported by throwing `CodecError` (any `std::exception` is tolerated).
///
using Encoder = std::function<Payload(const std::string& key, const std::string& value)>;

/// Converts wire bytes into a human-facing value.
///
/// Malformed payloads are reported by throwing `CodecError` (any `std::exception` is tolerated).
///
using Decoder = std::function<std::string(const std::string& key, const Payload& payload)>;

class CodecError : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;

};  // CodecError

struct Codec final
{
    Encoder encoder;
    Decoder decoder;

};  // Codec

/// Process-wide mapping from a codec name to its encoder and decoder.
///
/// Encoders and decoders are kept in two independent groups (a plugin may contribute only one of them).
/// The last registration for a given name wins. The registry is populated once at startup,
/// and is read-only afterwards, so it is not thread-safe by itself.
///
class CodecRegistry final
{
public:
    struct ResolveEncoder final
    {
        using Success = Encoder;
        using Failure = Error;  // `ENOENT` for unknown names
        using Result  = cetl::variant<Success, Failure>;
    };
    struct ResolveDecoder final
    {
        using Success = Decoder;
        using Failure = Error;  // `ENOENT` for unknown names
        using Result  = cetl::variant<Success, Failure>;
    };
    struct ResolveCodec final
    {
        using Success = Codec;
        using Failure = Error;  // `ENOENT` if any of the two halves is unknown
        using Result  = cetl::variant<Success, Failure>;
    };

    CodecRegistry() = default;

    /// Registers both halves of a codec.
    ///
    /// @return `true` if any previous registration under the same name was replaced.
    ///
    bool registerCodec(const std::string& name, Encoder encoder, Decoder decoder);

    /// @return `true` if a previous encoder with the same name was replaced.
    ///
    bool registerEncoder(const std::string& name, Encoder encoder);

    /// @return `true` if a previous decoder with the same name was replaced.
    ///
    bool registerDecoder(const std::string& name, Decoder decoder);

    CETL_NODISCARD ResolveEncoder::Result resolveEncoder(const std::string& name) const;
    CETL_NODISCARD ResolveDecoder::Result resolveDecoder(const std::string& name) const;
    CETL_NODISCARD ResolveCodec::Result   resolve(const std::string& name) const;

    /// Names of the registered encoders (sorted).
    std::vector<std::string> encoderNames() const;

    /// Names of the registered decoders (sorted).
    std::vector<std::string> decoderNames() const;

private:
    std::map<std::string, Encoder> encoders_;
    std::map<std::string, Decoder> decoders_;

};  // CodecRegistry

/// Registers the bundled `text`, `base64` and `json` codecs.
///
void registerBuiltinCodecs(CodecRegistry& registry);

}  // namespace sdk
}  // namespace zcli

#endif  // ZCLI_SDK_CODEC_HPP_INCLUDED
