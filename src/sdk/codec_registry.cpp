//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include <zcli/sdk/codec.hpp>

#include "logging.hpp"

#include <cerrno>
#include <string>
#include <utility>
#include <vector>

namespace zcli
{
namespace sdk
{
namespace
{

template <typename Map>
std::vector<std::string> keysOf(const Map& map)
{
    std::vector<std::string> names;
    names.reserve(map.size());
    for (const auto& pair : map)
    {
        names.push_back(pair.first);
    }
    return names;  // `std::map` is already sorted
}

template <typename Map, typename Fn>
bool assign(Map& map, const std::string& name, Fn&& fn)
{
    auto it = map.find(name);
    if (it == map.end())
    {
        map.emplace(name, std::forward<Fn>(fn));
        return false;
    }
    it->second = std::forward<Fn>(fn);
    return true;
}

}  // namespace

bool CodecRegistry::registerCodec(const std::string& name, Encoder encoder, Decoder decoder)
{
    const bool enc_replaced = registerEncoder(name, std::move(encoder));
    const bool dec_replaced = registerDecoder(name, std::move(decoder));
    return enc_replaced || dec_replaced;
}

bool CodecRegistry::registerEncoder(const std::string& name, Encoder encoder)
{
    CETL_DEBUG_ASSERT(encoder, name.c_str());
    return assign(encoders_, name, std::move(encoder));
}

bool CodecRegistry::registerDecoder(const std::string& name, Decoder decoder)
{
    CETL_DEBUG_ASSERT(decoder, name.c_str());
    return assign(decoders_, name, std::move(decoder));
}

CodecRegistry::ResolveEncoder::Result CodecRegistry::resolveEncoder(const std::string& name) const
{
    const auto it = encoders_.find(name);
    if (it == encoders_.end())
    {
        return Error{ENOENT, "Unknown encoder '" + name + "'."};
    }
    return it->second;
}

CodecRegistry::ResolveDecoder::Result CodecRegistry::resolveDecoder(const std::string& name) const
{
    const auto it = decoders_.find(name);
    if (it == decoders_.end())
    {
        return Error{ENOENT, "Unknown decoder '" + name + "'."};
    }
    return it->second;
}

CodecRegistry::ResolveCodec::Result CodecRegistry::resolve(const std::string& name) const
{
    auto enc_result = resolveEncoder(name);
    if (auto* const failure = cetl::get_if<ResolveEncoder::Failure>(&enc_result))
    {
        return std::move(*failure);
    }
    auto dec_result = resolveDecoder(name);
    if (auto* const failure = cetl::get_if<ResolveDecoder::Failure>(&dec_result))
    {
        return std::move(*failure);
    }
    return Codec{cetl::get<Encoder>(std::move(enc_result)), cetl::get<Decoder>(std::move(dec_result))};
}

std::vector<std::string> CodecRegistry::encoderNames() const
{
    return keysOf(encoders_);
}

std::vector<std::string> CodecRegistry::decoderNames() const
{
    return keysOf(decoders_);
}

}  // namespace sdk
}  // namespace zcli
