//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef ZCLI_SDK_CODEC_PLUGIN_HPP_INCLUDED
#define ZCLI_SDK_CODEC_PLUGIN_HPP_INCLUDED

#include "codec.hpp"
#include "error.hpp"

#include <cetl/cetl.hpp>
#include <cetl/pf17/cetlpf.hpp>

#include <cstddef>
#include <memory>
#include <string>

/// Name of the symbol every codec plugin library has to export.
///
/// The symbol must be declared as:
/// ```
/// extern "C" void zcli_register_codecs(zcli::sdk::CodecRegistrar& registrar);
/// ```
#define ZCLI_CODEC_PLUGIN_ENTRY_NAME "zcli_register_codecs"

/// Environment variable with a colon-separated list of plugin files and/or directories.
///
#define ZCLI_CODEC_PLUGIN_PATH_ENV "ZCLI_CODEC_PLUGIN_PATH"

namespace zcli
{
namespace sdk
{

/// Defines the interface through which a plugin contributes codecs.
///
/// There are two independent groups of extension points - encoders and decoders.
///
class CodecRegistrar
{
public:
    CodecRegistrar(CodecRegistrar&&)                 = delete;
    CodecRegistrar(const CodecRegistrar&)            = delete;
    CodecRegistrar& operator=(CodecRegistrar&&)      = delete;
    CodecRegistrar& operator=(const CodecRegistrar&) = delete;

    virtual ~CodecRegistrar() = default;

    virtual void addEncoder(const std::string& name, Encoder encoder) = 0;
    virtual void addDecoder(const std::string& name, Decoder decoder) = 0;

protected:
    CodecRegistrar() = default;

};  // CodecRegistrar

extern "C" {
using CodecPluginEntry = void (*)(CodecRegistrar& registrar);
}

/// Discovers and loads codec plugin libraries.
///
/// Loaded libraries are never unmapped from the process (even after this object is destroyed),
/// so encoders and decoders registered by them stay valid for the whole process lifetime.
///
class CodecPlugins
{
public:
    using Ptr = std::unique_ptr<CodecPlugins>;

    CETL_NODISCARD static Ptr make();

    CodecPlugins(CodecPlugins&&)                 = delete;
    CodecPlugins(const CodecPlugins&)            = delete;
    CodecPlugins& operator=(CodecPlugins&&)      = delete;
    CodecPlugins& operator=(const CodecPlugins&) = delete;

    virtual ~CodecPlugins() = default;

    /// Loads a single plugin library, and lets it register its codecs into the registry.
    ///
    /// @return `cetl::nullopt` on success, or the reason of the failure.
    ///         Codecs which were registered before a failure (f.e. an exception thrown by the plugin) stay registered.
    ///
    CETL_NODISCARD virtual cetl::optional<Error> load(const std::string& path, CodecRegistry& registry) = 0;

    /// Loads all plugins found by a colon-separated search path.
    ///
    /// Each entry is either a library file, or a directory scanned (non-recursively, in name order) for `*.so` files.
    /// Failures are logged and skipped, so that one broken plugin does not prevent others from loading.
    ///
    /// @return Number of successfully loaded libraries.
    ///
    virtual std::size_t loadSearchPath(const std::string& search_path, CodecRegistry& registry) = 0;

    virtual std::size_t loadedCount() const noexcept = 0;

protected:
    CodecPlugins() = default;

};  // CodecPlugins

}  // namespace sdk
}  // namespace zcli

#endif  // ZCLI_SDK_CODEC_PLUGIN_HPP_INCLUDED
