//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include <zcli/sdk/codec_plugin.hpp>

#include "common_helpers.hpp"
#include "dl/shared_library.hpp"
#include "logging.hpp"

#include <zcli/sdk/codec.hpp>
#include <zcli/sdk/error.hpp>

#include <algorithm>
#include <cerrno>
#include <cstddef>
#include <dirent.h>
#include <memory>
#include <string>
#include <sys/stat.h>
#include <utility>
#include <vector>

namespace zcli
{
namespace sdk
{
namespace
{

/// Forwards plugin registrations into the registry, and logs shadowed names.
///
class RegistrarImpl final : public CodecRegistrar
{
public:
    RegistrarImpl(CodecRegistry& registry, const std::string& plugin_path)
        : registry_{registry}
        , plugin_path_{plugin_path}
        , logger_{common::getLogger("codec")}
    {
    }

    std::size_t addedCount() const noexcept
    {
        return added_count_;
    }

    // MARK: CodecRegistrar

    void addEncoder(const std::string& name, Encoder encoder) override
    {
        if (!encoder)
        {
            logger_->warn("Plugin '{}' registered empty encoder '{}' (ignored).", plugin_path_, name);
            return;
        }
        if (registry_.registerEncoder(name, std::move(encoder)))
        {
            logger_->info("Encoder '{}' is replaced by plugin '{}'.", name, plugin_path_);
        }
        ++added_count_;
    }

    void addDecoder(const std::string& name, Decoder decoder) override
    {
        if (!decoder)
        {
            logger_->warn("Plugin '{}' registered empty decoder '{}' (ignored).", plugin_path_, name);
            return;
        }
        if (registry_.registerDecoder(name, std::move(decoder)))
        {
            logger_->info("Decoder '{}' is replaced by plugin '{}'.", name, plugin_path_);
        }
        ++added_count_;
    }

private:
    CodecRegistry&     registry_;
    const std::string& plugin_path_;
    common::LoggerPtr  logger_;
    std::size_t        added_count_{0};

};  // RegistrarImpl

bool hasSoSuffix(const std::string& name)
{
    static const std::string suffix{".so"};
    return (name.size() > suffix.size()) && (name.compare(name.size() - suffix.size(), suffix.size(), suffix) == 0);
}

/// Lists `*.so` files of a directory (non-recursively), sorted by name.
///
std::vector<std::string> listPluginFiles(const std::string& dir_path)
{
    std::vector<std::string> files;

    const std::unique_ptr<DIR, int (*)(DIR*)> dir{::opendir(dir_path.c_str()), &::closedir};
    if (!dir)
    {
        return files;
    }
    while (const auto* const entry = ::readdir(dir.get()))
    {
        const std::string name{entry->d_name};  // NOLINT(*-array-to-pointer-decay)
        if (hasSoSuffix(name))
        {
            files.push_back(dir_path + "/" + name);
        }
    }
    std::sort(files.begin(), files.end());
    return files;
}

class CodecPluginsImpl final : public CodecPlugins
{
public:
    CodecPluginsImpl()
        : logger_{common::getLogger("codec")}
    {
    }

    // MARK: CodecPlugins

    CETL_NODISCARD cetl::optional<Error> load(const std::string& path, CodecRegistry& registry) override
    {
        logger_->debug("Loading codec plugin '{}'...", path);

        auto open_result = common::dl::SharedLibrary::open(path);
        if (const auto* const failure = cetl::get_if<common::dl::SharedLibrary::Open::Failure>(&open_result))
        {
            struct stat st{};
            const int   code = (::stat(path.c_str(), &st) == 0) ? EINVAL : ENOENT;
            return Error{code, "Failed to load plugin '" + path + "': " + *failure};
        }
        auto library = cetl::get<common::dl::SharedLibrary>(std::move(open_result));

        // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
        const auto entry = reinterpret_cast<CodecPluginEntry>(library.symbol(ZCLI_CODEC_PLUGIN_ENTRY_NAME));
        if (entry == nullptr)
        {
            return Error{EINVAL, "Plugin '" + path + "' has no '" ZCLI_CODEC_PLUGIN_ENTRY_NAME "' entry point."};
        }

        RegistrarImpl registrar{registry, path};
        const auto    err_msg = common::performCatchingMessage([entry, &registrar] {
            //
            entry(registrar);
        });
        if (!err_msg.empty())
        {
            return Error{EINVAL, "Plugin '" + path + "' failed to register codecs: " + err_msg};
        }

        logger_->debug("Plugin '{}' registered {} codec function(s).", path, registrar.addedCount());
        libraries_.push_back(std::move(library));
        return cetl::nullopt;
    }

    std::size_t loadSearchPath(const std::string& search_path, CodecRegistry& registry) override
    {
        std::size_t loaded = 0;
        for (const auto& entry : common::splitNonEmpty(search_path, ':'))
        {
            for (const auto& file : expandEntry(entry))
            {
                if (const auto error = load(file, registry))
                {
                    logger_->error("{} (err={})", error->text, error->code);
                    continue;
                }
                ++loaded;
            }
        }
        return loaded;
    }

    std::size_t loadedCount() const noexcept override
    {
        return libraries_.size();
    }

private:
    std::vector<std::string> expandEntry(const std::string& entry) const
    {
        struct stat st{};
        if ((::stat(entry.c_str(), &st) == 0) && S_ISDIR(st.st_mode))  // NOLINT(*-signed-bitwise)
        {
            auto files = listPluginFiles(entry);
            logger_->debug("Found {} plugin file(s) in '{}'.", files.size(), entry);
            return files;
        }
        // Anything else (including missing paths) is tried as a library file, so that failures get reported.
        return {entry};
    }

    common::LoggerPtr                      logger_;
    std::vector<common::dl::SharedLibrary> libraries_;

};  // CodecPluginsImpl

}  // namespace

CodecPlugins::Ptr CodecPlugins::make()
{
    return std::make_unique<CodecPluginsImpl>();
}

}  // namespace sdk
}  // namespace zcli
