//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef ZCLI_SDK_NETWORK_GRAPH_HPP_INCLUDED
#define ZCLI_SDK_NETWORK_GRAPH_HPP_INCLUDED

#include "error.hpp"

#include <nlohmann/json.hpp>

#include <cetl/cetl.hpp>
#include <cetl/pf17/cetlpf.hpp>

#include <cstddef>
#include <string>
#include <unordered_map>
#include <vector>

namespace zcli
{
namespace sdk
{

using JsonValue = nlohmann::ordered_json;

/// Snapshot of the Zenoh network topology, as seen from the local session.
///
/// Nodes are identified by their zid; edges go from a router to the nodes it has sessions with.
/// Adding an already known node updates its attributes (metadata is only replaced by a non-null value).
///
class NetworkGraph final
{
public:
    struct Node final
    {
        std::string zid;
        std::string whatami;
        JsonValue   metadata;

    };  // Node

    struct Edge final
    {
        std::string from;
        std::string to;
        std::string protocols;  // comma-separated, f.e. "tcp,udp"

    };  // Edge

    void addNode(const std::string& zid, const std::string& whatami, const JsonValue& metadata = JsonValue{});
    void addEdge(const std::string& from, const std::string& to, const std::string& protocols);

    /// Adds a router (and its sessions) described by a reply to the `@/<zid>/router` admin query.
    ///
    /// @return `cetl::nullopt` on success, or `EINVAL` error if the reply is not an expected JSON document.
    ///
    CETL_NODISCARD cetl::optional<Error> addRouterInfo(const std::string& json_text);

    const std::vector<Node>& nodes() const noexcept
    {
        return nodes_;
    }

    const std::vector<Edge>& edges() const noexcept
    {
        return edges_;
    }

    const Node* findNode(const std::string& zid) const;

    /// Makes label of a node by resolving the JSON pointer within its metadata.
    ///
    /// Falls back to the first 5 characters of the zid if the pointer does not resolve.
    ///
    std::string labelOf(const Node& node, const std::string& metadata_pointer) const;

    struct RenderDot final
    {
        using Success = std::string;
        using Failure = Error;
        using Result  = cetl::variant<Success, Failure>;
    };
    /// Writes the graph (without layout) as a Graphviz DOT document.
    ///
    /// @param self_zid The zid of the local session; its node is labeled "Me!" and highlighted.
    /// @param metadata_pointer JSON pointer used for node labels (see `labelOf`).
    ///
    CETL_NODISCARD RenderDot::Result renderDot(const std::string& self_zid, const std::string& metadata_pointer) const;

    /// Lays the graph out (with the `neato` engine), and renders it to an image file.
    ///
    /// @param format Graphviz output format, f.e. `png` or `svg`.
    /// @return `cetl::nullopt` on success, or `EIO` error if the layout or rendering has failed.
    ///
    CETL_NODISCARD cetl::optional<Error> renderToFile(const std::string& self_zid,
                                                      const std::string& metadata_pointer,
                                                      const std::string& format,
                                                      const std::string& file_path) const;

    /// Lays the graph out, and shows it in an interactive window (the `xlib` device).
    ///
    /// Blocks until the window is closed.
    ///
    CETL_NODISCARD cetl::optional<Error> display(const std::string& self_zid,
                                                 const std::string& metadata_pointer) const;

private:
    std::vector<Node>                            nodes_;
    std::vector<Edge>                            edges_;
    std::unordered_map<std::string, std::size_t> node_index_;

};  // NetworkGraph

/// Resolves RFC 6901 JSON pointer (f.e. `/name` or `/tags/0`) within the given JSON value.
///
/// @return Pointer to the referenced value, or `nullptr` if the pointer does not resolve
///         (including array indices which are out of range of any array).
///
const JsonValue* resolveJsonPointer(const JsonValue& root, const std::string& pointer);

}  // namespace sdk
}  // namespace zcli

#endif  // ZCLI_SDK_NETWORK_GRAPH_HPP_INCLUDED
