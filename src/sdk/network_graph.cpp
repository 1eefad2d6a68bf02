//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include <zcli/sdk/network_graph.hpp>

#include "logging.hpp"

#include <zcli/sdk/error.hpp>

#include <graphviz/cgraph.h>
#include <graphviz/gvc.h>

#include <nlohmann/json.hpp>

#include <cerrno>
#include <cstddef>
#include <cstdio>
#include <cstdlib>
#include <functional>
#include <limits>
#include <memory>
#include <string>
#include <vector>

namespace zcli
{
namespace sdk
{
namespace
{

constexpr std::size_t ShortZidLength = 5;

/// Extracts the protocol of a locator (`tcp/10.0.0.1:7447` -> `tcp`).
///
std::string protocolOf(const std::string& locator)
{
    return locator.substr(0, locator.find('/'));
}

const JsonValue* memberOf(const JsonValue& object, const char* const name)
{
    if (!object.is_object())
    {
        return nullptr;
    }
    const auto it = object.find(name);
    return (it != object.end()) ? &*it : nullptr;
}

/// @return The string member, or empty string if there is no such member (or it is not a string).
///
std::string stringMemberOf(const JsonValue& object, const char* const name)
{
    const auto* const member = memberOf(object, name);
    return ((member != nullptr) && member->is_string()) ? member->get<std::string>() : std::string{};
}

/// Joins protocols of session links.
///
/// Links are either objects with a `src` locator (newer routers), or plain locator strings (older ones).
///
std::string linkProtocols(const JsonValue* const links)
{
    std::string joined;
    if ((links == nullptr) || !links->is_array())
    {
        return joined;
    }
    for (const auto& link : *links)
    {
        std::string locator;
        if (link.is_object())
        {
            locator = stringMemberOf(link, "src");
        }
        else if (link.is_string())
        {
            locator = link.get<std::string>();
        }
        if (locator.empty())
        {
            continue;
        }
        if (!joined.empty())
        {
            joined += ',';
        }
        joined += protocolOf(locator);
    }
    return joined;
}

const char* fillColorOf(const std::string& whatami)
{
    if (whatami == "router")
    {
        return "steelblue";
    }
    if (whatami == "client")
    {
        return "lightgreen";
    }
    return "aliceblue";
}

/// Unescapes a single reference token of a JSON pointer (`~1` -> `/`, `~0` -> `~`).
///
std::string unescapeToken(const std::string& token)
{
    std::string result;
    for (std::size_t i = 0; i < token.size(); ++i)
    {
        if ((token[i] == '~') && ((i + 1) < token.size()))
        {
            if (token[i + 1] == '1')
            {
                result += '/';
                ++i;
                continue;
            }
            if (token[i + 1] == '0')
            {
                result += '~';
                ++i;
                continue;
            }
        }
        result += token[i];
    }
    return result;
}

/// Parses an array index token (decimal digits, no leading zeros).
///
cetl::optional<std::size_t> arrayIndexOf(const std::string& token)
{
    if (token.empty() || ((token.size() > 1) && (token.front() == '0')))
    {
        return cetl::nullopt;
    }
    // Longer indices are beyond any array anyway (and would overflow below).
    if (token.size() > static_cast<std::size_t>(std::numeric_limits<std::size_t>::digits10))
    {
        return cetl::nullopt;
    }

    std::size_t index = 0;
    for (const char ch : token)
    {
        if ((ch < '0') || (ch > '9'))
        {
            return cetl::nullopt;
        }
        index = (index * 10U) + static_cast<std::size_t>(ch - '0');  // NOLINT(*-magic-numbers)
    }
    return index;
}

// MARK: - Graphviz:

/// Graphviz C API takes names and values as mutable strings (but never modifies them).
///
char* gvText(const char* const text)
{
    return const_cast<char*>(text);  // NOLINT(cppcoreguidelines-pro-type-const-cast)
}

char* gvText(const std::string& text)
{
    return gvText(text.c_str());
}

struct AgraphCloser final
{
    void operator()(Agraph_t* const graph) const noexcept
    {
        agclose(graph);
    }
};
using AgraphPtr = std::unique_ptr<Agraph_t, AgraphCloser>;

struct GvcFreer final
{
    void operator()(GVC_t* const gvc) const noexcept
    {
        gvFreeContext(gvc);
    }
};
using GvcPtr = std::unique_ptr<GVC_t, GvcFreer>;

AgraphPtr makeAgraph(const NetworkGraph& graph, const std::string& self_zid, const std::string& metadata_pointer)
{
    AgraphPtr agraph{agopen(gvText("zenoh"), Agundirected, nullptr)};
    if (!agraph)
    {
        return agraph;
    }
    auto* const g = agraph.get();

    agattr(g, AGRAPH, gvText("bgcolor"), gvText("black"));
    agattr(g, AGRAPH, gvText("overlap"), gvText("false"));
    agattr(g, AGNODE, gvText("style"), gvText("filled"));
    agattr(g, AGNODE, gvText("fontcolor"), gvText("darkgrey"));
    agattr(g, AGNODE, gvText("fontname"), gvText("Helvetica-Bold"));
    agattr(g, AGNODE, gvText("fillcolor"), gvText("aliceblue"));
    agattr(g, AGNODE, gvText("label"), gvText("\\N"));
    agattr(g, AGNODE, gvText("whatami"), gvText(""));
    agattr(g, AGEDGE, gvText("color"), gvText("white"));
    agattr(g, AGEDGE, gvText("fontcolor"), gvText("white"));
    agattr(g, AGEDGE, gvText("label"), gvText(""));

    for (const auto& node : graph.nodes())
    {
        Agnode_t* const ag_node = agnode(g, gvText(node.zid), 1);
        if (ag_node == nullptr)
        {
            return nullptr;
        }
        const bool is_self = node.zid == self_zid;
        const auto label   = is_self ? std::string{"Me!"} : graph.labelOf(node, metadata_pointer);

        agset(ag_node, gvText("label"), gvText(label));
        agset(ag_node, gvText("whatami"), gvText(node.whatami));
        agset(ag_node, gvText("fillcolor"), gvText(is_self ? "lightcoral" : fillColorOf(node.whatami)));
    }
    for (const auto& edge : graph.edges())
    {
        Agnode_t* const from = agnode(g, gvText(edge.from), 1);
        Agnode_t* const to   = agnode(g, gvText(edge.to), 1);
        if ((from == nullptr) || (to == nullptr))
        {
            return nullptr;
        }
        Agedge_t* const ag_edge = agedge(g, from, to, nullptr, 1);
        if (ag_edge == nullptr)
        {
            return nullptr;
        }
        agset(ag_edge, gvText("label"), gvText(edge.protocols));
    }
    return agraph;
}

/// Lays out the graph with the `neato` engine, and then renders it with the given action.
///
cetl::optional<Error> layoutAndRender(const NetworkGraph&                            graph,
                                      const std::string&                             self_zid,
                                      const std::string&                             metadata_pointer,
                                      const std::function<int(GVC_t*, Agraph_t*)>& render)
{
    const GvcPtr gvc{gvContext()};
    if (!gvc)
    {
        return Error{ENOMEM, "Failed to create Graphviz context."};
    }
    const auto agraph = makeAgraph(graph, self_zid, metadata_pointer);
    if (!agraph)
    {
        return Error{ENOMEM, "Failed to build Graphviz graph."};
    }

    if (gvLayout(gvc.get(), agraph.get(), "neato") != 0)
    {
        return Error{EIO, "Failed to lay out the network graph."};
    }
    const int rendered = render(gvc.get(), agraph.get());
    gvFreeLayout(gvc.get(), agraph.get());

    if (rendered != 0)
    {
        return Error{EIO, "Failed to render the network graph."};
    }
    return cetl::nullopt;
}

}  // namespace

const JsonValue* resolveJsonPointer(const JsonValue& root, const std::string& pointer)
{
    if (pointer.empty())
    {
        return &root;
    }
    if (pointer.front() != '/')
    {
        return nullptr;
    }

    const JsonValue* current = &root;

    std::size_t begin = 1;
    while (true)
    {
        const auto end   = pointer.find('/', begin);
        const auto token = unescapeToken(pointer.substr(begin, (end == std::string::npos) ? end : end - begin));

        if (current->is_object())
        {
            current = memberOf(*current, token.c_str());
            if (current == nullptr)
            {
                return nullptr;
            }
        }
        else if (current->is_array())
        {
            const auto index = arrayIndexOf(token);
            if (!index || (*index >= current->size()))
            {
                return nullptr;
            }
            current = &(*current)[*index];
        }
        else
        {
            return nullptr;
        }

        if (end == std::string::npos)
        {
            return current;
        }
        begin = end + 1;
    }
}

void NetworkGraph::addNode(const std::string& zid, const std::string& whatami, const JsonValue& metadata)
{
    const auto it = node_index_.find(zid);
    if (it == node_index_.end())
    {
        node_index_.emplace(zid, nodes_.size());
        nodes_.push_back(Node{zid, whatami, metadata});
        return;
    }

    auto& node = nodes_[it->second];
    if (!whatami.empty())
    {
        node.whatami = whatami;
    }
    if (!metadata.is_null())
    {
        node.metadata = metadata;
    }
}

void NetworkGraph::addEdge(const std::string& from, const std::string& to, const std::string& protocols)
{
    for (auto& edge : edges_)
    {
        // The graph is undirected, so there is at most one edge between two nodes.
        if (((edge.from == from) && (edge.to == to)) || ((edge.from == to) && (edge.to == from)))
        {
            edge.protocols = protocols;
            return;
        }
    }
    edges_.push_back(Edge{from, to, protocols});
}

cetl::optional<Error> NetworkGraph::addRouterInfo(const std::string& json_text)
{
    JsonValue root;
    try
    {
        root = JsonValue::parse(json_text);

    } catch (const JsonValue::parse_error& ex)
    {
        return Error{EINVAL, std::string{"Router info is not a JSON document: "} + ex.what()};
    }

    const auto zid = stringMemberOf(root, "zid");
    if (zid.empty())
    {
        return Error{EINVAL, "Router info has no 'zid' string."};
    }

    const auto* const metadata = memberOf(root, "metadata");
    addNode(zid, "router", (metadata != nullptr) ? *metadata : JsonValue{});

    const auto* const sessions = memberOf(root, "sessions");
    if ((sessions == nullptr) || !sessions->is_array())
    {
        return cetl::nullopt;
    }
    for (const auto& session : *sessions)
    {
        const auto peer = stringMemberOf(session, "peer");
        if (peer.empty())
        {
            common::getLogger("sdk")->warn("Skipping malformed session entry of router '{}'.", zid);
            continue;
        }
        addNode(peer, stringMemberOf(session, "whatami"));
        addEdge(zid, peer, linkProtocols(memberOf(session, "links")));
    }
    return cetl::nullopt;
}

const NetworkGraph::Node* NetworkGraph::findNode(const std::string& zid) const
{
    const auto it = node_index_.find(zid);
    return (it != node_index_.end()) ? &nodes_[it->second] : nullptr;
}

std::string NetworkGraph::labelOf(const Node& node, const std::string& metadata_pointer) const
{
    if (const auto* const value = resolveJsonPointer(node.metadata, metadata_pointer))
    {
        if (value->is_string())
        {
            return value->get<std::string>();
        }
        if (value->is_primitive() && !value->is_null())
        {
            return value->dump(-1, ' ', false, JsonValue::error_handler_t::replace);
        }
    }
    return node.zid.substr(0, ShortZidLength);
}

NetworkGraph::RenderDot::Result NetworkGraph::renderDot(const std::string& self_zid,
                                                        const std::string& metadata_pointer) const
{
    const auto agraph = makeAgraph(*this, self_zid, metadata_pointer);
    if (!agraph)
    {
        return Error{ENOMEM, "Failed to build Graphviz graph."};
    }

    char*       buffer = nullptr;
    std::size_t size   = 0;
    FILE* const stream = ::open_memstream(&buffer, &size);
    if (stream == nullptr)
    {
        return Error{errno, "Failed to open memory stream for the DOT document."};
    }
    const int written = agwrite(agraph.get(), stream);
    std::fclose(stream);  // NOLINT(cert-err33-c)

    const std::unique_ptr<char, decltype(&std::free)> buffer_holder{buffer, &std::free};
    if ((written != 0) || (buffer == nullptr))
    {
        return Error{EIO, "Failed to write the DOT document."};
    }
    return std::string(buffer, size);
}

cetl::optional<Error> NetworkGraph::renderToFile(const std::string& self_zid,
                                                 const std::string& metadata_pointer,
                                                 const std::string& format,
                                                 const std::string& file_path) const
{
    auto error = layoutAndRender(*this, self_zid, metadata_pointer, [&format, &file_path](GVC_t* gvc, Agraph_t* g) {
        //
        return gvRenderFilename(gvc, g, format.c_str(), file_path.c_str());
    });
    if (error)
    {
        error->text += " (format='" + format + "', file='" + file_path + "')";
    }
    return error;
}

cetl::optional<Error> NetworkGraph::display(const std::string& self_zid, const std::string& metadata_pointer) const
{
    return layoutAndRender(*this, self_zid, metadata_pointer, [](GVC_t* gvc, Agraph_t* g) {
        //
        return gvRender(gvc, g, "xlib", nullptr);
    });
}

}  // namespace sdk
}  // namespace zcli
