#pragma once

#include <string>
#include <variant>

#include <megaapi.h>

#include <aiomega/client/types.h>
#include <aiomega/common/error.h>

namespace aiomega
{
namespace client
{

// Identifies a node by handle, by path or by the node itself.
using NodeId = std::variant<mega::MegaHandle, std::string, NodePtr>;

// The error reported when id doesn't resolve to any node.
common::Error notFound(const NodeId& id);

// Describes a node identifier in human readable form.
std::string toString(const NodeId& id);

// Check that id could plausibly identify a node.
//
// Null nodes, invalid handles and empty paths are rejected with
// INVALID_ARGUMENT.
common::Error validate(const NodeId& id);

} // client
} // aiomega

