#include <aiomega/client/node_id.h>
#include <aiomega/common/utility.h>

namespace aiomega
{
namespace client
{

using namespace common;

Error notFound(const NodeId& id)
{
    if (auto* handle = std::get_if<mega::MegaHandle>(&id))
        return nodeNotFound(mega::MegaError::API_ENOENT,
                            format("The node with the handle %llu doesn't exist anymore",
                                   static_cast<unsigned long long>(*handle)));

    if (auto* path = std::get_if<std::string>(&id))
        return nodeNotFound(mega::MegaError::API_ENOENT,
                            format("The node with path %s doesn't exist anymore",
                                   path->c_str()));

    return nodeNotFound(mega::MegaError::API_ENOENT,
                        format("The %s doesn't exist anymore",
                               toString(id).c_str()));
}

std::string toString(const NodeId& id)
{
    if (auto* handle = std::get_if<mega::MegaHandle>(&id))
        return format("handle %llu",
                      static_cast<unsigned long long>(*handle));

    if (auto* path = std::get_if<std::string>(&id))
        return format("path %s", path->c_str());

    auto& node = std::get<NodePtr>(id);

    if (!node)
        return "null node";

    return format("node %llu",
                  static_cast<unsigned long long>(node->getHandle()));
}

Error validate(const NodeId& id)
{
    if (auto* handle = std::get_if<mega::MegaHandle>(&id))
    {
        if (*handle == mega::INVALID_HANDLE)
            return invalidArgument(mega::MegaError::API_EARGS,
                                   "Invalid node handle");

        return Error();
    }

    if (auto* path = std::get_if<std::string>(&id))
    {
        if (path->empty())
            return invalidArgument(mega::MegaError::API_EARGS,
                                   "Invalid node path");

        return Error();
    }

    if (!std::get<NodePtr>(id))
        return invalidArgument(mega::MegaError::API_EARGS,
                               "No node was specified");

    return Error();
}

} // client
} // aiomega

