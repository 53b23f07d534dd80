/*
 * MethodResolver.cpp
 *
 *  Delegated method lookup along prototype links.
 */

#include "../headers/autopo_internal.h"

namespace autopo
{
    MethodResolver::MethodResolver(std::shared_ptr<ObjectStore> store, int maxDepth) :
        store(std::move(store)), maxDepth(maxDepth)
    {
        if (!this->store)
            throw std::invalid_argument("MethodResolver needs an object store");
    }

    /**
     * @brief Finds the nearest declaring object for \a methodName.
     *
     * The walk starts at \a startId (depth 0) and follows outbound
     * prototype links breadth first, so the shallowest declaration wins and
     * ties at equal depth go to the earliest added link. Objects beyond
     * maxDepth are never visited: a chain that only declares the method
     * deeper than that is a miss, not an error.
     */
    std::optional<ResolvedMethod> MethodResolver::resolve(const std::string& startId, const std::string& methodName) const
    {
        const std::vector<TraversalMatch> matches = store->graphTraverse(
            startId,
            AUTOPO_PROTOTYPE_LINKS,
            maxDepth,
            [&methodName](const ObjectDocument& document) { return document.hasMethod(methodName); },
            1);

        if (matches.empty())
        {
            if (diagEnabled())
                fprintf(stderr, "DEBUG: [RESOLVE] %s.%s not found (max depth %d)\n",
                        startId.c_str(), methodName.c_str(), maxDepth);
            return std::nullopt;
        }

        const TraversalMatch& match = matches.front();
        const std::string* body = match.document.getMethod(methodName);
        if (!body)
            return std::nullopt;

        if (diagEnabled())
            fprintf(stderr, "DEBUG: [RESOLVE] %s.%s found on %s at depth %d\n",
                    startId.c_str(), methodName.c_str(), match.objectId.c_str(), match.depth);
        return ResolvedMethod{match.objectId, *body, match.depth};
    }
}
