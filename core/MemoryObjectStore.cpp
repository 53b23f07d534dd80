/*
 * MemoryObjectStore.cpp
 *
 *  In-process object graph. Documents and typed edge collections live
 *  behind one reader/writer lock; each update is a single locked
 *  read-modify-write, so a document is never observed half written.
 */

#include "../headers/autopo_internal.h"
#include <deque>
#include <set>
#include <unordered_map>

namespace autopo
{
    struct MemoryObjectStore::Impl
    {
        std::unordered_map<std::string, ObjectDocument> documents;
        // edgeType -> fromId -> ordered targets
        std::map<std::string, std::unordered_map<std::string, std::vector<std::string>>> edges;
        std::shared_timed_mutex mutex;
        std::chrono::milliseconds lockTimeout;

        std::shared_lock<std::shared_timed_mutex> readLock(const char* operation)
        {
            std::shared_lock<std::shared_timed_mutex> lock(mutex, std::defer_lock);
            if (!lock.try_lock_for(lockTimeout))
                throw TransportError("store", std::string(operation) + " timed out waiting for the store lock");
            return lock;
        }

        std::unique_lock<std::shared_timed_mutex> writeLock(const char* operation)
        {
            std::unique_lock<std::shared_timed_mutex> lock(mutex, std::defer_lock);
            if (!lock.try_lock_for(lockTimeout))
                throw TransportError("store", std::string(operation) + " timed out waiting for the store lock");
            return lock;
        }

        const std::vector<std::string>* outbound(const std::string& edgeType, const std::string& fromId) const
        {
            auto collection = edges.find(edgeType);
            if (collection == edges.end()) return nullptr;
            auto it = collection->second.find(fromId);
            return it != collection->second.end() ? &it->second : nullptr;
        }
    };

    MemoryObjectStore::MemoryObjectStore(std::chrono::milliseconds lockTimeout) :
        impl(std::make_unique<Impl>())
    {
        impl->lockTimeout = lockTimeout;
    }

    MemoryObjectStore::~MemoryObjectStore() = default;

    std::optional<ObjectDocument> MemoryObjectStore::get(const std::string& objectId)
    {
        auto lock = impl->readLock("get");
        auto it = impl->documents.find(objectId);
        if (it == impl->documents.end())
            return std::nullopt;
        return it->second;
    }

    StoreStatus MemoryObjectStore::create(const ObjectDocument& document)
    {
        auto lock = impl->writeLock("create");
        if (impl->documents.count(document.getId()))
            return StoreStatus::Conflict;
        ObjectDocument stored(document.getId(), document.getAttributes(), document.getMethods());
        impl->documents.emplace(document.getId(), std::move(stored));
        if (diagEnabled())
            fprintf(stderr, "DEBUG: [STORE] created %s\n", document.getId().c_str());
        return StoreStatus::Ok;
    }

    StoreStatus MemoryObjectStore::update(const std::string& objectId, const DocumentPatch& patch, bool merge)
    {
        auto lock = impl->writeLock("update");
        auto it = impl->documents.find(objectId);
        if (it == impl->documents.end())
            return StoreStatus::NotFound;

        ObjectDocument& document = it->second;
        if (patch.attributes)
        {
            if (merge)
            {
                for (const auto& entry : *patch.attributes)
                    document.setAttribute(entry.first, entry.second);
            }
            else
            {
                document.replaceAttributes(*patch.attributes);
            }
        }
        for (const auto& entry : patch.methods)
            document.installMethod(entry.first, entry.second);
        document.clearDirty();

        if (diagEnabled())
            fprintf(stderr, "DEBUG: [STORE] updated %s (attributes=%s, methods=%zu, merge=%d)\n",
                    objectId.c_str(), patch.attributes ? "yes" : "no", patch.methods.size(), merge ? 1 : 0);
        return StoreStatus::Ok;
    }

    StoreStatus MemoryObjectStore::link(const std::string& edgeType, const std::string& fromId, const std::string& toId)
    {
        auto lock = impl->writeLock("link");
        if (!impl->documents.count(fromId) || !impl->documents.count(toId))
            return StoreStatus::NotFound;
        std::vector<std::string>& targets = impl->edges[edgeType][fromId];
        for (const auto& existing : targets)
        {
            if (existing == toId)
                return StoreStatus::Conflict;
        }
        targets.push_back(toId);
        return StoreStatus::Ok;
    }

    std::vector<std::string> MemoryObjectStore::getLinks(const std::string& edgeType, const std::string& fromId)
    {
        auto lock = impl->readLock("getLinks");
        const std::vector<std::string>* targets = impl->outbound(edgeType, fromId);
        return targets ? *targets : std::vector<std::string>();
    }

    std::vector<TraversalMatch> MemoryObjectStore::graphTraverse(
        const std::string& startId,
        const std::string& edgeType,
        int maxDepth,
        const DocumentPredicate& predicate,
        size_t limit)
    {
        auto lock = impl->readLock("graphTraverse");
        std::vector<TraversalMatch> matches;
        if (maxDepth < 0 || !impl->documents.count(startId))
            return matches;

        // Visited set keeps the walk finite on cyclic link graphs.
        std::set<std::string> visited;
        std::deque<std::pair<std::string, int>> frontier;
        frontier.emplace_back(startId, 0);
        visited.insert(startId);

        while (!frontier.empty())
        {
            const std::pair<std::string, int> entry = frontier.front();
            frontier.pop_front();

            auto doc = impl->documents.find(entry.first);
            if (doc == impl->documents.end())
                continue;

            if (!predicate || predicate(doc->second))
            {
                matches.push_back(TraversalMatch{entry.first, entry.second, doc->second});
                if (limit > 0 && matches.size() >= limit)
                    break;
            }

            if (entry.second >= maxDepth)
                continue;

            const std::vector<std::string>* targets = impl->outbound(edgeType, entry.first);
            if (!targets)
                continue;
            for (const auto& target : *targets)
            {
                if (visited.insert(target).second)
                    frontier.emplace_back(target, entry.second + 1);
            }
        }
        return matches;
    }

    size_t MemoryObjectStore::getSize()
    {
        auto lock = impl->readLock("getSize");
        return impl->documents.size();
    }

    void seedPrimordialObjects(ObjectStore& store)
    {
        if (!store.get(AUTOPO_NIL_OBJECT))
        {
            if (store.create(ObjectDocument(AUTOPO_NIL_OBJECT)) == StoreStatus::Ok)
                fprintf(stderr, "INFO: [STORE] created the root '%s' object\n", AUTOPO_NIL_OBJECT);
        }
        if (!store.get(AUTOPO_SYSTEM_OBJECT))
        {
            if (store.create(ObjectDocument(AUTOPO_SYSTEM_OBJECT)) == StoreStatus::Ok)
                fprintf(stderr, "INFO: [STORE] created the '%s' object\n", AUTOPO_SYSTEM_OBJECT);
        }
        const std::vector<std::string> links = store.getLinks(AUTOPO_PROTOTYPE_LINKS, AUTOPO_SYSTEM_OBJECT);
        bool linked = false;
        for (const auto& target : links)
            linked = linked || target == AUTOPO_NIL_OBJECT;
        if (!linked)
        {
            const StoreStatus status = store.link(AUTOPO_PROTOTYPE_LINKS, AUTOPO_SYSTEM_OBJECT, AUTOPO_NIL_OBJECT);
            if (status != StoreStatus::Ok)
                throw std::runtime_error(std::string("cannot link system to nil: ") + toString(status));
        }
    }
}
