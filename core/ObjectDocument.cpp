/*
 * ObjectDocument.cpp
 *
 *  The persistent object: attributes, installed method bodies and the
 *  explicit accessor protocol used instead of attribute interception.
 */

#include "../headers/autopoCore.h"

namespace autopo
{
    ObjectDocument::ObjectDocument(std::string id, AttributeMap attributes, MethodMap methods) :
        id(std::move(id)), attributes(std::move(attributes)), methods(std::move(methods)), dirty(false)
    {
    }

    /**
     * @brief Looks up an own attribute.
     * @return A pointer into the mapping, or nullptr when \a name is absent.
     *         Delegation is never applied here; it is the resolver's job.
     */
    const Value* ObjectDocument::getAttribute(const std::string& name) const
    {
        auto it = attributes.find(name);
        return it != attributes.end() ? &it->second : nullptr;
    }

    bool ObjectDocument::hasAttribute(const std::string& name) const
    {
        return attributes.find(name) != attributes.end();
    }

    /**
     * @brief Inserts or overwrites an own attribute and marks the document dirty.
     */
    void ObjectDocument::setAttribute(const std::string& name, Value value)
    {
        attributes[name] = std::move(value);
        dirty = true;
    }

    void ObjectDocument::replaceAttributes(AttributeMap newAttributes)
    {
        attributes = std::move(newAttributes);
        dirty = true;
    }

    const std::string* ObjectDocument::getMethod(const std::string& name) const
    {
        auto it = methods.find(name);
        return it != methods.end() ? &it->second : nullptr;
    }

    bool ObjectDocument::hasMethod(const std::string& name) const
    {
        return methods.find(name) != methods.end();
    }

    void ObjectDocument::installMethod(const std::string& name, std::string body)
    {
        methods[name] = std::move(body);
    }

    bool ObjectDocument::operator==(const ObjectDocument& other) const
    {
        return id == other.id && attributes == other.attributes && methods == other.methods;
    }

    const char* toString(StoreStatus status)
    {
        switch (status)
        {
        case StoreStatus::Ok: return "ok";
        case StoreStatus::NotFound: return "not found";
        case StoreStatus::Conflict: return "conflict";
        }
        return "unknown";
    }

    TransportError::TransportError(std::string component, const std::string& detail) :
        std::runtime_error(component + ": " + detail), component(std::move(component))
    {
    }
}
