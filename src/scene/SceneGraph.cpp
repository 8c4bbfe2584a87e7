/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "scene/SceneGraph.hpp"
#include "core/Logger.hpp"
#include <algorithm>
#include <stdexcept>

namespace JournalEngine {

SceneObject* SceneGraph::createObject(const std::string& name, ObjectHooks hooks,
                                      SceneObject* parent) {
    if (parent != nullptr && !owns(parent)) {
        throw std::invalid_argument("Journal Engine - Parent of '" + name +
                                    "' is not part of this scene");
    }

    SceneObject* object = allocate(name);
    object->setHooks(std::move(hooks));
    attach(object, parent);

    SCENE_DEBUG("Created object '" + name + "' (id " + std::to_string(object->getID()) + ")");
    return object;
}

SceneObject* SceneGraph::instantiate(const SceneObject& prototype, const Placement& placement,
                                     SceneObject* parent) {
    if (parent != nullptr && !owns(parent)) {
        throw std::invalid_argument("Journal Engine - Parent for clone of '" +
                                    prototype.getName() + "' is not part of this scene");
    }

    SceneObject* clone = cloneTree(prototype, parent);
    clone->setPlacement(placement);
    clone->setActive(true);
    ++m_instantiateCount;

    SCENE_DEBUG("Instantiated '" + prototype.getName() + "' (prototype " +
                std::to_string(prototype.getID()) + ") as id " + std::to_string(clone->getID()));
    return clone;
}

bool SceneGraph::destroy(SceneObject* object) {
    if (!owns(object)) {
        SCENE_WARN("destroy() called with an object this scene does not own");
        return false;
    }

    std::vector<InstanceID> doomed;
    collectSubtree(object, doomed);

    detach(object);
    for (InstanceID id : doomed) {
        m_objects.erase(id);
    }
    return true;
}

bool SceneGraph::setParent(SceneObject* object, SceneObject* parent) {
    if (!owns(object) || (parent != nullptr && !owns(parent))) {
        SCENE_WARN("setParent() called with an object this scene does not own");
        return false;
    }
    if (parent == object || (parent != nullptr && parent->isDescendantOf(*object))) {
        SCENE_ERROR("Refusing to parent '" + object->getName() + "' under its own subtree");
        return false;
    }
    if (object->mp_parent == parent) {
        return true;
    }

    detach(object);
    attach(object, parent);
    return true;
}

bool SceneGraph::owns(const SceneObject* object) const {
    if (object == nullptr) {
        return false;
    }
    auto it = m_objects.find(object->getID());
    return it != m_objects.end() && it->second.get() == object;
}

SceneObject* SceneGraph::find(InstanceID id) const {
    auto it = m_objects.find(id);
    return it != m_objects.end() ? it->second.get() : nullptr;
}

SceneObject* SceneGraph::allocate(const std::string& name) {
    const InstanceID id = m_nextID++;
    auto result = m_objects.emplace(id, std::make_unique<SceneObject>(id, name));
    return result.first->second.get();
}

SceneObject* SceneGraph::cloneTree(const SceneObject& source, SceneObject* parent) {
    // Copy the child list first; the clone may be attached under the source
    const auto children = source.getChildren();

    SceneObject* clone = allocate(source.getName());
    clone->setHooks(source.getHooks());
    clone->setSize(source.getSize());
    clone->setTint(source.getTint());
    clone->setPlacement(source.getPlacement());
    clone->setActive(source.isActiveSelf());
    attach(clone, parent);

    for (const SceneObject* child : children) {
        cloneTree(*child, clone);
    }
    return clone;
}

void SceneGraph::attach(SceneObject* object, SceneObject* parent) {
    object->mp_parent = parent;
    if (parent != nullptr) {
        parent->m_children.push_back(object);
    } else {
        m_roots.push_back(object);
    }
}

void SceneGraph::detach(SceneObject* object) {
    if (object->mp_parent != nullptr) {
        auto& siblings = object->mp_parent->m_children;
        siblings.erase(std::remove(siblings.begin(), siblings.end(), object), siblings.end());
    } else {
        m_roots.erase(std::remove(m_roots.begin(), m_roots.end(), object), m_roots.end());
    }
    object->mp_parent = nullptr;
}

void SceneGraph::collectSubtree(SceneObject* object, std::vector<InstanceID>& out) const {
    out.push_back(object->getID());
    for (SceneObject* child : object->m_children) {
        collectSubtree(child, out);
    }
}

} // namespace JournalEngine
