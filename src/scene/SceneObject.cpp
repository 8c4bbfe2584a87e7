/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "scene/SceneObject.hpp"

namespace JournalEngine {

SceneObject::SceneObject(InstanceID id, std::string name)
    : m_id(id), m_name(std::move(name)) {
}

Vector2D SceneObject::getWorldPosition() const {
    Vector2D position = m_placement.position;
    for (const SceneObject* parent = mp_parent; parent != nullptr; parent = parent->mp_parent) {
        position += parent->m_placement.position;
    }
    return position;
}

bool SceneObject::isActiveInHierarchy() const {
    for (const SceneObject* node = this; node != nullptr; node = node->mp_parent) {
        if (!node->m_active) {
            return false;
        }
    }
    return true;
}

bool SceneObject::isDescendantOf(const SceneObject& ancestor) const {
    for (const SceneObject* parent = mp_parent; parent != nullptr; parent = parent->mp_parent) {
        if (parent == &ancestor) {
            return true;
        }
    }
    return false;
}

void SceneObject::runInit() {
    if (m_hooks.init) {
        m_hooks.init(*this);
    }
}

void SceneObject::runDispose() {
    if (m_hooks.dispose) {
        m_hooks.dispose(*this);
    }
}

} // namespace JournalEngine
