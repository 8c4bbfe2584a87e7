/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "pool/ObjectPool.hpp"
#include "core/Logger.hpp"
#include "scene/SceneGraph.hpp"
#include <stdexcept>
#include <string>
#include <vector>

namespace JournalEngine {

ObjectPool::ObjectPool(SceneGraph& scene, const std::string& holderName)
    : m_scene(scene), mp_holder(scene.createObject(holderName)) {
    // Pooled instances live under an inactive holder so they drop out of the hierarchy
    mp_holder->setActive(false);
    m_freeLists.reserve(16);
    m_checkedOut.reserve(64);
}

ObjectPool::~ObjectPool() {
    // Destroys the holder together with every pooled instance parked under it
    forgetSubtree(*mp_holder);
    if (!m_checkedOut.empty()) {
        POOL_WARN(std::to_string(m_checkedOut.size()) +
                  " instances still checked out when the pool was destroyed");
    }
    m_scene.destroy(mp_holder);
}

SceneObject* ObjectPool::acquire(const SceneObject& prototype, const Placement& placement,
                                 SceneObject* parent) {
    if (parent != nullptr && !m_scene.owns(parent)) {
        POOL_ERROR("Parent for '" + prototype.getName() + "' is not part of this scene");
        throw std::invalid_argument("Journal Engine - Parent for '" + prototype.getName() +
                                    "' is not part of this scene");
    }
    if (isParked(parent)) {
        POOL_ERROR("Parent for '" + prototype.getName() + "' is parked in the pool");
        throw std::invalid_argument("Journal Engine - Parent for '" + prototype.getName() +
                                    "' is parked in the pool");
    }

    const InstanceID prototypeID = prototype.getID();

    SceneObject* instance = popFromFreeList(prototypeID);
    if (instance != nullptr) {
        if (!m_scene.setParent(instance, parent)) {
            m_freeLists[prototypeID].push_back(instance->getID());
            throw std::invalid_argument("Journal Engine - Cannot parent instance " +
                                        std::to_string(instance->getID()) + " of '" +
                                        prototype.getName() + "' there");
        }
        instance->setPlacement(placement);
        instance->setActive(true);
        POOL_DEBUG("Reused instance " + std::to_string(instance->getID()) +
                   " of prototype " + std::to_string(prototypeID));
    } else {
        instance = m_scene.instantiate(prototype, placement, parent);
    }

    m_checkedOut[instance->getID()] = prototypeID;
    instance->runInit();
    return instance;
}

bool ObjectPool::release(SceneObject* instance) {
    if (instance == nullptr) {
        POOL_ERROR("Unable to pool a null object");
        return false;
    }

    const InstanceID instanceID = instance->getID();
    auto it = m_checkedOut.find(instanceID);
    if (it == m_checkedOut.end()) {
        POOL_ERROR("Unable to pool '" + instance->getName() + "' (instance " +
                   std::to_string(instanceID) +
                   "): the object was not acquired through the pool or was already released");
        return false;
    }

    const InstanceID prototypeID = it->second;
    m_checkedOut.erase(it);

    instance->runDispose();
    liftCheckedOutDescendants(*instance);
    instance->setActive(false);
    m_scene.setParent(instance, mp_holder);

    // Free list created lazily on first release of this prototype
    m_freeLists[prototypeID].push_back(instanceID);
    return true;
}

bool ObjectPool::isPooled(const SceneObject& instance) const {
    return m_checkedOut.find(instance.getID()) != m_checkedOut.end();
}

InstanceID ObjectPool::originalPrototype(const SceneObject& instance) const {
    auto it = m_checkedOut.find(instance.getID());
    if (it == m_checkedOut.end()) {
        POOL_ERROR("Unable to get the original prototype of '" + instance.getName() +
                   "' (instance " + std::to_string(instance.getID()) +
                   "): has the object already been returned to the pool?");
        return INVALID_INSTANCE_ID;
    }
    return it->second;
}

size_t ObjectPool::prewarm(const SceneObject& prototype, size_t count) {
    if (count == 0) {
        return 0;
    }

    auto& freeList = m_freeLists[prototype.getID()];
    freeList.reserve(freeList.size() + count);

    for (size_t i = 0; i < count; ++i) {
        SceneObject* instance = m_scene.instantiate(prototype, prototype.getPlacement(), mp_holder);
        instance->setActive(false);
        freeList.push_back(instance->getID());
    }

    POOL_INFO("Prewarmed " + std::to_string(count) + " instances of '" +
              prototype.getName() + "'");
    return count;
}

void ObjectPool::clear() {
    size_t destroyed = 0;
    for (auto& [prototypeID, freeList] : m_freeLists) {
        for (InstanceID id : freeList) {
            SceneObject* pooled = m_scene.find(id);
            if (pooled == nullptr) {
                continue;
            }
            forgetSubtree(*pooled);
            if (m_scene.destroy(pooled)) {
                ++destroyed;
            }
        }
    }
    m_freeLists.clear();
    POOL_INFO("Cleared pool, destroyed " + std::to_string(destroyed) + " pooled instances");
}

size_t ObjectPool::getPooledCount(InstanceID prototypeID) const {
    auto it = m_freeLists.find(prototypeID);
    return it != m_freeLists.end() ? it->second.size() : 0;
}

size_t ObjectPool::getTotalPooledCount() const {
    size_t total = 0;
    for (const auto& [prototypeID, freeList] : m_freeLists) {
        total += freeList.size();
    }
    return total;
}

SceneObject* ObjectPool::popFromFreeList(InstanceID prototypeID) {
    auto it = m_freeLists.find(prototypeID);
    if (it == m_freeLists.end()) {
        return nullptr;
    }

    auto& freeList = it->second;
    while (!freeList.empty()) {
        const InstanceID id = freeList.back();
        freeList.pop_back();

        if (SceneObject* instance = m_scene.find(id)) {
            return instance;
        }
        POOL_WARN("Pooled instance " + std::to_string(id) +
                  " was destroyed outside the pool, skipping");
    }
    return nullptr;
}

bool ObjectPool::isParked(const SceneObject* object) const {
    return object != nullptr && (object == mp_holder || object->isDescendantOf(*mp_holder));
}

void ObjectPool::liftCheckedOutDescendants(SceneObject& instance) {
    std::vector<SceneObject*> lifted;
    std::vector<SceneObject*> pending(instance.getChildren().begin(), instance.getChildren().end());
    while (!pending.empty()) {
        SceneObject* node = pending.back();
        pending.pop_back();
        if (m_checkedOut.find(node->getID()) != m_checkedOut.end()) {
            lifted.push_back(node); // its own subtree goes with it
            continue;
        }
        pending.insert(pending.end(), node->getChildren().begin(), node->getChildren().end());
    }

    // Still in use: keep them in the hierarchy instead of parking them
    for (SceneObject* node : lifted) {
        POOL_WARN("Instance " + std::to_string(node->getID()) + " is still checked out, moving it off '" +
                  instance.getName() + "' before pooling");
        m_scene.setParent(node, instance.getParent());
    }
}

void ObjectPool::forgetSubtree(const SceneObject& root) {
    m_checkedOut.erase(root.getID());
    for (const SceneObject* child : root.getChildren()) {
        forgetSubtree(*child);
    }
}

} // namespace JournalEngine
