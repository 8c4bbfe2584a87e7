/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef OBJECT_POOL_HPP
#define OBJECT_POOL_HPP

#include "scene/Placement.hpp"
#include "scene/SceneObject.hpp"
#include <cstddef>
#include <string>
#include <unordered_map>
#include <vector>

namespace JournalEngine {

class SceneGraph;

/**
 * @brief Reuses scene objects instead of instantiating new ones
 *
 * Retired instances are kept inactive under a holding node, in one
 * last-in-first-out free list per prototype. Every instance handed out by
 * acquire() is tracked until it comes back through release(); the record
 * maps the instance's ID to the ID of the prototype it was cloned from.
 *
 * The pool is an ordinary object owned by whoever owns the scene's object
 * lifecycle. It must not outlive the SceneGraph it was built on.
 *
 * Usage:
 *   ObjectPool pool(scene);
 *   SceneObject* marker = pool.acquire(*markerPrototype, Placement({120.0f, 80.0f}));
 *   ...
 *   pool.release(marker);
 */
class ObjectPool {
public:
    explicit ObjectPool(SceneGraph& scene, const std::string& holderName = "ObjectPool");
    ~ObjectPool();

    ObjectPool(const ObjectPool&) = delete;
    ObjectPool& operator=(const ObjectPool&) = delete;

    /**
     * @brief Hands out an active instance of the prototype
     *
     * Pops the most recently released instance of this prototype when one
     * is available, otherwise clones the prototype. Runs the instance's init
     * hook, if any, before returning.
     * @param parent New parent of the instance, nullptr for a root object
     * @throws std::invalid_argument if parent belongs to another scene, is
     *         parked in this pool, or lies inside the reused instance
     */
    SceneObject* acquire(const SceneObject& prototype, const Placement& placement,
                         SceneObject* parent = nullptr);

    /**
     * @brief Returns an instance to its prototype's free list
     *
     * Instances that are not currently checked out (never acquired through
     * this pool, or already released) are a usage error: it is logged and
     * nothing changes. Checked-out instances below it are moved up to its
     * parent first so they stay in use.
     * @return true if the instance was pooled
     */
    bool release(SceneObject* instance);

    bool isPooled(const SceneObject& instance) const;

    /**
     * @brief ID of the prototype a checked-out instance was created from
     * @return INVALID_INSTANCE_ID (with an error logged) for untracked instances
     */
    InstanceID originalPrototype(const SceneObject& instance) const;

    /**
     * @brief Fills the prototype's free list with inactive instances
     * @return Number of instances created
     */
    size_t prewarm(const SceneObject& prototype, size_t count);

    // Destroys every instance waiting in a free list. Checked-out instances stay tracked.
    void clear();

    size_t getActiveCount() const { return m_checkedOut.size(); }
    size_t getPooledCount(InstanceID prototypeID) const;
    size_t getTotalPooledCount() const;
    size_t getFreeListCount() const { return m_freeLists.size(); }
    SceneObject* getHolder() const { return mp_holder; }

private:
    SceneObject* popFromFreeList(InstanceID prototypeID);
    bool isParked(const SceneObject* object) const;
    void liftCheckedOutDescendants(SceneObject& instance);
    void forgetSubtree(const SceneObject& root);

    SceneGraph& m_scene;
    SceneObject* mp_holder;
    // IDs rather than pointers so entries destroyed behind the pool's back are detected
    std::unordered_map<InstanceID, std::vector<InstanceID>> m_freeLists{};
    std::unordered_map<InstanceID, InstanceID> m_checkedOut{}; // instance -> prototype
};

} // namespace JournalEngine

#endif // OBJECT_POOL_HPP
