/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef SCENE_OBJECT_HPP
#define SCENE_OBJECT_HPP

#include "scene/Placement.hpp"
#include "utils/Tint.hpp"
#include <boost/container/small_vector.hpp>
#include <cstdint>
#include <functional>
#include <string>

namespace JournalEngine {

using InstanceID = uint64_t;

// Never handed out by a SceneGraph; returned where no valid identity exists
constexpr InstanceID INVALID_INSTANCE_ID = 0;

class SceneObject;

/**
 * @brief Optional lifecycle callbacks attached to a prototype at registration
 *
 * Instances created from the prototype carry a copy. The object pool runs
 * init after every acquire and dispose before every release.
 */
struct ObjectHooks {
    std::function<void(SceneObject&)> init{};
    std::function<void(SceneObject&)> dispose{};
};

/**
 * @brief Node of a SceneGraph
 *
 * Objects are owned by the graph that created them; everything else holds
 * raw, non-owning pointers. Hierarchy changes go through SceneGraph so the
 * root list stays consistent.
 */
class SceneObject {
public:
    SceneObject(InstanceID id, std::string name);

    SceneObject(const SceneObject&) = delete;
    SceneObject& operator=(const SceneObject&) = delete;

    InstanceID getID() const { return m_id; }
    const std::string& getName() const { return m_name; }

    const Placement& getPlacement() const { return m_placement; }
    void setPlacement(const Placement& placement) { m_placement = placement; }

    // Parent chain positions summed; rotation is not propagated
    Vector2D getWorldPosition() const;

    bool isActiveSelf() const { return m_active; }
    bool isActiveInHierarchy() const;
    void setActive(bool active) { m_active = active; }

    SceneObject* getParent() const { return mp_parent; }
    const boost::container::small_vector<SceneObject*, 4>& getChildren() const { return m_children; }
    bool isDescendantOf(const SceneObject& ancestor) const;

    const ObjectHooks& getHooks() const { return m_hooks; }
    void setHooks(ObjectHooks hooks) { m_hooks = std::move(hooks); }
    bool hasInitHook() const { return static_cast<bool>(m_hooks.init); }
    bool hasDisposeHook() const { return static_cast<bool>(m_hooks.dispose); }
    void runInit();
    void runDispose();

    float getSize() const { return m_size; }
    void setSize(float size) { m_size = size; }
    const Tint& getTint() const { return m_tint; }
    void setTint(const Tint& tint) { m_tint = tint; }

private:
    friend class SceneGraph;

    InstanceID m_id;
    std::string m_name;
    Placement m_placement{};
    bool m_active{true};
    SceneObject* mp_parent{nullptr};
    boost::container::small_vector<SceneObject*, 4> m_children{};
    ObjectHooks m_hooks{};
    float m_size{16.0f};
    Tint m_tint{};
};

} // namespace JournalEngine

#endif // SCENE_OBJECT_HPP
