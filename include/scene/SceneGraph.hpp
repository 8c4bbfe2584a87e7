/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef SCENE_GRAPH_HPP
#define SCENE_GRAPH_HPP

#include "scene/SceneObject.hpp"
#include <boost/container/flat_map.hpp>
#include <cstddef>
#include <memory>
#include <string>
#include <vector>

namespace JournalEngine {

/**
 * @brief Owns scene objects and hands out their identities
 *
 * This is the scene-object factory the ObjectPool builds on: it creates
 * objects (fresh or cloned from a prototype), destroys them, and keeps the
 * parent/child links. Identities start at 1, are unique per graph and are
 * never reused, so a destroyed object's ID never aliases a live one.
 */
class SceneGraph {
public:
    SceneGraph() = default;
    ~SceneGraph() = default;

    SceneGraph(const SceneGraph&) = delete;
    SceneGraph& operator=(const SceneGraph&) = delete;

    /**
     * @brief Creates an empty object (a prototype, a holding node, a parent)
     * @param parent Parent owned by this graph, or nullptr for a root object
     * @throws std::invalid_argument if parent is not owned by this graph
     */
    SceneObject* createObject(const std::string& name, ObjectHooks hooks = {},
                              SceneObject* parent = nullptr);

    /**
     * @brief Clones a prototype and its children into a new active object
     *
     * The clone copies name, hooks, size, tint and the children's
     * placements; it gets its own identity and the given placement.
     * @throws std::invalid_argument if parent is not owned by this graph
     */
    SceneObject* instantiate(const SceneObject& prototype, const Placement& placement,
                             SceneObject* parent = nullptr);

    // Destroys the object and all of its children. Returns false for foreign objects.
    bool destroy(SceneObject* object);

    /**
     * @brief Moves an object under a new parent (nullptr makes it a root)
     * @return false if either object is foreign or the move would create a cycle
     */
    bool setParent(SceneObject* object, SceneObject* parent);

    bool owns(const SceneObject* object) const;
    SceneObject* find(InstanceID id) const;

    size_t getObjectCount() const { return m_objects.size(); }
    const std::vector<SceneObject*>& getRoots() const { return m_roots; }

    // Number of instantiate() calls that produced a clone
    size_t getInstantiateCount() const { return m_instantiateCount; }

private:
    SceneObject* allocate(const std::string& name);
    SceneObject* cloneTree(const SceneObject& source, SceneObject* parent);
    void attach(SceneObject* object, SceneObject* parent);
    void detach(SceneObject* object);
    void collectSubtree(SceneObject* object, std::vector<InstanceID>& out) const;

    boost::container::flat_map<InstanceID, std::unique_ptr<SceneObject>> m_objects{};
    std::vector<SceneObject*> m_roots{};
    InstanceID m_nextID{1};
    size_t m_instantiateCount{0};
};

} // namespace JournalEngine

#endif // SCENE_GRAPH_HPP
