/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "managers/ScreenManager.hpp"
#include "core/Logger.hpp"
#include <algorithm>
#include <stdexcept>
#include <unordered_set>

namespace JournalEngine {

void ScreenManager::setScreens(std::vector<std::unique_ptr<Screen>> screens) {
    std::unordered_set<std::string> names;
    for (const auto& screen : screens) {
        if (!screen) {
            SCREEN_ERROR("Null screen in screen collection");
            throw std::invalid_argument("Journal Engine - Null screen in screen collection");
        }
        if (!names.insert(screen->getName()).second) {
            SCREEN_ERROR("Screen with name " + screen->getName() + " already exists");
            throw std::invalid_argument("Journal Engine - Screen with name " +
                                        screen->getName() + " already exists");
        }
    }

    m_screens = std::move(screens);
    mp_current = nullptr;
    mp_previous = nullptr;

    m_drawOrder.clear();
    m_drawOrder.reserve(m_screens.size());
    for (const auto& screen : m_screens) {
        screen->hide();
        m_drawOrder.push_back(screen.get());
    }

    SCREEN_INFO("Installed " + std::to_string(m_screens.size()) + " screens");
}

void ScreenManager::navigate(size_t index) {
    if (index >= m_screens.size()) {
        SCREEN_ERROR("Screen index out of range: " + std::to_string(index) +
                     " (have " + std::to_string(m_screens.size()) + ")");
        return;
    }

    Screen* target = m_screens[index].get();
    bringToFront(target);
    target->show(mp_current);

    mp_previous = mp_current;
    mp_current = target;
    SCREEN_INFO("Navigated to screen: " + target->getName());

    // Copy: callbacks may add or remove listeners
    const std::vector<ListenerInfo> listeners = m_listeners;
    for (const auto& listener : listeners) {
        listener.callback(index, *target);
    }
}

void ScreenManager::navigate(const std::string& screenName) {
    if (auto index = indexOf(screenName)) {
        navigate(*index);
        return;
    }
    SCREEN_DEBUG("No screen named " + screenName + ", ignoring navigation");
}

void ScreenManager::back() {
    if (mp_previous == nullptr || mp_current == nullptr) {
        SCREEN_WARN("back() called with no previous screen");
        return;
    }

    mp_previous->showWithoutTransition();
    mp_current->hide();
    std::swap(mp_current, mp_previous);
    SCREEN_INFO("Back to screen: " + mp_current->getName());
}

void ScreenManager::update(float deltaTime) {
    for (const auto& screen : m_screens) {
        screen->update(deltaTime);
    }
}

void ScreenManager::render(SDL_Renderer* renderer) const {
    for (const Screen* screen : m_drawOrder) {
        screen->render(renderer);
    }
}

std::optional<size_t> ScreenManager::getCurrentIndex() const {
    for (size_t i = 0; i < m_screens.size(); ++i) {
        if (m_screens[i].get() == mp_current) {
            return i;
        }
    }
    return std::nullopt;
}

Screen* ScreenManager::getScreen(size_t index) const {
    return index < m_screens.size() ? m_screens[index].get() : nullptr;
}

Screen* ScreenManager::findScreen(const std::string& screenName) const {
    auto index = indexOf(screenName);
    return index ? m_screens[*index].get() : nullptr;
}

std::optional<size_t> ScreenManager::indexOf(const std::string& screenName) const {
    for (size_t i = 0; i < m_screens.size(); ++i) {
        if (m_screens[i]->getName() == screenName) {
            return i;
        }
    }
    return std::nullopt;
}

size_t ScreenManager::addNavigationListener(NavigationCallback callback) {
    const size_t id = m_nextListenerId++;
    m_listeners.push_back({id, std::move(callback)});
    return id;
}

void ScreenManager::removeNavigationListener(size_t listenerId) {
    m_listeners.erase(
        std::remove_if(m_listeners.begin(), m_listeners.end(),
                       [listenerId](const ListenerInfo& info) { return info.id == listenerId; }),
        m_listeners.end());
}

void ScreenManager::bringToFront(Screen* screen) {
    auto it = std::find(m_drawOrder.begin(), m_drawOrder.end(), screen);
    if (it != m_drawOrder.end()) {
        std::rotate(it, it + 1, m_drawOrder.end());
    }
}

} // namespace JournalEngine
