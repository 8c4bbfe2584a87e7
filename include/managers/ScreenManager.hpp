/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef SCREEN_MANAGER_HPP
#define SCREEN_MANAGER_HPP

#include "ui/Screen.hpp"
#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

struct SDL_Renderer;

namespace JournalEngine {

/**
 * @brief Navigates a fixed, ordered set of named screens
 *
 * The manager keeps the current and the previous screen only; back() swaps
 * the two, so calling it twice lands on the same screen again. Screens are
 * drawn in visual order; navigating to a screen moves it to the front.
 */
class ScreenManager {
public:
    // Called after every successful navigate(), with the target's index
    using NavigationCallback = std::function<void(size_t index, Screen& screen)>;

    ScreenManager() = default;

    ScreenManager(const ScreenManager&) = delete;
    ScreenManager& operator=(const ScreenManager&) = delete;

    /**
     * @brief Installs the screen collection, replacing any previous one
     *
     * Resets current/previous. Every screen starts hidden; visual order is
     * collection order.
     * @throws std::invalid_argument on a null screen or a duplicate name
     */
    void setScreens(std::vector<std::unique_ptr<Screen>> screens);

    void navigate(size_t index);

    // Unknown names are ignored
    void navigate(const std::string& screenName);

    void back();

    void update(float deltaTime);
    void render(SDL_Renderer* renderer) const;

    Screen* getCurrentScreen() const { return mp_current; }
    Screen* getPreviousScreen() const { return mp_previous; }
    std::optional<size_t> getCurrentIndex() const;

    Screen* getScreen(size_t index) const;
    Screen* findScreen(const std::string& screenName) const;
    std::optional<size_t> indexOf(const std::string& screenName) const;
    size_t getScreenCount() const { return m_screens.size(); }

    // Back to front
    const std::vector<Screen*>& getDrawOrder() const { return m_drawOrder; }

    size_t addNavigationListener(NavigationCallback callback);
    void removeNavigationListener(size_t listenerId);

private:
    void bringToFront(Screen* screen);

    struct ListenerInfo {
        size_t id;
        NavigationCallback callback;
    };

    std::vector<std::unique_ptr<Screen>> m_screens{};
    std::vector<Screen*> m_drawOrder{};
    std::vector<ListenerInfo> m_listeners{};
    Screen* mp_current{nullptr};
    Screen* mp_previous{nullptr};
    size_t m_nextListenerId{0};
};

} // namespace JournalEngine

#endif // SCREEN_MANAGER_HPP
