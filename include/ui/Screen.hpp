/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef SCREEN_HPP
#define SCREEN_HPP

#include "utils/Tint.hpp"
#include <cstdint>
#include <string>

struct SDL_Renderer;

namespace JournalEngine {

enum class ScreenTransition : uint8_t {
    None,
    Fade,   // alpha 0 -> 1
    Slide,  // enters from the right edge of its bounds
    Scale   // grows from half size around its centre
};

// Parses "none", "fade", "slide", "scale"; anything else is None
ScreenTransition transitionFromString(const std::string& name);
const char* transitionToString(ScreenTransition transition);

struct ScreenRect {
    float x{0.0f};
    float y{0.0f};
    float width{0.0f};
    float height{0.0f};

    bool contains(float px, float py) const {
        return px >= x && px < x + width && py >= y && py < y + height;
    }
};

/**
 * @brief A named full-panel view navigated by the ScreenManager
 *
 * show() plays the screen's show transition; showWithoutTransition() snaps
 * it fully in. Transitions advance in update() and are purely visual: a
 * screen counts as visible from the moment it is shown.
 */
class Screen {
public:
    explicit Screen(const std::string& screenName);
    virtual ~Screen() = default;

    Screen(const Screen&) = delete;
    Screen& operator=(const Screen&) = delete;

    /**
     * @brief Makes the screen visible and starts its show transition
     * @param from Screen that was current before this one, may be nullptr
     */
    void show(const Screen* from);
    void showWithoutTransition();
    void hide();

    virtual void update(float deltaTime);
    void render(SDL_Renderer* renderer) const;

    const std::string& getName() const { return m_screenName; }
    bool isVisible() const { return m_visible; }
    bool isTransitioning() const { return m_visible && m_progress < 1.0f; }
    float getTransitionProgress() const { return m_progress; }
    const Screen* getShownFrom() const { return mp_shownFrom; }

    void setTransition(ScreenTransition transition, float duration);
    ScreenTransition getTransition() const { return m_transition; }
    float getTransitionDuration() const { return m_duration; }

    void setBounds(const ScreenRect& bounds) { m_bounds = bounds; }
    const ScreenRect& getBounds() const { return m_bounds; }
    void setTint(const Tint& tint) { m_tint = tint; }
    const Tint& getTint() const { return m_tint; }

    // Current alpha and bounds with the transition applied
    uint8_t getAnimatedAlpha() const;
    ScreenRect getAnimatedBounds() const;

protected:
    virtual void onShow(const Screen* /* from */, bool /* animated */) {}
    virtual void onHide() {}
    virtual void renderContent(SDL_Renderer* /* renderer */, const ScreenRect& /* bounds */,
                               uint8_t /* alpha */) const {}

private:
    float easedProgress() const;

    std::string m_screenName;
    bool m_visible{false};
    float m_progress{0.0f};
    const Screen* mp_shownFrom{nullptr};
    ScreenTransition m_transition{ScreenTransition::Fade};
    float m_duration{0.25f};
    ScreenRect m_bounds{0.0f, 0.0f, 1280.0f, 720.0f};
    Tint m_tint{48, 63, 159, 255};
};

} // namespace JournalEngine

#endif // SCREEN_HPP
