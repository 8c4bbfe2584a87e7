/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "ui/Screen.hpp"
#include <SDL3/SDL.h>
#include <algorithm>

namespace JournalEngine {

ScreenTransition transitionFromString(const std::string& name) {
    if (name == "fade") {
        return ScreenTransition::Fade;
    }
    if (name == "slide") {
        return ScreenTransition::Slide;
    }
    if (name == "scale") {
        return ScreenTransition::Scale;
    }
    return ScreenTransition::None;
}

const char* transitionToString(ScreenTransition transition) {
    switch (transition) {
    case ScreenTransition::Fade:
        return "fade";
    case ScreenTransition::Slide:
        return "slide";
    case ScreenTransition::Scale:
        return "scale";
    case ScreenTransition::None:
    default:
        return "none";
    }
}

Screen::Screen(const std::string& screenName) : m_screenName(screenName) {
}

void Screen::show(const Screen* from) {
    mp_shownFrom = from;
    m_visible = true;

    const bool animated = m_transition != ScreenTransition::None && m_duration > 0.0f;
    m_progress = animated ? 0.0f : 1.0f;
    onShow(from, animated);
}

void Screen::showWithoutTransition() {
    m_visible = true;
    m_progress = 1.0f;
    onShow(nullptr, false);
}

void Screen::hide() {
    m_visible = false;
    m_progress = 0.0f;
    onHide();
}

void Screen::update(float deltaTime) {
    if (!isTransitioning()) {
        return;
    }
    m_progress = std::min(1.0f, m_progress + deltaTime / m_duration);
}

void Screen::setTransition(ScreenTransition transition, float duration) {
    m_transition = transition;
    m_duration = std::max(0.0f, duration);
}

float Screen::easedProgress() const {
    // smoothstep
    return m_progress * m_progress * (3.0f - 2.0f * m_progress);
}

uint8_t Screen::getAnimatedAlpha() const {
    if (m_transition != ScreenTransition::Fade) {
        return m_tint.a;
    }
    return static_cast<uint8_t>(static_cast<float>(m_tint.a) * easedProgress());
}

ScreenRect Screen::getAnimatedBounds() const {
    const float t = easedProgress();
    ScreenRect bounds = m_bounds;

    switch (m_transition) {
    case ScreenTransition::Slide:
        bounds.x += (1.0f - t) * m_bounds.width;
        break;
    case ScreenTransition::Scale: {
        const float scale = 0.5f + 0.5f * t;
        bounds.width = m_bounds.width * scale;
        bounds.height = m_bounds.height * scale;
        bounds.x = m_bounds.x + (m_bounds.width - bounds.width) * 0.5f;
        bounds.y = m_bounds.y + (m_bounds.height - bounds.height) * 0.5f;
        break;
    }
    case ScreenTransition::Fade:
    case ScreenTransition::None:
    default:
        break;
    }
    return bounds;
}

void Screen::render(SDL_Renderer* renderer) const {
    if (!m_visible || renderer == nullptr) {
        return;
    }

    const ScreenRect bounds = getAnimatedBounds();
    const uint8_t alpha = getAnimatedAlpha();

    SDL_SetRenderDrawBlendMode(renderer, SDL_BLENDMODE_BLEND);
    SDL_SetRenderDrawColor(renderer, m_tint.r, m_tint.g, m_tint.b, alpha);
    const SDL_FRect panel{bounds.x, bounds.y, bounds.width, bounds.height};
    SDL_RenderFillRect(renderer, &panel);

    // Title bar
    SDL_SetRenderDrawColor(renderer, 255, 255, 255, alpha);
    SDL_RenderDebugText(renderer, bounds.x + 16.0f, bounds.y + 16.0f, m_screenName.c_str());

    renderContent(renderer, bounds, alpha);
}

} // namespace JournalEngine
