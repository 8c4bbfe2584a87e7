/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef JOURNAL_APP_HPP
#define JOURNAL_APP_HPP

#include "journal/TrackerRouter.hpp"
#include "managers/ScreenManager.hpp"
#include "pool/ObjectPool.hpp"
#include "scene/SceneGraph.hpp"
#include <SDL3/SDL.h>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

/**
 * @brief Patient journal front end
 *
 * Keys 1-7 navigate to a screen by index, Backspace goes back, Escape
 * quits. Clicking drops a symptom marker taken from the object pool; each
 * marker goes back to the pool after its lifetime runs out (right click
 * returns the newest one immediately).
 */
class JournalApp {
public:
  JournalApp() = default;
  ~JournalApp();

  JournalApp(const JournalApp &) = delete;
  JournalApp &operator=(const JournalApp &) = delete;

  /**
   * @brief Creates the window and renderer and builds screens and pool
   * @param layoutPath Screen layout JSON; the built-in layout is used if it fails to load
   * @return false if SDL could not be initialized
   */
  bool init(std::string_view title, int width, int height,
            const std::string &layoutPath);

  // Runs until the window closes or Escape is pressed
  void run();

  void handleEvents();
  void update(float deltaTime);
  void render();
  void clean();

  bool isRunning() const { return m_running; }

private:
  struct LiveMarker {
    JournalEngine::SceneObject *object;
    float age;
  };

  void buildScreens(const std::string &layoutPath);
  void buildMarkerPrototype();
  void spawnMarker(float x, float y);
  void releaseNewestMarker();
  void renderMarkers() const;

  std::unique_ptr<SDL_Window, decltype(&SDL_DestroyWindow)> mp_window{
      nullptr, SDL_DestroyWindow};
  std::unique_ptr<SDL_Renderer, decltype(&SDL_DestroyRenderer)> mp_renderer{
      nullptr, SDL_DestroyRenderer};

  JournalEngine::SceneGraph m_scene{};
  std::unique_ptr<JournalEngine::ObjectPool> mp_pool{};
  JournalEngine::ScreenManager m_screens{};
  std::unique_ptr<JournalEngine::TrackerRouter> mp_trackerRouter{};

  JournalEngine::SceneObject *mp_markerPrototype{nullptr};
  JournalEngine::SceneObject *mp_markerLayer{nullptr};
  std::vector<LiveMarker> m_liveMarkers{};

  int m_windowWidth{1280};
  int m_windowHeight{720};
  float m_markerLifetime{4.0f};
  bool m_running{false};
  bool m_sdlInitialized{false};
};

#endif // JOURNAL_APP_HPP
