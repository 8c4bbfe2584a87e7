/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "core/JournalApp.hpp"
#include "core/Logger.hpp"
#include "journal/PatientJournalScreen.hpp"
#include "journal/ScreenLayout.hpp"
#include "managers/SettingsManager.hpp"
#include <algorithm>
#include <format>

using namespace JournalEngine;

#define JOURNAL_GRAY 31, 32, 34, 255

JournalApp::~JournalApp() {
  clean();
}

bool JournalApp::init(std::string_view title, int width, int height,
                      const std::string &layoutPath) {
  APP_INFO("Initializing SDL Video");

  if (!SDL_Init(SDL_INIT_VIDEO)) {
    APP_CRITICAL(std::format("SDL initialization failed: {}", SDL_GetError()));
    return false;
  }
  m_sdlInitialized = true;

  m_windowWidth = width > 0 ? width : 1280;
  m_windowHeight = height > 0 ? height : 720;

  const std::string windowTitle(title);
  mp_window.reset(SDL_CreateWindow(windowTitle.c_str(), m_windowWidth,
                                   m_windowHeight, 0));
  if (!mp_window) {
    APP_ERROR(std::format("Failed to create window: {}", SDL_GetError()));
    return false;
  }

  mp_renderer.reset(SDL_CreateRenderer(mp_window.get(), nullptr));
  if (!mp_renderer) {
    APP_ERROR(std::format("Failed to create renderer: {}", SDL_GetError()));
    return false;
  }

  if (!SDL_SetRenderVSync(mp_renderer.get(), 1)) {
    APP_WARN(std::format("VSync unavailable: {}", SDL_GetError()));
  }

  APP_INFO(std::format("Window {}x{} online", m_windowWidth, m_windowHeight));

  buildScreens(layoutPath);
  buildMarkerPrototype();

  m_running = true;
  return true;
}

void JournalApp::buildScreens(const std::string &layoutPath) {
  const ScreenRect bounds{0.0f, 0.0f, static_cast<float>(m_windowWidth),
                          static_cast<float>(m_windowHeight)};

  ScreenLayout layout;
  if (!loadScreenLayout(layoutPath, bounds, layout)) {
    APP_WARN("Using built-in screen layout");
    layout = makeDefaultScreenLayout(bounds);
  }

  PatientJournalScreen *journal = layout.journal;
  std::vector<TrackerRule> rules = std::move(layout.trackerRules);
  m_screens.setScreens(std::move(layout.screens));

  if (journal != nullptr) {
    mp_trackerRouter = std::make_unique<TrackerRouter>(*journal, std::move(rules));
    mp_trackerRouter->attach(m_screens);
  } else {
    APP_WARN("Layout has no journal screen, tracker routing disabled");
  }

  m_screens.navigate(0);
}

void JournalApp::buildMarkerPrototype() {
  auto &settings = SettingsManager::Instance();
  const float markerSize = settings.get<float>("pool", "marker_size", 18.0f);
  const int prewarmCount = settings.get<int>("pool", "prewarm_count", 16);
  m_markerLifetime = settings.get<float>("pool", "marker_lifetime", 4.0f);

  mp_pool = std::make_unique<ObjectPool>(m_scene);
  mp_markerLayer = m_scene.createObject("Markers");

  ObjectHooks hooks;
  hooks.init = [markerSize](SceneObject &marker) {
    marker.setSize(markerSize);
  };
  hooks.dispose = [](SceneObject &marker) {
    APP_DEBUG(std::format("Marker {} retired", marker.getID()));
  };

  mp_markerPrototype = m_scene.createObject("SymptomMarker", std::move(hooks));
  mp_markerPrototype->setActive(false); // the template itself is never drawn
  mp_markerPrototype->setTint({255, 193, 7, 255});

  mp_pool->prewarm(*mp_markerPrototype,
                   static_cast<size_t>(std::max(0, prewarmCount)));
}

void JournalApp::run() {
  Uint64 lastTicks = SDL_GetTicksNS();
  while (m_running) {
    const Uint64 now = SDL_GetTicksNS();
    const float deltaTime =
        static_cast<float>(now - lastTicks) / static_cast<float>(SDL_NS_PER_SECOND);
    lastTicks = now;

    handleEvents();
    update(deltaTime);
    render();
  }
}

void JournalApp::handleEvents() {
  SDL_Event event;
  while (SDL_PollEvent(&event)) {
    switch (event.type) {
    case SDL_EVENT_QUIT:
      m_running = false;
      break;

    case SDL_EVENT_KEY_DOWN:
      if (event.key.key == SDLK_ESCAPE) {
        m_running = false;
      } else if (event.key.key == SDLK_BACKSPACE) {
        m_screens.back();
      } else if (event.key.key >= SDLK_1 && event.key.key <= SDLK_9) {
        m_screens.navigate(static_cast<size_t>(event.key.key - SDLK_1));
      }
      break;

    case SDL_EVENT_MOUSE_BUTTON_DOWN:
      if (event.button.button == SDL_BUTTON_LEFT) {
        spawnMarker(event.button.x, event.button.y);
      } else if (event.button.button == SDL_BUTTON_RIGHT) {
        releaseNewestMarker();
      }
      break;

    default:
      break;
    }
  }
}

void JournalApp::update(float deltaTime) {
  m_screens.update(deltaTime);

  for (auto &marker : m_liveMarkers) {
    marker.age += deltaTime;
  }

  auto expired = std::stable_partition(
      m_liveMarkers.begin(), m_liveMarkers.end(),
      [this](const LiveMarker &marker) { return marker.age < m_markerLifetime; });
  for (auto it = expired; it != m_liveMarkers.end(); ++it) {
    mp_pool->release(it->object);
  }
  m_liveMarkers.erase(expired, m_liveMarkers.end());
}

void JournalApp::render() {
  SDL_Renderer *renderer = mp_renderer.get();
  SDL_SetRenderDrawColor(renderer, JOURNAL_GRAY);
  SDL_RenderClear(renderer);

  m_screens.render(renderer);
  renderMarkers();

  const std::string poolStats =
      std::format("pool: {} active, {} pooled", mp_pool->getActiveCount(),
                  mp_pool->getTotalPooledCount());
  SDL_SetRenderDrawColor(renderer, 255, 255, 255, 255);
  SDL_RenderDebugText(renderer, 16.0f, static_cast<float>(m_windowHeight) - 24.0f,
                      poolStats.c_str());

  SDL_RenderPresent(renderer);
}

void JournalApp::spawnMarker(float x, float y) {
  SceneObject *marker =
      mp_pool->acquire(*mp_markerPrototype, Placement({x, y}), mp_markerLayer);
  m_liveMarkers.push_back({marker, 0.0f});
}

void JournalApp::releaseNewestMarker() {
  if (m_liveMarkers.empty()) {
    return;
  }
  mp_pool->release(m_liveMarkers.back().object);
  m_liveMarkers.pop_back();
}

void JournalApp::renderMarkers() const {
  SDL_Renderer *renderer = mp_renderer.get();
  for (const SceneObject *marker : mp_markerLayer->getChildren()) {
    if (!marker->isActiveInHierarchy()) {
      continue;
    }
    const Vector2D position = marker->getWorldPosition();
    const float half = marker->getSize() * 0.5f;
    const Tint &tint = marker->getTint();
    const SDL_FRect rect{position.getX() - half, position.getY() - half,
                         marker->getSize(), marker->getSize()};
    SDL_SetRenderDrawColor(renderer, tint.r, tint.g, tint.b, tint.a);
    SDL_RenderFillRect(renderer, &rect);
  }
}

void JournalApp::clean() {
  if (!m_sdlInitialized) {
    return;
  }
  APP_INFO("Starting shutdown sequence...");

  for (const auto &marker : m_liveMarkers) {
    mp_pool->release(marker.object);
  }
  m_liveMarkers.clear();

  mp_trackerRouter.reset();
  mp_pool.reset();

  mp_renderer.reset();
  mp_window.reset();
  SDL_Quit();
  m_sdlInitialized = false;
  m_running = false;
  APP_INFO("Shutdown complete");
}
