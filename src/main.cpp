/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "core/JournalApp.hpp"
#include "core/Logger.hpp"
#include "managers/SettingsManager.hpp"
#include <exception>
#include <format>
#include <string>

const int WINDOW_WIDTH{1280};
const int WINDOW_HEIGHT{720};
const std::string APP_TITLE{"Patient Journal"};
const std::string SETTINGS_PATH{"res/settings.json"};

int main([[maybe_unused]] int argc, [[maybe_unused]] char* argv[]) {
  APP_INFO(std::format("Initializing {}", APP_TITLE));

  auto& settings = JournalEngine::SettingsManager::Instance();
  if (!settings.loadFromFile(SETTINGS_PATH)) {
    APP_WARN("Failed to load " + SETTINGS_PATH + " - using defaults");
  }

  const int windowWidth = settings.get<int>("window", "width", WINDOW_WIDTH);
  const int windowHeight = settings.get<int>("window", "height", WINDOW_HEIGHT);
  const std::string title = settings.get<std::string>("window", "title", APP_TITLE);
  const std::string layoutPath = settings.get<std::string>("ui", "layout_file", "res/screens.json");

  JournalApp app;
  try {
    if (!app.init(title, windowWidth, windowHeight, layoutPath)) {
      APP_CRITICAL(std::format("Init {} failed", title));
      app.clean();
      return -1;
    }
    app.run();
  } catch (const std::exception& e) {
    APP_CRITICAL(std::format("Unhandled exception: {}", e.what()));
    app.clean();
    return -1;
  }

  app.clean();
  return 0;
}
