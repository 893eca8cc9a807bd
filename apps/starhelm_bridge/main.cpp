#include "starhelm/core/Log.h"
#include "starhelm/sim/Destinations.h"
#include "starhelm/sim/Simulation.h"

#include <SDL.h>
#include <SDL_opengl.h>

#include <imgui.h>
#include <backends/imgui_impl_opengl3.h>
#include <backends/imgui_impl_sdl2.h>

#include <algorithm>
#include <cstdio>
#include <deque>
#include <string>
#include <vector>

using namespace starhelm;

namespace {

struct LogLine {
  double timeSec{0.0};
  std::string text;
};

ImVec4 alertColor(sim::AlertLevel a) {
  switch (a) {
    case sim::AlertLevel::Green:  return {0.35f, 0.95f, 0.45f, 1.0f};
    case sim::AlertLevel::Yellow: return {1.00f, 0.85f, 0.25f, 1.0f};
    case sim::AlertLevel::Red:    return {1.00f, 0.30f, 0.25f, 1.0f};
  }
  return {1.0f, 1.0f, 1.0f, 1.0f};
}

ImVec4 damageColor(sim::DamageState s) {
  switch (s) {
    case sim::DamageState::Healthy:    return {0.35f, 0.95f, 0.45f, 1.0f};
    case sim::DamageState::Damaged:    return {1.00f, 0.85f, 0.25f, 1.0f};
    case sim::DamageState::Critical:   return {1.00f, 0.45f, 0.20f, 1.0f};
    case sim::DamageState::Exploding:  return {1.00f, 0.25f, 0.20f, 1.0f};
    case sim::DamageState::Debris:     return {0.55f, 0.55f, 0.55f, 1.0f};
    case sim::DamageState::Respawning: return {0.45f, 0.70f, 1.00f, 1.0f};
  }
  return {1.0f, 1.0f, 1.0f, 1.0f};
}

// Keyboard -> intent. Axes come from held keys; actions are plain held state
// and the simulation derives the edges.
sim::InputSnapshot sampleKeyboard(const Uint8* keys) {
  sim::InputSnapshot in;
  in.throttleAxis = (keys[SDL_SCANCODE_W] ? 1.0 : 0.0) - (keys[SDL_SCANCODE_S] ? 1.0 : 0.0);
  in.yawAxis = (keys[SDL_SCANCODE_A] || keys[SDL_SCANCODE_LEFT] ? 1.0 : 0.0)
             - (keys[SDL_SCANCODE_D] || keys[SDL_SCANCODE_RIGHT] ? 1.0 : 0.0);
  in.pitchAxis = (keys[SDL_SCANCODE_UP] ? 1.0 : 0.0) - (keys[SDL_SCANCODE_DOWN] ? 1.0 : 0.0);
  in.rollAxis = (keys[SDL_SCANCODE_Q] ? 1.0 : 0.0) - (keys[SDL_SCANCODE_E] ? 1.0 : 0.0);

  in.fullStop = keys[SDL_SCANCODE_X] != 0;
  in.engageWarp = keys[SDL_SCANCODE_J] != 0;
  in.emergencyStop = keys[SDL_SCANCODE_BACKSPACE] != 0;
  in.skipToDestination = keys[SDL_SCANCODE_K] != 0;

  in.firePhasers = keys[SDL_SCANCODE_SPACE] != 0;
  in.fireTorpedo = keys[SDL_SCANCODE_F] != 0;
  in.cycleTarget = keys[SDL_SCANCODE_T] != 0;
  in.scan = keys[SDL_SCANCODE_C] != 0;
  return in;
}

void drawBar(const char* label, double pct, const ImVec4& color) {
  char overlay[48];
  std::snprintf(overlay, sizeof(overlay), "%s %.0f%%", label, pct);
  ImGui::PushStyleColor(ImGuiCol_PlotHistogram, color);
  ImGui::ProgressBar(static_cast<float>(std::clamp(pct, 0.0, 100.0) / 100.0), ImVec2(-1.0f, 0.0f), overlay);
  ImGui::PopStyleColor();
}

} // namespace

int main(int argc, char** argv) {
  (void)argc; (void)argv;

  core::setLogLevel(core::LogLevel::Info);

  if (SDL_Init(SDL_INIT_VIDEO | SDL_INIT_TIMER) != 0) {
    core::log(core::LogLevel::Error, std::string("SDL_Init failed: ") + SDL_GetError());
    return 1;
  }

  // GL 3.3 core
  SDL_GL_SetAttribute(SDL_GL_CONTEXT_FLAGS, 0);
  SDL_GL_SetAttribute(SDL_GL_CONTEXT_PROFILE_MASK, SDL_GL_CONTEXT_PROFILE_CORE);
  SDL_GL_SetAttribute(SDL_GL_CONTEXT_MAJOR_VERSION, 3);
  SDL_GL_SetAttribute(SDL_GL_CONTEXT_MINOR_VERSION, 3);
  SDL_GL_SetAttribute(SDL_GL_DOUBLEBUFFER, 1);

  SDL_Window* window = SDL_CreateWindow(
      "Starhelm Bridge",
      SDL_WINDOWPOS_CENTERED, SDL_WINDOWPOS_CENTERED,
      1280, 800,
      SDL_WINDOW_OPENGL | SDL_WINDOW_RESIZABLE);

  if (!window) {
    core::log(core::LogLevel::Error, std::string("SDL_CreateWindow failed: ") + SDL_GetError());
    SDL_Quit();
    return 1;
  }

  SDL_GLContext glContext = SDL_GL_CreateContext(window);
  if (!glContext) {
    core::log(core::LogLevel::Error, std::string("SDL_GL_CreateContext failed: ") + SDL_GetError());
    SDL_DestroyWindow(window);
    SDL_Quit();
    return 1;
  }
  SDL_GL_MakeCurrent(window, glContext);
  SDL_GL_SetSwapInterval(1);

  IMGUI_CHECKVERSION();
  ImGui::CreateContext();
  ImGuiIO& io = ImGui::GetIO();
  io.ConfigFlags |= ImGuiConfigFlags_NavEnableKeyboard;
  ImGui::StyleColorsDark();

  ImGui_ImplSDL2_InitForOpenGL(window, glContext);
  ImGui_ImplOpenGL3_Init("#version 330 core");

  sim::Simulation simulation;
  simulation.populateFromCatalog();
  simulation.setWarpLevel(3);

  const auto& catalog = sim::solCatalog();
  int selectedDest = 0;
  for (int i = 0; i < (int)catalog.size(); ++i) {
    if (catalog[(std::size_t)i].key == "earth") selectedDest = i;
  }
  (void)simulation.setDestination(catalog[(std::size_t)selectedDest].key);

  std::deque<LogLine> eventLog;
  const std::size_t kMaxLogLines = 200;

  bool paused = false;
  bool forceCombat = false;
  bool running = true;
  Uint64 lastCounter = SDL_GetPerformanceCounter();
  const double freq = (double)SDL_GetPerformanceFrequency();

  while (running) {
    SDL_Event event;
    while (SDL_PollEvent(&event)) {
      ImGui_ImplSDL2_ProcessEvent(&event);

      if (event.type == SDL_QUIT) running = false;
      if (event.type == SDL_WINDOWEVENT && event.window.event == SDL_WINDOWEVENT_CLOSE) running = false;

      if (event.type == SDL_KEYDOWN && !event.key.repeat && !io.WantCaptureKeyboard) {
        const SDL_Keycode k = event.key.keysym.sym;
        if (k == SDLK_ESCAPE) running = false;
        if (k == SDLK_p) paused = !paused;
        if (k >= SDLK_1 && k <= SDLK_9) simulation.setWarpLevel((int)(k - SDLK_0));
      }
    }

    const Uint64 now = SDL_GetPerformanceCounter();
    const double frameDt = (double)(now - lastCounter) / freq;
    lastCounter = now;

    sim::InputSnapshot input;
    if (!io.WantCaptureKeyboard) input = sampleKeyboard(SDL_GetKeyboardState(nullptr));

    const sim::FrameSnapshot& f = simulation.tick(paused ? 0.0 : frameDt, input);

    for (const auto& ev : f.events) {
      std::string text = sim::eventTypeName(ev.type);
      if (!ev.detail.empty()) text += " " + ev.detail;
      eventLog.push_back(LogLine{f.timeSec, std::move(text)});
      while (eventLog.size() > kMaxLogLines) eventLog.pop_front();
    }

    int w = 0, h = 0;
    SDL_GL_GetDrawableSize(window, &w, &h);
    glViewport(0, 0, w, h);
    glClearColor(0.01f, 0.01f, 0.02f, 1.0f);
    glClear(GL_COLOR_BUFFER_BIT);

    ImGui_ImplOpenGL3_NewFrame();
    ImGui_ImplSDL2_NewFrame();
    ImGui::NewFrame();

    // Helm
    ImGui::SetNextWindowPos(ImVec2(10, 10), ImGuiCond_FirstUseEver);
    ImGui::SetNextWindowSize(ImVec2(360, 230), ImGuiCond_FirstUseEver);
    if (ImGui::Begin("Helm")) {
      ImGui::Text("t = %.1f s%s", f.timeSec, paused ? "  (paused)" : "");
      ImGui::Text("Position  %.1f  %.1f  %.1f", f.ship.position.x, f.ship.position.y, f.ship.position.z);
      const math::Vec3d fwd = f.ship.orientation.forward();
      ImGui::Text("Heading   %.2f  %.2f  %.2f", fwd.x, fwd.y, fwd.z);
      ImGui::Text("Speed     %.2f u/s", f.ship.speed);
      drawBar("Throttle", f.ship.throttlePercent, {0.35f, 0.65f, 1.0f, 1.0f});
      drawBar("Target", f.ship.targetThrottlePercent, {0.25f, 0.45f, 0.75f, 1.0f});
      ImGui::Separator();
      ImGui::TextDisabled("W/S throttle  A/D yaw  arrows pitch  Q/E roll  X full stop");
    }
    ImGui::End();

    // Navigation
    ImGui::SetNextWindowPos(ImVec2(10, 250), ImGuiCond_FirstUseEver);
    ImGui::SetNextWindowSize(ImVec2(360, 260), ImGuiCond_FirstUseEver);
    if (ImGui::Begin("Navigation")) {
      const char* preview = catalog[(std::size_t)selectedDest].name.c_str();
      if (ImGui::BeginCombo("Destination", preview)) {
        for (int i = 0; i < (int)catalog.size(); ++i) {
          const bool selected = (i == selectedDest);
          if (ImGui::Selectable(catalog[(std::size_t)i].name.c_str(), selected)) {
            std::string err;
            if (simulation.setDestination(catalog[(std::size_t)i].key, &err)) {
              selectedDest = i;
            } else {
              core::log(core::LogLevel::Warn, err);
            }
          }
          if (selected) ImGui::SetItemDefaultFocus();
        }
        ImGui::EndCombo();
      }

      int level = simulation.warp().warpLevel();
      if (ImGui::SliderInt("Warp", &level, 1, 9)) simulation.setWarpLevel(level);

      ImGui::Text("Phase     %s", sim::warpPhaseName(f.ship.warpPhase));
      ImGui::Text("Remaining %.1f u", f.ship.distanceRemaining);
      ImGui::Text("ETA       %s", sim::formatEta(f.ship.etaSec).c_str());
      ImGui::ProgressBar((float)f.ship.warpProgress, ImVec2(-1.0f, 0.0f));
      ImGui::ProgressBar((float)f.ship.stretch, ImVec2(-1.0f, 0.0f), "stretch");
      ImGui::Separator();
      ImGui::TextDisabled("J engage  K skip  Backspace emergency stop  1-9 warp");
    }
    ImGui::End();

    // Tactical
    ImGui::SetNextWindowPos(ImVec2(380, 10), ImGuiCond_FirstUseEver);
    ImGui::SetNextWindowSize(ImVec2(360, 250), ImGuiCond_FirstUseEver);
    if (ImGui::Begin("Tactical")) {
      if (!f.weapons.online) {
        ImGui::TextColored({1.0f, 0.45f, 0.2f, 1.0f}, "WEAPONS OFFLINE (warp)");
      }
      if (f.weapons.targetId != sim::kNoEntity) {
        ImGui::Text("Target    %s  (%.1f u)", f.weapons.targetName.c_str(), f.weapons.targetDistance);
      } else {
        ImGui::TextDisabled("Target    none");
      }
      drawBar(f.weapons.phaserOverheated ? "Phasers OVERHEAT" : "Phasers", f.weapons.phaserHeat,
              f.weapons.phaserOverheated ? ImVec4{1.0f, 0.3f, 0.25f, 1.0f} : ImVec4{1.0f, 0.6f, 0.2f, 1.0f});
      ImGui::Text("Torpedoes %d / %d%s", f.weapons.torpedoAmmo, f.weapons.torpedoMaxAmmo,
                  f.weapons.torpedoReloading ? "  (reloading)" : "");
      ImGui::Text("In flight %d", (int)f.weapons.projectilePositions.size());
      ImGui::Separator();
      ImGui::Text("Scanner   %s  %.0f%%", sim::scanStatusName(f.scanner.status), f.scanner.progress);
      if (!f.scanner.targetName.empty()) ImGui::Text("          %s", f.scanner.targetName.c_str());
      if (!f.scanner.error.empty()) ImGui::TextColored({1.0f, 0.45f, 0.2f, 1.0f}, "%s", f.scanner.error.c_str());
      ImGui::Separator();
      ImGui::TextDisabled("T cycle target  Space phasers  F torpedo  C scan");
    }
    ImGui::End();

    // Defense
    ImGui::SetNextWindowPos(ImVec2(380, 270), ImGuiCond_FirstUseEver);
    ImGui::SetNextWindowSize(ImVec2(360, 240), ImGuiCond_FirstUseEver);
    if (ImGui::Begin("Defense")) {
      ImGui::TextColored(alertColor(f.defense.alert), "ALERT: %s", sim::alertLevelName(f.defense.alert));
      for (std::size_t i = 0; i < sim::kShieldQuadrantCount; ++i) {
        drawBar(sim::shieldQuadrantName(static_cast<sim::ShieldQuadrant>(i)), f.defense.shields[i],
                {0.35f, 0.75f, 1.0f, 1.0f});
      }
      drawBar("Hull", f.defense.hull, {0.8f, 0.8f, 0.8f, 1.0f});

      if (ImGui::Checkbox("Hostile contact", &forceCombat)) {
        simulation.setCombatActive(forceCombat);
      }
      ImGui::SameLine();
      if (ImGui::Button("Reset ship")) {
        simulation.resetShipSystems();
        forceCombat = false;
      }
    }
    ImGui::End();

    // Ship systems
    ImGui::SetNextWindowPos(ImVec2(750, 480), ImGuiCond_FirstUseEver);
    ImGui::SetNextWindowSize(ImVec2(500, 310), ImGuiCond_FirstUseEver);
    if (ImGui::Begin("Systems")) {
      for (const auto& sys : f.systems) {
        ImGui::PushID(sys.key.c_str());
        bool active = sys.active;
        if (ImGui::Checkbox("##active", &active)) {
          std::string err;
          if (!simulation.toggleSystem(sys.key, active, &err)) core::log(core::LogLevel::Warn, err);
        }
        ImGui::SameLine();
        if (ImGui::SmallButton("Repair")) {
          std::string err;
          if (!simulation.repairSystem(sys.key, 25.0, &err)) core::log(core::LogLevel::Warn, err);
        }
        ImGui::SameLine();
        const ImVec4 color = sys.status == sim::SystemStatus::Online  ? ImVec4(0.4f, 0.9f, 0.4f, 1.0f)
                           : sys.status == sim::SystemStatus::Damaged ? ImVec4(1.0f, 0.8f, 0.2f, 1.0f)
                                                                      : ImVec4(1.0f, 0.3f, 0.3f, 1.0f);
        drawBar(sys.name.c_str(), sys.power, color);
        ImGui::PopID();
      }
    }
    ImGui::End();

    // Entities
    ImGui::SetNextWindowPos(ImVec2(750, 10), ImGuiCond_FirstUseEver);
    ImGui::SetNextWindowSize(ImVec2(500, 460), ImGuiCond_FirstUseEver);
    if (ImGui::Begin("Entities")) {
      if (ImGui::BeginTable("entities", 4, ImGuiTableFlags_RowBg | ImGuiTableFlags_ScrollY)) {
        ImGui::TableSetupColumn("Name");
        ImGui::TableSetupColumn("Health");
        ImGui::TableSetupColumn("State");
        ImGui::TableSetupColumn("Dist");
        ImGui::TableHeadersRow();
        for (const auto& e : f.entities) {
          ImGui::TableNextRow();
          ImGui::TableSetColumnIndex(0);
          ImGui::TextUnformatted(e.name.c_str());
          ImGui::TableSetColumnIndex(1);
          ImGui::Text("%.0f%%", e.healthPercent);
          ImGui::TableSetColumnIndex(2);
          ImGui::TextColored(damageColor(e.state), "%s", sim::damageStateName(e.state));
          ImGui::TableSetColumnIndex(3);
          ImGui::Text("%.0f", math::distance(f.ship.position, e.position));
        }
        ImGui::EndTable();
      }
    }
    ImGui::End();

    // Events
    ImGui::SetNextWindowPos(ImVec2(10, 520), ImGuiCond_FirstUseEver);
    ImGui::SetNextWindowSize(ImVec2(730, 270), ImGuiCond_FirstUseEver);
    if (ImGui::Begin("Events")) {
      for (const auto& line : eventLog) {
        ImGui::Text("[%7.2f] %s", line.timeSec, line.text.c_str());
      }
      if (ImGui::GetScrollY() >= ImGui::GetScrollMaxY()) ImGui::SetScrollHereY(1.0f);
    }
    ImGui::End();

    ImGui::Render();
    ImGui_ImplOpenGL3_RenderDrawData(ImGui::GetDrawData());

    SDL_GL_SwapWindow(window);
  }

  // Cleanup
  ImGui_ImplOpenGL3_Shutdown();
  ImGui_ImplSDL2_Shutdown();
  ImGui::DestroyContext();

  SDL_GL_DeleteContext(glContext);
  SDL_DestroyWindow(window);
  SDL_Quit();

  return 0;
}
