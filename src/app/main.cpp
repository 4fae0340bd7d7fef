#include "imgui.h"
#include "imgui_impl_sdl3.h"
#include "imgui_impl_sdlrenderer3.h"

#include <SDL3/SDL.h>

#include <algorithm>
#include <csignal>
#include <cstdio>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "core/bar_button_item.h"
#include "core/i18n.h"
#include "core/key_chord.h"
#include "core/keyboard_action.h"

#include "ui/imgui_shortcuts.h"
#include "ui/keyboard_tab_bar.h"

// Set when we receive SIGINT (Ctrl+C) so the main loop can exit cleanly.
static volatile std::sig_atomic_t g_InterruptRequested = 0;

static void HandleInterruptSignal(int signal)
{
    if (signal == SIGINT)
        g_InterruptRequested = 1;
}

namespace
{
struct DemoState
{
    chordkit::Platform platform = chordkit::Platform::Any;
    bool               right_to_left = false;
    std::vector<std::unique_ptr<chordkit::BarButtonItem>> toolbar;
    std::vector<std::string> log;
    int  zoom_percent = 100;
    bool confirm_delete = false;
};

static void Log(DemoState& st, const std::string& line)
{
    st.log.push_back(line);
    if (st.log.size() > 200)
        st.log.erase(st.log.begin());
}

static void TriggerAction(DemoState& st, chordkit::KeyboardAction action)
{
    switch (action)
    {
        case chordkit::KeyboardAction::ZoomIn: st.zoom_percent += 10; break;
        case chordkit::KeyboardAction::ZoomOut: st.zoom_percent = std::max(10, st.zoom_percent - 10); break;
        case chordkit::KeyboardAction::ZoomToActualSize: st.zoom_percent = 100; break;
        case chordkit::KeyboardAction::Delete: st.confirm_delete = true; break;
        default: break;
    }
    Log(st, std::string("action: ") + chordkit::ActionId(action));
}

static void RenderToolbar(DemoState& st)
{
    for (const auto& item : st.toolbar)
    {
        const auto& action = item->KeyboardActionValue();
        if (!action.has_value())
            continue;
        ImGui::SameLine();
        const std::string chord = chordkit::FormatChordSymbols(chordkit::KeyEquivalent(*action), st.platform);
        const std::string label = item->Title().value_or(chordkit::ActionDisplayName(*action)) + " (" + chord + ")";
        ImGui::BeginDisabled(!item->Enabled());
        if (ImGui::Button(label.c_str()))
            TriggerAction(st, *action);
        ImGui::EndDisabled();
    }
}

static void DispatchCatalogShortcuts(DemoState& st)
{
    // Shortcuts never fire underneath a modal.
    if (ImGui::IsPopupOpen("", ImGuiPopupFlags_AnyPopupId | ImGuiPopupFlags_AnyPopupLevel))
        return;

    for (const auto& item : st.toolbar)
    {
        const std::optional<chordkit::CommandDescriptor> cmd = item->KeyCommand();
        if (!cmd.has_value())
            continue;
        const std::optional<chordkit::KeyboardAction> action = chordkit::ActionFromHandler(cmd->Handler());
        if (action.has_value() && chordkit::ui::ActionPressed(*action, st.platform, st.right_to_left))
        {
            TriggerAction(st, *action);
            break;
        }
    }
}
} // namespace

int main(int, char**)
{
    std::signal(SIGINT, HandleInterruptSignal);

    DemoState st;
    st.platform = chordkit::RuntimePlatform();
    st.right_to_left = chordkit::i18n::IsRightToLeft("");
    std::fprintf(stderr, "[i18n] locale %s (%s)\n", chordkit::i18n::DefaultLocale().c_str(),
                 st.right_to_left ? "rtl" : "ltr");

    for (const chordkit::SystemBarItem s : {chordkit::SystemBarItem::Add, chordkit::SystemBarItem::Refresh,
                                            chordkit::SystemBarItem::Trash, chordkit::SystemBarItem::Rewind,
                                            chordkit::SystemBarItem::FastForward})
    {
        st.toolbar.push_back(chordkit::CreateKeyboardBarButtonItem(s));
    }

    if (!SDL_Init(SDL_INIT_VIDEO))
    {
        std::printf("Error: SDL_Init(): %s\n", SDL_GetError());
        return 1;
    }

    const float main_scale = SDL_GetDisplayContentScale(SDL_GetPrimaryDisplay());
    const SDL_WindowFlags window_flags = SDL_WINDOW_RESIZABLE | SDL_WINDOW_HIDDEN | SDL_WINDOW_HIGH_PIXEL_DENSITY;
    SDL_Window* window = SDL_CreateWindow("chordkit", (int)(960 * main_scale), (int)(640 * main_scale), window_flags);
    if (window == nullptr)
    {
        std::printf("Error: SDL_CreateWindow(): %s\n", SDL_GetError());
        return 1;
    }
    SDL_Renderer* renderer = SDL_CreateRenderer(window, nullptr);
    if (renderer == nullptr)
    {
        std::printf("Error: SDL_CreateRenderer(): %s\n", SDL_GetError());
        SDL_DestroyWindow(window);
        SDL_Quit();
        return 1;
    }
    SDL_SetWindowPosition(window, SDL_WINDOWPOS_CENTERED, SDL_WINDOWPOS_CENTERED);
    SDL_ShowWindow(window);

    IMGUI_CHECKVERSION();
    ImGui::CreateContext();
    ImGuiIO& io = ImGui::GetIO();
    io.ConfigFlags |= ImGuiConfigFlags_NavEnableKeyboard;
    io.IniFilename = nullptr;

    ImGui::StyleColorsDark();
    ImGui::GetStyle().ScaleAllSizes(main_scale);

    ImGui_ImplSDL3_InitForSDLRenderer(window, renderer);
    ImGui_ImplSDLRenderer3_Init(renderer);

    chordkit::ui::KeyboardTabBar tabs;
    tabs.AddTab("Home", [&st]() {
        ImGui::Text("Zoom: %d%%", st.zoom_percent);
        for (const auto& line : st.log)
            ImGui::TextUnformatted(line.c_str());
    });
    tabs.AddTab("Search", []() { ImGui::TextUnformatted("Search results appear here."); });
    tabs.AddTab("Settings", [&st]() {
        ImGui::Text("Platform: %s", chordkit::PlatformName(st.platform));
        ImGui::Checkbox("Right-to-left layout", &st.right_to_left);
    });

    bool done = false;
    while (!done && !g_InterruptRequested)
    {
        SDL_Event event;
        while (SDL_PollEvent(&event))
        {
            ImGui_ImplSDL3_ProcessEvent(&event);
            if (event.type == SDL_EVENT_QUIT)
                done = true;
            if (event.type == SDL_EVENT_WINDOW_CLOSE_REQUESTED && event.window.windowID == SDL_GetWindowID(window))
                done = true;
        }
        if (SDL_GetWindowFlags(window) & SDL_WINDOW_MINIMIZED)
        {
            SDL_Delay(10);
            continue;
        }

        ImGui_ImplSDLRenderer3_NewFrame();
        ImGui_ImplSDL3_NewFrame();
        ImGui::NewFrame();

        const ImGuiViewport* vp = ImGui::GetMainViewport();
        ImGui::SetNextWindowPos(vp->WorkPos);
        ImGui::SetNextWindowSize(vp->WorkSize);
        ImGui::Begin("##main", nullptr, ImGuiWindowFlags_NoDecoration | ImGuiWindowFlags_NoSavedSettings);

        DispatchCatalogShortcuts(st);
        RenderToolbar(st);
        ImGui::NewLine();

        std::vector<chordkit::CommandDescriptor> toolbar_commands;
        for (const auto& item : st.toolbar)
        {
            if (auto cmd = item->KeyCommand())
                toolbar_commands.push_back(std::move(*cmd));
        }
        tabs.SetInheritedCommands(std::move(toolbar_commands));
        tabs.Draw("##tabs", st.platform);

        if (st.confirm_delete)
        {
            ImGui::OpenPopup("Delete?");
            st.confirm_delete = false;
        }
        if (ImGui::BeginPopupModal("Delete?", nullptr, ImGuiWindowFlags_AlwaysAutoResize))
        {
            ImGui::TextUnformatted("Tab shortcuts are disabled while this is open.");
            if (ImGui::Button("OK") || chordkit::ui::ActionPressed(chordkit::KeyboardAction::Cancel, st.platform,
                                                                   st.right_to_left))
            {
                ImGui::CloseCurrentPopup();
            }
            ImGui::EndPopup();
        }
        ImGui::End();

        chordkit::ui::DrawShortcutOverlay(tabs.LastCommands(), st.platform);

        ImGui::Render();
        SDL_SetRenderScale(renderer, io.DisplayFramebufferScale.x, io.DisplayFramebufferScale.y);
        SDL_SetRenderDrawColorFloat(renderer, 0.1f, 0.1f, 0.12f, 1.0f);
        SDL_RenderClear(renderer);
        ImGui_ImplSDLRenderer3_RenderDrawData(ImGui::GetDrawData(), renderer);
        SDL_RenderPresent(renderer);
    }

    ImGui_ImplSDLRenderer3_Shutdown();
    ImGui_ImplSDL3_Shutdown();
    ImGui::DestroyContext();

    SDL_DestroyRenderer(renderer);
    SDL_DestroyWindow(window);
    SDL_Quit();
    return 0;
}
