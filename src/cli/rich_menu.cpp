// Rich-menu front end: FTXUI menu driven by the current mode query
#include "cli/rich_menu.hpp"

#include <algorithm>

#include "cli/menu_common.hpp"
#include "ftxui/component/component.hpp"
#include "ftxui/component/component_options.hpp"
#include "ftxui/component/screen_interactive.hpp"
#include "ftxui/dom/elements.hpp"

using namespace ftxui;

namespace pm {

ModeMenuModel build_mode_menu(const ModeTable& modes, const std::string& current_id,
                              const std::string& title) {
    ModeMenuModel model;
    model.title = title;
    model.prompt_lines = {
        "Use ↑↓ to choose a mode. Press ESC to exit.",
        "",
        "Current mode: " + format_current_mode(modes, current_id),
    };
    for (const auto& kv : modes) {
        if (kv.first == current_id) model.default_index = (int)model.entries.size();
        model.entries.push_back({kv.first, kv.second});
    }
    return model;
}

std::optional<std::string> run_mode_picker(const ModeMenuModel& model) {
    if (model.entries.empty()) return std::nullopt;

    auto screen = ScreenInteractive::Fullscreen();
    std::vector<std::string> labels;
    for (const auto& e : model.entries) labels.push_back(e.id + "  " + e.name);
    int selected = std::clamp(model.default_index, 0, (int)labels.size() - 1);
    std::optional<std::string> choice;

    auto accept = [&] {
        choice = model.entries[selected].id;
        screen.Exit();
    };
    auto cancel = [&] {
        choice.reset();
        screen.Exit();
    };

    MenuOption menu_opt;
    menu_opt.entries = &labels;
    menu_opt.selected = &selected;
    menu_opt.on_enter = accept;
    auto menu = Menu(menu_opt);
    auto ok_button = Button("OK", accept);
    auto cancel_button = Button(model.cancel_label, cancel);
    auto root = Container::Vertical({menu, Container::Horizontal({ok_button, cancel_button})});

    auto renderer = Renderer(root, [&] {
        Elements prompt;
        for (const auto& line : model.prompt_lines) prompt.push_back(text(line));
        auto body = vbox({
            vbox(std::move(prompt)),
            separator(),
            menu->Render() | vscroll_indicator | frame | size(HEIGHT, LESS_THAN, 12),
            separator(),
            hbox({ok_button->Render(), text(" "), cancel_button->Render()}) | hcenter,
        });
        return window(text(" " + model.title + " ") | bold, body) |
               size(WIDTH, LESS_THAN, 50) | center;
    });
    renderer |= CatchEvent([&](Event event) {
        if (event == Event::Escape) {
            cancel();
            return true;
        }
        return false;
    });

    screen.Loop(renderer);
    return choice;
}

int run_rich_menu(PowerModeService& svc, const ModeTable& modes, const std::string& title,
                  const ModePicker& picker, KeySource& keys, std::ostream& out) {
    while (true) {
        std::string current_id = svc.QueryCurrentMode();
        auto choice = picker(build_mode_menu(modes, current_id, title));
        if (!choice) {
            out << kFarewell << std::endl;
            return 0;
        }

        auto it = modes.find(*choice);
        if (it == modes.end()) continue;

        out << format_change_report(svc.ChangeMode(it->first, it->second));
        out << "\n" << kPressEnter << std::endl;
        if (!wait_for_enter(keys)) {
            out << kFarewell << std::endl;
            return 0;
        }
    }
}

} // namespace pm
