#include <format>
#include <string>
#include <vector>

#include "ftxui/component/captured_mouse.hpp"// for ftxui
#include "ftxui/component/component.hpp"// for Input, Renderer, ResizableSplitLeft
#include "ftxui/component/component_base.hpp"// for ComponentBase, Component
#include "ftxui/component/screen_interactive.hpp"// for ScreenInteractive
#include "ftxui/dom/elements.hpp"// for operator|, separator, text, Element, flex, vbox, border

#include <tree_scheme/reader.hpp>
#include <tree_scheme/tree_scheme.hpp>
#include <tree_scheme/utility.hpp>

#include <internal_use_only/config.hpp>


int main([[maybe_unused]] int argc, [[maybe_unused]] const char *argv[])
{
  // one root for the whole session, so definitions survive between evaluations
  const auto global_scope = tree_scheme::make_global_scope();

  std::string content_1;
  std::string content_2;

  std::vector<std::string> globals;
  int globals_selected = 0;
  std::size_t evaluations = 0;
  std::size_t failures = 0;

  auto update_globals = [&]() { globals = tree_scheme::describe_bindings(*global_scope); };

  update_globals();

  auto do_evaluate = [&]() {
    content_2 += "\n> " + content_1 + "\n";
    ++evaluations;

    const auto nodes = tree_scheme::read(content_1);
    if (!nodes) {
      ++failures;
      content_2 += tree_scheme::to_string(nodes.error());
    } else {
      const auto program = tree_scheme::from_nodes(*nodes);
      const auto result = tree_scheme::sequence(program, global_scope);
      if (result) {
        content_2 += tree_scheme::to_string(*result, false);
      } else {
        ++failures;
        content_2 += tree_scheme::to_string(result.error());
      }
    }

    update_globals();
  };

  auto textarea_1 = ftxui::Input(&content_1);
  auto output_1 = ftxui::Input(&content_2);
  auto button = ftxui::Button("Evaluate", do_evaluate);
  int size = 50;
  auto resizeable_bits = ftxui::ResizableSplitLeft(textarea_1, output_1, &size);

  auto globalsbox = ftxui::Menu(&globals, &globals_selected);

  auto layout = ftxui::Container::Horizontal({ globalsbox, resizeable_bits, button });

  auto get_stats = [&]() {
    return ftxui::vbox({ ftxui::text(std::format("{} version {}",
                           tree_scheme::cmake::project_name,
                           tree_scheme::cmake::project_version)),
      ftxui::text(std::format("globals: {}  evaluations: {}  failures: {}  global scope references: {}",
        global_scope->size(),
        evaluations,
        failures,
        global_scope.use_count())) });
  };

  auto component = ftxui::Renderer(layout, [&] {
    return ftxui::hbox({ globalsbox->Render() | ftxui::vscroll_indicator | ftxui::frame,
             ftxui::separator(),
             ftxui::vbox({ resizeable_bits->Render() | ftxui::flex,
               ftxui::separator(),
               ftxui::hbox({ button->Render(), get_stats() }) })
               | ftxui::flex })
           | ftxui::border;
  });

  auto screen = ftxui::ScreenInteractive::Fullscreen();
  screen.Loop(component);
}
