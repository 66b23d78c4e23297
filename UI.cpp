#include "UI.hpp"

#include <format>
#include <ftxui/component/component.hpp>
#include <ftxui/dom/elements.hpp>
#include <mutex>
#include <utility>

#include "IOManager.hpp"
#include "SchemeCompiler.hpp"
#include "utils.hpp"

using namespace ftxui;

UI::UI(Renamer& renamer, json pathList)
    : m_screen(ScreenInteractive::Fullscreen()),
      m_renamer(renamer),
      m_path_list(std::move(pathList)),
      m_status_text("Ready. Press 'Generate' to preview new names."),
      m_generate_button_label(" Generate "),
      m_apply_button_label(" Apply Selected (Enter) ") {
  IOManager::log("Initializing UI components...");

  try {
    m_plan_component =
        Renderer([&] {
          if (m_plan_entries.empty()) {
            return text(m_status_text) | center;
          }
          Elements elements;
          for (size_t i = 0; i < m_plan_entries.size(); ++i) {
            Element entry = text((m_plan_selections[i] ? "[X] " : "[ ] ") +
                                 m_plan_entries[i]);
            if ((int)i == m_selected_entry) {
              entry = entry | inverted | focus;
            }
            elements.push_back(entry);
          }
          return vbox(elements) | vscroll_indicator | frame;
        }) |
        CatchEvent([&](Event event) {
          if (m_is_operation_in_progress) {
            return false;
          }
          if (event.is_mouse()) return false;
          if (event == Event::ArrowUp && m_selected_entry > 0) {
            m_selected_entry--;
          } else if (event == Event::ArrowDown &&
                     m_selected_entry < (int)m_plan_entries.size() - 1) {
            m_selected_entry++;
          } else if (event == Event::Character(' ') &&
                     !m_plan_selections.empty()) {
            m_plan_selections[m_selected_entry] =
                !m_plan_selections[m_selected_entry];
          } else if (event == Event::Return && !m_plan.empty()) {
            execute_plan();
          } else {
            return false;
          }
          return true;
        });

    m_log_component = Renderer([&] {
      Elements logs;
      {
        std::scoped_lock lock(m_log_mutex);
        for (const auto& msg : m_log_messages) {
          logs.push_back(text(msg));
        }
      }
      return vbox(logs) | vscroll_indicator | frame | flex;
    });

  } catch (const std::exception& e) {
    IOManager::log(std::format(
        "CRITICAL: Failed to initialize UI components: {}", e.what()));
    throw;
  }
}

void UI::AddLogMessage(std::string_view message) {
  {
    std::scoped_lock lock(m_log_mutex);
    m_log_messages.push_back(std::string(message));
    if (m_log_messages.size() > 100) {
      m_log_messages.pop_front();
    }
  }
  m_screen.Post(Event::Custom);
}

void UI::cleanup_finished_threads() {
  std::erase_if(m_worker_threads,
                [](const std::jthread& t) { return !t.joinable(); });
}

void UI::update_ui_from_plan() {
  m_plan_entries.clear();
  m_plan_selections.clear();
  m_selected_entry = 0;
  for (const auto& entry : m_plan) {
    m_plan_entries.push_back(std::format(
        "'{}' -> '{}'", safe_path_to_string(entry.from.filename()), entry.to));
    m_plan_selections.push_back(true);
  }
  if (m_plan.empty()) {
    m_status_text = "No file could be renamed. See the log for details.";
  } else {
    m_status_text = std::format(
        "{} of {} files can be renamed. Use Arrow Keys and Space to select. "
        "Press Enter to apply.",
        m_plan.size(), m_path_list.size());
  }
}

void UI::generate_plan() {
  if (m_is_operation_in_progress) {
    return;
  }
  m_is_operation_in_progress = true;
  cleanup_finished_threads();
  m_status_text = "Generating names... Please wait.";

  m_worker_threads.emplace_back([self = shared_from_this()](
                                    const std::stop_token& stoken) {
    try {
      RenamePlan plan_result = self->m_renamer.generate_from_json(self->m_path_list);

      if (stoken.stop_requested()) {
        IOManager::log("Generation was cancelled, UI will not be updated.");
        self->m_is_operation_in_progress = false;
        return;
      }

      self->m_screen.Post(
          [self, plan_result = std::move(plan_result)]() mutable {
            self->m_plan = std::move(plan_result);
            self->update_ui_from_plan();
          });
    } catch (const std::exception& e) {
      IOManager::log(std::format("ERROR during generation: {}", e.what()));
      self->m_screen.Post([self, error_msg = std::string(e.what())] {
        self->m_status_text = "Generation failed: " + error_msg;
      });
    }
    self->m_is_operation_in_progress = false;
  });
}

void UI::execute_plan() {
  if (m_is_operation_in_progress) return;

  RenamePlan selected;
  for (size_t i = 0; i < m_plan.size(); ++i) {
    if (m_plan_selections[i]) {
      selected.push_back(m_plan[i]);
    }
  }

  if (selected.empty()) {
    m_status_text = "Nothing selected to apply.";
    return;
  }

  cleanup_finished_threads();
  m_status_text = "Renaming in progress...";
  m_is_operation_in_progress = true;

  m_worker_threads.emplace_back(
      [self = shared_from_this(), selected = std::move(selected)] {
        try {
          self->m_renamer.overwrite(selected);

          self->m_screen.Post([self] {
            self->m_plan.clear();
            self->update_ui_from_plan();
            self->m_status_text =
                "Plan applied. Skipped renames are listed in the log.";
          });
        } catch (const std::exception& e) {
          IOManager::log(
              std::format("CRITICAL ERROR in execute_plan: {}", e.what()));
          self->m_screen.Post([self, error_msg = std::string(e.what())] {
            self->m_status_text = "Execution failed: " + error_msg;
          });
        }
        self->m_is_operation_in_progress = false;
      });
}

void UI::run() {
  try {
    IOManager::set_log_handler(
        [this](std::string_view message) { this->AddLogMessage(message); });

    auto generate_button =
        Button(&m_generate_button_label, [this] { generate_plan(); });

    auto quit_button = Button("  Quit  ", [this] {
      IOManager::log("Quit requested. Stopping worker threads...");
      for (auto& t : m_worker_threads) {
        t.request_stop();
      }
      m_screen.Exit();
    });

    auto apply_button = Button(&m_apply_button_label, [&] {
      if (m_is_operation_in_progress || m_plan.empty()) {
        return;
      }
      execute_plan();
    });

    auto top_menu = Container::Horizontal({generate_button, quit_button});

    auto main_layout =
        Container::Vertical({top_menu, m_plan_component, apply_button});

    m_main_container = Container::Vertical({
        main_layout,
        m_log_component,
    });

    const std::string scheme_text =
        SchemeCompiler::describe(m_renamer.naming_scheme());

    auto final_renderer = Renderer(m_main_container, [&] {
      bool is_busy = m_is_operation_in_progress;
      bool can_apply = !m_plan.empty() && !is_busy;

      m_generate_button_label = is_busy ? "  Busy...  " : " Generate ";
      m_apply_button_label =
          is_busy ? "  Busy...  " : " Apply Selected (Enter) ";

      Element apply_button_element = apply_button->Render();

      if (!can_apply) {
        apply_button_element = apply_button_element | dim;
      }

      auto top_pane = vbox(
          {hbox({text(" Media Renamer ") | bold, filler(),
                 text(std::format("Scheme: {} ", scheme_text))}) |
               color(Color::White) | bgcolor(Color::Blue),
           top_menu->Render(), separator(), m_plan_component->Render() | flex,
           separator(),
           hbox({text(" " + m_status_text), filler(), apply_button_element})});

      auto log_pane =
          vbox({text("Log Output") | bold, m_log_component->Render() | flex});

      return vbox({top_pane | flex_grow, separator(),
                   log_pane | size(HEIGHT, EQUAL, 10)}) |
             border;
    });

    IOManager::log("Starting UI event loop...");
    m_screen.Loop(final_renderer);
    IOManager::log("UI event loop exited. Waiting for threads to join...");

    m_worker_threads.clear();

    IOManager::log("All threads joined. Exiting.");
    IOManager::set_log_handler(nullptr);

  } catch (const std::exception& e) {
    IOManager::log(
        std::format("CRITICAL: Exception in UI::run(): {}", e.what()));
    throw;
  }
}
