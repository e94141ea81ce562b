#include "Dashboard.hpp"

#include <format>
#include <ftxui/component/component.hpp>
#include <ftxui/dom/elements.hpp>
#include <utility>

#include "IOManager.hpp"
#include "utils.hpp"

using namespace ftxui;

namespace {
Element counter_cell(std::string_view label, std::uint64_t value, Color tint) {
  return vbox({text(std::string(label)) | dim | center,
               text(std::to_string(value)) | bold | color(tint) | center}) |
         border | flex;
}
}  // namespace

Dashboard::Dashboard(IngestPipeline& pipeline, const Config& config)
    : m_screen(ScreenInteractive::Fullscreen()),
      m_pipeline(pipeline),
      m_config(config),
      m_status_text("Starting..."),
      m_stop_button_label("  Stop  "),
      m_quit_button_label("  Quit  ") {
  IOManager::log("Initializing dashboard components...");

  m_log_component = Renderer([&] {
    Elements logs;
    {
      std::scoped_lock lock(m_log_mutex);
      for (const auto& msg : m_log_messages) {
        logs.push_back(text(msg));
      }
    }
    return vbox(logs) | focusPositionRelative(0, 1) | vscroll_indicator |
           frame | flex;
  });
}

void Dashboard::AddLogMessage(std::string_view message) {
  {
    std::scoped_lock lock(m_log_mutex);
    m_log_messages.push_back(std::string(message));
    if (m_log_messages.size() > 200) {
      m_log_messages.pop_front();
    }
  }
  m_screen.Post(Event::Custom);
}

void Dashboard::start_pipeline() {
  m_pipeline.set_progress_handler([this](const SessionCounters& counters) {
    {
      std::scoped_lock lock(m_state_mutex);
      m_counters = counters;
    }
    m_screen.Post(Event::Custom);
  });

  m_gate.start();
  m_status_text = m_config.dry_run ? "Dry run in progress..."
                                   : "Ingestion in progress...";

  m_pipeline_thread = std::jthread([self = shared_from_this()] {
    try {
      RunSummary summary = self->m_pipeline.run();
      std::scoped_lock lock(self->m_state_mutex);
      self->m_counters = summary.counters;
      self->m_status_text = std::format(
          "Session {} {}. Press Quit to exit.", summary.session_id,
          summary.completed ? "completed" : "stopped (partial)");
      self->m_summary = summary;
    } catch (const std::exception& e) {
      IOManager::log(std::format("CRITICAL ERROR in pipeline: {}", e.what()));
      std::scoped_lock lock(self->m_state_mutex);
      self->m_failure = std::current_exception();
      self->m_status_text = "Session failed: " + std::string(e.what());
    }
    if (self->m_gate.finish()) {
      self->m_screen.Post([self] { self->m_screen.Exit(); });
    } else {
      self->m_screen.Post(Event::Custom);
    }
  });
}

void Dashboard::request_quit() {
  if (m_gate.request_quit()) {
    m_screen.Exit();
    return;
  }
  // The pipeline thread closes the screen once the in-flight files are done.
  IOManager::log("Quit requested. Waiting for workers to finish...");
  m_pipeline.request_stop();
  std::scoped_lock lock(m_state_mutex);
  m_status_text = "Stopping, waiting for in-flight files...";
}

RunSummary Dashboard::run() {
  IOManager::set_log_handler(
      [this](std::string_view message) { this->AddLogMessage(message); });

  auto stop_button = Button(&m_stop_button_label, [this] {
    if (!m_gate.running() || m_pipeline.stop_requested()) return;
    m_pipeline.request_stop();
    std::scoped_lock lock(m_state_mutex);
    m_status_text = "Stopping, waiting for in-flight files...";
  });
  auto quit_button = Button(&m_quit_button_label, [this] { request_quit(); });

  auto top_menu = Container::Horizontal({stop_button, quit_button});
  m_main_container = Container::Vertical({top_menu, m_log_component});

  auto final_renderer = Renderer(m_main_container, [&] {
    SessionCounters counters;
    std::string status;
    {
      std::scoped_lock lock(m_state_mutex);
      counters = m_counters;
      status = m_status_text;
    }
    const bool stoppable = m_gate.running() && !m_pipeline.stop_requested();
    m_stop_button_label = stoppable ? "  Stop  " : "  Stopped  ";

    Element stop_element = stop_button->Render();
    if (!stoppable) stop_element = stop_element | dim;

    auto header =
        hbox({text(m_config.dry_run ? " Media Archiver [DRY RUN] "
                                    : " Media Archiver ") |
                  bold,
              filler(),
              text(std::format("{} -> {} ",
                               safe_path_to_string(m_config.source),
                               safe_path_to_string(m_config.destination)))}) |
        color(Color::White) | bgcolor(Color::Blue);

    auto counter_row = hbox({
        counter_cell("seen", counters.seen, Color::White),
        counter_cell("organized", counters.organized, Color::Green),
        counter_cell("duplicate", counters.duplicate, Color::Yellow),
        counter_cell("review", counters.review, Color::Cyan),
        counter_cell("error", counters.error, Color::Red),
        counter_cell("scan errors", counters.scan_errors, Color::Magenta),
    });

    auto top_pane = vbox({header, hbox({stop_element, quit_button->Render()}),
                          counter_row, separator(),
                          hbox({text(" " + status), filler()})});

    auto log_pane =
        vbox({text("Log Output") | bold, m_log_component->Render() | flex});

    return vbox({top_pane, separator(), log_pane | flex}) | border;
  });

  start_pipeline();

  IOManager::log("Starting UI event loop...");
  m_screen.Loop(final_renderer);
  IOManager::log("UI event loop exited. Waiting for the pipeline...");

  // Closing the window mid-run counts as a stop.
  if (m_gate.running()) m_pipeline.request_stop();
  if (m_pipeline_thread.joinable()) m_pipeline_thread.join();

  m_pipeline.set_progress_handler(nullptr);
  IOManager::set_log_handler(nullptr);

  std::scoped_lock lock(m_state_mutex);
  if (m_failure) std::rethrow_exception(m_failure);
  return m_summary.value_or(RunSummary{});
}
