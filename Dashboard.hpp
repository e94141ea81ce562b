#pragma once

#include <deque>
#include <exception>
#include <ftxui/component/component.hpp>
#include <ftxui/component/screen_interactive.hpp>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

#include "IngestPipeline.hpp"
#include "SessionGate.hpp"

// Interactive front end for one session: live counters, the log tail and a
// Stop button. The pipeline runs on a background thread.
class Dashboard : public std::enable_shared_from_this<Dashboard> {
 public:
  Dashboard(IngestPipeline& pipeline, const Config& config);

  // Returns once the user quit and the pipeline has finished. Rethrows a
  // failure of the pipeline thread.
  RunSummary run();

 private:
  void start_pipeline();
  void request_quit();

  void AddLogMessage(std::string_view message);
  std::mutex m_log_mutex;
  std::deque<std::string> m_log_messages;

  ftxui::ScreenInteractive m_screen;
  IngestPipeline& m_pipeline;
  const Config& m_config;

  std::mutex m_state_mutex;
  SessionCounters m_counters;
  std::optional<RunSummary> m_summary;
  std::exception_ptr m_failure;
  std::string m_status_text;

  std::jthread m_pipeline_thread;
  SessionGate m_gate;

  std::string m_stop_button_label;
  std::string m_quit_button_label;

  ftxui::Component m_log_component;
  ftxui::Component m_main_container;
};
