#pragma once

#include <mutex>

// Running/quit handshake between the UI thread and the session thread.
// Exactly one side ends up responsible for closing the screen.
class SessionGate {
 public:
  void start() {
    std::scoped_lock lock(m_mutex);
    m_running = true;
    m_quit_pending = false;
  }

  // True when the session is not running and the caller closes the screen
  // now. Otherwise finish() will report the pending quit.
  bool request_quit() {
    std::scoped_lock lock(m_mutex);
    if (!m_running) return true;
    m_quit_pending = true;
    return false;
  }

  // Marks the session done. True when a quit arrived while it was running.
  bool finish() {
    std::scoped_lock lock(m_mutex);
    m_running = false;
    return m_quit_pending;
  }

  bool running() const {
    std::scoped_lock lock(m_mutex);
    return m_running;
  }

 private:
  mutable std::mutex m_mutex;
  bool m_running = false;
  bool m_quit_pending = false;
};
