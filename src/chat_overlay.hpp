#pragma once

#include <functional>
#include <mutex>
#include <string>
#include <string_view>

#include "console.hpp"
#include "line_editor.hpp"

// Line-editing layer over a pump's local input. Enter sends the buffer as
// one line or runs a /command locally; inbound data is printed above the
// line being composed, which is then redrawn.
class ChatOverlay : public Console::InputLine {
public:
  struct Hooks {
    std::function<void(std::string line)> send;
    std::function<std::string()> status;
    std::function<std::string()> whoami;
    std::function<void()> quit;
  };

  ChatOverlay(Console& console, Hooks hooks, bool local_echo = true);
  ~ChatOverlay() override;

  ChatOverlay(const ChatOverlay&) = delete;
  ChatOverlay& operator=(const ChatOverlay&) = delete;

  void attach();
  void detach();

  // Raw bytes from the terminal (or a pipe).
  void feed(std::string_view raw);

  void show_inbound(std::string_view data, const std::string& from = {});
  void show_notice(const std::string& text);

  std::string render() const override;
  std::string pending() const;
  bool quit_requested() const;

private:
  enum class Action { none, redraw, submit, quit };

  Action consume(char c, std::string& submitted);
  void run_line(const std::string& line);
  void run_command(ChatCommand command, const std::string& line);
  std::string prompt() const;

  Console& console_;
  Hooks hooks_;
  bool local_echo_;
  bool attached_ = false;

  mutable std::mutex mutex_;
  LineEditor editor_;
  int escape_state_ = 0;
  bool last_was_cr_ = false;
  bool quit_requested_ = false;
};
