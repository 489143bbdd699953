#include "chat_overlay.hpp"

#include "utils.hpp"

#include <fmt/format.h>

namespace {

constexpr char kCtrlD = 4;
constexpr char kEscape = 0x1b;

const char* const kHelpLines[] = {
  "/help    show this list",
  "/clear   clear the screen",
  "/quit    close the session and exit (Ctrl+D on an empty line)",
  "/status  show session details",
  "/whoami  show the local endpoint",
};

} // namespace

ChatOverlay::ChatOverlay(Console& console, Hooks hooks, bool local_echo)
  : console_(console), hooks_(std::move(hooks)), local_echo_(local_echo) {}

ChatOverlay::~ChatOverlay() {
  detach();
}

void ChatOverlay::attach() {
  if(attached_) return;
  attached_ = true;
  console_.set_input_line(this);
  console_.refresh_input();
}

void ChatOverlay::detach() {
  if(!attached_) return;
  attached_ = false;
  console_.set_input_line(nullptr);
}

std::string ChatOverlay::prompt() const {
  return fmt::format("{}[{}] [YOU]{} ", ansi::green, timestamp_now(true), ansi::reset);
}

std::string ChatOverlay::render() const {
  std::lock_guard<std::mutex> lock(mutex_);
  if(!local_echo_) return prompt();
  return prompt() + editor_.buffer();
}

std::string ChatOverlay::pending() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return editor_.buffer();
}

bool ChatOverlay::quit_requested() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return quit_requested_;
}

ChatOverlay::Action ChatOverlay::consume(char c, std::string& submitted) {
  if(escape_state_ == 1) {
    escape_state_ = (c == '[' || c == 'O') ? 2 : 0;
    return Action::none;
  }
  if(escape_state_ == 2) {
    // parameters until a final byte in @..~
    if(c >= 0x40 && c <= 0x7e) escape_state_ = 0;
    return Action::none;
  }
  if(c == kEscape) {
    escape_state_ = 1;
    return Action::none;
  }

  bool after_cr = last_was_cr_;
  last_was_cr_ = (c == '\r');
  if(c == '\r' || c == '\n') {
    if(c == '\n' && after_cr) return Action::none;
    submitted = editor_.submit();
    return Action::submit;
  }
  if(c == 127 || c == '\b') {
    return editor_.backspace() ? Action::redraw : Action::none;
  }
  if(c == kCtrlD) {
    if(editor_.empty()) {
      quit_requested_ = true;
      return Action::quit;
    }
    return Action::none;
  }
  if(c == '\t' || static_cast<unsigned char>(c) >= 0x20) {
    editor_.insert(c);
    return Action::redraw;
  }
  return Action::none;
}

void ChatOverlay::feed(std::string_view raw) {
  for(char c : raw) {
    std::string submitted;
    Action action;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      action = consume(c, submitted);
    }
    // console calls take the console lock, then ours through render()
    switch(action) {
      case Action::none:
        break;
      case Action::redraw:
        if(local_echo_) console_.refresh_input();
        break;
      case Action::submit:
        run_line(submitted);
        break;
      case Action::quit:
        if(hooks_.quit) hooks_.quit();
        return;
    }
  }
}

void ChatOverlay::run_line(const std::string& line) {
  if(line.empty()) {
    console_.refresh_input();
    return;
  }
  auto command = parse_chat_command(line);
  if(command != ChatCommand::none) {
    run_command(command, line);
    return;
  }
  console_.above_input(fmt::format("{}[{}] [YOU]{} {}", ansi::green, timestamp_now(true), ansi::reset, line));
  if(hooks_.send) hooks_.send(line + "\n");
}

void ChatOverlay::run_command(ChatCommand command, const std::string& line) {
  switch(command) {
    case ChatCommand::help:
      for(const char* help : kHelpLines) console_.above_input(help);
      break;
    case ChatCommand::clear:
      console_.clear_screen();
      break;
    case ChatCommand::quit:
      {
        std::lock_guard<std::mutex> lock(mutex_);
        quit_requested_ = true;
      }
      if(hooks_.quit) hooks_.quit();
      break;
    case ChatCommand::status:
      console_.above_input(hooks_.status ? hooks_.status() : std::string("no session"));
      break;
    case ChatCommand::whoami:
      console_.above_input(hooks_.whoami ? hooks_.whoami() : std::string("unknown"));
      break;
    case ChatCommand::unknown:
      console_.above_input(fmt::format("{}Unknown command {}, type /help{}", ansi::yellow, line, ansi::reset));
      break;
    case ChatCommand::none:
      break;
  }
}

void ChatOverlay::show_inbound(std::string_view data, const std::string& from) {
  std::string text(data);
  while(!text.empty() && (text.back() == '\n' || text.back() == '\r')) text.pop_back();
  if(text.empty()) return;

  auto header = fmt::format("{}[{}] [RECV]{} ", ansi::cyan, timestamp_now(true), ansi::reset);
  if(!from.empty()) header += "[" + from + "] ";

  bool first = true;
  std::size_t start = 0;
  while(start <= text.size()) {
    auto end = text.find('\n', start);
    if(end == std::string::npos) end = text.size();
    auto line = text.substr(start, end - start);
    if(!line.empty() && line.back() == '\r') line.pop_back();
    console_.above_input(header + line, first);
    first = false;
    start = end + 1;
  }
}

void ChatOverlay::show_notice(const std::string& text) {
  console_.above_input(fmt::format("{}{}{}", ansi::yellow, text, ansi::reset));
}
