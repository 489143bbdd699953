#include "line_editor.hpp"

#include <algorithm>
#include <cctype>

// Drops the last UTF-8 character: trailing continuation bytes go with
// their lead byte.
bool LineEditor::backspace() {
  if(buffer_.empty()) return false;
  auto is_continuation = [](char c){ return (static_cast<unsigned char>(c) & 0xC0) == 0x80; };
  while(buffer_.size() > 1 && is_continuation(buffer_.back())) {
    buffer_.pop_back();
  }
  buffer_.pop_back();
  return true;
}

std::string LineEditor::submit() {
  std::string line;
  line.swap(buffer_);
  return line;
}

ChatCommand parse_chat_command(std::string_view line) {
  while(!line.empty() && std::isspace(static_cast<unsigned char>(line.back()))) {
    line.remove_suffix(1);
  }
  if(line.empty() || line.front() != kCommandPrefix) return ChatCommand::none;

  auto space = line.find(' ');
  auto word = space == std::string_view::npos ? line.substr(1) : line.substr(1, space - 1);
  std::string lowered(word);
  std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                 [](unsigned char ch){ return static_cast<char>(std::tolower(ch)); });

  if(lowered == "help" || lowered == "?") return ChatCommand::help;
  if(lowered == "clear" || lowered == "cls") return ChatCommand::clear;
  if(lowered == "quit" || lowered == "exit") return ChatCommand::quit;
  if(lowered == "status") return ChatCommand::status;
  if(lowered == "whoami") return ChatCommand::whoami;
  return ChatCommand::unknown;
}
