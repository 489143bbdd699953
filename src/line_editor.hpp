#pragma once

#include <string>
#include <string_view>

// Text being composed by the operator, independent of any transport.
class LineEditor {
public:
  void insert(char c) { buffer_.push_back(c); }
  void insert(std::string_view text) { buffer_.append(text.data(), text.size()); }

  // Removes one whole character. False when there was nothing to remove.
  bool backspace();

  // Returns the composed line and clears the buffer.
  std::string submit();

  void clear() { buffer_.clear(); }
  const std::string& buffer() const { return buffer_; }
  bool empty() const { return buffer_.empty(); }

private:
  std::string buffer_;
};

enum class ChatCommand { none, help, clear, quit, status, whoami, unknown };

inline constexpr char kCommandPrefix = '/';

// `none` for ordinary text; `unknown` for a prefixed word not in the set.
ChatCommand parse_chat_command(std::string_view line);
