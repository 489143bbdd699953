#pragma once

#include <functional>
#include <mutex>
#include <string>
#include <string_view>

// Local rendering. Peer payload goes to stdout untouched apart from our own
// line decorations (sender prefix, timestamp); status lines go to stderr.
// Complete lines are mirrored into the log file when one is configured.
class Console {
public:
  struct Options {
    bool timestamps = false;
    bool hex = false;
    bool color = true;
  };

  // A line being composed on the terminal. render() returns prompt plus
  // pending text; it is called with the console lock held.
  class InputLine {
  public:
    virtual ~InputLine() = default;
    virtual std::string render() const = 0;
  };

  // Destination of stdout-bound text; tests capture it.
  using Writer = std::function<void(std::string_view)>;

  explicit Console(Options options, Writer writer = {});
  ~Console();

  Console(const Console&) = delete;
  Console& operator=(const Console&) = delete;

  const Options& options() const { return options_; }

  void set_input_line(InputLine* line);

  // `from` is shown as "[from] " at the start of every line when set.
  void payload(std::string_view data, const std::string& from = {});

  void status(const std::string& line);
  void success(const std::string& line);
  void warning(const std::string& line);
  void failure(const std::string& line);

  // Prints a full line above the input line and re-renders it.
  void above_input(const std::string& line, bool ring_bell = false);
  // Redraws the input line in place.
  void refresh_input();
  void clear_screen();

  // Terminates a partial payload line and flushes the mirror.
  void finish();

private:
  void write_stdout(std::string_view text);
  void mirror(std::string_view rendered);
  void emit_status(const std::string& line, const char* color);
  std::string decorate(const char* color, const std::string& text) const;
  std::string line_prefix(const std::string& from) const;

  Options options_;
  Writer writer_;
  std::mutex mutex_;
  InputLine* input_line_ = nullptr;
  bool at_line_start_ = true;
  std::string mirror_partial_;
};
