#include "console.hpp"

#include "log.hpp"
#include "utils.hpp"

#include <cstdio>

Console::Console(Options options, Writer writer)
  : options_(options), writer_(std::move(writer)) {}

Console::~Console() {
  finish();
}

void Console::set_input_line(InputLine* line) {
  std::lock_guard<std::mutex> lock(mutex_);
  input_line_ = line;
}

std::string Console::decorate(const char* color, const std::string& text) const {
  if(!options_.color || !color) return text;
  return std::string(color) + text + ansi::reset;
}

std::string Console::line_prefix(const std::string& from) const {
  std::string prefix;
  if(options_.timestamps) {
    prefix += decorate(ansi::blue, "[" + timestamp_now() + "]") + " ";
  }
  if(!from.empty()) {
    prefix += decorate(ansi::cyan, "[" + from + "]") + " ";
  }
  return prefix;
}

void Console::write_stdout(std::string_view text) {
  if(writer_) {
    writer_(text);
    return;
  }
  std::fwrite(text.data(), 1, text.size(), stdout);
  std::fflush(stdout);
}

void Console::mirror(std::string_view rendered) {
  auto logger = mirror_logger();
  if(!logger) return;
  mirror_partial_.append(rendered.data(), rendered.size());
  std::size_t start = 0;
  for(auto pos = mirror_partial_.find('\n'); pos != std::string::npos;
      pos = mirror_partial_.find('\n', start)) {
    auto line = mirror_partial_.substr(start, pos - start);
    if(!line.empty() && line.back() == '\r') line.pop_back();
    logger->info("{}", strip_ansi(line));
    start = pos + 1;
  }
  mirror_partial_.erase(0, start);
}

void Console::payload(std::string_view data, const std::string& from) {
  if(data.empty()) return;
  std::lock_guard<std::mutex> lock(mutex_);

  std::string rendered;
  if(options_.hex) {
    for(const auto& line : format_hex_dump(data, options_.color)) {
      rendered += line_prefix(from) + line + "\n";
    }
  } else if(!options_.timestamps && from.empty()) {
    rendered.assign(data.data(), data.size());
  } else {
    rendered.reserve(data.size() + 64);
    for(char c : data) {
      if(at_line_start_) {
        rendered += line_prefix(from);
        at_line_start_ = false;
      }
      rendered += c;
      if(c == '\n') at_line_start_ = true;
    }
  }
  if(!options_.hex && !data.empty()) {
    at_line_start_ = data.back() == '\n';
  }

  if(input_line_) {
    write_stdout(ansi::clear_line);
    write_stdout(rendered);
    if(!at_line_start_) {
      write_stdout("\n");
      at_line_start_ = true;
    }
    write_stdout(input_line_->render());
  } else {
    write_stdout(rendered);
  }
  mirror(rendered);
}

void Console::emit_status(const std::string& line, const char* color) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto text = decorate(color, line);
  if(options_.timestamps) text = apply_timestamp(text);
  if(input_line_) write_stdout(ansi::clear_line);
  print_err(nullptr, "{}", options_.color ? text : strip_ansi(text));
  if(input_line_) write_stdout(input_line_->render());
}

void Console::status(const std::string& line) { emit_status(line, nullptr); }
void Console::success(const std::string& line) { emit_status(line, ansi::green); }
void Console::warning(const std::string& line) { emit_status(line, ansi::yellow); }
void Console::failure(const std::string& line) { emit_status(line, ansi::red); }

void Console::above_input(const std::string& line, bool ring_bell) {
  std::lock_guard<std::mutex> lock(mutex_);
  std::string rendered = line;
  if(rendered.empty() || rendered.back() != '\n') rendered += '\n';
  if(!options_.color) rendered = strip_ansi(rendered);
  write_stdout(ansi::clear_line);
  write_stdout(rendered);
  if(ring_bell) write_stdout("\a");
  at_line_start_ = true;
  if(input_line_) write_stdout(input_line_->render());
  mirror(rendered);
}

void Console::refresh_input() {
  std::lock_guard<std::mutex> lock(mutex_);
  if(!input_line_) return;
  write_stdout(ansi::clear_line);
  auto text = input_line_->render();
  write_stdout(options_.color ? text : strip_ansi(text));
}

void Console::clear_screen() {
  std::lock_guard<std::mutex> lock(mutex_);
  write_stdout(ansi::clear_screen);
  if(input_line_) write_stdout(input_line_->render());
}

void Console::finish() {
  std::lock_guard<std::mutex> lock(mutex_);
  if(!mirror_partial_.empty()) {
    if(auto logger = mirror_logger()) logger->info("{}", strip_ansi(mirror_partial_));
    mirror_partial_.clear();
  }
  if(input_line_) {
    write_stdout("\n");
    input_line_ = nullptr;
  }
}
