#include "test_runner_utils.hpp"

#include "chat_overlay.hpp"
#include "console.hpp"
#include "line_editor.hpp"
#include "utils.hpp"

namespace ndog::test {
namespace {

// Console whose stdout side lands in a string.
struct CapturedConsole {
  explicit CapturedConsole(Console::Options options = {})
    : console(options, [this](std::string_view text){ out.append(text); }) {}

  ByteSink out;
  Console console;
};

bool test_line_editor(TestContext&) {
  LineEditor editor;
  if(!editor.empty() || editor.backspace()) return false;
  editor.insert('h');
  editor.insert("ello!");
  if(editor.buffer() != "hello!") return false;
  if(!editor.backspace() || editor.buffer() != "hello") return false;
  auto line = editor.submit();
  if(line != "hello" || !editor.empty()) return false;
  editor.insert("x");
  editor.clear();
  return editor.buffer().empty();
}

bool test_line_editor_utf8_backspace(TestContext&) {
  LineEditor editor;
  // one, two, three and four byte sequences
  editor.insert("a\xc3\xb1\xe2\x82\xac\xf0\x9f\x98\x80");
  if(!editor.backspace() || editor.buffer() != "a\xc3\xb1\xe2\x82\xac") return false;
  if(!editor.backspace() || editor.buffer() != "a\xc3\xb1") return false;
  if(!editor.backspace() || editor.buffer() != "a") return false;
  if(!editor.backspace() || !editor.empty()) return false;
  // a stray continuation byte on its own is still removed
  editor.insert("\x80");
  return editor.backspace() && editor.empty();
}

bool test_overlay_backspace_sends_whole_characters(TestContext&) {
  CapturedConsole captured(Console::Options{false, false, false});
  std::vector<std::string> sent;
  ChatOverlay::Hooks hooks;
  hooks.send = [&sent](std::string line){ sent.push_back(std::move(line)); };
  ChatOverlay overlay(captured.console, hooks);
  overlay.feed("caf\xc3\xa9\x7f" "e\n");
  return sent.size() == 1 && sent[0] == "cafe\n";
}

bool test_chat_command_parsing(TestContext&) {
  return parse_chat_command("hello") == ChatCommand::none &&
         parse_chat_command("") == ChatCommand::none &&
         parse_chat_command("not /help") == ChatCommand::none &&
         parse_chat_command("/help") == ChatCommand::help &&
         parse_chat_command("/?") == ChatCommand::help &&
         parse_chat_command("/CLEAR") == ChatCommand::clear &&
         parse_chat_command("/cls") == ChatCommand::clear &&
         parse_chat_command("/quit now") == ChatCommand::quit &&
         parse_chat_command("/exit") == ChatCommand::quit &&
         parse_chat_command("/status  ") == ChatCommand::status &&
         parse_chat_command("/whoami") == ChatCommand::whoami &&
         parse_chat_command("/dance") == ChatCommand::unknown &&
         parse_chat_command("/") == ChatCommand::unknown;
}

bool test_overlay_sends_lines(TestContext&) {
  CapturedConsole captured(Console::Options{false, false, false});
  std::vector<std::string> sent;
  ChatOverlay::Hooks hooks;
  hooks.send = [&sent](std::string line){ sent.push_back(std::move(line)); };
  ChatOverlay overlay(captured.console, hooks);
  overlay.attach();

  overlay.feed("hi therx");
  overlay.feed("\x7f" "e\r\n");
  overlay.feed("second\n");
  // arrow keys never reach the buffer
  overlay.feed("\x1b[Athird\x1b[D\r");

  if(sent.size() != 3) return false;
  return sent[0] == "hi there\n" &&
         sent[1] == "second\n" &&
         sent[2] == "third\n" &&
         overlay.pending().empty() &&
         strip_ansi(captured.out.str()).find("[YOU] hi there") != std::string::npos;
}

bool test_overlay_commands_stay_local(TestContext&) {
  CapturedConsole captured(Console::Options{false, false, false});
  int sends = 0;
  int quits = 0;
  ChatOverlay::Hooks hooks;
  hooks.send = [&sends](std::string){ ++sends; };
  hooks.status = [](){ return std::string("connected 127.0.0.1:1 -> 127.0.0.1:2"); };
  hooks.whoami = [](){ return std::string("127.0.0.1:40000"); };
  hooks.quit = [&quits](){ ++quits; };
  ChatOverlay overlay(captured.console, hooks);
  overlay.attach();

  overlay.feed("/help\n/status\n/whoami\n/bogus\n/clear\n");
  auto out = strip_ansi(captured.out.str());
  bool ok = sends == 0 && quits == 0 &&
            out.find("/whoami  show the local endpoint") != std::string::npos &&
            out.find("connected 127.0.0.1:1 -> 127.0.0.1:2") != std::string::npos &&
            out.find("127.0.0.1:40000") != std::string::npos &&
            out.find("Unknown command /bogus, type /help") != std::string::npos &&
            captured.out.str().find(ansi::clear_screen) != std::string::npos;

  overlay.feed("/quit\n");
  ok = ok && quits == 1 && overlay.quit_requested();

  // Ctrl+D quits only on an empty line
  ChatOverlay second(captured.console, hooks);
  second.feed("abc\x04");
  ok = ok && quits == 1 && second.pending() == "abc";
  second.feed("\x7f\x7f\x7f\x04");
  return ok && quits == 2;
}

bool test_inbound_rerenders_pending_input(TestContext&) {
  CapturedConsole captured(Console::Options{false, false, false});
  ChatOverlay overlay(captured.console, ChatOverlay::Hooks{});
  overlay.attach();
  overlay.feed("half typed");

  auto before = captured.out.str().size();
  overlay.show_inbound("line one\nline two\n", "10.0.0.5:4000");
  auto raw = captured.out.str().substr(before);
  auto after = strip_ansi(raw);

  auto clear = raw.find(ansi::clear_line);
  auto first = after.find("[RECV] [10.0.0.5:4000] line one");
  auto second = after.find("[RECV] [10.0.0.5:4000] line two");
  auto redraw = after.rfind("[YOU] half typed");
  bool ordered = clear == 0 &&
                 first != std::string::npos &&
                 second != std::string::npos &&
                 redraw != std::string::npos &&
                 first < second && second < redraw;
  // the pending buffer survives untouched
  return ordered && overlay.pending() == "half typed" &&
         captured.out.str().find('\a') != std::string::npos;
}

bool test_console_payload_modes(TestContext&) {
  {
    CapturedConsole plain(Console::Options{false, false, true});
    std::string raw("\x00\x01raw\r\nbytes", 12);
    plain.console.payload(raw);
    if(plain.out.str() != raw) return false;
  }
  {
    CapturedConsole prefixed(Console::Options{false, false, false});
    prefixed.console.payload("a\nb", "1.2.3.4:5");
    prefixed.console.payload("c\n", "1.2.3.4:5");
    if(prefixed.out.str() != "[1.2.3.4:5] a\n[1.2.3.4:5] bc\n") return false;
  }
  {
    CapturedConsole hex(Console::Options{false, true, false});
    hex.console.payload("ABC");
    auto out = hex.out.str();
    if(out.find("41 42 43") == std::string::npos || out.find("ABC") == std::string::npos) return false;
  }
  {
    CapturedConsole stamped(Console::Options{true, false, false});
    stamped.console.payload("x\n");
    auto out = stamped.out.str();
    if(out.size() < 4 || out[0] != '[' || out.find("] x\n") == std::string::npos) return false;
  }
  return true;
}

bool test_hex_dump_format(TestContext&) {
  auto lines = format_hex_dump(std::string("0123456789abcdefXY"), false);
  if(lines.size() != 2) return false;
  return lines[0].find("30 31 32") != std::string::npos &&
         lines[0].find("0123456789abcdef") != std::string::npos &&
         lines[1].find("58 59") != std::string::npos &&
         strip_ansi("\x1b[31mred\x1b[0m") == "red" &&
         hex_from_bytes("\x01\xff") == "01ff";
}

} // namespace

void add_chat_tests(std::vector<TestCase>& tests) {
  tests.push_back({"line_editor", test_line_editor});
  tests.push_back({"line_editor_utf8_backspace", test_line_editor_utf8_backspace});
  tests.push_back({"chat_overlay_backspace_utf8", test_overlay_backspace_sends_whole_characters});
  tests.push_back({"chat_command_parsing", test_chat_command_parsing});
  tests.push_back({"chat_overlay_sends_lines", test_overlay_sends_lines});
  tests.push_back({"chat_overlay_commands_stay_local", test_overlay_commands_stay_local});
  tests.push_back({"chat_inbound_rerenders_pending_input", test_inbound_rerenders_pending_input});
  tests.push_back({"console_payload_modes", test_console_payload_modes});
  tests.push_back({"hex_dump_format", test_hex_dump_format});
}

} // namespace ndog::test
