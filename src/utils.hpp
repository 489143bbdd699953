#pragma once
#include <asio.hpp>

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

std::string hex_from_bytes(std::string_view bytes);

// "offset: hex bytes  ascii", 16 bytes per line.
std::vector<std::string> format_hex_dump(std::string_view data,
                                         bool colorize,
                                         std::size_t bytes_per_line = 16);

std::string format_endpoint(const asio::ip::tcp::endpoint& ep);
std::string format_endpoint(const asio::ip::udp::endpoint& ep);

std::string strip_ansi(const std::string& text);

// Local wall clock, "YYYY-mm-dd HH:MM:SS.mmm" or "HH:MM:SS" when short.
std::string timestamp_now(bool short_form = false);

// Prefixes "[timestamp] ", placed after a leading colour escape if present.
std::string apply_timestamp(const std::string& message);

namespace ansi {
inline constexpr const char* reset = "\x1b[0m";
inline constexpr const char* red = "\x1b[31m";
inline constexpr const char* green = "\x1b[32m";
inline constexpr const char* yellow = "\x1b[33m";
inline constexpr const char* blue = "\x1b[34m";
inline constexpr const char* cyan = "\x1b[36m";
inline constexpr const char* clear_line = "\r\x1b[K";
inline constexpr const char* clear_screen = "\x1b[2J\x1b[H";
} // namespace ansi
