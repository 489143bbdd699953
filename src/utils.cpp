#include "utils.hpp"

#include <fmt/chrono.h>
#include <fmt/format.h>

#include <chrono>
#include <ctime>
#include <iomanip>
#include <regex>
#include <sstream>

std::string hex_from_bytes(std::string_view bytes){
    std::ostringstream oss;
    for(auto c: bytes) oss << std::hex << std::setw(2) << std::setfill('0') << (int)(unsigned char)c;
    return oss.str();
}

std::vector<std::string> format_hex_dump(std::string_view data,
                                         bool colorize,
                                         std::size_t bytes_per_line){
    std::vector<std::string> lines;
    if(bytes_per_line == 0) bytes_per_line = 16;
    for(std::size_t offset = 0; offset < data.size(); offset += bytes_per_line){
        auto chunk = data.substr(offset, bytes_per_line);
        std::string hex;
        for(std::size_t i = 0; i < chunk.size(); ++i){
            if(i > 0) hex += ' ';
            hex += hex_from_bytes(chunk.substr(i, 1));
        }
        hex.resize(bytes_per_line * 3, ' ');
        std::string printable;
        for(char c : chunk){
            auto u = static_cast<unsigned char>(c);
            printable += (u >= 32 && u <= 126) ? c : '.';
        }
        if(colorize){
            lines.push_back(fmt::format("{}{:08x}: {}{}  {}{}{}",
                                        ansi::cyan, offset, ansi::reset, hex,
                                        ansi::green, printable, ansi::reset));
        } else {
            lines.push_back(fmt::format("{:08x}: {}  {}", offset, hex, printable));
        }
    }
    return lines;
}

std::string format_endpoint(const asio::ip::tcp::endpoint& ep){
    return ep.address().to_string() + ":" + std::to_string(ep.port());
}

std::string format_endpoint(const asio::ip::udp::endpoint& ep){
    return ep.address().to_string() + ":" + std::to_string(ep.port());
}

std::string strip_ansi(const std::string& text){
    static const std::regex escape("\x1b\\[[0-9;]*[A-Za-z]");
    return std::regex_replace(text, escape, "");
}

std::string timestamp_now(bool short_form){
    auto now = std::chrono::system_clock::now();
    auto seconds = std::chrono::system_clock::to_time_t(now);
    std::tm local{};
    localtime_r(&seconds, &local);
    if(short_form){
        return fmt::format("{:%H:%M:%S}", local);
    }
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()).count() % 1000;
    return fmt::format("{:%Y-%m-%d %H:%M:%S}.{:03d}", local, static_cast<int>(millis));
}

std::string apply_timestamp(const std::string& message){
    auto stamp = "[" + timestamp_now() + "] ";
    if(message.rfind("\x1b[", 0) == 0){
        auto color_end = message.find('m');
        if(color_end != std::string::npos){
            return message.substr(0, color_end + 1) + stamp + message.substr(color_end + 1);
        }
    }
    return stamp + message;
}
