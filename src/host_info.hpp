#pragma once

#include <asio.hpp>

#include <chrono>
#include <string>

class Logger;

// Address of the interface used for outbound traffic (no packet is sent).
// "0.0.0.0" when it cannot be determined.
std::string get_local_ip(asio::io_context& io, Logger* logger = nullptr);

// Plain HTTP query to api.ipify.org. "0.0.0.0" on failure, with a warning.
std::string get_public_ip(asio::io_context& io,
                          std::chrono::milliseconds timeout = std::chrono::seconds(3),
                          Logger* logger = nullptr);
