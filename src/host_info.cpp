#include "host_info.hpp"

#include "log.hpp"

#include <stdexcept>
#include <system_error>

#include <sys/socket.h>
#include <sys/time.h>

namespace {
constexpr const char* kUnknownAddress = "0.0.0.0";
constexpr const char* kIpEchoHost = "api.ipify.org";
} // namespace

std::string get_local_ip(asio::io_context& io, Logger* logger) {
    using asio::ip::udp;
    std::error_code ec;
    udp::socket socket(io);
    socket.open(udp::v4(), ec);
    // connect() on UDP only selects a route
    if(!ec) socket.connect(udp::endpoint(asio::ip::make_address_v4("8.8.8.8"), 53), ec);
    if(ec) {
        log_warn(logger, "Unable to determine local IP: {}", ec.message());
        return kUnknownAddress;
    }
    auto local = socket.local_endpoint(ec);
    if(ec) {
        log_warn(logger, "Unable to determine local IP: {}", ec.message());
        return kUnknownAddress;
    }
    return local.address().to_string();
}

std::string get_public_ip(asio::io_context& io,
                          std::chrono::milliseconds timeout,
                          Logger* logger) {
    using asio::ip::tcp;
    try {
        tcp::resolver resolver(io);
        tcp::socket socket(io);

        auto endpoints = resolver.resolve(kIpEchoHost, "80");
        asio::connect(socket, endpoints);

        // bound the blocking exchange below
        timeval tv{};
        tv.tv_sec = static_cast<time_t>(timeout.count() / 1000);
        tv.tv_usec = static_cast<suseconds_t>((timeout.count() % 1000) * 1000);
        ::setsockopt(socket.native_handle(), SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));

        std::string request =
            "GET /?format=text HTTP/1.0\r\nHost: api.ipify.org\r\n\r\n";
        asio::write(socket, asio::buffer(request));

        std::string response;
        char buf[512];
        for (;;) {
            std::error_code ec;
            size_t n = socket.read_some(asio::buffer(buf), ec);
            if (ec == asio::error::eof) break;         // normal end of stream
            if (ec) throw std::system_error(ec);
            response.append(buf, n);
        }

        auto pos = response.find("\r\n\r\n");
        if (pos == std::string::npos) throw std::runtime_error("malformed HTTP response");

        std::string body = response.substr(pos + 4);
        while (!body.empty() &&
               (body.back() == '\r' || body.back() == '\n' || body.back() == ' '))
            body.pop_back();

        std::error_code parse_ec;
        asio::ip::make_address(body, parse_ec);
        if (parse_ec) throw std::runtime_error("unexpected body '" + body + "'");
        return body;
    } catch (const std::exception& e) {
        log_warn(logger, "Unable to determine public IP: {}", e.what());
        return kUnknownAddress;
    }
}
