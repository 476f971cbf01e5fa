#pragma once
// ═══════════════════════════════════════════════════════════════════
//  lanserve/network.h — Local address discovery for the printed URL
// ═══════════════════════════════════════════════════════════════════

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/udp.hpp>
#include <string>

namespace lanserve::network {

inline constexpr const char* FallbackAddress = "127.0.0.1";

// ── Address of the interface that routes to the outside world ──
//    Connecting a UDP socket sends nothing; it only selects a route.
inline std::string localIp() {
    namespace net = boost::asio;
    using udp = net::ip::udp;

    net::io_context ioc;
    udp::socket socket(ioc);
    boost::system::error_code ec;

    socket.open(udp::v4(), ec);
    if (ec) return FallbackAddress;

    socket.connect(udp::endpoint(net::ip::make_address_v4("8.8.8.8"), 80), ec);
    if (ec) return FallbackAddress;

    auto local = socket.local_endpoint(ec);
    if (ec || local.address().is_unspecified()) return FallbackAddress;
    return local.address().to_string();
}

} // namespace lanserve::network
