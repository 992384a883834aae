#pragma once

#include "lanscan/common/Device.h"

#include <boost/asio/ip/address.hpp>
#include <boost/asio/ip/address_v4.hpp>

#include <array>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace lanscan::scanner {

inline constexpr std::string_view kBluesoundServiceType = "_musc._tcp.local.";
inline constexpr std::string_view kVolumioServiceType = "_http._tcp.local.";
inline constexpr std::string_view kSpotifyConnectServiceType = "_spotify-connect._tcp.local.";
inline constexpr std::string_view kQobuzConnectServiceType = "_qobuz-connect._tcp.local.";

// Browsed on every scan, in this order.
inline constexpr std::array<std::string_view, 4> kBrowsedServiceTypes{
    kBluesoundServiceType,
    kVolumioServiceType,
    kSpotifyConnectServiceType,
    kQobuzConnectServiceType,
};

// Maps an advertisement to a device type. `_http._tcp` is only a Volumio player when the
// instance name says so; every unknown type is Generic.
common::DeviceType classifyService(std::string_view serviceType, std::string_view fullname);

// "Living Room._musc._tcp.local." -> "Living Room"
std::string displayName(std::string_view fullname);

// First IPv4 candidate outside 169.254.0.0/16.
std::optional<boost::asio::ip::address_v4> selectDeviceAddress(
    const std::vector<boost::asio::ip::address>& candidates);

}  // namespace lanscan::scanner
