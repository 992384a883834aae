#include "lanscan/scanner/ServiceCategory.h"

#include <algorithm>
#include <cctype>

namespace lanscan::scanner {

namespace {

constexpr std::string_view kVolumioKeyword = "volumio";

std::string toLower(std::string_view value) {
    std::string out(value);
    std::transform(out.begin(), out.end(), out.begin(), [](unsigned char ch) {
        return static_cast<char>(std::tolower(ch));
    });
    return out;
}

bool isLinkLocal(const boost::asio::ip::address_v4& address) {
    const auto bytes = address.to_bytes();
    return bytes[0] == 169 && bytes[1] == 254;
}

}  // namespace

common::DeviceType classifyService(std::string_view serviceType, std::string_view fullname) {
    using common::DeviceType;
    if (serviceType == kBluesoundServiceType) {
        return DeviceType::Bluesound;
    }
    if (serviceType == kVolumioServiceType) {
        return toLower(fullname).find(kVolumioKeyword) != std::string::npos ? DeviceType::Volumio
                                                                           : DeviceType::Generic;
    }
    if (serviceType == kSpotifyConnectServiceType) {
        return DeviceType::SpotifyConnect;
    }
    if (serviceType == kQobuzConnectServiceType) {
        return DeviceType::QobuzConnect;
    }
    return DeviceType::Generic;
}

std::string displayName(std::string_view fullname) {
    return std::string(fullname.substr(0, fullname.find('.')));
}

std::optional<boost::asio::ip::address_v4> selectDeviceAddress(
    const std::vector<boost::asio::ip::address>& candidates) {
    for (const auto& candidate : candidates) {
        if (!candidate.is_v4()) {
            continue;
        }
        const auto v4 = candidate.to_v4();
        if (!isLinkLocal(v4)) {
            return v4;
        }
    }
    return std::nullopt;
}

}  // namespace lanscan::scanner
