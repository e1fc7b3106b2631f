#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace fwdgate {
namespace trust {

// Which entry of a forwarded-for list names the client.
enum class AddressPick {
    kLeftmost,  // originating client, by convention of the forwarding chain
    kRightmost, // closest hop
};

struct TrustedNetwork {
    std::uint32_t network;
    std::uint32_t mask;
};

// Proxy-header trust settings. Built once at startup and read-only afterwards.
// An empty header name disables that header.
struct TrustConfig {
    bool enabled = false;
    std::string forwardedForHeader = "X-Forwarded-For";
    std::string forwardedProtoHeader = "X-Forwarded-Proto";
    std::string forwardedHostHeader = "X-Forwarded-Host";
    AddressPick addressPick = AddressPick::kLeftmost;

    // Peers whose forwarding headers are believed. trustAllPeers corresponds to "*".
    bool trustAllPeers = true;
    std::vector<TrustedNetwork> trustedNetworks;

    bool PeerTrusted(const std::string& peerIp) const;
};

const char* AddressPickToString(AddressPick pick);

} // namespace trust
} // namespace fwdgate
