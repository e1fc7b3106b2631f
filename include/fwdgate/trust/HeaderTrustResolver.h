#pragma once

#include "fwdgate/trust/TrustConfig.h"
#include "fwdgate/trust/RequestContext.h"

#include <optional>
#include <string>

namespace fwdgate {
namespace protocol {
class HttpRequest;
}

namespace trust {

// Derives the effective client address, scheme and host of a request from its
// transport and, when trusted, the proxy forwarding headers. Malformed header
// values are treated as absent; Resolve never fails.
class HeaderTrustResolver {
public:
    explicit HeaderTrustResolver(const TrustConfig& config);

    RequestContext Resolve(const ConnectionInfo& conn, const protocol::HttpRequest& req) const;

    const TrustConfig& config() const { return config_; }

    // Picks the client from a comma separated forwarded-for list; nullopt if no entry is a
    // well-formed address.
    static std::optional<std::string> ParseClientAddress(const std::string& list, AddressPick pick);

    // IPv4 or IPv6 literal, IPv6 optionally in brackets. *normalized receives the
    // address without brackets.
    static bool IsValidIpLiteral(const std::string& value, std::string* normalized = nullptr);

    // RFC 7230 token.
    static bool IsValidHeaderName(const std::string& name);

    // Non-empty authority without whitespace, control characters, '/', '\\' or '@'.
    static bool IsPlausibleHost(const std::string& host);

    // "*" or a comma separated list of IPv4 addresses / CIDRs.
    static bool ParseTrustedProxies(const std::string& csv, TrustConfig* config, std::string* err);

    static bool ParseCidr(const std::string& cidr, TrustedNetwork* out);

private:
    TrustConfig config_;
};

} // namespace trust
} // namespace fwdgate
