#include "fwdgate/trust/HeaderTrustResolver.h"
#include "fwdgate/protocol/HttpRequest.h"
#include "fwdgate/common/Logger.h"

#include <arpa/inet.h>
#include <cctype>
#include <cstring>
#include <vector>

namespace fwdgate {
namespace trust {

namespace {

std::string TrimCopy(const std::string& s) {
    size_t i = 0;
    while (i < s.size() && std::isspace(static_cast<unsigned char>(s[i]))) ++i;
    size_t j = s.size();
    while (j > i && std::isspace(static_cast<unsigned char>(s[j - 1]))) --j;
    return s.substr(i, j - i);
}

std::vector<std::string> SplitList(const std::string& list) {
    std::vector<std::string> out;
    size_t start = 0;
    while (start <= list.size()) {
        size_t comma = list.find(',', start);
        if (comma == std::string::npos) comma = list.size();
        out.push_back(TrimCopy(list.substr(start, comma - start)));
        start = comma + 1;
    }
    return out;
}

// Repeated header lines form one list (RFC 7230 section 3.2.2).
std::string JoinedHeader(const protocol::HttpRequest& req, const std::string& name) {
    std::string joined;
    for (const auto& value : req.getHeaderValues(name)) {
        if (!joined.empty()) joined += ',';
        joined += value;
    }
    return joined;
}

std::string FirstListEntry(const std::string& list) {
    return TrimCopy(list.substr(0, list.find(',')));
}

bool ParseIpv4(const std::string& ip, std::uint32_t* out) {
    in_addr addr;
    std::memset(&addr, 0, sizeof(addr));
    if (::inet_pton(AF_INET, ip.c_str(), &addr) != 1) return false;
    *out = ntohl(addr.s_addr);
    return true;
}

} // namespace

const char* AddressPickToString(AddressPick pick) {
    return pick == AddressPick::kRightmost ? "rightmost" : "leftmost";
}

bool TrustConfig::PeerTrusted(const std::string& peerIp) const {
    if (trustAllPeers) return true;
    std::uint32_t ip = 0;
    if (!ParseIpv4(peerIp, &ip)) return false;
    for (const auto& n : trustedNetworks) {
        if ((ip & n.mask) == n.network) return true;
    }
    return false;
}

HeaderTrustResolver::HeaderTrustResolver(const TrustConfig& config) : config_(config) {}

RequestContext HeaderTrustResolver::Resolve(const ConnectionInfo& conn, const protocol::HttpRequest& req) const {
    RequestContext ctx;
    ctx.transportAddress_ = conn.remoteAddress;
    ctx.transportPort_ = conn.remotePort;
    ctx.transportScheme_ = conn.transportScheme;
    ctx.clientAddress_ = conn.remoteAddress;
    ctx.clientPort_ = conn.remotePort;
    ctx.scheme_ = conn.transportScheme;
    ctx.host_ = TrimCopy(req.getHeader("Host"));

    ctx.method_ = req.methodString();
    ctx.path_ = req.path();
    ctx.query_ = req.query();
    ctx.httpVersion_ = req.versionString();
    ctx.headers_ = req.headers();
    ctx.body_ = req.body();

    if (!config_.enabled) {
        return ctx;
    }
    if (!config_.PeerTrusted(conn.remoteAddress)) {
        LOG_DEBUG << "peer " << conn.remoteAddress << " is not a trusted proxy, ignoring forwarding headers";
        return ctx;
    }

    if (!config_.forwardedForHeader.empty()) {
        const std::string list = JoinedHeader(req, config_.forwardedForHeader);
        if (!list.empty()) {
            std::optional<std::string> client = ParseClientAddress(list, config_.addressPick);
            if (client) {
                ctx.clientAddress_ = *client;
                ctx.clientPort_ = 0;
                ctx.forwarded_ = true;
            } else {
                LOG_DEBUG << config_.forwardedForHeader << " has no usable address (\"" << list
                          << "\"), using transport address " << conn.remoteAddress;
            }
        }
    }

    if (!config_.forwardedProtoHeader.empty()) {
        const std::string list = JoinedHeader(req, config_.forwardedProtoHeader);
        if (!list.empty()) {
            const std::string proto = FirstListEntry(list);
            // Only ever upgrades: a TLS transport is never reported as http.
            if (protocol::HttpRequest::iequals(proto, "https")) {
                if (ctx.scheme_ != Scheme::kHttps) ctx.forwarded_ = true;
                ctx.scheme_ = Scheme::kHttps;
            } else if (!protocol::HttpRequest::iequals(proto, "http")) {
                LOG_DEBUG << config_.forwardedProtoHeader << " value \"" << proto << "\" ignored";
            }
        }
    }

    if (!config_.forwardedHostHeader.empty()) {
        const std::string list = JoinedHeader(req, config_.forwardedHostHeader);
        if (!list.empty()) {
            const std::string host = FirstListEntry(list);
            if (IsPlausibleHost(host)) {
                ctx.host_ = host;
                ctx.forwarded_ = true;
            } else {
                LOG_DEBUG << config_.forwardedHostHeader << " value \"" << host << "\" ignored";
            }
        }
    }

    return ctx;
}

std::optional<std::string> HeaderTrustResolver::ParseClientAddress(const std::string& list, AddressPick pick) {
    const std::vector<std::string> entries = SplitList(list);
    std::optional<std::string> found;
    for (const auto& entry : entries) {
        std::string normalized;
        if (!IsValidIpLiteral(entry, &normalized)) {
            continue;
        }
        found = normalized;
        if (pick == AddressPick::kLeftmost) {
            break;
        }
    }
    return found;
}

bool HeaderTrustResolver::IsValidIpLiteral(const std::string& value, std::string* normalized) {
    if (value.empty() || value.size() > INET6_ADDRSTRLEN + 2) {
        return false;
    }
    std::string candidate = value;
    bool bracketed = false;
    if (candidate.front() == '[') {
        if (candidate.size() < 3 || candidate.back() != ']') return false;
        candidate = candidate.substr(1, candidate.size() - 2);
        bracketed = true;
    }

    unsigned char buf[sizeof(struct in6_addr)];
    bool ok = false;
    if (!bracketed && ::inet_pton(AF_INET, candidate.c_str(), buf) == 1) {
        ok = true;
    } else if (::inet_pton(AF_INET6, candidate.c_str(), buf) == 1) {
        ok = true;
    }
    if (ok && normalized) {
        *normalized = candidate;
    }
    return ok;
}

bool HeaderTrustResolver::IsValidHeaderName(const std::string& name) {
    if (name.empty()) return false;
    static const char kTokenSpecials[] = "!#$%&'*+-.^_`|~";
    for (unsigned char c : name) {
        if (std::isalnum(c)) continue;
        if (c != '\0' && std::strchr(kTokenSpecials, c) != nullptr) continue;
        return false;
    }
    return true;
}

bool HeaderTrustResolver::IsPlausibleHost(const std::string& host) {
    if (host.empty() || host.size() > 255) return false;
    for (unsigned char c : host) {
        if (c <= 0x20 || c == 0x7f) return false;
        if (c == '/' || c == '\\' || c == '@') return false;
    }
    return true;
}

bool HeaderTrustResolver::ParseCidr(const std::string& cidr, TrustedNetwork* out) {
    std::string s = TrimCopy(cidr);
    if (s.empty()) return false;

    auto slash = s.find('/');
    std::string ipPart = TrimCopy((slash == std::string::npos) ? s : s.substr(0, slash));
    std::string prefixPart = TrimCopy((slash == std::string::npos) ? "32" : s.substr(slash + 1));

    if (prefixPart.empty() || prefixPart.size() > 2) return false;
    int prefix = 0;
    for (unsigned char c : prefixPart) {
        if (!std::isdigit(c)) return false;
        prefix = prefix * 10 + (c - '0');
    }
    if (prefix > 32) return false;

    std::uint32_t ip = 0;
    if (!ParseIpv4(ipPart, &ip)) return false;

    std::uint32_t m = (prefix == 0) ? 0u : (0xFFFFFFFFu << (32 - prefix));
    out->mask = m;
    out->network = ip & m;
    return true;
}

bool HeaderTrustResolver::ParseTrustedProxies(const std::string& csv, TrustConfig* config, std::string* err) {
    const std::string trimmed = TrimCopy(csv);
    if (trimmed.empty()) {
        if (err) *err = "trusted_proxies must not be empty (use * to trust every peer)";
        return false;
    }
    if (trimmed == "*") {
        config->trustAllPeers = true;
        config->trustedNetworks.clear();
        return true;
    }

    std::vector<TrustedNetwork> nets;
    for (const auto& entry : SplitList(trimmed)) {
        if (entry.empty()) continue;
        TrustedNetwork net;
        if (entry == "*" || !ParseCidr(entry, &net)) {
            if (err) *err = "invalid trusted proxy entry '" + entry + "'";
            return false;
        }
        nets.push_back(net);
    }
    if (nets.empty()) {
        if (err) *err = "trusted_proxies lists no address";
        return false;
    }
    config->trustAllPeers = false;
    config->trustedNetworks = std::move(nets);
    return true;
}

} // namespace trust
} // namespace fwdgate
