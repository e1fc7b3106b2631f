#pragma once

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace fwdgate {
namespace trust {

class HeaderTrustResolver;

enum class Scheme { kHttp, kHttps };

const char* SchemeToString(Scheme scheme);

// Immutable snapshot of the transport a request arrived on.
struct ConnectionInfo {
    std::string remoteAddress;
    uint16_t remotePort = 0;
    Scheme transportScheme = Scheme::kHttp;
    std::string name;
};

// Everything the application sees about one request. Only HeaderTrustResolver creates these.
class RequestContext {
public:
    using HeaderList = std::vector<std::pair<std::string, std::string>>;

    // Never empty.
    const std::string& clientAddress() const { return clientAddress_; }
    // 0 when the address came from a forwarding header.
    uint16_t clientPort() const { return clientPort_; }
    Scheme scheme() const { return scheme_; }
    bool secure() const { return scheme_ == Scheme::kHttps; }
    const std::string& host() const { return host_; }

    const std::string& transportAddress() const { return transportAddress_; }
    uint16_t transportPort() const { return transportPort_; }
    Scheme transportScheme() const { return transportScheme_; }
    // True when at least one forwarding header changed address, scheme or host.
    bool forwarded() const { return forwarded_; }

    const std::string& method() const { return method_; }
    const std::string& path() const { return path_; }
    const std::string& query() const { return query_; }
    const std::string& httpVersion() const { return httpVersion_; }
    const HeaderList& headers() const { return headers_; }
    const std::string& body() const { return body_; }

    // First value of a header, case-insensitive; empty if absent.
    std::string header(const std::string& name) const;

    bool operator==(const RequestContext& other) const;
    bool operator!=(const RequestContext& other) const { return !(*this == other); }

private:
    friend class HeaderTrustResolver;
    RequestContext() = default;

    std::string clientAddress_;
    uint16_t clientPort_ = 0;
    Scheme scheme_ = Scheme::kHttp;
    std::string host_;
    std::string transportAddress_;
    uint16_t transportPort_ = 0;
    Scheme transportScheme_ = Scheme::kHttp;
    bool forwarded_ = false;

    std::string method_;
    std::string path_;
    std::string query_;
    std::string httpVersion_;
    HeaderList headers_;
    std::string body_;
};

} // namespace trust
} // namespace fwdgate
