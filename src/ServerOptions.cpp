#include "fwdgate/ServerOptions.h"
#include "fwdgate/common/Config.h"
#include "fwdgate/trust/HeaderTrustResolver.h"

#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <map>
#include <set>
#include <arpa/inet.h>

namespace fwdgate {

namespace {

std::string Lower(std::string s) {
    for (auto& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return s;
}

bool ParseLong(const std::string& text, long long* out) {
    if (text.empty()) return false;
    errno = 0;
    char* end = nullptr;
    long long v = std::strtoll(text.c_str(), &end, 10);
    if (errno != 0 || end == text.c_str() || *end != '\0') return false;
    *out = v;
    return true;
}

bool ParseDouble(const std::string& text, double* out) {
    if (text.empty()) return false;
    errno = 0;
    char* end = nullptr;
    double v = std::strtod(text.c_str(), &end);
    if (errno != 0 || end == text.c_str() || *end != '\0' || !std::isfinite(v)) return false;
    *out = v;
    return true;
}

// Walks the known keys of one section, reporting the first malformed value.
class SectionReader {
public:
    SectionReader(const common::Config& config, const std::string& section, std::string* err)
        : config_(config), section_(section), err_(err), ok_(true) {}

    bool ok() const { return ok_; }

    void String(const std::string& key, std::string* out) {
        auto v = config_.Find(section_, key);
        if (v) *out = *v;
    }

    void Bool(const std::string& key, bool* out) {
        auto v = config_.Find(section_, key);
        if (!v || !ok_) return;
        if (!ParseBool(*v, out)) Fail(key, *v, "expected a boolean");
    }

    void Int(const std::string& key, int* out) {
        auto v = config_.Find(section_, key);
        if (!v || !ok_) return;
        long long n = 0;
        if (!ParseLong(*v, &n) || n < 0 || n > 4096) {
            Fail(key, *v, "expected an integer between 0 and 4096");
            return;
        }
        *out = static_cast<int>(n);
    }

    void Size(const std::string& key, size_t* out) {
        auto v = config_.Find(section_, key);
        if (!v || !ok_) return;
        long long n = 0;
        if (!ParseLong(*v, &n) || n <= 0) {
            Fail(key, *v, "expected a positive integer");
            return;
        }
        *out = static_cast<size_t>(n);
    }

    void Seconds(const std::string& key, double* out) {
        auto v = config_.Find(section_, key);
        if (!v || !ok_) return;
        if (!ParseDouble(*v, out)) Fail(key, *v, "expected a number of seconds");
    }

    void Port(const std::string& key, uint16_t* out) {
        auto v = config_.Find(section_, key);
        if (!v || !ok_) return;
        if (!ParsePort(*v, out)) Fail(key, *v, "expected a port between 1 and 65535");
    }

    void Fail(const std::string& key, const std::string& value, const std::string& why) {
        if (!ok_) return;
        ok_ = false;
        if (err_) *err_ = "[" + section_ + "] " + key + " = '" + value + "': " + why;
    }

private:
    const common::Config& config_;
    std::string section_;
    std::string* err_;
    bool ok_;
};

void WarnUnknownKeys(const common::Config& config) {
    static const std::map<std::string, std::set<std::string>> kKnown = {
        {"global", {"listen_address", "listen_port", "threads", "worker_threads", "log_level", "reuse_port"}},
        {"http", {"request_timeout_sec", "keepalive_timeout_sec", "max_request_bytes", "access_log"}},
        {"proxy_headers", {"enable", "forwarded_for_header", "forwarded_proto_header", "forwarded_host_header",
                           "trusted_proxies", "address_pick"}},
        {"shutdown", {"grace_period_sec"}},
        {"tls", {"enable", "cert_path", "key_path"}},
    };
    for (const auto& section : config.GetAll()) {
        auto known = kKnown.find(section.first);
        if (known == kKnown.end()) {
            LOG_WARN << "Config: unknown section [" << section.first << "] ignored";
            continue;
        }
        for (const auto& kv : section.second) {
            if (known->second.count(kv.first) == 0) {
                LOG_WARN << "Config: unknown key [" << section.first << "] " << kv.first << " ignored";
            }
        }
    }
}

} // namespace

bool ParsePort(const std::string& text, uint16_t* out) {
    long long n = 0;
    if (!ParseLong(text, &n) || n < 1 || n > 65535) return false;
    *out = static_cast<uint16_t>(n);
    return true;
}

bool ParseBool(const std::string& text, bool* out) {
    const std::string v = Lower(text);
    if (v == "1" || v == "true" || v == "yes" || v == "on") {
        *out = true;
        return true;
    }
    if (v == "0" || v == "false" || v == "no" || v == "off") {
        *out = false;
        return true;
    }
    return false;
}

bool LoadServerOptions(const common::Config& config, ServerOptions* options, std::string* err) {
    WarnUnknownKeys(config);

    SectionReader global(config, "global", err);
    global.String("listen_address", &options->listenAddress);
    global.Port("listen_port", &options->port);
    global.Int("threads", &options->ioThreads);
    global.Int("worker_threads", &options->workerThreads);
    global.Bool("reuse_port", &options->reusePort);
    if (auto level = config.Find("global", "log_level")) {
        if (!common::Logger::ParseLevel(*level, &options->logLevel)) {
            global.Fail("log_level", *level, "expected DEBUG, INFO, WARN, ERROR or FATAL");
        }
    }
    if (!global.ok()) return false;

    SectionReader http(config, "http", err);
    http.Seconds("request_timeout_sec", &options->requestTimeoutSec);
    http.Seconds("keepalive_timeout_sec", &options->keepAliveTimeoutSec);
    http.Size("max_request_bytes", &options->maxRequestBytes);
    http.Bool("access_log", &options->accessLog);
    if (!http.ok()) return false;

    SectionReader proxy(config, "proxy_headers", err);
    trust::TrustConfig& t = options->trust;
    proxy.Bool("enable", &t.enabled);
    proxy.String("forwarded_for_header", &t.forwardedForHeader);
    proxy.String("forwarded_proto_header", &t.forwardedProtoHeader);
    proxy.String("forwarded_host_header", &t.forwardedHostHeader);
    if (auto pick = config.Find("proxy_headers", "address_pick")) {
        const std::string p = Lower(*pick);
        if (p == "leftmost") {
            t.addressPick = trust::AddressPick::kLeftmost;
        } else if (p == "rightmost") {
            t.addressPick = trust::AddressPick::kRightmost;
        } else {
            proxy.Fail("address_pick", *pick, "expected leftmost or rightmost");
        }
    }
    if (auto proxies = config.Find("proxy_headers", "trusted_proxies")) {
        std::string why;
        if (proxy.ok() && !trust::HeaderTrustResolver::ParseTrustedProxies(*proxies, &t, &why)) {
            proxy.Fail("trusted_proxies", *proxies, why);
        }
    }
    if (!proxy.ok()) return false;

    SectionReader shutdown(config, "shutdown", err);
    shutdown.Seconds("grace_period_sec", &options->gracePeriodSec);
    if (!shutdown.ok()) return false;

    SectionReader tls(config, "tls", err);
    tls.Bool("enable", &options->tlsEnabled);
    tls.String("cert_path", &options->tlsCertPath);
    tls.String("key_path", &options->tlsKeyPath);
    return tls.ok();
}

bool ApplyEnvironment(ServerOptions* options, std::string* err, const EnvLookup& lookup) {
    auto get = [&lookup](const char* name) -> std::string {
        const char* v = lookup ? lookup(name) : ::getenv(name);
        return v ? v : "";
    };
    auto fail = [err](const char* name, const std::string& value, const std::string& why) {
        if (err) *err = std::string(name) + "='" + value + "': " + why;
        return false;
    };

    const std::string port = get("FWDGATE_PORT");
    if (!port.empty() && !ParsePort(port, &options->port)) {
        return fail("FWDGATE_PORT", port, "expected a port between 1 and 65535");
    }
    const std::string host = get("FWDGATE_HOST");
    if (!host.empty()) {
        options->listenAddress = host;
    }
    const std::string proxyHeaders = get("FWDGATE_PROXY_HEADERS");
    if (!proxyHeaders.empty() && !ParseBool(proxyHeaders, &options->trust.enabled)) {
        return fail("FWDGATE_PROXY_HEADERS", proxyHeaders, "expected a boolean");
    }
    const std::string allowIps = get("FORWARDED_ALLOW_IPS");
    if (!allowIps.empty()) {
        std::string why;
        if (!trust::HeaderTrustResolver::ParseTrustedProxies(allowIps, &options->trust, &why)) {
            return fail("FORWARDED_ALLOW_IPS", allowIps, why);
        }
    }
    const std::string level = get("FWDGATE_LOG_LEVEL");
    if (!level.empty() && !common::Logger::ParseLevel(level, &options->logLevel)) {
        return fail("FWDGATE_LOG_LEVEL", level, "expected DEBUG, INFO, WARN, ERROR or FATAL");
    }
    return true;
}

bool ValidateServerOptions(const ServerOptions& options, std::string* err) {
    auto fail = [err](const std::string& msg) {
        if (err) *err = msg;
        return false;
    };

    struct in_addr addr;
    if (::inet_pton(AF_INET, options.listenAddress.c_str(), &addr) != 1) {
        return fail("listen_address '" + options.listenAddress + "' is not an IPv4 address");
    }
    if (options.port == 0) {
        return fail("listen_port must be between 1 and 65535");
    }
    if (options.ioThreads < 0) {
        return fail("threads must be >= 0");
    }
    if (options.workerThreads < 0) {
        return fail("worker_threads must be >= 0");
    }
    if (!(options.requestTimeoutSec > 0.0)) {
        return fail("request_timeout_sec must be > 0");
    }
    if (!(options.keepAliveTimeoutSec > 0.0)) {
        return fail("keepalive_timeout_sec must be > 0");
    }
    if (options.maxRequestBytes == 0) {
        return fail("max_request_bytes must be > 0");
    }
    if (options.gracePeriodSec < 0.0) {
        return fail("grace_period_sec must be >= 0");
    }
    if (options.tlsEnabled && (options.tlsCertPath.empty() || options.tlsKeyPath.empty())) {
        return fail("[tls] enable requires cert_path and key_path");
    }

    const trust::TrustConfig& t = options.trust;
    const std::string* names[] = {&t.forwardedForHeader, &t.forwardedProtoHeader, &t.forwardedHostHeader};
    for (const std::string* name : names) {
        if (!name->empty() && !trust::HeaderTrustResolver::IsValidHeaderName(*name)) {
            return fail("invalid header name '" + *name + "'");
        }
    }
    if (!t.trustAllPeers && t.trustedNetworks.empty()) {
        return fail("trusted_proxies lists no address");
    }
    return true;
}

} // namespace fwdgate
