#pragma once

#include "fwdgate/common/Logger.h"
#include "fwdgate/trust/TrustConfig.h"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>

namespace fwdgate {

namespace common {
class Config;
}

// Process-wide settings. Built once at startup, then passed around by const reference.
struct ServerOptions {
    std::string listenAddress = "0.0.0.0";
    uint16_t port = 3000;
    int ioThreads = 4;
    int workerThreads = 16;
    bool reusePort = false;
    common::LogLevel logLevel = common::LogLevel::INFO;

    double requestTimeoutSec = 30.0;
    double keepAliveTimeoutSec = 5.0;
    size_t maxRequestBytes = 1024 * 1024;
    bool accessLog = true;

    double gracePeriodSec = 10.0;

    bool tlsEnabled = false;
    std::string tlsCertPath;
    std::string tlsKeyPath;

    trust::TrustConfig trust;

    ServerOptions() { trust.enabled = true; }
};

// Reads every known key from the INI settings on top of *options. Unknown keys are
// logged and ignored; malformed values fail with *err describing section, key and value.
bool LoadServerOptions(const common::Config& config, ServerOptions* options, std::string* err);

// Deployment overrides, applied between the INI file and the command line:
//   FWDGATE_PORT, FWDGATE_HOST, FWDGATE_PROXY_HEADERS, FORWARDED_ALLOW_IPS, FWDGATE_LOG_LEVEL.
// Unset or empty variables leave the option alone. lookup defaults to ::getenv.
using EnvLookup = std::function<const char*(const char*)>;
bool ApplyEnvironment(ServerOptions* options, std::string* err, const EnvLookup& lookup = EnvLookup());

// Range and consistency checks, run after command line overrides.
bool ValidateServerOptions(const ServerOptions& options, std::string* err);

// Strict numeric parsing shared by the INI loader and the command line.
bool ParsePort(const std::string& text, uint16_t* out);
bool ParseBool(const std::string& text, bool* out);

} // namespace fwdgate
