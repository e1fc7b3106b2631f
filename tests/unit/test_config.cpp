#include "fwdgate/ServerOptions.h"
#include "fwdgate/common/Config.h"
#include "fwdgate/common/Logger.h"

#include <cassert>
#include <cstdio>
#include <fstream>
#include <map>
#include <string>
#include <unistd.h>

using namespace fwdgate;
using fwdgate::common::Config;
using fwdgate::common::LogLevel;
using fwdgate::common::Logger;

static bool load(const std::string& ini, ServerOptions* options, std::string* err) {
    Config config;
    assert(config.LoadFromString(ini));
    return LoadServerOptions(config, options, err) && ValidateServerOptions(*options, err);
}

void testDefaults() {
    ServerOptions options;
    std::string err;
    assert(load("", &options, &err));
    assert(options.listenAddress == "0.0.0.0");
    assert(options.port == 3000);
    assert(options.workerThreads == 16);
    assert(options.requestTimeoutSec == 30.0);
    assert(options.keepAliveTimeoutSec == 5.0);
    assert(options.maxRequestBytes == 1024 * 1024);
    assert(options.gracePeriodSec == 10.0);
    assert(options.trust.enabled);
    assert(options.trust.trustAllPeers);
    assert(options.trust.forwardedForHeader == "X-Forwarded-For");
    assert(!options.tlsEnabled);
    LOG_INFO << "Defaults PASS";
}

void testFullFile() {
    const std::string ini =
        "# sample\n"
        "listen_port = 8080\n"
        "log_level = warn\n"
        "[global]\n"
        "listen_address = 127.0.0.1\n"
        "threads = 2\n"
        "worker_threads = 0\n"
        "reuse_port = yes\n"
        "[http]\n"
        "request_timeout_sec = 2.5\n"
        "keepalive_timeout_sec = 1\n"
        "max_request_bytes = 4096\n"
        "access_log = off\n"
        "[proxy_headers]\n"
        "enable = false\n"
        "forwarded_for_header = X-Client-IP\n"
        "forwarded_proto_header =\n"
        "trusted_proxies = 10.0.0.0/8, 127.0.0.1\n"
        "address_pick = Rightmost\n"
        "[shutdown]\n"
        "grace_period_sec = 3\n"
        "; trailing comment\n";
    ServerOptions options;
    std::string err;
    assert(load(ini, &options, &err));
    assert(options.port == 8080);
    assert(options.logLevel == LogLevel::WARN);
    assert(options.listenAddress == "127.0.0.1");
    assert(options.ioThreads == 2);
    assert(options.workerThreads == 0);
    assert(options.reusePort);
    assert(options.requestTimeoutSec == 2.5);
    assert(options.keepAliveTimeoutSec == 1.0);
    assert(options.maxRequestBytes == 4096);
    assert(!options.accessLog);
    assert(!options.trust.enabled);
    assert(options.trust.forwardedForHeader == "X-Client-IP");
    assert(options.trust.forwardedProtoHeader.empty());
    assert(options.trust.forwardedHostHeader == "X-Forwarded-Host");
    assert(!options.trust.trustAllPeers);
    assert(options.trust.trustedNetworks.size() == 2);
    assert(options.trust.addressPick == trust::AddressPick::kRightmost);
    assert(options.gracePeriodSec == 3.0);
    LOG_INFO << "Full file PASS";
}

void testRejected() {
    const char* bad[] = {
        "[global]\nlisten_port = 70000\n",
        "[global]\nlisten_port = 0\n",
        "[global]\nlisten_port = 80a\n",
        "[global]\nlisten_address = localhost\n",
        "[global]\nlog_level = chatty\n",
        "[global]\nthreads = -1\n",
        "[http]\nrequest_timeout_sec = 0\n",
        "[http]\nkeepalive_timeout_sec = soon\n",
        "[http]\nmax_request_bytes = 0\n",
        "[http]\naccess_log = maybe\n",
        "[proxy_headers]\nforwarded_for_header = X Forwarded\n",
        "[proxy_headers]\ntrusted_proxies = 10.0.0.300\n",
        "[proxy_headers]\naddress_pick = middle\n",
        "[shutdown]\ngrace_period_sec = -1\n",
        "[tls]\nenable = 1\n",
    };
    for (const char* ini : bad) {
        ServerOptions options;
        std::string err;
        assert(!load(ini, &options, &err));
        assert(!err.empty());
        LOG_DEBUG << "rejected: " << err;
    }
    // A port set programmatically still goes through validation.
    ServerOptions zeroPort;
    zeroPort.port = 0;
    std::string err;
    assert(!ValidateServerOptions(zeroPort, &err));
    assert(err.find("listen_port") != std::string::npos);
    LOG_INFO << "Rejected values PASS";
}

void testUnknownKeysIgnored() {
    ServerOptions options;
    std::string err;
    assert(load("[global]\nbogus = 1\n[nowhere]\nx = y\n", &options, &err));
    assert(options.port == 3000);
    LOG_INFO << "Unknown keys PASS";
}

void testParsers() {
    uint16_t port = 1;
    assert(!ParsePort("0", &port) && port == 1);
    assert(ParsePort("1", &port) && port == 1);
    assert(ParsePort("65535", &port) && port == 65535);
    assert(!ParsePort("", &port));
    assert(!ParsePort("-1", &port));
    assert(!ParsePort("3000 ", &port));

    bool b = false;
    assert(ParseBool("ON", &b) && b);
    assert(ParseBool("no", &b) && !b);
    assert(!ParseBool("2", &b));
    LOG_INFO << "Parsers PASS";
}

void testLoadFile() {
    char path[] = "/tmp/fwdgate_config_XXXXXX";
    int fd = ::mkstemp(path);
    assert(fd >= 0);
    ::close(fd);
    {
        std::ofstream out(path);
        out << "[global]\nlisten_port = 3100\n";
    }
    Config config;
    assert(config.Load(path));
    assert(config.LoadedFilename() && *config.LoadedFilename() == path);
    ServerOptions options;
    std::string err;
    assert(LoadServerOptions(config, &options, &err));
    assert(options.port == 3100);
    std::remove(path);

    Config missing;
    assert(!missing.Load("/nonexistent/fwdgate.conf"));
    LOG_INFO << "Load file PASS";
}

void testEnvironment() {
    std::map<std::string, std::string> env;
    auto lookup = [&env](const char* name) -> const char* {
        auto it = env.find(name);
        return it == env.end() ? nullptr : it->second.c_str();
    };

    ServerOptions options;
    std::string err;
    assert(ApplyEnvironment(&options, &err, lookup));
    assert(options.port == 3000);
    assert(options.trust.trustAllPeers);

    env["FWDGATE_PORT"] = "8080";
    env["FWDGATE_HOST"] = "127.0.0.1";
    env["FWDGATE_PROXY_HEADERS"] = "false";
    env["FORWARDED_ALLOW_IPS"] = "10.0.0.0/8, 192.168.1.1";
    env["FWDGATE_LOG_LEVEL"] = "warn";
    env["FWDGATE_UNRELATED"] = "x";
    assert(ApplyEnvironment(&options, &err, lookup));
    assert(options.port == 8080);
    assert(options.listenAddress == "127.0.0.1");
    assert(!options.trust.enabled);
    assert(!options.trust.trustAllPeers);
    assert(options.trust.trustedNetworks.size() == 2);
    assert(options.logLevel == LogLevel::WARN);
    assert(ValidateServerOptions(options, &err));

    // Empty means unset.
    ServerOptions untouched;
    env.clear();
    env["FWDGATE_PORT"] = "";
    assert(ApplyEnvironment(&untouched, &err, lookup));
    assert(untouched.port == 3000);

    const char* bad[][2] = {
        {"FWDGATE_PORT", "0"},
        {"FWDGATE_PORT", "http"},
        {"FWDGATE_PROXY_HEADERS", "sometimes"},
        {"FORWARDED_ALLOW_IPS", "10.0.0.1/33"},
        {"FWDGATE_LOG_LEVEL", "loud"},
    };
    for (const auto& kv : bad) {
        env.clear();
        env[kv[0]] = kv[1];
        ServerOptions o;
        err.clear();
        assert(!ApplyEnvironment(&o, &err, lookup));
        assert(err.find(kv[0]) == 0);
    }
    LOG_INFO << "Environment PASS";
}

int main() {
    Logger::Instance().SetLevel(LogLevel::INFO);
    testDefaults();
    testFullFile();
    testRejected();
    testUnknownKeysIgnored();
    testParsers();
    testLoadFile();
    testEnvironment();
    return 0;
}
