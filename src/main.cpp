#include "fwdgate/Lifecycle.h"
#include "fwdgate/ServerOptions.h"
#include "fwdgate/common/Config.h"
#include "fwdgate/common/Logger.h"
#include "fwdgate/protocol/HttpResponse.h"
#include "fwdgate/trust/HeaderTrustResolver.h"
#include "fwdgate/trust/RequestContext.h"

#include <getopt.h>
#include <unistd.h>
#include <cstdio>
#include <optional>
#include <string>

namespace {

const char* kDefaultConfigFile = "config/fwdgate.conf";

const int kExitOk = 0;
const int kExitStartupFailure = 1;
const int kExitUsage = 2;

enum LongOnlyOption {
    kOptHost = 1000,
    kOptProxyHeaders,
    kOptNoProxyHeaders,
    kOptForwardedAllowIps,
};

struct CommandLine {
    std::string configFile = kDefaultConfigFile;
    bool explicitConfig = false;
    bool checkOnly = false;
    std::optional<std::string> port;
    std::optional<std::string> host;
    std::optional<bool> proxyHeaders;
    std::optional<std::string> forwardedAllowIps;
    std::optional<std::string> logLevel;
};

void PrintUsage(FILE* out, const char* prog) {
    fprintf(out,
            "Usage: %s [options]\n"
            "  -c, --config FILE              INI configuration (default %s)\n"
            "  -p, --port N                   listening port (default 3000)\n"
            "      --host ADDR                listening IPv4 address (default 0.0.0.0)\n"
            "      --proxy-headers            trust X-Forwarded-* headers\n"
            "      --no-proxy-headers         ignore X-Forwarded-* headers\n"
            "      --forwarded-allow-ips LIST proxies whose headers are trusted (* or IPv4/CIDR list)\n"
            "  -l, --log-level LEVEL          DEBUG, INFO, WARN, ERROR or FATAL\n"
            "  -C, --check                    validate configuration and exit\n"
            "  -h, --help                     show this help\n"
            "Environment (overrides the file, overridden by options):\n"
            "  FWDGATE_PORT, FWDGATE_HOST, FWDGATE_PROXY_HEADERS, FORWARDED_ALLOW_IPS, FWDGATE_LOG_LEVEL\n",
            prog, kDefaultConfigFile);
}

// Returns -1 to continue, otherwise the exit status.
int ParseCommandLine(int argc, char* argv[], CommandLine* cli) {
    static const struct option kLongOptions[] = {
        {"config", required_argument, nullptr, 'c'},
        {"port", required_argument, nullptr, 'p'},
        {"host", required_argument, nullptr, kOptHost},
        {"proxy-headers", no_argument, nullptr, kOptProxyHeaders},
        {"no-proxy-headers", no_argument, nullptr, kOptNoProxyHeaders},
        {"forwarded-allow-ips", required_argument, nullptr, kOptForwardedAllowIps},
        {"log-level", required_argument, nullptr, 'l'},
        {"check", no_argument, nullptr, 'C'},
        {"help", no_argument, nullptr, 'h'},
        {nullptr, 0, nullptr, 0},
    };

    int ch;
    while ((ch = getopt_long(argc, argv, "c:p:l:Ch", kLongOptions, nullptr)) != -1) {
        switch (ch) {
            case 'c':
                cli->configFile = optarg;
                cli->explicitConfig = true;
                break;
            case 'p':
                cli->port = optarg;
                break;
            case kOptHost:
                cli->host = optarg;
                break;
            case kOptProxyHeaders:
                cli->proxyHeaders = true;
                break;
            case kOptNoProxyHeaders:
                cli->proxyHeaders = false;
                break;
            case kOptForwardedAllowIps:
                cli->forwardedAllowIps = optarg;
                break;
            case 'l':
                cli->logLevel = optarg;
                break;
            case 'C':
                cli->checkOnly = true;
                break;
            case 'h':
                PrintUsage(stdout, argv[0]);
                return kExitOk;
            default:
                PrintUsage(stderr, argv[0]);
                return kExitUsage;
        }
    }
    if (optind < argc) {
        fprintf(stderr, "%s: unexpected argument '%s'\n", argv[0], argv[optind]);
        PrintUsage(stderr, argv[0]);
        return kExitUsage;
    }
    return -1;
}

bool ApplyCommandLine(const CommandLine& cli, fwdgate::ServerOptions* options, std::string* err) {
    if (cli.port && !fwdgate::ParsePort(*cli.port, &options->port)) {
        *err = "invalid port '" + *cli.port + "'";
        return false;
    }
    if (cli.host) {
        options->listenAddress = *cli.host;
    }
    if (cli.proxyHeaders) {
        options->trust.enabled = *cli.proxyHeaders;
    }
    if (cli.forwardedAllowIps &&
        !fwdgate::trust::HeaderTrustResolver::ParseTrustedProxies(*cli.forwardedAllowIps, &options->trust, err)) {
        return false;
    }
    if (cli.logLevel && !fwdgate::common::Logger::ParseLevel(*cli.logLevel, &options->logLevel)) {
        *err = "invalid log level '" + *cli.logLevel + "'";
        return false;
    }
    return true;
}

// Application routes are outside this server; "/" reports what the front end resolved.
void DefaultHandler(const fwdgate::trust::RequestContext& ctx, fwdgate::protocol::HttpResponse* resp) {
    using fwdgate::protocol::HttpResponse;

    resp->setContentType("text/plain; charset=utf-8");
    if (ctx.path() != "/") {
        resp->setStatusCode(HttpResponse::k404NotFound);
        resp->setBody("Not Found\n");
        return;
    }
    if (ctx.method() != "GET" && ctx.method() != "HEAD") {
        resp->setStatusCode(HttpResponse::k405MethodNotAllowed);
        resp->addHeader("Allow", "GET, HEAD");
        resp->setBody("Method Not Allowed\n");
        return;
    }
    resp->setStatusCode(HttpResponse::k200Ok);
    resp->setBody("client: " + ctx.clientAddress() + "\n" +
                  "scheme: " + fwdgate::trust::SchemeToString(ctx.scheme()) + "\n" +
                  "host: " + ctx.host() + "\n");
}

} // namespace

int main(int argc, char* argv[]) {
    using namespace fwdgate;

    // Before any thread exists, so every thread inherits the mask and only the signalfd sees them.
    if (!Lifecycle::BlockTerminationSignals()) {
        return kExitStartupFailure;
    }

    CommandLine cli;
    int rc = ParseCommandLine(argc, argv, &cli);
    if (rc >= 0) {
        return rc;
    }

    if (cli.logLevel) {
        common::LogLevel level;
        if (common::Logger::ParseLevel(*cli.logLevel, &level)) {
            common::Logger::Instance().SetLevel(level);
        }
    }

    common::Config config;
    if (cli.explicitConfig || ::access(cli.configFile.c_str(), F_OK) == 0) {
        if (!config.Load(cli.configFile)) {
            LOG_ERROR << "cannot read configuration file " << cli.configFile;
            return kExitUsage;
        }
    } else {
        LOG_DEBUG << "no " << cli.configFile << ", using built-in defaults";
    }

    ServerOptions options;
    std::string err;
    if (!LoadServerOptions(config, &options, &err) ||
        !ApplyEnvironment(&options, &err) ||
        !ApplyCommandLine(cli, &options, &err) ||
        !ValidateServerOptions(options, &err)) {
        LOG_ERROR << "configuration error: " << err;
        return kExitUsage;
    }
    common::Logger::Instance().SetLevel(options.logLevel);

    if (cli.checkOnly) {
        printf("OK\n");
        return kExitOk;
    }

    Lifecycle lifecycle(options, DefaultHandler);
    return lifecycle.Run();
}
