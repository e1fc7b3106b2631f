#include "fwdgate/network/TlsContext.h"
#include "fwdgate/FrontEnd.h"
#include "fwdgate/network/EventLoop.h"
#include "fwdgate/common/Logger.h"

#include <cassert>
#include <cstdio>
#include <fstream>
#include <string>

using namespace fwdgate;
using fwdgate::network::TlsContext;
using namespace fwdgate::common;

int main() {
    Logger::Instance().SetLevel(LogLevel::DEBUG);

    {
        TlsContext ctx;
        assert(!ctx.ok());
        assert(ctx.NewSession(0) == nullptr);

        std::string err;
        assert(!ctx.InitServer("", "", &err));
        assert(err.find("required") != std::string::npos);

        assert(!ctx.InitServer("/nonexistent/cert.pem", "/nonexistent/key.pem", &err));
        assert(err.find("/nonexistent/cert.pem") != std::string::npos);
        assert(!ctx.ok());
    }

    // A file that is not PEM.
    {
        const char* path = "/tmp/fwdgate_not_a_cert.pem";
        {
            std::ofstream out(path);
            out << "hello\n";
        }
        TlsContext ctx;
        std::string err;
        assert(!ctx.InitServer(path, path, &err));
        assert(!err.empty());
        std::remove(path);
        LOG_INFO << "rejected bogus certificate: " << err;
    }

    // TLS setup failure is a startup failure: nothing listens.
    {
        ServerOptions options;
        options.listenAddress = "127.0.0.1";
        options.port = 0;
        options.tlsEnabled = true;
        options.tlsCertPath = "/nonexistent/cert.pem";
        options.tlsKeyPath = "/nonexistent/key.pem";
        network::EventLoop loop;
        FrontEnd frontEnd(&loop, options, RequestHandler());
        std::string err;
        assert(!frontEnd.Start(&err));
        assert(!err.empty());
        assert(frontEnd.listenerState() == network::Acceptor::State::kUnbound);
    }

    LOG_INFO << "TlsContext test passed";
    return 0;
}
