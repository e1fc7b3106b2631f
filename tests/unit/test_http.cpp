#include "fwdgate/protocol/HttpContext.h"
#include "fwdgate/protocol/HttpResponse.h"
#include "fwdgate/network/Buffer.h"
#include "fwdgate/common/Logger.h"
#include <cassert>
#include <string>

using namespace fwdgate::protocol;
using namespace fwdgate::network;
using namespace fwdgate::common;

static bool parse(HttpContext* context, Buffer* buf) {
    return context->parseRequest(buf, std::chrono::system_clock::now());
}

void testParseRequest() {
    HttpContext context;
    Buffer buf;

    // Simulate partial arrival
    buf.Append("GET /index.html?id=123 HTTP/1.1\r\nHost: ");
    assert(parse(&context, &buf));
    assert(!context.gotAll());
    assert(context.inProgress());

    buf.Append("localhost\r\nUser-Agent: curl/7.68.0\r\nAccept: */*\r\n\r\n");
    assert(parse(&context, &buf));
    assert(context.gotAll());

    const HttpRequest& req = context.request();
    assert(req.getMethod() == HttpRequest::kGet);
    assert(req.getVersion() == HttpRequest::kHttp11);
    assert(req.path() == "/index.html");
    assert(req.query() == "?id=123");
    assert(req.getHeader("host") == "localhost");
    assert(req.getHeader("User-Agent") == "curl/7.68.0");
    assert(buf.ReadableBytes() == 0);

    context.reset();
    assert(!context.inProgress());
    LOG_INFO << "Parse Request PASS";
}

void testDuplicateHeadersKept() {
    HttpContext context;
    Buffer buf;
    buf.Append("GET / HTTP/1.1\r\n"
               "X-Forwarded-For: 1.1.1.1\r\n"
               "Host: a\r\n"
               "x-forwarded-for: 2.2.2.2\r\n"
               "\r\n");
    assert(parse(&context, &buf));
    assert(context.gotAll());
    const HttpRequest& req = context.request();
    assert(req.headers().size() == 3);
    auto values = req.getHeaderValues("X-Forwarded-For");
    assert(values.size() == 2);
    assert(values[0] == "1.1.1.1" && values[1] == "2.2.2.2");
    assert(req.headers()[1].first == "Host");
    LOG_INFO << "Duplicate headers PASS";
}

void testParseContentLengthBody() {
    HttpContext context;
    Buffer buf;
    buf.Append("POST /submit HTTP/1.1\r\n"
               "Host: localhost\r\n"
               "Content-Length: 5\r\n"
               "\r\n"
               "hel");
    assert(parse(&context, &buf));
    assert(!context.gotAll());
    buf.Append("loGET / HTTP/1.1\r\n");
    assert(parse(&context, &buf));
    assert(context.gotAll());
    const HttpRequest& req = context.request();
    assert(req.getMethod() == HttpRequest::kPost);
    assert(req.path() == "/submit");
    assert(req.body() == "hello");
    // Pipelined bytes stay in the buffer.
    assert(buf.RetrieveAllAsString() == "GET / HTTP/1.1\r\n");
    LOG_INFO << "Parse Content-Length Body PASS";
}

void testParseChunkedBody() {
    HttpContext context;
    Buffer buf;
    buf.Append("POST /chunk HTTP/1.1\r\n"
               "Host: localhost\r\n"
               "Transfer-Encoding: chunked\r\n"
               "\r\n"
               "5;ext=1\r\n"
               "hello\r\n"
               "6\r\n"
               " world\r\n"
               "0\r\n"
               "X-Trailer: yes\r\n"
               "\r\n");
    assert(parse(&context, &buf));
    assert(context.gotAll());
    const HttpRequest& req = context.request();
    assert(req.path() == "/chunk");
    assert(req.body() == "hello world");
    assert(buf.ReadableBytes() == 0);
    LOG_INFO << "Parse Chunked Body PASS";
}

void testBadRequests() {
    const char* bad[] = {
        "BREW /pot HTTP/1.1\r\n\r\n",
        "GET / HTTP/2.0\r\n\r\n",
        "GET  HTTP/1.1\r\n\r\n",
        "GET / HTTP/1.1\r\nNoColonHere\r\n\r\n",
        "GET / HTTP/1.1\r\nHost: a\r\n folded\r\n\r\n",
        "POST / HTTP/1.1\r\nContent-Length: abc\r\n\r\n",
        "POST / HTTP/1.1\r\nContent-Length: 3\r\nContent-Length: 4\r\n\r\nabcd",
        "POST / HTTP/1.1\r\nTransfer-Encoding: gzip\r\n\r\n",
        "POST / HTTP/1.1\r\nTransfer-Encoding: chunked\r\n\r\nzz\r\n",
    };
    for (const char* input : bad) {
        HttpContext context;
        Buffer buf;
        buf.Append(input);
        assert(!parse(&context, &buf));
        assert(context.error() == HttpContext::kBadRequest);
    }
    LOG_INFO << "Bad requests PASS";
}

void testTooLarge() {
    {
        HttpContext context(64);
        Buffer buf;
        buf.Append("POST / HTTP/1.1\r\nContent-Length: 1000\r\n\r\n");
        assert(!parse(&context, &buf));
        assert(context.error() == HttpContext::kTooLarge);
    }
    {
        // Headers that never end.
        HttpContext context(64);
        Buffer buf;
        buf.Append("GET / HTTP/1.1\r\n");
        buf.Append("X-Long: " + std::string(100, 'a'));
        assert(!parse(&context, &buf));
        assert(context.error() == HttpContext::kTooLarge);
    }
    {
        HttpContext context(64);
        Buffer buf;
        buf.Append("POST / HTTP/1.1\r\nTransfer-Encoding: chunked\r\n\r\n");
        buf.Append("40\r\n" + std::string(64, 'x') + "\r\n0\r\n\r\n");
        assert(!parse(&context, &buf));
        assert(context.error() == HttpContext::kTooLarge);
    }
    {
        HttpContext context(64);
        Buffer buf;
        buf.Append("GET / HTTP/1.1\r\nHost: a\r\n\r\n");
        assert(parse(&context, &buf));
        assert(context.gotAll());
    }
    LOG_INFO << "Too large PASS";
}

void testResponseGen() {
    HttpResponse resp(false);
    resp.setStatusCode(HttpResponse::k200Ok);
    resp.setContentType("text/plain");
    resp.addHeader("Server", "fwdgate");
    resp.addHeader("Content-Length", "999");
    resp.setBody("Hello World");

    Buffer buf;
    resp.appendToBuffer(&buf);
    std::string output = buf.RetrieveAllAsString();
    assert(output == "HTTP/1.1 200 OK\r\n"
                     "Content-Length: 11\r\n"
                     "Connection: keep-alive\r\n"
                     "Content-Type: text/plain\r\n"
                     "Server: fwdgate\r\n"
                     "\r\n"
                     "Hello World");

    HttpResponse head(true);
    head.setStatusCode(HttpResponse::k404NotFound);
    head.setBody("Not Found\n");
    head.appendToBuffer(&buf, true);
    output = buf.RetrieveAllAsString();
    assert(output.find("HTTP/1.1 404 Not Found\r\n") == 0);
    assert(output.find("Content-Length: 10\r\n") != std::string::npos);
    assert(output.find("Connection: close\r\n") != std::string::npos);
    assert(output.compare(output.size() - 4, 4, "\r\n\r\n") == 0);

    assert(std::string(HttpResponse::ReasonPhrase(HttpResponse::k413PayloadTooLarge)) == "Payload Too Large");
    LOG_INFO << "Response Gen PASS";
}

int main() {
    Logger::Instance().SetLevel(LogLevel::INFO);
    testParseRequest();
    testDuplicateHeadersKept();
    testParseContentLengthBody();
    testParseChunkedBody();
    testBadRequests();
    testTooLarge();
    testResponseGen();
    return 0;
}
