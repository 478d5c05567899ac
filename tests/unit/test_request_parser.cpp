#include "fwdproxy/protocol/RequestParser.h"
#include "fwdproxy/network/Buffer.h"
#include "fwdproxy/common/Logger.h"

#include <cassert>
#include <string>

using fwdproxy::network::Buffer;
using fwdproxy::protocol::ParseError;
using fwdproxy::protocol::ParsedRequest;
using fwdproxy::protocol::RequestParser;

static bool parseFails(const std::string& head) {
    ParseError err = ParseError::kTimeout;
    auto req = RequestParser::Parse(head, &err);
    return !req && err == ParseError::kMalformedRequest;
}

int main() {
    fwdproxy::common::Logger::Instance().SetLevel(fwdproxy::common::LogLevel::ERROR);

    // Absolute-URI wins over Host; fragment dropped, authority lower-cased.
    {
        auto req = RequestParser::Parse(
            "get http://Example.COM:8080/a/b?x=1#frag HTTP/1.1\r\nHost: other.test\r\nAccept: */*\r\n\r\n");
        assert(req);
        assert(req->method == "GET");
        assert(req->host == "example.com");
        assert(req->port == 8080);
        assert(req->scheme == "http");
        assert(req->path == "/a/b?x=1");
        assert(!req->tunnel);
        assert(req->headers.size() == 2);
        assert(req->GetHeader("accept") == "*/*");
        assert(req->FindHeader("X-Missing") == nullptr);
    }

    // Absolute-URI without a path becomes "/"; https defaults to 443.
    {
        auto req = RequestParser::Parse("GET http://example.com HTTP/1.1\r\n\r\n");
        assert(req && req->port == 80 && req->path == "/");
        auto tls = RequestParser::Parse("GET https://example.com/x HTTP/1.1\r\n\r\n");
        assert(tls && tls->port == 443 && tls->scheme == "https");
    }

    // Origin-form uses Host.
    {
        auto req = RequestParser::Parse("POST /submit HTTP/1.1\r\nHost: api.example.org:9000\r\n\r\n");
        assert(req);
        assert(req->host == "api.example.org");
        assert(req->port == 9000);
        assert(req->path == "/submit");
        auto noPort = RequestParser::Parse("GET / HTTP/1.0\nHost: plain.test\n\n");
        assert(noPort && noPort->port == 80 && noPort->version == "HTTP/1.0");
    }

    // CONNECT authority, default port 443.
    {
        auto req = RequestParser::Parse("CONNECT www.example.com:8443 HTTP/1.1\r\nHost: ignored\r\n\r\n");
        assert(req);
        assert(req->tunnel);
        assert(req->host == "www.example.com");
        assert(req->port == 8443);
        assert(req->path.empty());
        auto noPort = RequestParser::Parse("CONNECT secure.test HTTP/1.1\r\n\r\n");
        assert(noPort && noPort->port == 443);
        auto v6 = RequestParser::Parse("CONNECT [::1]:443 HTTP/1.1\r\n\r\n");
        assert(v6 && v6->host == "::1");
    }

    // Malformed heads.
    assert(parseFails("GET /x\r\n\r\n"));
    assert(parseFails("GET  /x HTTP/1.1\r\nHost: a\r\n\r\n"));
    assert(parseFails("GET /x HTTP/1.1\r\n\r\n"));                       // no Host
    assert(parseFails("GET /x FTP/1.0\r\nHost: a\r\n\r\n"));
    assert(parseFails("CONNECT example.com:0 HTTP/1.1\r\n\r\n"));
    assert(parseFails("CONNECT example.com:70000 HTTP/1.1\r\n\r\n"));
    assert(parseFails("CONNECT example.com:http HTTP/1.1\r\n\r\n"));
    assert(parseFails("CONNECT :443 HTTP/1.1\r\n\r\n"));
    assert(parseFails("GET ftp://example.com/ HTTP/1.1\r\n\r\n"));
    assert(parseFails("GET / HTTP/1.1\r\nHost: a\r\nBad Header: x\r\n\r\n"));
    assert(parseFails("GET / HTTP/1.1\r\nHost: a\r\n folded\r\n\r\n"));
    assert(parseFails("G(T / HTTP/1.1\r\nHost: a\r\n\r\n"));

    // Incremental feed; bytes after the blank line stay pending.
    {
        RequestParser parser;
        Buffer buf;
        buf.Append("\r\nGET http://example.com/ HTTP/1.1\r\nHo");
        assert(parser.Feed(&buf) == RequestParser::kNeedMore);
        buf.Append("st: example.com\r\nContent-Length: 4\r\n\r\nbody");
        assert(parser.Feed(&buf) == RequestParser::kComplete);
        assert(parser.request().host == "example.com");
        assert(parser.request().pending == "body");
        assert(parser.request().rawHeader.find("GET http://example.com/ HTTP/1.1\r\n") == 0);
        assert(buf.ReadableBytes() == 0);
        // Leading blank line is consumed too.
        assert(parser.bytesConsumed() == 2 + parser.request().rawHeader.size() + 4);
        // Terminal status is sticky.
        assert(parser.OnClosed() == RequestParser::kComplete);
    }

    // Head over the limit.
    {
        RequestParser parser(256);
        Buffer buf;
        buf.Append("GET http://example.com/ HTTP/1.1\r\nX-Pad: " + std::string(300, 'a'));
        assert(parser.Feed(&buf) == RequestParser::kError);
        assert(parser.error() == ParseError::kMalformedRequest);
    }

    // Close and timeout before the blank line.
    {
        RequestParser parser;
        Buffer buf;
        buf.Append("GET / HTTP/1.1\r\n");
        assert(parser.Feed(&buf) == RequestParser::kNeedMore);
        assert(parser.OnClosed() == RequestParser::kError);
        assert(parser.error() == ParseError::kIncompleteRequest);

        RequestParser slow;
        assert(slow.OnTimeout() == RequestParser::kError);
        assert(slow.error() == ParseError::kTimeout);
    }

    // Malformed head arriving through Feed.
    {
        RequestParser parser;
        Buffer buf;
        buf.Append("NOT A REQUEST LINE\r\n\r\n");
        assert(parser.Feed(&buf) == RequestParser::kError);
        assert(parser.error() == ParseError::kMalformedRequest);
    }

    assert(std::string(fwdproxy::protocol::ParseErrorName(ParseError::kIncompleteRequest)) == "IncompleteRequest");
    return 0;
}
