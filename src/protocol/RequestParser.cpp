#include "fwdproxy/protocol/RequestParser.h"
#include "fwdproxy/network/Buffer.h"
#include "fwdproxy/common/Logger.h"

#include <algorithm>
#include <cctype>
#include <cstring>

namespace fwdproxy {
namespace protocol {

const char* ParseErrorName(ParseError e) {
    switch (e) {
        case ParseError::kMalformedRequest: return "MalformedRequest";
        case ParseError::kIncompleteRequest: return "IncompleteRequest";
        case ParseError::kTimeout: return "Timeout";
    }
    return "Unknown";
}

std::string ToLowerCopy(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (unsigned char c : s) out.push_back(static_cast<char>(std::tolower(c)));
    return out;
}

bool IEquals(const std::string& a, const std::string& b) {
    if (a.size() != b.size()) return false;
    for (size_t i = 0; i < a.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(a[i])) != std::tolower(static_cast<unsigned char>(b[i]))) {
            return false;
        }
    }
    return true;
}

const std::string* ParsedRequest::FindHeader(const std::string& name) const {
    for (const auto& h : headers) {
        if (IEquals(h.name, name)) return &h.value;
    }
    return nullptr;
}

std::string ParsedRequest::GetHeader(const std::string& name) const {
    const std::string* v = FindHeader(name);
    return v ? *v : std::string();
}

namespace {

// RFC 7230 tchar.
bool IsTokenChar(unsigned char c) {
    if (std::isalnum(c)) return true;
    return std::strchr("!#$%&'*+-.^_`|~", c) != nullptr && c != '\0';
}

bool ParsePort(const std::string& s, uint16_t* port) {
    if (s.empty() || s.size() > 5) return false;
    unsigned long v = 0;
    for (unsigned char c : s) {
        if (!std::isdigit(c)) return false;
        v = v * 10 + (c - '0');
    }
    if (v < 1 || v > 65535) return false;
    *port = static_cast<uint16_t>(v);
    return true;
}

// host, host:port, [v6] or [v6]:port. Port stays at defaultPort when absent.
bool ParseAuthority(const std::string& authority, uint16_t defaultPort, std::string* host, uint16_t* port) {
    std::string h;
    std::string p;
    if (!authority.empty() && authority[0] == '[') {
        const size_t close = authority.find(']');
        if (close == std::string::npos) return false;
        h = authority.substr(1, close - 1);
        const std::string rest = authority.substr(close + 1);
        if (!rest.empty()) {
            if (rest[0] != ':') return false;
            p = rest.substr(1);
            if (p.empty()) return false;
        }
    } else {
        const size_t colon = authority.rfind(':');
        if (colon == std::string::npos) {
            h = authority;
        } else {
            h = authority.substr(0, colon);
            p = authority.substr(colon + 1);
            // An unbracketed IPv6 literal is ambiguous.
            if (h.find(':') != std::string::npos || p.empty()) return false;
        }
    }
    if (h.empty()) return false;
    for (unsigned char c : h) {
        if (std::isspace(c) || c == '/' || c == '@' || c < 0x21) return false;
    }
    *port = defaultPort;
    if (!p.empty() && !ParsePort(p, port)) return false;
    *host = ToLowerCopy(h);
    return true;
}

std::string TrimOws(const std::string& s) {
    size_t b = 0;
    size_t e = s.size();
    while (b < e && (s[b] == ' ' || s[b] == '\t')) ++b;
    while (e > b && (s[e - 1] == ' ' || s[e - 1] == '\t')) --e;
    return s.substr(b, e - b);
}

bool StartsWithCI(const std::string& s, const char* prefix) {
    const size_t n = std::strlen(prefix);
    return s.size() >= n && IEquals(s.substr(0, n), prefix);
}

bool ClassifyTarget(ParsedRequest* req) {
    if (req->method == "CONNECT") {
        req->tunnel = true;
        return ParseAuthority(req->target, 443, &req->host, &req->port);
    }

    const char* scheme = nullptr;
    uint16_t defaultPort = 80;
    if (StartsWithCI(req->target, "http://")) {
        scheme = "http";
    } else if (StartsWithCI(req->target, "https://")) {
        scheme = "https";
        defaultPort = 443;
    }

    if (scheme) {
        // Absolute-URI takes precedence over Host.
        const size_t authStart = std::strlen(scheme) + 3;
        size_t authEnd = req->target.find_first_of("/?#", authStart);
        if (authEnd == std::string::npos) authEnd = req->target.size();
        std::string authority = req->target.substr(authStart, authEnd - authStart);
        const size_t at = authority.rfind('@');
        if (at != std::string::npos) authority = authority.substr(at + 1);
        if (!ParseAuthority(authority, defaultPort, &req->host, &req->port)) return false;
        req->scheme = scheme;
        std::string rest = req->target.substr(authEnd);
        const size_t hash = rest.find('#');
        if (hash != std::string::npos) rest = rest.substr(0, hash);
        if (rest.empty() || rest[0] != '/') rest = "/" + rest;
        req->path = rest;
        return true;
    }

    if (req->target.find("://") != std::string::npos) return false;

    const std::string* hostHeader = req->FindHeader("Host");
    if (!hostHeader) return false;
    if (!ParseAuthority(*hostHeader, 80, &req->host, &req->port)) return false;
    req->path = req->target;
    return true;
}

} // namespace

std::optional<ParsedRequest> RequestParser::Parse(const std::string& head, ParseError* err) {
    auto fail = [err]() -> std::optional<ParsedRequest> {
        if (err) *err = ParseError::kMalformedRequest;
        return std::nullopt;
    };

    ParsedRequest req;
    req.rawHeader = head;

    std::vector<std::string> lines;
    size_t pos = 0;
    while (pos < head.size()) {
        size_t eol = head.find('\n', pos);
        if (eol == std::string::npos) eol = head.size();
        std::string line = head.substr(pos, eol - pos);
        if (!line.empty() && line.back() == '\r') line.pop_back();
        pos = eol + 1;
        if (line.empty()) break;
        lines.push_back(line);
    }
    if (lines.empty()) return fail();

    // Request line: exactly three single-space separated parts.
    const std::string& requestLine = lines[0];
    const size_t sp1 = requestLine.find(' ');
    if (sp1 == std::string::npos) return fail();
    const size_t sp2 = requestLine.find(' ', sp1 + 1);
    if (sp2 == std::string::npos) return fail();
    if (requestLine.find(' ', sp2 + 1) != std::string::npos) return fail();
    req.method = requestLine.substr(0, sp1);
    req.target = requestLine.substr(sp1 + 1, sp2 - sp1 - 1);
    req.version = requestLine.substr(sp2 + 1);
    if (req.method.empty() || req.target.empty() || req.version.empty()) return fail();
    for (unsigned char c : req.method) {
        if (!IsTokenChar(c)) return fail();
    }
    for (unsigned char c : req.target) {
        if (c < 0x21 || c == 0x7f) return fail();
    }
    for (char& c : req.method) c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    if (req.version.compare(0, 5, "HTTP/") != 0 || req.version.size() == 5) return fail();

    for (size_t i = 1; i < lines.size(); ++i) {
        const std::string& line = lines[i];
        // Obsolete line folding.
        if (line[0] == ' ' || line[0] == '\t') return fail();
        const size_t colon = line.find(':');
        if (colon == std::string::npos || colon == 0) return fail();
        std::string name = line.substr(0, colon);
        for (unsigned char c : name) {
            if (!IsTokenChar(c)) return fail();
        }
        req.headers.push_back(HttpHeader{name, TrimOws(line.substr(colon + 1))});
    }

    if (!ClassifyTarget(&req)) return fail();
    return req;
}

RequestParser::Status RequestParser::Fail(ParseError e) {
    status_ = kError;
    error_ = e;
    return status_;
}

RequestParser::Status RequestParser::Feed(network::Buffer* buf) {
    if (status_ != kNeedMore) return status_;

    // Tolerate empty lines before the request line.
    if (scanned_ == 0) {
        while (buf->ReadableBytes() > 0) {
            const char c = *buf->Peek();
            if (c == '\n') {
                buf->Retrieve(1);
                ++bytesConsumed_;
            } else if (c == '\r' && buf->ReadableBytes() >= 2 && buf->Peek()[1] == '\n') {
                buf->Retrieve(2);
                bytesConsumed_ += 2;
            } else {
                break;
            }
        }
    }

    const char* begin = buf->Peek();
    const char* end = buf->BeginWrite();
    size_t headLen = 0;
    while (begin + scanned_ < end) {
        const char* lineStart = begin + scanned_;
        const char* eol = buf->FindEOL(lineStart);
        if (!eol) break;
        const bool blank = (eol == lineStart) || (eol == lineStart + 1 && *lineStart == '\r');
        scanned_ = static_cast<size_t>(eol + 1 - begin);
        if (blank) {
            headLen = scanned_;
            break;
        }
    }

    if (headLen == 0) {
        if (buf->ReadableBytes() > maxHeaderBytes_) {
            LOG_DEBUG << "request head exceeds " << maxHeaderBytes_ << " bytes";
            return Fail(ParseError::kMalformedRequest);
        }
        return kNeedMore;
    }
    if (headLen > maxHeaderBytes_) {
        return Fail(ParseError::kMalformedRequest);
    }

    std::string head = buf->RetrieveAsString(headLen);
    std::string rest = buf->RetrieveAllAsString();
    bytesConsumed_ += head.size() + rest.size();

    ParseError err = ParseError::kMalformedRequest;
    std::optional<ParsedRequest> parsed = Parse(head, &err);
    if (!parsed) {
        request_.rawHeader = head;
        return Fail(err);
    }
    request_ = std::move(*parsed);
    request_.pending = std::move(rest);
    status_ = kComplete;
    return status_;
}

RequestParser::Status RequestParser::OnClosed() {
    if (status_ != kNeedMore) return status_;
    return Fail(ParseError::kIncompleteRequest);
}

RequestParser::Status RequestParser::OnTimeout() {
    if (status_ != kNeedMore) return status_;
    return Fail(ParseError::kTimeout);
}

} // namespace protocol
} // namespace fwdproxy
