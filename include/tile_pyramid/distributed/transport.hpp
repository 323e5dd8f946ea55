#pragma once

#include "tile_pyramid/distributed/partial_pyramid.hpp"

#include <functional>
#include <map>
#include <memory>
#include <string>

namespace tile_pyramid::distributed {

enum class HttpMethod {
    PUT,   // tile update
    POST   // finalize
};

inline std::string method_to_string(HttpMethod m) {
    return m == HttpMethod::PUT ? "PUT" : "POST";
}

struct TransportReply {
    int status = 0;
    std::string body;
};

// One HTTP request. Returns the status code and body; throws
// TransportTimeout when the attempt ran out of time and NetworkError when no
// response was received.
class TileTransport {
public:
    virtual ~TileTransport() = default;
    virtual TransportReply request(HttpMethod method, const std::string& url,
                                   const std::string& body, double timeout_s) = 0;
};

using TransportFactory = std::function<std::unique_ptr<TileTransport>()>;

struct ParsedUrl {
    std::string authority;  // host:port
    std::string path;       // without the leading '/'
};

// Splits "http://host:port/path". Throws NetworkError for other schemes.
ParsedUrl parse_url(const std::string& url);

// Delivers requests to TileUpdateService instances in this process, keyed by
// the host:port they stand in for. A host can carry several pyramid names.
class InProcessTransport : public TileTransport {
public:
    void attach(const std::string& authority, TileUpdateService& service);

    TransportReply request(HttpMethod method, const std::string& url, const std::string& body,
                           double timeout_s) override;

    int requests() const { return requests_; }

private:
    std::multimap<std::string, TileUpdateService*> services_;
    int requests_ = 0;
};

} // namespace tile_pyramid::distributed
