#include "tile_pyramid/distributed/transport.hpp"
#include "tile_pyramid/core/errors.hpp"
#include "tile_pyramid/core/utils.hpp"

namespace tile_pyramid::distributed {

namespace {

constexpr const char* kFinalizeSuffix = "/update_pyramid";

} // namespace

ParsedUrl parse_url(const std::string& url) {
    const std::string scheme = "http://";
    if (!core::starts_with(url, scheme)) {
        throw NetworkError("unsupported url " + url);
    }
    const std::string rest = url.substr(scheme.size());
    const auto slash = rest.find('/');

    ParsedUrl parsed;
    parsed.authority = rest.substr(0, slash);
    parsed.path = slash == std::string::npos ? std::string() : rest.substr(slash + 1);
    if (parsed.authority.empty()) {
        throw NetworkError("url without host: " + url);
    }
    return parsed;
}

void InProcessTransport::attach(const std::string& authority, TileUpdateService& service) {
    services_.emplace(authority, &service);
}

TransportReply InProcessTransport::request(HttpMethod method, const std::string& url,
                                           const std::string& body, double timeout_s) {
    (void)timeout_s;
    ++requests_;

    const ParsedUrl parsed = parse_url(url);
    auto range = services_.equal_range(parsed.authority);
    if (range.first == range.second) {
        throw NetworkError("connection refused: " + parsed.authority);
    }

    // PUT /<name>, POST /<name>/update_pyramid
    std::string name = parsed.path;
    if (method == HttpMethod::POST) {
        const std::string suffix = kFinalizeSuffix;
        if (name.size() <= suffix.size() ||
            name.compare(name.size() - suffix.size(), suffix.size(), suffix) != 0) {
            return {404, "no route for POST /" + parsed.path};
        }
        name.erase(name.size() - suffix.size());
    }

    for (auto it = range.first; it != range.second; ++it) {
        if (it->second->name() != name) continue;
        const ServiceResponse r = method == HttpMethod::POST
            ? it->second->handle_update_pyramid(name, body)
            : it->second->handle_put(name, body);
        return {r.status, r.body};
    }
    return {404, "unknown pyramid '" + name + "'"};
}

} // namespace tile_pyramid::distributed
