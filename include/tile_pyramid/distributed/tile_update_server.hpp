#pragma once

#include "tile_pyramid/distributed/partial_pyramid.hpp"

#include <QHttpServer>

#include <memory>
#include <string>
#include <vector>

namespace tile_pyramid::distributed {

// Exposes TileUpdateService instances over HTTP with Qt HttpServer. Requests
// are routed by pyramid name; an unknown name answers 404.
class TileUpdateServer {
public:
    explicit TileUpdateServer(std::vector<TileUpdateService*> services);

    // Returns the bound port; throws NetworkError when listening fails.
    int listen(const std::string& bind_address, int port);

private:
    TileUpdateService* find(const std::string& name) const;

    std::vector<TileUpdateService*> services_;
    std::unique_ptr<QHttpServer> server_;
};

} // namespace tile_pyramid::distributed
