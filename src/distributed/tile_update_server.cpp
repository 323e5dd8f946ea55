#include "tile_pyramid/distributed/tile_update_server.hpp"
#include "tile_pyramid/core/errors.hpp"

#include <QHostAddress>
#include <QHttpServerRequest>
#include <QHttpServerResponse>

#include <iostream>

namespace tile_pyramid::distributed {

namespace {

QHttpServerResponse to_response(const ServiceResponse& r) {
    return QHttpServerResponse("text/plain", QByteArray::fromStdString(r.body),
                               static_cast<QHttpServerResponder::StatusCode>(r.status));
}

ServiceResponse unknown_pyramid(const std::string& name) {
    return {404, "unknown pyramid '" + name + "'"};
}

} // namespace

TileUpdateServer::TileUpdateServer(std::vector<TileUpdateService*> services)
    : services_(std::move(services)), server_(std::make_unique<QHttpServer>()) {
    if (services_.empty()) {
        throw ValidationError("tile update server needs at least one pyramid");
    }

    server_->route("/<arg>", QHttpServerRequest::Method::Put,
                   [this](const QString& name, const QHttpServerRequest& request) {
                       const std::string n = name.toStdString();
                       TileUpdateService* service = find(n);
                       return to_response(service
                           ? service->handle_put(n, request.body().toStdString())
                           : unknown_pyramid(n));
                   });

    server_->route("/<arg>/update_pyramid", QHttpServerRequest::Method::Post,
                   [this](const QString& name, const QHttpServerRequest& request) {
                       const std::string n = name.toStdString();
                       TileUpdateService* service = find(n);
                       return to_response(service
                           ? service->handle_update_pyramid(n, request.body().toStdString())
                           : unknown_pyramid(n));
                   });
}

TileUpdateService* TileUpdateServer::find(const std::string& name) const {
    for (TileUpdateService* s : services_) {
        if (s->name() == name) return s;
    }
    return nullptr;
}

int TileUpdateServer::listen(const std::string& bind_address, int port) {
    const QHostAddress address(QString::fromStdString(bind_address));
    const quint16 bound = server_->listen(address, static_cast<quint16>(port));
    if (bound == 0) {
        throw NetworkError("cannot listen on " + bind_address + ":" + std::to_string(port));
    }
    for (const TileUpdateService* s : services_) {
        std::cerr << "[SERVER] Serving pyramid '" << s->name() << "' on " << bind_address
                  << ":" << bound << std::endl;
    }
    return static_cast<int>(bound);
}

} // namespace tile_pyramid::distributed
