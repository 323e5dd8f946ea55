#pragma once

#include "tile_pyramid/distributed/transport.hpp"

#include <QNetworkAccessManager>

#include <map>
#include <memory>
#include <string>

namespace tile_pyramid::distributed {

// Synchronous PUT/POST over Qt Network. Keeps one QNetworkAccessManager (and so
// one pool of persistent connections) per server. Needs a
// QCoreApplication; each call spins a local event loop until the reply
// finishes or the timeout fires.
class QtHttpTransport : public TileTransport {
public:
    QtHttpTransport() = default;
    ~QtHttpTransport() override = default;

    TransportReply request(HttpMethod method, const std::string& url, const std::string& body,
                           double timeout_s) override;

private:
    QNetworkAccessManager& session_for(const std::string& authority);

    std::map<std::string, std::unique_ptr<QNetworkAccessManager>> sessions_;
};

} // namespace tile_pyramid::distributed
