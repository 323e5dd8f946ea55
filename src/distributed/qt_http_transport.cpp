#include "tile_pyramid/distributed/qt_http_transport.hpp"
#include "tile_pyramid/core/errors.hpp"

#include <QByteArray>
#include <QEventLoop>
#include <QNetworkReply>
#include <QNetworkRequest>
#include <QTimer>
#include <QUrl>

namespace tile_pyramid::distributed {

QNetworkAccessManager& QtHttpTransport::session_for(const std::string& authority) {
    auto it = sessions_.find(authority);
    if (it == sessions_.end()) {
        it = sessions_.emplace(authority, std::make_unique<QNetworkAccessManager>()).first;
    }
    return *it->second;
}

TransportReply QtHttpTransport::request(HttpMethod method, const std::string& url,
                                        const std::string& body, double timeout_s) {
    const ParsedUrl parsed = parse_url(url);
    QNetworkAccessManager& nam = session_for(parsed.authority);

    QNetworkRequest request(QUrl(QString::fromStdString(url)));
    request.setHeader(QNetworkRequest::ContentTypeHeader, "application/json");
    request.setHeader(QNetworkRequest::UserAgentHeader, "TilePyramid/1.0");

    const QByteArray data = QByteArray::fromStdString(body);
    QNetworkReply* reply = method == HttpMethod::PUT ? nam.put(request, data)
                                                     : nam.post(request, data);

    QEventLoop loop;
    QTimer timer;
    timer.setSingleShot(true);
    QObject::connect(&timer, &QTimer::timeout, &loop, &QEventLoop::quit);
    QObject::connect(reply, &QNetworkReply::finished, &loop, &QEventLoop::quit);
    timer.start(static_cast<int>(timeout_s * 1000.0));
    loop.exec();

    if (!reply->isFinished()) {
        reply->abort();
        reply->deleteLater();
        throw TransportTimeout(url);
    }
    timer.stop();

    const QVariant status_attr = reply->attribute(QNetworkRequest::HttpStatusCodeAttribute);
    if (!status_attr.isValid()) {
        const std::string err = reply->errorString().toStdString();
        const bool timed_out = reply->error() == QNetworkReply::TimeoutError;
        reply->deleteLater();
        if (timed_out) {
            throw TransportTimeout(url);
        }
        throw NetworkError(method_to_string(method) + " " + url + ": " + err);
    }

    TransportReply out;
    out.status = status_attr.toInt();
    out.body = reply->readAll().toStdString();
    reply->deleteLater();
    return out;
}

} // namespace tile_pyramid::distributed
