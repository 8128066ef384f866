#include "DeviceInfoProbe.hpp"

#include <osv/Version.hpp>

#include <QJsonDocument>
#include <QJsonObject>
#include <QNetworkAccessManager>
#include <QNetworkReply>
#include <QNetworkRequest>
#include <QPointer>
#include <QUrl>

namespace svr {

DeviceInfoProbe::DeviceInfoProbe(const QList<uint16_t>& ports, int timeoutMs, QObject* parent)
    : QObject(parent)
    , ports_(ports)
    , timeoutMs_(timeoutMs)
    , nam_(new QNetworkAccessManager(this))
{
}

void DeviceInfoProbe::probe(const QString& ip, ProbeCallback done)
{
    probePort(ip, 0, std::move(done));
}

void DeviceInfoProbe::probePort(const QString& ip, int portIndex, ProbeCallback done)
{
    if (portIndex >= ports_.size()) {
        done(std::nullopt);
        return;
    }

    QUrl url;
    url.setScheme("http");
    url.setHost(ip);
    url.setPort(ports_.at(portIndex));
    url.setPath(QString::fromLatin1(osv::API_PATH));

    QNetworkRequest request(url);
    request.setTransferTimeout(timeoutMs_);

    QNetworkReply* reply = nam_->get(request);
    QPointer<DeviceInfoProbe> self(this);
    connect(reply, &QNetworkReply::finished, this, [self, reply, ip, portIndex, done]() {
        reply->deleteLater();
        std::optional<Device> device;
        if (reply->error() == QNetworkReply::NoError)
            device = parseDeviceInfo(reply->readAll(), ip);

        if (device || !self) {
            done(device);
            return;
        }
        self->probePort(ip, portIndex + 1, done);
    });
}

std::optional<Device> DeviceInfoProbe::parseDeviceInfo(const QByteArray& body, const QString& probedIp)
{
    QJsonDocument doc = QJsonDocument::fromJson(body);
    if (!doc.isObject())
        return std::nullopt;
    const QJsonValue deviceValue = doc.object().value("device");
    if (!deviceValue.isObject())
        return std::nullopt;
    const QJsonObject d = deviceValue.toObject();

    Device device;
    device.ip = d.value("ip").toString();
    if (device.ip.isEmpty())
        device.ip = probedIp;
    device.mac = d.value("wifiMac").toString();
    device.friendlyName = d.value("name").toString();
    if (device.friendlyName.isEmpty())
        device.friendlyName = d.value("modelName").toString();
    if (device.friendlyName.isEmpty())
        device.friendlyName = QStringLiteral("Samsung TV");
    return device;
}

} // namespace svr
