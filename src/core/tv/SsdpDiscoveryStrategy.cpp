#include "SsdpDiscoveryStrategy.hpp"
#include "DeviceInfoProbe.hpp"

#include <QHostAddress>
#include <QUdpSocket>
#include <boost/log/trivial.hpp>
#include <memory>

namespace svr {

namespace {
const QHostAddress kSsdpGroup(QStringLiteral("239.255.255.250"));
constexpr uint16_t kSsdpPort = 1900;
}

SsdpDiscoveryStrategy::SsdpDiscoveryStrategy(const DiscoverySettings& settings, QObject* parent)
    : QObject(parent)
    , settings_(settings)
    , probe_(new DeviceInfoProbe(settings.probePorts, settings.probeTimeoutMs, this))
{
    listenTimer_.setSingleShot(true);
    connect(&listenTimer_, &QTimer::timeout, this, &SsdpDiscoveryStrategy::onListenFinished);
}

void SsdpDiscoveryStrategy::discover(int timeoutMs, DevicesCallback done)
{
    waiting_.append(std::move(done));
    if (waiting_.size() > 1) {
        BOOST_LOG_TRIVIAL(debug) << "[SsdpDiscovery] Pass already running, joining it";
        return;
    }
    responders_.clear();

    socket_ = new QUdpSocket(this);
    connect(socket_, &QUdpSocket::readyRead, this, &SsdpDiscoveryStrategy::onReadyRead);
    if (!socket_->bind(QHostAddress::AnyIPv4, 0)) {
        BOOST_LOG_TRIVIAL(warning) << "[SsdpDiscovery] Failed to bind UDP socket: "
                                   << socket_->errorString().toStdString();
        finish({});
        return;
    }

    const QByteArray message = searchMessage();
    if (socket_->writeDatagram(message, kSsdpGroup, kSsdpPort) < 0) {
        BOOST_LOG_TRIVIAL(warning) << "[SsdpDiscovery] M-SEARCH send failed: "
                                   << socket_->errorString().toStdString();
        finish({});
        return;
    }

    const int listenMs = timeoutMs > 0 ? timeoutMs : settings_.timeoutMs;
    BOOST_LOG_TRIVIAL(debug) << "[SsdpDiscovery] M-SEARCH sent, listening " << listenMs << "ms";
    listenTimer_.start(listenMs);
}

QByteArray SsdpDiscoveryStrategy::searchMessage()
{
    return QString(
        "M-SEARCH * HTTP/1.1\r\n"
        "HOST: 239.255.255.250:1900\r\n"
        "MAN: \"ssdp:discover\"\r\n"
        "ST: %1\r\n"
        "MX: 1\r\n\r\n").arg(QString::fromLatin1(SEARCH_TARGET)).toUtf8();
}

SsdpDiscoveryStrategy::SsdpResponse SsdpDiscoveryStrategy::parseSsdpResponse(const QByteArray& datagram)
{
    SsdpResponse response;
    const QStringList lines = QString::fromUtf8(datagram).split("\r\n");
    if (lines.isEmpty() || !lines.first().startsWith("HTTP/1.1 200", Qt::CaseInsensitive))
        return response;

    for (const QString& line : lines) {
        const int colon = line.indexOf(':');
        if (colon <= 0)
            continue;
        const QString key = line.left(colon).trimmed().toUpper();
        const QString value = line.mid(colon + 1).trimmed();
        if (key == "LOCATION")
            response.location = value;
        else if (key == "ST")
            response.searchTarget = value;
        else if (key == "USN")
            response.usn = value;
    }

    response.valid = response.searchTarget.compare(QLatin1String(SEARCH_TARGET), Qt::CaseInsensitive) == 0
                     || response.usn.contains(QLatin1String(SEARCH_TARGET), Qt::CaseInsensitive);
    return response;
}

void SsdpDiscoveryStrategy::onReadyRead()
{
    while (socket_ && socket_->hasPendingDatagrams()) {
        QByteArray data;
        QHostAddress sender;
        data.resize(int(socket_->pendingDatagramSize()));
        socket_->readDatagram(data.data(), data.size(), &sender);

        if (!parseSsdpResponse(data).valid)
            continue;

        const QString ip = QHostAddress(sender.toIPv4Address()).toString();
        if (!responders_.contains(ip)) {
            BOOST_LOG_TRIVIAL(debug) << "[SsdpDiscovery] Response from " << ip.toStdString();
            responders_.append(ip);
        }
    }
}

void SsdpDiscoveryStrategy::onListenFinished()
{
    if (socket_) {
        socket_->close();
        socket_->deleteLater();
        socket_ = nullptr;
    }

    if (responders_.isEmpty()) {
        finish({});
        return;
    }

    auto devices = std::make_shared<QList<Device>>();
    auto remaining = std::make_shared<int>(responders_.size());
    const QList<QString> responders = responders_;
    for (const QString& ip : responders) {
        probe_->probe(ip, [this, ip, devices, remaining](const std::optional<Device>& info) {
            devices->append(info ? *info : Device{ip, QString(), QStringLiteral("Samsung TV")});
            if (--(*remaining) == 0)
                finish(*devices);
        });
    }
}

void SsdpDiscoveryStrategy::finish(const QList<Device>& devices)
{
    listenTimer_.stop();
    if (socket_) {
        socket_->deleteLater();
        socket_ = nullptr;
    }
    const QList<DevicesCallback> callers = std::move(waiting_);
    waiting_.clear();
    for (const DevicesCallback& done : callers)
        done(devices);
}

} // namespace svr
