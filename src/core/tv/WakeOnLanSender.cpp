#include "WakeOnLanSender.hpp"
#include "SavedConnectionStore.hpp"

#include <QHostAddress>
#include <QRegularExpression>
#include <QUdpSocket>
#include <boost/log/trivial.hpp>

namespace svr {

WakeOnLanSender::WakeOnLanSender(SavedConnectionStore* store, const WakeSettings& settings,
                                 QObject* parent)
    : QObject(parent)
    , store_(store)
    , settings_(settings)
    , socket_(new QUdpSocket(this))
{
    timer_.setSingleShot(true);
    connect(&timer_, &QTimer::timeout, this, &WakeOnLanSender::sendNext);
}

void WakeOnLanSender::wake(ResultCallback done)
{
    if (done_) {
        done(OperationResult::failure(ErrorCode::Busy, QStringLiteral("Wake already in progress")));
        return;
    }

    std::optional<SavedConnection> saved = store_->load();
    if (!saved) {
        done(OperationResult::failure(ErrorCode::NotFound,
                                      QStringLiteral("No saved TV to wake. Connect first.")));
        return;
    }

    QByteArray packet = buildMagicPacket(saved->mac);
    if (packet.isEmpty()) {
        done(OperationResult::failure(ErrorCode::InvalidArgument,
                                      QStringLiteral("Saved TV has no valid MAC address: %1").arg(saved->mac)));
        return;
    }

    BOOST_LOG_TRIVIAL(info) << "[WakeOnLan] Waking " << saved->mac.toStdString() << " ("
                            << settings_.packetCount << " packets)";
    packet_ = packet;
    sent_ = 0;
    done_ = std::move(done);
    sendNext();
}

QByteArray WakeOnLanSender::buildMagicPacket(const QString& mac)
{
    static const QRegularExpression macPattern(
        "^([0-9A-Fa-f]{2})[:-]?([0-9A-Fa-f]{2})[:-]?([0-9A-Fa-f]{2})[:-]?"
        "([0-9A-Fa-f]{2})[:-]?([0-9A-Fa-f]{2})[:-]?([0-9A-Fa-f]{2})$");
    QRegularExpressionMatch m = macPattern.match(mac.trimmed());
    if (!m.hasMatch())
        return QByteArray();

    QByteArray address;
    for (int i = 1; i <= 6; ++i)
        address.append(char(m.captured(i).toUInt(nullptr, 16)));

    QByteArray packet(6, char(0xFF));
    for (int i = 0; i < 16; ++i)
        packet.append(address);
    return packet;
}

void WakeOnLanSender::sendNext()
{
    const qint64 written = socket_->writeDatagram(packet_, QHostAddress(settings_.broadcastAddress),
                                                  settings_.port);
    if (written < 0) {
        BOOST_LOG_TRIVIAL(warning) << "[WakeOnLan] Send failed: " << socket_->errorString().toStdString();
        finish(OperationResult::failure(ErrorCode::NetworkError, socket_->errorString()));
        return;
    }

    if (++sent_ >= settings_.packetCount) {
        finish(OperationResult::ok());
        return;
    }
    timer_.start(settings_.intervalMs);
}

void WakeOnLanSender::finish(const OperationResult& result)
{
    timer_.stop();
    ResultCallback done = std::move(done_);
    done_ = nullptr;
    if (done)
        done(result);
}

} // namespace svr
