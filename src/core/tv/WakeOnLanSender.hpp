#pragma once

#include <QObject>
#include <QTimer>

#include "TvSettings.hpp"
#include "TvTypes.hpp"

class QUdpSocket;

namespace svr {

class SavedConnectionStore;

/// Wakes the remembered TV with a burst of magic packets.
class WakeOnLanSender : public QObject {
    Q_OBJECT
public:
    WakeOnLanSender(SavedConnectionStore* store, const WakeSettings& settings,
                    QObject* parent = nullptr);

    /// NotFound without a saved TV, InvalidArgument for an unusable MAC.
    /// Completes after the last packet has been sent.
    void wake(ResultCallback done);

    /// 6 x 0xFF followed by the MAC 16 times. Empty for a malformed MAC
    /// (accepts ':' or '-' separators, or none).
    static QByteArray buildMagicPacket(const QString& mac);

private:
    void sendNext();
    void finish(const OperationResult& result);

    SavedConnectionStore* store_;
    WakeSettings settings_;
    QUdpSocket* socket_;
    QTimer timer_;
    QByteArray packet_;
    int sent_ = 0;
    ResultCallback done_;
};

} // namespace svr
