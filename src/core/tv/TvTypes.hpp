#pragma once

#include <QJsonObject>
#include <QList>
#include <QString>
#include <functional>

namespace svr {

/// A television found on the network. ip is the addressable key.
struct Device {
    QString ip;
    QString mac;
    QString friendlyName;

    QJsonObject toJson() const;
    bool operator==(const Device& other) const
    {
        return ip == other.ip && mac == other.mac && friendlyName == other.friendlyName;
    }
};

/// The one remembered pairing, persisted on disk.
struct SavedConnection {
    QString ip;
    QString mac;
    QString friendlyName;  // empty = unknown
    QString token;         // empty = never paired

    Device device() const { return Device{ip, mac, friendlyName}; }
};

enum class ErrorCode {
    None,
    NotConnected,
    UnknownApp,
    HandshakeTimeout,
    HandshakeRejected,
    TransportClosed,
    NetworkError,
    NotFound,
    Busy,
    InvalidArgument
};

QString errorCodeName(ErrorCode code);

struct OperationResult {
    bool success = false;
    ErrorCode error = ErrorCode::None;
    QString message;

    static OperationResult ok() { return OperationResult{true, ErrorCode::None, QString()}; }
    static OperationResult failure(ErrorCode code, const QString& message)
    {
        return OperationResult{false, code, message};
    }

    QJsonObject toJson() const;
};

struct DeviceStatus {
    bool connected = false;
    bool hasDevice = false;
    Device device;

    QJsonObject toJson() const;
};

struct SmartQuery {
    QString app;
    QString search;
};

struct SmartSearchResult {
    bool success = false;
    QString app;
    QString search;
    bool usedFallback = false;
    ErrorCode error = ErrorCode::None;
    QString message;

    QJsonObject toJson() const;
};

struct VideoResult {
    QString id;
    QString title;
    QString channel;

    QJsonObject toJson() const;
};

using ResultCallback = std::function<void(const OperationResult&)>;
using DevicesCallback = std::function<void(const QList<Device>&)>;
using VideoResultsCallback = std::function<void(const QList<VideoResult>&)>;
using SmartSearchCallback = std::function<void(const SmartSearchResult&)>;

inline const QString kNotConnectedMessage = QStringLiteral("Not connected to any TV");

} // namespace svr
