#pragma once

#include <QObject>
#include <QString>
#include <QUrl>

namespace osv {

class ITransport : public QObject {
    Q_OBJECT
public:
    using QObject::QObject;
    ~ITransport() override = default;

    virtual void open(const QUrl& url) = 0;
    virtual void close() = 0;
    virtual bool sendText(const QString& message) = 0;
    virtual bool isConnected() const = 0;

signals:
    void connected();
    void textReceived(const QString& message);
    void disconnected(int closeCode, const QString& reason);
    void error(const QString& message);
};

} // namespace osv
