#pragma once

#include <osv/Transport/ITransport.hpp>
#include <QWebSocket>

namespace osv {

/// ITransport over QWebSocket. Certificate errors are ignored: the TV serves
/// wss:// with a self-signed certificate.
class WebSocketTransport : public ITransport {
    Q_OBJECT
public:
    explicit WebSocketTransport(QObject* parent = nullptr);
    ~WebSocketTransport() override;

    void open(const QUrl& url) override;
    void close() override;
    bool sendText(const QString& message) override;
    bool isConnected() const override;

private:
    void connectSocketSignals();

    QWebSocket socket_;
    bool closing_ = false;
};

} // namespace osv
