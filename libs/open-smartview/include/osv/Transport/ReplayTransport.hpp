#pragma once

#include <osv/Transport/ITransport.hpp>
#include <QList>

namespace osv {

class ReplayTransport : public ITransport {
    Q_OBJECT
public:
    explicit ReplayTransport(QObject* parent = nullptr);
    ~ReplayTransport() override;

    // ITransport interface
    void open(const QUrl& url) override;
    void close() override;
    bool sendText(const QString& message) override;
    bool isConnected() const override;

    // Test API
    void feedText(const QString& message);
    void simulateConnect();
    void simulateClose(int closeCode = 1000, const QString& reason = QString());
    void simulateError(const QString& message);
    void setSendFails(bool fails) { sendFails_ = fails; }
    QUrl openedUrl() const { return url_; }
    int openCount() const { return openCount_; }
    bool closeRequested() const { return closeRequested_; }
    QList<QString> sentMessages() const;
    void clearSent();

private:
    QUrl url_;
    int openCount_ = 0;
    bool connected_ = false;
    bool closeRequested_ = false;
    bool sendFails_ = false;
    QList<QString> sent_;
};

} // namespace osv
