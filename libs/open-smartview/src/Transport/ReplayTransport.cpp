#include <osv/Transport/ReplayTransport.hpp>

namespace osv {

ReplayTransport::ReplayTransport(QObject* parent)
    : ITransport(parent)
{
}

ReplayTransport::~ReplayTransport() = default;

void ReplayTransport::open(const QUrl& url)
{
    url_ = url;
    ++openCount_;
}

void ReplayTransport::close()
{
    closeRequested_ = true;
    connected_ = false;
}

bool ReplayTransport::sendText(const QString& message)
{
    if (!connected_ || sendFails_)
        return false;
    sent_.append(message);
    return true;
}

bool ReplayTransport::isConnected() const
{
    return connected_;
}

void ReplayTransport::feedText(const QString& message)
{
    emit textReceived(message);
}

void ReplayTransport::simulateConnect()
{
    connected_ = true;
    emit connected();
}

void ReplayTransport::simulateClose(int closeCode, const QString& reason)
{
    connected_ = false;
    emit disconnected(closeCode, reason);
}

void ReplayTransport::simulateError(const QString& message)
{
    emit error(message);
}

QList<QString> ReplayTransport::sentMessages() const
{
    return sent_;
}

void ReplayTransport::clearSent()
{
    sent_.clear();
}

} // namespace osv
