#include "SavedConnectionStore.hpp"
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonDocument>
#include <QJsonObject>
#include <QSaveFile>
#include <boost/log/trivial.hpp>

namespace svr {

SavedConnectionStore::SavedConnectionStore(const QString& filePath)
    : filePath_(filePath)
{
}

std::optional<SavedConnection> SavedConnectionStore::load() const
{
    QFile file(filePath_);
    if (!file.open(QIODevice::ReadOnly))
        return std::nullopt;

    QJsonParseError err;
    QJsonDocument doc = QJsonDocument::fromJson(file.readAll(), &err);
    if (err.error != QJsonParseError::NoError || !doc.isObject()) {
        BOOST_LOG_TRIVIAL(warning) << "[SavedConnectionStore] Ignoring malformed "
                                   << filePath_.toStdString() << ": "
                                   << err.errorString().toStdString();
        return std::nullopt;
    }

    QJsonObject obj = doc.object();
    SavedConnection saved;
    saved.ip = obj.value("ip").toString();
    saved.mac = obj.value("mac").toString();
    saved.friendlyName = obj.value("friendlyName").toString();
    saved.token = obj.value("token").toString();
    if (saved.ip.isEmpty())
        return std::nullopt;
    return saved;
}

bool SavedConnectionStore::save(const SavedConnection& connection) const
{
    QDir().mkpath(QFileInfo(filePath_).absolutePath());

    QJsonObject obj;
    obj["ip"] = connection.ip;
    obj["mac"] = connection.mac;
    if (!connection.friendlyName.isEmpty())
        obj["friendlyName"] = connection.friendlyName;
    if (!connection.token.isEmpty())
        obj["token"] = connection.token;

    QSaveFile file(filePath_);
    if (!file.open(QIODevice::WriteOnly)) {
        BOOST_LOG_TRIVIAL(error) << "[SavedConnectionStore] Cannot write "
                                 << filePath_.toStdString() << ": "
                                 << file.errorString().toStdString();
        return false;
    }
    file.write(QJsonDocument(obj).toJson(QJsonDocument::Indented));
    if (!file.commit()) {
        BOOST_LOG_TRIVIAL(error) << "[SavedConnectionStore] Commit failed for "
                                 << filePath_.toStdString();
        return false;
    }
    // The token grants remote control of the TV.
    QFile::setPermissions(filePath_, QFileDevice::ReadOwner | QFileDevice::WriteOwner);
    return true;
}

} // namespace svr
