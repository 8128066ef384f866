#include "AppCatalog.hpp"
#include <QHash>
#include <QRegularExpression>

namespace svr {

namespace {

const QHash<QString, QString>& table()
{
    static const QHash<QString, QString> ids = {
        {"Netflix", "11101200001"},
        {"YouTube", "111299001912"},
        {"Disney+", "3201901017640"},
        {"Hulu", "3201601007625"},
        {"HBO Max", "3202301029760"},
        {"Prime Video", "3201512006785"},
    };
    return ids;
}

} // namespace

QString AppCatalog::appId(const QString& appName)
{
    return table().value(appName);
}

QString AppCatalog::resolveLenient(const QString& appName)
{
    const QString id = appId(appName);
    if (!id.isEmpty())
        return id;

    static const QRegularExpression numeric("^\\d+$");
    if (numeric.match(appName).hasMatch())
        return appName;
    return QString();
}

} // namespace svr
