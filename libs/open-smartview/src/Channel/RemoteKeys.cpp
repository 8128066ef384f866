#include <osv/Channel/RemoteKeys.hpp>

namespace osv {

const QStringList& RemoteKeys::names()
{
    static const QStringList keys = {
        // Power and sources
        "KEY_POWER", "KEY_POWEROFF", "KEY_POWERON", "KEY_SOURCE", "KEY_HDMI",
        "KEY_HDMI1", "KEY_HDMI2", "KEY_HDMI3", "KEY_HDMI4", "KEY_TV",
        // Digits
        "KEY_0", "KEY_1", "KEY_2", "KEY_3", "KEY_4",
        "KEY_5", "KEY_6", "KEY_7", "KEY_8", "KEY_9", "KEY_11", "KEY_12",
        // Volume and channels
        "KEY_VOLUP", "KEY_VOLDOWN", "KEY_MUTE", "KEY_CHUP", "KEY_CHDOWN",
        "KEY_PRECH", "KEY_CH_LIST", "KEY_FAVCH", "KEY_DTV",
        // Navigation
        "KEY_UP", "KEY_DOWN", "KEY_LEFT", "KEY_RIGHT", "KEY_ENTER",
        "KEY_RETURN", "KEY_EXIT", "KEY_HOME", "KEY_MENU", "KEY_TOOLS",
        "KEY_INFO", "KEY_GUIDE", "KEY_SMART_HUB", "KEY_CONTENTS", "KEY_W_LINK",
        "KEY_AMBIENT", "KEY_SEARCH",
        // Colour keys
        "KEY_RED", "KEY_GREEN", "KEY_YELLOW", "KEY_BLUE", "KEY_CYAN",
        // Playback
        "KEY_PLAY", "KEY_PAUSE", "KEY_STOP", "KEY_REWIND", "KEY_FF",
        "KEY_REC", "KEY_PLAY_BACK",
        // Picture and sound
        "KEY_PMODE", "KEY_PICTURE_SIZE", "KEY_ASPECT", "KEY_3D", "KEY_CAPTION",
        "KEY_SUB_TITLE", "KEY_MTS", "KEY_AD", "KEY_SLEEP", "KEY_ESAVING",
        "KEY_PIP_ONOFF", "KEY_MORE",
    };
    return keys;
}

QString RemoteKeys::resolve(const QString& name)
{
    const QString trimmed = name.trimmed();
    if (trimmed.isEmpty())
        return QString();

    const QStringList& keys = names();
    if (keys.contains(trimmed))
        return trimmed;

    QString upper = trimmed.toUpper();
    if (!upper.startsWith(QLatin1String("KEY_")))
        upper.prepend(QLatin1String("KEY_"));
    if (keys.contains(upper))
        return upper;

    return QString();
}

} // namespace osv
