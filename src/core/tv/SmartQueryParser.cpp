#include "SmartQueryParser.hpp"

#include <QList>
#include <QRegularExpression>

namespace svr {

namespace {

struct AppKeyword {
    QRegularExpression pattern;
    QString app;
};

const QList<AppKeyword>& keywords()
{
    static const QRegularExpression::PatternOptions ci = QRegularExpression::CaseInsensitiveOption;
    static const QList<AppKeyword> table = {
        {QRegularExpression("\\b(?:on\\s+)?netflix\\b", ci), "Netflix"},
        {QRegularExpression("\\b(?:on\\s+)?disney(?:\\s*\\+|\\s+plus\\b|\\b)", ci), "Disney+"},
        {QRegularExpression("\\b(?:on\\s+)?hulu\\b", ci), "Hulu"},
        {QRegularExpression("\\b(?:on\\s+)?hbo(?:\\s*max)?\\b|\\bon\\s+max\\b", ci), "HBO Max"},
        {QRegularExpression("\\b(?:on\\s+)?(?:amazon\\s+)?prime\\s*video\\b|\\bon\\s+(?:amazon\\s+)?prime\\b"
                            "|\\b(?:on\\s+)?amazon(?:\\s+prime)?\\b", ci), "Prime Video"},
        {QRegularExpression("\\b(?:on\\s+)?youtube\\b", ci), "YouTube"},
    };
    return table;
}

// "search for" must precede "search" or the "for" is left behind.
QString stripCommandVerbs(QString text)
{
    static const QRegularExpression verbs(
        "\\b(put on|play|watch|find|search for|search|look up)\\b",
        QRegularExpression::CaseInsensitiveOption);
    text.remove(verbs);
    return text.simplified();
}

} // namespace

SmartQuery parseSmartQuery(const QString& query)
{
    for (const AppKeyword& keyword : keywords()) {
        QRegularExpressionMatch m = keyword.pattern.match(query);
        if (!m.hasMatch())
            continue;

        QString rest = query;
        rest.remove(m.capturedStart(), m.capturedLength());
        return SmartQuery{keyword.app, stripCommandVerbs(rest)};
    }
    return SmartQuery{QStringLiteral("YouTube"), stripCommandVerbs(query)};
}

} // namespace svr
