#include "VideoSearchClient.hpp"

#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QNetworkAccessManager>
#include <QNetworkReply>
#include <QNetworkRequest>
#include <QRegularExpression>
#include <QSet>
#include <QUrlQuery>
#include <boost/log/trivial.hpp>

namespace svr {

namespace {

// "runs":[{"text":...}] or "simpleText"
QString textOf(const QJsonValue& value)
{
    const QJsonObject obj = value.toObject();
    if (obj.contains("simpleText"))
        return obj.value("simpleText").toString();

    QString text;
    for (const QJsonValue& run : obj.value("runs").toArray())
        text += run.toObject().value("text").toString();
    return text;
}

} // namespace

VideoSearchClient::VideoSearchClient(const VideoSearchSettings& settings, QObject* parent)
    : QObject(parent)
    , settings_(settings)
    , nam_(new QNetworkAccessManager(this))
{
}

void VideoSearchClient::search(const QString& term, VideoResultsCallback done)
{
    QUrl url(settings_.url);
    QUrlQuery query;
    query.addQueryItem("search_query", term);
    url.setQuery(query);

    QNetworkRequest request(url);
    // Without a browser UA the page comes back in a different layout.
    request.setRawHeader("User-Agent", settings_.userAgent.toUtf8());
    request.setRawHeader("Accept-Language", "en-US,en;q=0.9");
    request.setTransferTimeout(settings_.timeoutMs);

    QNetworkReply* reply = nam_->get(request);
    const int maxResults = settings_.maxResults;
    connect(reply, &QNetworkReply::finished, this, [reply, term, maxResults, done]() {
        reply->deleteLater();
        if (reply->error() != QNetworkReply::NoError) {
            BOOST_LOG_TRIVIAL(warning) << "[VideoSearchClient] Search for \"" << term.toStdString()
                                       << "\" failed: " << reply->errorString().toStdString();
            done({});
            return;
        }

        QList<VideoResult> results = parseResultsPage(QString::fromUtf8(reply->readAll()), maxResults);
        BOOST_LOG_TRIVIAL(debug) << "[VideoSearchClient] " << results.size() << " results for \""
                                 << term.toStdString() << "\"";
        done(results);
    });
}

QList<VideoResult> VideoSearchClient::parseResultsPage(const QString& html, int maxResults)
{
    QList<VideoResult> results;
    if (maxResults <= 0)
        return results;

    const QString blob = extractInitialData(html);
    if (!blob.isEmpty()) {
        QJsonParseError err;
        QJsonDocument doc = QJsonDocument::fromJson(blob.toUtf8(), &err);
        if (err.error == QJsonParseError::NoError && doc.isObject())
            collectVideos(doc.object(), results, maxResults);
    }

    if (results.isEmpty())
        results = scanVideoIds(html, maxResults);
    return results;
}

QString VideoSearchClient::extractInitialData(const QString& html)
{
    int pos = html.indexOf("ytInitialData");
    if (pos < 0)
        return QString();
    int start = html.indexOf('{', pos);
    if (start < 0)
        return QString();

    int depth = 0;
    bool inString = false;
    bool escaped = false;
    for (int i = start; i < html.size(); ++i) {
        const QChar c = html.at(i);
        if (inString) {
            if (escaped)
                escaped = false;
            else if (c == '\\')
                escaped = true;
            else if (c == '"')
                inString = false;
            continue;
        }
        if (c == '"') {
            inString = true;
        } else if (c == '{') {
            ++depth;
        } else if (c == '}') {
            if (--depth == 0)
                return html.mid(start, i - start + 1);
        }
    }
    return QString();
}

void VideoSearchClient::collectVideos(const QJsonValue& node, QList<VideoResult>& out, int maxResults)
{
    if (out.size() >= maxResults)
        return;

    if (node.isArray()) {
        for (const QJsonValue& child : node.toArray()) {
            collectVideos(child, out, maxResults);
            if (out.size() >= maxResults)
                return;
        }
        return;
    }
    if (!node.isObject())
        return;

    const QJsonObject obj = node.toObject();
    if (obj.contains("videoRenderer")) {
        const QJsonObject renderer = obj.value("videoRenderer").toObject();
        const QString id = renderer.value("videoId").toString();
        if (!id.isEmpty()) {
            VideoResult video;
            video.id = id;
            video.title = textOf(renderer.value("title"));
            video.channel = textOf(renderer.value("ownerText"));
            if (video.channel.isEmpty())
                video.channel = textOf(renderer.value("longBylineText"));
            out.append(video);
        }
        return;
    }

    for (auto it = obj.begin(); it != obj.end(); ++it) {
        collectVideos(it.value(), out, maxResults);
        if (out.size() >= maxResults)
            return;
    }
}

QList<VideoResult> VideoSearchClient::scanVideoIds(const QString& html, int maxResults)
{
    static const QRegularExpression idPattern("\"videoId\"\\s*:\\s*\"([A-Za-z0-9_-]{11})\"");

    QList<VideoResult> results;
    QSet<QString> seen;
    QRegularExpressionMatchIterator it = idPattern.globalMatch(html);
    while (it.hasNext() && results.size() < maxResults) {
        const QString id = it.next().captured(1);
        if (seen.contains(id))
            continue;
        seen.insert(id);
        results.append(VideoResult{id, QString(), QString()});
    }
    return results;
}

} // namespace svr
