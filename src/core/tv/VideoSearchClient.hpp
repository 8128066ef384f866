#pragma once

#include <QObject>

#include "IVideoSearchClient.hpp"
#include "TvSettings.hpp"

class QNetworkAccessManager;
class QJsonValue;

namespace svr {

/// Scrapes the public YouTube results page. The page embeds its results as
/// a JSON blob (ytInitialData); when that cannot be found or parsed, video
/// ids are pulled from the raw text instead.
class VideoSearchClient : public QObject, public IVideoSearchClient {
    Q_OBJECT
public:
    explicit VideoSearchClient(const VideoSearchSettings& settings, QObject* parent = nullptr);

    void search(const QString& term, VideoResultsCallback done) override;

    static QList<VideoResult> parseResultsPage(const QString& html, int maxResults);

private:
    static QString extractInitialData(const QString& html);
    static void collectVideos(const QJsonValue& node, QList<VideoResult>& out, int maxResults);
    static QList<VideoResult> scanVideoIds(const QString& html, int maxResults);

    VideoSearchSettings settings_;
    QNetworkAccessManager* nam_;
};

} // namespace svr
