#include "SmartQueryEngine.hpp"
#include "CommandChannel.hpp"
#include "ConnectionManager.hpp"
#include "IVideoSearchClient.hpp"
#include "SmartQueryParser.hpp"

#include <boost/log/trivial.hpp>

namespace svr {

namespace {
const QString kYouTube = QStringLiteral("YouTube");
}

SmartQueryEngine::SmartQueryEngine(ConnectionManager* connection, CommandChannel* commands,
                                   IVideoSearchClient* videoSearch,
                                   const SmartSearchSettings& settings, QObject* parent)
    : QObject(parent)
    , connection_(connection)
    , commands_(commands)
    , videoSearch_(videoSearch)
    , settings_(settings)
{
}

void SmartQueryEngine::smartSearch(const QString& query, SmartSearchCallback done)
{
    if (!connection_->isChannelOpen()) {
        SmartSearchResult result;
        result.error = ErrorCode::NotConnected;
        result.message = kNotConnectedMessage;
        done(result);
        return;
    }

    const SmartQuery parsed = parseSmartQuery(query);
    SmartSearchResult result;
    result.app = parsed.app;
    result.search = parsed.search.isEmpty() ? query : parsed.search;

    BOOST_LOG_TRIVIAL(info) << "[SmartQueryEngine] \"" << result.search.toStdString()
                            << "\" (app: " << result.app.toStdString() << ")";

    QPointer<SmartQueryEngine> self(this);
    auto castOrFallback = [self, result, done](const QString& contentId, const QString& metaTag) {
        self->commands_->castToTV(result.app, contentId, metaTag,
                                  [self, result, done](const OperationResult& cast) {
            if (!self)
                return;
            if (cast.success) {
                SmartSearchResult ok = result;
                ok.success = true;
                done(ok);
                return;
            }
            BOOST_LOG_TRIVIAL(info) << "[SmartQueryEngine] Deep link failed (" << cast.message.toStdString()
                                    << "), using on-screen search";
            self->runFallback(result, done);
        });
    };

    if (result.app == kYouTube) {
        videoSearch_->search(result.search, [self, result, done, castOrFallback](const QList<VideoResult>& videos) {
            if (!self)
                return;
            if (videos.isEmpty()) {
                BOOST_LOG_TRIVIAL(info) << "[SmartQueryEngine] No video results, using on-screen search";
                self->runFallback(result, done);
                return;
            }
            const VideoResult& first = videos.first();
            BOOST_LOG_TRIVIAL(info) << "[SmartQueryEngine] Casting " << first.id.toStdString()
                                    << " \"" << first.title.toStdString() << "\"";
            castOrFallback(first.id, first.id);
        });
        return;
    }

    castOrFallback(result.search, QString());
}

void SmartQueryEngine::cancel()
{
    if (sequence_)
        sequence_->cancel();
}

void SmartQueryEngine::runFallback(const SmartSearchResult& partial, SmartSearchCallback done)
{
    // Only one on-screen automation can drive the TV at a time.
    if (sequence_)
        sequence_->cancel();

    auto* sequence = new AutomationSequence(this);
    sequence_ = sequence;

    CommandChannel* commands = commands_;
    const QString term = partial.search;
    auto key = [commands](const char* code) {
        return [commands, code]() {
            OperationResult r = commands->sendKey(QString::fromLatin1(code));
            if (!r.success)
                BOOST_LOG_TRIVIAL(warning) << "[SmartQueryEngine] " << code << " not sent: "
                                           << r.message.toStdString();
        };
    };

    sequence->addStep("open search", key("KEY_SMART_HUB"), settings_.openSearchDelayMs);
    sequence->addStep("enter text", [commands, term]() {
        OperationResult r = commands->sendText(term);
        if (!r.success)
            BOOST_LOG_TRIVIAL(warning) << "[SmartQueryEngine] Text not sent: " << r.message.toStdString();
    }, settings_.textInputDelayMs);
    sequence->addStep("submit", key("KEY_ENTER"), settings_.resultsDelayMs);
    sequence->addStep("move to first result", key("KEY_DOWN"), settings_.navigateDelayMs);
    sequence->addStep("select", key("KEY_ENTER"));

    connect(sequence, &AutomationSequence::stepExecuted, this, [this](int, const QString& name) {
        BOOST_LOG_TRIVIAL(debug) << "[SmartQueryEngine] Step: " << name.toStdString();
        emit automationStep(name);
    });

    SmartSearchResult result = partial;
    result.success = true;
    result.usedFallback = true;
    connect(sequence, &AutomationSequence::finished, this, [sequence, result, done]() {
        sequence->deleteLater();
        done(result);
    });
    connect(sequence, &AutomationSequence::cancelled, this, [sequence, result, done]() {
        sequence->deleteLater();
        SmartSearchResult stopped = result;
        stopped.message = QStringLiteral("On-screen search cancelled");
        done(stopped);
    });

    sequence->start();
}

} // namespace svr
