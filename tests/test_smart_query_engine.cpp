#include <QtTest>
#include <QJsonDocument>
#include <QJsonObject>
#include <QSignalSpy>
#include <QTemporaryDir>
#include <osv/Transport/ReplayTransport.hpp>
#include "core/tv/CommandChannel.hpp"
#include "core/tv/ConnectionManager.hpp"
#include "core/tv/IVideoSearchClient.hpp"
#include "core/tv/SavedConnectionStore.hpp"
#include "core/tv/SmartQueryEngine.hpp"
#include "FakeHttpServer.hpp"

namespace {

class FakeVideoSearch : public svr::IVideoSearchClient {
public:
    void search(const QString& term, svr::VideoResultsCallback done) override
    {
        terms.append(term);
        done(results);
    }

    QList<svr::VideoResult> results;
    QStringList terms;
};

// What the TV was told, in order: key codes, "TEXT:<decoded>", or "DEEPLINK:<appId>:<metaTag>".
QStringList describe(const QList<QString>& frames)
{
    QStringList out;
    for (const QString& f : frames) {
        QJsonObject msg = QJsonDocument::fromJson(f.toUtf8()).object();
        QJsonObject params = msg.value("params").toObject();
        if (msg.value("method").toString() == "ms.channel.emit") {
            QJsonObject data = params.value("data").toObject();
            out << "DEEPLINK:" + data.value("appId").toString() + ":" + data.value("metaTag").toString();
        } else if (params.value("TypeOfRemote").toString() == "SendInputString") {
            out << "TEXT:" + QString::fromUtf8(QByteArray::fromBase64(params.value("Cmd").toString().toLatin1()));
        } else {
            out << params.value("DataOfCmd").toString();
        }
    }
    return out;
}

struct Fixture {
    QTemporaryDir dir;
    svr::SavedConnectionStore store{dir.path() + "/tv-token.json"};
    svr::ConnectionManager manager{&store, svr::ConnectionSettings{}};
    FakeHttpServer http;
    FakeVideoSearch videos;
    std::unique_ptr<svr::CommandChannel> commands;
    std::unique_ptr<svr::SmartQueryEngine> engine;
    QPointer<osv::ReplayTransport> transport;
    int transportsCreated = 0;

    explicit Fixture(int stepDelayMs = 5)
    {
        http.listen();
        svr::CommandSettings commandSettings;
        commandSettings.restPort = http.port();
        commands = std::make_unique<svr::CommandChannel>(&manager, commandSettings);

        svr::SmartSearchSettings smart;
        smart.openSearchDelayMs = stepDelayMs;
        smart.textInputDelayMs = stepDelayMs;
        smart.resultsDelayMs = stepDelayMs;
        smart.navigateDelayMs = stepDelayMs;
        engine = std::make_unique<svr::SmartQueryEngine>(&manager, commands.get(), &videos, smart);

        manager.setTransportFactory([this](QObject* parent) -> osv::ITransport* {
            ++transportsCreated;
            transport = new osv::ReplayTransport(parent);
            return transport.data();
        });
    }

    void pair()
    {
        svr::ConnectRequest request;
        request.ip = "127.0.0.1";
        manager.connectToDevice(request, [](const svr::OperationResult&) {});
        transport->simulateConnect();
        transport->feedText(R"({"event":"ms.channel.connect","data":{"token":"t"}})");
    }
};

} // namespace

class TestSmartQueryEngine : public QObject {
    Q_OBJECT
private slots:
    void testNotConnectedMakesNoCalls();
    void testYouTubeCastsFirstResult();
    void testYouTubeWithoutResultsRunsAutomation();
    void testOtherAppDeepLinksSearchTerm();
    void testEmptySearchUsesRawQuery();
    void testFailedCastStillSucceedsViaAutomation();
    void testCancelStopsAutomation();
};

void TestSmartQueryEngine::testNotConnectedMakesNoCalls()
{
    Fixture f;
    std::optional<svr::SmartSearchResult> result;
    f.engine->smartSearch("play stranger things on netflix", [&](const svr::SmartSearchResult& r) { result = r; });

    QVERIFY(result.has_value());
    QVERIFY(!result->success);
    QCOMPARE(result->error, svr::ErrorCode::NotConnected);
    QVERIFY(f.videos.terms.isEmpty());
    QCOMPARE(f.transportsCreated, 0);
    QVERIFY(f.http.requests().isEmpty());
}

void TestSmartQueryEngine::testYouTubeCastsFirstResult()
{
    Fixture f;
    f.pair();
    f.videos.results = {svr::VideoResult{"aaaaaaaaaaa", "First", "Chan"},
                        svr::VideoResult{"bbbbbbbbbbb", "Second", "Chan"}};

    std::optional<svr::SmartSearchResult> result;
    f.engine->smartSearch("search for cat videos", [&](const svr::SmartSearchResult& r) { result = r; });

    QVERIFY(result.has_value());
    QVERIFY(result->success);
    QVERIFY(!result->usedFallback);
    QCOMPARE(result->app, QString("YouTube"));
    QCOMPARE(result->search, QString("cat videos"));
    QCOMPARE(f.videos.terms, QStringList{"cat videos"});
    QCOMPARE(describe(f.transport->sentMessages()),
             QStringList{"DEEPLINK:111299001912:aaaaaaaaaaa"});
}

void TestSmartQueryEngine::testYouTubeWithoutResultsRunsAutomation()
{
    Fixture f;
    f.pair();
    QSignalSpy stepSpy(f.engine.get(), &svr::SmartQueryEngine::automationStep);

    std::optional<svr::SmartSearchResult> result;
    f.engine->smartSearch("search for cat videos", [&](const svr::SmartSearchResult& r) { result = r; });
    QVERIFY(!result.has_value());
    QVERIFY(f.engine->isAutomationRunning());

    QTRY_VERIFY_WITH_TIMEOUT(result.has_value(), 3000);
    QVERIFY(result->success);
    QVERIFY(result->usedFallback);
    QCOMPARE(result->search, QString("cat videos"));
    QCOMPARE(describe(f.transport->sentMessages()),
             (QStringList{"KEY_SMART_HUB", "TEXT:cat videos", "KEY_ENTER", "KEY_DOWN", "KEY_ENTER"}));
    QCOMPARE(stepSpy.count(), 5);
    QCOMPARE(stepSpy.first().at(0).toString(), QString("open search"));
}

void TestSmartQueryEngine::testOtherAppDeepLinksSearchTerm()
{
    Fixture f;
    f.pair();

    std::optional<svr::SmartSearchResult> result;
    f.engine->smartSearch("play stranger things on netflix", [&](const svr::SmartSearchResult& r) { result = r; });

    QVERIFY(result.has_value());
    QVERIFY(result->success);
    QVERIFY(!result->usedFallback);
    QCOMPARE(result->app, QString("Netflix"));
    QCOMPARE(result->search, QString("stranger things"));
    QVERIFY(f.videos.terms.isEmpty());
    QCOMPARE(describe(f.transport->sentMessages()),
             QStringList{"DEEPLINK:11101200001:stranger things"});
}

void TestSmartQueryEngine::testEmptySearchUsesRawQuery()
{
    Fixture f;
    f.pair();
    f.videos.results = {svr::VideoResult{"ccccccccccc", "", ""}};

    std::optional<svr::SmartSearchResult> result;
    f.engine->smartSearch("play", [&](const svr::SmartSearchResult& r) { result = r; });
    QVERIFY(result.has_value());
    QCOMPARE(result->search, QString("play"));
    QCOMPARE(f.videos.terms, QStringList{"play"});
}

void TestSmartQueryEngine::testFailedCastStillSucceedsViaAutomation()
{
    Fixture f;
    f.pair();
    // Channel send fails (drops the connection) and the REST fallback errors
    f.transport->setSendFails(true);
    f.http.respondWith(500, "{}");

    std::optional<svr::SmartSearchResult> result;
    f.engine->smartSearch("the bear on hulu", [&](const svr::SmartSearchResult& r) { result = r; });

    QTRY_VERIFY_WITH_TIMEOUT(result.has_value(), 5000);
    QVERIFY(result->success);
    QVERIFY(result->usedFallback);
    QCOMPARE(result->app, QString("Hulu"));
    QCOMPARE(f.http.requests().size(), 1);
}

void TestSmartQueryEngine::testCancelStopsAutomation()
{
    Fixture f(10000);
    f.pair();

    std::optional<svr::SmartSearchResult> result;
    f.engine->smartSearch("cat videos", [&](const svr::SmartSearchResult& r) { result = r; });
    QVERIFY(f.engine->isAutomationRunning());
    QCOMPARE(describe(f.transport->sentMessages()), QStringList{"KEY_SMART_HUB"});

    f.engine->cancel();
    QVERIFY(result.has_value());
    QVERIFY(result->usedFallback);
    QVERIFY(!result->message.isEmpty());
    QVERIFY(!f.engine->isAutomationRunning());
    QCOMPARE(f.transport->sentMessages().size(), 1);
}

QTEST_MAIN(TestSmartQueryEngine)
#include "test_smart_query_engine.moc"
