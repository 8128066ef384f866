#include <QtTest>
#include <QJsonDocument>
#include <QJsonObject>
#include <QTemporaryDir>
#include <osv/Transport/ReplayTransport.hpp>
#include "core/tv/CommandChannel.hpp"
#include "core/tv/ConnectionManager.hpp"
#include "core/tv/SavedConnectionStore.hpp"
#include "FakeHttpServer.hpp"

namespace {

QJsonObject frame(const QString& text)
{
    return QJsonDocument::fromJson(text.toUtf8()).object();
}

// A manager paired with 127.0.0.1 over a ReplayTransport, and a command
// channel whose REST calls go to a local fake.
struct Fixture {
    QTemporaryDir dir;
    svr::SavedConnectionStore store{dir.path() + "/tv-token.json"};
    svr::ConnectionManager manager{&store, svr::ConnectionSettings{}};
    FakeHttpServer http;
    std::unique_ptr<svr::CommandChannel> commands;
    QPointer<osv::ReplayTransport> transport;

    Fixture()
    {
        http.listen();
        svr::CommandSettings settings;
        settings.restPort = http.port();
        settings.restTimeoutMs = 3000;
        commands = std::make_unique<svr::CommandChannel>(&manager, settings);
        manager.setTransportFactory([this](QObject* parent) -> osv::ITransport* {
            transport = new osv::ReplayTransport(parent);
            return transport.data();
        });
    }

    void pair()
    {
        svr::ConnectRequest request;
        request.ip = "127.0.0.1";
        request.mac = "aa:bb:cc:dd:ee:ff";
        manager.connectToDevice(request, [](const svr::OperationResult&) {});
        transport->simulateConnect();
        transport->feedText(R"({"event":"ms.channel.connect","data":{"token":"t"}})");
    }
};

} // namespace

class TestCommandChannel : public QObject {
    Q_OBJECT
private slots:
    void testSendKeyRequiresChannel();
    void testSendKeyResolvesName();
    void testUnknownKeySentRaw();
    void testSendText();
    void testFailedSendDropsConnection();
    void testLaunchRequiresDevice();
    void testLaunchKnownApp();
    void testLaunchNumericId();
    void testLaunchUnknownName();
    void testLaunchErrorUsesDeviceMessage();
    void testLaunchErrorGenericMessage();
    void testCastUnknownAppAlwaysFails();
    void testCastRequiresChannel();
    void testCastOverChannel();
    void testCastFallsBackToRest();
    void testCastFailsWhenBothPathsFail();
    void testAvailableKeys();
};

void TestCommandChannel::testSendKeyRequiresChannel()
{
    Fixture f;
    svr::OperationResult r = f.commands->sendKey("KEY_POWER");
    QVERIFY(!r.success);
    QCOMPARE(r.error, svr::ErrorCode::NotConnected);
    QCOMPARE(r.message, QString("Not connected to any TV"));

    QCOMPARE(f.commands->sendText("hello").error, svr::ErrorCode::NotConnected);
}

void TestCommandChannel::testSendKeyResolvesName()
{
    Fixture f;
    f.pair();
    QVERIFY(f.commands->sendKey("volup").success);

    QCOMPARE(f.transport->sentMessages().size(), 1);
    QJsonObject msg = frame(f.transport->sentMessages().first());
    QCOMPARE(msg.value("method").toString(), QString("ms.remote.control"));
    QJsonObject params = msg.value("params").toObject();
    QCOMPARE(params.value("Cmd").toString(), QString("Click"));
    QCOMPARE(params.value("DataOfCmd").toString(), QString("KEY_VOLUP"));
    QCOMPARE(params.value("TypeOfRemote").toString(), QString("SendRemoteKey"));
}

void TestCommandChannel::testUnknownKeySentRaw()
{
    Fixture f;
    f.pair();
    QVERIFY(f.commands->sendKey("KEY_SOMETHING_NEW").success);
    QJsonObject params = frame(f.transport->sentMessages().first()).value("params").toObject();
    QCOMPARE(params.value("DataOfCmd").toString(), QString("KEY_SOMETHING_NEW"));
}

void TestCommandChannel::testSendText()
{
    Fixture f;
    f.pair();
    QVERIFY(f.commands->sendText("stranger things").success);

    QJsonObject params = frame(f.transport->sentMessages().first()).value("params").toObject();
    QCOMPARE(params.value("TypeOfRemote").toString(), QString("SendInputString"));
    QCOMPARE(params.value("DataOfCmd").toString(), QString("base64"));
    QCOMPARE(QByteArray::fromBase64(params.value("Cmd").toString().toLatin1()),
             QByteArray("stranger things"));
}

void TestCommandChannel::testFailedSendDropsConnection()
{
    Fixture f;
    f.pair();
    f.transport->setSendFails(true);

    svr::OperationResult r = f.commands->sendKey("KEY_HOME");
    QVERIFY(!r.success);
    QVERIFY(!f.manager.status().connected);
    QCOMPARE(f.commands->sendKey("KEY_HOME").error, svr::ErrorCode::NotConnected);
}

void TestCommandChannel::testLaunchRequiresDevice()
{
    Fixture f;
    std::optional<svr::OperationResult> result;
    f.commands->launchApp("Netflix", [&](const svr::OperationResult& r) { result = r; });
    QVERIFY(result.has_value());
    QCOMPARE(result->error, svr::ErrorCode::NotConnected);
    QVERIFY(f.http.requests().isEmpty());
}

void TestCommandChannel::testLaunchKnownApp()
{
    Fixture f;
    f.pair();
    f.http.respondWith(200, R"({"ok":true})");

    std::optional<svr::OperationResult> result;
    f.commands->launchApp("Netflix", [&](const svr::OperationResult& r) { result = r; });
    QTRY_VERIFY_WITH_TIMEOUT(result.has_value(), 5000);
    QVERIFY(result->success);
    QCOMPARE(f.http.requests().size(), 1);
    QCOMPARE(f.http.requests().first().method, QByteArray("POST"));
    QCOMPARE(f.http.requests().first().path, QByteArray("/api/v2/applications/11101200001"));
}

void TestCommandChannel::testLaunchNumericId()
{
    Fixture f;
    f.pair();
    f.http.respondWith(200, "{}");

    std::optional<svr::OperationResult> result;
    f.commands->launchApp("3201907018807", [&](const svr::OperationResult& r) { result = r; });
    QTRY_VERIFY_WITH_TIMEOUT(result.has_value(), 5000);
    QVERIFY(result->success);
    QCOMPARE(f.http.requests().first().path, QByteArray("/api/v2/applications/3201907018807"));
}

void TestCommandChannel::testLaunchUnknownName()
{
    Fixture f;
    f.pair();

    std::optional<svr::OperationResult> result;
    f.commands->launchApp("Spotify", [&](const svr::OperationResult& r) { result = r; });
    QVERIFY(result.has_value());
    QCOMPARE(result->error, svr::ErrorCode::UnknownApp);
    QCOMPARE(result->message, QString("Unknown app: Spotify. Use a known app name or a numeric app ID."));
    QVERIFY(f.http.requests().isEmpty());
}

void TestCommandChannel::testLaunchErrorUsesDeviceMessage()
{
    Fixture f;
    f.pair();
    f.http.respondWith(404, R"({"message":"App not installed"})");

    std::optional<svr::OperationResult> result;
    f.commands->launchApp("Hulu", [&](const svr::OperationResult& r) { result = r; });
    QTRY_VERIFY_WITH_TIMEOUT(result.has_value(), 5000);
    QVERIFY(!result->success);
    QCOMPARE(result->error, svr::ErrorCode::NetworkError);
    QCOMPARE(result->message, QString("App not installed"));
}

void TestCommandChannel::testLaunchErrorGenericMessage()
{
    Fixture f;
    f.pair();
    f.http.respondWith(500, "oops", "text/plain");

    std::optional<svr::OperationResult> result;
    f.commands->launchApp("Hulu", [&](const svr::OperationResult& r) { result = r; });
    QTRY_VERIFY_WITH_TIMEOUT(result.has_value(), 5000);
    QCOMPARE(result->message, QString("Failed to launch Hulu"));
}

void TestCommandChannel::testCastUnknownAppAlwaysFails()
{
    Fixture f;
    std::optional<svr::OperationResult> result;

    // Disconnected: the app check still comes first
    f.commands->castToTV("Spotify", "abc", QString(), [&](const svr::OperationResult& r) { result = r; });
    QCOMPARE(result->error, svr::ErrorCode::UnknownApp);

    // Connected, numeric name: no raw-id fallback here
    f.pair();
    result.reset();
    f.commands->castToTV("3201907018807", "abc", QString(), [&](const svr::OperationResult& r) { result = r; });
    QVERIFY(result.has_value());
    QCOMPARE(result->error, svr::ErrorCode::UnknownApp);
    QVERIFY(f.transport->sentMessages().isEmpty());
}

void TestCommandChannel::testCastRequiresChannel()
{
    Fixture f;
    std::optional<svr::OperationResult> result;
    f.commands->castToTV("YouTube", "dQw4w9WgXcQ", QString(), [&](const svr::OperationResult& r) { result = r; });
    QCOMPARE(result->error, svr::ErrorCode::NotConnected);
}

void TestCommandChannel::testCastOverChannel()
{
    Fixture f;
    f.pair();

    std::optional<svr::OperationResult> result;
    f.commands->castToTV("YouTube", "dQw4w9WgXcQ", QString(), [&](const svr::OperationResult& r) { result = r; });
    QVERIFY(result.has_value());
    QVERIFY(result->success);
    QVERIFY(f.http.requests().isEmpty());

    QJsonObject msg = frame(f.transport->sentMessages().first());
    QCOMPARE(msg.value("method").toString(), QString("ms.channel.emit"));
    QJsonObject params = msg.value("params").toObject();
    QCOMPARE(params.value("event").toString(), QString("ed.apps.launch"));
    QCOMPARE(params.value("to").toString(), QString("host"));
    QJsonObject data = params.value("data").toObject();
    QCOMPARE(data.value("appId").toString(), QString("111299001912"));
    QCOMPARE(data.value("action_type").toString(), QString("DEEP_LINK"));
    QCOMPARE(data.value("metaTag").toString(), QString("dQw4w9WgXcQ"));

    // An explicit metaTag wins over the content id
    f.transport->clearSent();
    f.commands->castToTV("Netflix", "80057281", "m=80057281", [](const svr::OperationResult&) {});
    data = frame(f.transport->sentMessages().first()).value("params").toObject().value("data").toObject();
    QCOMPARE(data.value("metaTag").toString(), QString("m=80057281"));
}

void TestCommandChannel::testCastFallsBackToRest()
{
    Fixture f;
    f.pair();
    f.transport->setSendFails(true);
    f.http.respondWith(200, "{}");

    std::optional<svr::OperationResult> result;
    f.commands->castToTV("Netflix", "80057281", QString(), [&](const svr::OperationResult& r) { result = r; });
    QTRY_VERIFY_WITH_TIMEOUT(result.has_value(), 5000);
    QVERIFY(result->success);

    QCOMPARE(f.http.requests().size(), 1);
    const FakeHttpServer::Request& req = f.http.requests().first();
    QCOMPARE(req.method, QByteArray("POST"));
    QCOMPARE(req.path, QByteArray("/api/v2/applications/11101200001"));
    QJsonObject body = QJsonDocument::fromJson(req.body).object();
    QCOMPARE(body.value("appId").toString(), QString("11101200001"));
    QCOMPARE(body.value("action_type").toString(), QString("DEEP_LINK"));
    QCOMPARE(body.value("metaTag").toString(), QString("80057281"));
}

void TestCommandChannel::testCastFailsWhenBothPathsFail()
{
    Fixture f;
    f.pair();
    f.transport->setSendFails(true);
    f.http.respondWith(500, R"({"message":"deep link refused"})");

    std::optional<svr::OperationResult> result;
    f.commands->castToTV("Hulu", "abc", QString(), [&](const svr::OperationResult& r) { result = r; });
    QTRY_VERIFY_WITH_TIMEOUT(result.has_value(), 5000);
    QVERIFY(!result->success);
    QCOMPARE(result->error, svr::ErrorCode::NetworkError);
    QCOMPARE(result->message, QString("deep link refused"));
}

void TestCommandChannel::testAvailableKeys()
{
    QStringList keys = svr::CommandChannel::availableKeys();
    QVERIFY(keys.contains("KEY_POWER"));
    QVERIFY(keys.contains("KEY_SMART_HUB"));
    QVERIFY(keys.contains("KEY_ENTER"));
}

QTEST_MAIN(TestCommandChannel)
#include "test_command_channel.moc"
