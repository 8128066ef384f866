#include <QtTest/QtTest>
#include <QSignalSpy>
#include <QWebSocket>
#include <QWebSocketServer>
#include <osv/Transport/WebSocketTransport.hpp>

class TestWebSocketTransport : public QObject {
    Q_OBJECT
private slots:
    void testConnectSendReceive()
    {
        QWebSocketServer server("fake-tv", QWebSocketServer::NonSecureMode);
        QVERIFY(server.listen(QHostAddress::LocalHost, 0));
        QSignalSpy newConnSpy(&server, &QWebSocketServer::newConnection);

        osv::WebSocketTransport transport;
        QSignalSpy connectedSpy(&transport, &osv::ITransport::connected);
        QSignalSpy textSpy(&transport, &osv::ITransport::textReceived);

        QUrl url(QString("ws://127.0.0.1:%1/api/v2/channels/samsung.remote.control")
                     .arg(server.serverPort()));
        transport.open(url);

        QVERIFY(newConnSpy.wait(3000));
        QWebSocket* peer = server.nextPendingConnection();
        QVERIFY(peer);
        QSignalSpy peerTextSpy(peer, &QWebSocket::textMessageReceived);

        QTRY_COMPARE(connectedSpy.count(), 1);
        QVERIFY(transport.isConnected());

        QVERIFY(transport.sendText("{\"method\":\"ms.remote.control\"}"));
        QVERIFY(peerTextSpy.wait(3000));
        QCOMPARE(peerTextSpy.at(0).at(0).toString(), QString("{\"method\":\"ms.remote.control\"}"));

        peer->sendTextMessage("{\"event\":\"ms.channel.connect\"}");
        QVERIFY(textSpy.wait(3000));
        QCOMPARE(textSpy.at(0).at(0).toString(), QString("{\"event\":\"ms.channel.connect\"}"));
    }

    void testRemoteCloseReportsCode()
    {
        QWebSocketServer server("fake-tv", QWebSocketServer::NonSecureMode);
        QVERIFY(server.listen(QHostAddress::LocalHost, 0));
        QSignalSpy newConnSpy(&server, &QWebSocketServer::newConnection);

        osv::WebSocketTransport transport;
        QSignalSpy connectedSpy(&transport, &osv::ITransport::connected);
        QSignalSpy closedSpy(&transport, &osv::ITransport::disconnected);

        transport.open(QUrl(QString("ws://127.0.0.1:%1/").arg(server.serverPort())));
        QVERIFY(newConnSpy.wait(3000));
        QWebSocket* peer = server.nextPendingConnection();
        QVERIFY(peer);
        QTRY_COMPARE(connectedSpy.count(), 1);

        peer->close(QWebSocketProtocol::CloseCodeGoingAway, "standby");
        QVERIFY(closedSpy.wait(3000));
        QCOMPARE(closedSpy.at(0).at(0).toInt(), int(QWebSocketProtocol::CloseCodeGoingAway));
        QVERIFY(!transport.isConnected());
        QVERIFY(!transport.sendText("late"));
    }

    void testConnectRefusedReportsError()
    {
        QWebSocketServer probe("port-finder", QWebSocketServer::NonSecureMode);
        QVERIFY(probe.listen(QHostAddress::LocalHost, 0));
        const quint16 port = probe.serverPort();
        probe.close();

        osv::WebSocketTransport transport;
        QSignalSpy errorSpy(&transport, &osv::ITransport::error);
        transport.open(QUrl(QString("ws://127.0.0.1:%1/").arg(port)));
        QVERIFY(errorSpy.wait(3000));
        QVERIFY(!transport.isConnected());
    }
};

QTEST_MAIN(TestWebSocketTransport)
#include "test_websocket_transport.moc"
