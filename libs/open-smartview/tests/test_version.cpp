#include <QtTest/QtTest>
#include <osv/Version.hpp>

class TestVersion : public QObject {
    Q_OBJECT
private slots:
    void testPorts() {
        QCOMPARE(osv::PLAIN_PORT, uint16_t(8001));
        QCOMPARE(osv::SECURE_PORT, uint16_t(8002));
        QCOMPARE(osv::REST_PORT, uint16_t(8001));
    }
    void testProtocolConstants() {
        QCOMPARE(QString(osv::API_PATH), QString("/api/v2/"));
        QCOMPARE(QString(osv::REMOTE_CHANNEL), QString("samsung.remote.control"));
        QCOMPARE(osv::CLOSE_CODE_REJECTED, 1005);
        QCOMPARE(osv::HANDSHAKE_TIMEOUT_MS, 15000);
    }
};

QTEST_MAIN(TestVersion)
#include "test_version.moc"
