#include <QtTest>
#include "core/tv/SmartQueryParser.hpp"

class TestSmartQueryParser : public QObject {
    Q_OBJECT
private slots:
    void testParse_data();
    void testParse();
    void testPriorityOrder();
    void testEmptyAndBlankInput();
};

void TestSmartQueryParser::testParse_data()
{
    QTest::addColumn<QString>("query");
    QTest::addColumn<QString>("app");
    QTest::addColumn<QString>("search");

    QTest::newRow("netflix suffix") << "play stranger things on netflix" << "Netflix" << "stranger things";
    QTest::newRow("default youtube") << "search for cat videos" << "YouTube" << "cat videos";
    QTest::newRow("disney plus") << "watch the mandalorian on disney+" << "Disney+" << "the mandalorian";
    QTest::newRow("disney no plus") << "bluey disney" << "Disney+" << "bluey";
    QTest::newRow("disney+ first") << "disney+ bluey" << "Disney+" << "bluey";
    QTest::newRow("disney plus words") << "encanto on disney plus" << "Disney+" << "encanto";
    QTest::newRow("disneyland is not disney") << "watch disneyland vlog" << "YouTube" << "disneyland vlog";
    QTest::newRow("disneyworld is not disney") << "disneyworld tour" << "YouTube" << "disneyworld tour";
    QTest::newRow("hulu") << "put on the bear on hulu" << "Hulu" << "the bear";
    QTest::newRow("on max") << "find succession on max" << "HBO Max" << "succession";
    QTest::newRow("hbo") << "HBO the last of us" << "HBO Max" << "the last of us";
    QTest::newRow("prime video") << "the boys prime video" << "Prime Video" << "the boys";
    QTest::newRow("amazon") << "look up reacher amazon" << "Prime Video" << "reacher";
    QTest::newRow("explicit youtube") << "lofi beats on youtube" << "YouTube" << "lofi beats";
    QTest::newRow("case insensitive") << "PLAY Wednesday ON NETFLIX" << "Netflix" << "Wednesday";
    QTest::newRow("verb only") << "play" << "YouTube" << "";
    QTest::newRow("trigger only") << "netflix" << "Netflix" << "";
    QTest::newRow("plain text") << "how to tie a tie" << "YouTube" << "how to tie a tie";
}

void TestSmartQueryParser::testParse()
{
    QFETCH(QString, query);
    QFETCH(QString, app);
    QFETCH(QString, search);

    svr::SmartQuery parsed = svr::parseSmartQuery(query);
    QCOMPARE(parsed.app, app);
    QCOMPARE(parsed.search, search);
}

void TestSmartQueryParser::testPriorityOrder()
{
    // Netflix outranks YouTube even when YouTube appears first
    svr::SmartQuery parsed = svr::parseSmartQuery("youtube trailer for netflix show");
    QCOMPARE(parsed.app, QString("Netflix"));
}

void TestSmartQueryParser::testEmptyAndBlankInput()
{
    svr::SmartQuery empty = svr::parseSmartQuery(QString());
    QCOMPARE(empty.app, QString("YouTube"));
    QVERIFY(empty.search.isEmpty());

    svr::SmartQuery blank = svr::parseSmartQuery("   ");
    QCOMPARE(blank.app, QString("YouTube"));
    QVERIFY(blank.search.isEmpty());
}

QTEST_MAIN(TestSmartQueryParser)
#include "test_smart_query_parser.moc"
