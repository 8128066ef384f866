#include <QtTest>
#include <QElapsedTimer>
#include <QSignalSpy>
#include "core/tv/AutomationSequence.hpp"

class TestAutomationSequence : public QObject {
    Q_OBJECT
private slots:
    void testRunsStepsInOrderWithDelays();
    void testEmptySequenceFinishesImmediately();
    void testCancelBetweenSteps();
    void testCancelFromInsideStep();
    void testStartWhileRunningIsIgnored();
};

void TestAutomationSequence::testRunsStepsInOrderWithDelays()
{
    svr::AutomationSequence seq;
    QStringList ran;
    seq.addStep("a", [&]() { ran << "a"; }, 30);
    seq.addStep("b", [&]() { ran << "b"; }, 30);
    seq.addStep("c", [&]() { ran << "c"; });
    QCOMPARE(seq.stepCount(), 3);

    QSignalSpy stepSpy(&seq, &svr::AutomationSequence::stepExecuted);
    QSignalSpy finishedSpy(&seq, &svr::AutomationSequence::finished);

    QElapsedTimer clock;
    clock.start();
    seq.start();

    // First step runs synchronously
    QCOMPARE(ran, QStringList{"a"});
    QVERIFY(seq.isRunning());

    QVERIFY(finishedSpy.wait(2000));
    QVERIFY(clock.elapsed() >= 55);
    QCOMPARE(ran, (QStringList{"a", "b", "c"}));
    QCOMPARE(stepSpy.count(), 3);
    QCOMPARE(stepSpy.at(2).at(0).toInt(), 2);
    QCOMPARE(stepSpy.at(2).at(1).toString(), QString("c"));
    QVERIFY(!seq.isRunning());
}

void TestAutomationSequence::testEmptySequenceFinishesImmediately()
{
    svr::AutomationSequence seq;
    QSignalSpy finishedSpy(&seq, &svr::AutomationSequence::finished);
    seq.start();
    QCOMPARE(finishedSpy.count(), 1);
    QVERIFY(!seq.isRunning());
}

void TestAutomationSequence::testCancelBetweenSteps()
{
    svr::AutomationSequence seq;
    int runs = 0;
    seq.addStep("first", [&]() { ++runs; }, 5000);
    seq.addStep("second", [&]() { ++runs; });

    QSignalSpy cancelledSpy(&seq, &svr::AutomationSequence::cancelled);
    QSignalSpy finishedSpy(&seq, &svr::AutomationSequence::finished);
    seq.start();
    seq.cancel();

    QCOMPARE(cancelledSpy.count(), 1);
    QTest::qWait(50);
    QCOMPARE(runs, 1);
    QCOMPARE(finishedSpy.count(), 0);

    // Cancelling again is harmless
    seq.cancel();
    QCOMPARE(cancelledSpy.count(), 1);
}

void TestAutomationSequence::testCancelFromInsideStep()
{
    svr::AutomationSequence seq;
    int runs = 0;
    seq.addStep("stop", [&]() { ++runs; seq.cancel(); }, 1);
    seq.addStep("never", [&]() { ++runs; });

    QSignalSpy finishedSpy(&seq, &svr::AutomationSequence::finished);
    seq.start();
    QTest::qWait(30);
    QCOMPARE(runs, 1);
    QCOMPARE(finishedSpy.count(), 0);
}

void TestAutomationSequence::testStartWhileRunningIsIgnored()
{
    svr::AutomationSequence seq;
    int runs = 0;
    seq.addStep("one", [&]() { ++runs; }, 20);
    seq.addStep("two", [&]() { ++runs; });

    QSignalSpy finishedSpy(&seq, &svr::AutomationSequence::finished);
    seq.start();
    seq.start();
    QVERIFY(finishedSpy.wait(2000));
    QCOMPARE(runs, 2);
}

QTEST_MAIN(TestAutomationSequence)
#include "test_automation_sequence.moc"
