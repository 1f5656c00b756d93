#include <QtTest>

#include "termxfer/LogRing.hpp"

using namespace termxfer;

class TestLogRing : public QObject
{
    Q_OBJECT

private slots:
    void testNewestFirst()
    {
        LogRing ring(8);
        ring.push(LogLevel::Info, "first");
        ring.push(LogLevel::Warn, "second");
        ring.push(LogLevel::Error, "third");

        QCOMPARE(ring.size(), std::size_t(3));
        QCOMPARE(ring.records()[0].message, std::string("third"));
        QCOMPARE(ring.records()[0].level, LogLevel::Error);
        QCOMPARE(ring.records()[2].message, std::string("first"));
        QVERIFY(ring.records()[0].time >= ring.records()[2].time);
    }

    void testOldestIsEvicted()
    {
        LogRing ring(3);
        for (int i = 0; i < 5; ++i) ring.push(LogLevel::Info, "msg " + std::to_string(i));

        QCOMPARE(ring.size(), std::size_t(3));
        QCOMPARE(ring.records().front().message, std::string("msg 4"));
        QCOMPARE(ring.records().back().message, std::string("msg 2"));
    }

    void testZeroCapacityKeepsOne()
    {
        LogRing ring(0);
        QCOMPARE(ring.capacity(), std::size_t(1));
        ring.push(LogLevel::Info, "a");
        ring.push(LogLevel::Info, "b");
        QCOMPARE(ring.size(), std::size_t(1));
        QCOMPARE(ring.records().front().message, std::string("b"));
        ring.clear();
        QVERIFY(ring.empty());
    }

    void testLevelNames()
    {
        QCOMPARE(QString(logLevelName(LogLevel::Error)), QString("ERROR"));
        QCOMPARE(QString(logLevelName(LogLevel::Warn)), QString("WARN"));
        QCOMPARE(QString(logLevelName(LogLevel::Info)), QString("INFO"));
    }
};

QTEST_GUILESS_MAIN(TestLogRing)
#include "test_logring.moc"
