#include <QTest>
#include "adapters/transport/connection_pool.h"

class TestConnectionPool : public QObject {
    Q_OBJECT

private slots:
    void testReusesReleasedManager() {
        ConnectionPool pool(4);
        QNetworkAccessManager* first = pool.acquire();
        QVERIFY(first);
        QCOMPARE(pool.activeCount(), 1);

        pool.release(first);
        QCOMPARE(pool.activeCount(), 0);
        QCOMPARE(pool.idleCount(), 1);

        QNetworkAccessManager* second = pool.acquire();
        QCOMPARE(second, first);
        QCOMPARE(pool.createdCount(), 1);
        pool.release(second);
    }

    void testConcurrentAcquiresGetDistinctManagers() {
        ConnectionPool pool(4);
        QNetworkAccessManager* a = pool.acquire();
        QNetworkAccessManager* b = pool.acquire();
        QVERIFY(a != b);
        QCOMPARE(pool.activeCount(), 2);
        pool.release(a);
        pool.release(b);
        QCOMPARE(pool.idleCount(), 2);
    }

    void testOverflowIsDiscarded() {
        ConnectionPool pool(1);
        QNetworkAccessManager* a = pool.acquire();
        QNetworkAccessManager* b = pool.acquire();
        QCOMPARE(pool.createdCount(), 2);

        pool.release(a);
        QCOMPARE(pool.idleCount(), 0);
        pool.release(b);
        QCOMPARE(pool.idleCount(), 1);
    }

    void testDisabledPoolNeverReuses() {
        ConnectionPool pool(4, false);
        QVERIFY(!pool.isEnabled());
        QNetworkAccessManager* a = pool.acquire();
        pool.release(a);
        QCOMPARE(pool.idleCount(), 0);

        QNetworkAccessManager* b = pool.acquire();
        pool.release(b);
        QCOMPARE(pool.createdCount(), 2);
        QCOMPARE(pool.activeCount(), 0);
    }

    void testClearDropsEverything() {
        ConnectionPool pool(4);
        pool.release(pool.acquire());
        pool.acquire();
        pool.clear();
        QCOMPARE(pool.activeCount(), 0);
        QCOMPARE(pool.idleCount(), 0);
    }

    void testMaxSizeAtLeastOne() {
        ConnectionPool pool(0);
        QCOMPARE(pool.maxSize(), 1);
    }
};

QTEST_MAIN(TestConnectionPool)
#include "tst_connection_pool.moc"
