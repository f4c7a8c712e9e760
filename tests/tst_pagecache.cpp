#include <QtTest>
#include <QThread>
#include "pagecache.h"

static PageRequest req(const QString& src, int page, int col = -1) {
    PageRequest r;
    r.source = src;
    r.pageIndex = page;
    r.pageSize = 10;
    r.sort.column = col;
    return r;
}

static PageResult res(const PageRequest& r, int marker) {
    PageResult p;
    p.request = r;
    p.rows << Record{marker};
    p.totalRows = 100;
    return p;
}

class TestPageCache : public QObject {
    Q_OBJECT
private slots:
    void hitAndMiss();
    void evictsLeastRecentlyUsed();
    void putReplacesAndTouches();
    void keyIncludesSort();
    void invalidateSource();
    void shrinkCapacity();
    void concurrentAccess();
};

void TestPageCache::hitAndMiss() {
    PageCache cache(4);
    PageResult out;
    QVERIFY(!cache.get(req("a", 0), out));
    cache.put(req("a", 0), res(req("a", 0), 7));
    QVERIFY(cache.get(req("a", 0), out));
    QCOMPARE(out.rows.first().first().toInt(), 7);
    QCOMPARE(cache.stats().hits, qint64(1));
    QCOMPARE(cache.stats().misses, qint64(1));
}

void TestPageCache::evictsLeastRecentlyUsed() {
    PageCache cache(3);
    for (int p = 0; p < 3; ++p) cache.put(req("a", p), res(req("a", p), p));

    PageResult out;
    QVERIFY(cache.get(req("a", 0), out));   // 0 pasa a ser el más reciente; 1 es el LRU

    cache.put(req("a", 3), res(req("a", 3), 3));
    QCOMPARE(cache.size(), 3);
    QVERIFY(!cache.contains(req("a", 1)));
    QVERIFY(cache.contains(req("a", 0)));
    QVERIFY(cache.contains(req("a", 2)));
    QVERIFY(cache.contains(req("a", 3)));
    QCOMPARE(cache.stats().evictions, qint64(1));
}

void TestPageCache::putReplacesAndTouches() {
    PageCache cache(2);
    cache.put(req("a", 0), res(req("a", 0), 1));
    cache.put(req("a", 1), res(req("a", 1), 2));
    cache.put(req("a", 0), res(req("a", 0), 3));   // reemplaza y refresca
    cache.put(req("a", 2), res(req("a", 2), 4));   // expulsa la 1

    QCOMPARE(cache.size(), 2);
    QVERIFY(!cache.contains(req("a", 1)));
    PageResult out;
    QVERIFY(cache.get(req("a", 0), out));
    QCOMPARE(out.rows.first().first().toInt(), 3);
}

void TestPageCache::keyIncludesSort() {
    PageCache cache(8);
    cache.put(req("a", 0, 1), res(req("a", 0, 1), 1));
    QVERIFY(!cache.contains(req("a", 0)));
    QVERIFY(!cache.contains(req("a", 0, 2)));
    QVERIFY(cache.contains(req("a", 0, 1)));

    PageRequest filtered = req("a", 0, 1);
    filtered.filter = "x";
    QVERIFY(!cache.contains(filtered));
}

void TestPageCache::invalidateSource() {
    PageCache cache(10);
    for (int p = 0; p < 3; ++p) cache.put(req("a", p), res(req("a", p), p));
    cache.put(req("b", 0), res(req("b", 0), 9));

    QCOMPARE(cache.invalidateSource("a"), 3);
    QCOMPARE(cache.size(), 1);
    QVERIFY(cache.contains(req("b", 0)));
    QCOMPARE(cache.invalidateSource("a"), 0);

    // tras invalidar, las inserciones siguen respetando la capacidad
    for (int p = 0; p < 12; ++p) cache.put(req("c", p), res(req("c", p), p));
    QCOMPARE(cache.size(), 10);

    cache.clear();
    QCOMPARE(cache.size(), 0);
}

void TestPageCache::shrinkCapacity() {
    PageCache cache(5);
    for (int p = 0; p < 5; ++p) cache.put(req("a", p), res(req("a", p), p));
    cache.setCapacity(2);
    QCOMPARE(cache.capacity(), 2);
    QCOMPARE(cache.size(), 2);
    QVERIFY(cache.contains(req("a", 3)));
    QVERIFY(cache.contains(req("a", 4)));

    cache.setCapacity(0);   // mínimo 1
    QCOMPARE(cache.capacity(), 1);
    QCOMPARE(cache.size(), 1);
}

void TestPageCache::concurrentAccess() {
    PageCache cache(16);
    QList<QThread*> threads;
    for (int t = 0; t < 4; ++t) {
        threads << QThread::create([&cache, t]() {
            for (int i = 0; i < 500; ++i) {
                const PageRequest r = req(QString::number(t), i % 20);
                cache.put(r, res(r, i));
                PageResult out;
                cache.get(r, out);
                if (i % 97 == 0) cache.invalidateSource(QString::number(t));
            }
        });
    }
    for (QThread* th : threads) th->start();
    for (QThread* th : threads) {
        QVERIFY(th->wait(10000));
        delete th;
    }
    QVERIFY(cache.size() <= 16);
}

QTEST_GUILESS_MAIN(TestPageCache)
#include "tst_pagecache.moc"
