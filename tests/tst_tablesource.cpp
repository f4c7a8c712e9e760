#include <QtTest>
#include <QTemporaryDir>
#include <QSqlDatabase>
#include <QSqlQuery>
#include <QSqlError>
#include <QThread>
#include "tablesource.h"

static QList<int> ids(const PageResult& r) {
    QList<int> out;
    for (const Record& rec : r.rows) out << rec[0].toInt();
    return out;
}

static PageRequest request(int col, Qt::SortOrder order = Qt::AscendingOrder,
                           int page = 0, int size = 10) {
    PageRequest r;
    r.source = "people";
    r.sort.column = col;
    r.sort.order = order;
    r.pageIndex = page;
    r.pageSize = size;
    return r;
}

class TestTableSource : public QObject {
    Q_OBJECT
private slots:
    void initTestCase();

    void listTables();
    void schemaTypes();
    void rowCountAndFilter();
    void nativeOrderAndWindows();
    void sortNullsLastWithRowidTies();
    void sortText();
    void nonIsoDatesSortChronologically();
    void likeEscapesWildcards();
    void withoutRowidTable();
    void invalidSort();
    void missingTableOrDatabase();
    void closedSource();
    void quoting();
    void concurrentFetches();

private:
    QString dbPath() const { return m_dir.filePath("people.db"); }
    QTemporaryDir m_dir;
};

void TestTableSource::initTestCase() {
    QVERIFY(m_dir.isValid());
    {
        QSqlDatabase db = QSqlDatabase::addDatabase("QSQLITE", "setup");
        db.setDatabaseName(dbPath());
        QVERIFY(db.open());
        QSqlQuery q(db);
        const QStringList stmts = {
            "CREATE TABLE people(id INTEGER PRIMARY KEY, name TEXT, age INTEGER, born DATE, photo BLOB)",
            "INSERT INTO people VALUES(1, 'Ana',   30, '2020-01-01', X'01')",
            "INSERT INTO people VALUES(2, 'Luis',  NULL, '2019-05-05', NULL)",
            "INSERT INTO people VALUES(3, 'Marta', 25, NULL, NULL)",
            "INSERT INTO people VALUES(4, 'Pedro', 30, '2021-02-02', NULL)",
            "INSERT INTO people VALUES(5, 'a_b',   18, '2018-03-03', NULL)",
            "CREATE TABLE kv(k TEXT PRIMARY KEY, v INTEGER) WITHOUT ROWID",
            "INSERT INTO kv VALUES('b', 2)",
            "INSERT INTO kv VALUES('a', 1)",
        };
        for (const QString& s : stmts)
            QVERIFY2(q.exec(s), qPrintable(q.lastError().text()));
        db.close();
    }
    QSqlDatabase::removeDatabase("setup");
}

void TestTableSource::listTables() {
    QStringList tables;
    QVERIFY(TableSource::listTables(dbPath(), tables));
    QCOMPARE(tables, (QStringList{"people", "kv"}));

    QString err;
    QVERIFY(!TableSource::listTables(m_dir.filePath("missing.db"), tables, &err));
    QVERIFY(!err.isEmpty());
}

void TestTableSource::schemaTypes() {
    TableSource src(dbPath(), "people");
    QCOMPARE(src.displayName(), QStringLiteral("people"));
    QVERIFY(src.identity().startsWith(QStringLiteral("sqlite:")));
    QVERIFY(src.identity().endsWith(QStringLiteral("#people")));

    Schema s;
    QVERIFY(src.schema(s));
    QCOMPARE(s.size(), 5);
    QCOMPARE(s[0].name, QStringLiteral("id"));
    QCOMPARE(s[0].declType, QStringLiteral("INTEGER"));
    QCOMPARE(int(s[0].type), int(ColumnType::Numeric));
    QCOMPARE(int(s[1].type), int(ColumnType::Text));
    QCOMPARE(int(s[2].type), int(ColumnType::Numeric));
    QCOMPARE(int(s[3].type), int(ColumnType::Temporal));
    QCOMPARE(int(s[4].type), int(ColumnType::Blob));
}

void TestTableSource::rowCountAndFilter() {
    TableSource src(dbPath(), "people");
    qint64 n = 0;
    QVERIFY(src.rowCount(QString(), n));
    QCOMPARE(n, qint64(5));

    QVERIFY(src.rowCount(QStringLiteral("AN"), n));   // LIKE sin distinguir mayúsculas
    QCOMPARE(n, qint64(1));

    QVERIFY(src.rowCount(QStringLiteral("30"), n));
    QCOMPARE(n, qint64(2));

    PageRequest r = request(-1);
    r.filter = QStringLiteral("30");
    PageResult out;
    QVERIFY(src.fetchPage(r, out));
    QCOMPARE(ids(out), (QList<int>{1, 4}));
    QCOMPARE(out.totalRows, qint64(2));
}

void TestTableSource::nativeOrderAndWindows() {
    TableSource src(dbPath(), "people");
    PageResult r;
    QVERIFY(src.fetchPage(request(-1, Qt::AscendingOrder, 0, 2), r));
    QCOMPARE(ids(r), (QList<int>{1, 2}));
    QCOMPARE(r.totalRows, qint64(5));
    QCOMPARE(r.pageCount(), 3);

    QVERIFY(src.fetchPage(request(-1, Qt::AscendingOrder, 2, 2), r));
    QCOMPARE(ids(r), (QList<int>{5}));

    QVERIFY(src.fetchPage(request(-1, Qt::AscendingOrder, 7, 2), r));
    QVERIFY(r.rows.isEmpty());
    QCOMPARE(r.totalRows, qint64(5));
}

void TestTableSource::sortNullsLastWithRowidTies() {
    TableSource src(dbPath(), "people");
    PageResult r;
    QVERIFY(src.fetchPage(request(2, Qt::AscendingOrder), r));
    QCOMPARE(ids(r), (QList<int>{5, 3, 1, 4, 2}));

    QVERIFY(src.fetchPage(request(2, Qt::DescendingOrder), r));
    QCOMPARE(ids(r), (QList<int>{1, 4, 3, 5, 2}));

    QVERIFY(src.fetchPage(request(3, Qt::DescendingOrder), r));
    QCOMPARE(ids(r), (QList<int>{4, 1, 2, 5, 3}));
    QCOMPARE(r.rows[0][3].toDate(), QDate(2021, 2, 2));
}

void TestTableSource::sortText() {
    TableSource src(dbPath(), "people");
    PageResult r;
    QVERIFY(src.fetchPage(request(1, Qt::AscendingOrder), r));
    // colación BINARY: mayúsculas antes que minúsculas
    QCOMPARE(ids(r), (QList<int>{1, 2, 3, 4, 5}));
    QCOMPARE(r.rows[0][4].toByteArray(), QByteArray("\x01", 1));
}

void TestTableSource::nonIsoDatesSortChronologically() {
    const QString path = m_dir.filePath("events.db");
    {
        QSqlDatabase db = QSqlDatabase::addDatabase("QSQLITE", "events_setup");
        db.setDatabaseName(path);
        QVERIFY(db.open());
        QSqlQuery q(db);
        const QStringList stmts = {
            "CREATE TABLE events(id INTEGER PRIMARY KEY, name TEXT, at DATE)",
            "INSERT INTO events VALUES(1, 'alta',   '05/03/2020')",
            "INSERT INTO events VALUES(2, 'baja',   '01/12/2021')",
            "INSERT INTO events VALUES(3, 'cambio', '15/07/2019')",
            "INSERT INTO events VALUES(4, 'nada',   NULL)",
            "INSERT INTO events VALUES(5, 'otro',   '2020-06-01')",
        };
        for (const QString& s : stmts)
            QVERIFY2(q.exec(s), qPrintable(q.lastError().text()));
        db.close();
    }
    QSqlDatabase::removeDatabase("events_setup");

    TableSource src(path, "events");
    PageResult r;
    PageRequest req = request(2, Qt::AscendingOrder);
    req.source = "events";
    QVERIFY(src.fetchPage(req, r));
    QCOMPARE(ids(r), (QList<int>{3, 1, 5, 2, 4}));
    QCOMPARE(r.totalRows, qint64(5));
    QCOMPARE(r.rows[0][2].toDate(), QDate(2019, 7, 15));

    req.sort.order = Qt::DescendingOrder;
    QVERIFY(src.fetchPage(req, r));
    QCOMPARE(ids(r), (QList<int>{2, 5, 1, 3, 4}));

    // ventana y filtro sobre el orden en memoria
    req = request(2, Qt::AscendingOrder, 1, 2);
    req.source = "events";
    QVERIFY(src.fetchPage(req, r));
    QCOMPARE(ids(r), (QList<int>{5, 2}));
    QCOMPARE(r.totalRows, qint64(5));

    req = request(2, Qt::AscendingOrder);
    req.source = "events";
    req.filter = QStringLiteral("2020");
    QVERIFY(src.fetchPage(req, r));
    QCOMPARE(ids(r), (QList<int>{1, 5}));
    QCOMPARE(r.totalRows, qint64(2));
}

void TestTableSource::likeEscapesWildcards() {
    QCOMPARE(TableSource::likePattern(QStringLiteral("ab")), QStringLiteral("%ab%"));
    QCOMPARE(TableSource::likePattern(QStringLiteral("5%_\\")), QStringLiteral("%5\\%\\_\\\\%"));

    TableSource src(dbPath(), "people");
    qint64 n = 0;
    QVERIFY(src.rowCount(QStringLiteral("_"), n));
    QCOMPARE(n, qint64(1));   // sólo "a_b"
    QVERIFY(src.rowCount(QStringLiteral("%"), n));
    QCOMPARE(n, qint64(0));
}

void TestTableSource::withoutRowidTable() {
    TableSource src(dbPath(), "kv");
    PageResult r;
    QVERIFY(src.fetchPage(request(1, Qt::DescendingOrder), r));
    QCOMPARE(r.rows.size(), 2);
    QCOMPARE(r.rows[0][0].toString(), QStringLiteral("b"));
    QCOMPARE(r.rows[1][0].toString(), QStringLiteral("a"));
}

void TestTableSource::invalidSort() {
    TableSource src(dbPath(), "people");
    PageResult r;
    SourceError err;
    QVERIFY(!src.fetchPage(request(4), r, &err));   // blob
    QCOMPARE(err.kind, SourceError::Kind::InvalidSort);

    err = SourceError();
    QVERIFY(!src.fetchPage(request(12), r, &err));
    QCOMPARE(err.kind, SourceError::Kind::InvalidSort);
}

void TestTableSource::missingTableOrDatabase() {
    SourceError err;
    Schema s;
    TableSource noTable(dbPath(), "nope");
    QVERIFY(!noTable.schema(s, &err));
    QCOMPARE(err.kind, SourceError::Kind::SourceUnavailable);

    err = SourceError();
    TableSource noDb(m_dir.filePath("missing.db"), "people");
    qint64 n = 0;
    QVERIFY(!noDb.rowCount(QString(), n, &err));
    QCOMPARE(err.kind, SourceError::Kind::SourceUnavailable);
}

void TestTableSource::closedSource() {
    TableSource src(dbPath(), "people");
    src.close();
    PageResult r;
    SourceError err;
    QVERIFY(!src.fetchPage(request(-1), r, &err));
    QCOMPARE(err.kind, SourceError::Kind::SourceUnavailable);
}

void TestTableSource::quoting() {
    QCOMPARE(TableSource::quoteIdentifier(QStringLiteral("a\"b")), QStringLiteral("\"a\"\"b\""));
}

void TestTableSource::concurrentFetches() {
    TableSource src(dbPath(), "people");
    QAtomicInt failures(0);
    QList<QThread*> threads;
    for (int t = 0; t < 4; ++t) {
        threads << QThread::create([&src, &failures, t]() {
            for (int i = 0; i < 20; ++i) {
                PageResult r;
                const int col = (t % 2) ? 2 : -1;
                if (!src.fetchPage(request(col, Qt::AscendingOrder, 0, 5), r) || r.rows.size() != 5)
                    failures.ref();
            }
        });
    }
    for (QThread* th : threads) th->start();
    for (QThread* th : threads) {
        QVERIFY(th->wait(30000));
        delete th;
    }
    QCOMPARE(failures.loadRelaxed(), 0);
}

QTEST_GUILESS_MAIN(TestTableSource)
#include "tst_tablesource.moc"
