#include <QtTest>
#include "tabletypes.h"

class TestTableTypes : public QObject {
    Q_OBJECT
private slots:
    void typeFromDecl_data();
    void typeFromDecl();
    void normalizeNumericAndEmpty();
    void normalizeTemporal();
    void normalizeBoolean();
    void numericComparesByValue();
    void nullsLastBothDirections();
    void largeIntegersKeepPrecision();
    void nanSortsWithNulls();
    void inferFromText();
    void inferFromTypedCells();
    void searchIsCaseInsensitive();
    void noneSortsAreEqual();
    void pageCountOfResult();
    void blobText();
};

void TestTableTypes::typeFromDecl_data() {
    QTest::addColumn<QString>("decl");
    QTest::addColumn<int>("type");
    QTest::newRow("integer")   << "INTEGER"          << int(ColumnType::Numeric);
    QTest::newRow("bigint")    << "bigint"           << int(ColumnType::Numeric);
    QTest::newRow("real")      << "REAL"             << int(ColumnType::Numeric);
    QTest::newRow("double")    << "DOUBLE PRECISION" << int(ColumnType::Numeric);
    QTest::newRow("decimal")   << "DECIMAL(10,2)"    << int(ColumnType::Numeric);
    QTest::newRow("varchar")   << "VARCHAR(20)"      << int(ColumnType::Text);
    QTest::newRow("text")      << "TEXT"             << int(ColumnType::Text);
    QTest::newRow("date")      << "DATE"             << int(ColumnType::Temporal);
    QTest::newRow("datetime")  << "DATETIME"         << int(ColumnType::Temporal);
    QTest::newRow("timestamp") << "TIMESTAMP"        << int(ColumnType::Temporal);
    QTest::newRow("boolean")   << "BOOLEAN"          << int(ColumnType::Boolean);
    QTest::newRow("blob")      << "BLOB"             << int(ColumnType::Blob);
    QTest::newRow("empty")     << ""                 << int(ColumnType::Text);
}

void TestTableTypes::typeFromDecl() {
    QFETCH(QString, decl);
    QFETCH(int, type);
    QCOMPARE(int(TableTypes::typeFromDecl(decl)), type);
}

void TestTableTypes::normalizeNumericAndEmpty() {
    const QVariant i = TableTypes::normalizeCell(ColumnType::Numeric, QStringLiteral(" 42 "));
    QCOMPARE(i.metaType().id(), int(QMetaType::LongLong));
    QCOMPARE(i.toLongLong(), qlonglong(42));

    const QVariant d = TableTypes::normalizeCell(ColumnType::Numeric, QStringLiteral("3.5"));
    QCOMPARE(d.toDouble(), 3.5);

    QVERIFY(TableTypes::isNullCell(TableTypes::normalizeCell(ColumnType::Numeric, QString())));
    QVERIFY(TableTypes::isNullCell(TableTypes::normalizeCell(ColumnType::Text, QString())));
    QVERIFY(TableTypes::isNullCell(TableTypes::normalizeCell(ColumnType::Text, QVariant())));
}

void TestTableTypes::normalizeTemporal() {
    const QVariant v = TableTypes::normalizeCell(ColumnType::Temporal, QStringLiteral("2024-01-31"));
    QCOMPARE(v.toDate(), QDate(2024, 1, 31));

    const QVariant eu = TableTypes::normalizeCell(ColumnType::Temporal, QStringLiteral("05/03/2020"));
    QCOMPARE(eu.toDate(), QDate(2020, 3, 5));
}

void TestTableTypes::normalizeBoolean() {
    QCOMPARE(TableTypes::normalizeCell(ColumnType::Boolean, QStringLiteral("true")), QVariant(true));
    QCOMPARE(TableTypes::normalizeCell(ColumnType::Boolean, QStringLiteral("0")), QVariant(false));
}

void TestTableTypes::numericComparesByValue() {
    QVERIFY(TableTypes::compareCells(ColumnType::Numeric, QVariant(10), QVariant(9)) > 0);
    // como texto, "10" va antes que "9"
    QVERIFY(TableTypes::compareCells(ColumnType::Text, QStringLiteral("10"), QStringLiteral("9")) < 0);
    QCOMPARE(TableTypes::compareCells(ColumnType::Numeric, QVariant(2), QVariant(2.0)), 0);
    QVERIFY(TableTypes::compareCells(ColumnType::Temporal, QDate(2020, 1, 1), QDate(2019, 12, 31)) > 0);
    QVERIFY(TableTypes::compareCells(ColumnType::Boolean, false, true) < 0);
}

void TestTableTypes::nullsLastBothDirections() {
    const QVariant null;
    const QVariant one(1);
    QVERIFY(TableTypes::lessForSort(ColumnType::Numeric, Qt::AscendingOrder, one, null));
    QVERIFY(!TableTypes::lessForSort(ColumnType::Numeric, Qt::AscendingOrder, null, one));
    QVERIFY(TableTypes::lessForSort(ColumnType::Numeric, Qt::DescendingOrder, one, null));
    QVERIFY(!TableTypes::lessForSort(ColumnType::Numeric, Qt::DescendingOrder, null, one));
    QVERIFY(!TableTypes::lessForSort(ColumnType::Numeric, Qt::AscendingOrder, null, null));

    QVERIFY(TableTypes::lessForSort(ColumnType::Numeric, Qt::DescendingOrder, QVariant(5), QVariant(1)));
}

void TestTableTypes::largeIntegersKeepPrecision() {
    const qint64 big = Q_INT64_C(9007199254740993);     // 2^53 + 1
    const qint64 below = Q_INT64_C(9007199254740992);   // 2^53
    QVERIFY(TableTypes::compareCells(ColumnType::Numeric, QVariant(big), QVariant(below)) > 0);
    QVERIFY(TableTypes::compareCells(ColumnType::Numeric, QVariant(below), QVariant(big)) < 0);
    QVERIFY(TableTypes::compareCells(ColumnType::Numeric, QStringLiteral("9007199254740993"),
                                     QStringLiteral("9007199254740992")) > 0);
    // entero contra double: 2^53 como double no es igual a 2^53 + 1
    QVERIFY(TableTypes::compareCells(ColumnType::Numeric, QVariant(big), QVariant(9007199254740992.0)) > 0);
    QCOMPARE(TableTypes::compareCells(ColumnType::Numeric, QVariant(below), QVariant(9007199254740992.0)), 0);
    QVERIFY(TableTypes::compareCells(ColumnType::Numeric, QVariant(3), QVariant(3.5)) < 0);
    QVERIFY(TableTypes::compareCells(ColumnType::Numeric, QVariant(-3), QVariant(-3.5)) > 0);
}

void TestTableTypes::nanSortsWithNulls() {
    const QVariant nan(qQNaN());
    const QVariant one(1), five(5.0);

    // NaN va después de todo número y es igual a sí mismo
    QVERIFY(TableTypes::compareCells(ColumnType::Numeric, nan, one) > 0);
    QVERIFY(TableTypes::compareCells(ColumnType::Numeric, one, nan) < 0);
    QVERIFY(TableTypes::compareCells(ColumnType::Numeric, nan, five) > 0);
    QCOMPARE(TableTypes::compareCells(ColumnType::Numeric, nan, QVariant(qQNaN())), 0);

    // al ordenar queda al final en ambas direcciones, como un nulo
    QVERIFY(TableTypes::lessForSort(ColumnType::Numeric, Qt::AscendingOrder, five, nan));
    QVERIFY(!TableTypes::lessForSort(ColumnType::Numeric, Qt::AscendingOrder, nan, five));
    QVERIFY(TableTypes::lessForSort(ColumnType::Numeric, Qt::DescendingOrder, one, nan));
    QVERIFY(!TableTypes::lessForSort(ColumnType::Numeric, Qt::DescendingOrder, nan, one));
    QVERIFY(!TableTypes::lessForSort(ColumnType::Numeric, Qt::AscendingOrder, nan, QVariant()));
    QVERIFY(!TableTypes::lessForSort(ColumnType::Numeric, Qt::AscendingOrder, QVariant(), nan));
}

void TestTableTypes::inferFromText() {
    using V = QVector<QVariant>;
    QCOMPARE(int(TableTypes::inferType(V{"1", "2.5", QString(), "-3"})), int(ColumnType::Numeric));
    QCOMPARE(int(TableTypes::inferType(V{"true", "FALSE"})), int(ColumnType::Boolean));
    QCOMPARE(int(TableTypes::inferType(V{"2024-01-01", "2024-02-29"})), int(ColumnType::Temporal));
    QCOMPARE(int(TableTypes::inferType(V{"abc", "1"})), int(ColumnType::Text));
    QCOMPARE(int(TableTypes::inferType(V{QVariant(), QString()})), int(ColumnType::Text));
}

void TestTableTypes::inferFromTypedCells() {
    using V = QVector<QVariant>;
    QCOMPARE(int(TableTypes::inferType(V{QVariant(1), QVariant(2.5)})), int(ColumnType::Numeric));
    QCOMPARE(int(TableTypes::inferType(V{QVariant(QDate(2020, 1, 1)), QVariant()})), int(ColumnType::Temporal));
    QCOMPARE(int(TableTypes::inferType(V{QVariant(1), QVariant(QStringLiteral("x"))})), int(ColumnType::Text));
    QCOMPARE(int(TableTypes::inferType(V{QVariant(true), QVariant(1)})), int(ColumnType::Text));
}

void TestTableTypes::searchIsCaseInsensitive() {
    const Record r{QStringLiteral("Alice"), 30, QVariant()};
    QVERIFY(TableTypes::rowMatches(r, QStringLiteral("ali")));
    QVERIFY(TableTypes::rowMatches(r, QStringLiteral("30")));
    QVERIFY(!TableTypes::rowMatches(r, QStringLiteral("bob")));
    QVERIFY(TableTypes::rowMatches(r, QString()));
}

void TestTableTypes::noneSortsAreEqual() {
    SortSpec a;
    SortSpec b;
    b.order = Qt::DescendingOrder;
    QVERIFY(a == b);
    QCOMPARE(qHash(a), qHash(b));

    SortSpec c;
    c.column = 1;
    QVERIFY(a != c);

    PageRequest r1;
    r1.source = "s";
    PageRequest r2 = r1;
    r2.sort = b;
    QVERIFY(r1 == r2);
    QCOMPARE(qHash(r1), qHash(r2));
    r2.pageIndex = 1;
    QVERIFY(r1 != r2);
}

void TestTableTypes::pageCountOfResult() {
    PageResult r;
    r.request.pageSize = 25;
    r.totalRows = 101;
    QCOMPARE(r.pageCount(), 5);
    r.totalRows = 0;
    QCOMPARE(r.pageCount(), 0);
    r.request.pageIndex = 2;
    QCOMPARE(r.firstRow(), qint64(50));
}

void TestTableTypes::blobText() {
    QCOMPARE(TableTypes::cellText(QByteArray(3, 'x')), QStringLiteral("<3 bytes>"));
    QVERIFY(!TableTypes::isSortable(ColumnType::Blob));
    QVERIFY(TableTypes::isSortable(ColumnType::Temporal));
}

QTEST_GUILESS_MAIN(TestTableTypes)
#include "tst_tabletypes.moc"
