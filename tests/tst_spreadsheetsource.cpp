#include <QtTest>
#include <QDate>
#include "spreadsheetsource.h"

// Libro en memoria: hoja -> grilla
class FakeSheetReader : public SheetReader {
public:
    QMap<QString, QVector<QVector<QVariant>>> sheets;
    bool failReads = false;

    QStringList sheetNames(QString* err = nullptr) override {
        Q_UNUSED(err);
        return sheets.keys();
    }
    bool readSheet(const QString& sheet, QVector<QVector<QVariant>>& grid,
                   QString* err = nullptr) override {
        if (failReads || !sheets.contains(sheet)) {
            if (err) *err = QStringLiteral("lectura fallida");
            return false;
        }
        grid = sheets.value(sheet);
        return true;
    }
};

static QSharedPointer<FakeSheetReader> makeReader() {
    auto reader = QSharedPointer<FakeSheetReader>::create();
    reader->sheets["Hoja1"] = {
        {"name", QVariant(), "when", "active"},
        {"Ana",  3,          QDate(2020, 1, 1), true},
        {"Luis", 1.5,        QDate(2021, 6, 1), false},
        {"Eva",  QVariant(), QVariant(),        true},
        {"Zed"},
    };
    return reader;
}

static QStringList names(const PageResult& r) {
    QStringList out;
    for (const Record& rec : r.rows) out << rec[0].toString();
    return out;
}

static PageRequest request(int col, Qt::SortOrder order = Qt::AscendingOrder) {
    PageRequest r;
    r.source = "sheet";
    r.sort.column = col;
    r.sort.order = order;
    r.pageSize = 10;
    return r;
}

class TestSpreadsheetSource : public QObject {
    Q_OBJECT
private slots:
    void schemaFromTypedCells();
    void shortRowsArePadded();
    void sortTypedColumn();
    void readerFailure();
    void missingReader();
};

void TestSpreadsheetSource::schemaFromTypedCells() {
    SpreadsheetSource src("sheet:libro#Hoja1", makeReader(), "Hoja1");
    QCOMPARE(src.displayName(), QStringLiteral("Hoja1"));

    Schema s;
    QVERIFY(src.schema(s));
    QCOMPARE(s.size(), 4);
    QCOMPARE(s[0].name, QStringLiteral("name"));
    QCOMPARE(s[1].name, QStringLiteral("Columna 2"));
    QCOMPARE(int(s[0].type), int(ColumnType::Text));
    QCOMPARE(int(s[1].type), int(ColumnType::Numeric));
    QCOMPARE(int(s[2].type), int(ColumnType::Temporal));
    QCOMPARE(int(s[3].type), int(ColumnType::Boolean));

    qint64 n = 0;
    QVERIFY(src.rowCount(QString(), n));
    QCOMPARE(n, qint64(4));
}

void TestSpreadsheetSource::shortRowsArePadded() {
    SpreadsheetSource src("sheet:libro#Hoja1", makeReader(), "Hoja1");
    PageResult r;
    QVERIFY(src.fetchPage(request(-1), r));
    QCOMPARE(r.rows.size(), 4);
    QCOMPARE(r.rows[3].size(), 4);
    QCOMPARE(r.rows[3][0].toString(), QStringLiteral("Zed"));
    QVERIFY(TableTypes::isNullCell(r.rows[3][3]));
}

void TestSpreadsheetSource::sortTypedColumn() {
    SpreadsheetSource src("sheet:libro#Hoja1", makeReader(), "Hoja1");
    PageResult r;
    QVERIFY(src.fetchPage(request(1), r));
    QCOMPARE(names(r), (QStringList{"Luis", "Ana", "Eva", "Zed"}));
    QVERIFY(src.fetchPage(request(1, Qt::DescendingOrder), r));
    QCOMPARE(names(r), (QStringList{"Ana", "Luis", "Eva", "Zed"}));
    QVERIFY(src.fetchPage(request(2, Qt::DescendingOrder), r));
    QCOMPARE(names(r), (QStringList{"Luis", "Ana", "Eva", "Zed"}));
}

void TestSpreadsheetSource::readerFailure() {
    auto reader = makeReader();
    reader->failReads = true;
    SpreadsheetSource src("sheet:libro#Hoja1", reader, "Hoja1");
    PageResult r;
    SourceError err;
    QVERIFY(!src.fetchPage(request(-1), r, &err));
    QCOMPARE(err.kind, SourceError::Kind::SourceUnavailable);
    QVERIFY(err.message.contains(QStringLiteral("lectura fallida")));

    // la hoja se vuelve legible: el siguiente intento carga
    reader->failReads = false;
    QVERIFY(src.fetchPage(request(-1), r));
    QCOMPARE(r.totalRows, qint64(4));
}

void TestSpreadsheetSource::missingReader() {
    SpreadsheetSource src("sheet:x#y", QSharedPointer<SheetReader>(), "y");
    Schema s;
    SourceError err;
    QVERIFY(!src.schema(s, &err));
    QCOMPARE(err.kind, SourceError::Kind::SourceUnavailable);
}

QTEST_GUILESS_MAIN(TestSpreadsheetSource)
#include "tst_spreadsheetsource.moc"
