#include <QCoreApplication>
#include <QCommandLineParser>
#include <QFile>
#include <QTextStream>
#include <QDebug>

#include "delimitedfilesource.h"
#include "engineconfig.h"
#include "loadcoordinator.h"
#include "pagetablemodel.h"
#include "sourcecatalog.h"

// CSV por stdin -> MemorySource (tipos inferidos igual que con archivos)
static QSharedPointer<TabularSource> sourceFromStdin(QString* err) {
    QFile in;
    if (!in.open(stdin, QIODevice::ReadOnly)) {
        if (err) *err = QStringLiteral("no se pudo leer stdin");
        return {};
    }
    QVector<QStringList> recs;
    if (!DelimitedFileSource::parse(QString::fromUtf8(in.readAll()), u',', recs) || recs.isEmpty()) {
        if (err) *err = QStringLiteral("stdin no contiene un CSV válido");
        return {};
    }

    Schema schema;
    const QStringList header = recs.first();
    QVector<QVector<QVariant>> columns(header.size());
    QVector<Record> rows;
    for (int i = 1; i < recs.size(); ++i) {
        Record r(header.size());
        for (int c = 0; c < header.size() && c < recs[i].size(); ++c) {
            if (!recs[i][c].isEmpty()) r[c] = recs[i][c];
        }
        for (int c = 0; c < header.size(); ++c) columns[c].push_back(r[c]);
        rows.push_back(r);
    }
    for (int c = 0; c < header.size(); ++c) {
        ColumnDef col;
        col.name = header[c];
        col.type = TableTypes::inferType(columns[c]);
        schema << col;
    }
    auto* src = new MemorySource(QStringLiteral("stdin"), schema, rows);
    src->setDisplayName(QStringLiteral("stdin"));
    return QSharedPointer<TabularSource>(src, &QObject::deleteLater);
}

int main(int argc, char* argv[]) {
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName("pagebrowser");

    QCommandLineParser parser;
    parser.setApplicationDescription("Muestra una página de una tabla, CSV u hoja (salida TSV).");
    parser.addHelpOption();
    parser.addPositionalArgument("file", "Base SQLite, CSV, o '-' para CSV por stdin.");
    QCommandLineOption listOpt({"l", "list"}, "Lista las tablas del archivo.");
    QCommandLineOption tableOpt({"t", "table"}, "Tabla a mostrar (por defecto la primera).", "name");
    QCommandLineOption pageOpt({"p", "page"}, "Página (desde 1).", "n", "1");
    QCommandLineOption sizeOpt({"s", "page-size"}, "Filas por página.", "n");
    QCommandLineOption sortOpt("sort", "Columna de orden.", "column");
    QCommandLineOption descOpt("desc", "Orden descendente.");
    QCommandLineOption filterOpt({"f", "filter"}, "Texto a buscar en todas las columnas.", "text");
    QCommandLineOption describeOpt("describe", "Estadística descriptiva de columnas (separadas por coma).",
                                   "columns");
    QCommandLineOption configOpt("config", "Archivo de configuración JSON.", "file",
                                 QString::fromLatin1(EngineConfig::kDefaultFile));
    parser.addOptions({listOpt, tableOpt, pageOpt, sizeOpt, sortOpt, descOpt, filterOpt, describeOpt,
                       configOpt});
    parser.process(app);

    QTextStream out(stdout);
    QTextStream errOut(stderr);

    const QStringList args = parser.positionalArguments();
    if (args.size() != 1) {
        parser.showHelp(2);
    }

    EngineConfig config;
    QString err;
    if (!EngineConfig::load(parser.value(configOpt), config, &err)) {
        errOut << err << Qt::endl;
        return 2;
    }

    QSharedPointer<TabularSource> source;
    SourceCatalog catalog;
    if (args.first() == QLatin1String("-")) {
        source = sourceFromStdin(&err);
    } else {
        if (!catalog.open(args.first(), &err)) {
            errOut << err << Qt::endl;
            return 1;
        }
        if (parser.isSet(listOpt)) {
            for (const QString& n : catalog.names()) out << n << Qt::endl;
            return 0;
        }
        const QString table = parser.isSet(tableOpt) ? parser.value(tableOpt) : catalog.names().first();
        source = catalog.source(table, &err);
    }
    if (!source) {
        errOut << err << Qt::endl;
        return 1;
    }

    LoadCoordinator coordinator(config);
    PageTableModel model(&coordinator);

    bool applied = false;
    bool applying = false;   // las intenciones pueden emitir viewChanged en el acto (caché)
    bool done = false;
    auto print = [&]() {
        QStringList header;
        for (const ColumnDef& c : coordinator.schema()) header << c.name;
        out << header.join(u'\t') << Qt::endl;
        QList<int> rows;
        for (int i = 0; i < model.rowCount(); ++i) rows << i;
        if (!rows.isEmpty()) out << model.rowsAsTsv(rows) << Qt::endl;
        errOut << model.statusText() << Qt::endl;
    };

    QObject::connect(&coordinator, &LoadCoordinator::viewChanged, &app, [&](const ViewUpdate& u) {
        if (done || applying || u.status == ViewStatus::Loading) return;
        if (u.status == ViewStatus::Error) {
            done = true;
            errOut << errorKindName(u.error.kind) << ": " << u.error.message << Qt::endl;
            app.exit(1);
            return;
        }
        if (parser.isSet(describeOpt)) {
            // primera página lista: se describen las columnas pedidas y se termina
            if (applied) return;
            applied = true;
            QList<int> cols;
            const Schema schema = coordinator.schema();
            for (const QString& name : parser.value(describeOpt).split(u',', Qt::SkipEmptyParts)) {
                int col = -1;
                for (int i = 0; i < schema.size(); ++i)
                    if (schema[i].name == name.trimmed()) col = i;
                cols << col;
            }
            SourceError se;
            if (!coordinator.describeColumns(cols, &se)) {
                done = true;
                errOut << errorKindName(se.kind) << ": " << se.message << Qt::endl;
                app.exit(1);
            }
            return;
        }
        if (!applied) {
            // primera página lista: ya hay esquema para resolver --sort
            applied = true;
            applying = true;
            if (parser.isSet(filterOpt)) coordinator.setFilter(parser.value(filterOpt));
            if (parser.isSet(sortOpt)) {
                int col = -1;
                const Schema schema = coordinator.schema();
                for (int i = 0; i < schema.size(); ++i)
                    if (schema[i].name == parser.value(sortOpt)) col = i;
                SourceError se;
                if (!coordinator.setSort(col, parser.isSet(descOpt) ? Qt::DescendingOrder
                                                                    : Qt::AscendingOrder, &se)) {
                    done = true;
                    errOut << errorKindName(se.kind) << ": " << se.message << Qt::endl;
                    app.exit(1);
                    return;
                }
            }
            if (parser.isSet(sizeOpt) && !coordinator.setPageSize(parser.value(sizeOpt).toInt(), &err)) {
                done = true;
                errOut << err << Qt::endl;
                app.exit(2);
                return;
            }
            coordinator.goToPage(parser.value(pageOpt).toInt() - 1);
            applying = false;
            if (coordinator.isLoading()) return;
        }
        done = true;
        print();
        app.quit();
    });

    QObject::connect(&coordinator, &LoadCoordinator::columnsDescribed, &app,
                     [&](quint64, const QList<ColumnStats>& stats) {
        done = true;
        out << describeText(stats) << Qt::endl;
        app.quit();
    });
    QObject::connect(&coordinator, &LoadCoordinator::describeFailed, &app,
                     [&](quint64, const SourceError& e) {
        done = true;
        errOut << errorKindName(e.kind) << ": " << e.message << Qt::endl;
        app.exit(1);
    });

    coordinator.switchSource(source);
    return app.exec();
}
