#include "sourcecatalog.h"
#include "tablesource.h"
#include "delimitedfilesource.h"

#include <QFileInfo>
#include <QDebug>

const char* SourceCatalog::kDelimitedEntry = "CSV file";

SourceCatalog::Kind SourceCatalog::kindForPath(const QString& path) {
    const QString ext = QFileInfo(path).suffix().toLower();
    if (ext == "db" || ext == "db3" || ext == "sqlite" || ext == "sqlite3") return Kind::Sqlite;
    if (ext == "csv" || ext == "tsv" || ext == "txt")                       return Kind::Delimited;
    if (ext == "xlsx" || ext == "xls" || ext == "ods")                      return Kind::Spreadsheet;
    return Kind::None;
}

void SourceCatalog::clear() {
    m_kind = Kind::None;
    m_path.clear();
    m_names.clear();
    m_reader.reset();
}

bool SourceCatalog::open(const QString& path, QString* err) {
    clear();

    const Kind k = kindForPath(path);
    if (k == Kind::None) {
        if (err) *err = tr("Tipo de archivo no soportado: %1").arg(QFileInfo(path).fileName());
        return false;
    }
    if (!QFileInfo::exists(path)) {
        if (err) *err = tr("No existe el archivo %1").arg(path);
        return false;
    }

    QStringList names;
    QSharedPointer<SheetReader> reader;
    switch (k) {
    case Kind::Sqlite:
        if (!TableSource::listTables(path, names, err)) return false;
        break;
    case Kind::Delimited:
        names << QString::fromLatin1(kDelimitedEntry);
        break;
    case Kind::Spreadsheet: {
        if (!m_sheetFactory) {
            if (err) *err = tr("No hay lector de hojas de cálculo para %1").arg(QFileInfo(path).fileName());
            return false;
        }
        reader = m_sheetFactory(path);
        if (!reader) {
            if (err) *err = tr("No se pudo abrir el libro %1").arg(path);
            return false;
        }
        QString why;
        names = reader->sheetNames(&why);
        if (!why.isEmpty()) {
            if (err) *err = why;
            return false;
        }
        break;
    }
    case Kind::None:
        break;
    }

    if (names.isEmpty()) {
        if (err) *err = tr("No se encontraron tablas en %1").arg(QFileInfo(path).fileName());
        return false;
    }

    m_kind = k;
    m_path = path;
    m_names = names;
    m_reader = reader;
    qDebug() << "[pagebrowser] abierto" << path << "con" << names.size() << "entradas";
    return true;
}

QSharedPointer<TabularSource> SourceCatalog::source(const QString& name, QString* err) const {
    if (!m_names.contains(name)) {
        if (err) *err = tr("No existe la entrada %1").arg(name);
        return {};
    }

    const QString abs = QFileInfo(m_path).absoluteFilePath();
    TabularSource* src = nullptr;
    switch (m_kind) {
    case Kind::Sqlite:
        src = new TableSource(QStringLiteral("sqlite:%1#%2").arg(abs, name), m_path, name);
        break;
    case Kind::Delimited: {
        auto* d = new DelimitedFileSource(QStringLiteral("csv:%1").arg(abs), m_path);
        if (QFileInfo(m_path).suffix().compare(QLatin1String("tsv"), Qt::CaseInsensitive) == 0)
            d->setDelimiter(u'\t');
        src = d;
        break;
    }
    case Kind::Spreadsheet:
        src = new SpreadsheetSource(QStringLiteral("sheet:%1#%2").arg(abs, name), m_reader, name);
        break;
    case Kind::None:
        if (err) *err = tr("No hay ningún archivo abierto");
        return {};
    }
    return QSharedPointer<TabularSource>(src, &QObject::deleteLater);
}
