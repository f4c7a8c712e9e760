#ifndef SOURCECATALOG_H
#define SOURCECATALOG_H

#include <QCoreApplication>
#include <QSharedPointer>
#include <QStringList>
#include <functional>

#include "spreadsheetsource.h"

/**
 * SourceCatalog
 * -------------
 * Abre un archivo según su extensión y lista lo que se puede explorar:
 *   .db .db3 .sqlite .sqlite3  -> tablas de la base
 *   .csv .tsv .txt             -> una sola entrada, "CSV file"
 *   .xlsx .xls .ods            -> hojas (requiere un SheetReader registrado)
 * source(name) construye el adaptador para una entrada.
 */
class SourceCatalog {
    Q_DECLARE_TR_FUNCTIONS(SourceCatalog)
public:
    enum class Kind { None, Sqlite, Delimited, Spreadsheet };

    using SheetReaderFactory = std::function<QSharedPointer<SheetReader>(const QString& path)>;

    static const char* kDelimitedEntry;   // "CSV file"

    static Kind kindForPath(const QString& path);

    void setSheetReaderFactory(SheetReaderFactory f) { m_sheetFactory = std::move(f); }

    bool open(const QString& path, QString* err = nullptr);
    void clear();

    Kind kind() const { return m_kind; }
    QString path() const { return m_path; }
    QStringList names() const { return m_names; }

    // Adaptador nuevo para 'name'. Se destruye con deleteLater (puede soltarse en un worker).
    QSharedPointer<TabularSource> source(const QString& name, QString* err = nullptr) const;

private:
    Kind m_kind = Kind::None;
    QString m_path;
    QStringList m_names;
    SheetReaderFactory m_sheetFactory;
    QSharedPointer<SheetReader> m_reader;
};

#endif // SOURCECATALOG_H
