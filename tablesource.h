#ifndef TABLESOURCE_H
#define TABLESOURCE_H

#include <QMutex>
#include <QStringList>
#include <QHash>
#include "tabularsource.h"

class QSqlError;

/**
 * TableSource
 * -----------
 * Una tabla de una base SQLite (QtSql / QSQLITE). El orden, el filtro y la ventana
 * se resuelven en SQL:
 *
 *   SELECT * FROM "t" [WHERE CAST("c" AS TEXT) LIKE ? ESCAPE '\' OR ...]
 *   ORDER BY ("c" IS NULL), "c" ASC|DESC, rowid LIMIT ? OFFSET ?
 *
 * Las columnas temporales sólo se ordenan en SQL si todos sus valores son texto
 * ISO ("yyyy-MM-dd" o "yyyy-MM-dd HH:mm..."); si no, la página se ordena en memoria.
 *
 * Las conexiones de QtSql sólo sirven en el hilo que las creó, así que cada
 * llamada abre la suya (solo lectura, con busy timeout) y la cierra al salir.
 */
class TableSource : public TabularSource {
    Q_OBJECT
public:
    TableSource(const QString& dbPath, const QString& table, QObject* parent = nullptr);
    TableSource(const QString& identity, const QString& dbPath, const QString& table,
                QObject* parent = nullptr);

    QString databasePath() const { return m_dbPath; }
    QString table() const { return m_table; }
    QString displayName() const override { return m_table; }

    bool schema(Schema& out, SourceError* err = nullptr) override;
    bool rowCount(const QString& filter, qint64& out, SourceError* err = nullptr) override;
    bool fetchPage(const PageRequest& r, PageResult& out, SourceError* err = nullptr) override;

    // Tablas de sqlite_master (sin sqlite_autoindex_*), en el orden en que las guarda SQLite.
    static bool listTables(const QString& dbPath, QStringList& out, QString* err = nullptr);

    static QString quoteIdentifier(const QString& name);
    static QString likePattern(const QString& term);

protected:
    void dropCaches() override;

private:
    class Connection;

    bool openConnection(Connection& conn, SourceError* err);
    bool ensureSchema(Connection& conn, SourceError* err);
    bool countRows(Connection& conn, const Schema& schema, const QString& filter,
                   qint64& out, SourceError* err);
    bool isoTemporalColumn(Connection& conn, const QString& column, bool& out, SourceError* err);
    bool fetchSortedInMemory(Connection& conn, const PageRequest& r, const Schema& schema,
                             bool hasRowid, const QDeadlineTimer& dl, PageResult& out,
                             SourceError* err);
    QString whereClause(const QString& filter, const Schema& schema) const;
    SourceError::Kind kindFor(const QSqlError& e) const;

    QString m_dbPath;
    QString m_table;

    QMutex m_mutex;
    bool   m_schemaLoaded = false;
    Schema m_schema;
    bool   m_hasRowid = false;
    QHash<QString, bool> m_isoTemporal;   // columna -> ¿orden nativo cronológico?
};

#endif // TABLESOURCE_H
