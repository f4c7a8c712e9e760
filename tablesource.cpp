#include "tablesource.h"
#include "pageplanner.h"

#include <QSqlDatabase>
#include <QSqlQuery>
#include <QSqlError>
#include <QFileInfo>
#include <QAtomicInteger>
#include <QMutexLocker>
#include <QDebug>

#include <algorithm>

static QAtomicInteger<quint64> s_connectionSerial{0};

/* ===================== Conexión por llamada (RAII) ===================== */
class TableSource::Connection {
public:
    Connection(const QString& path, int busyTimeoutMs)
        : m_name(QStringLiteral("pagebrowser_%1").arg(s_connectionSerial.fetchAndAddRelaxed(1)))
    {
        m_db = QSqlDatabase::addDatabase(QStringLiteral("QSQLITE"), m_name);
        m_db.setDatabaseName(path);
        QString opts = QStringLiteral("QSQLITE_OPEN_READONLY");
        if (busyTimeoutMs > 0) opts += QStringLiteral(";QSQLITE_BUSY_TIMEOUT=%1").arg(busyTimeoutMs);
        m_db.setConnectOptions(opts);
    }

    ~Connection() {
        if (m_db.isOpen()) m_db.close();
        m_db = QSqlDatabase();              // soltar la referencia antes de quitarla
        QSqlDatabase::removeDatabase(m_name);
    }

    Connection(const Connection&) = delete;
    Connection& operator=(const Connection&) = delete;

    bool open() { return m_db.open(); }
    QSqlDatabase& db() { return m_db; }

private:
    QString      m_name;
    QSqlDatabase m_db;
};

/* ============================ TableSource ============================ */

TableSource::TableSource(const QString& dbPath, const QString& table, QObject* parent)
    : TableSource(QStringLiteral("sqlite:%1#%2").arg(QFileInfo(dbPath).absoluteFilePath(), table),
                  dbPath, table, parent) {}

TableSource::TableSource(const QString& identity, const QString& dbPath, const QString& table,
                         QObject* parent)
    : TabularSource(identity, parent), m_dbPath(dbPath), m_table(table) {}

QString TableSource::quoteIdentifier(const QString& name) {
    QString s = name;
    s.replace(u'"', QStringLiteral("\"\""));
    return u'"' + s + u'"';
}

QString TableSource::likePattern(const QString& term) {
    QString s;
    s.reserve(term.size() + 2);
    s += u'%';
    for (const QChar c : term) {
        if (c == u'\\' || c == u'%' || c == u'_') s += u'\\';
        s += c;
    }
    s += u'%';
    return s;
}

SourceError::Kind TableSource::kindFor(const QSqlError& e) const {
    // SQLITE_BUSY = 5, SQLITE_LOCKED = 6
    const QString code = e.nativeErrorCode();
    if (code == QLatin1String("5") || code == QLatin1String("6")) return SourceError::Kind::Timeout;
    return SourceError::Kind::SourceUnavailable;
}

void TableSource::dropCaches() {
    QMutexLocker lk(&m_mutex);
    m_schemaLoaded = false;
    m_isoTemporal.clear();
}

bool TableSource::openConnection(Connection& conn, SourceError* err) {
    if (!QFileInfo::exists(m_dbPath))
        return fail(err, SourceError::Kind::SourceUnavailable,
                    tr("No existe la base de datos %1").arg(m_dbPath));
    if (conn.open()) return true;
    const QSqlError e = conn.db().lastError();
    qWarning() << "[pagebrowser] no se pudo abrir" << m_dbPath << ":" << e.text();
    return fail(err, kindFor(e), tr("No se pudo abrir %1: %2").arg(m_dbPath, e.text()));
}

bool TableSource::ensureSchema(Connection& conn, SourceError* err) {
    {
        QMutexLocker lk(&m_mutex);
        if (m_schemaLoaded) return true;
    }

    Schema schema;
    bool hasRowid = false;
    {
        QSqlQuery q(conn.db());
        if (!q.exec(QStringLiteral("PRAGMA table_info(%1)").arg(quoteIdentifier(m_table)))) {
            qWarning() << "[pagebrowser] table_info falló:" << q.lastError().text();
            return fail(err, kindFor(q.lastError()), q.lastError().text());
        }
        // cid, name, type, notnull, dflt_value, pk
        while (q.next()) {
            ColumnDef col;
            col.name     = q.value(1).toString();
            col.declType = q.value(2).toString();
            col.type     = TableTypes::typeFromDecl(col.declType);
            schema << col;
        }
        if (schema.isEmpty())
            return fail(err, SourceError::Kind::SourceUnavailable,
                        tr("La tabla %1 no existe en %2").arg(m_table, m_dbPath));
    }
    {
        // las tablas WITHOUT ROWID no tienen desempate implícito
        QSqlQuery q(conn.db());
        hasRowid = q.exec(QStringLiteral("SELECT rowid FROM %1 LIMIT 0").arg(quoteIdentifier(m_table)));
    }

    QMutexLocker lk(&m_mutex);
    m_schema = schema;
    m_hasRowid = hasRowid;
    m_schemaLoaded = true;
    return true;
}

QString TableSource::whereClause(const QString& filter, const Schema& schema) const {
    if (filter.isEmpty() || schema.isEmpty()) return QString();
    QStringList parts;
    for (const ColumnDef& c : schema)
        parts << QStringLiteral("CAST(%1 AS TEXT) LIKE ? ESCAPE '\\'").arg(quoteIdentifier(c.name));
    return QStringLiteral(" WHERE ") + parts.join(QStringLiteral(" OR "));
}

bool TableSource::isoTemporalColumn(Connection& conn, const QString& column, bool& out,
                                    SourceError* err)
{
    {
        QMutexLocker lk(&m_mutex);
        const auto it = m_isoTemporal.constFind(column);
        if (it != m_isoTemporal.constEnd()) { out = it.value(); return true; }
    }

    // SQLite guarda DATE como texto: sólo el formato ISO ordena igual que el calendario
    const QString col = quoteIdentifier(column);
    QSqlQuery q(conn.db());
    q.setForwardOnly(true);
    const QString sql = QStringLiteral(
        "SELECT EXISTS(SELECT 1 FROM %1 WHERE %2 IS NOT NULL AND NOT (typeof(%2) = 'text' AND ("
        "%2 GLOB '[0-9][0-9][0-9][0-9]-[0-9][0-9]-[0-9][0-9]' OR "
        "%2 GLOB '[0-9][0-9][0-9][0-9]-[0-9][0-9]-[0-9][0-9] [0-9][0-9]:*')))")
        .arg(quoteIdentifier(m_table), col);
    if (!q.exec(sql) || !q.next()) {
        qWarning() << "[pagebrowser] no se pudo revisar el formato de" << column << ":" << q.lastError().text();
        return fail(err, kindFor(q.lastError()), q.lastError().text());
    }
    out = !q.value(0).toBool();
    if (!out) qDebug() << "[pagebrowser]" << m_table << "." << column << "no es ISO; se ordena en memoria";

    QMutexLocker lk(&m_mutex);
    m_isoTemporal.insert(column, out);
    return true;
}

bool TableSource::fetchSortedInMemory(Connection& conn, const PageRequest& r, const Schema& schema,
                                      bool hasRowid, const QDeadlineTimer& dl, PageResult& out,
                                      SourceError* err)
{
    QString sql = QStringLiteral("SELECT * FROM %1%2")
                      .arg(quoteIdentifier(m_table), whereClause(r.filter, schema));
    if (hasRowid) sql += QStringLiteral(" ORDER BY rowid");

    QSqlQuery q(conn.db());
    q.setForwardOnly(true);
    q.prepare(sql);
    if (!r.filter.isEmpty()) {
        const QString pattern = likePattern(r.filter);
        for (int i = 0; i < schema.size(); ++i) q.addBindValue(pattern);
    }
    if (!q.exec()) {
        qWarning() << "[pagebrowser] SELECT falló en" << m_table << ":" << q.lastError().text();
        return fail(err, kindFor(q.lastError()), q.lastError().text());
    }

    const int width = schema.size();
    QVector<Record> rows;
    while (q.next()) {
        Record rec(width);
        for (int c = 0; c < width; ++c)
            rec[c] = TableTypes::normalizeCell(schema[c].type, q.value(c));
        rows.push_back(rec);
    }
    if (q.lastError().isValid())
        return fail(err, kindFor(q.lastError()), q.lastError().text());
    if (!checkDeadline(dl, err)) return false;

    const int col = r.sort.column;
    const ColumnType type = schema[col].type;
    const Qt::SortOrder dir = r.sort.order;
    std::stable_sort(rows.begin(), rows.end(), [&](const Record& a, const Record& b) {
        return TableTypes::lessForSort(type, dir, a[col], b[col]);
    });
    if (!checkDeadline(dl, err)) return false;

    const PagePlanner::Window w = PagePlanner::window(r);
    PageResult res;
    res.request = r;
    res.totalRows = rows.size();
    for (qint64 i = w.offset; i < rows.size() && i < w.offset + w.limit; ++i)
        res.rows.push_back(rows[int(i)]);

    out = std::move(res);
    return true;
}

bool TableSource::schema(Schema& out, SourceError* err) {
    if (!checkOpen(err)) return false;
    Connection conn(m_dbPath, options().timeoutMs);
    if (!openConnection(conn, err) || !ensureSchema(conn, err)) return false;
    QMutexLocker lk(&m_mutex);
    out = m_schema;
    return true;
}

bool TableSource::countRows(Connection& conn, const Schema& schema, const QString& filter,
                            qint64& out, SourceError* err)
{
    QSqlQuery q(conn.db());
    q.setForwardOnly(true);
    q.prepare(QStringLiteral("SELECT COUNT(*) FROM %1%2")
                  .arg(quoteIdentifier(m_table), whereClause(filter, schema)));
    if (!filter.isEmpty()) {
        const QString pattern = likePattern(filter);
        for (int i = 0; i < schema.size(); ++i) q.addBindValue(pattern);
    }
    if (!q.exec() || !q.next()) {
        qWarning() << "[pagebrowser] COUNT falló en" << m_table << ":" << q.lastError().text();
        return fail(err, kindFor(q.lastError()), q.lastError().text());
    }
    out = q.value(0).toLongLong();
    return true;
}

bool TableSource::rowCount(const QString& filter, qint64& out, SourceError* err) {
    if (!checkOpen(err)) return false;
    Connection conn(m_dbPath, options().timeoutMs);
    if (!openConnection(conn, err) || !ensureSchema(conn, err)) return false;

    Schema schema;
    {
        QMutexLocker lk(&m_mutex);
        schema = m_schema;
    }
    return countRows(conn, schema, filter, out, err);
}

bool TableSource::fetchPage(const PageRequest& r, PageResult& out, SourceError* err) {
    if (!checkOpen(err)) return false;
    const QDeadlineTimer dl = makeDeadline();
    Connection conn(m_dbPath, options().timeoutMs);
    if (!openConnection(conn, err) || !ensureSchema(conn, err)) return false;

    Schema schema;
    bool hasRowid = false;
    {
        QMutexLocker lk(&m_mutex);
        schema = m_schema;
        hasRowid = m_hasRowid;
    }
    if (!PagePlanner::validateSort(r.sort, schema, err)) return false;

    if (!r.sort.isNone() && schema[r.sort.column].type == ColumnType::Temporal) {
        bool native = true;
        if (!isoTemporalColumn(conn, schema[r.sort.column].name, native, err)) return false;
        if (!native) return fetchSortedInMemory(conn, r, schema, hasRowid, dl, out, err);
    }

    QString sql = QStringLiteral("SELECT * FROM %1%2")
                      .arg(quoteIdentifier(m_table), whereClause(r.filter, schema));
    QStringList orderBy;
    if (!r.sort.isNone()) {
        const QString col = quoteIdentifier(schema[r.sort.column].name);
        // nulos al final en ambos sentidos
        orderBy << QStringLiteral("(%1 IS NULL)").arg(col)
                << col + (r.sort.order == Qt::AscendingOrder ? QStringLiteral(" ASC")
                                                             : QStringLiteral(" DESC"));
    }
    if (hasRowid) orderBy << QStringLiteral("rowid");
    if (!orderBy.isEmpty()) sql += QStringLiteral(" ORDER BY ") + orderBy.join(QStringLiteral(", "));
    sql += QStringLiteral(" LIMIT ? OFFSET ?");

    // total con el mismo filtro
    qint64 total = 0;
    if (!countRows(conn, schema, r.filter, total, err)) return false;

    const PagePlanner::Window w = PagePlanner::window(r);
    QSqlQuery q(conn.db());
    q.setForwardOnly(true);
    q.prepare(sql);
    if (!r.filter.isEmpty()) {
        const QString pattern = likePattern(r.filter);
        for (int i = 0; i < schema.size(); ++i) q.addBindValue(pattern);
    }
    q.addBindValue(w.limit);
    q.addBindValue(w.offset);
    if (!q.exec()) {
        qWarning() << "[pagebrowser] SELECT falló en" << m_table << ":" << q.lastError().text();
        return fail(err, kindFor(q.lastError()), q.lastError().text());
    }

    PageResult res;
    res.request = r;
    res.totalRows = total;
    res.rows.reserve(w.limit);
    const int width = schema.size();
    while (q.next()) {
        Record rec(width);
        for (int c = 0; c < width; ++c)
            rec[c] = TableTypes::normalizeCell(schema[c].type, q.value(c));
        res.rows.push_back(rec);
    }
    if (q.lastError().isValid()) {
        return fail(err, kindFor(q.lastError()), q.lastError().text());
    }
    if (!checkDeadline(dl, err)) return false;

    out = std::move(res);
    return true;
}

bool TableSource::listTables(const QString& dbPath, QStringList& out, QString* err) {
    out.clear();
    if (!QFileInfo::exists(dbPath)) {
        if (err) *err = tr("No existe la base de datos %1").arg(dbPath);
        return false;
    }
    Connection conn(dbPath, 0);
    if (!conn.open()) {
        if (err) *err = tr("No se pudo abrir %1: %2").arg(dbPath, conn.db().lastError().text());
        return false;
    }
    QSqlQuery q(conn.db());
    if (!q.exec(QStringLiteral("SELECT name FROM sqlite_master WHERE type='table'"))) {
        if (err) *err = q.lastError().text();
        return false;
    }
    while (q.next()) {
        const QString name = q.value(0).toString();
        if (!name.startsWith(QLatin1String("sqlite_autoindex_"))) out << name;
    }
    return true;
}
