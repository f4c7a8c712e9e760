#include "memorysource.h"
#include "pageplanner.h"

#include <QMutexLocker>
#include <QDebug>
#include <algorithm>

static constexpr int kDeadlineStride = 4096;   // cada cuántas filas se mira el plazo

/* ============================ MemorySortedSource ============================ */

void MemorySortedSource::dropCaches() {
    // sin lock: un worker puede estar ordenando; la próxima llamada recarga
    m_generation.ref();
}

bool MemorySortedSource::ensureLoadedLocked(const QDeadlineTimer& dl, SourceError* err) {
    const int gen = m_generation.loadAcquire();
    if (m_loaded && m_loadedGeneration == gen) return true;

    Schema schema;
    QVector<Record> rows;
    if (!loadRows(schema, rows, dl, err)) return false;

    // todas las filas con el ancho del esquema
    const int width = schema.size();
    for (Record& r : rows) {
        if (r.size() != width) r.resize(width);
    }

    m_schema = schema;
    m_rows = std::move(rows);
    m_loaded = true;
    m_loadedGeneration = gen;
    m_orderValid = false;
    qDebug() << "[pagebrowser]" << identity() << "cargada:" << m_rows.size() << "filas,"
             << m_schema.size() << "columnas";
    return true;
}

bool MemorySortedSource::orderLocked(const SortSpec& sort, const QString& filter,
                                     const QDeadlineTimer& dl, SourceError* err)
{
    if (m_orderValid && m_orderSort == sort && m_orderFilter == filter) return true;

    QVector<int> order;
    order.reserve(m_rows.size());
    for (int i = 0; i < m_rows.size(); ++i) {
        if ((i % kDeadlineStride) == 0 && !checkDeadline(dl, err)) return false;
        if (TableTypes::rowMatches(m_rows[i], filter)) order.push_back(i);
    }

    if (!sort.isNone()) {
        const int col = sort.column;
        const ColumnType type = m_schema[col].type;
        const Qt::SortOrder dir = sort.order;
        const QVector<Record>& rows = m_rows;
        std::stable_sort(order.begin(), order.end(), [&](int a, int b) {
            return TableTypes::lessForSort(type, dir, rows[a][col], rows[b][col]);
        });
    }
    if (!checkDeadline(dl, err)) return false;

    m_order = std::move(order);
    m_orderSort = sort;
    m_orderFilter = filter;
    m_orderValid = true;
    return true;
}

bool MemorySortedSource::schema(Schema& out, SourceError* err) {
    if (!checkOpen(err)) return false;
    QMutexLocker lk(&m_mutex);
    if (!ensureLoadedLocked(makeDeadline(), err)) return false;
    out = m_schema;
    return true;
}

bool MemorySortedSource::rowCount(const QString& filter, qint64& out, SourceError* err) {
    if (!checkOpen(err)) return false;
    const QDeadlineTimer dl = makeDeadline();
    QMutexLocker lk(&m_mutex);
    if (!ensureLoadedLocked(dl, err)) return false;

    if (filter.isEmpty()) { out = m_rows.size(); return true; }
    if (m_orderValid && m_orderFilter == filter) { out = m_order.size(); return true; }

    qint64 n = 0;
    for (int i = 0; i < m_rows.size(); ++i) {
        if ((i % kDeadlineStride) == 0 && !checkDeadline(dl, err)) return false;
        if (TableTypes::rowMatches(m_rows[i], filter)) ++n;
    }
    out = n;
    return true;
}

bool MemorySortedSource::fetchPage(const PageRequest& r, PageResult& out, SourceError* err) {
    if (!checkOpen(err)) return false;
    const QDeadlineTimer dl = makeDeadline();
    QMutexLocker lk(&m_mutex);
    if (!ensureLoadedLocked(dl, err)) return false;
    if (!PagePlanner::validateSort(r.sort, m_schema, err)) return false;
    if (!orderLocked(r.sort, r.filter, dl, err)) return false;

    const PagePlanner::Window w = PagePlanner::window(r);
    PageResult res;
    res.request = r;
    res.totalRows = m_order.size();
    if (w.offset < m_order.size()) {
        const int first = int(w.offset);
        const int last = int(std::min<qint64>(w.offset + w.limit, m_order.size()));
        res.rows.reserve(last - first);
        for (int i = first; i < last; ++i) res.rows.push_back(m_rows[m_order[i]]);
    }
    out = std::move(res);
    return true;
}

/* ============================ MemorySource ============================ */

MemorySource::MemorySource(const QString& identity, const Schema& schema,
                           const QVector<Record>& rows, QObject* parent)
    : MemorySortedSource(identity, parent), m_dataSchema(schema), m_dataRows(rows) {}

QString MemorySource::displayName() const {
    QMutexLocker lk(&m_dataMutex);
    return m_name.isEmpty() ? identity() : m_name;
}

void MemorySource::setDisplayName(const QString& name) {
    QMutexLocker lk(&m_dataMutex);
    m_name = name;
}

void MemorySource::setRows(const QVector<Record>& rows) {
    {
        QMutexLocker lk(&m_dataMutex);
        m_dataRows = rows;
    }
    markMutated();
}

void MemorySource::setData(const Schema& schema, const QVector<Record>& rows) {
    {
        QMutexLocker lk(&m_dataMutex);
        m_dataSchema = schema;
        m_dataRows = rows;
    }
    markMutated();
}

bool MemorySource::loadRows(Schema& schema, QVector<Record>& rows,
                            const QDeadlineTimer& deadline, SourceError* err)
{
    {
        QMutexLocker lk(&m_dataMutex);
        schema = m_dataSchema;
        rows = m_dataRows;
    }
    for (int i = 0; i < rows.size(); ++i) {
        if ((i % kDeadlineStride) == 0 && !checkDeadline(deadline, err)) return false;
        Record& r = rows[i];
        const int n = std::min<int>(r.size(), schema.size());
        for (int c = 0; c < n; ++c)
            r[c] = TableTypes::normalizeCell(schema[c].type, r[c]);
    }
    return true;
}
