#include "loadcoordinator.h"
#include "pageplanner.h"
#include "delimitedfilesource.h"

#include <QMetaObject>
#include <QDebug>
#include <algorithm>
#include <limits>

static const int kDescribeChunk = 1000;   // filas por lectura al describir columnas

static bool failWith(SourceError* err, SourceError::Kind kind, const QString& msg) {
    if (err) *err = SourceError::make(kind, msg);
    return false;
}

LoadCoordinator::LoadCoordinator(const EngineConfig& config, QObject* parent)
    : QObject(parent), m_config(config), m_cache(config.cacheCapacity)
{
    qRegisterMetaType<ViewUpdate>("ViewUpdate");
    qRegisterMetaType<Schema>("Schema");
    qRegisterMetaType<SourceError>("SourceError");
    qRegisterMetaType<QList<ColumnStats>>("QList<ColumnStats>");

    m_pool.setMaxThreadCount(m_config.effectiveWorkerThreads());

    PageRequest d;
    d.pageSize = std::max(m_config.defaultPageSize, 1);
    m_state.reset(d);
}

LoadCoordinator::~LoadCoordinator() {
    // los workers en vuelo ven el id 0 y terminan en el siguiente punto de control
    m_latestId.storeRelease(0);
    m_latestDescribeId.storeRelease(0);
    m_pool.clear();
    m_pool.waitForDone();
}

/* ============================ Consultas ============================ */

qint64 LoadCoordinator::knownRowCount() const {
    if (m_knownRows < 0 || m_knownRowsFilter != m_state.desiredRequest().filter) return -1;
    return m_knownRows;
}

int LoadCoordinator::pageSize() const {
    return m_state.desiredRequest().pageSize;
}

bool LoadCoordinator::isLoading() const {
    return m_state.status() == ViewStatus::Loading;
}

/* ============================ Fuente ============================ */

void LoadCoordinator::switchSource(QSharedPointer<TabularSource> source) {
    if (m_source) {
        disconnect(m_source.data(), nullptr, this, nullptr);
        // la fuente anterior deja de vigilar su archivo
        if (m_source != source) {
            if (auto* file = qobject_cast<DelimitedFileSource*>(m_source.data()))
                file->setWatchFile(false);
        }
    }

    m_source = source;
    m_schema.clear();
    m_schemaKnown = false;
    m_knownRows = -1;
    m_knownRowsFilter.clear();
    ++m_epoch;

    // el tamaño de página se conserva; orden, filtro y página vuelven al inicio
    PageRequest d;
    d.pageSize = pageSize();
    d.source = m_source ? m_source->identity() : QString();
    m_latestId.storeRelease(0);
    m_latestDescribeId.storeRelease(0);
    m_state.reset(d);
    emit schemaChanged(m_schema);

    if (!m_source) {
        emit viewChanged(ViewUpdate());
        return;
    }

    SourceOptions opts;
    opts.timeoutMs = m_config.fetchTimeoutMs;
    m_source->setOptions(opts);
    if (m_config.watchFiles) {
        if (auto* file = qobject_cast<DelimitedFileSource*>(m_source.data()))
            file->setWatchFile(true);
    }
    connect(m_source.data(), &TabularSource::mutated, this, &LoadCoordinator::onSourceMutated);

    qDebug() << "[pagebrowser] fuente activa:" << m_source->identity();
    dispatch(d);
}

void LoadCoordinator::closeSource() {
    if (!m_source) return;
    const QString id = m_source->identity();
    disconnect(m_source.data(), nullptr, this, nullptr);
    if (auto* file = qobject_cast<DelimitedFileSource*>(m_source.data()))
        file->setWatchFile(false);
    m_source->close();
    m_cache.invalidateSource(id);
    m_source.reset();
    m_schema.clear();
    m_schemaKnown = false;
    m_knownRows = -1;
    ++m_epoch;

    PageRequest d;
    d.pageSize = pageSize();
    m_latestId.storeRelease(0);
    m_latestDescribeId.storeRelease(0);
    m_state.reset(d);
    qDebug() << "[pagebrowser] fuente cerrada:" << id;
    emit schemaChanged(m_schema);
    emit viewChanged(ViewUpdate());
}

void LoadCoordinator::invalidateCurrentSource() {
    m_cache.invalidateSource(m_source->identity());
    ++m_epoch;
    m_knownRows = -1;
    m_knownRowsFilter.clear();
    m_schemaKnown = false;
}

void LoadCoordinator::onSourceMutated(const QString& identity) {
    if (!m_source || identity != m_source->identity()) return;
    qDebug() << "[pagebrowser] la fuente cambió:" << identity;
    invalidateCurrentSource();
    if (m_config.reloadOnMutation) dispatch(m_state.desiredRequest());
}

/* ============================ Intenciones ============================ */

bool LoadCoordinator::setSort(int column, Qt::SortOrder order, SourceError* err) {
    if (!m_source)
        return failWith(err, SourceError::Kind::SourceUnavailable, tr("No hay ninguna fuente abierta"));

    SortSpec s;
    s.column = column;
    s.order = order;
    if (column < 0)
        return failWith(err, SourceError::Kind::InvalidSort, tr("Columna de orden inválida: %1").arg(column));
    // con esquema conocido se rechaza aquí mismo, sin lanzar nada
    if (m_schemaKnown && !PagePlanner::validateSort(s, m_schema, err)) {
        qWarning() << "[pagebrowser] orden rechazado, columna" << column;
        return false;
    }

    PageRequest d = m_state.desiredRequest();
    d.sort = s;
    d.pageIndex = 0;
    dispatch(d);
    return true;
}

void LoadCoordinator::clearSort() {
    PageRequest d = m_state.desiredRequest();
    d.sort = SortSpec::none();
    d.pageIndex = 0;
    dispatch(d);
}

bool LoadCoordinator::cycleSort(int column, SourceError* err) {
    const SortSpec cur = m_state.desiredRequest().sort;
    if (cur.isNone() || cur.column != column) return setSort(column, Qt::AscendingOrder, err);
    if (cur.order == Qt::AscendingOrder)    return setSort(column, Qt::DescendingOrder, err);
    clearSort();
    return true;
}

void LoadCoordinator::goToPage(int index) {
    PageRequest d = m_state.desiredRequest();
    d.pageIndex = index;
    dispatch(d);
}

void LoadCoordinator::nextPage() {
    PageRequest d = m_state.desiredRequest();
    if (d.pageIndex < std::numeric_limits<int>::max()) ++d.pageIndex;
    dispatch(d);
}

void LoadCoordinator::previousPage() {
    PageRequest d = m_state.desiredRequest();
    --d.pageIndex;
    dispatch(d);
}

void LoadCoordinator::firstPage() {
    goToPage(0);
}

void LoadCoordinator::lastPage() {
    const qint64 known = knownRowCount();
    const int pc = PagePlanner::pageCount(known, pageSize());
    // sin conteo, el worker recorta con el total real
    goToPage(known >= 0 ? std::max(pc - 1, 0) : std::numeric_limits<int>::max());
}

bool LoadCoordinator::setPageSize(int size, QString* err) {
    if (!PagePlanner::validatePageSize(size, err)) return false;
    if (!m_config.isRecognizedPageSize(size))
        qDebug() << "[pagebrowser] tamaño de página personalizado:" << size;

    PageRequest d = m_state.desiredRequest();
    d.pageIndex = PagePlanner::anchoredPageIndex(d.pageIndex, d.pageSize, size);
    d.pageSize = size;
    if (!m_source) {
        m_state.reset(d);
        return true;
    }
    dispatch(d);
    return true;
}

void LoadCoordinator::setFilter(const QString& text) {
    PageRequest d = m_state.desiredRequest();
    if (d.filter == text) return;
    d.filter = text;
    d.pageIndex = 0;
    dispatch(d);
}

void LoadCoordinator::refresh() {
    if (!m_source) return;
    qDebug() << "[pagebrowser] refresh:" << m_source->identity();
    m_source->discardCachedData();
    invalidateCurrentSource();
    dispatch(m_state.desiredRequest());
}

void LoadCoordinator::retry() {
    dispatch(m_state.desiredRequest());
}

quint64 LoadCoordinator::describeColumns(const QList<int>& columns, SourceError* err) {
    if (!m_source) {
        failWith(err, SourceError::Kind::SourceUnavailable, tr("No hay ninguna fuente abierta"));
        return 0;
    }
    if (columns.isEmpty()) {
        failWith(err, SourceError::Kind::InvalidSort, tr("No se eligió ninguna columna"));
        return 0;
    }
    for (int c : columns) {
        if (c < 0 || (m_schemaKnown && c >= m_schema.size())) {
            failWith(err, SourceError::Kind::InvalidSort, tr("Columna inválida: %1").arg(c));
            return 0;
        }
    }

    const quint64 id = m_nextId.fetchAndAddOrdered(1) + 1;
    m_latestDescribeId.storeRelease(id);
    qDebug() << "[pagebrowser] describir" << id << "columnas" << columns;

    QSharedPointer<TabularSource> src = m_source;
    const Schema knownSchema = m_schema;
    const bool needSchema = !m_schemaKnown;
    const quint64 epoch = m_epoch;
    m_pool.start([this, src, columns, knownSchema, needSchema, id, epoch]() {
        const DescribeOutcome o = runDescribe(src, columns, knownSchema, needSchema, id, epoch);
        QMetaObject::invokeMethod(this, [this, id, o]() { finishDescribe(id, o); }, Qt::QueuedConnection);
    });
    return id;
}

quint64 LoadCoordinator::requestChange(const PageRequest& desired) {
    return dispatch(desired);
}

/* ============================ Despacho ============================ */

quint64 LoadCoordinator::dispatch(const PageRequest& desired) {
    if (!m_source) {
        qDebug() << "[pagebrowser] petición ignorada: no hay fuente";
        return 0;
    }

    PageRequest d = desired;
    d.source = m_source->identity();
    const qint64 known = (m_knownRows >= 0 && m_knownRowsFilter == d.filter) ? m_knownRows : -1;
    const PageRequest planned = PagePlanner::plan(d, known);

    const quint64 id = m_nextId.fetchAndAddOrdered(1) + 1;
    m_latestId.storeRelease(id);
    const ViewUpdate loading = m_state.propose(planned, id);

    PageResult hit;
    if (m_schemaKnown && m_cache.get(planned, hit)) {
        m_knownRows = hit.totalRows;
        m_knownRowsFilter = hit.request.filter;
        ViewUpdate u;
        if (m_state.commitIfCurrent(id, QSharedPointer<const PageResult>(new PageResult(hit)), &u)) {
            qDebug() << "[pagebrowser] caché:" << planned;
            emit viewChanged(u);
        }
        return id;
    }

    emit viewChanged(loading);
    qDebug() << "[pagebrowser] petición" << id << planned;

    QSharedPointer<TabularSource> src = m_source;
    const Schema knownSchema = m_schema;
    const bool needSchema = !m_schemaKnown;
    const quint64 epoch = m_epoch;
    m_pool.start([this, src, planned, knownSchema, needSchema, id, epoch]() {
        const Outcome o = runFetch(src, planned, knownSchema, needSchema, id, epoch);
        QMetaObject::invokeMethod(this, [this, id, o]() { finish(id, o); }, Qt::QueuedConnection);
    });
    return id;
}

// Corre en un hilo del pool: sólo toca la fuente y m_latestId.
LoadCoordinator::Outcome LoadCoordinator::runFetch(QSharedPointer<TabularSource> src,
                                                   const PageRequest& planned,
                                                   const Schema& knownSchema, bool needSchema,
                                                   quint64 id, quint64 epoch) const
{
    Outcome o;
    o.identity = src->identity();
    o.epoch = epoch;
    o.filter = planned.filter;

    auto superseded = [&]() {
        if (m_latestId.loadAcquire() == id) return false;
        o.error = SourceError::make(SourceError::Kind::StaleResultDiscarded, QString());
        return true;
    };

    Schema schema = knownSchema;
    if (needSchema) {
        if (!src->schema(o.schema, &o.error)) return o;
        o.schemaLoaded = true;
        schema = o.schema;
    }
    if (superseded()) return o;

    qint64 total = 0;
    if (!src->rowCount(planned.filter, total, &o.error)) return o;
    o.hasRowCount = true;
    o.rowCount = total;
    if (superseded()) return o;

    // con el total real la página puede quedar fuera de rango
    const PageRequest r = PagePlanner::plan(planned, total);
    if (!PagePlanner::validateSort(r.sort, schema, &o.error)) return o;

    if (!src->fetchPage(r, o.result, &o.error)) return o;
    o.ok = true;
    return o;
}

void LoadCoordinator::finish(quint64 id, const Outcome& o) {
    // sólo lo que viene de la misma fuente sin invalidaciones intermedias alimenta caché y conteos
    const bool sameEpoch = m_source && o.epoch == m_epoch && o.identity == m_source->identity();
    if (sameEpoch) {
        if (o.schemaLoaded && (!m_schemaKnown || m_schema != o.schema)) {
            m_schema = o.schema;
            m_schemaKnown = true;
            emit schemaChanged(m_schema);
        }
        if (o.hasRowCount) {
            m_knownRows = o.rowCount;
            m_knownRowsFilter = o.filter;
        }
        if (o.ok) m_cache.put(o.result.request, o.result);
    }

    ViewUpdate u;
    if (o.ok) {
        if (m_state.commitIfCurrent(id, QSharedPointer<const PageResult>(new PageResult(o.result)), &u)) {
            emit viewChanged(u);
            return;
        }
    } else if (o.error.kind != SourceError::Kind::StaleResultDiscarded) {
        if (m_state.failIfCurrent(id, o.error, &u)) {
            qWarning() << "[pagebrowser] petición" << id << "falló:"
                       << errorKindName(o.error.kind) << o.error.message;
            emit viewChanged(u);
            // orden inválido sin ninguna página aplicada: se carga con el orden anterior
            if (o.error.kind == SourceError::Kind::InvalidSort && !m_state.snapshot().hasCommitted) {
                qDebug() << "[pagebrowser] se recarga sin el orden rechazado";
                dispatch(m_state.desiredRequest());
            }
            return;
        }
    }
    discardStale(id);
}

void LoadCoordinator::discardStale(quint64 id) {
    qDebug() << "[pagebrowser] resultado obsoleto descartado, id" << id;
    emit staleResultDiscarded(id);
}

/* ============================ Estadística ============================ */

// Corre en un hilo del pool. Lee la fuente por bloques sin orden ni filtro.
LoadCoordinator::DescribeOutcome LoadCoordinator::runDescribe(QSharedPointer<TabularSource> src,
                                                              const QList<int>& columns,
                                                              const Schema& knownSchema,
                                                              bool needSchema, quint64 id,
                                                              quint64 epoch) const
{
    DescribeOutcome o;
    o.identity = src->identity();
    o.epoch = epoch;

    auto superseded = [&]() {
        if (m_latestDescribeId.loadAcquire() == id) return false;
        o.error = SourceError::make(SourceError::Kind::StaleResultDiscarded, QString());
        return true;
    };

    Schema schema = knownSchema;
    if (needSchema) {
        if (!src->schema(o.schema, &o.error)) return o;
        o.schemaLoaded = true;
        schema = o.schema;
    }
    for (int c : columns) {
        if (c < 0 || c >= schema.size()) {
            o.error = SourceError::make(SourceError::Kind::InvalidSort,
                                        tr("Columna inválida: %1").arg(c));
            return o;
        }
    }
    if (superseded()) return o;

    qint64 total = 0;
    if (!src->rowCount(QString(), total, &o.error)) return o;

    QVector<QVector<QVariant>> cells(columns.size());
    for (QVector<QVariant>& col : cells) col.reserve(int(std::min<qint64>(total, kDescribeChunk * 64)));

    PageRequest req;
    req.source = o.identity;
    req.pageSize = kDescribeChunk;
    qint64 read = 0;
    while (read < total) {
        if (superseded()) return o;
        PageResult page;
        if (!src->fetchPage(req, page, &o.error)) return o;
        for (const Record& rec : page.rows) {
            for (int i = 0; i < columns.size(); ++i)
                cells[i].push_back(columns[i] < rec.size() ? rec[columns[i]] : QVariant());
        }
        read += page.rows.size();
        if (page.rows.size() < kDescribeChunk) break;
        ++req.pageIndex;
    }
    if (superseded()) return o;

    for (int i = 0; i < columns.size(); ++i)
        o.stats << ColumnStats::compute(schema[columns[i]], cells[i]);
    o.ok = true;
    return o;
}

void LoadCoordinator::finishDescribe(quint64 id, const DescribeOutcome& o) {
    const bool sameEpoch = m_source && o.epoch == m_epoch && o.identity == m_source->identity();
    if (sameEpoch && o.schemaLoaded && !m_schemaKnown) {
        m_schema = o.schema;
        m_schemaKnown = true;
        emit schemaChanged(m_schema);
    }

    const bool current = sameEpoch && m_latestDescribeId.loadAcquire() == id
                         && o.error.kind != SourceError::Kind::StaleResultDiscarded;
    if (!current) {
        discardStale(id);
        return;
    }
    if (o.ok) {
        qDebug() << "[pagebrowser] descripción" << id << "lista," << o.stats.size() << "columnas";
        emit columnsDescribed(id, o.stats);
    } else {
        qWarning() << "[pagebrowser] descripción" << id << "falló:"
                   << errorKindName(o.error.kind) << o.error.message;
        emit describeFailed(id, o.error);
    }
}
