#ifndef LOADCOORDINATOR_H
#define LOADCOORDINATOR_H

#include <QObject>
#include <QSharedPointer>
#include <QThreadPool>
#include <QAtomicInteger>

#include "columnstats.h"
#include "engineconfig.h"
#include "pagecache.h"
#include "tabularsource.h"
#include "viewstate.h"

/**
 * LoadCoordinator
 * ---------------
 * Vive en el hilo de control. Recibe las intenciones del usuario (página, orden,
 * tamaño, filtro, fuente), las pasa por el PagePlanner y:
 *   - si la página está en caché, la aplica al instante;
 *   - si no, lanza en el pool: (esquema) -> rowCount -> re-planificar -> fetchPage.
 *
 * Cada petición lleva un id creciente. Al terminar, el worker publica el resultado
 * con una invocación encolada y aquí se aplica SÓLO si ese id sigue siendo el último
 * (ViewState::commitIfCurrent). Lo demás se descarta y se reporta como obsoleto.
 */
class LoadCoordinator : public QObject {
    Q_OBJECT
public:
    explicit LoadCoordinator(const EngineConfig& config = EngineConfig(), QObject* parent = nullptr);
    ~LoadCoordinator() override;

    const ViewState& state() const { return m_state; }
    const PageCache& cache() const { return m_cache; }
    EngineConfig config() const { return m_config; }

    QSharedPointer<TabularSource> source() const { return m_source; }
    Schema schema() const { return m_schema; }
    bool   schemaKnown() const { return m_schemaKnown; }
    qint64 knownRowCount() const;          // -1 si no se conoce para el filtro actual
    int    pageSize() const;
    bool   isLoading() const;

    /* ---------- Intenciones ---------- */
    void switchSource(QSharedPointer<TabularSource> source);
    void closeSource();

    bool setSort(int column, Qt::SortOrder order, SourceError* err = nullptr);
    void clearSort();
    // clic en encabezado: ascendente -> descendente -> orden original
    bool cycleSort(int column, SourceError* err = nullptr);

    void goToPage(int index);
    void nextPage();
    void previousPage();
    void firstPage();
    void lastPage();

    bool setPageSize(int size, QString* err = nullptr);
    void setFilter(const QString& text);

    void refresh();
    void retry();

    // Estadística descriptiva de las columnas indicadas sobre la fuente completa (sin filtro).
    // Corre en el pool; el resultado llega por columnsDescribed/describeFailed sólo si
    // sigue vigente (misma fuente, sin refresh ni mutación, sin otra descripción más nueva).
    // Devuelve el id asignado, 0 si se rechaza en el acto.
    quint64 describeColumns(const QList<int>& columns, SourceError* err = nullptr);

    // Petición arbitraria (siempre pasa por el planner). Devuelve el id asignado (0 = sin fuente).
    quint64 requestChange(const PageRequest& desired);

signals:
    void viewChanged(const ViewUpdate& update);
    void schemaChanged(const Schema& schema);
    void staleResultDiscarded(quint64 requestId);
    void columnsDescribed(quint64 requestId, const QList<ColumnStats>& stats);
    void describeFailed(quint64 requestId, const SourceError& error);

private slots:
    void onSourceMutated(const QString& identity);

private:
    // Lo que produce un worker; se copia al hilo de control.
    struct Outcome {
        bool        ok = false;
        PageResult  result;
        SourceError error;
        bool        schemaLoaded = false;
        Schema      schema;
        bool        hasRowCount = false;
        qint64      rowCount = 0;
        QString     filter;
        QString     identity;
        quint64     epoch = 0;
    };

    struct DescribeOutcome {
        bool               ok = false;
        QList<ColumnStats> stats;
        SourceError        error;
        bool               schemaLoaded = false;
        Schema             schema;
        QString            identity;
        quint64            epoch = 0;
    };

    quint64 dispatch(const PageRequest& desired);
    DescribeOutcome runDescribe(QSharedPointer<TabularSource> src, const QList<int>& columns,
                                const Schema& knownSchema, bool needSchema, quint64 id,
                                quint64 epoch) const;
    void finishDescribe(quint64 id, const DescribeOutcome& o);
    Outcome runFetch(QSharedPointer<TabularSource> src, const PageRequest& planned,
                     const Schema& knownSchema, bool needSchema, quint64 id, quint64 epoch) const;
    void finish(quint64 id, const Outcome& o);
    void discardStale(quint64 id);
    void invalidateCurrentSource();

    EngineConfig m_config;
    ViewState    m_state;
    PageCache    m_cache;

    QSharedPointer<TabularSource> m_source;
    Schema  m_schema;
    bool    m_schemaKnown = false;
    qint64  m_knownRows = -1;
    QString m_knownRowsFilter;
    quint64 m_epoch = 0;              // cambia con refresh / mutación / cambio de fuente

    QAtomicInteger<quint64> m_nextId{0};
    QAtomicInteger<quint64> m_latestId{0};   // lo leen los workers para cortar temprano
    QAtomicInteger<quint64> m_latestDescribeId{0};

    QThreadPool m_pool;
};

#endif // LOADCOORDINATOR_H
