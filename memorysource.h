#ifndef MEMORYSOURCE_H
#define MEMORYSOURCE_H

#include <QMutex>
#include "tabularsource.h"

/* ================== Ruta común: cargar todo, ordenar en memoria ================== */

/**
 * Base de las fuentes que no saben ordenar por sí mismas (archivos, hojas, memoria).
 * loadRows() entrega el conjunto completo SIN ordenar una sola vez; después cada
 * fetchPage filtra, ordena (stable_sort: empates en orden de origen, nulos al final)
 * y recorta la ventana. La última permutación (orden + filtro) queda guardada para
 * que pasar de página con el mismo orden no vuelva a ordenar.
 */
class MemorySortedSource : public TabularSource {
    Q_OBJECT
public:
    using TabularSource::TabularSource;

    bool schema(Schema& out, SourceError* err = nullptr) override;
    bool rowCount(const QString& filter, qint64& out, SourceError* err = nullptr) override;
    bool fetchPage(const PageRequest& r, PageResult& out, SourceError* err = nullptr) override;

protected:
    // Lee esquema + filas completas. Se llama con el lock tomado; debe respetar 'deadline'.
    virtual bool loadRows(Schema& schema, QVector<Record>& rows,
                          const QDeadlineTimer& deadline, SourceError* err) = 0;

    void dropCaches() override;

private:
    bool ensureLoadedLocked(const QDeadlineTimer& dl, SourceError* err);
    bool orderLocked(const SortSpec& sort, const QString& filter,
                     const QDeadlineTimer& dl, SourceError* err);

    QMutex          m_mutex;
    QAtomicInt      m_generation{0};
    int             m_loadedGeneration = -1;
    bool            m_loaded = false;
    Schema          m_schema;
    QVector<Record> m_rows;

    // permutación vigente
    bool         m_orderValid = false;
    SortSpec     m_orderSort;
    QString      m_orderFilter;
    QVector<int> m_order;
};

/* ================== Filas suministradas en memoria ================== */
class MemorySource : public MemorySortedSource {
    Q_OBJECT
public:
    MemorySource(const QString& identity, const Schema& schema,
                 const QVector<Record>& rows = {}, QObject* parent = nullptr);

    QString displayName() const override;
    void setDisplayName(const QString& name);

    // Reemplaza todo el contenido y emite mutated().
    void setRows(const QVector<Record>& rows);
    void setData(const Schema& schema, const QVector<Record>& rows);

protected:
    bool loadRows(Schema& schema, QVector<Record>& rows,
                  const QDeadlineTimer& deadline, SourceError* err) override;

private:
    mutable QMutex  m_dataMutex;
    QString         m_name;
    Schema          m_dataSchema;
    QVector<Record> m_dataRows;
};

#endif // MEMORYSOURCE_H
