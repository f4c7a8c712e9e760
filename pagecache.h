#pragma once
#include <QHash>
#include <QMap>
#include <QMutex>
#include "tabletypes.h"

/**
 * PageCache
 * ---------
 * Ventanas de página ya leídas, por PageRequest (fuente + orden + página + tamaño + filtro).
 * - Capacidad acotada, expulsión LRU con token de recencia monótono
 * - invalidateSource(id) borra todo lo de una fuente (refresh/cierre/mutación)
 * - Seguro entre hilos (QMutex)
 *
 * Un fallo siempre se puede resolver releyendo la fuente: vaciar la caché
 * sólo afecta a la latencia.
 */
class PageCache {
public:
    explicit PageCache(int capacity = 64);
    PageCache(const PageCache&) = delete;
    PageCache& operator=(const PageCache&) = delete;

    bool get(const PageRequest& r, PageResult& out);   // false = fallo (miss)
    void put(const PageRequest& r, const PageResult& result);
    bool contains(const PageRequest& r) const;         // no toca la recencia

    int  invalidateSource(const QString& sourceIdentity); // devuelve cuántas entradas quitó
    void clear();

    void setCapacity(int capacity);
    int  capacity() const;
    int  size() const;

    struct Stats {
        qint64 hits{0};
        qint64 misses{0};
        qint64 evictions{0};
    };
    Stats stats() const;

private:
    struct Entry {
        PageResult result;
        quint64    token = 0;
    };

    void touch(Entry& e, const PageRequest& key);
    void evictOverflow();

    mutable QMutex mutex_;
    int capacity_;
    quint64 nextToken_ = 0;
    QHash<PageRequest, Entry> entries_;
    QMap<quint64, PageRequest> byRecency_; // token -> clave (el menor es el LRU)
    Stats stats_;
};
