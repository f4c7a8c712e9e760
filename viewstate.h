#ifndef VIEWSTATE_H
#define VIEWSTATE_H

#include <QMutex>
#include <QSharedPointer>
#include "tabletypes.h"

class LoadCoordinator;

enum class ViewStatus { Idle, Loading, Error };

QString viewStatusName(ViewStatus s);

// Mensaje que recibe la capa de render en cada cambio de estado.
struct ViewUpdate {
    ViewStatus                        status = ViewStatus::Idle;
    quint64                           requestId = 0;
    QSharedPointer<const PageResult>  result;   // última página buena (puede ser nula)
    SourceError                       error;    // sólo con status == Error
};

/**
 * Estado de UNA vista abierta.
 *  - desired:   lo último que pidió el usuario (ya pasado por el planner)
 *  - committed: la petición cuyo resultado está aplicado
 *  - result:    la última página aplicada; se reemplaza entera (swap del puntero)
 *
 * Lectura libre desde cualquier hilo. Escritura sólo desde LoadCoordinator,
 * con el compare-and-apply por id bajo el mismo lock.
 */
class ViewState {
public:
    struct Snapshot {
        PageRequest                      desired;
        PageRequest                      committed;
        bool                             hasCommitted = false;
        QSharedPointer<const PageResult> result;
        ViewStatus                       status = ViewStatus::Idle;
        SourceError                      error;
        quint64                          currentId = 0;
    };

    ViewState() = default;
    ViewState(const ViewState&) = delete;
    ViewState& operator=(const ViewState&) = delete;

    PageRequest desiredRequest() const;
    PageRequest committedRequest() const;
    QSharedPointer<const PageResult> committedResult() const;
    ViewStatus status() const;
    SourceError lastError() const;
    quint64 currentRequestId() const;
    Snapshot snapshot() const;

private:
    friend class LoadCoordinator;

    // Nueva petición deseada con su id; pasa a Loading.
    ViewUpdate propose(const PageRequest& desired, quint64 id);

    // Aplica el resultado sólo si 'id' sigue siendo el vigente. Devuelve false si está superado.
    bool commitIfCurrent(quint64 id, const QSharedPointer<const PageResult>& result,
                         ViewUpdate* update = nullptr);

    // Igual, para errores. InvalidSort devuelve la petición deseada a la última aplicada.
    bool failIfCurrent(quint64 id, const SourceError& error, ViewUpdate* update = nullptr);

    // Cambio de fuente: olvida lo aplicado y deja obsoleto todo lo que esté en vuelo.
    void reset(const PageRequest& desired);

    ViewUpdate updateLocked() const;

    mutable QMutex m_mutex;
    PageRequest m_desired;
    PageRequest m_committed;
    bool m_hasCommitted = false;
    QSharedPointer<const PageResult> m_result;
    ViewStatus m_status = ViewStatus::Idle;
    SourceError m_error;
    quint64 m_currentId = 0;
};

Q_DECLARE_METATYPE(ViewUpdate)

#endif // VIEWSTATE_H
