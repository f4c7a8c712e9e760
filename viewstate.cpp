#include "viewstate.h"
#include <QMutexLocker>

QString viewStatusName(ViewStatus s) {
    switch (s) {
    case ViewStatus::Idle:    return QStringLiteral("Idle");
    case ViewStatus::Loading: return QStringLiteral("Loading");
    case ViewStatus::Error:   return QStringLiteral("Error");
    }
    return QStringLiteral("Idle");
}

/* ====================== Lectura ====================== */

PageRequest ViewState::desiredRequest() const {
    QMutexLocker lk(&m_mutex);
    return m_desired;
}

PageRequest ViewState::committedRequest() const {
    QMutexLocker lk(&m_mutex);
    return m_committed;
}

QSharedPointer<const PageResult> ViewState::committedResult() const {
    QMutexLocker lk(&m_mutex);
    return m_result;
}

ViewStatus ViewState::status() const {
    QMutexLocker lk(&m_mutex);
    return m_status;
}

SourceError ViewState::lastError() const {
    QMutexLocker lk(&m_mutex);
    return m_error;
}

quint64 ViewState::currentRequestId() const {
    QMutexLocker lk(&m_mutex);
    return m_currentId;
}

ViewState::Snapshot ViewState::snapshot() const {
    QMutexLocker lk(&m_mutex);
    Snapshot s;
    s.desired      = m_desired;
    s.committed    = m_committed;
    s.hasCommitted = m_hasCommitted;
    s.result       = m_result;
    s.status       = m_status;
    s.error        = m_error;
    s.currentId    = m_currentId;
    return s;
}

/* ====================== Escritura (sólo LoadCoordinator) ====================== */

ViewUpdate ViewState::updateLocked() const {
    ViewUpdate u;
    u.status    = m_status;
    u.requestId = m_currentId;
    u.result    = m_result;
    if (m_status == ViewStatus::Error) u.error = m_error;
    return u;
}

ViewUpdate ViewState::propose(const PageRequest& desired, quint64 id) {
    QMutexLocker lk(&m_mutex);
    m_desired   = desired;
    m_currentId = id;
    m_status    = ViewStatus::Loading;
    m_error     = SourceError();
    return updateLocked();
}

bool ViewState::commitIfCurrent(quint64 id, const QSharedPointer<const PageResult>& result,
                                ViewUpdate* update)
{
    QMutexLocker lk(&m_mutex);
    if (id != m_currentId) return false;   // superado: no se toca nada

    m_result       = result;
    m_committed    = result->request;
    m_hasCommitted = true;
    // el planner pudo recortar la página con el conteo fresco
    m_desired      = result->request;
    m_status       = ViewStatus::Idle;
    m_error        = SourceError();
    if (update) *update = updateLocked();
    return true;
}

bool ViewState::failIfCurrent(quint64 id, const SourceError& error, ViewUpdate* update) {
    QMutexLocker lk(&m_mutex);
    if (id != m_currentId) return false;

    // se conserva la última página buena (m_result no cambia)
    m_status = ViewStatus::Error;
    m_error  = error;
    // orden rechazado: se vuelve a lo aplicado (página incluida)
    if (error.kind == SourceError::Kind::InvalidSort) {
        if (m_hasCommitted) m_desired = m_committed;
        else                m_desired.sort = SortSpec::none();
    }
    if (update) *update = updateLocked();
    return true;
}

void ViewState::reset(const PageRequest& desired) {
    QMutexLocker lk(&m_mutex);
    m_desired      = desired;
    m_committed    = PageRequest();
    m_hasCommitted = false;
    m_result.reset();
    m_status       = ViewStatus::Idle;
    m_error        = SourceError();
    m_currentId    = 0;   // ningún id en vuelo es vigente
}
