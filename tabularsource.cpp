#include "tabularsource.h"
#include <QDebug>

TabularSource::TabularSource(const QString& identity, QObject* parent)
    : QObject(parent), m_identity(identity) {}

TabularSource::~TabularSource() = default;

QString TabularSource::displayName() const {
    return m_identity;
}

void TabularSource::close() {
    if (m_closed.fetchAndStoreOrdered(1) == 0)
        qDebug() << "[pagebrowser] fuente cerrada:" << m_identity;
    dropCaches();
}

bool TabularSource::isClosed() const {
    return m_closed.loadAcquire() != 0;
}

void TabularSource::setOptions(const SourceOptions& o) {
    m_timeoutMs.storeRelease(o.timeoutMs);
}

SourceOptions TabularSource::options() const {
    SourceOptions o;
    o.timeoutMs = m_timeoutMs.loadAcquire();
    return o;
}

void TabularSource::markMutated() {
    dropCaches();
    emit mutated(m_identity);
}

bool TabularSource::checkOpen(SourceError* err) const {
    if (!isClosed()) return true;
    return fail(err, SourceError::Kind::SourceUnavailable,
                tr("La fuente %1 está cerrada").arg(displayName()));
}

QDeadlineTimer TabularSource::makeDeadline() const {
    const int ms = m_timeoutMs.loadAcquire();
    return ms > 0 ? QDeadlineTimer(ms) : QDeadlineTimer(QDeadlineTimer::Forever);
}

bool TabularSource::checkDeadline(const QDeadlineTimer& dl, SourceError* err) const {
    if (!dl.hasExpired()) return true;
    return fail(err, SourceError::Kind::Timeout,
                tr("Tiempo de espera agotado leyendo %1").arg(displayName()));
}

bool TabularSource::fail(SourceError* err, SourceError::Kind kind, const QString& message) {
    if (err) *err = SourceError::make(kind, message);
    return false;
}
