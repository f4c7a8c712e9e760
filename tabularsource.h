#ifndef TABULARSOURCE_H
#define TABULARSOURCE_H

#include <QObject>
#include <QAtomicInt>
#include <QDeadlineTimer>
#include "tabletypes.h"

struct SourceOptions {
    int timeoutMs = 30000;   // <= 0: sin límite
};

/**
 * TabularSource
 * -------------
 * Contrato común de todas las fuentes (tabla SQLite, archivo delimitado, hoja de cálculo,
 * filas en memoria). Los métodos de consulta se llaman desde hilos del pool: cada variante
 * protege su propio estado y nunca toca el estado de la vista.
 *
 * Errores: bool + SourceError* (SourceUnavailable, InvalidSort, Timeout).
 */
class TabularSource : public QObject {
    Q_OBJECT
public:
    explicit TabularSource(const QString& identity, QObject* parent = nullptr);
    ~TabularSource() override;

    // Identidad estable; es parte de la clave de la caché de páginas.
    QString identity() const { return m_identity; }
    virtual QString displayName() const;

    virtual bool schema(Schema& out, SourceError* err = nullptr) = 0;
    virtual bool rowCount(const QString& filter, qint64& out, SourceError* err = nullptr) = 0;
    virtual bool fetchPage(const PageRequest& r, PageResult& out, SourceError* err = nullptr) = 0;

    virtual void close();
    bool isClosed() const;

    void setOptions(const SourceOptions& o);
    SourceOptions options() const;

    // Los datos de origen cambiaron: se olvida lo cacheado y se avisa.
    void markMutated();
    // Olvida lo cacheado sin avisar (refresh explícito).
    void discardCachedData() { dropCaches(); }

signals:
    void mutated(const QString& identity);

protected:
    // Caches internas del adaptador (filas cargadas, esquema...)
    virtual void dropCaches() {}

    bool checkOpen(SourceError* err) const;
    QDeadlineTimer makeDeadline() const;
    bool checkDeadline(const QDeadlineTimer& dl, SourceError* err) const;

    static bool fail(SourceError* err, SourceError::Kind kind, const QString& message);

private:
    QString    m_identity;
    QAtomicInt m_closed{0};
    QAtomicInt m_timeoutMs{30000};
};

#endif // TABULARSOURCE_H
