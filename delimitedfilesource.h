#ifndef DELIMITEDFILESOURCE_H
#define DELIMITEDFILESOURCE_H

#include <QStringList>
#include "memorysource.h"

class QFileSystemWatcher;

/**
 * DelimitedFileSource
 * -------------------
 * Archivo de texto delimitado (CSV) con fila de encabezado.
 *  - Comillas estilo RFC 4180 ("" escapa comillas, saltos de línea dentro de comillas)
 *  - Separador: el configurado, o automático: ',' y si los conteos no cuadran, ';'
 *  - Tipos inferidos a partir de los valores (celdas vacías = nulo)
 *  - Opcional: vigilar el archivo y emitir mutated() cuando cambia en disco
 */
class DelimitedFileSource : public MemorySortedSource {
    Q_OBJECT
public:
    explicit DelimitedFileSource(const QString& path, QObject* parent = nullptr);
    DelimitedFileSource(const QString& identity, const QString& path, QObject* parent = nullptr);

    QString path() const { return m_path; }
    QString displayName() const override;

    // QChar() = automático
    void setDelimiter(QChar delimiter);
    QChar delimiter() const;
    QChar detectedDelimiter() const;

    void setWatchFile(bool on);
    bool watchFile() const { return m_watcher != nullptr; }

    void close() override;

    // Parser puro (expuesto para pruebas). false si hay comillas sin cerrar.
    static bool parse(const QString& text, QChar delimiter, QVector<QStringList>& out);

protected:
    bool loadRows(Schema& schema, QVector<Record>& rows,
                  const QDeadlineTimer& deadline, SourceError* err) override;

private slots:
    void onFileChanged(const QString& path);

private:
    static bool consistent(const QVector<QStringList>& recs);

    QString m_path;
    QFileSystemWatcher* m_watcher = nullptr;

    mutable QMutex m_delimMutex;
    QChar m_delimiter;
    QChar m_detected;
};

#endif // DELIMITEDFILESOURCE_H
