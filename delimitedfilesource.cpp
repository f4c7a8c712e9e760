#include "delimitedfilesource.h"

#include <QFile>
#include <QFileInfo>
#include <QFileSystemWatcher>
#include <QMutexLocker>
#include <QDebug>

DelimitedFileSource::DelimitedFileSource(const QString& path, QObject* parent)
    : DelimitedFileSource(QStringLiteral("csv:") + QFileInfo(path).absoluteFilePath(), path, parent) {}

DelimitedFileSource::DelimitedFileSource(const QString& identity, const QString& path, QObject* parent)
    : MemorySortedSource(identity, parent), m_path(path) {}

QString DelimitedFileSource::displayName() const {
    return QFileInfo(m_path).fileName();
}

void DelimitedFileSource::setDelimiter(QChar delimiter) {
    {
        QMutexLocker lk(&m_delimMutex);
        if (m_delimiter == delimiter) return;
        m_delimiter = delimiter;
    }
    dropCaches();
}

QChar DelimitedFileSource::delimiter() const {
    QMutexLocker lk(&m_delimMutex);
    return m_delimiter;
}

QChar DelimitedFileSource::detectedDelimiter() const {
    QMutexLocker lk(&m_delimMutex);
    return m_detected;
}

/* ============================ Vigilancia ============================ */

void DelimitedFileSource::setWatchFile(bool on) {
    if (on == (m_watcher != nullptr)) return;
    if (!on) {
        delete m_watcher;
        m_watcher = nullptr;
        return;
    }
    m_watcher = new QFileSystemWatcher(this);
    if (!m_watcher->addPath(m_path))
        qWarning() << "[pagebrowser] no se pudo vigilar" << m_path;
    connect(m_watcher, &QFileSystemWatcher::fileChanged, this, &DelimitedFileSource::onFileChanged);
}

void DelimitedFileSource::onFileChanged(const QString& path) {
    // algunos editores reemplazan el archivo: hay que volver a registrarlo
    if (m_watcher && QFileInfo::exists(path) && !m_watcher->files().contains(path))
        m_watcher->addPath(path);
    qDebug() << "[pagebrowser] archivo modificado:" << path;
    markMutated();
}

void DelimitedFileSource::close() {
    setWatchFile(false);
    MemorySortedSource::close();
}

/* ============================ Parser ============================ */

bool DelimitedFileSource::parse(const QString& text, QChar delimiter, QVector<QStringList>& out) {
    out.clear();
    QStringList record;
    QString field;
    bool inQuotes = false;
    bool fieldWasQuoted = false;

    auto endField = [&]() {
        record << field;
        field.clear();
        fieldWasQuoted = false;
    };
    auto endRecord = [&]() {
        endField();
        // líneas en blanco no son registros
        if (!(record.size() == 1 && record.first().isEmpty())) out.push_back(record);
        record.clear();
    };

    const int n = text.size();
    for (int i = 0; i < n; ++i) {
        const QChar c = text.at(i);
        if (inQuotes) {
            if (c == u'"') {
                if (i + 1 < n && text.at(i + 1) == u'"') { field += u'"'; ++i; }
                else inQuotes = false;
            } else {
                field += c;
            }
            continue;
        }
        if (c == u'"' && field.isEmpty() && !fieldWasQuoted) {
            inQuotes = true;
            fieldWasQuoted = true;
        } else if (c == delimiter) {
            endField();
        } else if (c == u'\r') {
            if (i + 1 < n && text.at(i + 1) == u'\n') ++i;
            endRecord();
        } else if (c == u'\n') {
            endRecord();
        } else {
            field += c;
        }
    }
    if (inQuotes) return false;
    if (!field.isEmpty() || !record.isEmpty() || fieldWasQuoted) endRecord();
    return true;
}

bool DelimitedFileSource::consistent(const QVector<QStringList>& recs) {
    if (recs.isEmpty() || recs.first().size() < 2) return false;
    const int width = recs.first().size();
    for (const QStringList& r : recs)
        if (r.size() != width) return false;
    return true;
}

/* ============================ Carga ============================ */

bool DelimitedFileSource::loadRows(Schema& schema, QVector<Record>& rows,
                                   const QDeadlineTimer& deadline, SourceError* err)
{
    QFile f(m_path);
    if (!f.open(QIODevice::ReadOnly)) {
        qWarning() << "[pagebrowser] no se pudo abrir" << m_path << ":" << f.errorString();
        return fail(err, SourceError::Kind::SourceUnavailable,
                    tr("No se pudo abrir %1: %2").arg(m_path, f.errorString()));
    }
    QString text = QString::fromUtf8(f.readAll());
    f.close();
    if (text.startsWith(QChar(0xFEFF))) text.remove(0, 1);
    if (!checkDeadline(deadline, err)) return false;

    QVector<QStringList> recs;
    QChar used = delimiter();
    if (!used.isNull()) {
        if (!parse(text, used, recs))
            return fail(err, SourceError::Kind::SourceUnavailable,
                        tr("Comillas sin cerrar en %1").arg(m_path));
    } else {
        // ',' primero; si no da una tabla consistente se prueba ';'
        QVector<QStringList> comma, semicolon;
        const bool okComma = parse(text, u',', comma);
        if (okComma && consistent(comma)) {
            used = u',';
            recs = std::move(comma);
        } else if (parse(text, u';', semicolon) && consistent(semicolon)) {
            used = u';';
            recs = std::move(semicolon);
        } else if (okComma) {
            used = u',';
            recs = std::move(comma);
        } else {
            return fail(err, SourceError::Kind::SourceUnavailable,
                        tr("Formato no reconocido en %1").arg(m_path));
        }
    }
    {
        QMutexLocker lk(&m_delimMutex);
        m_detected = used;
    }

    schema.clear();
    rows.clear();
    if (recs.isEmpty()) return true;   // archivo vacío: sin columnas ni filas

    const QStringList header = recs.first();
    const int width = header.size();
    for (int c = 0; c < width; ++c) {
        ColumnDef col;
        col.name = header[c].trimmed().isEmpty() ? tr("Columna %1").arg(c + 1) : header[c].trimmed();
        schema << col;
    }

    // columnas crudas para inferir tipos
    QVector<QVector<QVariant>> columns(width);
    rows.reserve(recs.size() - 1);
    for (int i = 1; i < recs.size(); ++i) {
        if ((i % 4096) == 0 && !checkDeadline(deadline, err)) return false;
        const QStringList& rec = recs[i];
        Record r(width);
        for (int c = 0; c < width && c < rec.size(); ++c) {
            if (!rec[c].isEmpty()) r[c] = rec[c];
        }
        for (int c = 0; c < width; ++c) columns[c].push_back(r[c]);
        rows.push_back(r);
    }

    for (int c = 0; c < width; ++c) {
        schema[c].type = TableTypes::inferType(columns[c]);
        schema[c].declType = TableTypes::typeName(schema[c].type);
    }
    for (Record& r : rows)
        for (int c = 0; c < width; ++c)
            r[c] = TableTypes::normalizeCell(schema[c].type, r[c]);

    return checkDeadline(deadline, err);
}
