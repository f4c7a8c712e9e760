#include "spreadsheetsource.h"
#include <QDebug>
#include <algorithm>

SpreadsheetSource::SpreadsheetSource(const QString& identity, QSharedPointer<SheetReader> reader,
                                     const QString& sheet, QObject* parent)
    : MemorySortedSource(identity, parent), m_reader(std::move(reader)), m_sheet(sheet) {}

bool SpreadsheetSource::loadRows(Schema& schema, QVector<Record>& rows,
                                 const QDeadlineTimer& deadline, SourceError* err)
{
    if (!m_reader)
        return fail(err, SourceError::Kind::SourceUnavailable,
                    tr("No hay lector de hojas de cálculo para %1").arg(m_sheet));

    QVector<QVector<QVariant>> grid;
    QString readErr;
    if (!m_reader->readSheet(m_sheet, grid, &readErr)) {
        qWarning() << "[pagebrowser] error leyendo la hoja" << m_sheet << ":" << readErr;
        return fail(err, SourceError::Kind::SourceUnavailable,
                    tr("No se pudo leer la hoja %1: %2").arg(m_sheet, readErr));
    }
    if (!checkDeadline(deadline, err)) return false;

    schema.clear();
    rows.clear();
    if (grid.isEmpty()) return true;

    // el ancho lo da la fila más larga
    int width = 0;
    for (const auto& line : grid) width = std::max(width, int(line.size()));

    const QVector<QVariant>& header = grid.first();
    for (int c = 0; c < width; ++c) {
        ColumnDef col;
        const QString name = c < header.size() ? TableTypes::cellText(header[c]).trimmed() : QString();
        col.name = name.isEmpty() ? tr("Columna %1").arg(c + 1) : name;
        schema << col;
    }

    QVector<QVector<QVariant>> columns(width);
    rows.reserve(grid.size() - 1);
    for (int i = 1; i < grid.size(); ++i) {
        Record r = grid[i];
        r.resize(width);
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
