#ifndef SPREADSHEETSOURCE_H
#define SPREADSHEETSOURCE_H

#include <QSharedPointer>
#include <QStringList>
#include "memorysource.h"

// Lector de libros de cálculo (xlsx/ods...). El parseo binario vive fuera de este proyecto.
class SheetReader {
public:
    virtual ~SheetReader() = default;

    virtual QStringList sheetNames(QString* err = nullptr) = 0;
    // Grilla completa de la hoja; fila 0 = encabezados. Celdas vacías como QVariant().
    virtual bool readSheet(const QString& sheet, QVector<QVector<QVariant>>& grid,
                           QString* err = nullptr) = 0;
};

// Una hoja de un libro, vista como tabla.
class SpreadsheetSource : public MemorySortedSource {
    Q_OBJECT
public:
    SpreadsheetSource(const QString& identity, QSharedPointer<SheetReader> reader,
                      const QString& sheet, QObject* parent = nullptr);

    QString sheet() const { return m_sheet; }
    QString displayName() const override { return m_sheet; }

protected:
    bool loadRows(Schema& schema, QVector<Record>& rows,
                  const QDeadlineTimer& deadline, SourceError* err) override;

private:
    QSharedPointer<SheetReader> m_reader;
    QString m_sheet;
};

#endif // SPREADSHEETSOURCE_H
