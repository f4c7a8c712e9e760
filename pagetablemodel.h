#pragma once
#include <QAbstractTableModel>
#include <QSharedPointer>
#include "tabletypes.h"
#include "viewstate.h"

class LoadCoordinator;

/**
 * Modelo de solo lectura sobre la página aplicada del LoadCoordinator.
 * La vista (externa) sólo ve páginas completas: cada viewChanged con resultado
 * nuevo reemplaza el modelo entero.
 */
class PageTableModel : public QAbstractTableModel {
    Q_OBJECT
public:
    explicit PageTableModel(LoadCoordinator* coordinator, QObject* parent = nullptr);

    int rowCount(const QModelIndex& parent = QModelIndex()) const override;
    int columnCount(const QModelIndex& parent = QModelIndex()) const override;
    QVariant data(const QModelIndex& index, int role = Qt::DisplayRole) const override;
    QVariant headerData(int section, Qt::Orientation orientation,
                        int role = Qt::DisplayRole) const override;
    Qt::ItemFlags flags(const QModelIndex& index) const override;

    // clic en encabezado -> LoadCoordinator::setSort
    void sort(int column, Qt::SortOrder order = Qt::AscendingOrder) override;

    // Filas visibles como TSV ("\t" entre celdas, "\n" entre filas), para el portapapeles.
    QString rowsAsTsv(const QList<int>& rows) const;

    // "Showing table: X, rows: N, page: p of P" / "Processing..." / error
    QString statusText() const;

    ViewStatus status() const { return m_status; }
    SourceError lastError() const { return m_error; }
    QSharedPointer<const PageResult> page() const { return m_result; }
    Schema schema() const { return m_schema; }

    static QString displayText(ColumnType type, const QVariant& v);

signals:
    void statusChanged(ViewStatus status);

private slots:
    void onViewChanged(const ViewUpdate& update);
    void onSchemaChanged(const Schema& schema);

private:
    LoadCoordinator* m_coordinator;
    Schema m_schema;
    QSharedPointer<const PageResult> m_result;
    ViewStatus m_status = ViewStatus::Idle;
    SourceError m_error;
};
