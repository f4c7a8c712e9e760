#include "pagetablemodel.h"
#include "loadcoordinator.h"

#include <QDateTime>
#include <QLocale>
#include <QTime>
#include <QDebug>

PageTableModel::PageTableModel(LoadCoordinator* coordinator, QObject* parent)
    : QAbstractTableModel(parent), m_coordinator(coordinator)
{
    if (!m_coordinator) return;
    m_schema = m_coordinator->schema();
    m_result = m_coordinator->state().committedResult();
    m_status = m_coordinator->state().status();
    connect(m_coordinator, &LoadCoordinator::viewChanged, this, &PageTableModel::onViewChanged);
    connect(m_coordinator, &LoadCoordinator::schemaChanged, this, &PageTableModel::onSchemaChanged);
}

/* ========================== Señales del coordinador ========================== */

void PageTableModel::onViewChanged(const ViewUpdate& update) {
    if (update.result != m_result) {
        beginResetModel();
        m_result = update.result;
        endResetModel();
    }
    m_error = update.error;
    if (update.status != m_status) {
        m_status = update.status;
        emit statusChanged(m_status);
    }
}

void PageTableModel::onSchemaChanged(const Schema& schema) {
    beginResetModel();
    m_schema = schema;
    // la página anterior no corresponde a columnas nuevas
    if (m_schema.isEmpty()) m_result.reset();
    endResetModel();
}

/* ========================== QAbstractTableModel ========================== */

int PageTableModel::rowCount(const QModelIndex& parent) const {
    if (parent.isValid() || !m_result) return 0;
    return int(m_result->rows.size());
}

int PageTableModel::columnCount(const QModelIndex& parent) const {
    if (parent.isValid()) return 0;
    return int(m_schema.size());
}

QString PageTableModel::displayText(ColumnType type, const QVariant& v) {
    if (TableTypes::isNullCell(v)) return QString();
    switch (type) {
    case ColumnType::Temporal: {
        // fechas sin hora se muestran sin la parte 00:00
        if (v.metaType().id() == QMetaType::QDateTime) {
            const QDateTime dt = v.toDateTime();
            if (dt.time() == QTime(0, 0)) return dt.date().toString(Qt::ISODate);
            return dt.toString(QStringLiteral("yyyy-MM-dd HH:mm:ss"));
        }
        return TableTypes::cellText(v);
    }
    case ColumnType::Boolean:
        if (v.metaType().id() == QMetaType::Bool)
            return v.toBool() ? tr("Sí") : tr("No");
        return TableTypes::cellText(v);
    default:
        return TableTypes::cellText(v);
    }
}

QVariant PageTableModel::data(const QModelIndex& index, int role) const {
    if (!index.isValid() || !m_result) return {};
    if (index.row() >= m_result->rows.size() || index.column() >= m_schema.size()) return {};

    const QVariant v = m_result->rows[index.row()].value(index.column());
    const ColumnType type = m_schema[index.column()].type;

    switch (role) {
    case Qt::DisplayRole:
        return displayText(type, v);
    case Qt::EditRole:
        return v;
    case Qt::TextAlignmentRole:
        if (type == ColumnType::Numeric) return (Qt::AlignRight | Qt::AlignVCenter).toInt();
        return (Qt::AlignLeft | Qt::AlignVCenter).toInt();
    case Qt::ToolTipRole:
        if (type == ColumnType::Blob) return TableTypes::cellText(v);
        return {};
    default:
        return {};
    }
}

QVariant PageTableModel::headerData(int section, Qt::Orientation orientation, int role) const {
    if (orientation == Qt::Horizontal) {
        if (section < 0 || section >= m_schema.size()) return {};
        if (role == Qt::DisplayRole) return m_schema[section].name;
        if (role == Qt::ToolTipRole) {
            const ColumnDef& c = m_schema[section];
            return c.declType.isEmpty() ? TableTypes::typeName(c.type) : c.declType;
        }
        return {};
    }
    if (role != Qt::DisplayRole) return {};
    // número de fila absoluto (1-based) dentro del resultado completo
    const qint64 first = m_result ? m_result->firstRow() : 0;
    return first + section + 1;
}

Qt::ItemFlags PageTableModel::flags(const QModelIndex& index) const {
    if (!index.isValid()) return Qt::NoItemFlags;
    return Qt::ItemIsEnabled | Qt::ItemIsSelectable;
}

void PageTableModel::sort(int column, Qt::SortOrder order) {
    if (!m_coordinator) return;
    SourceError err;
    if (!m_coordinator->setSort(column, order, &err))
        qWarning() << "[pagebrowser] no se pudo ordenar:" << err.message;
}

/* ========================== Extras ========================== */

QString PageTableModel::rowsAsTsv(const QList<int>& rows) const {
    if (!m_result) return QString();
    QStringList lines;
    for (int r : rows) {
        if (r < 0 || r >= m_result->rows.size()) continue;
        QStringList cells;
        const Record& rec = m_result->rows[r];
        for (int c = 0; c < m_schema.size(); ++c) {
            QString text = displayText(m_schema[c].type, rec.value(c));
            // un tab o salto dentro de la celda rompería las columnas al pegar
            text.replace(u'\t', u' ');
            text.replace(u'\n', u' ');
            cells << text;
        }
        lines << cells.join(u'\t');
    }
    return lines.join(u'\n');
}

QString PageTableModel::statusText() const {
    if (m_status == ViewStatus::Loading) return tr("Processing...");
    if (m_status == ViewStatus::Error) {
        if (m_error.message.isEmpty()) return tr("Error opening table");
        return tr("Error opening table: %1").arg(m_error.message);
    }
    if (!m_result) return QString();

    const QString name = (m_coordinator && m_coordinator->source())
                             ? m_coordinator->source()->displayName() : m_result->request.source;
    if (m_result->totalRows == 0) return tr("No data found in table");

    const QLocale loc(QLocale::English);
    return tr("Showing table: %1, rows: %2, page: %3 of %4")
        .arg(name,
             loc.toString(m_result->totalRows),
             loc.toString(m_result->request.pageIndex + 1),
             loc.toString(m_result->pageCount()));
}
