#include "pageplanner.h"
#include <algorithm>

int PagePlanner::pageCount(qint64 rowCount, int pageSize) {
    if (rowCount <= 0 || pageSize <= 0) return 0;
    return int((rowCount + pageSize - 1) / pageSize);
}

int PagePlanner::clampPage(int pageIndex, int pageCount) {
    return std::clamp(pageIndex, 0, std::max(pageCount - 1, 0));
}

PageRequest PagePlanner::plan(const PageRequest& desired, qint64 rowCount) {
    PageRequest r = desired;
    if (r.pageSize < 1) r.pageSize = 1;
    if (r.sort.isNone()) r.sort = SortSpec::none(); // una sola forma de "sin orden"
    if (rowCount < 0) {
        // total desconocido: sólo el límite inferior; el worker re-planifica con el conteo real
        r.pageIndex = std::max(r.pageIndex, 0);
        return r;
    }
    r.pageIndex = clampPage(r.pageIndex, pageCount(rowCount, r.pageSize));
    return r;
}

int PagePlanner::anchoredPageIndex(int oldIndex, int oldSize, int newSize) {
    if (oldIndex <= 0 || oldSize <= 0 || newSize <= 0) return 0;
    return int((qint64(oldIndex) * oldSize) / newSize);
}

PagePlanner::Window PagePlanner::window(const PageRequest& r) {
    Window w;
    w.offset = qint64(std::max(r.pageIndex, 0)) * std::max(r.pageSize, 1);
    w.limit  = std::max(r.pageSize, 1);
    return w;
}

bool PagePlanner::validateSort(const SortSpec& s, const Schema& schema, SourceError* err) {
    if (s.isNone()) return true;
    if (s.column >= schema.size()) {
        if (err) *err = SourceError::make(SourceError::Kind::InvalidSort,
                                          tr("Columna de orden fuera de rango: %1 (hay %2 columnas).")
                                              .arg(s.column).arg(schema.size()));
        return false;
    }
    const ColumnDef& col = schema[s.column];
    if (!TableTypes::isSortable(col.type)) {
        if (err) *err = SourceError::make(SourceError::Kind::InvalidSort,
                                          tr("La columna \"%1\" no se puede ordenar (%2).")
                                              .arg(col.name, TableTypes::typeName(col.type)));
        return false;
    }
    return true;
}

bool PagePlanner::validatePageSize(int pageSize, QString* err) {
    if (pageSize >= 1) return true;
    if (err) *err = tr("Tamaño de página inválido: %1 (mínimo 1).").arg(pageSize);
    return false;
}
