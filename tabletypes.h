#ifndef TABLETYPES_H
#define TABLETYPES_H

#include <QString>
#include <QStringList>
#include <QList>
#include <QVector>
#include <QDebug>
#include <QVariant>
#include <QMetaType>
#include <QHash>
#include <QDateTime>

/* ======================== Tipos de columna ======================== */
// Etiqueta de tipo: decide el comparador y el formato de despliegue.
enum class ColumnType { Numeric, Text, Temporal, Boolean, Blob };

struct ColumnDef {
    QString    name;
    ColumnType type = ColumnType::Text;
    QString    declType;   // tipo tal como lo reporta el backend ("INTEGER", "varchar(20)", ...)

    bool operator==(const ColumnDef& o) const {
        return name == o.name && type == o.type && declType == o.declType;
    }
};

// Un "Schema" es la lista de columnas de una fuente (en el orden en que se muestran).
using Schema = QList<ColumnDef>;
// Una fila de datos (mismo orden/longitud que el Schema). Celda nula = QVariant inválido/nulo.
using Record = QVector<QVariant>;

/* ======================== Orden / páginas ======================== */
struct SortSpec {
    int           column = -1;                 // -1 => sin orden (orden nativo de la fuente)
    Qt::SortOrder order  = Qt::AscendingOrder;

    bool isNone() const { return column < 0; }
    static SortSpec none() { return {}; }

    bool operator==(const SortSpec& o) const {
        if (isNone() && o.isNone()) return true;
        return column == o.column && order == o.order;
    }
    bool operator!=(const SortSpec& o) const { return !(*this == o); }
};

struct PageRequest {
    QString  source;        // identidad de la fuente
    SortSpec sort;
    int      pageIndex = 0; // >= 0
    int      pageSize  = 25; // > 0
    QString  filter;        // búsqueda simple (subcadena, sin mayúsculas/minúsculas); vacío = sin filtro

    bool operator==(const PageRequest& o) const {
        return source == o.source && sort == o.sort && pageIndex == o.pageIndex
               && pageSize == o.pageSize && filter == o.filter;
    }
    bool operator!=(const PageRequest& o) const { return !(*this == o); }
};

size_t qHash(const SortSpec& s, size_t seed = 0) noexcept;
size_t qHash(const PageRequest& r, size_t seed = 0) noexcept;

struct PageResult {
    PageRequest     request;     // la petición (ya normalizada) que responde
    QVector<Record> rows;
    qint64          totalRows = 0; // filas totales (tras filtro) al momento del fetch

    int    pageCount() const;
    qint64 firstRow() const { return qint64(request.pageIndex) * request.pageSize; }
    bool   isEmpty() const { return rows.isEmpty(); }

    bool operator==(const PageResult& o) const {
        return request == o.request && rows == o.rows && totalRows == o.totalRows;
    }
};

/* ======================== Errores ======================== */
struct SourceError {
    enum class Kind {
        None,
        SourceUnavailable,     // fuente cerrada / inaccesible
        InvalidSort,           // columna fuera de rango o no ordenable
        Timeout,               // se excedió el plazo del adaptador
        StaleResultDiscarded   // interno: resultado de una petición superada
    };

    Kind    kind = Kind::None;
    QString message;

    bool isError() const { return kind != Kind::None; }
    static SourceError make(Kind k, const QString& msg) { return {k, msg}; }
};

QString errorKindName(SourceError::Kind k);

QDebug operator<<(QDebug dbg, const PageRequest& r);

/* ======================== Utilidades de tipo ======================== */
namespace TableTypes {

// Mapea un tipo declarado (SQL u otro) a ColumnType según reglas de afinidad.
ColumnType typeFromDecl(const QString& decl);

// Deduce el tipo a partir de un QVariant ya tipado (celdas de hoja de cálculo).
ColumnType typeFromVariant(const QVariant& v);

// Deduce el tipo de una columna completa: celdas ya tipadas del mismo tipo -> ese tipo;
// sólo texto -> numérico/fecha/booleano si TODAS las celdas no vacías lo son; si no, texto.
ColumnType inferType(const QVector<QVariant>& cells);

QString typeName(ColumnType t);

bool isNullCell(const QVariant& v);
bool isSortable(ColumnType t);

// Convierte la celda al tipo de la columna (texto ISO -> QDateTime, "1" -> true, etc.).
// Si no se puede convertir, la deja como está.
QVariant normalizeCell(ColumnType t, const QVariant& v);

// Celda temporal (QDate, QDateTime, QTime o texto reconocible) como QDateTime; inválido si no se puede.
QDateTime toDateTime(const QVariant& v);

// Comparación por tipo: <0, 0, >0. No trata nulos (ver lessForSort).
int compareCells(ColumnType t, const QVariant& a, const QVariant& b);

// "a va antes que b" con la dirección indicada; los nulos van al final en ambas direcciones.
bool lessForSort(ColumnType t, Qt::SortOrder order, const QVariant& a, const QVariant& b);

// Texto de la celda usado para búsqueda y copia.
QString cellText(const QVariant& v);

// ¿Alguna celda de la fila contiene el término (sin distinguir mayúsculas)?
bool rowMatches(const Record& r, const QString& term);

} // namespace TableTypes

Q_DECLARE_METATYPE(ColumnDef)
Q_DECLARE_METATYPE(SortSpec)
Q_DECLARE_METATYPE(PageRequest)
Q_DECLARE_METATYPE(PageResult)
Q_DECLARE_METATYPE(SourceError)

#endif // TABLETYPES_H
