#include "tabletypes.h"

#include <QDate>
#include <QDateTime>
#include <QTime>
#include <QByteArray>
#include <QCoreApplication>
#include <QtNumeric>

#include <limits>

/* ====================== Hash / igualdad ====================== */

size_t qHash(const SortSpec& s, size_t seed) noexcept {
    // "sin orden" tiene una sola representación
    if (s.isNone()) return qHash(-1, seed);
    return qHashMulti(seed, s.column, int(s.order));
}

size_t qHash(const PageRequest& r, size_t seed) noexcept {
    return qHashMulti(seed, r.source, r.sort, r.pageIndex, r.pageSize, r.filter);
}

int PageResult::pageCount() const {
    if (totalRows <= 0 || request.pageSize <= 0) return 0;
    return int((totalRows + request.pageSize - 1) / request.pageSize);
}

QString errorKindName(SourceError::Kind k) {
    switch (k) {
    case SourceError::Kind::None:                 return QStringLiteral("None");
    case SourceError::Kind::SourceUnavailable:    return QStringLiteral("SourceUnavailable");
    case SourceError::Kind::InvalidSort:          return QStringLiteral("InvalidSort");
    case SourceError::Kind::Timeout:              return QStringLiteral("Timeout");
    case SourceError::Kind::StaleResultDiscarded: return QStringLiteral("StaleResultDiscarded");
    }
    return QStringLiteral("Unknown");
}

QDebug operator<<(QDebug dbg, const PageRequest& r) {
    QDebugStateSaver saver(dbg);
    dbg.nospace() << "PageRequest(" << r.source << ", page " << r.pageIndex << "x" << r.pageSize;
    if (!r.sort.isNone())
        dbg << ", col " << r.sort.column << (r.sort.order == Qt::AscendingOrder ? " asc" : " desc");
    if (!r.filter.isEmpty()) dbg << ", filter " << r.filter;
    dbg << ')';
    return dbg;
}

namespace TableTypes {

/* ====================== Tipos ====================== */

ColumnType typeFromDecl(const QString& decl) {
    const QString s = decl.trimmed().toUpper();
    if (s.isEmpty())                                   return ColumnType::Text;
    if (s.startsWith(u"BOOL"))                         return ColumnType::Boolean;
    if (s.contains(u"DATE") || s.contains(u"TIME"))    return ColumnType::Temporal;
    if (s.contains(u"INT"))                            return ColumnType::Numeric;
    if (s.contains(u"CHAR") || s.contains(u"CLOB") || s.contains(u"TEXT"))
        return ColumnType::Text;
    if (s.contains(u"BLOB"))                           return ColumnType::Blob;
    if (s.contains(u"REAL") || s.contains(u"FLOA") || s.contains(u"DOUB")
        || s.startsWith(u"NUMERIC") || s.startsWith(u"DECIMAL") || s.startsWith(u"MONEY"))
        return ColumnType::Numeric;
    return ColumnType::Text; // por defecto
}

ColumnType typeFromVariant(const QVariant& v) {
    switch (v.metaType().id()) {
    case QMetaType::Bool:
        return ColumnType::Boolean;
    case QMetaType::Int:
    case QMetaType::UInt:
    case QMetaType::LongLong:
    case QMetaType::ULongLong:
    case QMetaType::Double:
    case QMetaType::Float:
        return ColumnType::Numeric;
    case QMetaType::QDate:
    case QMetaType::QDateTime:
    case QMetaType::QTime:
        return ColumnType::Temporal;
    case QMetaType::QByteArray:
        return ColumnType::Blob;
    default:
        return ColumnType::Text;
    }
}

static bool looksBoolean(const QString& s) {
    const QString t = s.trimmed().toLower();
    return t == "true" || t == "false";
}

// declarada más abajo (normalización)
static QDateTime parseDateTime(const QString& s);
static QDate parseDate(const QString& s);

ColumnType inferType(const QVector<QVariant>& cells) {
    bool anyText = false, allNum = true, allDate = true, allBool = true;
    bool haveTyped = false, mixed = false;
    ColumnType typed = ColumnType::Text;

    for (const QVariant& v : cells) {
        if (isNullCell(v)) continue;
        if (v.metaType().id() == QMetaType::QString) {
            const QString s = v.toString().trimmed();
            if (s.isEmpty()) continue;
            anyText = true;
            bool ok = false;
            s.toDouble(&ok);
            if (!ok) allNum = false;
            if (!parseDateTime(s).isValid() && !parseDate(s).isValid()) allDate = false;
            if (!looksBoolean(s)) allBool = false;
            continue;
        }
        const ColumnType t = typeFromVariant(v);
        if (!haveTyped) { typed = t; haveTyped = true; }
        else if (typed != t) mixed = true;
    }

    if (haveTyped) {
        // celdas tipadas mezcladas entre sí o con texto -> texto
        if (mixed || anyText) return ColumnType::Text;
        return typed;
    }
    if (!anyText) return ColumnType::Text;
    if (allNum)   return ColumnType::Numeric;
    if (allBool)  return ColumnType::Boolean;
    if (allDate)  return ColumnType::Temporal;
    return ColumnType::Text;
}

QString typeName(ColumnType t) {
    switch (t) {
    case ColumnType::Numeric:  return QStringLiteral("numeric");
    case ColumnType::Text:     return QStringLiteral("text");
    case ColumnType::Temporal: return QStringLiteral("temporal");
    case ColumnType::Boolean:  return QStringLiteral("boolean");
    case ColumnType::Blob:     return QStringLiteral("blob");
    }
    return QStringLiteral("text");
}

bool isNullCell(const QVariant& v) {
    return !v.isValid() || v.isNull();
}

bool isSortable(ColumnType t) {
    return t != ColumnType::Blob;
}

/* ====================== Normalización ====================== */

static QDateTime parseDateTime(const QString& s) {
    QDateTime dt = QDateTime::fromString(s, Qt::ISODateWithMs);
    if (!dt.isValid()) dt = QDateTime::fromString(s, Qt::ISODate);
    if (!dt.isValid()) dt = QDateTime::fromString(s, QStringLiteral("yyyy-MM-dd HH:mm:ss"));
    if (!dt.isValid()) dt = QDateTime::fromString(s, QStringLiteral("yyyy-MM-dd HH:mm"));
    return dt;
}

static QDate parseDate(const QString& s) {
    QDate d = QDate::fromString(s, Qt::ISODate);
    if (!d.isValid()) d = QDate::fromString(s, QStringLiteral("dd/MM/yyyy"));
    if (!d.isValid()) d = QDate::fromString(s, QStringLiteral("dd-MM-yyyy"));
    return d;
}

QDateTime toDateTime(const QVariant& v) {
    switch (v.metaType().id()) {
    case QMetaType::QDateTime: return v.toDateTime();
    case QMetaType::QDate:     return v.toDate().startOfDay();
    case QMetaType::QTime:     return QDateTime(QDate(1970, 1, 1), v.toTime());
    default: break;
    }
    const QString s = v.toString().trimmed();
    QDateTime dt = parseDateTime(s);
    if (dt.isValid()) return dt;
    const QDate d = parseDate(s);
    return d.isValid() ? d.startOfDay() : QDateTime();
}

QVariant normalizeCell(ColumnType t, const QVariant& v) {
    if (isNullCell(v)) return QVariant();

    const int id = v.metaType().id();
    const bool isString = (id == QMetaType::QString);

    switch (t) {
    case ColumnType::Numeric: {
        if (!isString) return v;
        const QString s = v.toString().trimmed();
        if (s.isEmpty()) return QVariant();
        bool ok = false;
        const qint64 i = s.toLongLong(&ok);
        if (ok) return i;
        const double d = s.toDouble(&ok);
        if (ok) return d;
        return v;
    }
    case ColumnType::Temporal: {
        if (id == QMetaType::QDate || id == QMetaType::QDateTime || id == QMetaType::QTime)
            return v;
        const QString s = v.toString().trimmed();
        if (s.isEmpty()) return QVariant();
        const QDateTime dt = parseDateTime(s);
        if (dt.isValid()) return dt;
        const QDate d = parseDate(s);
        if (d.isValid()) return d;
        return v;
    }
    case ColumnType::Boolean: {
        if (id == QMetaType::Bool) return v;
        const QString s = v.toString().trimmed().toLower();
        if (s.isEmpty()) return QVariant();
        if (s == "1" || s == "true" || s == "yes" || s == "sí" || s == "si") return true;
        if (s == "0" || s == "false" || s == "no")                           return false;
        return v;
    }
    case ColumnType::Text:
        if (isString && v.toString().isEmpty()) return QVariant();
        return v;
    case ColumnType::Blob:
        return v;
    }
    return v;
}

/* ====================== Comparación ====================== */

static int cmp3(double a, double b) { return (a < b) ? -1 : (b < a ? 1 : 0); }

/* Clave numérica de una celda: rank 0 = número, 1 = NaN, 2 = no numérico.
   Los enteros se conservan como qint64 para no perder precisión sobre 2^53. */
struct NumericKey {
    int    rank = 2;
    bool   isInt = false;
    qint64 i = 0;
    double d = 0.0;
};

static NumericKey numericKey(const QVariant& v) {
    NumericKey k;
    bool ok = false;
    switch (v.metaType().id()) {
    case QMetaType::Int:
    case QMetaType::UInt:
    case QMetaType::LongLong:
        k.rank = 0; k.isInt = true; k.i = v.toLongLong();
        return k;
    case QMetaType::ULongLong: {
        const qulonglong u = v.toULongLong();
        if (u <= qulonglong(std::numeric_limits<qint64>::max())) {
            k.rank = 0; k.isInt = true; k.i = qint64(u);
            return k;
        }
        k.d = double(u);
        ok = true;
        break;
    }
    case QMetaType::QString: {
        const QString s = v.toString().trimmed();
        k.i = s.toLongLong(&ok);
        if (ok) { k.rank = 0; k.isInt = true; return k; }
        k.d = s.toDouble(&ok);
        break;
    }
    default:
        k.d = v.toDouble(&ok);
        break;
    }
    if (!ok) return k;
    k.rank = qIsNaN(k.d) ? 1 : 0;
    return k;
}

// Entero contra double sin pasar el entero a double.
static int cmpIntDouble(qint64 i, double d) {
    if (d >= 9223372036854775808.0) return -1;   // 2^63
    if (d < -9223372036854775808.0) return 1;
    const qint64 t = qint64(d);                  // trunca hacia cero, exacto en este rango
    if (i != t) return (i < t) ? -1 : 1;
    const double frac = d - double(t);
    return (frac > 0) ? -1 : (frac < 0 ? 1 : 0);
}

static int compareNumeric(const NumericKey& a, const NumericKey& b) {
    if (a.isInt && b.isInt) return (a.i < b.i) ? -1 : (b.i < a.i ? 1 : 0);
    if (a.isInt)            return cmpIntDouble(a.i, b.d);
    if (b.isInt)            return -cmpIntDouble(b.i, a.d);
    return cmp3(a.d, b.d);
}

static bool isNaNCell(ColumnType t, const QVariant& v) {
    return t == ColumnType::Numeric && numericKey(v).rank == 1;
}

int compareCells(ColumnType t, const QVariant& a, const QVariant& b) {
    switch (t) {
    case ColumnType::Numeric: {
        const NumericKey ka = numericKey(a);
        const NumericKey kb = numericKey(b);
        // números, luego NaN, luego basura textual
        if (ka.rank != kb.rank) return (ka.rank < kb.rank) ? -1 : 1;
        if (ka.rank == 0) return compareNumeric(ka, kb);
        if (ka.rank == 1) return 0;
        break;
    }
    case ColumnType::Temporal: {
        const QDateTime da = toDateTime(a);
        const QDateTime db = toDateTime(b);
        if (da.isValid() && db.isValid()) return (da < db) ? -1 : (db < da ? 1 : 0);
        if (da.isValid() != db.isValid()) return da.isValid() ? -1 : 1;
        break;
    }
    case ColumnType::Boolean:
        return int(a.toBool()) - int(b.toBool());
    case ColumnType::Blob: {
        const QByteArray ba = a.toByteArray();
        const QByteArray bb = b.toByteArray();
        return (ba < bb) ? -1 : (bb < ba ? 1 : 0);
    }
    case ColumnType::Text:
        break;
    }
    const int c = QString::compare(cellText(a), cellText(b), Qt::CaseSensitive);
    return (c < 0) ? -1 : (c > 0 ? 1 : 0);
}

bool lessForSort(ColumnType t, Qt::SortOrder order, const QVariant& a, const QVariant& b) {
    // NaN cuenta como nulo al ordenar
    const bool nullA = isNullCell(a) || isNaNCell(t, a);
    const bool nullB = isNullCell(b) || isNaNCell(t, b);
    // nulos al final sin importar la dirección
    if (nullA || nullB) return !nullA && nullB;

    const int c = compareCells(t, a, b);
    return (order == Qt::AscendingOrder) ? (c < 0) : (c > 0);
}

/* ====================== Texto / búsqueda ====================== */

QString cellText(const QVariant& v) {
    if (isNullCell(v)) return QString();
    switch (v.metaType().id()) {
    case QMetaType::QDateTime: return v.toDateTime().toString(Qt::ISODate);
    case QMetaType::QDate:     return v.toDate().toString(Qt::ISODate);
    case QMetaType::QTime:     return v.toTime().toString(Qt::ISODate);
    case QMetaType::Bool:      return v.toBool() ? QStringLiteral("true") : QStringLiteral("false");
    case QMetaType::Double:
    case QMetaType::Float:     return QString::number(v.toDouble(), 'g', 15);
    case QMetaType::QByteArray:
        return QCoreApplication::translate("TableTypes", "<%1 bytes>").arg(v.toByteArray().size());
    default:                   return v.toString();
    }
}

bool rowMatches(const Record& r, const QString& term) {
    if (term.isEmpty()) return true;
    for (const QVariant& c : r) {
        if (cellText(c).contains(term, Qt::CaseInsensitive)) return true;
    }
    return false;
}

} // namespace TableTypes
