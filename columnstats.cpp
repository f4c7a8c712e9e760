#include "columnstats.h"

#include <QHash>
#include <QtMath>
#include <QtNumeric>
#include <algorithm>
#include <cmath>

static ColumnStats::Kind kindFor(ColumnType t) {
    switch (t) {
    case ColumnType::Numeric:  return ColumnStats::Kind::Numeric;
    case ColumnType::Temporal: return ColumnStats::Kind::Temporal;
    default:                   return ColumnStats::Kind::Categorical;
    }
}

// Cuantil con interpolación lineal sobre valores ya ordenados (no vacío).
static double quantile(const QVector<double>& sorted, double p) {
    const double pos = p * double(sorted.size() - 1);
    const int lo = int(std::floor(pos));
    const int hi = std::min(lo + 1, int(sorted.size()) - 1);
    return sorted[lo] + (sorted[hi] - sorted[lo]) * (pos - lo);
}

/* ====================== Numérica / temporal ====================== */

static void fillNumeric(ColumnStats& st, QVector<double> values) {
    st.count = values.size();
    if (values.isEmpty()) return;
    std::sort(values.begin(), values.end());

    double sum = 0;
    for (double v : values) sum += v;
    const double mean = sum / values.size();

    st.mean   = mean;
    st.min    = values.first();
    st.q25    = quantile(values, 0.25);
    st.median = quantile(values, 0.50);
    st.q75    = quantile(values, 0.75);
    st.max    = values.last();

    if (values.size() > 1) {
        double acc = 0;
        for (double v : values) acc += (v - mean) * (v - mean);
        st.stddev = std::sqrt(acc / (values.size() - 1));
    }
}

static QVariant fromMSecs(double ms) {
    return QDateTime::fromMSecsSinceEpoch(qint64(std::llround(ms)));
}

static void fillTemporal(ColumnStats& st, QVector<double> msecs) {
    st.count = msecs.size();
    if (msecs.isEmpty()) return;
    std::sort(msecs.begin(), msecs.end());

    // la suma en long double evita perder milisegundos con muchas fechas
    long double sum = 0;
    for (double v : msecs) sum += v;

    st.mean   = fromMSecs(double(sum / msecs.size()));
    st.min    = fromMSecs(msecs.first());
    st.q25    = fromMSecs(quantile(msecs, 0.25));
    st.median = fromMSecs(quantile(msecs, 0.50));
    st.q75    = fromMSecs(quantile(msecs, 0.75));
    st.max    = fromMSecs(msecs.last());
}

/* ====================== Categórica ====================== */

static QString categoryKey(const QVariant& v) {
    if (v.metaType().id() == QMetaType::QByteArray)
        return QString::fromLatin1(v.toByteArray().toHex());
    return TableTypes::cellText(v);
}

static void fillCategorical(ColumnStats& st, const QVector<QVariant>& cells) {
    QHash<QString, qint64> counts;
    QVector<QString> keys;          // en orden de aparición
    QVector<QVariant> firstValue;
    for (const QVariant& v : cells) {
        if (TableTypes::isNullCell(v)) continue;
        const QString key = categoryKey(v);
        ++st.count;
        auto it = counts.find(key);
        if (it == counts.end()) {
            counts.insert(key, 1);
            keys.push_back(key);
            firstValue.push_back(v);
        } else {
            ++it.value();
        }
    }
    st.unique = keys.size();

    // empate: gana el que apareció primero
    for (int i = 0; i < keys.size(); ++i) {
        const qint64 c = counts.value(keys[i]);
        if (c > st.freq) {
            st.freq = c;
            st.top = firstValue[i];
        }
    }
}

/* ====================== ColumnStats ====================== */

ColumnStats ColumnStats::compute(const ColumnDef& col, const QVector<QVariant>& cells) {
    ColumnStats st;
    st.column = col.name;
    st.type = col.type;
    st.kind = kindFor(col.type);

    switch (st.kind) {
    case Kind::Numeric: {
        QVector<double> values;
        values.reserve(cells.size());
        for (const QVariant& v : cells) {
            if (TableTypes::isNullCell(v)) continue;
            bool ok = false;
            const double d = v.toDouble(&ok);
            if (ok && !qIsNaN(d)) values.push_back(d);
        }
        fillNumeric(st, std::move(values));
        break;
    }
    case Kind::Temporal: {
        QVector<double> msecs;
        msecs.reserve(cells.size());
        for (const QVariant& v : cells) {
            if (TableTypes::isNullCell(v)) continue;
            const QDateTime dt = TableTypes::toDateTime(v);
            if (dt.isValid()) msecs.push_back(double(dt.toMSecsSinceEpoch()));
        }
        fillTemporal(st, std::move(msecs));
        break;
    }
    case Kind::Categorical:
        fillCategorical(st, cells);
        break;
    }
    return st;
}

static QString statText(const QVariant& v) {
    if (!v.isValid()) return QStringLiteral("NaN");
    if (v.metaType().id() == QMetaType::QDateTime)
        return v.toDateTime().toString(QStringLiteral("yyyy-MM-dd HH:mm:ss"));
    if (v.metaType().id() == QMetaType::Double)
        return QString::number(v.toDouble(), 'f', 6);
    return TableTypes::cellText(v);
}

QList<QPair<QString, QString>> ColumnStats::lines() const {
    QList<QPair<QString, QString>> out;
    out << qMakePair(QStringLiteral("count"), QString::number(count));
    if (kind == Kind::Categorical) {
        out << qMakePair(QStringLiteral("unique"), QString::number(unique));
        if (count > 0) {
            out << qMakePair(QStringLiteral("top"), TableTypes::cellText(top));
            out << qMakePair(QStringLiteral("freq"), QString::number(freq));
        }
        return out;
    }
    out << qMakePair(QStringLiteral("mean"), statText(mean));
    if (kind == Kind::Numeric) out << qMakePair(QStringLiteral("std"), statText(stddev));
    out << qMakePair(QStringLiteral("min"), statText(min))
        << qMakePair(QStringLiteral("25%"), statText(q25))
        << qMakePair(QStringLiteral("50%"), statText(median))
        << qMakePair(QStringLiteral("75%"), statText(q75))
        << qMakePair(QStringLiteral("max"), statText(max));
    return out;
}

QString ColumnStats::toText() const {
    const QList<QPair<QString, QString>> ls = lines();
    int width = 0;
    for (const auto& l : ls) width = std::max(width, int(l.first.size()));

    QStringList out;
    out << column + u':';
    for (const auto& l : ls)
        out << l.first.leftJustified(width + 4) + l.second;
    out << tr("Tipo: %1").arg(TableTypes::typeName(type));
    return out.join(u'\n');
}

QString describeText(const QList<ColumnStats>& stats) {
    QStringList blocks;
    for (const ColumnStats& s : stats) blocks << s.toText();
    return blocks.join(QStringLiteral("\n\n"));
}
