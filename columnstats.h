#pragma once
#include <QCoreApplication>
#include <QList>
#include <QPair>
#include <QStringList>
#include <QString>
#include <QVariant>
#include <QVector>
#include "tabletypes.h"

/* ======================== Estadística descriptiva ======================== */
// Resumen de una columna completa (sin filtro), como el "describe" clásico:
//  - numérica: count, mean, std, min, 25%, 50%, 75%, max
//  - temporal: count, mean, min, 25%, 50%, 75%, max (sin std)
//  - texto / booleana / blob: count, unique, top, freq
// count no incluye nulos ni NaN. Los cuartiles interpolan linealmente.
struct ColumnStats {
    Q_DECLARE_TR_FUNCTIONS(ColumnStats)
public:
    enum class Kind { Numeric, Temporal, Categorical };

    QString    column;
    ColumnType type = ColumnType::Text;
    Kind       kind = Kind::Categorical;
    qint64     count = 0;

    // numérica (double) o temporal (QDateTime); inválidos si no hay datos
    QVariant mean;
    QVariant stddev;       // desviación muestral; inválida con menos de 2 valores
    QVariant min;
    QVariant q25;
    QVariant median;
    QVariant q75;
    QVariant max;

    // categórica
    qint64   unique = 0;
    QVariant top;          // el más frecuente (el primero que aparece si hay empate)
    qint64   freq = 0;

    static ColumnStats compute(const ColumnDef& col, const QVector<QVariant>& cells);

    // Pares etiqueta/valor en el orden en que se muestran.
    QList<QPair<QString, QString>> lines() const;
    QString toText() const;
};

QString describeText(const QList<ColumnStats>& stats);

Q_DECLARE_METATYPE(ColumnStats)
