#include "engineconfig.h"
#include <QFile>
#include <QJsonArray>
#include <QJsonDocument>
#include <QThread>
#include <QDebug>
#include <algorithm>

const char* EngineConfig::kDefaultFile = "pagebrowser.json";

int EngineConfig::effectiveWorkerThreads() const {
    if (workerThreads > 0) return workerThreads;
    return std::max(QThread::idealThreadCount(), 1);
}

QJsonObject EngineConfig::toJson() const {
    QJsonArray sizes;
    for (int s : pageSizeOptions) sizes.append(s);

    QJsonObject o;
    o["pageSizeOptions"]  = sizes;
    o["defaultPageSize"]  = defaultPageSize;
    o["cacheCapacity"]    = cacheCapacity;
    o["workerThreads"]    = workerThreads;
    o["fetchTimeoutMs"]   = fetchTimeoutMs;
    o["reloadOnMutation"] = reloadOnMutation;
    o["watchFiles"]       = watchFiles;
    return o;
}

// Lee un entero opcional; false si existe pero no es número entero.
static bool readInt(const QJsonObject& o, const char* key, int& out) {
    if (!o.contains(key)) return true;
    const QJsonValue v = o.value(key);
    if (!v.isDouble()) return false;
    const double d = v.toDouble();
    if (d != double(int(d))) return false;
    out = int(d);
    return true;
}

static bool readBool(const QJsonObject& o, const char* key, bool& out) {
    if (!o.contains(key)) return true;
    const QJsonValue v = o.value(key);
    if (!v.isBool()) return false;
    out = v.toBool();
    return true;
}

bool EngineConfig::fromJson(const QJsonObject& o, EngineConfig& out, QString* err) {
    EngineConfig c;   // parte de los valores por defecto

    if (o.contains("pageSizeOptions")) {
        const QJsonValue v = o.value("pageSizeOptions");
        if (!v.isArray()) { if (err) *err = tr("pageSizeOptions debe ser una lista"); return false; }
        QList<int> sizes;
        for (const QJsonValue& e : v.toArray()) {
            const int s = e.toInt(0);
            if (!e.isDouble() || s < 1) {
                if (err) *err = tr("pageSizeOptions: tamaño inválido (mínimo 1)");
                return false;
            }
            if (!sizes.contains(s)) sizes << s;
        }
        if (sizes.isEmpty()) { if (err) *err = tr("pageSizeOptions está vacía"); return false; }
        std::sort(sizes.begin(), sizes.end());
        c.pageSizeOptions = sizes;
    }

    if (!readInt(o, "defaultPageSize", c.defaultPageSize) || c.defaultPageSize < 1) {
        if (err) *err = tr("defaultPageSize inválido (mínimo 1)");
        return false;
    }
    if (!readInt(o, "cacheCapacity", c.cacheCapacity) || c.cacheCapacity < 1) {
        if (err) *err = tr("cacheCapacity inválido (mínimo 1)");
        return false;
    }
    if (!readInt(o, "workerThreads", c.workerThreads) || c.workerThreads < 0) {
        if (err) *err = tr("workerThreads inválido (0 = automático)");
        return false;
    }
    if (!readInt(o, "fetchTimeoutMs", c.fetchTimeoutMs)) {
        if (err) *err = tr("fetchTimeoutMs debe ser un entero");
        return false;
    }
    if (!readBool(o, "reloadOnMutation", c.reloadOnMutation)) {
        if (err) *err = tr("reloadOnMutation debe ser true/false");
        return false;
    }
    if (!readBool(o, "watchFiles", c.watchFiles)) {
        if (err) *err = tr("watchFiles debe ser true/false");
        return false;
    }

    out = c;
    return true;
}

bool EngineConfig::load(const QString& file, EngineConfig& out, QString* err) {
    QFile f(file);
    if (!f.exists()) {
        // sin archivo: valores por defecto
        out = EngineConfig();
        return true;
    }
    if (!f.open(QIODevice::ReadOnly)) {
        if (err) *err = tr("No se pudo leer %1").arg(file);
        return false;
    }
    QJsonParseError pe;
    const auto doc = QJsonDocument::fromJson(f.readAll(), &pe);
    if (pe.error != QJsonParseError::NoError || !doc.isObject()) {
        if (err) *err = tr("%1 no es un JSON válido: %2").arg(file, pe.errorString());
        qWarning() << "[pagebrowser] configuración inválida:" << file << pe.errorString();
        return false;
    }
    QString why;
    if (!fromJson(doc.object(), out, &why)) {
        if (err) *err = tr("%1: %2").arg(file, why);
        qWarning() << "[pagebrowser] configuración inválida:" << file << why;
        return false;
    }
    return true;
}

bool EngineConfig::save(const QString& file, QString* err) const {
    QFile f(file);
    if (!f.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        if (err) *err = tr("No se pudo escribir %1").arg(file);
        return false;
    }
    f.write(QJsonDocument(toJson()).toJson(QJsonDocument::Indented));
    return true;
}
