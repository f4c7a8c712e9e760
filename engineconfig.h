#pragma once
#include <QCoreApplication>
#include <QJsonObject>
#include <QList>
#include <QString>

/**
 * Configuración del motor, guardada como JSON ("pagebrowser.json").
 * Claves desconocidas se ignoran; valores inválidos se rechazan con mensaje.
 */
struct EngineConfig {
    Q_DECLARE_TR_FUNCTIONS(EngineConfig)
public:
    static const char* kDefaultFile;

    QList<int> pageSizeOptions{10, 25, 50, 100};  // opciones del menú; cualquier tamaño >= 1 vale
    int  defaultPageSize  = 25;
    int  cacheCapacity    = 64;
    int  workerThreads    = 0;      // 0 = QThread::idealThreadCount()
    int  fetchTimeoutMs   = 30000;  // <= 0 sin límite
    bool reloadOnMutation = true;
    bool watchFiles       = false;

    bool isRecognizedPageSize(int size) const { return pageSizeOptions.contains(size); }
    int  effectiveWorkerThreads() const;

    QJsonObject toJson() const;
    static bool fromJson(const QJsonObject& o, EngineConfig& out, QString* err = nullptr);

    static bool load(const QString& file, EngineConfig& out, QString* err = nullptr);
    bool save(const QString& file, QString* err = nullptr) const;
};
