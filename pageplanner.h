#pragma once
#include <QCoreApplication>
#include "tabletypes.h"

/**
 * PagePlanner
 * -----------
 * Funciones puras (sin estado ni efectos) que convierten el estado deseado
 * (orden, página, tamaño de página) y el total de filas conocido en una
 * PageRequest canónica.
 *
 *  - pageCount = ceil(rowCount / pageSize), 0 si no hay filas
 *  - la página siempre queda en [0, max(pageCount-1, 0)]
 *  - al cambiar el tamaño de página se conserva visible la primera fila
 */
class PagePlanner {
    Q_DECLARE_TR_FUNCTIONS(PagePlanner)
public:
    struct Window {
        qint64 offset = 0;
        int    limit  = 0;
    };

    static int pageCount(qint64 rowCount, int pageSize);
    static int clampPage(int pageIndex, int pageCount);

    // Petición final: misma fuente/orden/filtro, página recortada al rango válido.
    // rowCount < 0 = desconocido (sólo se evita la página negativa).
    static PageRequest plan(const PageRequest& desired, qint64 rowCount);

    // floor(oldIndex * oldSize / newSize)
    static int anchoredPageIndex(int oldIndex, int oldSize, int newSize);

    static Window window(const PageRequest& r);

    static bool validateSort(const SortSpec& s, const Schema& schema, SourceError* err = nullptr);
    static bool validatePageSize(int pageSize, QString* err = nullptr);
};
