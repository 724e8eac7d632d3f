#pragma once

#include "core/shared/types.h"

#include <QVector>

namespace folio {

// Source of the book corpus the similarity index is built from.
class BookCatalog {
public:
    virtual ~BookCatalog() = default;

    virtual QVector<CatalogBook> pullAll() = 0;
    virtual QVector<CatalogBook> pullChangedSince(qint64 sinceMs) = 0;
};

} // namespace folio
