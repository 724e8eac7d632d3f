#pragma once

#include "core/catalog/book_catalog.h"

namespace folio {

class RewardStore;

// Reads the corpus from the store's books table.
class StoreBookCatalog : public BookCatalog {
public:
    explicit StoreBookCatalog(RewardStore& store);

    QVector<CatalogBook> pullAll() override;
    QVector<CatalogBook> pullChangedSince(qint64 sinceMs) override;

private:
    RewardStore& m_store;
};

} // namespace folio
