#include "core/catalog/store_book_catalog.h"
#include "core/store/reward_store.h"

namespace folio {

StoreBookCatalog::StoreBookCatalog(RewardStore& store)
    : m_store(store)
{
}

QVector<CatalogBook> StoreBookCatalog::pullAll()
{
    return m_store.books();
}

QVector<CatalogBook> StoreBookCatalog::pullChangedSince(qint64 sinceMs)
{
    return m_store.booksChangedSince(sinceMs);
}

} // namespace folio
