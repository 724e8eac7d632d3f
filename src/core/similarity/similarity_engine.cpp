#include "core/similarity/similarity_engine.h"
#include "core/catalog/book_catalog.h"
#include "core/shared/logging.h"

#include <QElapsedTimer>

namespace folio {

QJsonObject SimilarityStats::toJson() const
{
    QJsonObject json;
    json[QStringLiteral("documents")] = documents;
    json[QStringLiteral("vocabularySize")] = vocabularySize;
    json[QStringLiteral("buildTimeMs")] = static_cast<double>(buildTimeMs);
    json[QStringLiteral("generation")] = static_cast<double>(generation);
    json[QStringLiteral("builtAt")] = builtAt.isValid()
        ? builtAt.toUTC().toString(Qt::ISODateWithMs) : QString();
    return json;
}

SimilarityEngine::SimilarityEngine()
    : m_index(std::make_shared<const SimilarityIndex>())
{
}

void SimilarityEngine::rebuild(const QVector<CorpusDocument>& corpus)
{
    QElapsedTimer timer;
    timer.start();

    auto index = std::make_shared<const SimilarityIndex>(SimilarityIndex::build(corpus));
    const qint64 elapsedMs = timer.elapsed();

    uint64_t generation = 0;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_index = index;
        m_stats.documents = index->documentCount();
        m_stats.vocabularySize = index->vocabularySize();
        m_stats.buildTimeMs = elapsedMs;
        m_stats.generation += 1;
        m_stats.builtAt = QDateTime::currentDateTimeUtc();
        generation = m_stats.generation;
    }

    LOG_INFO(folioSimilarity, "Similarity index generation %llu: %d documents, %d terms (%lld ms)",
             static_cast<unsigned long long>(generation), index->documentCount(),
             index->vocabularySize(), static_cast<long long>(elapsedMs));
}

void SimilarityEngine::rebuildFromCatalog(BookCatalog& catalog)
{
    const qint64 pulledAtMs = QDateTime::currentMSecsSinceEpoch();
    const QVector<CatalogBook> books = catalog.pullAll();

    QVector<CorpusDocument> corpus;
    corpus.reserve(books.size());
    for (const CatalogBook& book : books) {
        corpus.append({book.bookId, indexableText(book)});
    }
    rebuild(corpus);

    std::lock_guard<std::mutex> lock(m_mutex);
    m_lastCatalogPullMs = pulledAtMs;
}

bool SimilarityEngine::refreshFromCatalog(BookCatalog& catalog)
{
    qint64 sinceMs = 0;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        sinceMs = m_lastCatalogPullMs;
    }
    if (sinceMs > 0 && catalog.pullChangedSince(sinceMs).isEmpty()) {
        LOG_DEBUG(folioSimilarity, "Catalog unchanged; keeping current index");
        return false;
    }
    rebuildFromCatalog(catalog);
    return true;
}

std::shared_ptr<const SimilarityIndex> SimilarityEngine::snapshot() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_index;
}

QVector<SimilarityHit> SimilarityEngine::query(const SparseVector& vector, int k,
                                               double thresholdMin) const
{
    return snapshot()->query(vector, k, thresholdMin);
}

QVector<SimilarityHit> SimilarityEngine::queryText(const QString& text, int k,
                                                   double thresholdMin) const
{
    return snapshot()->queryText(text, k, thresholdMin);
}

QVector<SimilarityHit> SimilarityEngine::similarToBook(const QString& bookId, int k,
                                                       double thresholdMin) const
{
    return snapshot()->similarToBook(bookId, k, thresholdMin);
}

std::optional<SparseVector> SimilarityEngine::vectorFor(const QString& bookId) const
{
    return snapshot()->vectorFor(bookId);
}

double SimilarityEngine::compareTexts(const QString& a, const QString& b) const
{
    const std::shared_ptr<const SimilarityIndex> index = snapshot();
    return SimilarityIndex::cosine(index->vectorize(a), index->vectorize(b));
}

SimilarityStats SimilarityEngine::stats() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_stats;
}

} // namespace folio
