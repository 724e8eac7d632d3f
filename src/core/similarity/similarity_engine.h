#pragma once

#include "core/similarity/similarity_index.h"

#include <QDateTime>
#include <QJsonObject>

#include <cstdint>
#include <memory>
#include <mutex>

namespace folio {

class BookCatalog;

struct SimilarityStats {
    int documents = 0;
    int vocabularySize = 0;
    qint64 buildTimeMs = 0;
    uint64_t generation = 0;
    QDateTime builtAt;

    QJsonObject toJson() const;
};

// SimilarityEngine -- owns the current SimilarityIndex.
//
// Thread-safety: rebuild() builds the new index without holding any lock and
// then swaps the shared pointer under a short lock. Queries take a snapshot of
// the pointer and run lock-free, so they see either the old or the complete
// new index and never block on a rebuild.
class SimilarityEngine {
public:
    SimilarityEngine();

    void rebuild(const QVector<CorpusDocument>& corpus);
    void rebuildFromCatalog(BookCatalog& catalog);
    // Rebuilds only when the catalog reports changes since the last build.
    // Returns true when a rebuild happened.
    bool refreshFromCatalog(BookCatalog& catalog);

    std::shared_ptr<const SimilarityIndex> snapshot() const;

    QVector<SimilarityHit> query(const SparseVector& vector, int k, double thresholdMin) const;
    QVector<SimilarityHit> queryText(const QString& text, int k, double thresholdMin) const;
    QVector<SimilarityHit> similarToBook(const QString& bookId, int k, double thresholdMin) const;
    std::optional<SparseVector> vectorFor(const QString& bookId) const;

    // Cosine of two free texts vectorised with the current index. Returns 0
    // when either text shares no vocabulary with the corpus.
    double compareTexts(const QString& a, const QString& b) const;

    SimilarityStats stats() const;

private:
    mutable std::mutex m_mutex;
    std::shared_ptr<const SimilarityIndex> m_index;
    SimilarityStats m_stats;
    qint64 m_lastCatalogPullMs = 0;
};

} // namespace folio
