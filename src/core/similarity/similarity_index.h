#pragma once

#include <QHash>
#include <QString>
#include <QVector>

#include <optional>

namespace folio {

// Sparse TF-IDF vector keyed by vocabulary term index.
using SparseVector = QHash<int, double>;

struct CorpusDocument {
    QString id;
    QString text;
};

struct SimilarityHit {
    QString bookId;
    double similarity = 0.0;
};

// SimilarityIndex -- immutable TF-IDF index over the book corpus.
//
// TF = count / document length, IDF = ln(N / df). Once built an index is never
// mutated, so any number of threads may query it concurrently. Rebuilds
// produce a new instance (see SimilarityEngine).
class SimilarityIndex {
public:
    SimilarityIndex() = default;

    // O(N * V). Documents with an empty id are skipped; for duplicate ids the
    // first occurrence wins.
    static SimilarityIndex build(const QVector<CorpusDocument>& corpus);

    int documentCount() const { return m_bookIds.size(); }
    int vocabularySize() const { return m_terms.size(); }
    bool isEmpty() const { return m_bookIds.isEmpty(); }
    bool contains(const QString& bookId) const { return m_rowByBookId.contains(bookId); }

    // IDF of a term, or nullopt when the term is not in the vocabulary.
    std::optional<double> idf(const QString& term) const;

    std::optional<SparseVector> vectorFor(const QString& bookId) const;

    // Vectorises free text with this index's vocabulary and IDF weights.
    // Terms outside the vocabulary are dropped.
    SparseVector vectorize(const QString& text) const;

    // At most k hits with similarity >= thresholdMin, sorted by similarity
    // descending and bookId ascending on ties. Zero-norm books never match.
    QVector<SimilarityHit> query(const SparseVector& vector, int k, double thresholdMin) const;
    QVector<SimilarityHit> queryText(const QString& text, int k, double thresholdMin) const;
    // Same as query() on the book's own vector, excluding the book itself.
    QVector<SimilarityHit> similarToBook(const QString& bookId, int k, double thresholdMin) const;

    static double cosine(const SparseVector& a, const SparseVector& b);
    static double norm(const SparseVector& v);

private:
    QHash<QString, int> m_termIndex;
    QVector<QString> m_terms;
    QVector<double> m_idf;

    QVector<QString> m_bookIds;
    QVector<SparseVector> m_vectors;
    QVector<double> m_norms;
    QHash<QString, int> m_rowByBookId;
};

} // namespace folio
