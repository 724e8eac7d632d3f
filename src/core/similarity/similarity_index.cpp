#include "core/similarity/similarity_index.h"
#include "core/similarity/text_tokenizer.h"

#include <algorithm>
#include <cmath>

namespace folio {

namespace {

QHash<QString, int> termCounts(const QStringList& tokens)
{
    QHash<QString, int> counts;
    for (const QString& token : tokens) {
        ++counts[token];
    }
    return counts;
}

bool hitLessThan(const SimilarityHit& a, const SimilarityHit& b)
{
    if (a.similarity != b.similarity) {
        return a.similarity > b.similarity;
    }
    return a.bookId < b.bookId;
}

} // namespace

SimilarityIndex SimilarityIndex::build(const QVector<CorpusDocument>& corpus)
{
    SimilarityIndex index;

    QVector<QHash<QString, int>> counts;
    QVector<int> lengths;
    QHash<QString, int> documentFrequency;

    for (const CorpusDocument& doc : corpus) {
        if (doc.id.isEmpty() || index.m_rowByBookId.contains(doc.id)) {
            continue;
        }
        const QStringList tokens = TextTokenizer::tokenize(doc.text);
        const QHash<QString, int> docCounts = termCounts(tokens);
        for (auto it = docCounts.constBegin(); it != docCounts.constEnd(); ++it) {
            ++documentFrequency[it.key()];
        }

        index.m_rowByBookId.insert(doc.id, index.m_bookIds.size());
        index.m_bookIds.append(doc.id);
        counts.append(docCounts);
        lengths.append(tokens.size());
    }

    // Sorted vocabulary keeps term indices stable for identical corpora.
    QStringList vocabulary = documentFrequency.keys();
    std::sort(vocabulary.begin(), vocabulary.end());

    const double n = static_cast<double>(index.m_bookIds.size());
    index.m_terms.reserve(vocabulary.size());
    index.m_idf.reserve(vocabulary.size());
    for (const QString& term : vocabulary) {
        index.m_termIndex.insert(term, index.m_terms.size());
        index.m_terms.append(term);
        index.m_idf.append(std::log(n / documentFrequency.value(term)));
    }

    index.m_vectors.reserve(counts.size());
    index.m_norms.reserve(counts.size());
    for (int row = 0; row < counts.size(); ++row) {
        SparseVector vec;
        const double length = static_cast<double>(lengths.at(row));
        const QHash<QString, int>& docCounts = counts.at(row);
        for (auto it = docCounts.constBegin(); it != docCounts.constEnd(); ++it) {
            const int termId = index.m_termIndex.value(it.key());
            const double weight = (it.value() / length) * index.m_idf.at(termId);
            if (weight != 0.0) {
                vec.insert(termId, weight);
            }
        }
        index.m_norms.append(norm(vec));
        index.m_vectors.append(vec);
    }

    return index;
}

std::optional<double> SimilarityIndex::idf(const QString& term) const
{
    const auto it = m_termIndex.constFind(term);
    if (it == m_termIndex.constEnd()) {
        return std::nullopt;
    }
    return m_idf.at(it.value());
}

std::optional<SparseVector> SimilarityIndex::vectorFor(const QString& bookId) const
{
    const auto it = m_rowByBookId.constFind(bookId);
    if (it == m_rowByBookId.constEnd()) {
        return std::nullopt;
    }
    return m_vectors.at(it.value());
}

SparseVector SimilarityIndex::vectorize(const QString& text) const
{
    SparseVector vec;
    const QStringList tokens = TextTokenizer::tokenize(text);
    if (tokens.isEmpty()) {
        return vec;
    }
    const double length = static_cast<double>(tokens.size());
    const QHash<QString, int> counts = termCounts(tokens);
    for (auto it = counts.constBegin(); it != counts.constEnd(); ++it) {
        const auto termIt = m_termIndex.constFind(it.key());
        if (termIt == m_termIndex.constEnd()) {
            continue;
        }
        const double weight = (it.value() / length) * m_idf.at(termIt.value());
        if (weight != 0.0) {
            vec.insert(termIt.value(), weight);
        }
    }
    return vec;
}

QVector<SimilarityHit> SimilarityIndex::query(const SparseVector& vector, int k,
                                              double thresholdMin) const
{
    QVector<SimilarityHit> hits;
    const double queryNorm = norm(vector);
    if (k <= 0 || queryNorm <= 0.0) {
        return hits;
    }

    for (int row = 0; row < m_vectors.size(); ++row) {
        const double rowNorm = m_norms.at(row);
        if (rowNorm <= 0.0) {
            continue;
        }
        const SparseVector& docVec = m_vectors.at(row);
        // Iterate the smaller map.
        const SparseVector& small = docVec.size() < vector.size() ? docVec : vector;
        const SparseVector& large = docVec.size() < vector.size() ? vector : docVec;
        double dot = 0.0;
        for (auto it = small.constBegin(); it != small.constEnd(); ++it) {
            dot += it.value() * large.value(it.key(), 0.0);
        }
        const double similarity = dot / (queryNorm * rowNorm);
        if (similarity >= thresholdMin) {
            hits.append({m_bookIds.at(row), similarity});
        }
    }

    std::sort(hits.begin(), hits.end(), hitLessThan);
    if (hits.size() > k) {
        hits.resize(k);
    }
    return hits;
}

QVector<SimilarityHit> SimilarityIndex::queryText(const QString& text, int k,
                                                  double thresholdMin) const
{
    return query(vectorize(text), k, thresholdMin);
}

QVector<SimilarityHit> SimilarityIndex::similarToBook(const QString& bookId, int k,
                                                      double thresholdMin) const
{
    const std::optional<SparseVector> vec = vectorFor(bookId);
    if (!vec.has_value() || k <= 0) {
        return {};
    }
    QVector<SimilarityHit> hits = query(*vec, k + 1, thresholdMin);
    hits.erase(std::remove_if(hits.begin(), hits.end(),
                              [&bookId](const SimilarityHit& hit) { return hit.bookId == bookId; }),
               hits.end());
    if (hits.size() > k) {
        hits.resize(k);
    }
    return hits;
}

double SimilarityIndex::cosine(const SparseVector& a, const SparseVector& b)
{
    const double normA = norm(a);
    const double normB = norm(b);
    if (normA <= 0.0 || normB <= 0.0) {
        return 0.0;
    }
    double dot = 0.0;
    for (auto it = a.constBegin(); it != a.constEnd(); ++it) {
        dot += it.value() * b.value(it.key(), 0.0);
    }
    return dot / (normA * normB);
}

double SimilarityIndex::norm(const SparseVector& v)
{
    double sum = 0.0;
    for (auto it = v.constBegin(); it != v.constEnd(); ++it) {
        sum += it.value() * it.value();
    }
    return std::sqrt(sum);
}

} // namespace folio
