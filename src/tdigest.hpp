#pragma once
#include <cstddef>
#include <vector>

/// TDigest: mergeable approximate-quantile sketch (merging t-digest).
/// - add(x) buffers a sample; the buffer is folded into centroids once it
///   grows past a few times the compression factor.
/// - quantile(q) never mutates the digest: pending samples are merged into
///   a temporary copy, so repeated queries return the same value.
/// - Centroids near the tails stay small, so high quantiles (p95, p99) keep
///   a small relative error.
///
/// Not thread-safe; owned by a single WindowStats.
class TDigest {
public:
    explicit TDigest(double compression = 100.0);

    void add(double x, double weight = 1.0);

    // Fold another digest into this one.
    void merge(const TDigest &other);

    // q in [0,1]; returns 0 for an empty digest.
    double quantile(double q) const;

    double total_weight() const { return total_weight_; }
    size_t centroid_count() const;
    bool empty() const { return total_weight_ <= 0.0; }

    void reset();

private:
    struct Centroid {
        double mean;
        double weight;
    };

    void compress();
    std::vector<Centroid> merged_view() const;
    static std::vector<Centroid> build(std::vector<Centroid> points, double compression, double total);

    double compression_;
    std::vector<Centroid> centroids_;
    std::vector<Centroid> buffer_;
    double total_weight_ = 0.0;
    double min_ = 0.0;
    double max_ = 0.0;
};
