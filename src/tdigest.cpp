#include "tdigest.hpp"
#include <algorithm>
#include <cmath>

TDigest::TDigest(double compression)
    : compression_(compression > 10.0 ? compression : 10.0) {}

void TDigest::add(double x, double weight) {
    if (!std::isfinite(x) || weight <= 0.0) return;
    if (total_weight_ <= 0.0) {
        min_ = x;
        max_ = x;
    } else {
        min_ = std::min(min_, x);
        max_ = std::max(max_, x);
    }
    buffer_.push_back(Centroid{x, weight});
    total_weight_ += weight;
    if (buffer_.size() >= static_cast<size_t>(compression_ * 5)) compress();
}

void TDigest::merge(const TDigest &other) {
    if (other.empty()) return;
    if (empty()) {
        min_ = other.min_;
        max_ = other.max_;
    } else {
        min_ = std::min(min_, other.min_);
        max_ = std::max(max_, other.max_);
    }
    buffer_.insert(buffer_.end(), other.centroids_.begin(), other.centroids_.end());
    buffer_.insert(buffer_.end(), other.buffer_.begin(), other.buffer_.end());
    total_weight_ += other.total_weight_;
    compress();
}

// Greedy merge of sorted points; a centroid may grow while its weight stays
// under 4*W*q*(1-q)/compression at both of its quantile edges.
std::vector<TDigest::Centroid> TDigest::build(std::vector<Centroid> points, double compression, double total) {
    std::vector<Centroid> out;
    if (points.empty()) return out;
    std::sort(points.begin(), points.end(),
              [](const Centroid &a, const Centroid &b) { return a.mean < b.mean; });

    out.reserve(static_cast<size_t>(compression) * 2);
    Centroid cur = points[0];
    double so_far = 0.0;
    for (size_t i = 1; i < points.size(); ++i) {
        double proposed = cur.weight + points[i].weight;
        double q0 = so_far / total;
        double q2 = (so_far + proposed) / total;
        double limit = 4.0 * total * std::min(q0 * (1.0 - q0), q2 * (1.0 - q2)) / compression;
        if (proposed <= limit) {
            cur.mean += (points[i].mean - cur.mean) * points[i].weight / proposed;
            cur.weight = proposed;
        } else {
            so_far += cur.weight;
            out.push_back(cur);
            cur = points[i];
        }
    }
    out.push_back(cur);
    return out;
}

void TDigest::compress() {
    if (buffer_.empty()) return;
    std::vector<Centroid> all;
    all.reserve(centroids_.size() + buffer_.size());
    all.insert(all.end(), centroids_.begin(), centroids_.end());
    all.insert(all.end(), buffer_.begin(), buffer_.end());
    buffer_.clear();
    centroids_ = build(std::move(all), compression_, total_weight_);
}

std::vector<TDigest::Centroid> TDigest::merged_view() const {
    if (buffer_.empty()) return centroids_;
    std::vector<Centroid> all;
    all.reserve(centroids_.size() + buffer_.size());
    all.insert(all.end(), centroids_.begin(), centroids_.end());
    all.insert(all.end(), buffer_.begin(), buffer_.end());
    return build(std::move(all), compression_, total_weight_);
}

size_t TDigest::centroid_count() const {
    return merged_view().size();
}

double TDigest::quantile(double q) const {
    if (empty()) return 0.0;
    if (q <= 0.0) return min_;
    if (q >= 1.0) return max_;

    std::vector<Centroid> cs = merged_view();
    if (cs.size() == 1) return cs[0].mean;

    const double index = q * total_weight_;

    // left tail: between min and the first centroid's center
    double first_center = cs[0].weight / 2.0;
    if (index < first_center) {
        return min_ + (cs[0].mean - min_) * (index / first_center);
    }

    double cumulative = 0.0;
    for (size_t i = 0; i + 1 < cs.size(); ++i) {
        double left = cumulative + cs[i].weight / 2.0;
        double right = cumulative + cs[i].weight + cs[i + 1].weight / 2.0;
        if (index < right) {
            double t = (index - left) / (right - left);
            return cs[i].mean + t * (cs[i + 1].mean - cs[i].mean);
        }
        cumulative += cs[i].weight;
    }

    // right tail: between the last centroid's center and max
    const Centroid &last = cs.back();
    double last_center = total_weight_ - last.weight / 2.0;
    double span = total_weight_ - last_center;
    if (span <= 0.0) return last.mean;
    double t = (index - last_center) / span;
    return last.mean + t * (max_ - last.mean);
}

void TDigest::reset() {
    centroids_.clear();
    buffer_.clear();
    total_weight_ = 0.0;
    min_ = 0.0;
    max_ = 0.0;
}
