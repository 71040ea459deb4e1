#pragma once

#include "surveyor/core/Category.h"
#include "surveyor/core/Evidence.h"

#include <array>
#include <cstddef>
#include <vector>

namespace surveyor {

// Accumulates evidence per category and reduces it to (count, examples).
// Examples are capped at `maxExamples` (0 = unbounded) but counts never are.
// merge() is associative: folding packages in any grouping yields the same
// counts, and the same examples for a fixed package order.
class Aggregator {
public:
    explicit Aggregator(size_t maxExamples = 0) : maxExamples_(maxExamples) {}

    void record(EvidenceRecord rec);
    void merge(Aggregator &&other);

    size_t count(Category c) const { return buckets_[categoryIndex(c)].count; }
    size_t total() const;

    const std::vector<EvidenceRecord> &records(Category c) const {
        return buckets_[categoryIndex(c)].records;
    }

    // Results for every category in `always` (even when empty) plus any
    // other category that collected evidence, in enum order.
    std::vector<CategoryResult> reduce(const std::vector<Category> &always) const;

private:
    struct Bucket {
        size_t count = 0;
        std::vector<EvidenceRecord> records;
    };

    bool hasRoom(const Bucket &b) const {
        return maxExamples_ == 0 || b.records.size() < maxExamples_;
    }

    size_t maxExamples_;
    std::array<Bucket, kCategoryCount> buckets_;
};

} // namespace surveyor
