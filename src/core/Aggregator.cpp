#include "surveyor/core/Aggregator.h"

#include <algorithm>
#include <iterator>

namespace surveyor {

void Aggregator::record(EvidenceRecord rec) {
    Bucket &b = buckets_[categoryIndex(rec.category())];
    ++b.count;
    if (hasRoom(b))
        b.records.push_back(std::move(rec));
}

void Aggregator::merge(Aggregator &&other) {
    for (size_t i = 0; i < kCategoryCount; ++i) {
        Bucket &dst = buckets_[i];
        Bucket &src = other.buckets_[i];
        dst.count += src.count;
        for (auto &rec : src.records) {
            if (!hasRoom(dst))
                break;
            dst.records.push_back(std::move(rec));
        }
        src.records.clear();
        src.count = 0;
    }
}

size_t Aggregator::total() const {
    size_t n = 0;
    for (const auto &b : buckets_)
        n += b.count;
    return n;
}

std::vector<CategoryResult>
Aggregator::reduce(const std::vector<Category> &always) const {
    std::vector<CategoryResult> out;
    for (size_t i = 0; i < kCategoryCount; ++i) {
        auto category = static_cast<Category>(i);
        const Bucket &b = buckets_[i];
        bool listed = std::find(always.begin(), always.end(), category) !=
                      always.end();
        if (!listed && b.count == 0)
            continue;

        CategoryResult result;
        result.category = category;
        result.label = std::string(categoryLabel(category));
        result.count = b.count;
        result.examples.reserve(b.records.size());
        std::transform(b.records.begin(), b.records.end(),
                       std::back_inserter(result.examples),
                       [](const EvidenceRecord &r) { return r.rendered(); });
        out.push_back(std::move(result));
    }
    return out;
}

} // namespace surveyor
