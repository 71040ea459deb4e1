#pragma once

#include "surveyor/ast/NodeVisitor.h"
#include "surveyor/core/Category.h"

#include <string>
#include <string_view>
#include <vector>

namespace surveyor {

class Aggregator;
class Node;

// A node visitor that classifies syntactic shapes into evidence categories.
// Subscribes to the node kinds it inspects; the CompositeVisitor only calls
// it for those.
class PatternDetector : public NodeVisitor {
public:
    virtual std::string_view getID() const = 0;
    virtual std::string_view getTitle() const = 0;
    virtual std::vector<NodeKind> subscribedKinds() const = 0;
    virtual std::vector<Category> categories() const = 0;

    // `notes` collects verbose-only messages; the owner decides whether and
    // where to print them.
    void attach(Aggregator &sink, std::vector<std::string> *notes = nullptr) {
        sink_ = &sink;
        notes_ = notes;
    }

protected:
    void record(Category category, const Node &node);
    void note(std::string message);

private:
    Aggregator *sink_ = nullptr;
    std::vector<std::string> *notes_ = nullptr;
};

} // namespace surveyor
