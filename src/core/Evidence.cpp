#include "surveyor/core/Evidence.h"
#include "surveyor/ast/SyntaxTree.h"

#include <algorithm>
#include <cctype>

namespace surveyor {

namespace {

constexpr size_t kMaxRenderedText = 120;

// Collapse runs of whitespace so multi-line nodes render on one line.
std::string flatten(std::string_view text) {
    std::string out;
    out.reserve(std::min(text.size(), kMaxRenderedText + 3));
    bool space = false;
    for (char c : text) {
        if (std::isspace(static_cast<unsigned char>(c))) {
            space = !out.empty();
            continue;
        }
        if (out.size() >= kMaxRenderedText) {
            out += "...";
            break;
        }
        if (space)
            out += ' ';
        space = false;
        out += c;
    }
    return out;
}

} // anonymous namespace

EvidenceRecord EvidenceRecord::fromNode(Category category, const Node &node) {
    SourceLocation loc = node.location();
    std::string rendered = flatten(node.text());
    if (rendered.empty())
        rendered = std::string(nodeKindName(node.kind()));
    rendered += " at " + std::to_string(loc.offset) + " in " + loc.file;
    return EvidenceRecord(category, std::move(loc), std::move(rendered));
}

} // namespace surveyor
