#include "DetectorTestUtil.h"
#include "TreeBuilder.h"

#include <gtest/gtest.h>

using namespace surveyor;
using surveyor::test::DetectorHarness;
using surveyor::test::TreeBuilder;

namespace {

// `auto f = [](int x, int y) { return Point(x, y); };`
TreeBuilder inlineLambda(std::string ctorName = "") {
    TreeBuilder b;
    Node &var = b.add(b.root(), NodeKind::VariableDeclaration,
                      DeclarationInfo{"f", Symbol{100, SymbolKind::Variable, "f"}});
    Node &lambda = b.add(var, NodeKind::FunctionLiteral);
    b.params(lambda, {{"x", 1}, {"y", 2}});
    Node &ret = b.returnBody(lambda);
    Node &point = b.creation(ret, "Point", std::move(ctorName));
    b.ident(point, "x", 1);
    b.ident(point, "y", 2);
    return b;
}

} // anonymous namespace

TEST(ConstructorShorthandTest, InlineLambdaIsHighConfidenceUnnamed) {
    TreeBuilder b = inlineLambda();
    DetectorHarness h;
    EXPECT_EQ(h.run(b.tree()), "");
    EXPECT_EQ(h.evidence.count(Category::HighConfidenceUnnamedTearoff), 1u);
    EXPECT_EQ(h.evidence.total(), 1u);
}

TEST(ConstructorShorthandTest, NamedConstructorInLambdaIsHighConfidenceNamed) {
    TreeBuilder b = inlineLambda("polar");
    DetectorHarness h;
    EXPECT_EQ(h.run(b.tree()), "");
    EXPECT_EQ(h.evidence.count(Category::HighConfidenceNamedTearoff), 1u);
    EXPECT_EQ(h.evidence.total(), 1u);
}

TEST(ConstructorShorthandTest, LambdaPassedAsCallbackIsHighConfidence) {
    // `apply([](int x) { return Point(x); });`
    TreeBuilder b;
    Node &call = b.add(b.root(), NodeKind::Invocation);
    b.ident(call, "apply", 60, SymbolKind::Function);
    Node &lambda = b.add(call, NodeKind::FunctionLiteral);
    b.params(lambda, {{"x", 1}});
    Node &point = b.creation(b.returnBody(lambda), "Point");
    b.ident(point, "x", 1);

    DetectorHarness h;
    EXPECT_EQ(h.run(b.tree()), "");
    EXPECT_EQ(h.evidence.count(Category::HighConfidenceUnnamedTearoff), 1u);
    EXPECT_EQ(h.evidence.total(), 1u);
    EXPECT_TRUE(h.notes.empty());
}

TEST(ConstructorShorthandTest, NamedFunctionIsLowConfidence) {
    // `Point make(int x, int y) { return Point(x, y); }`
    TreeBuilder b;
    Node &decl = b.add(b.root(), NodeKind::FunctionDeclaration,
                       DeclarationInfo{"make", Symbol{50, SymbolKind::Function, "make"}});
    Node &fn = b.add(decl, NodeKind::FunctionLiteral);
    b.params(fn, {{"x", 1}, {"y", 2}});
    Node &ret = b.returnBody(fn);
    Node &point = b.creation(ret, "Point");
    b.ident(point, "x", 1);
    b.ident(point, "y", 2);

    DetectorHarness h;
    EXPECT_EQ(h.run(b.tree()), "");
    EXPECT_EQ(h.evidence.count(Category::LowConfidenceUnnamedTearoff), 1u);
    EXPECT_EQ(h.evidence.total(), 1u);
}

TEST(ConstructorShorthandTest, MethodReturningNamedConstructorIsLowNamed) {
    // `static Point at(int x) { return Point::fromX(x); }`
    TreeBuilder b;
    Node &cls = b.add(b.root(), NodeKind::ClassDeclaration,
                      DeclarationInfo{"Factory", Symbol{60, SymbolKind::Class, "Factory"}});
    Node &method = b.add(cls, NodeKind::MethodDeclaration,
                         DeclarationInfo{"at", Symbol{61, SymbolKind::Method, "at"}});
    b.params(method, {{"x", 7}});
    Node &ret = b.returnBody(method);
    Node &point = b.creation(ret, "Point", "fromX");
    b.ident(point, "x", 7);

    DetectorHarness h;
    EXPECT_EQ(h.run(b.tree()), "");
    EXPECT_EQ(h.evidence.count(Category::LowConfidenceNamedTearoff), 1u);
    EXPECT_EQ(h.evidence.total(), 1u);
}

TEST(ConstructorShorthandTest, LiteralArgumentDoesNotMatch) {
    // `[](int x) { return Point(x, 0); }`
    TreeBuilder b;
    Node &lambda = b.add(b.root(), NodeKind::FunctionLiteral);
    b.params(lambda, {{"x", 1}});
    Node &ret = b.returnBody(lambda);
    Node &point = b.creation(ret, "Point");
    b.ident(point, "x", 1);
    b.literal(point);

    DetectorHarness h;
    EXPECT_EQ(h.run(b.tree()), "");
    EXPECT_EQ(h.evidence.total(), 0u);
}

TEST(ConstructorShorthandTest, ReorderedNamedArgumentsMatch) {
    // `(a, b) => Widget(child: b, key: a)`
    TreeBuilder b;
    Node &lambda = b.add(b.root(), NodeKind::FunctionLiteral);
    b.params(lambda, {{"a", 1}, {"b", 2}});
    Node &body = b.expressionBody(lambda);
    Node &widget = b.creation(body, "Widget");
    b.ident(b.named(widget, "child"), "b", 2);
    b.ident(b.named(widget, "key"), "a", 1);

    DetectorHarness h;
    EXPECT_EQ(h.run(b.tree()), "");
    EXPECT_EQ(h.evidence.count(Category::HighConfidenceUnnamedTearoff), 1u);
}

TEST(ConstructorShorthandTest, ForeignReferenceDoesNotMatch) {
    TreeBuilder b;
    Node &lambda = b.add(b.root(), NodeKind::FunctionLiteral);
    b.params(lambda, {{"x", 1}});
    Node &ret = b.returnBody(lambda);
    Node &point = b.creation(ret, "Point");
    b.ident(point, "x", 1);
    b.ident(point, "origin", 99, SymbolKind::Variable);

    DetectorHarness h;
    EXPECT_EQ(h.run(b.tree()), "");
    EXPECT_EQ(h.evidence.total(), 0u);
}

TEST(ConstructorShorthandTest, CompoundArgumentDoesNotMatch) {
    TreeBuilder b;
    Node &lambda = b.add(b.root(), NodeKind::FunctionLiteral);
    b.params(lambda, {{"x", 1}});
    Node &ret = b.returnBody(lambda);
    Node &point = b.creation(ret, "Point");
    Node &sum = b.add(point, NodeKind::Expression);
    b.ident(sum, "x", 1);
    b.literal(sum);

    DetectorHarness h;
    EXPECT_EQ(h.run(b.tree()), "");
    EXPECT_EQ(h.evidence.total(), 0u);
}

TEST(ConstructorShorthandTest, BodyWithSeveralStatementsDoesNotMatch) {
    TreeBuilder b;
    Node &lambda = b.add(b.root(), NodeKind::FunctionLiteral);
    b.params(lambda, {{"x", 1}});
    Node &body = b.add(lambda, NodeKind::BlockBody);
    Node &block = b.add(body, NodeKind::Block);
    b.add(block, NodeKind::Statement);
    Node &ret = b.add(block, NodeKind::ReturnStatement);
    Node &point = b.creation(ret, "Point");
    b.ident(point, "x", 1);

    DetectorHarness h;
    EXPECT_EQ(h.run(b.tree()), "");
    EXPECT_EQ(h.evidence.total(), 0u);
}

TEST(ConstructorShorthandTest, NonCreationBodyDoesNotMatch) {
    // `[](int x) { return make(x); }`
    TreeBuilder b;
    Node &lambda = b.add(b.root(), NodeKind::FunctionLiteral);
    b.params(lambda, {{"x", 1}});
    Node &ret = b.returnBody(lambda);
    Node &call = b.add(ret, NodeKind::Invocation);
    b.ident(call, "x", 1);

    DetectorHarness h;
    EXPECT_EQ(h.run(b.tree()), "");
    EXPECT_EQ(h.evidence.total(), 0u);
}

TEST(ConstructorShorthandTest, ZeroArgumentConstructionMatches) {
    // `[] { return Point(); }`
    TreeBuilder b;
    Node &lambda = b.add(b.root(), NodeKind::FunctionLiteral);
    b.params(lambda, {});
    Node &ret = b.returnBody(lambda);
    b.creation(ret, "Point");

    DetectorHarness h;
    EXPECT_EQ(h.run(b.tree()), "");
    EXPECT_EQ(h.evidence.count(Category::HighConfidenceUnnamedTearoff), 1u);
}

TEST(ConstructorShorthandTest, UnknownBodyOwnerIsACoverageGap) {
    TreeBuilder b;
    Node &cls = b.add(b.root(), NodeKind::ClassDeclaration);
    Node &ret = b.returnBody(cls);
    b.creation(ret, "Point");

    DetectorHarness h;
    EXPECT_EQ(h.run(b.tree()), "");
    EXPECT_EQ(h.evidence.count(Category::DetectorCoverageGap), 1u);
    EXPECT_EQ(h.evidence.total(), 1u);
    // Lenient mode keeps the explanation for --verbose instead of printing.
    ASSERT_EQ(h.notes.size(), 1u);
    EXPECT_NE(h.notes[0].find("cannot classify"), std::string::npos)
        << h.notes[0];
}

TEST(ConstructorShorthandTest, StrictCoverageReturnsTheGapAsAnError) {
    TreeBuilder b;
    Node &cls = b.add(b.root(), NodeKind::ClassDeclaration);
    Node &ret = b.returnBody(cls);
    b.creation(ret, "Point");

    DetectorHarness h;
    h.cfg.strictCoverage = true;
    std::string err = h.run(b.tree());
    EXPECT_NE(err.find("cannot classify"), std::string::npos) << err;
    EXPECT_NE(err.find("ClassDeclaration"), std::string::npos) << err;
    EXPECT_EQ(h.evidence.count(Category::DetectorCoverageGap), 1u);
}
