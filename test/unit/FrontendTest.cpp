#include "surveyor/ast/TreeWalker.h"
#include "surveyor/core/Config.h"
#include "surveyor/core/Errors.h"
#include "surveyor/frontend/ASTLowering.h"
#include "surveyor/frontend/ClangPackageResolver.h"

#include "DetectorTestUtil.h"

#include <clang/Frontend/ASTUnit.h>
#include <clang/Tooling/Tooling.h>
#include <llvm/ADT/SmallString.h>
#include <llvm/Support/FileSystem.h>
#include <llvm/Support/Path.h>
#include <llvm/Support/raw_ostream.h>

#include <gtest/gtest.h>

#include <array>
#include <string>
#include <vector>

using namespace surveyor;
using surveyor::test::DetectorHarness;

namespace {

std::unique_ptr<SyntaxTree> lowerCode(llvm::StringRef code) {
    auto ast = clang::tooling::buildASTFromCodeWithArgs(
        code, {"-std=c++20"}, "input.cc");
    if (!ast)
        return nullptr;
    ASTLowering lowering(ast->getASTContext());
    return lowering.lower("input.cc");
}

class KindCounter : public NodeVisitor {
public:
    llvm::Expected<WalkAction> visitNode(const Node &node) override {
        ++counts[static_cast<size_t>(node.kind())];
        return WalkAction::Continue;
    }

    size_t operator[](NodeKind kind) const {
        return counts[static_cast<size_t>(kind)];
    }

    std::array<size_t, kNodeKindCount> counts{};
};

const char *kShapes = R"cpp(
struct Point {
    Point(int x, int y) : x(x), y(y) {}
    static Point polar(int r, int a) { return Point(r, a); }
    int x, y;
};

struct Options {
    int width;
    int height;
};

auto inlineTearoff = [](int x, int y) { return Point(x, y); };
auto namedTearoff = [](int r, int a) { return Point::polar(r, a); };
auto designated = [](int w, int h) { return Options{.width = w, .height = h}; };
auto withLiteral = [](int x) { return Point(x, 0); };

Point makePoint(int x, int y) { return Point(x, y); }
)cpp";

const char *kTypes = R"cpp(
namespace std {
class type_info {
public:
    virtual ~type_info();
};
} // namespace std

struct Widget {};
using Alias = Widget;

const std::type_info &a = typeid(Widget);
const std::type_info &b = typeid(Alias);
const std::type_info &c = typeid(int);
Widget w;
)cpp";

const char *kCallbacks = R"cpp(
struct P {
    P(int a) : a(a) {}
    static P make(int v) { return P(v); }
    int a;
};

// Type-erased holder, converted implicitly from any callable.
struct Callback {
    template <typename F> Callback(F) {}
};

template <typename F> void apply(F) {}
void run(Callback) {}

void use() {
    apply([](int x) { return P(x); });
    run([](int v) { return P::make(v); });
}
)cpp";

// Scratch package directory removed on destruction.
class TempPackage {
public:
    TempPackage() {
        if (llvm::sys::fs::createUniqueDirectory("surveyor-pkg", path_))
            path_.clear();
    }
    ~TempPackage() {
        if (!path_.empty())
            llvm::sys::fs::remove_directories(path_);
    }

    std::string path() const { return path_.str().str(); }

    void write(llvm::StringRef name, llvm::StringRef text) const {
        llvm::SmallString<128> p(path_);
        llvm::sys::path::append(p, name);
        std::error_code ec;
        llvm::raw_fd_ostream os(p, ec);
        os << text;
    }

    void writeManifest(llvm::StringRef file) const {
        writeManifest(std::vector<std::string>{file.str()});
    }

    void writeManifest(const std::vector<std::string> &files) const {
        std::string json = "[";
        for (const auto &file : files) {
            if (json.size() > 1)
                json += ", ";
            json += "{\"directory\": \"" + path() + "\", \"file\": \"" +
                    file + "\", \"arguments\": [\"clang++\", \"-std=c++20\", "
                    "\"-Wunused-variable\", \"-c\", \"" + file + "\"]}";
        }
        json += "]\n";
        write("compile_commands.json", json);
    }

private:
    llvm::SmallString<128> path_;
};

} // anonymous namespace

TEST(ASTLoweringTest, LowersDeclarationsIntoTheClosedNodeSet) {
    auto tree = lowerCode(kShapes);
    ASSERT_NE(tree, nullptr);

    KindCounter counter;
    ASSERT_EQ(surveyor::test::errorText(TreeWalker::walk(*tree, counter)), "");
    EXPECT_EQ(counter[NodeKind::CompilationUnit], 1u);
    EXPECT_EQ(counter[NodeKind::ClassDeclaration], 2u);
    EXPECT_EQ(counter[NodeKind::ConstructorDeclaration], 1u);
    EXPECT_EQ(counter[NodeKind::MethodDeclaration], 1u);
    EXPECT_EQ(counter[NodeKind::FunctionDeclaration], 1u);
    // Four lambdas plus the literal wrapped by makePoint.
    EXPECT_EQ(counter[NodeKind::FunctionLiteral], 5u);
    EXPECT_EQ(counter[NodeKind::NamedArgument], 2u);
}

TEST(ASTLoweringTest, ClassifiesTearoffs) {
    auto tree = lowerCode(kShapes);
    ASSERT_NE(tree, nullptr);

    DetectorHarness h;
    EXPECT_EQ(h.run(*tree), "");
    // inlineTearoff and designated.
    EXPECT_EQ(h.evidence.count(Category::HighConfidenceUnnamedTearoff), 2u);
    EXPECT_EQ(h.evidence.count(Category::HighConfidenceNamedTearoff), 1u);
    // Point::polar and makePoint.
    EXPECT_EQ(h.evidence.count(Category::LowConfidenceUnnamedTearoff), 2u);
    EXPECT_EQ(h.evidence.count(Category::LowConfidenceNamedTearoff), 0u);
    EXPECT_EQ(h.evidence.count(Category::DetectorCoverageGap), 0u);

    const auto &high = h.evidence.records(Category::HighConfidenceUnnamedTearoff);
    ASSERT_FALSE(high.empty());
    EXPECT_EQ(high[0].rendered().rfind("Point(x, y) at ", 0), 0u)
        << high[0].rendered();
    EXPECT_EQ(high[0].location().file, "input.cc");
}

TEST(ASTLoweringTest, FindsTypeLiterals) {
    auto tree = lowerCode(kTypes);
    ASSERT_NE(tree, nullptr);

    DetectorHarness h;
    EXPECT_EQ(h.run(*tree), "");
    // typeid(Widget) and typeid(Alias); builtins and annotations are not.
    EXPECT_EQ(h.evidence.count(Category::TypeLiteral), 2u);
}

TEST(ASTLoweringTest, LambdasPassedAsArgumentsAreInlineTearoffs) {
    auto tree = lowerCode(kCallbacks);
    ASSERT_NE(tree, nullptr);

    DetectorHarness h;
    EXPECT_EQ(h.run(*tree), "");
    // Deduced template parameter and implicit Callback conversion.
    EXPECT_EQ(h.evidence.count(Category::HighConfidenceUnnamedTearoff), 1u);
    EXPECT_EQ(h.evidence.count(Category::HighConfidenceNamedTearoff), 1u);
    // P::make itself.
    EXPECT_EQ(h.evidence.count(Category::LowConfidenceUnnamedTearoff), 1u);
    EXPECT_EQ(h.evidence.count(Category::DetectorCoverageGap), 0u);
}

TEST(ASTLoweringTest, SymbolIdsTellParametersFromOtherDeclarations) {
    auto tree = lowerCode(R"cpp(
struct Q { Q(int a, int b) : a(a), b(b) {} int a, b; };
int g = 1;
auto foreign = [](int x) { return Q(x, g); };
auto shadow = [](int x, int y) { return Q(y, x); };
)cpp");
    ASSERT_NE(tree, nullptr);

    DetectorHarness h;
    EXPECT_EQ(h.run(*tree), "");
    // Only `shadow`: `g` is a global, not a parameter of `foreign`.
    EXPECT_EQ(h.evidence.count(Category::HighConfidenceUnnamedTearoff), 1u);
    EXPECT_EQ(h.evidence.total(), 1u);
}

TEST(ClangPackageResolverTest, ResolvesUnitsWithDiagnostics) {
    TempPackage pkg;
    ASSERT_FALSE(pkg.path().empty());
    pkg.write("main.cc", "struct P { P(int a) : a(a) {} int a; };\n"
                         "auto f = [](int v) { return P(v); };\n"
                         "int g() { int unused; return 0; }\n");
    pkg.writeManifest("main.cc");

    Config cfg;
    ClangPackageResolver resolver(cfg);
    auto resolved = resolver.resolvePackage(pkg.path());
    ASSERT_TRUE(static_cast<bool>(resolved))
        << llvm::toString(resolved.takeError());
    ASSERT_EQ(resolved->units.size(), 1u);

    const PackageUnit &unit = resolved->units[0];
    EXPECT_EQ(unit.packagePath, pkg.path());
    ASSERT_NE(unit.tree, nullptr);
    bool sawUnused = false;
    for (const auto &d : unit.diagnostics) {
        if (d.kind == DiagnosticKind::Warning && d.code == "-Wunused-variable")
            sawUnused = true;
    }
    EXPECT_TRUE(sawUnused);

    DetectorHarness h;
    EXPECT_EQ(h.run(*unit.tree), "");
    EXPECT_EQ(h.evidence.count(Category::HighConfidenceUnnamedTearoff), 1u);
}

TEST(ClangPackageResolverTest, MissingIncludeIsAMissingDependency) {
    TempPackage pkg;
    ASSERT_FALSE(pkg.path().empty());
    pkg.write("main.cc", "#include \"not_installed.h\"\nint x;\n");
    pkg.writeManifest("main.cc");

    Config cfg;
    ClangPackageResolver resolver(cfg);
    auto resolved = resolver.resolvePackage(pkg.path());
    ASSERT_FALSE(static_cast<bool>(resolved));

    bool missing = false;
    std::string message;
    llvm::handleAllErrors(resolved.takeError(), [&](const ResolveError &e) {
        missing = e.kind() == ResolveError::Kind::MissingDependency;
        message = e.reason();
    });
    EXPECT_TRUE(missing);
    EXPECT_NE(message.find("not_installed.h"), std::string::npos) << message;
}

TEST(ClangPackageResolverTest, FailedInputKeepsItsOwnDiagnostics) {
    TempPackage pkg;
    ASSERT_FALSE(pkg.path().empty());
    pkg.write("ok.cc", "int ok() { return 0; }\n");
    pkg.writeManifest(std::vector<std::string>{"missing.cc", "ok.cc"});

    Config cfg;
    ClangPackageResolver resolver(cfg);
    auto resolved = resolver.resolvePackage(pkg.path());
    ASSERT_TRUE(static_cast<bool>(resolved))
        << llvm::toString(resolved.takeError());
    ASSERT_EQ(resolved->units.size(), 2u);

    const PackageUnit &missing = resolved->units[0];
    EXPECT_EQ(llvm::sys::path::filename(missing.path).str(), "missing.cc");
    EXPECT_FALSE(missing.parsed);
    EXPECT_EQ(missing.tree, nullptr);
    bool sawError = false;
    for (const auto &d : missing.diagnostics)
        sawError |= d.kind == DiagnosticKind::Error;
    EXPECT_TRUE(sawError);

    const PackageUnit &ok = resolved->units[1];
    EXPECT_EQ(llvm::sys::path::filename(ok.path).str(), "ok.cc");
    EXPECT_TRUE(ok.parsed);
    ASSERT_NE(ok.tree, nullptr);
    for (const auto &d : ok.diagnostics)
        EXPECT_NE(d.kind, DiagnosticKind::Error) << d.message;

    EXPECT_FALSE(resolved->log.empty());
}

TEST(ClangPackageResolverTest, ClassifiesDocumentationAndTodoWarnings) {
    TempPackage pkg;
    ASSERT_FALSE(pkg.path().empty());
    pkg.write("docs.cc", "/// \\param z not a parameter\n"
                         "void f(int x);\n"
                         "#warning TODO split this file\n"
                         "#warning plain\n");
    pkg.writeManifest("docs.cc");

    Config cfg;
    cfg.extraArgs = {"-Wdocumentation"};
    ClangPackageResolver resolver(cfg);
    auto resolved = resolver.resolvePackage(pkg.path());
    ASSERT_TRUE(static_cast<bool>(resolved))
        << llvm::toString(resolved.takeError());
    ASSERT_EQ(resolved->units.size(), 1u);

    size_t lint = 0, todo = 0, warning = 0;
    for (const auto &d : resolved->units[0].diagnostics) {
        if (d.kind == DiagnosticKind::Lint)
            ++lint;
        else if (d.kind == DiagnosticKind::Todo)
            ++todo;
        else if (d.kind == DiagnosticKind::Warning)
            ++warning;
    }
    EXPECT_EQ(lint, 1u);
    EXPECT_EQ(todo, 1u);
    EXPECT_EQ(warning, 1u);
}

TEST(ClangPackageResolverTest, MissingManifestIsAConfigError) {
    TempPackage pkg;
    ASSERT_FALSE(pkg.path().empty());

    Config cfg;
    ClangPackageResolver resolver(cfg);
    auto resolved = resolver.resolvePackage(pkg.path());
    ASSERT_FALSE(static_cast<bool>(resolved));
    std::string msg = llvm::toString(resolved.takeError());
    EXPECT_NE(msg.find("no compile_commands.json"), std::string::npos) << msg;
}

TEST(ClangPackageResolverTest, ExcludedSourcesLeaveNothingToResolve) {
    TempPackage pkg;
    ASSERT_FALSE(pkg.path().empty());
    pkg.write("main.cc", "int x;\n");
    pkg.writeManifest("main.cc");

    Config cfg;
    cfg.excludePatterns = {"*/main.cc"};
    ClangPackageResolver resolver(cfg);
    auto resolved = resolver.resolvePackage(pkg.path());
    ASSERT_FALSE(static_cast<bool>(resolved));
    std::string msg = llvm::toString(resolved.takeError());
    EXPECT_NE(msg.find("no sources"), std::string::npos) << msg;
}
