#pragma once

#include "surveyor/core/Evidence.h"

#include <llvm/Support/Error.h>
#include <llvm/Support/raw_ostream.h>

#include <cstdint>
#include <string>
#include <string_view>

namespace surveyor {

// Bad or missing path, missing or malformed manifest. Fatal to one package.
class ConfigError : public llvm::ErrorInfo<ConfigError> {
public:
    static char ID;

    ConfigError(std::string path, std::string message)
        : path_(std::move(path)), message_(std::move(message)) {}

    void log(llvm::raw_ostream &os) const override;
    std::error_code convertToErrorCode() const override;

    const std::string &path() const { return path_; }
    const std::string &reason() const { return message_; }

private:
    std::string path_;
    std::string message_;
};

// The resolver could not produce units for a package.
class ResolveError : public llvm::ErrorInfo<ResolveError> {
public:
    enum class Kind : uint8_t {
        ToolFailure,        // the frontend failed outright
        MissingDependency,  // an included dependency is not installed
        NoSources,          // manifest lists no analyzable files
    };

    static char ID;

    ResolveError(Kind kind, std::string path, std::string message)
        : kind_(kind), path_(std::move(path)), message_(std::move(message)) {}

    void log(llvm::raw_ostream &os) const override;
    std::error_code convertToErrorCode() const override;

    Kind kind() const { return kind_; }
    const std::string &path() const { return path_; }
    const std::string &reason() const { return message_; }

private:
    Kind        kind_;
    std::string path_;
    std::string message_;
};

std::string_view resolveErrorKindName(ResolveError::Kind kind);

// A detector met a syntactic shape it has no classification for.
class DetectorCoverageError : public llvm::ErrorInfo<DetectorCoverageError> {
public:
    static char ID;

    DetectorCoverageError(std::string detector, std::string shape,
                          SourceLocation location)
        : detector_(std::move(detector)), shape_(std::move(shape)),
          location_(std::move(location)) {}

    void log(llvm::raw_ostream &os) const override;
    std::error_code convertToErrorCode() const override;

    const std::string &detector() const { return detector_; }
    const std::string &shape() const { return shape_; }
    const SourceLocation &location() const { return location_; }

private:
    std::string    detector_;
    std::string    shape_;
    SourceLocation location_;
};

// Any fault escaping the walk of one file. Contained to that file.
class TraversalError : public llvm::ErrorInfo<TraversalError> {
public:
    static char ID;

    TraversalError(std::string unitPath, std::string message)
        : unitPath_(std::move(unitPath)), message_(std::move(message)) {}

    void log(llvm::raw_ostream &os) const override;
    std::error_code convertToErrorCode() const override;

    const std::string &unitPath() const { return unitPath_; }

private:
    std::string unitPath_;
    std::string message_;
};

} // namespace surveyor
