#include "surveyor/core/Errors.h"

namespace surveyor {

char ConfigError::ID = 0;
char ResolveError::ID = 0;
char DetectorCoverageError::ID = 0;
char TraversalError::ID = 0;

void ConfigError::log(llvm::raw_ostream &os) const {
    os << "configuration error in '" << path_ << "': " << message_;
}

std::error_code ConfigError::convertToErrorCode() const {
    return std::make_error_code(std::errc::invalid_argument);
}

std::string_view resolveErrorKindName(ResolveError::Kind kind) {
    switch (kind) {
        case ResolveError::Kind::ToolFailure:       return "frontend failure";
        case ResolveError::Kind::MissingDependency: return "missing dependency";
        case ResolveError::Kind::NoSources:         return "no sources";
    }
    return "frontend failure";
}

void ResolveError::log(llvm::raw_ostream &os) const {
    os << "cannot resolve '" << path_ << "' (" << resolveErrorKindName(kind_)
       << "): " << message_;
}

std::error_code ResolveError::convertToErrorCode() const {
    if (kind_ == Kind::MissingDependency)
        return std::make_error_code(std::errc::no_such_file_or_directory);
    return std::make_error_code(std::errc::io_error);
}

void DetectorCoverageError::log(llvm::raw_ostream &os) const {
    os << "detector '" << detector_ << "' cannot classify " << shape_
       << " at " << location_.file << ":" << location_.line << ":"
       << location_.column;
}

std::error_code DetectorCoverageError::convertToErrorCode() const {
    return std::make_error_code(std::errc::not_supported);
}

void TraversalError::log(llvm::raw_ostream &os) const {
    os << "traversal of '" << unitPath_ << "' aborted: " << message_;
}

std::error_code TraversalError::convertToErrorCode() const {
    return std::make_error_code(std::errc::operation_canceled);
}

} // namespace surveyor
