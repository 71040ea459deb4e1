#include "surveyor/core/Config.h"

#include <llvm/Support/MemoryBuffer.h>
#include <llvm/Support/YAMLParser.h>
#include <llvm/Support/YAMLTraits.h>
#include <llvm/Support/raw_ostream.h>

#include <algorithm>

// YAML mapping for Config via llvm::yaml.

namespace llvm {
namespace yaml {

template <>
struct MappingTraits<surveyor::Config> {
    static void mapping(IO &io, surveyor::Config &cfg) {
        io.mapOptional("manifest_name",        cfg.manifestName);
        io.mapOptional("package_limit",        cfg.packageLimit);
        io.mapOptional("detectors",            cfg.detectors);
        io.mapOptional("strict_coverage",      cfg.strictCoverage);
        io.mapOptional("require_dependencies", cfg.requireDependencies);
        io.mapOptional("exclude_patterns",     cfg.excludePatterns);
        io.mapOptional("extra_args",           cfg.extraArgs);
        io.mapOptional("jobs",                 cfg.jobs);
        io.mapOptional("max_examples",         cfg.maxExamples);
        io.mapOptional("format",               cfg.format);
        io.mapOptional("output_file",          cfg.outputFile);
        io.mapOptional("verbose",              cfg.verbose);
    }

    static std::string validate(IO & /*io*/, surveyor::Config &cfg) {
        if (cfg.jobs == 0)
            return "jobs must be at least 1";
        if (cfg.format != "cli" && cfg.format != "json")
            return "format must be 'cli' or 'json'";
        return {};
    }
};

} // namespace yaml
} // namespace llvm

namespace surveyor {

bool Config::detectorEnabled(std::string_view id) const {
    return std::find(detectors.begin(), detectors.end(), id) != detectors.end();
}

Config Config::defaults() {
    return Config{};
}

Config Config::loadFromFile(const std::string &path) {
    auto bufOrErr = llvm::MemoryBuffer::getFile(path);
    if (!bufOrErr) {
        llvm::errs() << "surveyor: warning: cannot open config '"
                     << path << "', using defaults\n";
        return defaults();
    }

    Config cfg = defaults();
    llvm::yaml::Input yin(bufOrErr.get()->getBuffer());
    yin >> cfg;

    if (yin.error()) {
        llvm::errs() << "surveyor: warning: config parse error in '"
                     << path << "', using defaults\n";
        return defaults();
    }

    return cfg;
}

} // namespace surveyor
