#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace surveyor {

struct Config {
    // Discovery
    std::string manifestName    = "compile_commands.json";
    unsigned packageLimit       = 0;    // 0 = unlimited

    // Detection: any of "tearoffs", "type-literals", "errors"
    std::vector<std::string> detectors = {"tearoffs", "type-literals"};
    bool strictCoverage         = false; // coverage gaps abort the file

    // Resolution
    bool requireDependencies    = false; // missing dependency aborts the run
    std::vector<std::string> excludePatterns; // fnmatch-style, on file paths
    std::vector<std::string> extraArgs;
    unsigned jobs               = 1;

    // Output
    unsigned maxExamples        = 0;    // 0 = every example
    std::string format          = "cli";
    std::string outputFile;             // empty = stdout
    bool verbose                = false;

    bool detectorEnabled(std::string_view id) const;

    static Config loadFromFile(const std::string &path);
    static Config defaults();
};

} // namespace surveyor
