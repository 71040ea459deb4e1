#pragma once

#include "surveyor/core/PatternDetector.h"

#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace surveyor {

struct Config;

using DetectorFactory =
    std::function<std::unique_ptr<PatternDetector>(const Config &)>;

// Detectors are stateful per package, so the registry holds factories and
// the driver builds a fresh set for every package it analyzes.
class DetectorRegistry {
public:
    static DetectorRegistry &instance();

    void registerDetector(std::string id, DetectorFactory factory);

    std::unique_ptr<PatternDetector> create(std::string_view id,
                                            const Config &cfg) const;

    bool contains(std::string_view id) const;
    std::vector<std::string> ids() const;

private:
    DetectorRegistry() = default;
    std::vector<std::pair<std::string, DetectorFactory>> factories_;
};

// Macro for static self-registration in detector .cpp files.
#define SURVEYOR_REGISTER_DETECTOR(DetectorClass, DetectorID)                  \
    namespace {                                                                \
    struct DetectorClass##Registrar {                                          \
        DetectorClass##Registrar() {                                           \
            ::surveyor::DetectorRegistry::instance().registerDetector(          \
                DetectorID, [](const ::surveyor::Config &cfg) {                \
                    return std::unique_ptr<::surveyor::PatternDetector>(        \
                        std::make_unique<DetectorClass>(cfg));                 \
                });                                                            \
        }                                                                      \
    };                                                                         \
    static DetectorClass##Registrar g_##DetectorClass##Registrar;              \
    } // anonymous namespace

} // namespace surveyor
