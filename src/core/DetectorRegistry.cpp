#include "surveyor/core/DetectorRegistry.h"

#include <algorithm>

namespace surveyor {

DetectorRegistry &DetectorRegistry::instance() {
    static DetectorRegistry registry;
    return registry;
}

void DetectorRegistry::registerDetector(std::string id,
                                        DetectorFactory factory) {
    factories_.emplace_back(std::move(id), std::move(factory));
}

std::unique_ptr<PatternDetector>
DetectorRegistry::create(std::string_view id, const Config &cfg) const {
    auto it = std::find_if(factories_.begin(), factories_.end(),
                           [id](const auto &f) { return f.first == id; });
    return (it != factories_.end()) ? it->second(cfg) : nullptr;
}

bool DetectorRegistry::contains(std::string_view id) const {
    return std::any_of(factories_.begin(), factories_.end(),
                       [id](const auto &f) { return f.first == id; });
}

std::vector<std::string> DetectorRegistry::ids() const {
    std::vector<std::string> out;
    out.reserve(factories_.size());
    for (const auto &f : factories_)
        out.push_back(f.first);
    return out;
}

} // namespace surveyor
