#include "engine/SamplingScheduler.hpp"

namespace gitpulse {

std::vector<size_t> SamplingScheduler::sampleIndices(size_t total, size_t budget) {
    std::vector<size_t> indices;
    if (total <= budget) {
        indices.reserve(total);
        for (size_t i = 0; i < total; ++i) indices.push_back(i);
        return indices;
    }
    indices.reserve(budget);
    for (size_t i = 0; i < budget; ++i) {
        indices.push_back(i * total / budget);
    }
    return indices;
}

std::vector<DiffMode> SamplingScheduler::assign(size_t total) const {
    std::vector<DiffMode> modes(total, DiffMode::Fast);
    for (size_t index : sampleIndices(total, budget)) {
        modes[index] = DiffMode::Full;
    }
    return modes;
}

}
