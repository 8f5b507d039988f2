#include "core/pipeline_builder.hpp"
#include "core/pipeline.hpp"

#include <stdexcept>

namespace rulegate {

std::shared_ptr<Pipeline> PipelineBuilder::build() {
    if (!parts_.hooks) {
        throw std::invalid_argument("PipelineBuilder: a hook registry is required");
    }
    return std::make_shared<Pipeline>(std::move(parts_));
}

} // namespace rulegate
