#pragma once

#include <memory>

#include "interfaces.hpp"
#include "pipeline_runner.hpp"
#include "profile.hpp"

namespace pipeline {

    class StageFactory {
    public:
        static std::unique_ptr<IStage> createStage(core::StageId stage, const config::StageSettings& settings);

        // E -> F -> W -> RS -> D with the enabled flags from settings
        static std::unique_ptr<PipelineRunner> createRunner(const config::StageSettings& settings,
                                                            core::WorkerPool* pool = nullptr);
    };

} // namespace pipeline
