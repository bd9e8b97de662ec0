#pragma once

#include <string>

#include "datatypes.hpp"
#include "series_store.hpp"

namespace pipeline {

    // Everything a stage may look at for one symbol at one decision time.
    // All windows are cut at decision_time, so later bars are unreachable.
    struct StageInput {
        std::string symbol;
        core::Timestamp decision_time;
        core::Mode mode = core::Mode::Retrospective;
        data::SeriesWindow daily;
        data::SeriesWindow weekly;
        data::SeriesWindow fundamental;
        data::SeriesWindow earnings;

        static StageInput fromSeries(const data::SymbolSeries& series,
                                     core::Timestamp decision_time,
                                     core::Mode mode);
    };

    // --- Stage Interface ---
    // A pure predicate over a StageInput. Implementations report missing or
    // non-finite data as a failed result rather than throwing.
    class IStage {
    public:
        virtual ~IStage() = default;

        virtual core::StageId id() const = 0;

        virtual core::StageResult evaluate(const StageInput& input) const = 0;

        virtual std::string describe() const = 0;
    };

    // Result pre-filled with symbol, stage and decision time
    core::StageResult makeResult(const StageInput& input, core::StageId stage);

    // Marks the result failed with a reason; returns it for `return fail(...)`
    core::StageResult& fail(core::StageResult& result, const std::string& reason);

} // namespace pipeline
