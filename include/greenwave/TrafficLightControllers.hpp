#pragma once

#include "Geometry.hpp"

#include <cstddef>
#include <optional>
#include <utility>
#include <vector>

namespace greenwave
{
    using PhaseMask = std::vector<bool>;
    using SignalGroup = std::vector<RoadId>;

    // Raw cycle data as supplied by a scenario. Exactly one of the two lists is
    // expected to be filled; anything else is treated as malformed.
    struct PhaseCycle
    {
        std::vector<double> durations;
        std::vector<PhaseMask> masks;

        static PhaseCycle fromDurations(std::vector<double> values)
        {
            PhaseCycle cycle;
            cycle.durations = std::move(values);
            return cycle;
        }

        static PhaseCycle fromMasks(std::vector<PhaseMask> values)
        {
            PhaseCycle cycle;
            cycle.masks = std::move(values);
            return cycle;
        }
    };

    // Forwarded untouched to the kinematics model.
    struct SignalTiming
    {
        double slow_distance = 50.0;
        double slow_factor = 0.4;
        double stop_distance = 15.0;
    };

    class SignalController
    {
    public:
        enum class CycleMode
        {
            Durations,
            Masks
        };

        SignalController(std::vector<SignalGroup> groups, const PhaseCycle &cycle, SignalTiming timing = SignalTiming{});

        // Accumulates time in duration mode; ignored in mask mode and for
        // non-positive or non-finite deltas.
        void tick(double dt_seconds);

        // Immediate switch to the next phase, in either mode.
        void advancePhase();

        // nullopt requests an immediate switch, a value is a timed tick.
        void update(std::optional<double> dt_seconds);

        PhaseMask currentPhaseMask() const;
        bool isGreen(std::size_t group_index) const;

        std::size_t phaseIndex() const { return phase_index; }
        std::size_t phaseCount() const { return mask_cycle.size(); }
        std::size_t groupCount() const { return signal_groups.size(); }
        CycleMode mode() const { return cycle_mode; }
        bool usedFallback() const { return fallback; }

        const std::vector<double> &durations() const { return phase_durations; }
        double cycleDuration() const;
        double timeInPhase() const { return phase_elapsed; }

        const std::vector<SignalGroup> &groups() const { return signal_groups; }
        const SignalTiming &timing() const { return signal_timing; }

        void reset();

    private:
        void parseCycle(const PhaseCycle &cycle);
        void applyRoundRobin();
        static PhaseMask oneHot(std::size_t index, std::size_t width);

        std::vector<SignalGroup> signal_groups;
        SignalTiming signal_timing;
        CycleMode cycle_mode = CycleMode::Durations;
        bool fallback = false;
        std::vector<double> phase_durations;
        std::vector<PhaseMask> mask_cycle;
        std::size_t phase_index = 0;
        double phase_elapsed = 0.0;
    };

} // namespace greenwave
