#include "greenwave/TrafficLightControllers.hpp"

#include <cmath>
#include <numeric>
#include <utility>

namespace greenwave
{
    SignalController::SignalController(std::vector<SignalGroup> groups, const PhaseCycle &cycle, SignalTiming timing)
        : signal_groups(std::move(groups)), signal_timing(timing)
    {
        parseCycle(cycle);
        reset();
    }

    void SignalController::parseCycle(const PhaseCycle &cycle)
    {
        const std::size_t group_count = signal_groups.size();
        const bool has_durations = !cycle.durations.empty();
        const bool has_masks = !cycle.masks.empty();

        if (has_durations == has_masks)
        {
            applyRoundRobin();
            return;
        }

        if (has_durations)
        {
            for (double value : cycle.durations)
            {
                if (!std::isfinite(value) || value <= 0.0)
                {
                    applyRoundRobin();
                    return;
                }
            }

            // One phase per group: truncate, or repeat the last duration.
            std::vector<double> durations = cycle.durations;
            if (durations.size() > group_count)
            {
                durations.resize(group_count);
            }
            while (durations.size() < group_count)
            {
                durations.push_back(durations.back());
            }

            cycle_mode = CycleMode::Durations;
            fallback = false;
            phase_durations = std::move(durations);
            mask_cycle.clear();
            for (std::size_t i = 0; i < group_count; ++i)
            {
                mask_cycle.push_back(oneHot(i, group_count));
            }
            return;
        }

        for (const auto &mask : cycle.masks)
        {
            if (mask.size() != group_count)
            {
                applyRoundRobin();
                return;
            }
        }

        cycle_mode = CycleMode::Masks;
        fallback = false;
        phase_durations.clear();
        mask_cycle = cycle.masks;
    }

    void SignalController::applyRoundRobin()
    {
        const std::size_t group_count = signal_groups.size();
        cycle_mode = CycleMode::Durations;
        fallback = true;
        phase_durations.assign(group_count, 1.0);
        mask_cycle.clear();
        for (std::size_t i = 0; i < group_count; ++i)
        {
            mask_cycle.push_back(oneHot(i, group_count));
        }
    }

    PhaseMask SignalController::oneHot(std::size_t index, std::size_t width)
    {
        PhaseMask mask(width, false);
        mask[index] = true;
        return mask;
    }

    void SignalController::tick(double dt_seconds)
    {
        if (mask_cycle.empty() || cycle_mode == CycleMode::Masks)
        {
            return;
        }
        if (!std::isfinite(dt_seconds) || dt_seconds <= 0.0)
        {
            return;
        }

        phase_elapsed += dt_seconds;
        while (phase_elapsed >= phase_durations[phase_index])
        {
            phase_elapsed -= phase_durations[phase_index];
            phase_index = (phase_index + 1) % mask_cycle.size();
        }
    }

    void SignalController::advancePhase()
    {
        if (mask_cycle.empty())
        {
            return;
        }
        phase_index = (phase_index + 1) % mask_cycle.size();
        phase_elapsed = 0.0;
    }

    void SignalController::update(std::optional<double> dt_seconds)
    {
        if (!dt_seconds.has_value())
        {
            advancePhase();
            return;
        }
        tick(*dt_seconds);
    }

    PhaseMask SignalController::currentPhaseMask() const
    {
        if (mask_cycle.empty())
        {
            return {};
        }
        return mask_cycle[phase_index];
    }

    bool SignalController::isGreen(std::size_t group_index) const
    {
        if (mask_cycle.empty() || group_index >= signal_groups.size())
        {
            return false;
        }
        return mask_cycle[phase_index][group_index];
    }

    double SignalController::cycleDuration() const
    {
        return std::accumulate(phase_durations.begin(), phase_durations.end(), 0.0);
    }

    void SignalController::reset()
    {
        phase_index = 0;
        phase_elapsed = 0.0;
    }

} // namespace greenwave
