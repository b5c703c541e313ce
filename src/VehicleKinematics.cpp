#include "greenwave/VehicleKinematics.hpp"

#include <algorithm>
#include <cmath>

namespace greenwave
{
    namespace
    {
        constexpr double MIN_GAP_EPSILON = 1e-3; // keeps the interaction term finite
    }

    void IntelligentDriverModel::advance(Road &road, const SignalCue &cue, double dt_seconds, double now)
    {
        auto &queue = road.vehicles();
        if (queue.empty())
        {
            return;
        }

        step(queue[0], nullptr, dt_seconds);
        for (std::size_t i = 1; i < queue.size(); ++i)
        {
            step(queue[i], &queue[i - 1], dt_seconds);
        }

        applySignal(road, cue, now);
        road.syncPositions();
    }

    void IntelligentDriverModel::step(Vehicle &vehicle, const Vehicle *lead, double dt_seconds)
    {
        const DriverProfile &p = vehicle.profile;

        if (vehicle.v + vehicle.a * dt_seconds < 0.0)
        {
            // Would reverse: brake to a standstill inside this step.
            vehicle.x -= 0.5 * vehicle.v * vehicle.v / vehicle.a;
            vehicle.v = 0.0;
        }
        else
        {
            vehicle.v += vehicle.a * dt_seconds;
            vehicle.x += vehicle.v * dt_seconds + vehicle.a * dt_seconds * dt_seconds / 2.0;
        }

        double interaction = 0.0;
        if (lead)
        {
            const double sqrt_ab = 2.0 * std::sqrt(p.max_accel * p.comfort_decel);
            const double gap = std::max(MIN_GAP_EPSILON, lead->x - vehicle.x - lead->profile.length);
            const double closing = vehicle.v - lead->v;
            interaction = (p.min_gap + std::max(0.0, p.time_headway * vehicle.v + closing * vehicle.v / sqrt_ab)) / gap;
        }

        const double cap = vehicle.speed_cap > 0.0 ? vehicle.speed_cap : p.max_speed;
        vehicle.a = p.max_accel * (1.0 - std::pow(vehicle.v / cap, 4) - interaction * interaction);

        if (vehicle.stopped)
        {
            vehicle.a = -p.comfort_decel * vehicle.v / cap;
        }
    }

    void IntelligentDriverModel::applySignal(Road &road, const SignalCue &cue, double now)
    {
        auto &queue = road.vehicles();
        Vehicle &lead = queue.front();

        if (!cue.controlled || cue.green)
        {
            lead.unstop(now);
            for (auto &vehicle : queue)
            {
                vehicle.unslow();
            }
            return;
        }

        const double length = road.length();
        if (lead.x >= length - cue.timing.slow_distance)
        {
            lead.slow(cue.timing.slow_factor);
        }
        if (lead.x >= length - cue.timing.stop_distance && lead.x <= length - cue.timing.stop_distance / 2.0)
        {
            lead.stop(now);
        }
    }

} // namespace greenwave
