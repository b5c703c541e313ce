#pragma once

#include "Road.hpp"
#include "TrafficLightControllers.hpp"

namespace greenwave
{
    // What the signal (if any) at the end of a road currently says.
    struct SignalCue
    {
        bool controlled = false;
        bool green = true;
        SignalTiming timing{};
    };

    // Moves the vehicles of one road forward in time. Implementations own the
    // car-following rules; the engine only relies on the queue order, `x`,
    // `position` and `waitTime()`.
    class IVehicleKinematics
    {
    public:
        virtual ~IVehicleKinematics() = default;
        virtual void advance(Road &road, const SignalCue &cue, double dt_seconds, double now) = 0;
    };

    class IntelligentDriverModel : public IVehicleKinematics
    {
    public:
        void advance(Road &road, const SignalCue &cue, double dt_seconds, double now) override;

        // One integration step for `vehicle` following `lead` (nullptr when it
        // leads the road).
        static void step(Vehicle &vehicle, const Vehicle *lead, double dt_seconds);

    private:
        static void applySignal(Road &road, const SignalCue &cue, double now);
    };

} // namespace greenwave
