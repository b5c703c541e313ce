#include "greenwave/VehicleGenerator.hpp"

#include <cmath>
#include <limits>
#include <stdexcept>
#include <utility>

namespace greenwave
{
    namespace
    {
        std::vector<double> sanitizedWeights(const std::vector<WeightedPath> &paths)
        {
            std::vector<double> weights;
            double total = 0.0;
            for (const auto &entry : paths)
            {
                double w = (std::isfinite(entry.weight) && entry.weight > 0.0) ? entry.weight : 0.0;
                weights.push_back(w);
                total += w;
            }

            if (total <= 0.0)
            {
                // No usable weights: every path equally likely.
                weights.assign(paths.size(), 1.0);
            }
            return weights;
        }
    }

    std::vector<WeightedPath> normalizeRoutes(const std::vector<RouteOption> &routes)
    {
        std::vector<WeightedPath> flat;
        for (const auto &route : routes)
        {
            for (const auto &path : route.alternatives)
            {
                if (!path.empty())
                {
                    flat.push_back({route.weight, path});
                }
            }
        }
        return flat;
    }

    VehicleGenerator::VehicleGenerator(GenerationSpec spec, uint32_t seed, DriverProfile driver)
        : generation_spec(std::move(spec)), driver_profile(driver), rng(seed)
    {
        for (const auto &entry : generation_spec.paths)
        {
            if (entry.path.empty())
            {
                throw std::invalid_argument("generator path is empty");
            }
            inbound_roads.insert(entry.path.front());
            if (entry.path.size() > 1)
            {
                outbound_roads.insert(entry.path.back());
            }
        }

        if (!generation_spec.paths.empty())
        {
            std::vector<double> weights = sanitizedWeights(generation_spec.paths);
            path_choice = std::discrete_distribution<std::size_t>(weights.begin(), weights.end());
            drawUpcomingPath();
        }
    }

    double VehicleGenerator::spawnInterval() const
    {
        const double rate = generation_spec.vehicles_per_minute;
        if (!std::isfinite(rate) || rate <= 0.0)
        {
            return std::numeric_limits<double>::infinity();
        }
        return 60.0 / rate;
    }

    void VehicleGenerator::drawUpcomingPath()
    {
        upcoming_path = path_choice(rng);
    }

    std::optional<RoadId> VehicleGenerator::update(double now, std::size_t generated_so_far, RoadNetwork &network)
    {
        if (!upcoming_path.has_value() || now - last_added_time < spawnInterval())
        {
            return std::nullopt;
        }

        const RoadPath &path = generation_spec.paths[*upcoming_path].path;
        Road &entry = network.road(path.front());

        // Hold the vehicle back until the entry has room for it.
        if (!entry.empty())
        {
            const Vehicle &last = entry.vehicles().back();
            if (last.x <= driver_profile.min_gap + driver_profile.length)
            {
                return std::nullopt;
            }
        }

        entry.enqueue(Vehicle(static_cast<uint32_t>(generated_so_far), path, driver_profile));
        last_added_time = now;
        drawUpcomingPath();
        return entry.id();
    }

} // namespace greenwave
