#include "greenwave/ScenarioConfig.hpp"

#include <array>
#include <cmath>
#include <map>
#include <set>
#include <utility>

namespace greenwave
{
    namespace
    {
        constexpr double JUNCTION_HALF_SIZE = 12.0; // center to stop line
        constexpr double LANE_OFFSET = 2.0;         // center line to lane axis
        constexpr double ARM_LENGTH = 60.0;
        constexpr double NODE_SPACING = 150.0;
        constexpr std::size_t MAX_ROUTE_HOPS = 3;
        constexpr double POINT_EPSILON = 1e-9;

        const SignalTiming kJunctionTiming{50.0, 0.4, 15.0};

        struct ArmGeometry
        {
            Point2 in_end;    // where the inbound lane meets the junction
            Point2 out_start; // where the outbound lane leaves it
            Point2 away;      // unit vector pointing away from the center
        };

        ArmGeometry armGeometry(const Point2 &c, ApproachId arm)
        {
            const double a = LANE_OFFSET;
            const double b = JUNCTION_HALF_SIZE;
            switch (arm)
            {
            case ApproachId::North:
                return {{c.x - a, c.y - b}, {c.x + a, c.y - b}, {0.0, -1.0}};
            case ApproachId::East:
                return {{c.x + b, c.y - a}, {c.x + b, c.y + a}, {1.0, 0.0}};
            case ApproachId::South:
                return {{c.x + a, c.y + b}, {c.x - a, c.y + b}, {0.0, 1.0}};
            case ApproachId::West:
                return {{c.x - b, c.y + a}, {c.x - b, c.y - a}, {-1.0, 0.0}};
            }
            return {c, c, {0.0, 0.0}};
        }

        Point2 offsetPoint(const Point2 &p, const Point2 &dir, double length)
        {
            return {p.x + dir.x * length, p.y + dir.y * length};
        }

        double cross(const Point2 &o, const Point2 &a, const Point2 &b)
        {
            return (a.x - o.x) * (b.y - o.y) - (a.y - o.y) * (b.x - o.x);
        }

        bool samePoint(const Point2 &a, const Point2 &b)
        {
            return distance(a, b) < POINT_EPSILON;
        }

        // Two connectors conflict when they merge into the same exit or cross.
        // Connectors leaving the same stop line only diverge.
        bool connectorsConflict(const RoadSegment &p, const RoadSegment &q)
        {
            if (samePoint(p.end, q.end))
            {
                return true;
            }
            if (samePoint(p.start, q.start))
            {
                return false;
            }

            const double d1 = cross(q.start, q.end, p.start);
            const double d2 = cross(q.start, q.end, p.end);
            const double d3 = cross(p.start, p.end, q.start);
            const double d4 = cross(p.start, p.end, q.end);
            return ((d1 > 0.0) != (d2 > 0.0)) && ((d3 > 0.0) != (d4 > 0.0));
        }

        struct Junction
        {
            Point2 center;
            std::vector<ApproachId> arms;
            std::array<std::optional<RoadId>, 4> inbound{};
            std::array<std::optional<RoadId>, 4> outbound{};
            std::array<std::optional<std::pair<std::size_t, ApproachId>>, 4> links{};
            std::map<std::pair<ApproachId, ApproachId>, RoadId> connectors;
        };

        // Lays out signalised junctions joined by two-way links and derives
        // roads, conflicts, signal groups and routes from the layout.
        class JunctionLayout
        {
        public:
            std::size_t addJunction(Point2 center, std::vector<ApproachId> arms)
            {
                Junction junction;
                junction.center = center;
                junction.arms = std::move(arms);
                junctions.push_back(std::move(junction));
                return junctions.size() - 1;
            }

            void link(std::size_t a, ApproachId arm_a, std::size_t b, ApproachId arm_b)
            {
                junctions[a].links[approachIndex(arm_a)] = std::make_pair(b, arm_b);
                junctions[b].links[approachIndex(arm_b)] = std::make_pair(a, arm_a);
            }

            ScenarioConfig build(int id, std::string name, double vehicles_per_minute)
            {
                ScenarioConfig config;
                config.id = id;
                config.name = std::move(name);

                addExternalRoads(config);
                addLinkRoads(config);
                addConnectors(config);

                for (const auto &junction : junctions)
                {
                    SignalConfig signal;
                    for (ApproachId arm : junction.arms)
                    {
                        signal.groups.push_back({*junction.inbound[approachIndex(arm)]});
                    }
                    signal.default_cycle = PhaseCycle::fromDurations(
                        std::vector<double>(signal.groups.size(), DEFAULT_GREEN_SECONDS));
                    signal.timing = kJunctionTiming;
                    config.signals.push_back(std::move(signal));
                }

                config.generators.push_back({vehicles_per_minute, enumerateRoutes()});
                return config;
            }

        private:
            static RoadId push(ScenarioConfig &config, Point2 start, Point2 end)
            {
                config.roads.push_back({start, end});
                return static_cast<RoadId>(config.roads.size() - 1);
            }

            void addExternalRoads(ScenarioConfig &config)
            {
                for (auto &junction : junctions)
                {
                    for (ApproachId arm : junction.arms)
                    {
                        const std::size_t idx = approachIndex(arm);
                        if (junction.links[idx].has_value())
                        {
                            continue;
                        }
                        ArmGeometry g = armGeometry(junction.center, arm);
                        junction.inbound[idx] = push(config, offsetPoint(g.in_end, g.away, ARM_LENGTH), g.in_end);
                        junction.outbound[idx] = push(config, g.out_start, offsetPoint(g.out_start, g.away, ARM_LENGTH));
                    }
                }
            }

            void addLinkRoads(ScenarioConfig &config)
            {
                for (std::size_t a = 0; a < junctions.size(); ++a)
                {
                    for (ApproachId arm : junctions[a].arms)
                    {
                        const auto &link = junctions[a].links[approachIndex(arm)];
                        if (!link.has_value())
                        {
                            continue;
                        }

                        // Each link road is created once, by its upstream junction.
                        Junction &to = junctions[link->first];
                        ArmGeometry from_geom = armGeometry(junctions[a].center, arm);
                        ArmGeometry to_geom = armGeometry(to.center, link->second);
                        RoadId id = push(config, from_geom.out_start, to_geom.in_end);
                        junctions[a].outbound[approachIndex(arm)] = id;
                        to.inbound[approachIndex(link->second)] = id;
                    }
                }
            }

            void addConnectors(ScenarioConfig &config)
            {
                for (auto &junction : junctions)
                {
                    std::vector<RoadId> created;
                    for (ApproachId from : junction.arms)
                    {
                        for (ApproachId to : junction.arms)
                        {
                            if (from == to)
                            {
                                continue;
                            }
                            ArmGeometry in = armGeometry(junction.center, from);
                            ArmGeometry out = armGeometry(junction.center, to);
                            RoadId id = push(config, in.in_end, out.out_start);
                            junction.connectors[{from, to}] = id;
                            created.push_back(id);
                        }
                    }

                    for (RoadId p : created)
                    {
                        for (RoadId q : created)
                        {
                            if (p != q && connectorsConflict(config.roads[p], config.roads[q]))
                            {
                                config.intersections[p].insert(q);
                            }
                        }
                    }
                }
            }

            static double routeWeight(bool all_straight, std::size_t hops)
            {
                if (all_straight)
                    return 3.0;
                return hops == 1 ? 2.0 : 1.0;
            }

            void extendRoute(std::size_t node, ApproachId from, RoadPath path, std::set<std::size_t> visited,
                             bool all_straight, std::map<double, std::vector<RoadPath>> &by_weight) const
            {
                const Junction &junction = junctions[node];
                visited.insert(node);

                for (ApproachId to : junction.arms)
                {
                    if (to == from)
                    {
                        continue;
                    }

                    RoadPath next = path;
                    next.push_back(junction.connectors.at({from, to}));
                    next.push_back(*junction.outbound[approachIndex(to)]);
                    const bool straight = all_straight && movementBetween(from, to) == MovementType::Straight;

                    const auto &link = junction.links[approachIndex(to)];
                    if (!link.has_value())
                    {
                        by_weight[routeWeight(straight, visited.size())].push_back(std::move(next));
                        continue;
                    }
                    if (visited.count(link->first) == 0 && visited.size() < MAX_ROUTE_HOPS)
                    {
                        extendRoute(link->first, link->second, std::move(next), visited, straight, by_weight);
                    }
                }
            }

            std::vector<RouteOption> enumerateRoutes() const
            {
                std::vector<RouteOption> routes;
                for (std::size_t node = 0; node < junctions.size(); ++node)
                {
                    for (ApproachId arm : junctions[node].arms)
                    {
                        if (junctions[node].links[approachIndex(arm)].has_value())
                        {
                            continue;
                        }

                        std::map<double, std::vector<RoadPath>> by_weight;
                        RoadPath start{*junctions[node].inbound[approachIndex(arm)]};
                        extendRoute(node, arm, start, {}, true, by_weight);
                        for (auto &entry : by_weight)
                        {
                            routes.push_back({entry.first, std::move(entry.second)});
                        }
                    }
                }
                return routes;
            }

            std::vector<Junction> junctions;
        };

        const std::vector<ApproachId> kAllArms = {ApproachId::West, ApproachId::East, ApproachId::North, ApproachId::South};
    }

    ScenarioConfig makeFourWayScenario()
    {
        JunctionLayout layout;
        layout.addJunction({0.0, 0.0}, kAllArms);
        return layout.build(1, "4-way", 25.0);
    }

    ScenarioConfig makeTJunctionScenario()
    {
        JunctionLayout layout;
        layout.addJunction({0.0, 0.0}, {ApproachId::West, ApproachId::East, ApproachId::South});
        return layout.build(2, "T-junction", 20.0);
    }

    ScenarioConfig makeCorridorScenario()
    {
        JunctionLayout layout;
        std::size_t a = layout.addJunction({0.0, 0.0}, {ApproachId::North, ApproachId::South, ApproachId::West, ApproachId::East});
        std::size_t b = layout.addJunction({NODE_SPACING, 0.0}, {ApproachId::North, ApproachId::South, ApproachId::East, ApproachId::West});
        layout.link(a, ApproachId::East, b, ApproachId::West);
        return layout.build(3, "Corridor (2 nodes)", 24.0);
    }

    ScenarioConfig makeGridScenario()
    {
        JunctionLayout layout;
        std::size_t tl = layout.addJunction({0.0, 0.0}, {ApproachId::North, ApproachId::West, ApproachId::East, ApproachId::South});
        std::size_t tr = layout.addJunction({NODE_SPACING, 0.0}, {ApproachId::North, ApproachId::East, ApproachId::West, ApproachId::South});
        std::size_t bl = layout.addJunction({0.0, NODE_SPACING}, {ApproachId::South, ApproachId::West, ApproachId::North, ApproachId::East});
        std::size_t br = layout.addJunction({NODE_SPACING, NODE_SPACING}, {ApproachId::South, ApproachId::East, ApproachId::North, ApproachId::West});
        layout.link(tl, ApproachId::East, tr, ApproachId::West);
        layout.link(tl, ApproachId::South, bl, ApproachId::North);
        layout.link(tr, ApproachId::South, br, ApproachId::North);
        layout.link(bl, ApproachId::East, br, ApproachId::West);
        return layout.build(4, "Grid 2x2 (4 nodes)", 30.0);
    }

    ScenarioConfig makeArterialScenario()
    {
        JunctionLayout layout;
        std::size_t top = layout.addJunction({0.0, 0.0}, {ApproachId::North, ApproachId::East, ApproachId::South});
        std::size_t mid = layout.addJunction({0.0, NODE_SPACING}, {ApproachId::East, ApproachId::West, ApproachId::North, ApproachId::South});
        std::size_t bot = layout.addJunction({0.0, 2.0 * NODE_SPACING}, {ApproachId::South, ApproachId::East, ApproachId::North});
        layout.link(top, ApproachId::South, mid, ApproachId::North);
        layout.link(mid, ApproachId::South, bot, ApproachId::North);
        return layout.build(5, "Arterial (3 nodes)", 24.0);
    }

    std::vector<int> builtinScenarioIds()
    {
        return {1, 2, 3, 4, 5};
    }

    std::optional<ScenarioConfig> makeBuiltinScenario(int scenario_id)
    {
        switch (scenario_id)
        {
        case 1:
            return makeFourWayScenario();
        case 2:
            return makeTJunctionScenario();
        case 3:
            return makeCorridorScenario();
        case 4:
            return makeGridScenario();
        case 5:
            return makeArterialScenario();
        default:
            return std::nullopt;
        }
    }

} // namespace greenwave
