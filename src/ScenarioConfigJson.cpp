#include "greenwave/ScenarioConfigJson.hpp"

#include <nlohmann/json.hpp>

#include <limits>
#include <set>

namespace greenwave
{
    namespace
    {
        using nlohmann::json;

        json pointToJson(const Point2 &p)
        {
            return json::array({p.x, p.y});
        }

        bool pointFromJson(const json &value, Point2 &p)
        {
            if (!value.is_array() || value.size() != 2 || !value[0].is_number() || !value[1].is_number())
            {
                return false;
            }
            p.x = value[0].get<double>();
            p.y = value[1].get<double>();
            return true;
        }

        bool roadIdFromJson(const json &value, std::size_t road_count, RoadId &id)
        {
            if (!value.is_number_unsigned())
            {
                return false;
            }
            const uint64_t raw = value.get<uint64_t>();
            if (raw >= road_count)
            {
                return false;
            }
            id = static_cast<RoadId>(raw);
            return true;
        }

        // A cycle of numbers is a duration list, a cycle of boolean arrays is a
        // mask list. Anything else is kept as unusable data so the controller
        // falls back to round-robin.
        PhaseCycle cycleFromJson(const json &value)
        {
            const PhaseCycle malformed = PhaseCycle::fromDurations({std::numeric_limits<double>::quiet_NaN()});
            if (!value.is_array())
            {
                return malformed;
            }
            if (value.empty())
            {
                return PhaseCycle{};
            }

            if (value[0].is_number())
            {
                std::vector<double> durations;
                for (const auto &entry : value)
                {
                    if (!entry.is_number())
                    {
                        return malformed;
                    }
                    durations.push_back(entry.get<double>());
                }
                return PhaseCycle::fromDurations(std::move(durations));
            }

            std::vector<PhaseMask> masks;
            for (const auto &entry : value)
            {
                if (!entry.is_array())
                {
                    return malformed;
                }
                PhaseMask mask;
                for (const auto &bit : entry)
                {
                    if (!bit.is_boolean())
                    {
                        return malformed;
                    }
                    mask.push_back(bit.get<bool>());
                }
                masks.push_back(std::move(mask));
            }
            return PhaseCycle::fromMasks(std::move(masks));
        }

        json cycleToJson(const PhaseCycle &cycle)
        {
            json out = json::array();
            if (!cycle.masks.empty())
            {
                for (const auto &mask : cycle.masks)
                {
                    json bits = json::array();
                    for (bool bit : mask)
                    {
                        bits.push_back(bit);
                    }
                    out.push_back(bits);
                }
                return out;
            }
            for (double d : cycle.durations)
            {
                out.push_back(d);
            }
            return out;
        }

        void parseRoads(const json &root, ScenarioParseResult &result)
        {
            if (!root.contains("roads") || !root["roads"].is_array())
            {
                result.errors.push_back("roads must be an array");
                return;
            }

            for (const auto &road_json : root["roads"])
            {
                RoadSegment segment;
                if (!road_json.is_object() || !road_json.contains("start") || !road_json.contains("end") ||
                    !pointFromJson(road_json["start"], segment.start) || !pointFromJson(road_json["end"], segment.end))
                {
                    result.errors.push_back("road " + std::to_string(result.config.roads.size()) +
                                            " needs start and end points as [x, y]");
                    continue;
                }
                result.config.roads.push_back(segment);
            }
        }

        void parseIntersections(const json &root, ScenarioParseResult &result)
        {
            if (!root.contains("intersections"))
            {
                return;
            }
            if (!root["intersections"].is_array())
            {
                result.errors.push_back("intersections must be an array");
                return;
            }

            const std::size_t road_count = result.config.roads.size();
            for (const auto &entry : root["intersections"])
            {
                RoadId road = 0;
                if (!entry.is_object() || !entry.contains("road") || !roadIdFromJson(entry["road"], road_count, road))
                {
                    result.errors.push_back("intersection entry references an unknown road");
                    continue;
                }
                if (!entry.contains("conflicts") || !entry["conflicts"].is_array())
                {
                    result.errors.push_back("intersection " + std::to_string(road) + " conflicts must be an array");
                    continue;
                }

                std::set<RoadId> &conflicts = result.config.intersections[road];
                for (const auto &other_json : entry["conflicts"])
                {
                    RoadId other = 0;
                    if (!roadIdFromJson(other_json, road_count, other))
                    {
                        result.errors.push_back("intersection " + std::to_string(road) + " conflicts with an unknown road");
                        continue;
                    }
                    conflicts.insert(other);
                }
            }
        }

        void parseSignals(const json &root, ScenarioParseResult &result)
        {
            if (!root.contains("signals"))
            {
                return;
            }
            if (!root["signals"].is_array())
            {
                result.errors.push_back("signals must be an array");
                return;
            }

            const std::size_t road_count = result.config.roads.size();
            for (const auto &signal_json : root["signals"])
            {
                const std::string label = "signal " + std::to_string(result.config.signals.size());
                if (!signal_json.is_object() || !signal_json.contains("groups") || !signal_json["groups"].is_array())
                {
                    result.errors.push_back(label + " groups must be an array");
                    continue;
                }

                SignalConfig signal;
                for (const auto &group_json : signal_json["groups"])
                {
                    if (!group_json.is_array())
                    {
                        result.errors.push_back(label + " group entries must be arrays of road ids");
                        continue;
                    }
                    SignalGroup group;
                    for (const auto &id_json : group_json)
                    {
                        RoadId id = 0;
                        if (!roadIdFromJson(id_json, road_count, id))
                        {
                            result.errors.push_back(label + " group references an unknown road");
                            continue;
                        }
                        group.push_back(id);
                    }
                    signal.groups.push_back(std::move(group));
                }

                if (signal_json.contains("cycle"))
                {
                    signal.default_cycle = cycleFromJson(signal_json["cycle"]);
                }
                else
                {
                    signal.default_cycle = PhaseCycle::fromDurations(
                        std::vector<double>(signal.groups.size(), DEFAULT_GREEN_SECONDS));
                }

                signal.timing.slow_distance = signal_json.value("slow_distance", signal.timing.slow_distance);
                signal.timing.slow_factor = signal_json.value("slow_factor", signal.timing.slow_factor);
                signal.timing.stop_distance = signal_json.value("stop_distance", signal.timing.stop_distance);
                result.config.signals.push_back(std::move(signal));
            }
        }

        void parseGenerators(const json &root, ScenarioParseResult &result)
        {
            if (!root.contains("generators") || !root["generators"].is_array())
            {
                result.errors.push_back("generators must be an array");
                return;
            }

            const std::size_t road_count = result.config.roads.size();
            for (const auto &generator_json : root["generators"])
            {
                const std::string label = "generator " + std::to_string(result.config.generators.size());
                if (!generator_json.is_object() || !generator_json.contains("vehicles_per_minute") ||
                    !generator_json["vehicles_per_minute"].is_number())
                {
                    result.errors.push_back(label + " vehicles_per_minute must be a number");
                    continue;
                }
                if (!generator_json.contains("routes") || !generator_json["routes"].is_array())
                {
                    result.errors.push_back(label + " routes must be an array");
                    continue;
                }

                GeneratorConfig generator;
                generator.vehicles_per_minute = generator_json["vehicles_per_minute"].get<double>();
                for (const auto &route_json : generator_json["routes"])
                {
                    if (!route_json.is_object() || !route_json.contains("paths") || !route_json["paths"].is_array())
                    {
                        result.errors.push_back(label + " route entries need a paths array");
                        continue;
                    }

                    RouteOption route;
                    route.weight = route_json.value("weight", 1.0);
                    for (const auto &path_json : route_json["paths"])
                    {
                        if (!path_json.is_array())
                        {
                            result.errors.push_back(label + " paths must be arrays of road ids");
                            continue;
                        }
                        RoadPath path;
                        bool valid = true;
                        for (const auto &id_json : path_json)
                        {
                            RoadId id = 0;
                            if (!roadIdFromJson(id_json, road_count, id))
                            {
                                valid = false;
                                break;
                            }
                            path.push_back(id);
                        }
                        if (!valid)
                        {
                            result.errors.push_back(label + " path references an unknown road");
                            continue;
                        }
                        route.alternatives.push_back(std::move(path));
                    }
                    generator.routes.push_back(std::move(route));
                }
                result.config.generators.push_back(std::move(generator));
            }
        }
    }

    std::string scenarioConfigToJson(const ScenarioConfig &config)
    {
        json root;
        root["id"] = config.id;
        root["name"] = config.name;
        if (config.max_generated.has_value())
        {
            root["max_generated"] = *config.max_generated;
        }

        root["roads"] = json::array();
        for (const auto &segment : config.roads)
        {
            root["roads"].push_back({{"start", pointToJson(segment.start)}, {"end", pointToJson(segment.end)}});
        }

        root["intersections"] = json::array();
        for (const auto &entry : config.intersections)
        {
            root["intersections"].push_back({{"road", entry.first}, {"conflicts", entry.second}});
        }

        root["signals"] = json::array();
        for (const auto &signal : config.signals)
        {
            json signal_json;
            signal_json["groups"] = signal.groups;
            signal_json["cycle"] = cycleToJson(signal.default_cycle);
            signal_json["slow_distance"] = signal.timing.slow_distance;
            signal_json["slow_factor"] = signal.timing.slow_factor;
            signal_json["stop_distance"] = signal.timing.stop_distance;
            root["signals"].push_back(signal_json);
        }

        root["generators"] = json::array();
        for (const auto &generator : config.generators)
        {
            json generator_json;
            generator_json["vehicles_per_minute"] = generator.vehicles_per_minute;
            generator_json["routes"] = json::array();
            for (const auto &route : generator.routes)
            {
                generator_json["routes"].push_back({{"weight", route.weight}, {"paths", route.alternatives}});
            }
            root["generators"].push_back(generator_json);
        }

        return root.dump();
    }

    ScenarioParseResult scenarioConfigFromJson(const std::string &json_text)
    {
        ScenarioParseResult result;

        json root;
        try
        {
            root = json::parse(json_text);
        }
        catch (const std::exception &e)
        {
            result.errors.push_back(std::string("invalid JSON: ") + e.what());
            return result;
        }

        if (!root.is_object())
        {
            result.errors.push_back("root must be an object");
            return result;
        }

        result.config.id = root.value("id", 0);
        result.config.name = root.value("name", std::string("custom"));
        if (root.contains("max_generated"))
        {
            if (root["max_generated"].is_number_unsigned())
            {
                result.config.max_generated = root["max_generated"].get<std::size_t>();
            }
            else if (!root["max_generated"].is_null())
            {
                result.errors.push_back("max_generated must be an unsigned number");
            }
        }

        parseRoads(root, result);
        if (!result.errors.empty())
        {
            // Later sections reference road ids; nothing to check them against.
            return result;
        }
        parseIntersections(root, result);
        parseSignals(root, result);
        parseGenerators(root, result);

        result.ok = result.errors.empty();
        return result;
    }

    std::string validationErrorsToJson(const std::vector<std::string> &errors)
    {
        json root;
        root["ok"] = false;
        root["errors"] = errors;
        return root.dump();
    }
} // namespace greenwave
