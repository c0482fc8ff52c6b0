/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <hamsky.hpp>
#include <hamsky/cli/json.hpp>
#include <hamsky/time.hpp>
#include <CLI/CLI.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/fmt/fmt.h>
#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <future>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

using spdlog::error;

/** Replace ~ with HOME directory */
std::string expandTilde(const std::string &path) {
    if (!path.empty() && path[0] == '~') {
        const char *home = std::getenv("HOME");
        if (home) {
            return std::string(home) + path.substr(1);
        }
    }
    return path;
}

/** Convert azimuth in degrees to compass direction string */
std::string azimuthToCompass(double azimuthInDegrees) {
    static const char *points[] = {
        "N", "NNE", "NE", "ENE", "E", "ESE", "SE", "SSE",
        "S", "SSW", "SW", "WSW", "W", "WNW", "NW", "NNW"
    };
    double deg = hamsky::normalizeDegrees(azimuthInDegrees);
    int index = static_cast<int>((deg + 11.25) / 22.5) % 16;
    return points[index];
}

std::string formatDuration(std::chrono::system_clock::duration d) {
    using namespace std::chrono;
    auto secs = duration_cast<seconds>(d);
    auto h = duration_cast<hours>(secs).count();
    auto m = duration_cast<minutes>(secs % hours(1)).count();
    auto s = (secs % minutes(1)).count();
    if (h > 0) {
        return fmt::format("{}h {:>2}m {:>2}s", h, m, s);
    }
    return fmt::format("{:>2}m {:>2}s", m, s);
}

std::string formatOptionalTime(const std::optional<hamsky::time_point> &tp) {
    return tp ? hamsky::formatTime(*tp) : std::string("-");
}

/** Print an error at the command boundary and exit */
[[noreturn]] void fail(const std::exception &err) {
    error("{}", err.what());
    std::exit(1);
}

template <typename F>
void printJSON(F &&write) {
    rapidjson::StringBuffer buffer;
    hamsky::cli::JsonWriter writer(buffer);
    write(writer);
    std::cout << buffer.GetString() << std::endl;
}

void printStaleness(const std::optional<hamsky::StalenessWarning> &staleness) {
    if (staleness) {
        std::cout << fmt::format("  Warning:   element set is {} hours old",
            std::chrono::duration_cast<std::chrono::hours>(staleness->age).count()) << std::endl;
    }
}

/**
 * Everything a command needs, built from the configuration once the
 * command line has been parsed.
 */
class Services {
public:
    explicit Services(hamsky::Config &config) {
        catalog_.replace(hamsky::loadElementSets(config.getElementFile()));

        auto source = std::make_shared<hamsky::CompositeSource>();
        source->add(std::make_shared<hamsky::SolarSystemSource>());
        source->add(std::make_shared<hamsky::SatelliteSource>(catalog_, std::make_shared<hamsky::KeplerPropagator>()));
        source_ = source;

        engine_ = std::make_unique<hamsky::GeometryEngine>(*source_,
            static_cast<std::size_t>(config.getWorkerThreads()), config.getStalenessHorizon());
    }

    hamsky::ElementSetCatalog& catalog() { return catalog_; }
    const hamsky::PositionSource& source() { return *source_; }
    hamsky::GeometryEngine& engine() { return *engine_; }

private:
    hamsky::ElementSetCatalog catalog_;
    std::shared_ptr<hamsky::PositionSource> source_;
    std::unique_ptr<hamsky::GeometryEngine> engine_;
};

void printPasses(const std::vector<hamsky::Pass> &passes, const hamsky::PositionSource &source) {
    using namespace hamsky;

    constexpr std::string_view rowFormat = "{:^25} {:^25} {:^25} {:^12} {:^12} {:^12} {:^12} {:^10}";

    std::string sep25(25, '-');
    std::string sep12(12, '-');
    std::string sep10(10, '-');

    std::cout << fmt::format(rowFormat, "Body", "Start", "End", "Duration", "Start Az", "End Az", "Max Az", "Max Elev") << std::endl;
    std::cout << fmt::format(rowFormat, sep25, sep25, sep25, sep12, sep12, sep12, sep12, sep10) << std::endl;
    for (const auto &pass : passes) {
        std::string body = pass.bodyId;
        if (auto set = source.elementSetFor(pass.bodyId)) {
            body = fmt::format("{:<5} {:<17}", set->getNoradID(), set->getName().substr(0, 17));
        }
        auto az = [](const std::optional<PassEvent> &event) {
            return event ? fmt::format("{:>6.2f} {:<3}", event->azimuthInDegrees, azimuthToCompass(event->azimuthInDegrees))
                         : std::string("-");
        };
        std::cout << fmt::format(rowFormat,
            body,
            pass.rise ? formatTime(pass.start) : "(" + formatTime(pass.start) + ")",
            pass.set ? formatTime(pass.end) : "(" + formatTime(pass.end) + ")",
            formatDuration(pass.duration()),
            az(pass.rise),
            az(pass.set),
            az(pass.culminate),
            fmt::format("{:<5.2f}", pass.maxElevationInDegrees)) << std::endl;
    }
    std::cout << std::endl;
}

/** Program entry point */
int main(int argc, char* argv[]) {
    spdlog::set_default_logger(spdlog::stderr_color_mt("hamsky"));
    spdlog::set_level(spdlog::level::warn);

    hamsky::Config config;
    config.setElementFile(expandTilde("~/.hamsky.tle"));
    config.setTime(std::chrono::system_clock::now());

    auto configFile = expandTilde("~/.hamsky.toml");

    CLI::App app{"hamsky - observer geometry and event prediction for amateur radio"};
    argv = app.ensure_utf8(argv);

    app.set_config("--config", configFile, "Read configuration from this file (default: " + configFile + ").");

    app.add_option_function<double>("--lat",
        [&config](const double l) { config.setLatitude(l); },
        "The latitude of the observer (in decimal degrees)");
    app.add_option_function<double>("--lon",
        [&config](const double l) { config.setLongitude(l); },
        "The longitude of the observer (in decimal degrees, east positive)");
    app.add_option_function<double>("--alt",
        [&config](const double a) { config.setAltitude(a); },
        "Altitude above sea level in meters");
    app.add_option_function<std::string>("--time",
        [&config](const std::string &timeStr) {
            try {
                config.setTime(hamsky::parseTime(timeStr));
            } catch (const std::invalid_argument &err) {
                throw CLI::ValidationError("--time", err.what());
            }
        }, "Time of the calculation (format: YYYY-MM-DD HH:MM:SS UTC, default now)");
    app.add_option_function<std::string>("--tle",
        [&config](const std::string &path) { config.setElementFile(expandTilde(path)); },
        "Element set file (default: ~/.hamsky.tle)");
    app.add_option_function<int>("--threads",
        [&config](const int t) { config.setWorkerThreads(t); },
        "Number of worker threads (default 2, max 64)");
    app.add_option_function<int>("--stale-hours",
        [&config](const int h) { config.setStalenessHorizon(h); },
        "Element sets older than this many hours are reported as stale (default 24)");
    app.add_flag_function("-v,--verbose",
        [&config](const int64_t v) {
            config.setVerbose(v > 0);
            if (v > 0) {
                spdlog::set_level(spdlog::level::debug);
            }
        },
        "Display debugging information");
    app.add_flag_function("--json",
        [&config](const int64_t j) { config.setJSON(j > 0); },
        "Write results as JSON");

    app.ignore_case();
    app.fallthrough();

    // grid command - Maidenhead locators
    auto gridCommand = app.add_subcommand("grid", "Maidenhead grid square tools");

    int gridPrecision = 6;
    std::vector<std::string> gridLocators;

    auto gridEncodeCommand = gridCommand->add_subcommand("encode", "Encode the observer location as a grid square");
    gridEncodeCommand->add_option("--precision", gridPrecision, "Number of characters: 2, 4, 6 or 8 (default 6)");

    auto gridDecodeCommand = gridCommand->add_subcommand("decode", "Decode grid squares to the center of each cell");
    gridDecodeCommand->add_option("locator", gridLocators, "Grid square(s) (ie. FN30as)");

    auto gridValidateCommand = gridCommand->add_subcommand("validate", "Check whether grid squares are well formed");
    gridValidateCommand->add_option("locator", gridLocators, "Grid square(s) (ie. FN30as)");

    auto gridDistanceCommand = gridCommand->add_subcommand("distance", "Distance and bearing between two grid squares");
    gridDistanceCommand->add_option("locator", gridLocators, "From and to grid squares")->expected(2);

    // distance command - great circle from the observer
    auto distanceCommand = app.add_subcommand("distance", "Distance and bearing from the observer to a location");

    std::optional<double> toLatitude;
    std::optional<double> toLongitude;
    std::string toGrid;
    distanceCommand->add_option("--to-lat", toLatitude, "Latitude of the destination");
    distanceCommand->add_option("--to-lon", toLongitude, "Longitude of the destination");
    distanceCommand->add_option("--to-grid", toGrid, "Grid square of the destination");

    // look command - current look angles for antenna pointing
    auto lookCommand = app.add_subcommand("look", "Get look angles (azimuth/elevation/range) for antenna pointing");

    std::vector<std::string> lookIDs;
    lookCommand->add_option("body", lookIDs, "Body identifier(s): sun, moon, a Norad ID or a satellite name");
    lookCommand->add_option_function<double>("--elev",
        [&config](const double elev) { config.setMinimumElevation(elev); },
        "Minimum elevation above the horizon in degrees for visibility (default 0)");

    // passes command - event prediction
    auto passesCommand = app.add_subcommand("passes", "Predict passes (rise, culmination and set)");

    std::vector<std::string> passesIDs;
    std::optional<int> passesStep;
    passesCommand->add_option("body", passesIDs, "Body identifier(s): sun, moon, a Norad ID or a satellite name");
    passesCommand->add_option_function<int>("--hours",
        [&config](const int hours) { config.setHours(hours); },
        "Number of hours to search for passes (default 24, max 240)");
    passesCommand->add_option_function<double>("--elev",
        [&config](const double elev) { config.setMinimumElevation(elev); },
        "Passes start and end when the body crosses this elevation, in degrees (default 0)");
    passesCommand->add_option("--step", passesStep, "Coarse search step in seconds (default 60 for satellites, 300 otherwise)");

    auto sunCommand = app.add_subcommand("sun", "Sun position, sunrise, sunset and twilight");

    auto moonCommand = app.add_subcommand("moon", "Moon position, moonrise, moonset and phase");

    // terminator command - day/night boundary
    auto terminatorCommand = app.add_subcommand("terminator", "Trace the day/night boundary");

    int terminatorPoints = 360;
    terminatorCommand->add_option("--points", terminatorPoints, "Number of points along the boundary (default 360)");

    // track command - ground track
    auto trackCommand = app.add_subcommand("track", "Ground track of a body");

    std::string trackID;
    int trackMinutes = 90;
    int trackPoints = 10;
    trackCommand->add_option("body", trackID, "Body identifier: sun, moon, a Norad ID or a satellite name")->required();
    trackCommand->add_option("--minutes", trackMinutes, "Length of the track in minutes (default 90)");
    trackCommand->add_option("--points", trackPoints, "Number of points along the track (default 10)");

    // elements command - local element set database
    auto elementsCommand = app.add_subcommand("elements", "View element sets from the local database");

    std::vector<std::string> elementIDs;
    bool elementsRaw = false;
    elementsCommand->add_option("body", elementIDs, "Norad ID(s) or name(s) of satellite(s) (default: all)");
    elementsCommand->add_flag("--raw", elementsRaw, "Print the raw TLE lines");

    // Command callbacks

    gridCommand->final_callback([gridCommand](void) {
        if (gridCommand->get_subcommands().empty()) {
            std::cerr << gridCommand->help() << std::endl;
            std::exit(1);
        }
    });

    gridEncodeCommand->final_callback([&config, &gridPrecision](void) {
        try {
            auto grid = hamsky::encodeGrid(config.getObserver(), gridPrecision);
            if (config.getJSON()) {
                printJSON([&](hamsky::cli::JsonWriter &writer) {
                    writer.StartObject();
                    writer.Key("grid");
                    writer.String(grid.c_str());
                    writer.Key("position");
                    hamsky::cli::writePosition(writer, config.getObserver());
                    writer.EndObject();
                });
            } else {
                std::cout << grid << std::endl;
            }
        } catch (const std::exception &err) {
            fail(err);
        }
    });

    gridDecodeCommand->final_callback([gridDecodeCommand, &config, &gridLocators](void) {
        if (gridLocators.empty()) {
            std::cerr << "Please provide at least one grid square." << std::endl;
            std::cerr << gridDecodeCommand->help() << std::endl;
            std::exit(1);
        }
        try {
            std::vector<std::pair<std::string, hamsky::GeodeticPosition>> decoded;
            for (const auto &locator : gridLocators) {
                decoded.emplace_back(locator, hamsky::decodeGrid(locator));
            }
            if (config.getJSON()) {
                printJSON([&](hamsky::cli::JsonWriter &writer) {
                    writer.StartArray();
                    for (const auto &[locator, position] : decoded) {
                        writer.StartObject();
                        writer.Key("grid");
                        writer.String(locator.c_str());
                        writer.Key("lat");
                        writer.Double(position.latInDegrees);
                        writer.Key("lon");
                        writer.Double(position.lonInDegrees);
                        writer.EndObject();
                    }
                    writer.EndArray();
                });
            } else {
                for (const auto &[locator, position] : decoded) {
                    std::cout << fmt::format("{:<8} {:>9.4f} {:>10.4f}", locator,
                        position.latInDegrees, position.lonInDegrees) << std::endl;
                }
            }
        } catch (const std::exception &err) {
            fail(err);
        }
    });

    gridValidateCommand->final_callback([&config, &gridLocators](void) {
        bool allValid = true;
        if (config.getJSON()) {
            printJSON([&](hamsky::cli::JsonWriter &writer) {
                writer.StartObject();
                for (const auto &locator : gridLocators) {
                    writer.Key(locator.c_str());
                    writer.Bool(hamsky::isValidGrid(locator));
                }
                writer.EndObject();
            });
        }
        for (const auto &locator : gridLocators) {
            bool valid = hamsky::isValidGrid(locator);
            allValid = allValid && valid;
            if (!config.getJSON()) {
                std::cout << fmt::format("{:<8} {}", locator, valid ? "VALID" : "INVALID") << std::endl;
            }
        }
        if (!allValid) {
            std::exit(1);
        }
    });

    gridDistanceCommand->final_callback([&config, &gridLocators](void) {
        try {
            auto gc = hamsky::gridDistance(gridLocators.at(0), gridLocators.at(1));
            if (config.getJSON()) {
                printJSON([&](hamsky::cli::JsonWriter &writer) {
                    hamsky::cli::writeGreatCircle(writer, gc);
                });
            } else {
                std::cout << fmt::format("{} -> {}: {:.1f} km, bearing {:.1f} deg ({})",
                    gridLocators[0], gridLocators[1], gc.distanceInKilometers,
                    gc.bearingInDegrees, azimuthToCompass(gc.bearingInDegrees)) << std::endl;
            }
        } catch (const std::exception &err) {
            fail(err);
        }
    });

    distanceCommand->final_callback([distanceCommand, &config, &toLatitude, &toLongitude, &toGrid](void) {
        try {
            hamsky::GeodeticPosition destination;
            if (!toGrid.empty()) {
                destination = hamsky::decodeGrid(toGrid);
            } else if (toLatitude && toLongitude) {
                destination = {*toLatitude, *toLongitude, 0.0};
            } else {
                std::cerr << "Please provide a destination grid square or latitude and longitude." << std::endl;
                std::cerr << distanceCommand->help() << std::endl;
                std::exit(1);
            }

            auto observer = config.getObserver();
            auto gc = hamsky::greatCircle(observer, destination);
            if (config.getJSON()) {
                printJSON([&](hamsky::cli::JsonWriter &writer) {
                    hamsky::cli::writeGreatCircle(writer, gc);
                });
            } else {
                std::cout << fmt::format("Distance: {:.1f} km", gc.distanceInKilometers) << std::endl;
                std::cout << fmt::format("Bearing:  {:.1f} deg ({})", gc.bearingInDegrees,
                    azimuthToCompass(gc.bearingInDegrees)) << std::endl;
            }
        } catch (const std::exception &err) {
            fail(err);
        }
    });

    lookCommand->final_callback([lookCommand, &config, &lookIDs](void) {
        if (lookIDs.empty()) {
            std::cerr << "Please provide at least one body." << std::endl;
            std::cerr << lookCommand->help() << std::endl;
            std::exit(1);
        }
        try {
            Services services(config);
            auto observer = config.getObserver();

            std::vector<std::future<hamsky::Annotated<hamsky::TopocentricFix>>> futures;
            for (const auto &id : lookIDs) {
                futures.push_back(services.engine().observe(id, observer, config.getTime()));
            }

            std::vector<hamsky::Annotated<hamsky::TopocentricFix>> fixes;
            for (auto &future : futures) {
                fixes.push_back(future.get());
            }

            if (config.getJSON()) {
                printJSON([&](hamsky::cli::JsonWriter &writer) {
                    writer.StartArray();
                    for (std::size_t i = 0; i < fixes.size(); ++i) {
                        writer.StartObject();
                        writer.Key("body");
                        writer.String(lookIDs[i].c_str());
                        writer.Key("fix");
                        hamsky::cli::writeFix(writer, fixes[i].value);
                        writer.Key("visible");
                        writer.Bool(hamsky::isVisible(fixes[i].value, config.getMinimumElevation()));
                        hamsky::cli::writeStaleness(writer, fixes[i].staleness);
                        writer.EndObject();
                    }
                    writer.EndArray();
                });
                return;
            }

            for (std::size_t i = 0; i < fixes.size(); ++i) {
                const auto &fix = fixes[i].value;
                std::string name = lookIDs[i];
                if (auto set = services.source().elementSetFor(lookIDs[i])) {
                    name = set->getName();
                }
                std::cout << "Body: " << name << std::endl;
                std::cout << "  Azimuth:   " << fmt::format("{:6.2f}", fix.azimuthInDegrees) << " deg (" << azimuthToCompass(fix.azimuthInDegrees) << ")" << std::endl;
                std::cout << "  Elevation: " << fmt::format("{:6.2f}", fix.elevationInDegrees) << " deg" << std::endl;
                std::cout << "  Range:     " << fmt::format("{:6.1f}", fix.rangeInKilometers) << " km" << std::endl;
                std::cout << "  Visible:   " << (hamsky::isVisible(fix, config.getMinimumElevation()) ? "YES" : "NO") << " (min elevation: " << config.getMinimumElevation() << " deg)" << std::endl;
                printStaleness(fixes[i].staleness);
                std::cout << std::endl;
            }
        } catch (const std::exception &err) {
            fail(err);
        }
    });

    passesCommand->final_callback([passesCommand, &config, &passesIDs, &passesStep](void) {
        if (passesIDs.empty()) {
            std::cerr << "Please provide at least one body." << std::endl;
            std::cerr << passesCommand->help() << std::endl;
            std::exit(1);
        }
        try {
            Services services(config);
            auto observer = config.getObserver();
            hamsky::TimeWindow window{config.getTime(), config.getTime() + std::chrono::hours(config.getHours())};

            std::vector<std::future<hamsky::Annotated<std::vector<hamsky::Pass>>>> futures;
            for (const auto &id : passesIDs) {
                auto options = hamsky::defaultSearchOptions(services.source().bodyKind(id), config.getMinimumElevation());
                if (passesStep) {
                    options.step = std::chrono::seconds(*passesStep);
                }
                futures.push_back(services.engine().findPasses(id, observer, window, options));
            }

            std::vector<hamsky::Pass> passes;
            std::vector<std::optional<hamsky::StalenessWarning>> warnings;
            for (std::size_t i = 0; i < futures.size(); ++i) {
                auto result = futures[i].get();
                if (result.value.empty() && !config.getJSON()) {
                    std::cerr << "No passes found for " << passesIDs[i] << std::endl;
                }
                if (result.staleness) {
                    warnings.push_back(result.staleness);
                }
                passes.insert(passes.end(), result.value.begin(), result.value.end());
            }

            std::sort(passes.begin(), passes.end(), [](const hamsky::Pass &a, const hamsky::Pass &b) {
                return a.start < b.start;
            });

            if (config.getJSON()) {
                printJSON([&](hamsky::cli::JsonWriter &writer) {
                    writer.StartObject();
                    writer.Key("passes");
                    writer.StartArray();
                    for (const auto &pass : passes) {
                        hamsky::cli::writePass(writer, pass);
                    }
                    writer.EndArray();
                    writer.Key("warnings");
                    writer.StartArray();
                    for (const auto &warning : warnings) {
                        writer.StartObject();
                        writer.Key("body");
                        writer.String(warning->bodyId.c_str());
                        hamsky::cli::writeStaleness(writer, warning);
                        writer.EndObject();
                    }
                    writer.EndArray();
                    writer.EndObject();
                });
                return;
            }

            std::cout << "Passes from " << hamsky::formatTime(window.start)
                      << " to " << hamsky::formatTime(window.end) << ":" << std::endl;
            printPasses(passes, services.source());
            for (const auto &warning : warnings) {
                std::cout << fmt::format("Warning: element set for {} is {} hours old", warning->bodyId,
                    std::chrono::duration_cast<std::chrono::hours>(warning->age).count()) << std::endl;
            }
        } catch (const std::exception &err) {
            fail(err);
        }
    });

    sunCommand->final_callback([&config](void) {
        try {
            Services services(config);
            auto &engine = services.engine();
            auto observer = config.getObserver();

            auto fixFuture = engine.observe("sun", observer, config.getTime());
            auto riseSetFuture = engine.riseSet("sun", observer, config.getTime());
            auto twilightFuture = engine.twilight(observer, config.getTime());

            auto fix = fixFuture.get().value;
            auto times = riseSetFuture.get().value;
            auto twilight = twilightFuture.get();
            auto subSolar = hamsky::subSolarPoint(*services.source().resolve("sun"), config.getTime());

            if (config.getJSON()) {
                printJSON([&](hamsky::cli::JsonWriter &writer) {
                    writer.StartObject();
                    writer.Key("fix");
                    hamsky::cli::writeFix(writer, fix);
                    writer.Key("subSolarPoint");
                    hamsky::cli::writePosition(writer, subSolar);
                    writer.Key("sun");
                    hamsky::cli::writeRiseSet(writer, times);
                    writer.Key("civil");
                    hamsky::cli::writeRiseSet(writer, twilight.civil);
                    writer.Key("nautical");
                    hamsky::cli::writeRiseSet(writer, twilight.nautical);
                    writer.Key("astronomical");
                    hamsky::cli::writeRiseSet(writer, twilight.astronomical);
                    writer.EndObject();
                });
                return;
            }

            std::cout << "Sun at " << hamsky::formatTime(config.getTime()) << std::endl;
            std::cout << "  Azimuth:    " << fmt::format("{:6.2f}", fix.azimuthInDegrees) << " deg (" << azimuthToCompass(fix.azimuthInDegrees) << ")" << std::endl;
            std::cout << "  Elevation:  " << fmt::format("{:6.2f}", fix.elevationInDegrees) << " deg" << std::endl;
            std::cout << "  Sub-solar:  " << fmt::format("{:.2f}, {:.2f}", subSolar.latInDegrees, subSolar.lonInDegrees) << std::endl;
            std::cout << "  Sunrise:    " << formatOptionalTime(times.rise) << std::endl;
            std::cout << "  Sunset:     " << formatOptionalTime(times.set) << std::endl;
            std::cout << "  Noon:       " << hamsky::formatTime(times.transit) << fmt::format(" ({:.2f} deg)", times.transitElevationInDegrees) << std::endl;
            if (auto length = times.dayLength()) {
                std::cout << "  Day length: " << formatDuration(*length) << std::endl;
            }
            if (times.alwaysUp) {
                std::cout << "  The Sun does not set on this day" << std::endl;
            } else if (times.alwaysDown) {
                std::cout << "  The Sun does not rise on this day" << std::endl;
            }
            std::cout << "  Civil dawn/dusk:        " << formatOptionalTime(twilight.civil.rise) << " / " << formatOptionalTime(twilight.civil.set) << std::endl;
            std::cout << "  Nautical dawn/dusk:     " << formatOptionalTime(twilight.nautical.rise) << " / " << formatOptionalTime(twilight.nautical.set) << std::endl;
            std::cout << "  Astronomical dawn/dusk: " << formatOptionalTime(twilight.astronomical.rise) << " / " << formatOptionalTime(twilight.astronomical.set) << std::endl;
        } catch (const std::exception &err) {
            fail(err);
        }
    });

    moonCommand->final_callback([&config](void) {
        try {
            Services services(config);
            auto &engine = services.engine();
            auto observer = config.getObserver();

            auto fixFuture = engine.observe("moon", observer, config.getTime());
            auto riseSetFuture = engine.riseSet("moon", observer, config.getTime());

            auto fix = fixFuture.get().value;
            auto times = riseSetFuture.get().value;
            auto phase = hamsky::moonPhase(config.getTime());
            auto equatorial = hamsky::equatorialCoordinates(services.source().positionAt("moon", config.getTime()).position);

            if (config.getJSON()) {
                printJSON([&](hamsky::cli::JsonWriter &writer) {
                    writer.StartObject();
                    writer.Key("fix");
                    hamsky::cli::writeFix(writer, fix);
                    writer.Key("rightAscension");
                    writer.Double(equatorial.rightAscensionInHours);
                    writer.Key("declination");
                    writer.Double(equatorial.declinationInDegrees);
                    writer.Key("moon");
                    hamsky::cli::writeRiseSet(writer, times);
                    writer.Key("phase");
                    hamsky::cli::writeMoonPhase(writer, phase);
                    writer.EndObject();
                });
                return;
            }

            std::cout << "Moon at " << hamsky::formatTime(config.getTime()) << std::endl;
            std::cout << "  Azimuth:      " << fmt::format("{:6.2f}", fix.azimuthInDegrees) << " deg (" << azimuthToCompass(fix.azimuthInDegrees) << ")" << std::endl;
            std::cout << "  Elevation:    " << fmt::format("{:6.2f}", fix.elevationInDegrees) << " deg" << std::endl;
            std::cout << "  Range:        " << fmt::format("{:.0f}", fix.rangeInKilometers) << " km" << std::endl;
            std::cout << "  RA / Dec:     " << fmt::format("{:.3f} h / {:.2f} deg", equatorial.rightAscensionInHours, equatorial.declinationInDegrees) << std::endl;
            std::cout << "  Moonrise:     " << formatOptionalTime(times.rise) << std::endl;
            std::cout << "  Moonset:      " << formatOptionalTime(times.set) << std::endl;
            std::cout << "  Phase:        " << phase.name << fmt::format(" ({:.0f}% illuminated)", phase.illuminationPercent) << std::endl;
        } catch (const std::exception &err) {
            fail(err);
        }
    });

    terminatorCommand->final_callback([&config, &terminatorPoints](void) {
        try {
            Services services(config);
            auto polyline = services.engine().traceTerminator(config.getTime(), terminatorPoints).get();

            if (config.getJSON()) {
                printJSON([&](hamsky::cli::JsonWriter &writer) {
                    hamsky::cli::writeTerminator(writer, polyline);
                });
                return;
            }

            std::cout << "Terminator at " << hamsky::formatTime(polyline.time) << std::endl;
            for (const auto &point : polyline.points) {
                std::cout << fmt::format("{:>9.4f} {:>10.4f}{}", point.latInDegrees, point.lonInDegrees,
                    point.bracketed ? "" : " *") << std::endl;
            }
        } catch (const std::exception &err) {
            fail(err);
        }
    });

    trackCommand->final_callback([&config, &trackID, &trackMinutes, &trackPoints](void) {
        try {
            Services services(config);
            auto result = services.engine().groundTrack(trackID, config.getTime(),
                std::chrono::minutes(trackMinutes), trackPoints).get();

            if (config.getJSON()) {
                printJSON([&](hamsky::cli::JsonWriter &writer) {
                    writer.StartObject();
                    writer.Key("body");
                    writer.String(trackID.c_str());
                    writer.Key("track");
                    hamsky::cli::writeTrack(writer, result.value);
                    hamsky::cli::writeStaleness(writer, result.staleness);
                    writer.EndObject();
                });
                return;
            }

            constexpr std::string_view rowFormat = "{:<25} {:>9.4f} {:>10.4f} {:>10.1f}";
            std::cout << fmt::format("{:<25} {:>9} {:>10} {:>10}", "Time", "Latitude", "Longitude", "Alt (km)") << std::endl;
            std::cout << std::string(57, '-') << std::endl;
            for (const auto &point : result.value) {
                std::cout << fmt::format(rowFormat, hamsky::formatTime(point.time),
                    point.position.latInDegrees, point.position.lonInDegrees,
                    point.position.altInMeters / 1000.0) << std::endl;
            }
            printStaleness(result.staleness);
        } catch (const std::exception &err) {
            fail(err);
        }
    });

    elementsCommand->final_callback([&config, &elementIDs, &elementsRaw](void) {
        try {
            Services services(config);
            auto &catalog = services.catalog();

            std::vector<hamsky::ElementSetCatalog::Entry> sets;
            if (elementIDs.empty()) {
                auto snapshot = catalog.snapshot();
                for (const auto &[id, set] : *snapshot) {
                    sets.push_back(set);
                }
            } else {
                for (const auto &id : elementIDs) {
                    auto set = catalog.find(id);
                    if (!set) {
                        std::cerr << "Satellite " << id << " not found in the local element set database." << std::endl;
                        continue;
                    }
                    sets.push_back(set);
                }
            }

            if (config.getJSON()) {
                printJSON([&](hamsky::cli::JsonWriter &writer) {
                    writer.StartArray();
                    for (const auto &set : sets) {
                        hamsky::cli::writeElementSet(writer, *set);
                    }
                    writer.EndArray();
                });
                return;
            }

            auto now = std::chrono::system_clock::now();
            for (const auto &set : sets) {
                if (elementsRaw) {
                    std::cout << set->getTLE() << std::endl;
                    continue;
                }
                set->printInfo(std::cout);
                if (set->isStale(now, config.getStalenessHorizon())) {
                    std::cout << fmt::format("Warning: element set is {} hours old",
                        std::chrono::duration_cast<std::chrono::hours>(set->age(now)).count()) << std::endl;
                }
                std::cout << std::endl;
            }
        } catch (const std::exception &err) {
            fail(err);
        }
    });

    CLI11_PARSE(app, argc, argv);

    if (app.get_subcommands().empty()) {
        std::cerr << app.help() << std::endl;
        std::exit(1);
    }

    return 0;
}
