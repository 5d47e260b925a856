#include "trackcover/config.hpp"
#include "trackcover/errors.hpp"

#include <boost/json.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>
#include <fstream>
#include <sstream>

namespace trackcover {

    using json = boost::json::value;

    namespace {

        double number(const json &v, const std::string &key) {
            if (!v.is_number())
                throw ConfigError("'" + key + "' must be a number");
            return boost::json::value_to<double>(v);
        }

        std::size_t count(const json &v, const std::string &key) {
            double d = number(v, key);
            if (d < 1.0 || std::floor(d) != d)
                throw ConfigError("'" + key + "' must be a positive integer");
            return static_cast<std::size_t>(d);
        }

        std::string text(const json &v, const std::string &key) {
            if (!v.is_string())
                throw ConfigError("'" + key + "' must be a string");
            return std::string(v.as_string());
        }

        const boost::json::object &object(const json &v, const std::string &key) {
            if (!v.is_object())
                throw ConfigError("'" + key + "' must be an object");
            return v.as_object();
        }

        Crs crsFrom(const json &v, const std::string &key) {
            try {
                return parseCRS(text(v, key));
            } catch (const ProjectionFailure &e) {
                throw ConfigError("'" + key + "': " + e.what());
            }
        }

        RegionSpec *findSpec(std::vector<RegionSpec> &catalogue, const std::string &name) {
            auto it = std::find_if(catalogue.begin(), catalogue.end(),
                                   [&](const RegionSpec &s) { return s.name == name; });
            return it == catalogue.end() ? nullptr : &*it;
        }

        // Shared by overrides and custom regions: buffer, simplify, crs.
        void applyTuning(RegionSpec &spec, const boost::json::object &obj, const std::string &path) {
            if (auto *v = obj.if_contains("buffer"))
                spec.bufferRadius = number(*v, path + ".buffer");
            if (auto *v = obj.if_contains("simplify"))
                spec.simplifyTolerance = number(*v, path + ".simplify");
            if (auto *v = obj.if_contains("crs"))
                spec.crs = crsFrom(*v, path + ".crs");
        }

        RegionSpec customRegion(const std::string &name, const boost::json::object &obj) {
            const std::string path = "custom_regions." + name;
            RegionSpec spec;
            spec.name = name;

            int kinds = 0;
            if (auto *v = obj.if_contains("bbox")) {
                if (!v->is_array() || v->as_array().size() != 4)
                    throw ConfigError("'" + path + ".bbox' must be [minLon, minLat, maxLon, maxLat]");
                auto const &a = v->as_array();
                spec.kind = BoundingBox{number(a[0], path + ".bbox"), number(a[1], path + ".bbox"),
                                        number(a[2], path + ".bbox"), number(a[3], path + ".bbox")};
                spec.crs = Crs::epsg(3857);
                ++kinds;
            }
            if (auto *v = obj.if_contains("admin")) {
                spec.kind = AdministrativeBoundary{text(*v, path + ".admin")};
                ++kinds;
            }
            if (auto *v = obj.if_contains("world")) {
                spec.kind = WorldSimplified{number(*v, path + ".world")};
                spec.crs = Crs::epsg(8857);
                ++kinds;
            }
            if (kinds != 1)
                throw ConfigError("'" + path + "' needs exactly one of 'bbox', 'admin' or 'world'");

            if (!obj.contains("crs") && std::holds_alternative<AdministrativeBoundary>(spec.kind))
                throw ConfigError("'" + path + ".crs' is required for administrative regions");
            applyTuning(spec, obj, path);
            return spec;
        }

    } // namespace

    RunConfig parseConfig(const std::string &jsonText, RunConfig base) {
        boost::json::error_code ec;
        json root = boost::json::parse(jsonText, ec);
        if (ec)
            throw ConfigError("configuration is not valid JSON: " + ec.message());
        auto const &obj = object(root, "<root>");

        for (auto const &item : obj) {
            std::string key(item.key());
            const json &v = item.value();

            if (key == "activities") {
                base.activities = text(v, key);
            } else if (key == "boundaries") {
                base.boundaries = text(v, key);
            } else if (key == "name_attribute") {
                base.nameAttribute = text(v, key);
            } else if (key == "regions") {
                if (!v.is_array())
                    throw ConfigError("'regions' must be an array of names");
                base.regions.clear();
                for (auto const &r : v.as_array())
                    base.regions.push_back(text(r, "regions[]"));
            } else if (key == "sample_stride") {
                base.sampleStride = count(v, key);
            } else if (key == "jobs") {
                base.jobs = count(v, key);
            } else if (key == "circle_segments") {
                base.circleSegments = count(v, key);
            } else if (key == "diagnostics") {
                if (!v.is_bool())
                    throw ConfigError("'diagnostics' must be true or false");
                base.diagnostics = v.as_bool();
            } else if (key == "output_dir") {
                base.outputDir = std::filesystem::path(text(v, key));
            } else if (key == "log_level") {
                base.logLevel = text(v, key);
            } else if (key == "custom_regions") {
                for (auto const &r : object(v, key)) {
                    std::string name(r.key());
                    auto spec = customRegion(name, object(r.value(), key + "." + name));
                    if (auto *existing = findSpec(base.catalogue, name))
                        *existing = std::move(spec);
                    else
                        base.catalogue.push_back(std::move(spec));
                }
            } else if (key == "region_overrides") {
                for (auto const &r : object(v, key)) {
                    std::string name(r.key());
                    auto *spec = findSpec(base.catalogue, name);
                    if (!spec)
                        throw ConfigError("'region_overrides." + name + "': no such region in the catalogue");
                    applyTuning(*spec, object(r.value(), key + "." + name), "region_overrides." + name);
                }
            } else {
                spdlog::warn("Ignoring unknown configuration key '{}'", key);
            }
        }
        return base;
    }

    RunConfig loadConfig(const std::filesystem::path &file, RunConfig base) {
        std::ifstream ifs(file);
        if (!ifs)
            throw ConfigError("cannot open configuration \"" + file.string() + '"');
        std::stringstream buffer;
        buffer << ifs.rdbuf();
        return parseConfig(buffer.str(), std::move(base));
    }

    CommandLine parseCommandLine(int argc, const char *const argv[]) {
        CommandLine cl;
        std::vector<std::string> args(argv + 1, argv + argc);

        auto value = [&](std::size_t &i) -> const std::string & {
            if (i + 1 >= args.size())
                throw ConfigError("missing value for " + args[i]);
            return args[++i];
        };
        auto positive = [](const std::string &flag, const std::string &s) -> std::size_t {
            std::size_t pos = 0;
            long long n = 0;
            try {
                n = std::stoll(s, &pos);
            } catch (const std::logic_error &) {
                pos = 0;
            }
            if (pos != s.size() || n < 1)
                throw ConfigError(flag + " expects a positive integer, got \"" + s + '"');
            return static_cast<std::size_t>(n);
        };

        for (std::size_t i = 0; i < args.size(); ++i) {
            if (args[i] == "--config") {
                cl.config = loadConfig(value(i), std::move(cl.config));
            } else if (args[i] == "--help" || args[i] == "-h") {
                cl.help = true;
            }
        }

        bool regionsFromFlags = false;
        for (std::size_t i = 0; i < args.size(); ++i) {
            const auto &a = args[i];
            if (a == "--config") {
                ++i;
            } else if (a == "--help" || a == "-h") {
                continue;
            } else if (a == "--activities") {
                cl.config.activities = value(i);
            } else if (a == "--boundaries") {
                cl.config.boundaries = value(i);
            } else if (a == "--region") {
                if (!regionsFromFlags)
                    cl.config.regions.clear();
                regionsFromFlags = true;
                cl.config.regions.push_back(value(i));
            } else if (a == "--stride") {
                cl.config.sampleStride = positive(a, value(i));
            } else if (a == "--jobs") {
                cl.config.jobs = positive(a, value(i));
            } else if (a == "--diagnostics") {
                cl.config.diagnostics = true;
            } else if (a == "--output") {
                cl.config.outputDir = std::filesystem::path(value(i));
            } else if (a == "--log-level") {
                cl.config.logLevel = value(i);
            } else {
                throw ConfigError("unknown option " + a);
            }
        }
        return cl;
    }

    void validate(const RunConfig &config) {
        if (config.sampleStride < 1)
            throw ConfigError("sample stride must be at least 1");
        if (config.jobs < 1)
            throw ConfigError("jobs must be at least 1");
        if (config.circleSegments < 3)
            throw ConfigError("circle_segments must be at least 3");
        if (config.regions.empty())
            throw ConfigError("no regions requested");

        static const std::vector<std::string> levels{"trace", "debug", "info", "warn", "warning", "error", "critical", "off"};
        if (std::find(levels.begin(), levels.end(), config.logLevel) == levels.end())
            throw ConfigError("unknown log level \"" + config.logLevel + '"');

        for (const auto &spec : config.catalogue) {
            if (!(spec.bufferRadius > 0.0))
                throw ConfigError("region \"" + spec.name + "\": buffer must be positive");
            if (spec.simplifyTolerance < 0.0)
                throw ConfigError("region \"" + spec.name + "\": simplify must not be negative");
            if (spec.crs.isGeographic())
                throw ConfigError("region \"" + spec.name + "\": working CRS must be projected, not " +
                                  spec.crs.name());
        }
    }

    std::string usage(const std::string &program) {
        std::ostringstream oss;
        oss << "Usage: " << program << " [options]\n"
            << "Options:\n"
            << "  --config FILE       JSON configuration file\n"
            << "  --activities DIR    Directory of .gpx, .gpx.gz, .fit and .fit.gz tracks\n"
            << "  --boundaries FILE   Country boundaries as GeoJSON\n"
            << "  --region NAME       Region to process (repeatable)\n"
            << "  --stride N          Keep every Nth point of each track (default: 1)\n"
            << "  --jobs N            Worker tasks for files and regions (default: 1)\n"
            << "  --output DIR        Write <region>_coverage.geojson files here\n"
            << "  --diagnostics       Log how many point buffers touch each region boundary\n"
            << "  --log-level LEVEL   trace, debug, info, warn, error, critical or off\n"
            << "  --help              Show this help message\n";
        return oss.str();
    }

} // namespace trackcover
