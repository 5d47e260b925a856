#include "trackcover/boundary.hpp"

#include <boost/json.hpp>
#include <spdlog/spdlog.h>

#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>

namespace trackcover {

    using json = boost::json::value;

    namespace {

        std::unordered_map<std::string, std::string> parseProperties(const json &props) {
            std::unordered_map<std::string, std::string> m;
            if (!props.is_object())
                return m;
            auto const &obj = props.as_object();
            m.reserve(obj.size());
            for (auto const &item : obj) {
                if (item.value().is_string())
                    m[std::string(item.key())] = std::string(item.value().as_string());
                else
                    m[std::string(item.key())] = boost::json::serialize(item.value());
            }
            return m;
        }

        Point parsePosition(const json &coords) {
            auto const &arr = coords.as_array();
            if (arr.size() < 2)
                throw std::runtime_error("Invalid point coordinates");
            return Point(boost::json::value_to<double>(arr.at(0)), boost::json::value_to<double>(arr.at(1)));
        }

        Polygon parsePolygon(const json &coords) {
            Polygon poly;
            auto const &rings = coords.as_array();
            for (std::size_t i = 0; i < rings.size(); ++i) {
                Polygon::ring_type ring;
                for (auto const &c : rings[i].as_array())
                    ring.push_back(parsePosition(c));
                if (i == 0)
                    poly.outer() = std::move(ring);
                else
                    poly.inners().push_back(std::move(ring));
            }
            bg::correct(poly);
            return poly;
        }

        // Only areal geometries matter for boundaries; points and lines are dropped.
        void parseGeometry(const json &geom, MultiPolygon &out) {
            auto const &obj = geom.as_object();
            auto type = std::string(obj.at("type").as_string());

            if (type == "Polygon") {
                out.push_back(parsePolygon(obj.at("coordinates")));
            } else if (type == "MultiPolygon") {
                for (auto const &poly : obj.at("coordinates").as_array())
                    out.push_back(parsePolygon(poly));
            } else if (type == "GeometryCollection") {
                for (auto const &sub : obj.at("geometries").as_array())
                    parseGeometry(sub, out);
            }
        }

        void checkCrs(const boost::json::object &fc) {
            if (!fc.contains("crs") || !fc.at("crs").is_object())
                return;
            auto const &crs = fc.at("crs").as_object();
            if (!crs.contains("properties") || !crs.at("properties").is_object())
                return;
            auto const &P = crs.at("properties").as_object();
            if (!P.contains("name") || !P.at("name").is_string())
                return;
            std::string name(P.at("name").as_string());
            if (name.find("CRS84") != std::string::npos || name.find("4326") != std::string::npos)
                return;
            throw std::runtime_error("boundary dataset must be in WGS84 longitude/latitude, found " + name);
        }


        json readDocument(const std::filesystem::path &file) {
            std::ifstream ifs(file);
            if (!ifs)
                throw std::runtime_error("trackcover::BoundaryDataset::load(): cannot open \"" + file.string() + '"');
            std::stringstream buffer;
            buffer << ifs.rdbuf();

            boost::json::error_code ec;
            json root = boost::json::parse(buffer.str(), ec);
            if (ec)
                throw std::runtime_error("trackcover::BoundaryDataset::load(): failed to parse JSON: " + ec.message());
            if (!root.is_object() || !root.as_object().contains("type") || !root.as_object().at("type").is_string())
                throw std::runtime_error("trackcover::BoundaryDataset::load(): top-level object has no string 'type'");
            return root;
        }

    } // namespace

    BoundaryDataset::BoundaryDataset(std::vector<BoundaryFeature> features) : features_(std::move(features)) {
        for (std::size_t i = 0; i < features_.size(); ++i)
            byName_[features_[i].name].push_back(i);
    }

    std::shared_ptr<const BoundaryDataset> BoundaryDataset::load(const std::filesystem::path &file,
                                                                 const std::string &nameAttribute) {
        json root = readDocument(file);
        auto const &top = root.as_object();
        std::string type(top.at("type").as_string());

        std::vector<BoundaryFeature> features;
        std::size_t unnamed = 0;
        auto addFeature = [&](const boost::json::object &feature) {
            if (!feature.contains("geometry") || feature.at("geometry").is_null())
                return;

            BoundaryFeature bf;
            if (feature.contains("properties"))
                bf.properties = parseProperties(feature.at("properties"));
            for (const auto &key : {nameAttribute, std::string("NAME"), std::string("name")}) {
                auto it = bf.properties.find(key);
                if (it != bf.properties.end()) {
                    bf.name = it->second;
                    break;
                }
            }
            if (bf.name.empty())
                ++unnamed;

            parseGeometry(feature.at("geometry"), bf.geometry);
            if (!bf.geometry.empty())
                features.push_back(std::move(bf));
        };

        if (type == "FeatureCollection") {
            checkCrs(top);
            if (!top.contains("features") || !top.at("features").is_array())
                throw std::runtime_error("missing top-level 'features'");
            for (auto const &feature : top.at("features").as_array()) {
                if (!feature.is_object())
                    throw std::runtime_error("feature is not an object");
                addFeature(feature.as_object());
            }
        } else if (type == "Feature") {
            addFeature(top);
        } else {
            // A bare geometry becomes one unnamed feature.
            boost::json::object feature;
            feature["geometry"] = root;
            addFeature(feature);
        }

        if (unnamed > 0)
            spdlog::warn("{}: {} feature(s) without a '{}' attribute", file.filename().string(), unnamed,
                         nameAttribute);
        spdlog::info("Loaded {} boundary feature(s) from {}", features.size(), file.string());
        return std::make_shared<const BoundaryDataset>(std::move(features));
    }

    bool BoundaryDataset::contains(const std::string &name) const { return byName_.count(name) > 0; }

    std::optional<MultiPolygon> BoundaryDataset::geometryOf(const std::string &name) const {
        auto it = byName_.find(name);
        if (it == byName_.end())
            return std::nullopt;
        MultiPolygon out;
        for (auto idx : it->second) {
            const auto &g = features_[idx].geometry;
            out.insert(out.end(), g.begin(), g.end());
        }
        return out;
    }

    MultiPolygon BoundaryDataset::all() const {
        MultiPolygon out;
        for (const auto &f : features_)
            out.insert(out.end(), f.geometry.begin(), f.geometry.end());
        return out;
    }

    std::ostream &operator<<(std::ostream &os, const BoundaryDataset &dataset) {
        os << "FEATURES: " << dataset.size() << "\n";
        for (const auto &f : dataset.features()) {
            os << "  " << (f.name.empty() ? "<unnamed>" : f.name) << ": " << f.geometry.size() << " polygon(s)\n";
        }
        return os;
    }

} // namespace trackcover
