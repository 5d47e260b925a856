#include "trackcover/track_reader.hpp"
#include "trackcover/errors.hpp"
#include "trackcover/fit.hpp"

#include <boost/iostreams/copy.hpp>
#include <boost/iostreams/filter/gzip.hpp>
#include <boost/iostreams/filtering_stream.hpp>
#include <libxml/parser.h>
#include <libxml/tree.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <future>
#include <memory>
#include <sstream>
#include <stdexcept>

namespace trackcover {

    namespace detail {

        struct XmlDocDeleter {
            void operator()(xmlDoc *doc) const {
                if (doc)
                    xmlFreeDoc(doc);
            }
        };
        using XmlDocPtr = std::unique_ptr<xmlDoc, XmlDocDeleter>;

        struct XmlCharDeleter {
            void operator()(xmlChar *s) const {
                if (s)
                    xmlFree(s);
            }
        };
        using XmlCharPtr = std::unique_ptr<xmlChar, XmlCharDeleter>;

        bool isElement(const xmlNode *node, const char *name) {
            return node->type == XML_ELEMENT_NODE && xmlStrcmp(node->name, BAD_CAST name) == 0;
        }

        std::optional<double> parseNumber(const xmlChar *text) {
            if (!text)
                return std::nullopt;
            const char *begin = reinterpret_cast<const char *>(text);
            char *end = nullptr;
            double v = std::strtod(begin, &end);
            if (end == begin)
                return std::nullopt;
            while (*end && std::isspace(static_cast<unsigned char>(*end)))
                ++end;
            if (*end || !std::isfinite(v))
                return std::nullopt;
            return v;
        }

        bool validPosition(double lat, double lon) {
            return std::isfinite(lat) && std::isfinite(lon) && std::abs(lat) <= 90.0 && std::abs(lon) <= 180.0;
        }

        std::optional<double> attributeNumber(xmlNode *node, const char *name) {
            XmlCharPtr value(xmlGetProp(node, BAD_CAST name));
            return parseNumber(value.get());
        }

        std::string childText(xmlNode *node, const char *name) {
            for (xmlNode *c = node->children; c; c = c->next) {
                if (isElement(c, name)) {
                    XmlCharPtr content(xmlNodeGetContent(c));
                    return content ? std::string(reinterpret_cast<const char *>(content.get())) : std::string();
                }
            }
            return {};
        }

        std::string lastXmlError() {
            const xmlError *err = xmlGetLastError();
            if (!err || !err->message)
                return "malformed XML";
            std::string msg = err->message;
            while (!msg.empty() && std::isspace(static_cast<unsigned char>(msg.back())))
                msg.pop_back();
            return msg + " (line " + std::to_string(err->line) + ")";
        }

        // Days since 1970-01-01 for a proleptic Gregorian date.
        std::int64_t daysFromCivil(std::int64_t y, unsigned m, unsigned d) {
            y -= m <= 2;
            const std::int64_t era = (y >= 0 ? y : y - 399) / 400;
            const unsigned yoe = static_cast<unsigned>(y - era * 400);
            const unsigned doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
            const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
            return era * 146097 + static_cast<std::int64_t>(doe) - 719468;
        }

        std::string readPlain(const std::filesystem::path &path) {
            std::ifstream ifs(path, std::ios::binary);
            if (!ifs)
                throw std::ios_base::failure("cannot open \"" + path.string() + '"');
            std::stringstream buffer;
            buffer << ifs.rdbuf();
            return buffer.str();
        }

        std::string readGzip(const std::filesystem::path &path) {
            std::ifstream ifs(path, std::ios::binary);
            if (!ifs)
                throw std::ios_base::failure("cannot open \"" + path.string() + '"');
            boost::iostreams::filtering_istream in;
            in.push(boost::iostreams::gzip_decompressor());
            in.push(ifs);
            std::ostringstream out;
            boost::iostreams::copy(in, out);
            return out.str();
        }

        void requireStride(std::size_t stride) {
            if (stride == 0)
                throw std::invalid_argument("sample stride must be at least 1");
        }

    } // namespace detail

    TrackFormat detectFormat(const std::filesystem::path &path) {
        std::string name = path.filename().string();
        std::transform(name.begin(), name.end(), name.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

        auto endsWith = [&](const std::string &suffix) {
            return name.size() > suffix.size() && name.compare(name.size() - suffix.size(), suffix.size(), suffix) == 0;
        };

        if (endsWith(".gpx.gz"))
            return TrackFormat::GpxGzip;
        if (endsWith(".fit.gz"))
            return TrackFormat::FitGzip;
        if (endsWith(".gpx"))
            return TrackFormat::Gpx;
        if (endsWith(".fit"))
            return TrackFormat::Fit;
        return TrackFormat::Unsupported;
    }

    const char *toString(TrackFormat format) {
        switch (format) {
        case TrackFormat::Gpx:
            return "gpx";
        case TrackFormat::GpxGzip:
            return "gpx.gz";
        case TrackFormat::Fit:
            return "fit";
        case TrackFormat::FitGzip:
            return "fit.gz";
        case TrackFormat::Unsupported:
            return "unsupported";
        }
        return "unsupported";
    }

    std::optional<Timestamp> parseIso8601(const std::string &text) {
        int year = 0, month = 0, day = 0, hour = 0, minute = 0, consumed = 0;
        double second = 0.0;
        if (std::sscanf(text.c_str(), "%4d-%2d-%2dT%2d:%2d:%lf%n", &year, &month, &day, &hour, &minute, &second,
                        &consumed) != 6)
            return std::nullopt;
        if (month < 1 || month > 12 || day < 1 || day > 31 || hour > 23 || minute > 59 || second >= 61.0)
            return std::nullopt;

        long offsetSeconds = 0;
        std::string zone = text.substr(static_cast<std::size_t>(consumed));
        if (!zone.empty() && zone != "Z") {
            int oh = 0, om = 0;
            char sign = 0;
            if (std::sscanf(zone.c_str(), "%c%2d:%2d", &sign, &oh, &om) != 3 || (sign != '+' && sign != '-'))
                return std::nullopt;
            offsetSeconds = (oh * 3600L + om * 60L) * (sign == '-' ? -1 : 1);
        }

        std::int64_t days = detail::daysFromCivil(year, static_cast<unsigned>(month), static_cast<unsigned>(day));
        auto whole = static_cast<std::int64_t>(second);
        std::int64_t epoch = days * 86400 + hour * 3600 + minute * 60 + whole - offsetSeconds;
        auto fraction = std::chrono::duration_cast<Timestamp::duration>(
            std::chrono::duration<double>(second - static_cast<double>(whole)));
        return Timestamp(std::chrono::seconds(epoch)) + fraction;
    }

    PointSet parseGpx(const std::string &xml, std::size_t sampleStride, std::size_t *records) {
        detail::requireStride(sampleStride);

        detail::XmlDocPtr doc(xmlReadMemory(xml.data(), static_cast<int>(xml.size()), "track.gpx", nullptr,
                                            XML_PARSE_NONET | XML_PARSE_NOERROR | XML_PARSE_NOWARNING));
        if (!doc)
            throw ParseFailure("gpx: " + detail::lastXmlError());

        xmlNode *root = xmlDocGetRootElement(doc.get());
        if (!root || !detail::isElement(root, "gpx"))
            throw ParseFailure("gpx: root element is not <gpx>");

        PointSet out;
        std::size_t count = 0;
        for (xmlNode *trk = root->children; trk; trk = trk->next) {
            if (!detail::isElement(trk, "trk"))
                continue;
            for (xmlNode *seg = trk->children; seg; seg = seg->next) {
                if (!detail::isElement(seg, "trkseg"))
                    continue;
                for (xmlNode *pt = seg->children; pt; pt = pt->next) {
                    if (!detail::isElement(pt, "trkpt"))
                        continue;
                    ++count;
                    if (count % sampleStride != 0)
                        continue;

                    auto lat = detail::attributeNumber(pt, "lat");
                    auto lon = detail::attributeNumber(pt, "lon");
                    if (!lat || !lon || !detail::validPosition(*lat, *lon))
                        continue;

                    TrackPoint tp;
                    tp.position = Point(*lon, *lat);
                    auto ele = detail::childText(pt, "ele");
                    if (!ele.empty())
                        tp.elevation = detail::parseNumber(BAD_CAST ele.c_str());
                    auto time = detail::childText(pt, "time");
                    if (!time.empty())
                        tp.time = parseIso8601(time);
                    out.points.push_back(tp);
                }
            }
        }

        if (records)
            *records = count;
        return out;
    }

    PointSet parseFit(const std::string &bytes, std::size_t sampleStride, std::size_t *records) {
        detail::requireStride(sampleStride);

        auto decoded = fit::decodeRecords(bytes);
        PointSet out;
        std::size_t count = 0;
        for (const auto &rec : decoded) {
            ++count;
            if (count % sampleStride != 0)
                continue;
            if (!rec.latitude || !rec.longitude)
                continue;

            double lat = fit::semicirclesToDegrees(*rec.latitude);
            double lon = fit::semicirclesToDegrees(*rec.longitude);
            if (!detail::validPosition(lat, lon))
                continue;

            TrackPoint tp;
            tp.position = Point(lon, lat);
            tp.elevation = rec.altitude;
            if (rec.timestamp)
                tp.time = Timestamp(std::chrono::seconds(fit::kFitEpochOffset + *rec.timestamp));
            out.points.push_back(tp);
        }

        if (records)
            *records = count;
        return out;
    }

    FileResult readTrackFile(const std::filesystem::path &path, TrackFormat format, std::size_t sampleStride) {
        detail::requireStride(sampleStride);

        FileResult result;
        result.path = path;
        result.format = format;

        try {
            switch (format) {
            case TrackFormat::Gpx:
                result.points = parseGpx(detail::readPlain(path), sampleStride, &result.records);
                break;
            case TrackFormat::GpxGzip:
                result.points = parseGpx(detail::readGzip(path), sampleStride, &result.records);
                break;
            case TrackFormat::Fit:
                result.points = parseFit(detail::readPlain(path), sampleStride, &result.records);
                break;
            case TrackFormat::FitGzip:
                result.points = parseFit(detail::readGzip(path), sampleStride, &result.records);
                break;
            case TrackFormat::Unsupported:
                break;
            }
        } catch (const ParseFailure &e) {
            result.failure = FileFailure{FileFailure::Kind::Decode, e.what()};
        } catch (const boost::iostreams::gzip_error &e) {
            result.failure = FileFailure{FileFailure::Kind::Decode, std::string("gzip: ") + e.what()};
        } catch (const std::ios_base::failure &e) {
            result.failure = FileFailure{FileFailure::Kind::Io, e.what()};
        }

        if (result.failure) {
            result.points = PointSet{};
            spdlog::warn("Failed to parse {}: {}", path.filename().string(), result.failure->message);
        } else {
            spdlog::debug("{}: {} records, {} points kept", path.filename().string(), result.records,
                          result.points.size());
        }
        return result;
    }

    FileResult readTrackFile(const std::filesystem::path &path, std::size_t sampleStride) {
        return readTrackFile(path, detectFormat(path), sampleStride);
    }

    IngestReport ingestDirectory(const std::filesystem::path &dir, const IngestOptions &options) {
        detail::requireStride(options.sampleStride);
        if (!std::filesystem::is_directory(dir))
            throw std::runtime_error("trackcover::ingestDirectory(): not a directory \"" + dir.string() + '"');

        IngestReport report;
        std::vector<std::filesystem::path> paths;
        for (const auto &entry : std::filesystem::directory_iterator(dir)) {
            if (!entry.is_regular_file())
                continue;
            if (detectFormat(entry.path()) == TrackFormat::Unsupported) {
                ++report.skippedFiles;
                continue;
            }
            paths.push_back(entry.path());
        }
        std::sort(paths.begin(), paths.end());

        // libxml2 must be initialised before worker threads touch it.
        xmlInitParser();

        report.files.reserve(paths.size());
        std::size_t jobs = std::max<std::size_t>(1, options.jobs);
        for (std::size_t begin = 0; begin < paths.size(); begin += jobs) {
            std::size_t end = std::min(paths.size(), begin + jobs);
            if (jobs == 1) {
                report.files.push_back(readTrackFile(paths[begin], options.sampleStride));
                continue;
            }
            std::vector<std::future<FileResult>> batch;
            for (std::size_t i = begin; i < end; ++i) {
                batch.push_back(std::async(std::launch::async, [&paths, i, &options] {
                    return readTrackFile(paths[i], options.sampleStride);
                }));
            }
            for (auto &f : batch)
                report.files.push_back(f.get());
        }

        for (const auto &file : report.files) {
            if (file.failure)
                ++report.failedFiles;
            if (!file.valid())
                continue;
            ++report.validFiles;
            report.points.append(file.points);
        }

        spdlog::info("Valid activities parsed: {}", report.validFiles);
        spdlog::info("Number of GPS points extracted: {}", report.points.size());
        if (report.failedFiles > 0)
            spdlog::warn("{} file(s) failed to parse", report.failedFiles);
        return report;
    }

} // namespace trackcover
