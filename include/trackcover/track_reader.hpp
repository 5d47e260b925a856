#pragma once

#include "trackcover/types.hpp"

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace trackcover {

    enum class TrackFormat { Gpx, GpxGzip, Fit, FitGzip, Unsupported };

    // Picks the encoding from the file name (case-insensitive), e.g. "run.gpx.gz".
    TrackFormat detectFormat(const std::filesystem::path &path);

    const char *toString(TrackFormat format);

    struct FileFailure {
        enum class Kind { Io, Decode };
        Kind kind;
        std::string message;
    };

    struct FileResult {
        std::filesystem::path path;
        TrackFormat format = TrackFormat::Unsupported;
        PointSet points;          // WGS84
        std::size_t records = 0;  // records seen before decimation
        std::optional<FileFailure> failure;

        bool valid() const { return !failure && !points.empty(); }
    };

    struct IngestOptions {
        std::size_t sampleStride = 1; // keep every Nth record of each file
        std::size_t jobs = 1;
    };

    struct IngestReport {
        std::vector<FileResult> files; // supported files, sorted by path
        PointSet points;               // all files combined, WGS84
        std::size_t validFiles = 0;
        std::size_t failedFiles = 0;
        std::size_t skippedFiles = 0;  // unsupported extensions
    };

    // Parsers over already-decompressed content. Both throw ParseFailure.
    PointSet parseGpx(const std::string &xml, std::size_t sampleStride, std::size_t *records = nullptr);
    PointSet parseFit(const std::string &bytes, std::size_t sampleStride, std::size_t *records = nullptr);

    std::optional<Timestamp> parseIso8601(const std::string &text);

    // Reads one track file. Decode and I/O errors are reported in the result, never thrown.
    FileResult readTrackFile(const std::filesystem::path &path, TrackFormat format, std::size_t sampleStride = 1);

    FileResult readTrackFile(const std::filesystem::path &path, std::size_t sampleStride = 1);

    // Scans `dir` (non-recursive) and combines every supported track file.
    IngestReport ingestDirectory(const std::filesystem::path &dir, const IngestOptions &options = {});

} // namespace trackcover
