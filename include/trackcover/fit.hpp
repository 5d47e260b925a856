#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace trackcover {

    namespace fit {

        // Global message number of the FIT "record" message.
        constexpr std::uint16_t kRecordMessage = 20;

        constexpr std::uint8_t kFieldPositionLat = 0;
        constexpr std::uint8_t kFieldPositionLong = 1;
        constexpr std::uint8_t kFieldAltitude = 2;
        constexpr std::uint8_t kFieldEnhancedAltitude = 78;
        constexpr std::uint8_t kFieldTimestamp = 253;

        constexpr std::int32_t kInvalidSint32 = 0x7FFFFFFF;

        // Seconds between the Unix epoch and the FIT epoch (1989-12-31T00:00:00Z).
        constexpr std::int64_t kFitEpochOffset = 631065600;

        // One decoded "record" message. Fields the message did not carry stay empty.
        struct Record {
            std::optional<std::int32_t> latitude;  // semicircles
            std::optional<std::int32_t> longitude; // semicircles
            std::optional<double> altitude;        // metres
            std::optional<std::uint32_t> timestamp; // seconds since the FIT epoch
        };

        double semicirclesToDegrees(std::int32_t semicircles);

        std::uint16_t crc16(const std::uint8_t *data, std::size_t size, std::uint16_t crc = 0);

        // Decodes every "record" message of one (possibly chained) FIT file.
        // Throws ParseFailure on a bad signature, CRC mismatch or truncated stream.
        std::vector<Record> decodeRecords(const std::string &bytes);

    } // namespace fit

} // namespace trackcover
