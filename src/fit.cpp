#include "trackcover/fit.hpp"
#include "trackcover/errors.hpp"

#include <array>

namespace trackcover {

    namespace fit {

        namespace detail {

            struct FieldDefinition {
                std::uint8_t number;
                std::uint8_t size;
            };

            struct MessageDefinition {
                bool defined = false;
                bool bigEndian = false;
                std::uint16_t globalNumber = 0;
                std::vector<FieldDefinition> fields;
                std::size_t developerBytes = 0;
            };

            class ByteReader {
              public:
                ByteReader(const std::uint8_t *data, std::size_t size) : data_(data), size_(size) {}

                std::size_t remaining() const { return size_ - pos_; }

                std::uint8_t u8() {
                    need(1);
                    return data_[pos_++];
                }

                std::uint64_t integer(std::size_t width, bool bigEndian) {
                    need(width);
                    std::uint64_t v = 0;
                    for (std::size_t i = 0; i < width; ++i) {
                        std::size_t idx = bigEndian ? i : width - 1 - i;
                        v = (v << 8) | data_[pos_ + idx];
                    }
                    pos_ += width;
                    return v;
                }

                void skip(std::size_t n) {
                    need(n);
                    pos_ += n;
                }

              private:
                void need(std::size_t n) const {
                    if (n > size_ - pos_)
                        throw ParseFailure("fit: truncated stream");
                }

                const std::uint8_t *data_;
                std::size_t size_;
                std::size_t pos_ = 0;
            };

            std::uint32_t applyTimeOffset(std::uint32_t last, std::uint8_t offset) {
                std::uint32_t base = last & ~std::uint32_t{0x1F};
                if (offset >= (last & 0x1F))
                    return base + offset;
                return base + offset + 0x20;
            }

            bool isDecodedField(const FieldDefinition &f) {
                switch (f.number) {
                case kFieldPositionLat:
                case kFieldPositionLong:
                case kFieldEnhancedAltitude:
                case kFieldTimestamp:
                    return f.size == 4;
                case kFieldAltitude:
                    return f.size == 2;
                default:
                    return false;
                }
            }

            // Decodes one data message into `rec` when it is a record message, and keeps
            // `lastTimestamp` current for compressed-timestamp headers.
            bool readDataMessage(ByteReader &in, const MessageDefinition &def, Record &rec,
                                 std::uint32_t &lastTimestamp) {
                bool isRecord = def.globalNumber == kRecordMessage;
                for (const auto &field : def.fields) {
                    if (!isDecodedField(field)) {
                        in.skip(field.size);
                        continue;
                    }

                    auto raw = in.integer(field.size, def.bigEndian);
                    if (field.number == kFieldTimestamp) {
                        if (raw != 0xFFFFFFFFu) {
                            lastTimestamp = static_cast<std::uint32_t>(raw);
                            if (isRecord)
                                rec.timestamp = lastTimestamp;
                        }
                        continue;
                    }
                    if (!isRecord)
                        continue;

                    switch (field.number) {
                    case kFieldPositionLat:
                    case kFieldPositionLong: {
                        auto value = static_cast<std::int32_t>(static_cast<std::uint32_t>(raw));
                        if (value == kInvalidSint32)
                            break;
                        if (field.number == kFieldPositionLat)
                            rec.latitude = value;
                        else
                            rec.longitude = value;
                        break;
                    }
                    case kFieldAltitude:
                        if (raw != 0xFFFFu && !rec.altitude)
                            rec.altitude = static_cast<double>(raw) / 5.0 - 500.0;
                        break;
                    case kFieldEnhancedAltitude:
                        if (raw != 0xFFFFFFFFu)
                            rec.altitude = static_cast<double>(raw) / 5.0 - 500.0;
                        break;
                    default:
                        break;
                    }
                }
                in.skip(def.developerBytes);
                return isRecord;
            }

            void readDefinition(ByteReader &in, MessageDefinition &def, bool developerData) {
                in.u8(); // reserved
                std::uint8_t arch = in.u8();
                if (arch > 1)
                    throw ParseFailure("fit: invalid architecture byte");
                def.bigEndian = arch == 1;
                def.globalNumber = static_cast<std::uint16_t>(in.integer(2, def.bigEndian));

                std::uint8_t count = in.u8();
                def.fields.clear();
                def.fields.reserve(count);
                for (std::uint8_t i = 0; i < count; ++i) {
                    FieldDefinition f{};
                    f.number = in.u8();
                    f.size = in.u8();
                    in.u8(); // base type
                    def.fields.push_back(f);
                }

                def.developerBytes = 0;
                if (developerData) {
                    std::uint8_t devCount = in.u8();
                    for (std::uint8_t i = 0; i < devCount; ++i) {
                        in.u8(); // field number
                        def.developerBytes += in.u8();
                        in.u8(); // developer data index
                    }
                }
                def.defined = true;
            }

            // Returns the number of bytes consumed by one FIT file starting at `data`.
            std::size_t decodeFile(const std::uint8_t *data, std::size_t size, std::vector<Record> &out) {
                if (size < 12)
                    throw ParseFailure("fit: truncated file header");

                std::uint8_t headerSize = data[0];
                if (headerSize != 12 && headerSize != 14)
                    throw ParseFailure("fit: unexpected header size " + std::to_string(headerSize));
                if (size < headerSize)
                    throw ParseFailure("fit: truncated file header");
                if (data[8] != '.' || data[9] != 'F' || data[10] != 'I' || data[11] != 'T')
                    throw ParseFailure("fit: missing .FIT signature");

                if (headerSize == 14) {
                    std::uint16_t headerCrc = static_cast<std::uint16_t>(data[12] | (data[13] << 8));
                    if (headerCrc != 0 && headerCrc != crc16(data, 12))
                        throw ParseFailure("fit: header CRC mismatch");
                }

                std::uint32_t dataSize = static_cast<std::uint32_t>(data[4]) |
                                         static_cast<std::uint32_t>(data[5]) << 8 |
                                         static_cast<std::uint32_t>(data[6]) << 16 |
                                         static_cast<std::uint32_t>(data[7]) << 24;
                std::size_t total = static_cast<std::size_t>(headerSize) + dataSize + 2;
                if (size < total)
                    throw ParseFailure("fit: truncated stream (expected " + std::to_string(total) + " bytes, have " +
                                       std::to_string(size) + ")");

                std::size_t crcOffset = headerSize + dataSize;
                std::uint16_t fileCrc = static_cast<std::uint16_t>(data[crcOffset] | (data[crcOffset + 1] << 8));
                if (fileCrc != crc16(data, crcOffset))
                    throw ParseFailure("fit: file CRC mismatch");

                std::array<MessageDefinition, 16> local{};
                std::uint32_t lastTimestamp = 0;
                ByteReader in(data + headerSize, dataSize);

                while (in.remaining() > 0) {
                    std::uint8_t header = in.u8();
                    if (header & 0x80) {
                        auto &def = local[(header >> 5) & 0x03];
                        if (!def.defined)
                            throw ParseFailure("fit: data message for undefined local type");
                        lastTimestamp = applyTimeOffset(lastTimestamp, header & 0x1F);
                        Record rec;
                        rec.timestamp = lastTimestamp;
                        if (readDataMessage(in, def, rec, lastTimestamp))
                            out.push_back(rec);
                        continue;
                    }

                    auto &def = local[header & 0x0F];
                    if (header & 0x40) {
                        readDefinition(in, def, (header & 0x20) != 0);
                        continue;
                    }
                    if (!def.defined)
                        throw ParseFailure("fit: data message for undefined local type");
                    Record rec;
                    if (readDataMessage(in, def, rec, lastTimestamp))
                        out.push_back(rec);
                }
                return total;
            }

        } // namespace detail

        double semicirclesToDegrees(std::int32_t semicircles) {
            return static_cast<double>(semicircles) * (180.0 / 2147483648.0);
        }

        std::uint16_t crc16(const std::uint8_t *data, std::size_t size, std::uint16_t crc) {
            static const std::uint16_t table[16] = {0x0000, 0xCC01, 0xD801, 0x1400, 0xF001, 0x3C00, 0x2800, 0xE401,
                                                    0xA001, 0x6C00, 0x7800, 0xB401, 0x5000, 0x9C01, 0x8801, 0x4400};
            for (std::size_t i = 0; i < size; ++i) {
                std::uint8_t byte = data[i];
                std::uint16_t tmp = table[crc & 0xF];
                crc = (crc >> 4) & 0x0FFF;
                crc = crc ^ tmp ^ table[byte & 0xF];
                tmp = table[crc & 0xF];
                crc = (crc >> 4) & 0x0FFF;
                crc = crc ^ tmp ^ table[(byte >> 4) & 0xF];
            }
            return crc;
        }

        std::vector<Record> decodeRecords(const std::string &bytes) {
            std::vector<Record> out;
            const auto *data = reinterpret_cast<const std::uint8_t *>(bytes.data());
            std::size_t offset = 0;
            do {
                offset += detail::decodeFile(data + offset, bytes.size() - offset, out);
            } while (offset < bytes.size());
            return out;
        }

    } // namespace fit

} // namespace trackcover
