#pragma once

#include <migration/serialization/ConfigSnapshot.hpp>
#include <cstdint>
#include <iterator>
#include <string>
#include <stdexcept>
#include <utility>
#include <vector>

/**
 * @brief Бинарный кодек снимков конфигурации
 *
 * Формат одного снимка:
 * [4 байта: magic "CSNP"]
 * [4 байта: версия кодека]
 * [4 байта: размер id][N байт: id]
 * [4 байта: версия формата сериализатора]
 * [4 байта: размер параметров][M байт: параметры]
 *
 * Формат таблицы (имя состояния → снимок):
 * [4 байта: magic "CSNT"]
 * [4 байта: версия кодека]
 * [4 байта: количество записей]
 * [записи: [4 байта: размер имени][имя][снимок без magic/версии]...]
 *
 * Все целые — little-endian.
 */
class ConfigSnapshotCodec {
public:
    static constexpr uint32_t SNAPSHOT_MAGIC = 0x504E5343;  // "CSNP" в little-endian
    static constexpr uint32_t TABLE_MAGIC = 0x544E5343;     // "CSNT" в little-endian
    static constexpr uint32_t VERSION = 1;

    using Table = std::vector<std::pair<std::string, ConfigSnapshot>>;

    static std::vector<uint8_t> encode(const ConfigSnapshot& snapshot) {
        std::vector<uint8_t> result;
        appendUint32(result, SNAPSHOT_MAGIC);
        appendUint32(result, VERSION);
        appendBody(result, snapshot);
        return result;
    }

    /**
     * @throws std::runtime_error при повреждённых данных
     */
    static ConfigSnapshot decode(const std::vector<uint8_t>& data) {
        size_t offset = 0;
        readHeader(data, offset, SNAPSHOT_MAGIC, "snapshot");
        ConfigSnapshot snapshot = readBody(data, offset);

        if (offset != data.size()) {
            throw std::runtime_error("Invalid snapshot: trailing bytes");
        }
        return snapshot;
    }

    static std::vector<uint8_t> encodeAll(const Table& entries) {
        std::vector<uint8_t> result;
        appendUint32(result, TABLE_MAGIC);
        appendUint32(result, VERSION);
        appendUint32(result, static_cast<uint32_t>(entries.size()));

        for (const auto& [name, snapshot] : entries) {
            appendBytes(result, name.begin(), name.end());
            appendBody(result, snapshot);
        }
        return result;
    }

    /**
     * @throws std::runtime_error при повреждённых данных
     */
    static Table decodeAll(const std::vector<uint8_t>& data) {
        size_t offset = 0;
        readHeader(data, offset, TABLE_MAGIC, "snapshot table");

        uint32_t count = readUint32(data, offset);
        Table result;

        for (uint32_t i = 0; i < count; ++i) {
            auto nameBytes = readBytes(data, offset);
            std::string name(nameBytes.begin(), nameBytes.end());
            result.emplace_back(std::move(name), readBody(data, offset));
        }

        if (offset != data.size()) {
            throw std::runtime_error("Invalid snapshot table: trailing bytes");
        }
        return result;
    }

private:
    // ==================== Утилиты для записи ====================

    static void appendUint32(std::vector<uint8_t>& data, uint32_t value) {
        data.push_back(static_cast<uint8_t>(value & 0xFF));
        data.push_back(static_cast<uint8_t>((value >> 8) & 0xFF));
        data.push_back(static_cast<uint8_t>((value >> 16) & 0xFF));
        data.push_back(static_cast<uint8_t>((value >> 24) & 0xFF));
    }

    template<typename It>
    static void appendBytes(std::vector<uint8_t>& data, It begin, It end) {
        appendUint32(data, static_cast<uint32_t>(std::distance(begin, end)));
        data.insert(data.end(), begin, end);
    }

    static void appendBody(std::vector<uint8_t>& data, const ConfigSnapshot& snapshot) {
        const auto& id = snapshot.serializerId();
        appendBytes(data, id.begin(), id.end());
        appendUint32(data, snapshot.version());
        appendBytes(data, snapshot.parameters().begin(), snapshot.parameters().end());
    }

    // ==================== Утилиты для чтения ====================

    static uint32_t readUint32(const std::vector<uint8_t>& data, size_t& offset) {
        if (offset + 4 > data.size()) {
            throw std::runtime_error("Unexpected end of snapshot data");
        }

        uint32_t value = static_cast<uint32_t>(data[offset]) |
                        (static_cast<uint32_t>(data[offset + 1]) << 8) |
                        (static_cast<uint32_t>(data[offset + 2]) << 16) |
                        (static_cast<uint32_t>(data[offset + 3]) << 24);
        offset += 4;
        return value;
    }

    static std::vector<uint8_t> readBytes(const std::vector<uint8_t>& data, size_t& offset) {
        uint32_t size = readUint32(data, offset);
        if (size > data.size() - offset) {
            throw std::runtime_error("Unexpected end of snapshot data");
        }

        std::vector<uint8_t> result(data.begin() + offset, data.begin() + offset + size);
        offset += size;
        return result;
    }

    static void readHeader(const std::vector<uint8_t>& data, size_t& offset,
                           uint32_t expectedMagic, const std::string& what) {
        if (data.size() < 8) {
            throw std::runtime_error("Invalid " + what + ": too small");
        }

        if (readUint32(data, offset) != expectedMagic) {
            throw std::runtime_error("Invalid " + what + ": wrong magic number");
        }

        uint32_t version = readUint32(data, offset);
        if (version != VERSION) {
            throw std::runtime_error("Unsupported " + what + " version: " +
                                     std::to_string(version));
        }
    }

    static ConfigSnapshot readBody(const std::vector<uint8_t>& data, size_t& offset) {
        auto idBytes = readBytes(data, offset);
        uint32_t version = readUint32(data, offset);
        auto parameters = readBytes(data, offset);
        return ConfigSnapshot(std::string(idBytes.begin(), idBytes.end()),
                              version, std::move(parameters));
    }
};
