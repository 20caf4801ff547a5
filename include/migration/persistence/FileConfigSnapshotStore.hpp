#pragma once

#include <migration/persistence/IConfigSnapshotStore.hpp>
#include <migration/serialization/ConfigSnapshotCodec.hpp>
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <string>
#include <stdexcept>
#include <utility>
#include <vector>

/**
 * @brief Файловое хранилище снимков конфигурации
 *
 * Стратегия:
 * - load() читает всю таблицу из файла
 * - put()/remove() меняют таблицу в памяти
 * - flush() (или каждое изменение при autoFlush) записывает полную
 *   таблицу во временный файл и атомарно заменяет основной
 *
 * Порядок записей сохраняется: новые состояния добавляются в конец.
 */
class FileConfigSnapshotStore : public IConfigSnapshotStore {
public:
    /**
     * @brief Конструктор
     * @param filePath Путь к файлу таблицы снимков
     * @param autoFlush Сохранять при каждом изменении
     * @throws std::invalid_argument если путь пустой
     */
    explicit FileConfigSnapshotStore(const std::string& filePath, bool autoFlush = false)
        : filePath_(filePath)
        , autoFlush_(autoFlush)
        , dirty_(false)
    {
        if (filePath_.empty()) {
            throw std::invalid_argument("Snapshot store path cannot be empty");
        }
    }

    void load() override {
        std::lock_guard<std::mutex> lock(mutex_);

        ConfigSnapshotCodec::Table loaded;

        if (std::filesystem::exists(filePath_)) {
            if (!std::filesystem::is_regular_file(filePath_)) {
                throw std::runtime_error("Not a regular file: " + filePath_);
            }

            std::ifstream file(filePath_, std::ios::binary);
            if (!file) {
                throw std::runtime_error("Failed to open file for reading: " + filePath_);
            }

            file.seekg(0, std::ios::end);
            std::streamoff end = file.tellg();
            file.seekg(0, std::ios::beg);

            if (end < 0) {
                throw std::runtime_error("Failed to determine file size: " + filePath_);
            }

            size_t fileSize = static_cast<size_t>(end);
            if (fileSize > 0) {
                std::vector<uint8_t> data(fileSize);
                file.read(reinterpret_cast<char*>(data.data()), fileSize);

                if (!file) {
                    throw std::runtime_error("Failed to read file: " + filePath_);
                }

                loaded = ConfigSnapshotCodec::decodeAll(data);
            }
        }

        // Память меняется только после успешного чтения
        entries_ = std::move(loaded);
        dirty_ = false;
    }

    void put(const std::string& stateName, const ConfigSnapshot& snapshot) override {
        std::lock_guard<std::mutex> lock(mutex_);

        auto it = findEntry(stateName);
        if (it != entries_.end()) {
            it->second = snapshot;
        } else {
            entries_.emplace_back(stateName, snapshot);
        }

        markDirty();
    }

    std::optional<ConfigSnapshot> find(const std::string& stateName) const override {
        std::lock_guard<std::mutex> lock(mutex_);

        auto it = std::find_if(entries_.begin(), entries_.end(),
            [&stateName](const ConfigSnapshotCodec::Table::value_type& entry) {
                return entry.first == stateName;
            });

        if (it == entries_.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    bool remove(const std::string& stateName) override {
        std::lock_guard<std::mutex> lock(mutex_);

        auto it = findEntry(stateName);
        if (it == entries_.end()) {
            return false;
        }

        entries_.erase(it);
        markDirty();
        return true;
    }

    void flush() override {
        std::lock_guard<std::mutex> lock(mutex_);

        if (dirty_) {
            writeToFile();
            dirty_ = false;
        }
    }

    bool exists() const override {
        return std::filesystem::exists(filePath_);
    }

    bool isDirty() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return dirty_;
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return entries_.size();
    }

    const std::string& filePath() const {
        return filePath_;
    }

private:
    ConfigSnapshotCodec::Table::iterator findEntry(const std::string& stateName) {
        return std::find_if(entries_.begin(), entries_.end(),
            [&stateName](const ConfigSnapshotCodec::Table::value_type& entry) {
                return entry.first == stateName;
            });
    }

    /**
     * @note Вызывать под lock!
     */
    void markDirty() {
        dirty_ = true;

        if (autoFlush_) {
            writeToFile();
            dirty_ = false;
        }
    }

    /**
     * @brief Записать таблицу в файл
     * @note Вызывать под lock!
     */
    void writeToFile() {
        auto data = ConfigSnapshotCodec::encodeAll(entries_);

        std::string tempPath = filePath_ + ".tmp";

        std::ofstream file(tempPath, std::ios::binary | std::ios::trunc);
        if (!file) {
            throw std::runtime_error("Failed to open temp file for writing: " + tempPath);
        }

        file.write(reinterpret_cast<const char*>(data.data()), data.size());
        file.flush();

        if (!file) {
            throw std::runtime_error("Failed to write to temp file: " + tempPath);
        }

        file.close();

        std::filesystem::rename(tempPath, filePath_);
    }

private:
    std::string filePath_;
    bool autoFlush_;

    mutable std::mutex mutex_;
    ConfigSnapshotCodec::Table entries_;
    bool dirty_;
};
