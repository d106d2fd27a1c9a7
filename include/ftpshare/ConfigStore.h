/**
 * @file ConfigStore.h
 * @brief Persistent key/value settings (username, password, port)
 */

#pragma once

#include <filesystem>
#include <mutex>
#include <string>
#include <nlohmann/json.hpp>

namespace FtpShare {

/**
 * @brief Key/value persistence consumed by the supervisor.
 *
 * Implementations raise PersistenceError when the backing storage cannot be
 * read or written. Callers treat that as non-fatal.
 */
class ConfigStore {
public:
    virtual ~ConfigStore() = default;

    /**
     * @brief Read a value
     * @return Stored value, or defaultValue if the key is absent
     */
    virtual std::string get(const std::string& key, const std::string& defaultValue) const = 0;

    /**
     * @brief Insert or replace a value
     */
    virtual void set(const std::string& key, const std::string& value) = 0;

    /**
     * @brief Delete a key (no-op if absent)
     */
    virtual void remove(const std::string& key) = 0;
};

/**
 * @brief ConfigStore backed by a JSON object in one file.
 *
 * Model:
 * - Top-level JSON object, every value a string.
 * - Each call is its own transaction: load, modify, atomic rename.
 * - An internal mutex makes this object single-writer; other processes
 *   are not coordinated with.
 */
class JsonConfigStore : public ConfigStore {
public:
    explicit JsonConfigStore(std::filesystem::path path);

    /**
     * @brief Prepare the file for use
     *
     * - Creates the file (and directory) if missing
     * - Moves an unparseable file aside to "<file>.corrupt" and starts fresh
     * - Deletes the legacy "folder" key
     * - Adds defaults for username/password/port without overwriting existing values
     *
     * @throws PersistenceError if the file cannot be written
     */
    void initialize();

    std::string get(const std::string& key, const std::string& defaultValue) const override;
    void set(const std::string& key, const std::string& value) override;
    void remove(const std::string& key) override;

    const std::filesystem::path& path() const { return m_path; }

private:
    nlohmann::json loadLocked() const;
    void saveLocked(const nlohmann::json& j) const;

    std::filesystem::path m_path;
    mutable std::mutex m_mutex;
};

}  // namespace FtpShare
