/**
 * @file ConfigStore.cpp
 * @brief JSON file settings store
 */

#include "ftpshare/ConfigStore.h"
#include "ftpshare/AtomicFile.h"
#include "ftpshare/Debug.h"
#include "ftpshare/ErrorCodes.h"
#include "ftpshare/Errors.h"
#include "ftpshare/config.h"

#include <fstream>
#include <iterator>
#include <system_error>
#include <utility>

namespace FtpShare {

namespace {

std::string valueToString(const nlohmann::json& value) {
    if (value.is_string()) {
        return value.get<std::string>();
    }
    // Hand-edited files may hold numbers ("port": 2121)
    return value.dump();
}

}  // namespace

JsonConfigStore::JsonConfigStore(std::filesystem::path path)
    : m_path(std::move(path))
{
}

nlohmann::json JsonConfigStore::loadLocked() const {
    std::error_code ec;
    if (!std::filesystem::exists(m_path, ec)) {
        return nlohmann::json::object();
    }

    std::ifstream in(m_path, std::ios::binary);
    if (!in.is_open()) {
        throw PersistenceError(std::string(ErrorCodes::PERSIST_READ_FAILED) +
                               ": cannot open " + m_path.string());
    }

    const std::string data((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    if (data.empty()) {
        return nlohmann::json::object();
    }

    nlohmann::json j = nlohmann::json::parse(data, nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
        throw PersistenceError(std::string(ErrorCodes::PERSIST_CORRUPT) +
                               ": settings file is not a JSON object: " + m_path.string());
    }
    return j;
}

void JsonConfigStore::saveLocked(const nlohmann::json& j) const {
    std::string errorMsg;
    if (!writeFileAtomically(m_path, j.dump(2) + "\n", errorMsg)) {
        throw PersistenceError(std::string(ErrorCodes::PERSIST_WRITE_FAILED) + ": " + errorMsg);
    }
}

void JsonConfigStore::initialize() {
    std::lock_guard<std::mutex> lock(m_mutex);

    nlohmann::json j;
    try {
        j = loadLocked();
    } catch (const PersistenceError& e) {
        LOG_WARNING("Settings unreadable, starting fresh: " << e.what());

        std::filesystem::path aside = m_path;
        aside += ".corrupt";
        std::error_code ec;
        std::filesystem::rename(m_path, aside, ec);
        if (ec) {
            LOG_WARNING("Could not move " << m_path.string() << " aside: " << ec.message());
        }
        j = nlohmann::json::object();
    }

    // Folder paths must not outlive the process
    j.erase(std::string(KEY_FOLDER_LEGACY));

    const std::pair<const char*, std::string> defaults[] = {
        {KEY_USERNAME, DEFAULT_USERNAME},
        {KEY_PASSWORD, DEFAULT_PASSWORD},
        {KEY_PORT, std::to_string(DEFAULT_PORT)},
    };
    for (const auto& kv : defaults) {
        if (!j.contains(kv.first)) {
            j[kv.first] = kv.second;
        }
    }

    saveLocked(j);
}

std::string JsonConfigStore::get(const std::string& key, const std::string& defaultValue) const {
    std::lock_guard<std::mutex> lock(m_mutex);

    const nlohmann::json j = loadLocked();
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) {
        return defaultValue;
    }
    return valueToString(*it);
}

void JsonConfigStore::set(const std::string& key, const std::string& value) {
    std::lock_guard<std::mutex> lock(m_mutex);

    nlohmann::json j = loadLocked();
    j[key] = value;
    saveLocked(j);
}

void JsonConfigStore::remove(const std::string& key) {
    std::lock_guard<std::mutex> lock(m_mutex);

    nlohmann::json j = loadLocked();
    if (j.erase(key) == 0) {
        return;
    }
    saveLocked(j);
}

}  // namespace FtpShare
