#pragma once

#include <nlohmann/json.hpp>

#include <mutex>
#include <string>

namespace dombridge {

struct SelectorListing {
    bool success = false;
    std::string message;
    std::string error;
    std::string file_path;
    nlohmann::json selectors = nlohmann::json::array();

    nlohmann::json to_json() const;
};

/**
 * Named selector presets kept in a JSON array file.
 *
 * Each preset is an object with at least "name" and "selector"; the other
 * fields (action, text, key, description, ...) are stored as given.
 */
class SelectorStore {
public:
    explicit SelectorStore(std::string file_path);

    /// Reads the file into memory. A missing file leaves the store empty.
    bool load();

    /// Re-reads the file so edits made by other tools are visible.
    SelectorListing list() const;

    bool add(const nlohmann::json& preset, std::string& error);
    bool remove(const std::string& name);

    nlohmann::json presets() const;
    std::size_t size() const;
    const std::string& file_path() const { return file_path_; }

private:
    bool save_locked() const;

    std::string file_path_;
    mutable std::mutex mutex_;
    nlohmann::json presets_ = nlohmann::json::array();
};

} // namespace dombridge
