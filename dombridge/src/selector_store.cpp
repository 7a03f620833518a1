#include "selector_store.hpp"

#include "logger.hpp"

#include <log4cplus/loggingmacros.h>

#include <filesystem>
#include <fstream>

namespace dombridge {

namespace {

bool read_presets(const std::filesystem::path& path, nlohmann::json& out, std::string& error) {
    std::ifstream in(path);
    if (!in) {
        error = "Failed to open " + path.string();
        return false;
    }
    try {
        nlohmann::json parsed = nlohmann::json::parse(in);
        if (!parsed.is_array()) {
            error = "Invalid JSON format: expected an array of selectors";
            return false;
        }
        out = std::move(parsed);
        return true;
    } catch (const nlohmann::json::parse_error& exc) {
        error = std::string("Invalid JSON format: ") + exc.what();
        return false;
    }
}

std::string string_field(const nlohmann::json& object, const char* key, const std::string& fallback) {
    auto it = object.find(key);
    if (it == object.end() || !it->is_string()) {
        return fallback;
    }
    return it->get<std::string>();
}

} // namespace

nlohmann::json SelectorListing::to_json() const {
    nlohmann::json out = {{"success", success}, {"selectors", selectors}};
    if (success) {
        out["message"] = message;
        out["file_path"] = file_path;
    } else {
        out["error"] = error;
    }
    return out;
}

SelectorStore::SelectorStore(std::string file_path)
    : file_path_(std::move(file_path)) {}

bool SelectorStore::load() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!std::filesystem::exists(file_path_)) {
        LOG4CPLUS_INFO(core_logger(), "No selector file at " << file_path_ << ", starting empty");
        presets_ = nlohmann::json::array();
        return true;
    }

    std::string error;
    nlohmann::json loaded;
    if (!read_presets(file_path_, loaded, error)) {
        LOG4CPLUS_ERROR(core_logger(), "Failed to load selectors: " << error);
        return false;
    }
    presets_ = std::move(loaded);
    LOG4CPLUS_INFO(core_logger(), "Loaded " << presets_.size() << " selectors from " << file_path_);
    return true;
}

SelectorListing SelectorStore::list() const {
    SelectorListing listing;
    std::filesystem::path path(file_path_);

    std::lock_guard<std::mutex> lock(mutex_);
    if (!std::filesystem::exists(path)) {
        listing.error = path.filename().string() + " file not found";
        return listing;
    }

    nlohmann::json presets;
    if (!read_presets(path, presets, listing.error)) {
        return listing;
    }

    listing.success = true;
    listing.message = "Saved selectors loaded successfully";
    listing.file_path = std::filesystem::absolute(path).string();
    listing.selectors = std::move(presets);
    return listing;
}

bool SelectorStore::add(const nlohmann::json& preset, std::string& error) {
    if (!preset.is_object()) {
        error = "preset must be an object";
        return false;
    }
    auto name = preset.find("name");
    auto selector = preset.find("selector");
    if (name == preset.end() || !name->is_string() || name->get<std::string>().empty()) {
        error = "preset name is required";
        return false;
    }
    if (selector == preset.end() || !selector->is_string() || selector->get<std::string>().empty()) {
        error = "preset selector is required";
        return false;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    presets_.push_back(preset);
    if (!save_locked()) {
        presets_.erase(presets_.size() - 1);
        error = "Failed to save selectors to " + file_path_;
        return false;
    }
    LOG4CPLUS_INFO(core_logger(), "Added selector: " << name->get<std::string>() << " (Action: "
                                  << string_field(preset, "action", "click") << ")");
    return true;
}

bool SelectorStore::remove(const std::string& name) {
    std::lock_guard<std::mutex> lock(mutex_);
    nlohmann::json kept = nlohmann::json::array();
    for (const auto& preset : presets_) {
        if (preset.is_object() && string_field(preset, "name", "") == name) {
            continue;
        }
        kept.push_back(preset);
    }
    if (kept.size() == presets_.size()) {
        return false;
    }
    presets_ = std::move(kept);
    return save_locked();
}

nlohmann::json SelectorStore::presets() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return presets_;
}

std::size_t SelectorStore::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return presets_.size();
}

bool SelectorStore::save_locked() const {
    std::ofstream out(file_path_, std::ios::trunc);
    if (!out) {
        LOG4CPLUS_ERROR(core_logger(), "Failed to open " << file_path_ << " for writing");
        return false;
    }
    out << presets_.dump(2);
    out.flush();
    if (!out) {
        LOG4CPLUS_ERROR(core_logger(), "Failed to write selectors to " << file_path_);
        return false;
    }
    LOG4CPLUS_DEBUG(core_logger(), "Selectors saved to " << file_path_);
    return true;
}

} // namespace dombridge
