#include <config.h>
#include <spdlog/spdlog.h>
#include <fstream>
#include <filesystem>
#include <vector>

bool sameKind(const json& a, const json& b) {
    if (a.is_number() && b.is_number()) { return true; }
    return a.type() == b.type();
}

void ConfigManager::setPath(std::string file) {
    path = std::filesystem::absolute(file).string();
}

bool ConfigManager::load(json def) {
    std::lock_guard<std::mutex> lck(mtx);
    if (path == "") {
        spdlog::error("Config manager tried to load file with no path specified");
        return false;
    }
    if (!std::filesystem::exists(path)) {
        spdlog::warn("Config file '{0}' does not exist, creating it", path);
        conf = def;
        return save();
    }
    if (!std::filesystem::is_regular_file(path)) {
        spdlog::error("Config file '{0}' isn't a file", path);
        return false;
    }

    try {
        std::ifstream file(path.c_str());
        file >> conf;
        file.close();
    }
    catch (const std::exception& e) {
        spdlog::error("Config file '{0}' is corrupted, resetting it: {1}", path, e.what());
        conf = def;
        return save();
    }

    if (repair(def)) { return save(); }
    return true;
}

bool ConfigManager::save() {
    std::ofstream file(path.c_str());
    if (!file.is_open()) {
        spdlog::error("Could not write config file '{0}'", path);
        return false;
    }
    file << conf.dump(4);
    file.close();
    return true;
}

bool ConfigManager::repair(const json& def) {
    bool modified = false;
    if (!conf.is_object()) {
        spdlog::warn("Config file '{0}' doesn't hold an object, resetting it", path);
        conf = def;
        return true;
    }

    // Fix missing elements in config
    for (auto const& item : def.items()) {
        if (!conf.contains(item.key()) || !sameKind(conf[item.key()], item.value())) {
            spdlog::info("Missing or invalid key in config {0}, repairing", item.key());
            conf[item.key()] = item.value();
            modified = true;
        }
    }

    // Remove unused elements
    auto items = conf.items();
    std::vector<std::string> unused;
    for (auto const& item : items) {
        if (!def.contains(item.key())) { unused.push_back(item.key()); }
    }
    for (const auto& key : unused) {
        spdlog::info("Unused key in config {0}, repairing", key);
        conf.erase(key);
        modified = true;
    }

    return modified;
}
