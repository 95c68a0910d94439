#pragma once
#include <nlohmann/json.hpp>
#include <string>
#include <mutex>

using nlohmann::json;

class ConfigManager {
public:
    void setPath(std::string file);

    /**
     * Load the config file, creating it from the defaults if it doesn't exist.
     * Missing keys are added from the defaults and unknown keys are removed.
     * @param def Default config.
     * @return True if the file was loaded or created, false if it can't be used.
    */
    bool load(json def);
    bool save();

    std::string getPath() { return path; }

    json conf;

private:
    bool repair(const json& def);

    std::string path = "";
    std::mutex mtx;
};
