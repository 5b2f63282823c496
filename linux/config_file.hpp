#pragma once

#include <connector/config_store.hpp>
#include <string>

namespace config_file {

// Default location: $XDG_CONFIG_HOME/g1link/config.json, else ~/.config/g1link/config.json
std::string default_path();

// fsync an already written file; false (and logged) on failure
bool sync_file(const std::string& path);

// Pairing records persisted as a JSON document
class JsonConfigStore : public g1::ConfigStore {
public:
    explicit JsonConfigStore(std::string path) : path_(std::move(path)) {}

    // Read the file; a missing file leaves an empty configuration.
    // Returns false if the file exists but could not be parsed.
    bool load();

    // Write to <path>.tmp and rename over the target
    bool save() override;

    const std::string& path() const { return path_; }

private:
    std::string path_;
};

} // namespace config_file
