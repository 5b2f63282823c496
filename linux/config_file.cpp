#include "config_file.hpp"

#include <ArduinoJson.h>

#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <iostream>
#include <iterator>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace config_file {

namespace {

struct Keys {
    const char* address;
    const char* name;
    const char* paired;
};

Keys keys_for(g1::Side side) {
    if (side == g1::Side::Left) return {"left_address", "left_name", "left_paired"};
    return {"right_address", "right_name", "right_paired"};
}

std::optional<std::string> read_optional_string(JsonVariantConst value) {
    if (value.is<const char*>()) {
        return std::string(value.as<const char*>());
    }
    return std::nullopt;
}

// mkdir -p for the directory part of path
bool ensure_parent_dir(const std::string& path) {
    auto slash = path.find_last_of('/');
    if (slash == std::string::npos || slash == 0) return true;

    std::string dir = path.substr(0, slash);
    for (size_t pos = 1; pos <= dir.size(); ++pos) {
        if (pos == dir.size() || dir[pos] == '/') {
            std::string prefix = dir.substr(0, pos);
            if (mkdir(prefix.c_str(), 0700) != 0 && errno != EEXIST) {
                std::cerr << "config: cannot create " << prefix << ": " << strerror(errno) << std::endl;
                return false;
            }
        }
    }
    return true;
}

} // namespace

std::string default_path() {
    if (const char* xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg) {
        return std::string(xdg) + "/g1link/config.json";
    }
    if (const char* home = std::getenv("HOME"); home && *home) {
        return std::string(home) + "/.config/g1link/config.json";
    }
    return "g1link.json";
}

bool JsonConfigStore::load() {
    clear();

    std::ifstream in(path_);
    if (!in) {
        // First run, nothing saved yet
        return true;
    }

    std::string content((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());

    JsonDocument doc;
    DeserializationError err = deserializeJson(doc, content);
    if (err) {
        std::cerr << "config: parse error in " << path_ << ": " << err.c_str() << std::endl;
        return false;
    }

    const JsonDocument& saved = doc;
    for (g1::Side side : g1::all_sides) {
        auto keys = keys_for(side);
        set_address(side, read_optional_string(saved[keys.address]));
        set_name(side, read_optional_string(saved[keys.name]));
        set_paired(side, saved[keys.paired] | false);
    }
    return true;
}

bool sync_file(const std::string& path) {
    int fd = ::open(path.c_str(), O_WRONLY);
    if (fd < 0) {
        std::cerr << "config: cannot reopen " << path << ": " << strerror(errno) << std::endl;
        return false;
    }
    bool synced = ::fsync(fd) == 0;
    if (!synced) {
        std::cerr << "config: fsync " << path << " failed: " << strerror(errno) << std::endl;
    }
    ::close(fd);
    return synced;
}

bool JsonConfigStore::save() {
    JsonDocument doc;
    for (g1::Side side : g1::all_sides) {
        auto keys = keys_for(side);
        const auto& address = this->address(side);
        const auto& name = this->name(side);

        if (address) doc[keys.address] = *address;
        else doc[keys.address] = nullptr;

        if (name) doc[keys.name] = *name;
        else doc[keys.name] = nullptr;

        doc[keys.paired] = paired(side);
    }

    if (!ensure_parent_dir(path_)) {
        return false;
    }

    const std::string tmp_path = path_ + ".tmp";
    {
        std::ofstream out(tmp_path, std::ios::trunc);
        if (!out) {
            std::cerr << "config: cannot write " << tmp_path << std::endl;
            return false;
        }
        serializeJsonPretty(doc, out);
        out << '\n';
        out.flush();
        if (!out) {
            std::cerr << "config: write to " << tmp_path << " failed" << std::endl;
            return false;
        }
    }

    if (!sync_file(tmp_path)) {
        std::remove(tmp_path.c_str());
        return false;
    }

    if (std::rename(tmp_path.c_str(), path_.c_str()) != 0) {
        std::cerr << "config: rename to " << path_ << " failed: " << strerror(errno) << std::endl;
        std::remove(tmp_path.c_str());
        return false;
    }
    return true;
}

} // namespace config_file
