#pragma once

#include <ocfg/platform.hpp>

#include <filesystem>
#include <fstream>
#include <string>

namespace ocfg::test {

namespace fs = std::filesystem;

// Temporary directory removed on destruction
class TempDir {
public:
    TempDir() {
        path_ = fs::temp_directory_path() / ("ocfg_test_" + generate_uuid());
        fs::create_directories(path_);
    }

    ~TempDir() {
        std::error_code ec;
        fs::remove_all(path_, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    std::string path() const { return path_.generic_string(); }

    // Path of a file below the directory
    std::string file(const std::string& relative) const {
        return (path_ / relative).generic_string();
    }

    // Write a file below the directory, creating parents
    std::string write(const std::string& relative, const std::string& content) const {
        fs::path p = path_ / relative;
        fs::create_directories(p.parent_path());
        std::ofstream out(p, std::ios::binary);
        out << content;
        return p.generic_string();
    }

    // Write <partition>/overlay/<name>.overlay.json
    std::string write_overlay(const std::string& partition, const std::string& package,
                              bool is_static = false, int priority = 0,
                              const std::string& subdir = "") const {
        std::string rel = partition + "/overlay/" + (subdir.empty() ? "" : subdir + "/") +
                          package + ".overlay.json";
        std::string json = "{\"package\": \"" + package + "\", \"target_package\": \"android\"";
        if (is_static) {
            json += ", \"static\": true, \"priority\": " + std::to_string(priority);
        }
        json += "}";
        return write(rel, json);
    }

    // Write <partition>/overlay/config/config.xml
    std::string write_config(const std::string& partition, const std::string& body) const {
        return write(partition + "/overlay/config/config.xml", "<config>\n" + body + "</config>\n");
    }

private:
    fs::path path_;
};

} // namespace ocfg::test
