#pragma once

#include <filesystem>
#include <fstream>
#include <random>
#include <string>
#include <gtest/gtest.h>


/// a fresh directory under the system temp dir, removed with everything in it on destruction
class TempDir {
public:
    TempDir() {
        std::random_device rd;
        auto base = std::filesystem::temp_directory_path();
        do {
            root = (base / ("distclean-test-" + std::to_string(rd()))).lexically_normal();
        } while (std::filesystem::exists(root));
        std::filesystem::create_directories(root);
    }

    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(root, ec);
    }

    TempDir(const TempDir &) = delete;
    TempDir &operator=(const TempDir &) = delete;

    std::filesystem::path path(const std::string &rel = "") const { return rel.empty() ? root : root / rel; }
    std::string str(const std::string &rel = "") const { return path(rel).string(); }

    /// create a file and its parent directories
    std::string touch(const std::string &rel, const std::string &content = "") const {
        auto p = path(rel);
        std::filesystem::create_directories(p.parent_path());
        std::ofstream(p) << content;
        return p.string();
    }

    std::string mkdir(const std::string &rel) const {
        auto p = path(rel);
        std::filesystem::create_directories(p);
        return p.string();
    }

    bool exists(const std::string &rel) const { return std::filesystem::exists(path(rel)); }

private:
    std::filesystem::path root;
};
