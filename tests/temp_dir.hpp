#pragma once
#include <filesystem>
#include <random>
#include <string>

// Scratch directory removed on destruction.
struct TempDir {
    std::filesystem::path path;

    TempDir() {
        std::random_device rd;
        path = std::filesystem::temp_directory_path() /
               ("tokenwarden-test-" + std::to_string(rd()) + std::to_string(rd()));
        std::filesystem::create_directories(path);
    }
    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path, ec);
    }

    std::string file(const std::string& name) const { return (path / name).string(); }
};
