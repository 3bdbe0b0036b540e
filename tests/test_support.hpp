/**
 * @file test_support.hpp
 * @brief Throwaway source trees under the system temp directory.
 */
#pragma once
#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>

namespace module_concat::test_support {

namespace fs = std::filesystem;

class TempTree {
public:
    TempTree() {
        static std::atomic<int> counter{0};
        auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
        root_ = fs::temp_directory_path() /
                ("modcat_test_" + std::to_string(stamp) + "_" + std::to_string(counter++));
        fs::create_directories(root_);
    }

    ~TempTree() {
        std::error_code ec;
        fs::remove_all(root_, ec);
    }

    TempTree(const TempTree&) = delete;
    TempTree& operator=(const TempTree&) = delete;

    fs::path write(const std::string& rel, const std::string& content) const {
        fs::path p = root_ / rel;
        fs::create_directories(p.parent_path());
        std::ofstream out(p, std::ios::binary);
        out << content;
        return p;
    }

    std::string read(const std::string& rel) const {
        std::ifstream in(root_ / rel, std::ios::binary);
        return std::string((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    }

    const fs::path& root() const { return root_; }

private:
    fs::path root_;
};

} // namespace module_concat::test_support
