#pragma once

#include <gtest/gtest.h>

#include <atomic>
#include <filesystem>
#include <fstream>
#include <string>
#include <unistd.h>

namespace configdesk::test {

// Per-test scratch directory, removed again on destruction
class TempDir {
public:
    TempDir() {
        static std::atomic<int> counter{0};
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        std::string name = "configdesk-";
        if (info) {
            name += std::string(info->test_suite_name()) + "-" + info->name();
        }
        name += "-" + std::to_string(getpid()) + "-" + std::to_string(counter++);
        dir = std::filesystem::temp_directory_path() / name;
        std::filesystem::create_directories(dir);
    }

    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(dir, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const std::filesystem::path& path() const { return dir; }

    std::filesystem::path write(const std::string& relative, const std::string& content) const {
        const auto file = dir / relative;
        std::filesystem::create_directories(file.parent_path());
        std::ofstream out(file, std::ios::binary);
        out << content;
        return file;
    }

private:
    std::filesystem::path dir;
};

inline std::string readFile(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

} // namespace configdesk::test
