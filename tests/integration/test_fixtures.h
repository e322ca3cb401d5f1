/**
 * @file test_fixtures.h
 * @brief Shared fixtures that build local trees for upload tests
 */

#ifndef CYMO_TEST_FIXTURES_H
#define CYMO_TEST_FIXTURES_H

#include <gtest/gtest.h>

#include <cymo/cymo.h>

#include <filesystem>
#include <fstream>
#include <random>
#include <string>

namespace cymo::test {

/**
 * @brief Test fixture for temporary directory management
 */
class TempDirectoryFixture : public ::testing::Test {
protected:
    void SetUp() override {
        test_dir_ = std::filesystem::temp_directory_path() /
                    ("cymo_test_" + std::to_string(std::random_device{}()));
        std::filesystem::create_directories(test_dir_);
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(test_dir_, ec);
    }

    /**
     * @brief Write @p content to test_dir_/@p relative, creating parents
     */
    auto write_file(const std::string& relative, const std::string& content)
        -> std::filesystem::path {
        auto path = test_dir_ / relative;
        std::filesystem::create_directories(path.parent_path());
        std::ofstream file(path, std::ios::binary);
        file.write(content.data(), static_cast<std::streamsize>(content.size()));
        return path;
    }

    auto create_binary_file(const std::string& relative, std::size_t size)
        -> std::filesystem::path {
        std::string content(size, '\0');
        std::mt19937 gen(42);  // Fixed seed for reproducibility
        std::uniform_int_distribution<> dis(0, 255);
        for (auto& byte : content) {
            byte = static_cast<char>(dis(gen));
        }
        // Guarantee NUL bytes so the content never reads as text
        if (!content.empty()) {
            content[0] = '\0';
        }
        return write_file(relative, content);
    }

    auto make_directory(const std::string& relative) -> std::filesystem::path {
        auto path = test_dir_ / relative;
        std::filesystem::create_directories(path);
        return path;
    }

    std::filesystem::path test_dir_;
};

}  // namespace cymo::test

#endif  // CYMO_TEST_FIXTURES_H
