#pragma once
/** @file  TempDir.hpp
 *  @brief Self-deleting scratch directory for file-based tests.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>
#include <system_error>

#include <unistd.h>

namespace crashwatch {
  namespace test {

    class TempDir {
    public:
      TempDir() {
        static std::atomic<unsigned> counter{ 0 };
        auto base = std::filesystem::temp_directory_path();
        auto name = std::string{ "crashwatch_test_" } + std::to_string(::getpid()) + "_" +
                    std::to_string(static_cast<unsigned long long>(
                        std::chrono::steady_clock::now().time_since_epoch().count())) +
                    "_" + std::to_string(counter++);
        path_ = base / name;
        std::filesystem::create_directories(path_);
      }

      ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
      }

      TempDir(const TempDir&) = delete;
      TempDir& operator=(const TempDir&) = delete;

      const std::filesystem::path& path() const noexcept { return path_; }

      /// Write \p content verbatim to \p name inside the directory; returns the full path.
      std::string writeFile(const std::string& name, const std::string& content) const {
        auto p = path_ / name;
        std::ofstream out(p, std::ios::binary | std::ios::trunc);
        out << content;
        return p.string();
      }

    private:
      std::filesystem::path path_{};
    };

  } // namespace test
} // namespace crashwatch
