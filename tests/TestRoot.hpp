#pragma once

#include <filesystem> // std::filesystem::{path, temp_directory_path, create_directories, remove_all}
#include <format>     // std::format
#include <fstream>    // std::ofstream
#include <random>     // std::{random_device, mt19937_64}
#include <system_error> // std::error_code

#include <Shelter/Utils/Types.hpp>

namespace shelter::test {
  namespace fs    = std::filesystem;
  namespace types = ::shelter::utils::types;

  /**
   * @brief Scratch directory that stands in for "/" during a test; removed on destruction.
   */
  class TestRoot {
   public:
    TestRoot() {
      std::random_device                        device;
      std::mt19937_64                           engine(device());
      std::uniform_int_distribution<types::u64> dist;

      m_path = fs::temp_directory_path() / std::format("shelter-test-{:016x}", dist(engine));
      fs::create_directories(m_path);
    }

    TestRoot(const TestRoot&)                    = delete;
    auto operator=(const TestRoot&) -> TestRoot& = delete;

    ~TestRoot() {
      std::error_code errc;
      fs::remove_all(m_path, errc);
    }

    [[nodiscard]] auto path() const -> const fs::path& {
      return m_path;
    }

    // Creates the file at logical path `logical` (e.g. "/run/.containerenv").
    auto file(const types::StringView logical, const types::StringView contents = "") const -> const TestRoot& {
      const fs::path target = m_path / fs::path(logical).relative_path();

      fs::create_directories(target.parent_path());
      std::ofstream(target, std::ios::binary) << contents;
      return *this;
    }

    auto dir(const types::StringView logical) const -> const TestRoot& {
      fs::create_directories(m_path / fs::path(logical).relative_path());
      return *this;
    }

   private:
    fs::path m_path;
  };
} // namespace shelter::test
