#pragma once

#include <filesystem> // std::filesystem::path

#include "Shelter/Utils/Error.hpp"
#include "Shelter/Utils/Types.hpp"

namespace shelter::core {
  namespace types = ::shelter::utils::types;

  /**
   * @brief Read-only view of the environment a module is rendered in.
   *
   * Every logical absolute path a probe asks about (e.g. "/proc/vz") is mapped
   * under a filesystem root. Production code uses "/", tests point the root at
   * a scratch directory populated with marker files.
   */
  class Context {
   public:
    explicit Context(std::filesystem::path root = "/");

    /**
     * @brief The filesystem root all logical paths are resolved against.
     */
    [[nodiscard]] auto root() const -> const std::filesystem::path& {
      return m_root;
    }

    /**
     * @brief Maps a logical path such as "/run/.containerenv" under the root.
     * @param logicalPath Absolute (or root-relative) logical path.
     * @return The real filesystem path.
     */
    [[nodiscard]] auto resolve(types::StringView logicalPath) const -> std::filesystem::path;

    /**
     * @brief Checks whether the logical path exists. Any filesystem error counts as "does not exist".
     */
    [[nodiscard]] auto exists(types::StringView logicalPath) const -> bool;

    /**
     * @brief Reads the whole file at the logical path as text.
     * @return The file contents, or an error if the file is missing, is a directory, or cannot be read.
     *
     * Never returns partial content: a read that stops early is reported as IoError.
     */
    [[nodiscard]] auto readText(types::StringView logicalPath) const -> types::Result<types::String>;

   private:
    std::filesystem::path m_root;
  };
} // namespace shelter::core
