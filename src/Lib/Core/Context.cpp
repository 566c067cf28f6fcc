#include "Shelter/Core/Context.hpp"

#include <fstream>      // std::ifstream
#include <iterator>     // std::istreambuf_iterator
#include <system_error> // std::error_code

#include "Shelter/Utils/Error.hpp"
#include "Shelter/Utils/Types.hpp"

using enum shelter::utils::error::ShelterErrorCode;
using namespace shelter::utils::types;
namespace fs = std::filesystem;

namespace shelter::core {
  Context::Context(fs::path root)
    : m_root(root.empty() ? fs::path("/") : std::move(root)) {}

  auto Context::resolve(const StringView logicalPath) const -> fs::path {
    StringView relative = logicalPath;

    while (!relative.empty() && relative.front() == '/')
      relative.remove_prefix(1);

    if (relative.empty())
      return m_root;

    return m_root / fs::path(relative);
  }

  auto Context::exists(const StringView logicalPath) const -> bool {
    std::error_code errc;
    const bool      found = fs::exists(resolve(logicalPath), errc);

    return found && !errc;
  }

  auto Context::readText(const StringView logicalPath) const -> Result<String> {
    const fs::path path = resolve(logicalPath);

    std::error_code       errc;
    const fs::file_status status = fs::status(path, errc);

    if (errc)
      ERR_FROM(errc);

    if (!fs::exists(status))
      ERR_FMT(NotFound, "File does not exist: {}", path.string());

    if (fs::is_directory(status))
      ERR_FMT(IoError, "Expected a file but found a directory: {}", path.string());

    std::ifstream file(path, std::ios::binary);

    if (!file.is_open())
      ERR_FMT(PermissionDenied, "Failed to open file: {}", path.string());

    String contents { std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>() };

    if (file.bad())
      ERR_FMT(IoError, "Failed to read file: {}", path.string());

    return contents;
  }
} // namespace shelter::core
