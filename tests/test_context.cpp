#include <boost/ut.hpp>

#include <Shelter/Core/Context.hpp>
#include <Shelter/Utils/Error.hpp>
#include <Shelter/Utils/Types.hpp>

#include "TestRoot.hpp"

auto main() -> int {
  using namespace boost::ut;
  using namespace shelter::utils::types;
  using shelter::core::Context;
  using shelter::test::TestRoot;
  using shelter::utils::error::ShelterErrorCode;

  namespace fs = std::filesystem;

  "Context defaults to the real root"_test = [] -> void {
    const Context context;

    expect(context.root() == fs::path("/"));
    expect(context.resolve("/proc/vz") == fs::path("/proc/vz"));
  };

  "resolve maps logical paths under the root"_test = [] -> void {
    const Context context("/srv/sandbox");

    expect(context.resolve("/run/.containerenv") == fs::path("/srv/sandbox/run/.containerenv"));
    expect(context.resolve("run/.containerenv") == fs::path("/srv/sandbox/run/.containerenv"));
    expect(context.resolve("/") == fs::path("/srv/sandbox"));
  };

  "exists reports files and directories"_test = [] -> void {
    const TestRoot root;
    root.file("/.dockerenv").dir("/proc/vz");

    const Context context(root.path());

    expect(context.exists("/.dockerenv"));
    expect(context.exists("/proc/vz"));
    expect(!context.exists("/proc/bc"));
  };

  "readText returns the whole file"_test = [] -> void {
    const TestRoot root;
    root.file("/run/systemd/container", "docker\n");

    const Context  context(root.path());
    Result<String> text = context.readText("/run/systemd/container");

    expect(text.has_value());
    expect(*text == String("docker\n"));
  };

  "readText reads empty files"_test = [] -> void {
    const TestRoot root;
    root.file("/run/.containerenv");

    Result<String> text = Context(root.path()).readText("/run/.containerenv");

    expect(text.has_value());
    expect(text->empty());
  };

  "readText fails with NotFound for missing files"_test = [] -> void {
    const TestRoot root;

    Result<String> text = Context(root.path()).readText("/run/systemd/container");

    expect(!text.has_value());
    expect(text.error().code == ShelterErrorCode::NotFound);
  };

  "readText refuses directories"_test = [] -> void {
    const TestRoot root;
    root.dir("/run/.containerenv");

    Result<String> text = Context(root.path()).readText("/run/.containerenv");

    expect(!text.has_value());
    expect(text.error().code == ShelterErrorCode::IoError);
  };

  return 0;
}
