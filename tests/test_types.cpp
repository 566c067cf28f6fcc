#include <boost/ut.hpp>

#include <Shelter/Utils/Error.hpp>
#include <Shelter/Utils/Types.hpp>

auto main() -> int {
  using namespace boost::ut;
  using namespace shelter::utils::types;

  "Type sizes"_test = [] -> void {
    expect(sizeof(u8) == 1_ul);
    expect(sizeof(u16) == 2_ul);
    expect(sizeof(u32) == 4_ul);
    expect(sizeof(u64) == 8_ul);
    expect(sizeof(i32) == 4_ul);
    expect(sizeof(i64) == 8_ul);
  };

  "Option helper Some"_test = [] -> void {
    Option<i32> opt = Some(42);

    expect(opt.has_value());
    expect(*opt == 42);

    const String   text   = "test";
    Option<String> optStr = Some(text);

    expect(optStr.has_value());
    expect(*optStr == String("test"));
  };

  "Result success"_test = [] -> void {
    Result<i32> res = 10;

    expect(res.has_value());
    expect(*res == 10);
  };

  "Result error"_test = [] -> void {
    using namespace shelter::utils::error;

    Result<i32> res = Err(ShelterError(ShelterErrorCode::NotFound, "test error"));

    expect(!res.has_value());
    expect(res.error().code == ShelterErrorCode::NotFound);
    expect(res.error().message == String("test error"));
  };

  "None constant"_test = [] -> void {
    Option<i32> opt = None;

    expect(!opt.has_value());
  };

  "Map supports heterogeneous lookup"_test = [] -> void {
    Map<String, i32> map { { "docker", 1 } };

    expect(map.find(StringView("docker")) != map.end());
    expect(map.find(StringView("podman")) == map.end());
  };

  return 0;
}
