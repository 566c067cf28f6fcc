#include <boost/ut.hpp>
#include <system_error> // std::{error_code, errc, make_error_code}

#include <Shelter/Utils/Error.hpp>

using namespace boost::ut;
using namespace shelter::utils::error;
using namespace shelter::utils::types;

namespace {
  auto fail_helper() -> Result<i32> {
    ERR(ShelterErrorCode::InvalidArgument, "fail");
  }

  auto succeed_helper() -> Result<i32> {
    return 42;
  }

  auto try_test_helper_fail() -> Result<i32> {
    i32 val = TRY(fail_helper());

    return val + 1; // Should not reach here
  }

  auto try_test_helper_success() -> Result<i32> {
    i32 val = TRY(succeed_helper());

    return val + 1; // Should be 43
  }

  auto try_void_helper(const bool fail) -> Result<> {
    TRY_VOID(fail ? Result<>(Err(ShelterError(ShelterErrorCode::ParseError, "bad"))) : Result<>());

    return {};
  }
} // namespace

auto main() -> int {
  "ShelterError construction"_test = [] -> void {
    ShelterError err(ShelterErrorCode::NotFound, "Item not found");

    expect(err.code == ShelterErrorCode::NotFound);
    expect(err.message == String("Item not found"));
    expect(err.location.line() > 0);
  };

  "ShelterError from error_code"_test = [] -> void {
    expect(ShelterError(std::make_error_code(std::errc::no_such_file_or_directory)).code == ShelterErrorCode::NotFound);
    expect(ShelterError(std::make_error_code(std::errc::permission_denied)).code == ShelterErrorCode::PermissionDenied);
    expect(ShelterError(std::make_error_code(std::errc::io_error)).code == ShelterErrorCode::IoError);
  };

  "TRY macro success"_test = [] -> void {
    Result<i32> res = try_test_helper_success();

    expect(res.has_value());
    expect(*res == 43);
  };

  "TRY macro failure"_test = [] -> void {
    Result<i32> res = try_test_helper_fail();

    expect(!res.has_value());
    expect(res.error().code == ShelterErrorCode::InvalidArgument);
    expect(res.error().message == String("fail"));
  };

  "TRY_VOID propagates errors"_test = [] -> void {
    expect(try_void_helper(false).has_value());

    Result<> res = try_void_helper(true);

    expect(!res.has_value());
    expect(res.error().code == ShelterErrorCode::ParseError);
  };

  "ERR macro"_test = [] -> void {
    auto func = []() -> Result<void> {
      ERR(ShelterErrorCode::InternalError, "internal error");
    };

    Result<void> res = func();

    expect(!res.has_value());
    expect(res.error().code == ShelterErrorCode::InternalError);
  };

  "ERR_FMT macro"_test = [] -> void {
    auto func = []() -> Result<void> {
      ERR_FMT(ShelterErrorCode::UnknownVariable, "Unknown variable '${}'", "name");
    };

    Result<void> res = func();

    expect(!res.has_value());
    expect(res.error().message == String("Unknown variable '$name'"));
  };

  return 0;
}
