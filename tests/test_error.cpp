#include <boost/ut.hpp>

#include <Pacfetch/Utils/Error.hpp>

using namespace boost::ut;
using namespace pacfetch::utils::error;
using namespace pacfetch::utils::types;

namespace {
  auto fail_helper() -> Result<i32> {
    ERR(PfErrorCode::InvalidArgument, "fail");
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
    TRY_VOID(fail ? Result<>(Err(PfError(PfErrorCode::IoError, "io"))) : Result<> {});

    return {};
  }
} // namespace

auto main() -> int {
  "PfError construction"_test = [] -> void {
    PfError err(PfErrorCode::NotFound, "Item not found");

    expect(err.code == PfErrorCode::NotFound);
    expect(err.message == String("Item not found"));
    expect(err.location.line() > 0);
  };

  "TRY macro success"_test = [] -> void {
    Result<i32> res = try_test_helper_success();

    expect(res.has_value());
    expect(*res == 43);
  };

  "TRY macro failure"_test = [] -> void {
    Result<i32> res = try_test_helper_fail();

    expect(!res.has_value());
    expect(res.error().code == PfErrorCode::InvalidArgument);
    expect(res.error().message == String("fail"));
  };

  "TRY_VOID propagates"_test = [] -> void {
    expect(try_void_helper(false).has_value());

    Result<> res = try_void_helper(true);

    expect(!res.has_value());
    expect(res.error().code == PfErrorCode::IoError);
  };

  "ERR macro"_test = [] -> void {
    auto func = []() -> Result<void> {
      ERR(PfErrorCode::InternalError, "internal error");
    };

    Result<void> res = func();

    expect(!res.has_value());
    expect(res.error().code == PfErrorCode::InternalError);
  };

  "ERR_FMT macro"_test = [] -> void {
    auto func = [](const i32 value) -> Result<void> {
      ERR_FMT(PfErrorCode::ParseError, "bad value {}", value);
    };

    Result<void> res = func(7);

    expect(!res.has_value());
    expect(res.error().message == String("bad value 7"));
  };

  "Expected absence"_test = [] -> void {
    expect(IsExpectedAbsence(PfErrorCode::NotFound));
    expect(IsExpectedAbsence(PfErrorCode::NotSupported));
    expect(!IsExpectedAbsence(PfErrorCode::PermissionDenied));
    expect(!IsExpectedAbsence(PfErrorCode::ParseError));
  };

  return 0;
}
