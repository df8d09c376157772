#include <boost/ut.hpp>

#include <Pacfetch/Utils/Env.hpp>

auto main() -> int {
  using namespace boost::ut;
  using namespace pacfetch::utils::env;
  using namespace pacfetch::utils::error;
  using namespace pacfetch::utils::types;

  "GetEnv returns NotFound for missing variable"_test = [] -> void {
    Result<String> result = GetEnv("PACFETCH_TEST_NONEXISTENT_VAR_12345");

    expect(!result.has_value());
    expect(result.error().code == PfErrorCode::NotFound);
  };

  "SetEnv and GetEnv round-trip"_test = [] -> void {
    SetEnv("PACFETCH_TEST_VAR", "test_value");
    Result<String> result = GetEnv("PACFETCH_TEST_VAR");

    expect(result.has_value());
    expect(*result == String("test_value"));

    UnsetEnv("PACFETCH_TEST_VAR");
  };

  "UnsetEnv removes variable"_test = [] -> void {
    SetEnv("PACFETCH_TEST_VAR2", "value");
    UnsetEnv("PACFETCH_TEST_VAR2");

    Result<String> result = GetEnv("PACFETCH_TEST_VAR2");

    expect(!result.has_value());
  };

  "GetHomeDir uses HOME outside sudo"_test = [] -> void {
    UnsetEnv("SUDO_USER");
    SetEnv("HOME", "/home/tester");

    Result<std::filesystem::path> home = GetHomeDir();

    expect(home.has_value());
    expect(*home == std::filesystem::path("/home/tester"));
  };

  "ExpandTilde"_test = [] -> void {
    UnsetEnv("SUDO_USER");
    SetEnv("HOME", "/home/tester");

    expect(*ExpandTilde("~") == std::filesystem::path("/home/tester"));
    expect(*ExpandTilde("~/art.txt") == std::filesystem::path("/home/tester/art.txt"));
    expect(*ExpandTilde("/etc/art.txt") == std::filesystem::path("/etc/art.txt"));
    expect(*ExpandTilde("./art.txt") == std::filesystem::path("./art.txt"));
  };

  return 0;
}
