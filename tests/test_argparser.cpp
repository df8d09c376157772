#include <boost/ut.hpp>

#include <Pacfetch/Utils/ArgumentParser.hpp>
#include <Pacfetch/Utils/Logging.hpp>
#include <Pacfetch/Utils/Types.hpp>

auto main() -> int {
  using namespace boost::ut;
  using namespace pacfetch::utils::argparse;
  using namespace pacfetch::utils::types;
  using pacfetch::utils::logging::LogLevel;

  "ArgumentParser flag"_test = [] -> void {
    ArgumentParser parser("0.1.0");
    bool           debug = false;
    parser.addArguments("-d", "--debug").flag().bindTo(debug);

    Vec<String> args   = { "testprog", "--debug" };
    Result<>    result = parser.parseInto(args);

    expect(result.has_value());
    expect(debug);
    expect(parser.isUsed("-d"));
  };

  "ArgumentParser value"_test = [] -> void {
    ArgumentParser parser("0.1.0");
    String         ascii;
    parser.addArguments("--ascii").bindTo(ascii);

    Vec<String> args   = { "testprog", "--ascii", "PACMAN_SMALL" };
    Result<>    result = parser.parseInto(args);

    expect(result.has_value());
    expect(ascii == String("PACMAN_SMALL"));
  };

  "ArgumentParser inline value"_test = [] -> void {
    ArgumentParser parser("0.1.0");
    String         color;
    parser.addArguments("--color").bindTo(color);

    Vec<String> args   = { "testprog", "--color=#ff8800" };
    Result<>    result = parser.parseInto(args);

    expect(result.has_value());
    expect(color == String("#ff8800"));
  };

  "ArgumentParser optional binding"_test = [] -> void {
    ArgumentParser parser("0.1.0");
    Option<String> given;
    Option<String> absent;
    parser.addArguments("--ascii").bindTo(given);
    parser.addArguments("--color").bindTo(absent);

    Vec<String> args   = { "testprog", "--ascii", "NONE" };
    Result<>    result = parser.parseInto(args);

    expect(result.has_value());
    expect(given.has_value());
    expect(*given == String("NONE"));
    expect(!absent.has_value());
  };

  "ArgumentParser enum choices"_test = [] -> void {
    ArgumentParser parser("0.1.0");
    LogLevel       level = LogLevel::Error;
    parser.addArguments("-l", "--log-level").defaultValue(LogLevel::Warn).bindToEnum(level);

    Vec<String> args   = { "testprog", "-l", "debug" };
    Result<>    result = parser.parseInto(args);

    expect(result.has_value());
    expect(level == LogLevel::Debug);
    expect(parser.getEnum<LogLevel>("--log-level") == LogLevel::Debug);
  };

  "ArgumentParser enum default"_test = [] -> void {
    ArgumentParser parser("0.1.0");
    parser.addArguments("-l", "--log-level").defaultValue(LogLevel::Warn);

    Vec<String> args   = { "testprog" };
    Result<>    result = parser.parseInto(args);

    expect(result.has_value());
    expect(parser.getEnum<LogLevel>("-l") == LogLevel::Warn);
  };

  "ArgumentParser rejects invalid choice"_test = [] -> void {
    ArgumentParser parser("0.1.0");
    parser.addArguments("-l", "--log-level").defaultValue(LogLevel::Warn);

    Vec<String> args   = { "testprog", "--log-level", "loud" };
    Result<>    result = parser.parseArgs(args);

    expect(!result.has_value());
  };

  "ArgumentParser default value"_test = [] -> void {
    ArgumentParser parser("0.1.0");
    String         ascii;
    parser.addArguments("--ascii").defaultValue(String("PACMAN_DEFAULT")).bindTo(ascii);

    Vec<String> args   = { "testprog" };
    Result<>    result = parser.parseInto(args);

    expect(result.has_value());
    expect(ascii == String("PACMAN_DEFAULT"));
  };

  "ArgumentParser help and version"_test = [] -> void {
    ArgumentParser parser("pacfetch 0.1.0");

    Vec<String> args   = { "testprog", "-v", "--help" };
    Result<>    result = parser.parseArgs(args);

    expect(result.has_value());
    expect(parser.isUsed("--version"));
    expect(parser.isUsed("-h"));
    expect(parser.getVersion() == String("pacfetch 0.1.0"));
  };

  "ArgumentParser flag rejects value"_test = [] -> void {
    ArgumentParser parser("0.1.0");
    parser.addArguments("--json").flag();

    Vec<String> args   = { "testprog", "--json=yes" };
    Result<>    result = parser.parseArgs(args);

    expect(!result.has_value());
  };

  "ArgumentParser missing value"_test = [] -> void {
    ArgumentParser parser("0.1.0");
    parser.addArguments("--ascii");

    Vec<String> args   = { "testprog", "--ascii" };
    Result<>    result = parser.parseArgs(args);

    expect(!result.has_value());
  };

  "ArgumentParser unknown argument"_test = [] -> void {
    ArgumentParser parser("0.1.0");
    Vec<String>    args   = { "testprog", "--unknown" };
    Result<>       result = parser.parseArgs(args);

    expect(!result.has_value());
  };

  return 0;
}
