#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

#include "commands.hpp"
#include "memory_handle.hpp"
#include "stepfrag/converter.hpp"

namespace {

struct CliRun {
  int code = 0;
  std::string out;
  std::string err;
};

CliRun RunCli(std::vector<std::string> args) {
  args.insert(args.begin(), "stepfrag");
  std::vector<char*> argv;
  for (auto& arg : args) {
    argv.push_back(arg.data());
  }
  argv.push_back(nullptr);
  std::ostringstream out;
  std::ostringstream err;
  CliRun run;
  run.code = stepfrag::cli::Run(static_cast<int>(args.size()), argv.data(), out, err);
  run.out = out.str();
  run.err = err.str();
  return run;
}

std::string LastLine(const std::string& text) {
  std::string body = text;
  if (!body.empty() && body.back() == '\n') {
    body.pop_back();
  }
  auto pos = body.rfind('\n');
  return pos == std::string::npos ? body : body.substr(pos + 1);
}

}  // namespace

int main() {
  using stepfrag::ParseResultLine;

  auto dir = std::filesystem::temp_directory_path() / "stepfrag_cli_test";
  std::filesystem::remove_all(dir);
  std::filesystem::create_directories(dir);

  // usage errors
  {
    auto run = RunCli({});
    assert(run.code == 1);
    assert(run.err.find("Usage:") != std::string::npos);
    assert(run.out.empty());

    run = RunCli({"convert"});
    assert(run.code == 1);

    run = RunCli({"explode", "model.ifc"});
    assert(run.code == 1);
    assert(run.err.find("Unknown command: explode") != std::string::npos);
  }

  // convert: missing input fails with the result line last
  {
    auto run = RunCli({"convert", (dir / "missing.ifc").string()});
    assert(run.code == 1);
    auto parsed = ParseResultLine(LastLine(run.out));
    assert(parsed.has_value());
    assert((*parsed)["success"] == false);
    assert((*parsed)["error"].get<std::string>().find("not found") != std::string::npos);
  }

  // convert: valid sample succeeds, output lands at the requested path
  {
    auto input = dir / "sample.ifc";
    {
      std::ofstream out(input, std::ios::binary | std::ios::trunc);
      out << stepfrag::testing::SampleStepFile(200);
    }
    auto output = dir / "out" / "sample.frag";
    auto run = RunCli({"convert", input.string(), output.string()});
    assert(run.code == 0);
    assert(std::filesystem::exists(output));
    assert(run.out.find("[START] Starting conversion: sample.ifc") != std::string::npos);
    auto parsed = ParseResultLine(LastLine(run.out));
    assert(parsed.has_value());
    assert((*parsed)["success"] == true);
    assert((*parsed)["stats"].contains("compressionRatio"));
  }

  // profile
  {
    auto run = RunCli({"profile", (dir / "sample.ifc").string()});
    assert(run.code == 0);
    assert(run.out.find("[PROFILE]") != std::string::npos);
    assert(run.out.find("schema: IFC4") != std::string::npos);

    run = RunCli({"profile", (dir / "missing.ifc").string()});
    assert(run.code == 1);
    assert(run.err.find("[ERROR] file not found") != std::string::npos);
  }

  std::filesystem::remove_all(dir);
  std::cout << "cli tests ok\n";
  return 0;
}
