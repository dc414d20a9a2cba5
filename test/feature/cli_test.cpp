#include <catch2/catch_test_macros.hpp>

#define STRINGIFY_HELPER(x) #x
#define STRINGIFY(x) STRINGIFY_HELPER(x)

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>

namespace fs = std::filesystem;

static const std::string xt_cli = STRINGIFY(XT_CLI);
static const std::string cases_dir = STRINGIFY(XT_CASES_DIR);
static const std::string schema_manifest = cases_dir + "/schemas/testfiles";
static const std::string instance_manifest = cases_dir + "/instances/testfiles";

static int
exit_code(int status) {
#ifdef _WIN32
  return status;
#else
  if (WIFEXITED(status)) return WEXITSTATUS(status);
  return -1;
#endif
}

static int
run_cli(const std::string& args) {
  std::string cmd = xt_cli + " " + args + " >/dev/null 2>&1";
  return exit_code(std::system(cmd.c_str()));
}

static std::string
slurp(const fs::path& file) {
  std::ifstream in(file);
  return {std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()};
}

// Runs the tool, capturing its standard output and error streams.
static int
run_cli_capture(const std::string& args, std::string& out, std::string& err) {
  auto out_file = fs::temp_directory_path() / "xt_cli_stdout.txt";
  auto err_file = fs::temp_directory_path() / "xt_cli_stderr.txt";
  std::string cmd = xt_cli + " " + args + " >" + out_file.string() + " 2>" +
                    err_file.string();
  int rc = exit_code(std::system(cmd.c_str()));
  out = slurp(out_file);
  err = slurp(err_file);
  fs::remove(out_file);
  fs::remove(err_file);
  return rc;
}

static fs::path
make_tmp_dir(const std::string& name) {
  auto dir = fs::temp_directory_path() / ("xt_cli_" + name);
  fs::remove_all(dir);
  fs::create_directories(dir);
  return dir;
}

TEST_CASE("--help exits 0 and produces output", "[cli]") {
  std::string out, err;
  CHECK(run_cli_capture("--help", out, err) == 0);
  CHECK(err.find("Usage") != std::string::npos);
}

TEST_CASE("-h exits 0", "[cli]") {
  CHECK(run_cli("-h") == 0);
}

TEST_CASE("--version exits 0 and names the tool", "[cli]") {
  std::string out, err;
  CHECK(run_cli_capture("--version", out, err) == 0);
  CHECK(err.find("xt ") == 0);
}

TEST_CASE("no arguments exits 1 (usage error)", "[cli]") {
  CHECK(run_cli("") == 1);
}

TEST_CASE("unknown option exits 1", "[cli]") {
  CHECK(run_cli("--frobnicate list " + instance_manifest) == 1);
}

TEST_CASE("option without its value exits 1", "[cli]") {
  CHECK(run_cli("list " + instance_manifest + " --label") == 1);
}

TEST_CASE("command without patterns exits 1", "[cli]") {
  CHECK(run_cli("list") == 1);
}

TEST_CASE("unknown command exits 1", "[cli]") {
  CHECK(run_cli("frobnicate " + instance_manifest) == 1);
}

TEST_CASE("list prints one line per unit", "[cli]") {
  std::string out, err;
  CHECK(run_cli_capture("list --base-dir " + cases_dir + " " +
                            instance_manifest,
                        out, err) == 0);
  CHECK(out.find("TestValidation001.test_validation_001_instances/"
                 "library_valid.xml\n") == 0);
  CHECK(out.find("TestValidation007.") != std::string::npos);
  CHECK(out.find("TestValidation008.") == std::string::npos);
}

TEST_CASE("list --json describes every unit", "[cli]") {
  std::string out, err;
  CHECK(run_cli_capture("list --json --suffix xsd --label schema " +
                            schema_manifest,
                        out, err) == 0);
  CHECK(out.find("\"class\": \"TestSchema011\"") != std::string::npos);
  CHECK(out.find("\"variant\": \"instrumented\"") != std::string::npos);
  CHECK(out.find("\"expected_errors\": 2") != std::string::npos);
}

TEST_CASE("--verbose reports skipped directives", "[cli]") {
  std::string out, err;
  CHECK(run_cli_capture("list --verbose " + instance_manifest, out, err) == 0);
  CHECK(err.find("skipped") != std::string::npos);
  CHECK(err.find("suffix mismatch") != std::string::npos);
}

TEST_CASE("run passes over the schema corpus", "[cli]") {
  std::string out, err;
  CHECK(run_cli_capture("run --suffix xsd --label schema " + schema_manifest,
                        out, err) == 0);
  CHECK(out.find("11 passed, 0 failed") != std::string::npos);
}

TEST_CASE("run passes over the instance corpus", "[cli]") {
  std::string out, err;
  CHECK(run_cli_capture("run " + instance_manifest, out, err) == 0);
  CHECK(out.find("7 passed, 0 failed") != std::string::npos);
}

TEST_CASE("run exits 5 when an expectation fails", "[cli]") {
  auto dir = make_tmp_dir("failing");
  fs::copy_file(cases_dir + "/instances/library.xsd", dir / "library.xsd");
  fs::copy_file(cases_dir + "/instances/library_valid.xml",
                dir / "library_valid.xml");
  std::ofstream(dir / "testfiles") << "library_valid.xml\n"
                                      "library_valid.xml 2\n";

  std::string out, err;
  CHECK(run_cli_capture("run " + (dir / "testfiles").string(), out, err) == 5);
  CHECK(out.find("1 passed, 1 failed") != std::string::npos);
  CHECK(out.find("FAILED  TestValidation002") != std::string::npos);
  CHECK(err.find("expected 2 validation error(s), found 0") !=
        std::string::npos);

  fs::remove_all(dir);
}

TEST_CASE("malformed manifest exits 3 (configuration error)", "[cli]") {
  auto dir = make_tmp_dir("malformed");
  std::ofstream(dir / "testfiles") << "a.xml many\n";

  std::string out, err;
  CHECK(run_cli_capture("list " + (dir / "testfiles").string(), out, err) == 3);
  CHECK(err.find("testfiles:1:") != std::string::npos);

  fs::remove_all(dir);
}

TEST_CASE("config file supplies option defaults", "[cli]") {
  auto dir = make_tmp_dir("config");
  std::ofstream(dir / "xt.json") << R"({"suffix": "xsd", "label": "schema"})";

  std::string out, err;
  CHECK(run_cli_capture("list --config " + (dir / "xt.json").string() + " " +
                            schema_manifest,
                        out, err) == 0);
  CHECK(out.find("TestSchema001.") == 0);

  // Command line options override the file.
  CHECK(run_cli_capture("list --config " + (dir / "xt.json").string() +
                            " --label build " + schema_manifest,
                        out, err) == 0);
  CHECK(out.find("TestBuild001.") == 0);

  fs::remove_all(dir);
}

TEST_CASE("unreadable config file exits 2", "[cli]") {
  CHECK(run_cli("list --config /nonexistent/xt.json " + instance_manifest) ==
        2);
}

TEST_CASE("invalid config file exits 3", "[cli]") {
  auto dir = make_tmp_dir("bad_config");
  std::ofstream(dir / "xt.json") << R"({"json": "yes"})";
  std::ofstream(dir / "broken.json") << "{ not json";

  CHECK(run_cli("list --config " + (dir / "broken.json").string() + " " +
                instance_manifest) == 3);
  CHECK(run_cli("list --config " + (dir / "xt.json").string() + " " +
                instance_manifest) == 3);

  fs::remove_all(dir);
}

TEST_CASE("pattern matching no manifest lists nothing", "[cli]") {
  auto dir = make_tmp_dir("missing");
  std::string out, err;
  CHECK(run_cli_capture("list " + (dir / "testfiles").string(), out, err) ==
        0);
  CHECK(out.empty());
  fs::remove_all(dir);
}
