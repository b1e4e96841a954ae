#include "common/assertions.hpp"
#include "common/cli_dispatch.hpp"
#include "common/temp_dir.hpp"

#include <filesystem>
#include <iostream>

int main() {
  using camkit::tests::common::AssertContains;
  using camkit::tests::common::CliResult;
  using camkit::tests::common::DispatchCaptured;
  using camkit::tests::common::AssertNotContains;
  using camkit::tests::common::Fail;
  using camkit::tests::common::WriteFileOrFail;

  const camkit::tests::common::ScopedTempDir temp("camkit-cli-constraints-smoke");

  const std::filesystem::path vga = temp.path() / "vga.json";
  WriteFileOrFail(vga, R"({"constraints":{"width":640,"height":480}})");
  CliResult result = DispatchCaptured({"camkit", "constraints", vga.string()});
  if (result.exit_code != 0) {
    Fail("constraints should succeed for a valid config: " + result.err);
  }
  AssertContains(result.out,
                 R"({"audio":false,"video":{"height":{"ideal":480},"width":{"ideal":640}}})");

  const std::filesystem::path empty = temp.path() / "empty.json";
  WriteFileOrFail(empty, "{}");
  result = DispatchCaptured({"camkit", "constraints", empty.string()});
  if (result.exit_code != 0) {
    Fail("constraints should succeed for an empty config: " + result.err);
  }
  AssertContains(result.out, R"({"audio":false,"video":true})");

  const std::filesystem::path exact = temp.path() / "exact.json";
  WriteFileOrFail(exact, R"({"constraints":{"facing_mode":"environment","facing_mode_exact":true,
                             "group_id":"g1","group_id_exact":true}})");
  result = DispatchCaptured({"camkit", "constraints", exact.string()});
  if (result.exit_code != 0) {
    Fail("constraints should succeed for exact directives: " + result.err);
  }
  AssertContains(result.out, R"("facingMode":{"exact":"environment"})");
  AssertContains(result.out, R"("groupId":{"exact":"g1"})");
  AssertNotContains(result.out, "ideal");

  const std::filesystem::path quoted = temp.path() / "quoted.json";
  WriteFileOrFail(quoted, R"({"constraints":{"device_id":"a\"b"}})");
  result = DispatchCaptured({"camkit", "constraints", quoted.string()});
  if (result.exit_code != 10) {
    Fail("device id that breaks the request should exit 10");
  }
  AssertContains(result.err, "MediaStreamConstraints");
  if (!result.out.empty()) {
    Fail("a rejected request should print nothing on stdout");
  }

  const std::filesystem::path typo = temp.path() / "typo.json";
  WriteFileOrFail(typo, R"({"constraints":{"widht":640}})");
  result = DispatchCaptured({"camkit", "constraints", typo.string()});
  if (result.exit_code != 10) {
    Fail("unknown config field should exit 10");
  }
  AssertContains(result.err, "unknown config field 'constraints.widht'");

  result = DispatchCaptured({"camkit", "constraints", (temp.path() / "none.json").string()});
  if (result.exit_code != 10) {
    Fail("missing config file should exit 10");
  }
  AssertContains(result.err, "unable to read capture config file");

  result = DispatchCaptured({"camkit", "constraints"});
  if (result.exit_code != 2) {
    Fail("constraints without a path should be a usage error");
  }
  AssertContains(result.err, "requires exactly 1 argument");

  std::cout << "cli_constraints_smoke: ok\n";
  return 0;
}
