#include "test_framework.hpp"

#include "hermit/common/fs.hpp"
#include "hermit/common/json_util.hpp"
#include "hermit/common/random.hpp"
#include "hermit/common/time.hpp"
#include "hermit/common/toml.hpp"
#include "tests/helpers/test_helpers.hpp"

#include <fstream>

void register_common_tests(std::vector<hermit::tests::TestCase> &tests) {
  using hermit::tests::require;
  namespace common = hermit::common;

  tests.push_back({"common_trim_and_lower", [] {
                     require(common::trim("  a b \n") == "a b", "trim mismatch");
                     require(common::trim("   ").empty(), "blank should trim to empty");
                     require(common::to_lower("MiXeD") == "mixed", "lower mismatch");
                     require(common::starts_with("once:+5m", "once:"), "prefix expected");
                   }});

  tests.push_back({"common_is_subpath_is_lexical", [] {
                     require(common::is_subpath("/a/b/c", "/a/b"), "child should be inside");
                     require(common::is_subpath("/a/b", "/a/b"), "equal path counts as inside");
                     require(!common::is_subpath("/a/bc", "/a/b"), "sibling prefix is outside");
                     require(!common::is_subpath("/a/b/../c", "/a/b"),
                             "dot-dot must be normalized away");
                   }});

  tests.push_back({"common_write_file_atomic_replaces_content", [] {
                     hermit::testing::TempWorkspace ws;
                     const auto path = ws.path() / "nested" / "file.txt";
                     require(common::write_file_atomic(path, "one").ok(), "first write failed");
                     require(common::write_file_atomic(path, "two").ok(), "second write failed");
                     auto content = common::read_file(path);
                     require(content.ok(), content.error());
                     require(content.value() == "two", "content should be replaced");
                     require(!std::filesystem::exists(path.string() + ".tmp"),
                             "temporary file should be gone");
                   }});

  tests.push_back({"common_append_line_accumulates", [] {
                     hermit::testing::TempWorkspace ws;
                     const auto path = ws.path() / "log.jsonl";
                     require(common::append_line(path, "a").ok(), "append failed");
                     require(common::append_line(path, "b").ok(), "append failed");
                     auto content = common::read_file(path);
                     require(content.ok() && content.value() == "a\nb\n", "lines mismatch");
                   }});

  tests.push_back({"common_json_escape_roundtrip_unicode", [] {
                     const std::string raw = "line\n\"quoted\" \\ tab\t caf\xC3\xA9";
                     const auto quoted = common::json_quote(raw);
                     require(quoted.find('\n') == std::string::npos, "newline must be escaped");
                     require(common::json_unescape(quoted.substr(1, quoted.size() - 2)) == raw,
                             "unescape should restore the original");
                     require(common::json_unescape("\\u00e9") == "\xC3\xA9",
                             "\\u escape should decode to UTF-8");
                   }});

  tests.push_back({"common_json_parse_flat_keeps_nested_raw", [] {
                     const auto fields = common::json_parse_flat(
                         R"({"cmd":"send","n":3,"ok":true,"obj":{"a":[1,2]},"s":"x\"y"})");
                     require(fields.at("cmd") == "send", "string value mismatch");
                     require(fields.at("n") == "3", "number kept raw");
                     require(fields.at("ok") == "true", "literal kept raw");
                     require(fields.at("obj") == R"({"a":[1,2]})", "object kept raw");
                     require(fields.at("s") == "x\"y", "string should be unescaped");
                   }});

  tests.push_back({"common_json_null_members_are_absent", [] {
                     const std::string json = R"({"a":null,"b":"null","c":7,"d":"s"})";
                     const auto fields = common::json_parse_flat(json);
                     require(!fields.contains("a"), "null literal is left out");
                     require(fields.at("b") == "null", "the string null is kept");
                     require(fields.at("c") == "7", "number kept raw");

                     const auto strings = common::json_parse_string_members(json);
                     require(strings.size() == 2 && strings.at("b") == "null" &&
                                 strings.at("d") == "s",
                             "only string members");
                   }});

  tests.push_back({"common_json_is_object_rejects_garbage", [] {
                     require(common::json_is_object(" {\"a\":\"}\"} "), "valid object");
                     require(!common::json_is_object("{\"a\":1"), "unterminated object");
                     require(!common::json_is_object("[]"), "array is not an object");
                     require(!common::json_is_object("{} trailing"), "trailing text");
                   }});

  tests.push_back({"common_json_split_array", [] {
                     const auto objects =
                         common::json_split_top_level_objects(R"([{"a":1}, {"b":{"c":2}}])");
                     require(objects.size() == 2, "expected two objects");
                     require(objects[1] == R"({"b":{"c":2}})", "nested object mismatch");
                     const auto strings = common::json_string_array(R"(["x","y\"z"])");
                     require(strings.size() == 2 && strings[1] == "y\"z", "string array mismatch");
                   }});

  tests.push_back({"common_toml_sections_and_arrays", [] {
                     auto parsed = common::parse_toml(R"(
# comment
[daemon]
scheduler_poll_secs = 15 # trailing
interactive_busy_policy = "reject"

[agent]
args = ["-p", "--output-format", "json"]
prompt_via_stdin = false

[tools.gh]
token = "abc"
)");
                     require(parsed.ok(), parsed.error());
                     const auto &doc = parsed.value();
                     require(doc.get_u64("daemon.scheduler_poll_secs", 0) == 15, "u64 mismatch");
                     require(doc.get_string("daemon.interactive_busy_policy") == "reject",
                             "string mismatch");
                     require(doc.get_string_array("agent.args").size() == 3, "array mismatch");
                     require(!doc.get_bool("agent.prompt_via_stdin", true), "bool mismatch");
                     const auto tools = doc.subsections("tools");
                     require(tools.size() == 1 && tools[0] == "gh", "subsection mismatch");
                   }});

  tests.push_back({"common_toml_rejects_bare_line", [] {
                     auto parsed = common::parse_toml("[daemon]\nnot a pair\n");
                     require(!parsed.ok(), "line without '=' should fail");
                   }});

  tests.push_back({"common_time_rfc3339_and_local_parse", [] {
                     require(common::to_rfc3339(common::from_unix_seconds(0)) ==
                                 "1970-01-01T00:00:00Z",
                             "epoch rendering mismatch");
                     auto with_t = common::parse_local_datetime("2031-05-06T07:08");
                     auto with_space = common::parse_local_datetime("2031-05-06 07:08:00");
                     require(with_t.ok() && with_space.ok(), "both forms should parse");
                     require(with_t.value() == with_space.value(), "forms should agree");
                     require(common::format_local(with_t.value()) == "2031-05-06 07:08",
                             "local format mismatch");
                     require(!common::parse_local_datetime("tomorrow").ok(), "garbage rejected");
                   }});

  tests.push_back({"common_random_hex_length", [] {
                     auto first = common::random_hex(4);
                     auto second = common::random_hex(4);
                     require(first.ok() && second.ok(), "random_hex failed");
                     require(first.value().size() == 8, "4 bytes should be 8 hex chars");
                     require(first.value().find_first_not_of("0123456789abcdef") ==
                                 std::string::npos,
                             "lowercase hex expected");
                   }});
}
