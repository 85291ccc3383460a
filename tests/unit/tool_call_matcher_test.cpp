#include "internal/replay/tool_call_matcher.hpp"

#include <cassert>
#include <iostream>
#include <string>

#include "internal/util/json.hpp"

namespace {

using flightrec::replay::ToolCallMatcher;

google::protobuf::Value ParseValue(const std::string& json) {
  google::protobuf::Value value;
  flightrec::util::FromJson(json, &value);
  return value;
}

void TestFindsOpenAiAndAnthropicShapes() {
  ToolCallMatcher matcher;
  const auto      data = ParseValue(R"({
    "choices": [{"message": {"tool_calls": [
      {"id": "call_1", "type": "function", "function": {"name": "get_weather", "arguments": "{\"city\":\"Paris\"}"}}
    ]}}],
    "toolCalls": [{"name": "search", "args": {"q": "c++"}}]
  })");

  const auto calls = matcher.FindToolCalls(data, "rec-1");
  assert(calls.size() == 2);

  bool saw_weather = false;
  bool saw_search  = false;
  for (const auto& call : calls) {
    if (call.name() == "get_weather") {
      saw_weather = true;
      assert(call.id() == "call_1");
      assert(call.type() == "function");
      assert(call.args().string_value() == "{\"city\":\"Paris\"}");
    } else if (call.name() == "search") {
      saw_search = true;
      assert(call.id().rfind("tool-rec-1-", 0) == 0);
      assert(call.type() == "function");
      assert(flightrec::util::FindField(call.args(), "q")->string_value() == "c++");
    }
  }
  assert(saw_weather && saw_search);
}

void TestGeneratedIdsAreStable() {
  ToolCallMatcher matcher;
  const auto      data = ParseValue(R"({"b": {"tools": [{"name": "x"}]}, "a": {"tools": [{"name": "y"}]}})");

  const auto first  = matcher.FindToolCalls(data, "rec-9");
  const auto second = matcher.FindToolCalls(data, "rec-9");
  assert(first.size() == 2 && second.size() == 2);
  for (int i = 0; i < 2; ++i) {
    assert(first[i].id() == second[i].id());
    assert(first[i].name() == second[i].name());
  }
  assert(first[0].id() != first[1].id());
}

void TestIgnoresEntriesWithoutName() {
  ToolCallMatcher matcher;
  const auto      data = ParseValue(R"({"tool_calls": [{"id": "x"}, {"function": {"arguments": "{}"}}, "text", {"name": "ok", "parameters": [1]}]})");

  const auto calls = matcher.FindToolCalls(data, "r");
  assert(calls.size() == 1);
  assert(calls[0].name() == "ok");
  assert(calls[0].args().list_value().values_size() == 1);
}

void TestNoCallsInScalarsOrPlainObjects() {
  ToolCallMatcher matcher;
  assert(matcher.FindToolCalls(ParseValue(R"("tool_calls")"), "r").empty());
  assert(matcher.FindToolCalls(ParseValue(R"({"tool_calls": {"name": "not-a-list"}})"), "r").empty());
  assert(matcher.FindToolCalls(google::protobuf::Value{}, "r").empty());
}

void TestFindToolResults() {
  ToolCallMatcher matcher;
  const auto      data = ParseValue(R"({
    "tool_results": [{"tool_call_id": "call_1", "content": "sunny"}],
    "nested": {"results": [{"id": "call_2", "content": "42"}]}
  })");

  const auto top = matcher.FindToolResults(data, /*recursive=*/false);
  assert(top.size() == 1);
  assert(ToolCallMatcher::ResultCallId(top[0]) == "call_1");

  const auto all = matcher.FindToolResults(data, /*recursive=*/true);
  assert(all.size() == 2);
}

void TestConfiguredFieldNames() {
  ToolCallMatcher matcher({"invocations"}, {"outcomes"});
  const auto      data = ParseValue(R"({"invocations": [{"name": "a"}], "tool_calls": [{"name": "b"}], "outcomes": [{"name": "a"}]})");

  const auto calls = matcher.FindToolCalls(data, "r");
  assert(calls.size() == 1 && calls[0].name() == "a");
  assert(matcher.FindToolResults(data, false).size() == 1);
  assert(ToolCallMatcher::ResultName(matcher.FindToolResults(data, false)[0]) == "a");

  ToolCallMatcher defaults;
  assert(defaults.ToolCallFields() == ToolCallMatcher::DefaultToolCallFields());
  assert(defaults.ToolResultFields().size() == 4);
}

} // namespace

int main() {
  TestFindsOpenAiAndAnthropicShapes();
  TestGeneratedIdsAreStable();
  TestIgnoresEntriesWithoutName();
  TestNoCallsInScalarsOrPlainObjects();
  TestFindToolResults();
  TestConfiguredFieldNames();

  std::cout << "flightrec_unit_tool_call_matcher: pass\n";
  return 0;
}
