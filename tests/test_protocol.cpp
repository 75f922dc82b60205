#include "test_framework.hpp"

#include "shellgate/hooks/protocol.hpp"
#include "tests/helpers/test_helpers.hpp"

void register_protocol_tests(std::vector<shellgate::tests::TestCase> &tests) {
  using shellgate::tests::require;
  namespace hooks = shellgate::hooks;
  namespace sec = shellgate::security;
  using shellgate::testing::describe;

  tests.push_back({"protocol_parse_request", [] {
                     auto request = hooks::parse_hook_request(
                         R"({"tool_name":"Bash","tool_input":{"command":"ls -la","timeout":5},)"
                         R"("context":{"project_dir":"/work/app"}})");
                     require(request.ok(), request.ok() ? "" : request.error());
                     require(request.value().tool_name == "Bash", "tool");
                     require(request.value().input_string("command").value_or("") == "ls -la",
                             "command");
                     require(!request.value().input_string("timeout").has_value(),
                             "number is not a string");
                     require(request.value().project_dir.value_or("") == "/work/app", "project");
                   }});

  tests.push_back({"protocol_decodes_escapes_in_command", [] {
                     auto request = hooks::parse_hook_request(
                         R"({"tool_name":"Bash","tool_input":{"command":"echo $(id)\nrm \"x\""}})");
                     require(request.ok(), request.ok() ? "" : request.error());
                     require(request.value().input_string("command").value_or("") ==
                                 "echo $(id)\nrm \"x\"",
                             "escapes decoded before evaluation");
                     require(!request.value().project_dir.has_value(), "no context");
                   }});

  tests.push_back({"protocol_optional_members", [] {
                     auto request = hooks::parse_hook_request(
                         R"({"tool_name":"Read","tool_input":null,"context":{"project_dir":null}})");
                     require(request.ok(), request.ok() ? "" : request.error());
                     require(request.value().tool_input.empty(), "null input");
                     require(!request.value().project_dir.has_value(), "null project");
                   }});

  tests.push_back({"protocol_rejects_malformed_requests", [] {
                     for (const std::string json :
                          {"", "not json", "[1,2]", R"({"tool_input":{}})",
                           R"({"tool_name":42})", R"({"tool_name":"Bash","tool_input":"ls"})",
                           R"({"tool_name":"Bash","context":[]})",
                           R"({"tool_name":"Bash","context":{"project_dir":7}})",
                           R"({"tool_name":"Bash","tool_input":{"command":"ls"})"}) {
                       auto request = hooks::parse_hook_request(json);
                       require(!request.ok(), "accepted malformed request: " + json);
                       require(request.error().rfind("malformed hook request: ", 0) == 0,
                               request.error());
                     }
                   }});

  tests.push_back({"protocol_encode_responses", [] {
                     require(hooks::encode_hook_response(sec::Decision::allow()) == "{}", "allow");
                     const auto block = sec::Decision::block(
                         sec::BlockKind::UnknownCommand, sec::Stage::Allowlist,
                         "Command 'x' is \"bad\"\nCommand: x");
                     require(hooks::encode_hook_response(block) ==
                                 R"({"decision":"block","reason":"Command 'x' is \"bad\"\nCommand: x"})",
                             hooks::encode_hook_response(block));
                     const std::string report = hooks::encode_decision_report(block, "x");
                     require(report == R"({"allowed":false,"kind":"unknown_command",)"
                                       R"("stage":"allowlist","reason":"Command 'x' is \"bad\"\nCommand: x",)"
                                       R"("command":"x"})",
                             report);
                     require(hooks::encode_decision_report(sec::Decision::allow(), "ls") ==
                                 R"({"allowed":true,"kind":"none","stage":"complete","reason":"",)"
                                 R"("command":"ls"})",
                             "allow report");
                   }});

  tests.push_back({"protocol_handle_routes_by_tool", [] {
                     const sec::BashSecurityHook bash;
                     const sec::FileToolHook files;

                     auto blocked = hooks::handle_hook_json(
                         R"({"tool_name":"Bash","tool_input":{"command":"wget x"}})", &bash,
                         &files);
                     require(!blocked.decision.allowed, describe(blocked.decision));
                     require(blocked.response.find("\"decision\":\"block\"") != std::string::npos,
                             blocked.response);
                     require(blocked.request.has_value(), "request kept");

                     auto other = hooks::handle_hook_json(
                         R"({"tool_name":"WebFetch","tool_input":{"url":"https://x"}})", &bash,
                         &files);
                     require(other.decision.allowed && other.response == "{}", "unhandled tool");

                     auto without_files = hooks::handle_hook_json(
                         R"({"tool_name":"Read","tool_input":{"file_path":"/etc/shadow"},)"
                         R"("context":{"project_dir":"/"}})",
                         &bash);
                     require(without_files.decision.allowed, "file hook not installed");

                     auto without_bash = hooks::handle_hook_json(
                         R"({"tool_name":"Bash","tool_input":{"command":"wget x"}})", nullptr,
                         &files);
                     require(without_bash.decision.allowed, "bash hook not installed");
                   }});

  tests.push_back({"protocol_handle_malformed_blocks", [] {
                     const sec::BashSecurityHook bash;
                     auto exchange = hooks::handle_hook_json("{\"tool_name\":", &bash);
                     require(!exchange.decision.allowed &&
                                 exchange.decision.kind == sec::BlockKind::ParseError,
                             describe(exchange.decision));
                     require(!exchange.request.has_value(), "no request on parse failure");
                     require(exchange.response.rfind("{\"decision\":\"block\"", 0) == 0,
                             exchange.response);
                   }});

  tests.push_back({"protocol_handle_fallback_project", [] {
                     shellgate::testing::TempWorkspace ws;
                     const sec::BashSecurityHook bash;
                     const std::string json =
                         R"({"tool_name":"Bash","tool_input":{"command":"cat /etc/hosts"}})";
                     require(hooks::handle_hook_json(json, &bash).decision.allowed,
                             "no project, no path check");
                     auto confined = hooks::handle_hook_json(json, &bash, nullptr, ws.str());
                     require(confined.decision.kind == sec::BlockKind::PathEscape,
                             describe(confined.decision));
                     require(confined.request->project_dir.value_or("") == ws.str(),
                             "fallback recorded on the request");
                   }});
}
