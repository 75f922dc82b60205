#include "test_framework.hpp"

#include "shellgate/shell/substitution.hpp"

namespace {

std::vector<shellgate::shell::Substitution> find_all(const std::string &text) {
  auto found = shellgate::shell::find_substitutions(text);
  shellgate::tests::require(found.ok(), "find_substitutions failed for: " + text);
  return found.value();
}

} // namespace

void register_substitution_tests(std::vector<shellgate::tests::TestCase> &tests) {
  using shellgate::tests::require;
  namespace sh = shellgate::shell;

  tests.push_back({"substitution_command_forms", [] {
                     const auto found = find_all("echo $(whoami) `date` <(ls) >(wc -l)");
                     require(found.size() == 4, "four substitutions");
                     require(found[0].kind == sh::SubstitutionKind::Command &&
                                 found[0].body == "whoami",
                             "dollar paren");
                     require(found[0].offset == 5, "offset of the opener");
                     require(found[1].kind == sh::SubstitutionKind::Backtick &&
                                 found[1].body == "date",
                             "backtick");
                     require(found[2].kind == sh::SubstitutionKind::ProcessInput &&
                                 found[2].body == "ls",
                             "process input");
                     require(found[3].kind == sh::SubstitutionKind::ProcessOutput &&
                                 found[3].body == "wc -l",
                             "process output");
                   }});

  tests.push_back({"substitution_outermost_only", [] {
                     const auto found = find_all("echo $(cat $(ls `pwd`))");
                     require(found.size() == 1, "nested forms stay in the body");
                     require(found[0].body == "cat $(ls `pwd`)", "body text");
                   }});

  tests.push_back({"substitution_arithmetic", [] {
                     const auto plain = find_all("echo $((1 + 2))");
                     require(plain.size() == 1 && plain[0].kind == sh::SubstitutionKind::Arithmetic,
                             "arithmetic");
                     require(plain[0].body == "1 + 2", "arithmetic body");

                     const auto subshell = find_all("echo $( (ls) )");
                     require(subshell.size() == 1 &&
                                 subshell[0].kind == sh::SubstitutionKind::Command,
                             "subshell inside a substitution");

                     const auto grouped = find_all("echo $((ls) && (pwd))");
                     require(grouped.size() == 1 &&
                                 grouped[0].kind == sh::SubstitutionKind::Command,
                             "two groups are not arithmetic");
                   }});

  tests.push_back({"substitution_ignores_quote_context", [] {
                     const auto single = find_all("echo '$(rm -rf /)'");
                     require(single.size() == 1 && single[0].body == "rm -rf /",
                             "single quotes still report the body");
                     const auto dbl = find_all("echo \"$(curl x)\"");
                     require(dbl.size() == 1 && dbl[0].body == "curl x", "double quotes");
                   }});

  tests.push_back({"substitution_escaped_openers", [] {
                     require(find_all("echo \\$(ls) \\`pwd\\`").empty(), "escaped openers");
                     require(find_all("echo $HOME ${PATH}").empty(), "parameter expansion");
                   }});

  tests.push_back({"substitution_backtick_unescaping", [] {
                     const auto found = find_all("echo `echo \\`id\\``");
                     require(found.size() == 1, "one outer backtick");
                     require(found[0].body == "echo `id`", "inner backticks unescaped");
                   }});

  tests.push_back({"substitution_parens_inside_quotes", [] {
                     const auto found = find_all("echo $(echo ')' \"(\")");
                     require(found.size() == 1, "quoted parens do not close");
                     require(found[0].body == "echo ')' \"(\"", "body");
                   }});

  tests.push_back({"substitution_unterminated_fails", [] {
                     require(!sh::find_substitutions("echo $(ls").ok(), "dollar paren");
                     require(!sh::find_substitutions("echo `ls").ok(), "backtick");
                     require(!sh::find_substitutions("diff <(ls").ok(), "process");
                   }});

  tests.push_back({"substitution_kind_names", [] {
                     require(std::string(sh::substitution_kind_name(
                                 sh::SubstitutionKind::ProcessInput)) == "process-input",
                             "kind name");
                   }});
}
