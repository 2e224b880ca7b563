#include <gramc/error.hpp>

#include <utility>

namespace gramc {

  namespace {

    std::string
    grammar_message(grammar_errc kind, const std::string& detail,
                    const std::string& rule_name,
                    const source_location& location) {
      std::string msg = "grammar error (";
      msg += to_string(kind);
      msg += ")";
      if (location.offset != 0 || location.line != 1 || location.column != 1)
        msg += " at " + location.to_string();
      if (!rule_name.empty()) msg += " in rule '" + rule_name + "'";
      return msg + ": " + detail;
    }

    std::string
    parse_message(parse_errc kind, const source_location& location,
                  const std::string& rule_name,
                  const std::vector<std::string>& tried) {
      std::string msg = "parse error at " + location.to_string() + ": ";
      switch (kind) {
        case parse_errc::no_alternative_matched:
          msg += "no alternative matched";
          if (!tried.empty()) {
            msg += ", expected one of:";
            for (const auto& name : tried)
              msg += " " + name;
          }
          break;
        case parse_errc::no_progress:
          msg += "rule '" + rule_name +
                 "' re-entered without consuming input (left recursion)";
          break;
        case parse_errc::depth_exceeded:
          msg += "nesting limit exceeded in rule '" + rule_name + "'";
          break;
      }
      return msg;
    }

    std::string
    lex_message(const source_location& location,
                const std::vector<std::string>& tried) {
      std::string msg =
          "lex error at " + location.to_string() + ": unrecognized character";
      if (!tried.empty()) {
        msg += ", tried:";
        for (const auto& name : tried)
          msg += " " + name;
      }
      return msg;
    }

  } // namespace

  std::string_view
  to_string(grammar_errc kind) {
    switch (kind) {
      case grammar_errc::syntax:
        return "syntax";
      case grammar_errc::conflicting_kind:
        return "conflicting kind";
      case grammar_errc::empty_literal:
        return "empty literal";
      case grammar_errc::invalid_escape:
        return "invalid escape";
      case grammar_errc::recursive_token:
        return "recursive token";
      case grammar_errc::duplicate_variant_name:
        return "duplicate variant name";
      case grammar_errc::undefined_symbol:
        return "undefined symbol";
      case grammar_errc::invalid_token_reference:
        return "invalid token reference";
    }
    return "unknown";
  }

  std::string_view
  to_string(parse_errc kind) {
    switch (kind) {
      case parse_errc::no_alternative_matched:
        return "no alternative matched";
      case parse_errc::no_progress:
        return "no progress";
      case parse_errc::depth_exceeded:
        return "depth exceeded";
    }
    return "unknown";
  }

  grammar_error::grammar_error(grammar_errc kind, std::string detail,
                               std::string rule_name,
                               source_location location)
      : std::runtime_error(
            grammar_message(kind, detail, rule_name, location)),
        kind_(kind), detail_(std::move(detail)),
        rule_name_(std::move(rule_name)), location_(location) {}

  grammar_error
  grammar_error::rebase(std::string rule_name,
                        source_location location) const {
    return grammar_error(kind_, detail_, std::move(rule_name), location);
  }

  lex_error::lex_error(source_location location,
                       std::vector<std::string> tried_rules)
      : std::runtime_error(lex_message(location, tried_rules)),
        location_(location), tried_rules_(std::move(tried_rules)) {}

  parse_error::parse_error(parse_errc kind, source_location location,
                           std::string rule_name,
                           std::vector<std::string> tried_rules)
      : std::runtime_error(
            parse_message(kind, location, rule_name, tried_rules)),
        kind_(kind), location_(location), rule_name_(std::move(rule_name)),
        tried_rules_(std::move(tried_rules)) {}

} // namespace gramc
