#include <gramc/compiled_grammar.hpp>

#include <gramc/rule_registry.hpp>

#include <iostream>
#include <unordered_set>

namespace gramc {

  namespace {

    void
    warn_to_stderr(const std::string& message) {
      std::cerr << "gramc: warning: " << message << "\n";
    }

    // Productions not reachable from the first production, in definition
    // order.
    std::vector<std::string>
    unreachable_productions(const rule_set& rules) {
      std::vector<std::string> result;
      const auto* start = rules.first_production();
      if (!start) return result;

      std::unordered_set<std::string> seen{start->name};
      std::vector<const rule*> work{start};
      while (!work.empty()) {
        const auto* r = work.back();
        work.pop_back();
        std::vector<const symbol_ref*> refs;
        collect_refs(*r, refs);
        for (const auto* ref : refs) {
          const auto& target = rules.at(ref->name);
          if (target.kind != rule_kind::production) continue;
          if (seen.insert(target.name).second) work.push_back(&target);
        }
      }

      for (const auto& r : rules.rules())
        if (r.kind == rule_kind::production && !seen.count(r.name))
          result.push_back(r.name);
      return result;
    }

  } // namespace

  compiled_grammar
  compile_grammar(std::string_view source, const compile_options& options) {
    rule_registry registry;
    registry.add(source);
    auto rules = registry.finalize();

    auto alphabet =
        std::make_shared<const token_table>(resolve_fragments(*rules));
    auto variants = std::make_shared<const variant_table>(tag_variants(*rules));
    auto automaton = std::make_shared<const token_automaton>(*rules);

    if (options.warnings) {
      const diagnostic_fn& warn =
          options.on_warning ? options.on_warning : diagnostic_fn(warn_to_stderr);
      for (const auto& name : alphabet->unused_fragments())
        warn("token fragment '" + name + "' is never used");
      for (const auto& name : unreachable_productions(*rules))
        warn("production '" + name + "' is unreachable from '" +
             rules->first_production()->name + "'");
    }

    tokenizer lexer(rules, alphabet, automaton);
    parser syntax(rules, variants, automaton, options.parse_defaults);
    return compiled_grammar{std::move(rules),     std::move(alphabet),
                            std::move(variants),  std::move(automaton),
                            std::move(lexer),     std::move(syntax)};
  }

} // namespace gramc
