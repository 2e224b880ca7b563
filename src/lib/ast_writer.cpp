#include <gramc/ast_writer.hpp>

#include <nlohmann/json.hpp>

#include <sstream>
#include <type_traits>
#include <variant>

namespace gramc {

  namespace {

    using json = nlohmann::ordered_json;

    json
    span_json(const source_span& span) {
      return json::array({span.begin, span.end});
    }

    json
    token_json(const token& tok) {
      json j;
      j["token"] = tok.rule;
      j["text"] = tok.text;
      j["span"] = span_json(tok.span);
      return j;
    }

    json
    node_json(const ast_node& node) {
      json j;
      j["rule"] = node.rule;
      j["variant"] = node.variant;
      j["span"] = span_json(node.span);
      auto children = json::array();
      for (const auto& child : node.children)
        children.push_back(child.is_token() ? token_json(child.as_token())
                                            : node_json(child.as_node()));
      j["children"] = std::move(children);
      return j;
    }

    // -- describe -------------------------------------------------------------

    void
    print(std::ostream& out, const concatenation& body);

    void
    print(std::ostream& out, const singular& s) {
      std::visit(
          [&](const auto& node) {
            using T = std::decay_t<decltype(node)>;
            if constexpr (std::is_same_v<T, nested>) {
              out << "(";
              for (std::size_t i = 0; i < node.body->choices.size(); ++i) {
                if (i > 0) out << " |";
                out << " ";
                print(out, node.body->choices[i]);
              }
              out << " )";
            } else if constexpr (std::is_same_v<T, symbol_ref>) {
              out << node.name;
            } else {
              out << node.text;
            }
          },
          s.data());
    }

    void
    print(std::ostream& out, const concatenation& body) {
      for (std::size_t i = 0; i < body.items.size(); ++i) {
        if (i > 0) out << " ";
        const auto& item = body.items[i];
        print(out, item.inner);
        switch (item.quantity) {
          case quantifier::one:
            break;
          case quantifier::maybe:
            out << "?";
            break;
          case quantifier::any:
            out << "*";
            break;
          case quantifier::many:
            out << "+";
            break;
        }
      }
    }

  } // namespace

  void
  write_json(std::ostream& out, const token& tok) {
    out << token_json(tok).dump();
  }

  void
  write_json(std::ostream& out, const ast_node& node) {
    out << node_json(node).dump();
  }

  std::string
  to_json(const ast_node& node) {
    return node_json(node).dump();
  }

  std::string
  to_json(const token& tok) {
    return token_json(tok).dump();
  }

  std::string
  describe(const rule_set& rules) {
    std::ostringstream out;
    for (const auto& r : rules.rules()) {
      if (r.synthetic) continue;
      if (r.doc) out << "/** " << *r.doc << " */\n";
      out << r.name << (r.kind == rule_kind::production ? " ::=" : " :==");
      for (std::size_t i = 0; i < r.alternatives.size(); ++i) {
        const auto& alt = r.alternatives[i];
        if (i > 0) out << " |";
        out << " ";
        print(out, alt.body);
        if (alt.name) out << " -> " << *alt.name;
      }
      out << " ;\n";
    }
    return out.str();
  }

} // namespace gramc
