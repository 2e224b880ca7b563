#include <gramc/grammar_model.hpp>

#include <type_traits>

namespace gramc {

  namespace {

    void
    collect_singular(const singular& s, std::vector<const symbol_ref*>& out) {
      std::visit(
          [&](const auto& node) {
            using T = std::decay_t<decltype(node)>;
            if constexpr (std::is_same_v<T, symbol_ref>) {
              out.push_back(&node);
            } else if constexpr (std::is_same_v<T, nested>) {
              if (!node.body) return;
              for (const auto& choice : node.body->choices)
                collect_refs(choice, out);
            }
          },
          s.data());
    }

  } // namespace

  void
  collect_refs(const concatenation& body,
               std::vector<const symbol_ref*>& out) {
    for (const auto& item : body.items)
      collect_singular(item.inner, out);
  }

  void
  collect_refs(const rule& r, std::vector<const symbol_ref*>& out) {
    for (const auto& alt : r.alternatives)
      collect_refs(alt.body, out);
  }

} // namespace gramc
