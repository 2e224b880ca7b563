#pragma once

#include <gramc/ast.hpp>
#include <gramc/rule_set.hpp>
#include <gramc/token.hpp>

#include <ostream>
#include <string>

namespace gramc {

  // Compact JSON for debugging and golden tests:
  //   {"rule":"r","variant":"r_1","span":[0,3],"children":[...]}
  //   {"token":"t","text":"abc","span":[0,3]}
  void
  write_json(std::ostream& out, const ast_node& node);

  void
  write_json(std::ostream& out, const token& tok);

  std::string
  to_json(const ast_node& node);

  std::string
  to_json(const token& tok);

  // The merged rules printed back in meta-grammar form, one rule per line,
  // in definition order. Synthetic token rules are not printed; they appear
  // inline where they were written.
  std::string
  describe(const rule_set& rules);

} // namespace gramc
