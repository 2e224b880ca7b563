#pragma once

#include <gramc/rule_set.hpp>

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace gramc {

  struct variant_info {
    std::string tag;
    std::optional<std::string> doc;
    bool generated = false; // no explicit `-> name` was written
  };

  // Tree-node type derived from one production rule.
  struct node_type {
    std::string rule;
    std::optional<std::string> doc;
    std::vector<variant_info> variants; // one per top-level alternative
  };

  class variant_table {
  public:
    explicit variant_table(std::vector<node_type> types);

    // In definition order.
    const std::vector<node_type>&
    types() const {
      return types_;
    }

    // nullptr when `rule` is not a production.
    const node_type*
    find(std::string_view rule) const;

    // Throws std::out_of_range.
    const std::string&
    tag(std::string_view rule, std::size_t alternative) const;

  private:
    std::vector<node_type> types_;
    std::unordered_map<std::string, std::size_t> index_;
  };

  // Assign a variant tag to every top-level alternative of every production:
  // the explicit `-> name`, or `<rule>_<n>` with n the 1-based position.
  // Throws grammar_error(duplicate_variant_name) when two alternatives of one
  // rule end up with the same tag.
  variant_table
  tag_variants(const rule_set& rules);

} // namespace gramc
