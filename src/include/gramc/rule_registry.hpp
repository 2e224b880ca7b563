#pragma once

#include <gramc/grammar_model.hpp>
#include <gramc/rule_set.hpp>

#include <cstddef>
#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace gramc {

  namespace detail {
    class meta_parser;
  }

  // Accumulates rules from grammar source text. Definitions sharing a name are
  // merged in source order; the merged rule keeps the definition index of its
  // first occurrence. finalize() closes the registry and hands the rules over
  // to an immutable rule_set.
  class rule_registry {
  public:
    // Parse every rule in `source` and register it. May be called repeatedly;
    // definition indices continue across calls. Throws grammar_error.
    void
    add(std::string_view source);

    // Checks that every referenced symbol is defined. Throws grammar_error,
    // or std::logic_error if called twice.
    std::shared_ptr<const rule_set>
    finalize();

    bool
    finalized() const {
      return finalized_;
    }

  private:
    friend class detail::meta_parser;

    std::size_t
    reserve_index() {
      return next_index_++;
    }

    void
    merge(rule r);

    // Register (or reuse) the synthetic token rule for a literal or character
    // set written inside a production body. Returns its name.
    std::string
    lift(singular pattern, const std::string& text,
         const source_location& location);

    std::vector<rule> rules_;
    std::unordered_map<std::string, std::size_t> by_name_;
    std::size_t next_index_ = 0;
    bool finalized_ = false;
  };

} // namespace gramc
