#include <gramc/variant_tagger.hpp>

#include <gramc/error.hpp>

#include <stdexcept>
#include <unordered_map>

namespace gramc {

  variant_table::variant_table(std::vector<node_type> types)
      : types_(std::move(types)) {
    for (std::size_t i = 0; i < types_.size(); ++i)
      index_.emplace(types_[i].rule, i);
  }

  const node_type*
  variant_table::find(std::string_view rule) const {
    auto it = index_.find(std::string(rule));
    if (it == index_.end()) return nullptr;
    return &types_[it->second];
  }

  const std::string&
  variant_table::tag(std::string_view rule, std::size_t alternative) const {
    const auto* type = find(rule);
    if (!type)
      throw std::out_of_range("no node type for rule: " + std::string(rule));
    return type->variants.at(alternative).tag;
  }

  variant_table
  tag_variants(const rule_set& rules) {
    std::vector<node_type> types;

    for (const auto& r : rules.rules()) {
      if (r.kind != rule_kind::production) continue;

      node_type type;
      type.rule = r.name;
      type.doc = r.doc;

      // Explicit names are claimed first so that a generated tag colliding
      // with a later explicit one is still caught.
      std::unordered_map<std::string, std::size_t> claimed;
      for (std::size_t i = 0; i < r.alternatives.size(); ++i) {
        const auto& alt = r.alternatives[i];
        if (!alt.name) continue;
        auto [it, inserted] = claimed.emplace(*alt.name, i);
        if (!inserted)
          throw grammar_error(grammar_errc::duplicate_variant_name,
                              "alternative name '" + *alt.name +
                                  "' is used more than once",
                              r.name, alt.location);
      }

      for (std::size_t i = 0; i < r.alternatives.size(); ++i) {
        const auto& alt = r.alternatives[i];
        variant_info info;
        info.doc = alt.doc;
        if (alt.name) {
          info.tag = *alt.name;
        } else {
          info.tag = r.name + "_" + std::to_string(i + 1);
          info.generated = true;
          if (claimed.count(info.tag))
            throw grammar_error(grammar_errc::duplicate_variant_name,
                                "generated name '" + info.tag +
                                    "' for alternative " +
                                    std::to_string(i + 1) +
                                    " collides with an explicit name",
                                r.name, alt.location);
        }
        type.variants.push_back(std::move(info));
      }

      types.push_back(std::move(type));
    }

    return variant_table(std::move(types));
  }

} // namespace gramc
