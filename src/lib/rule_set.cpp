#include <gramc/rule_set.hpp>

#include <algorithm>
#include <stdexcept>

namespace gramc {

  rule_set::rule_set(std::vector<rule> rules) : rules_(std::move(rules)) {
    std::stable_sort(rules_.begin(), rules_.end(),
                     [](const rule& a, const rule& b) {
                       return a.first_definition_index <
                              b.first_definition_index;
                     });
    for (std::size_t i = 0; i < rules_.size(); ++i) {
      if (!index_.emplace(rules_[i].name, i).second)
        throw std::invalid_argument("duplicate rule name: " + rules_[i].name);
    }
  }

  const rule*
  rule_set::find(std::string_view name) const {
    auto it = index_.find(std::string(name));
    if (it == index_.end()) return nullptr;
    return &rules_[it->second];
  }

  const rule&
  rule_set::at(std::string_view name) const {
    return rules_[index_of(name)];
  }

  std::size_t
  rule_set::index_of(std::string_view name) const {
    auto it = index_.find(std::string(name));
    if (it == index_.end())
      throw std::out_of_range("unknown rule: " + std::string(name));
    return it->second;
  }

  const rule*
  rule_set::whitespace() const {
    for (const auto& r : rules_)
      if (r.kind == rule_kind::whitespace) return &r;
    return nullptr;
  }

  const rule*
  rule_set::first_production() const {
    for (const auto& r : rules_)
      if (r.kind == rule_kind::production) return &r;
    return nullptr;
  }

} // namespace gramc
