#pragma once

#include <gramc/source_location.hpp>
#include <gramc/token.hpp>

#include <memory>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace gramc {

  struct ast_node;

  // A child of a parse node: a token leaf or a nested node.
  class ast_child {
  public:
    using variant_type = std::variant<token, std::unique_ptr<ast_node>>;

    ast_child(token t) : data_(std::move(t)) {}

    ast_child(std::unique_ptr<ast_node> n) : data_(std::move(n)) {}

    ast_child(const ast_child&) = delete;
    ast_child&
    operator=(const ast_child&) = delete;
    ast_child(ast_child&&) = default;
    ast_child&
    operator=(ast_child&&) = default;

    bool
    is_token() const {
      return std::holds_alternative<token>(data_);
    }

    bool
    is_node() const {
      return !is_token();
    }

    const token&
    as_token() const {
      return std::get<token>(data_);
    }

    const ast_node&
    as_node() const;

    const variant_type&
    data() const {
      return data_;
    }

  private:
    variant_type data_;
  };

  struct ast_node {
    std::string rule;    // production rule name
    std::string variant; // tag of the alternative that matched
    std::vector<ast_child> children;
    source_span span;
  };

  inline const ast_node&
  ast_child::as_node() const {
    return *std::get<std::unique_ptr<ast_node>>(data_);
  }

} // namespace gramc
