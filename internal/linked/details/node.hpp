#pragma once

#include <cstddef>
#include <type_traits>
#include <utility>

namespace linked::details {
template <typename Value> struct node {
  struct sentinel {};

  /**
   * @brief Forward iterator over a chain of nodes.
   *
   * @details NodeType is either node or const node. The iterator walks
   *          the next links until it reaches the end of the chain, which
   *          compares equal to sentinel.
   */
  template <typename NodeType> struct basic_iterator {
    using value_type = std::remove_const_t<NodeType>;
    using difference_type = std::ptrdiff_t;

    constexpr basic_iterator() noexcept;
    constexpr basic_iterator(NodeType *start) noexcept;

    auto operator*() const -> NodeType &;
    auto operator->() const -> NodeType *;
    auto operator++() -> basic_iterator &;
    auto operator++(int) -> basic_iterator;
    auto operator==(const basic_iterator &other) const -> bool;
    auto operator==(sentinel) const -> bool;

    NodeType *current;
  };

  using iterator = basic_iterator<node>;
  using const_iterator = basic_iterator<const node>;
  using value_type = Value;

  node *next;
  Value value;

  template <typename... CtorArgs>
  constexpr node(node *next, CtorArgs &&...ctor_args) noexcept(
      std::is_nothrow_constructible_v<Value, CtorArgs...>);

  auto begin() -> iterator;
  auto begin() const -> const_iterator;
  auto end() const -> sentinel;

  auto last() -> node &;

  /**
   * @brief Walks steps links forward from this node.
   *
   * @details The caller guarantees that the chain is long enough.
   *
   * @return node& The node steps positions after this one.
   */
  auto nth(std::size_t steps) -> node &;
};
} // namespace linked::details

// ---
// Iterator implementation
// ---

template <typename Value>
template <typename NodeType>
constexpr linked::details::node<Value>::basic_iterator<
    NodeType>::basic_iterator() noexcept
    : current{nullptr} {}

template <typename Value>
template <typename NodeType>
constexpr linked::details::node<Value>::basic_iterator<
    NodeType>::basic_iterator(NodeType *start) noexcept
    : current{start} {}

template <typename Value>
template <typename NodeType>
auto linked::details::node<Value>::basic_iterator<NodeType>::operator*() const
    -> NodeType & {
  return *current;
}

template <typename Value>
template <typename NodeType>
auto linked::details::node<Value>::basic_iterator<NodeType>::operator->() const
    -> NodeType * {
  return current;
}

template <typename Value>
template <typename NodeType>
auto linked::details::node<Value>::basic_iterator<NodeType>::operator++()
    -> basic_iterator & {
  current = current->next;
  return *this;
}

template <typename Value>
template <typename NodeType>
auto linked::details::node<Value>::basic_iterator<NodeType>::operator++(int)
    -> basic_iterator {
  basic_iterator copy{current};
  this->operator++();
  return copy;
}

template <typename Value>
template <typename NodeType>
auto linked::details::node<Value>::basic_iterator<NodeType>::operator==(
    const basic_iterator &other) const -> bool {
  return current == other.current;
}

template <typename Value>
template <typename NodeType>
auto linked::details::node<Value>::basic_iterator<NodeType>::operator==(
    sentinel) const -> bool {
  return current == nullptr;
}

// ---
// Node implementation
// ---

template <typename Value>
template <typename... CtorArgs>
constexpr linked::details::node<Value>::node(
    node *next, CtorArgs &&...ctor_args) noexcept(
    std::is_nothrow_constructible_v<Value, CtorArgs...>)
    : next{next}, value(std::forward<CtorArgs>(ctor_args)...) {}

template <typename Value>
auto linked::details::node<Value>::begin() -> iterator {
  return this;
}

template <typename Value>
auto linked::details::node<Value>::begin() const -> const_iterator {
  return this;
}

template <typename Value>
auto linked::details::node<Value>::end() const -> sentinel {
  return {};
}

template <typename Value>
auto linked::details::node<Value>::last() -> node & {
  auto current = begin();
  auto previous = current;
  while (++current != end())
    previous = current;
  return *previous;
}

template <typename Value>
auto linked::details::node<Value>::nth(std::size_t steps) -> node & {
  auto current = begin();
  for (; steps != 0; --steps)
    ++current;
  return *current;
}
