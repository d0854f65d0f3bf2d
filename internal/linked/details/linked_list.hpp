#pragma once

#include <cstddef>
#include <utility>

#include "node.hpp"

namespace linked::details {
/**
 * @brief Head, tail and length bookkeeping of a singly linked chain.
 *
 * @details The chain does not allocate or free nodes. Whoever hands nodes
 *          to it owns them, and gets them back from the unlink methods.
 *          The tail is only an alias into the chain, cached for O(1)
 *          appends.
 */
template <typename Value> class linked_list {
public:
  // Types.
  using node_type = node<Value>;
  using size_type = std::size_t;

  // Constructors.
  constexpr linked_list() noexcept;
  linked_list(const linked_list &) = delete;
  constexpr linked_list(linked_list &&other) noexcept;

  auto operator=(const linked_list &) -> linked_list & = delete;
  auto operator=(linked_list &&other) noexcept -> linked_list &;

  // Accessors.
  auto head() const noexcept -> node_type *;
  auto tail() const noexcept -> node_type *;
  auto length() const noexcept -> size_type;

  // Methods.
  void push_back(node_type &node) noexcept;
  void push_front(node_type &node) noexcept;
  void link_after(node_type &position, node_type &node) noexcept;
  auto unlink_front() noexcept -> node_type &;
  auto unlink_after(node_type &position) noexcept -> node_type &;

  /**
   * @brief Moves every node of other behind the tail of this chain.
   *
   * @details other is left empty.
   */
  void splice_back(linked_list &other) noexcept;

  /**
   * @brief Detaches the whole chain and resets to empty.
   *
   * @return node_type* The former head, nullptr if the chain was empty.
   */
  auto release() noexcept -> node_type *;

  // Walks steps links forward from the head. steps must be below length().
  auto walk(size_type steps) const noexcept -> node_type &;

private:
  // Members.
  node_type *root;
  node_type *last_node;
  size_type count;
};
} // namespace linked::details

// ---
// Implementation
// ---

template <typename Value>
constexpr linked::details::linked_list<Value>::linked_list() noexcept
    : root{nullptr}, last_node{nullptr}, count{0} {}

template <typename Value>
constexpr linked::details::linked_list<Value>::linked_list(
    linked_list &&other) noexcept
    : root{std::exchange(other.root, nullptr)},
      last_node{std::exchange(other.last_node, nullptr)},
      count{std::exchange(other.count, 0)} {}

template <typename Value>
auto linked::details::linked_list<Value>::operator=(
    linked_list &&other) noexcept -> linked_list & {
  if (this != &other) {
    root = std::exchange(other.root, nullptr);
    last_node = std::exchange(other.last_node, nullptr);
    count = std::exchange(other.count, 0);
  }
  return *this;
}

template <typename Value>
auto linked::details::linked_list<Value>::head() const noexcept
    -> node_type * {
  return root;
}

template <typename Value>
auto linked::details::linked_list<Value>::tail() const noexcept
    -> node_type * {
  return last_node;
}

template <typename Value>
auto linked::details::linked_list<Value>::length() const noexcept
    -> size_type {
  return count;
}

template <typename Value>
void linked::details::linked_list<Value>::push_back(node_type &node) noexcept {
  node.next = nullptr;
  if (last_node)
    last_node->next = &node;
  else
    root = &node;
  last_node = &node;
  ++count;
}

template <typename Value>
void linked::details::linked_list<Value>::push_front(
    node_type &node) noexcept {
  node.next = root;
  root = &node;
  if (!last_node)
    last_node = root;
  ++count;
}

template <typename Value>
void linked::details::linked_list<Value>::link_after(node_type &position,
                                                     node_type &node) noexcept {
  node.next = position.next;
  position.next = &node;
  if (!node.next)
    last_node = &node;
  ++count;
}

template <typename Value>
auto linked::details::linked_list<Value>::unlink_front() noexcept
    -> node_type & {
  auto &front = *root;
  root = front.next;
  front.next = nullptr;
  --count;
  if (!root)
    last_node = nullptr;
  return front;
}

template <typename Value>
auto linked::details::linked_list<Value>::unlink_after(
    node_type &position) noexcept -> node_type & {
  auto &removed = *position.next;
  position.next = removed.next;
  removed.next = nullptr;
  --count;
  // The removed node was the tail.
  if (!position.next)
    last_node = &position;
  return removed;
}

template <typename Value>
void linked::details::linked_list<Value>::splice_back(
    linked_list &other) noexcept {
  if (!other.root)
    return;

  if (root)
    last_node->next = other.root;
  else
    root = other.root;
  last_node = other.last_node;
  count += other.count;

  other.root = nullptr;
  other.last_node = nullptr;
  other.count = 0;
}

template <typename Value>
auto linked::details::linked_list<Value>::release() noexcept -> node_type * {
  last_node = nullptr;
  count = 0;
  return std::exchange(root, nullptr);
}

template <typename Value>
auto linked::details::linked_list<Value>::walk(size_type steps) const noexcept
    -> node_type & {
  return root->nth(steps);
}
