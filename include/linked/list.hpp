#pragma once

#include <linked/details/linked_list.hpp>

#include <concepts>
#include <cstddef>
#include <functional>
#include <initializer_list>
#include <iterator>
#include <memory>
#include <ostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>

namespace linked {
/**
 * @brief Singly linked list with indexed access and functional transforms.
 *
 * @details The list owns every node of its chain and allocates them through
 *          Allocator. Appending is O(1) through the cached tail, every other
 *          indexed operation walks from the head.
 *
 *          Concatenation and subtraction never share nodes between two live
 *          lists: rvalue operands are consumed, lvalue operands are copied.
 *
 *          Not thread safe.
 */
template <typename Value,
          typename Allocator =
              std::allocator<typename details::linked_list<Value>::node_type>>
class list {
public:
  // Types.
  using value_type = Value;
  using allocator_type = Allocator;
  using node_type = typename details::linked_list<Value>::node_type;
  using size_type = std::size_t;
  using index_type = std::ptrdiff_t;
  using reference = value_type &;
  using const_reference = const value_type &;
  using sentinel = typename node_type::sentinel;

  template <bool IsConst> class basic_iterator {
  public:
    using node_iterator =
        std::conditional_t<IsConst, typename node_type::const_iterator,
                           typename node_type::iterator>;
    using iterator_category = std::forward_iterator_tag;
    using value_type = Value;
    using difference_type = std::ptrdiff_t;
    using reference = std::conditional_t<IsConst, const Value &, Value &>;
    using pointer = std::conditional_t<IsConst, const Value *, Value *>;

    constexpr basic_iterator() noexcept = default;
    constexpr explicit basic_iterator(node_iterator inner) noexcept;

    auto operator*() const -> reference;
    auto operator->() const -> pointer;
    auto operator++() -> basic_iterator &;
    auto operator++(int) -> basic_iterator;
    auto operator==(const basic_iterator &other) const -> bool;
    auto operator==(sentinel) const -> bool;

  private:
    node_iterator inner_iterator{};
  };

  using iterator = basic_iterator<false>;
  using const_iterator = basic_iterator<true>;

  // Constructors.
  list() noexcept(noexcept(allocator_type{}));
  explicit list(const allocator_type &allocator) noexcept;
  list(std::initializer_list<value_type> values,
       const allocator_type &allocator = allocator_type{});
  list(const list &other);
  list(list &&other) noexcept;

  ~list();

  auto operator=(const list &other) -> list &;
  auto operator=(list &&other) noexcept(
      std::allocator_traits<allocator_type>::is_always_equal::value ||
      std::allocator_traits<
          allocator_type>::propagate_on_container_move_assignment::value)
      -> list &;

  // Observers.
  auto length() const noexcept -> size_type;
  auto size() const noexcept -> size_type;
  auto empty() const noexcept -> bool;
  auto get_allocator() const -> allocator_type;

  auto front() -> reference;
  auto front() const -> const_reference;
  auto back() -> reference;
  auto back() const -> const_reference;

  // Methods.
  void add(const value_type &value);
  void add(value_type &&value);
  template <typename... CtorArgs> auto emplace(CtorArgs &&...args) -> reference;

  /**
   * @brief Inserts value before the element at index.
   *
   * @details index must address an existing element. The position behind
   *          the last element is rejected, append with add() instead.
   *
   * @throws std::out_of_range if index is not in [0, length()).
   */
  void insert(index_type index, const value_type &value);
  void insert(index_type index, value_type &&value);

  /**
   * @brief Removes the element at index and returns it.
   *
   * @throws std::out_of_range if index is not in [0, length()).
   */
  auto remove_at(index_type index) -> value_type;

  auto contains(const value_type &value) const -> bool
    requires std::equality_comparable<Value>;

  // Index of the first element equal to value, -1 if there is none.
  auto index_of(const value_type &value) const -> index_type
    requires std::equality_comparable<Value>;

  void clear() noexcept;

  template <typename Action> void for_each(Action &&action);
  template <typename Action> void for_each(Action &&action) const;

  template <typename Transform>
  auto map(Transform &&transform) const
      -> list<std::remove_cvref_t<
          std::invoke_result_t<Transform &, const value_type &>>>;

  template <typename Test> auto where(Test &&test) const -> list;

  // Renders "LinkedList: [v1,v2,...]".
  auto to_string() const -> std::string;

  auto begin() -> iterator;
  auto begin() const -> const_iterator;
  auto cbegin() const -> const_iterator;
  auto end() const -> sentinel;
  auto cend() const -> sentinel;

  // Operators.
  auto operator[](index_type index) -> reference;
  auto operator[](index_type index) const -> const_reference;

  /**
   * @brief Moves the nodes of other behind the last element.
   *
   * @details other is left empty. Nodes are relinked without reallocation
   *          when both allocators compare equal, otherwise the values are
   *          moved into freshly allocated nodes.
   */
  auto operator+=(list &&other) -> list &;

  // Appends copies of the elements of other, other stays untouched.
  auto operator+=(const list &other) -> list &;

  // Removes the first element equal to value, if any.
  auto operator-=(const value_type &value) -> list &
    requires std::equality_comparable<Value>;

  friend auto operator+(list lhs, list &&rhs) -> list {
    lhs += std::move(rhs);
    return lhs;
  }

  friend auto operator+(list lhs, const list &rhs) -> list {
    lhs += rhs;
    return lhs;
  }

  friend auto operator-(list lhs, const value_type &value) -> list
    requires std::equality_comparable<Value>
  {
    lhs -= value;
    return lhs;
  }

  friend auto operator==(const list &lhs, const list &rhs) -> bool
    requires std::equality_comparable<Value>
  {
    if (lhs.length() != rhs.length())
      return false;
    auto rhs_iterator = rhs.begin();
    for (const auto &value : lhs)
      if (!(value == *rhs_iterator++))
        return false;
    return true;
  }

  friend auto operator<<(std::ostream &stream, const list &values)
      -> std::ostream & {
    stream << "LinkedList: [";
    const char *separator = "";
    for (const auto &value : values) {
      stream << separator << value;
      separator = ",";
    }
    return stream << ']';
  }

private:
  // Types.
  using allocator_traits = std::allocator_traits<allocator_type>;
  using list_type = details::linked_list<value_type>;

  // Methods.
  /**
   * @brief Allocates a detached node and constructs its value in place.
   *
   * @details The memory is handed back to the allocator if the value
   *          constructor throws.
   *
   * @return node_type& The new node, owned by the caller until linked.
   */
  template <typename... CtorArgs>
  auto create_node(CtorArgs &&...args) -> node_type &;
  void destroy_node(node_type &node) noexcept;

  void check_index(index_type index, const char *operation) const;
  auto node_at(index_type index, const char *operation) const -> node_type &;
  template <typename NodeValue>
  void insert_node(index_type index, NodeValue &&value);

  // Appends copies of the first count values starting at first.
  void append_copies(const node_type *first, size_type count);

  // Members.
  allocator_type allocator;
  list_type nodes;
};
} // namespace linked

// ---
// Iterator implementation
// ---

template <typename Value, typename Allocator>
template <bool IsConst>
constexpr linked::list<Value, Allocator>::basic_iterator<
    IsConst>::basic_iterator(node_iterator inner) noexcept
    : inner_iterator{inner} {}

template <typename Value, typename Allocator>
template <bool IsConst>
auto linked::list<Value, Allocator>::basic_iterator<IsConst>::operator*() const
    -> reference {
  return inner_iterator->value;
}

template <typename Value, typename Allocator>
template <bool IsConst>
auto linked::list<Value, Allocator>::basic_iterator<IsConst>::operator->()
    const -> pointer {
  return std::addressof(inner_iterator->value);
}

template <typename Value, typename Allocator>
template <bool IsConst>
auto linked::list<Value, Allocator>::basic_iterator<IsConst>::operator++()
    -> basic_iterator & {
  ++inner_iterator;
  return *this;
}

template <typename Value, typename Allocator>
template <bool IsConst>
auto linked::list<Value, Allocator>::basic_iterator<IsConst>::operator++(int)
    -> basic_iterator {
  auto copy = *this;
  ++inner_iterator;
  return copy;
}

template <typename Value, typename Allocator>
template <bool IsConst>
auto linked::list<Value, Allocator>::basic_iterator<IsConst>::operator==(
    const basic_iterator &other) const -> bool {
  return inner_iterator == other.inner_iterator;
}

template <typename Value, typename Allocator>
template <bool IsConst>
auto linked::list<Value, Allocator>::basic_iterator<IsConst>::operator==(
    sentinel end) const -> bool {
  return inner_iterator == end;
}

// ---
// List implementation
// ---

template <typename Value, typename Allocator>
linked::list<Value, Allocator>::list() noexcept(noexcept(allocator_type{}))
    : allocator{}, nodes{} {}

template <typename Value, typename Allocator>
linked::list<Value, Allocator>::list(const allocator_type &allocator) noexcept
    : allocator{allocator}, nodes{} {}

template <typename Value, typename Allocator>
linked::list<Value, Allocator>::list(std::initializer_list<value_type> values,
                                     const allocator_type &allocator)
    : list(allocator) {
  for (const auto &value : values)
    add(value);
}

template <typename Value, typename Allocator>
linked::list<Value, Allocator>::list(const list &other)
    : list(allocator_traits::select_on_container_copy_construction(
          other.allocator)) {
  append_copies(other.nodes.head(), other.length());
}

template <typename Value, typename Allocator>
linked::list<Value, Allocator>::list(list &&other) noexcept
    : allocator{std::move(other.allocator)}, nodes{std::move(other.nodes)} {}

template <typename Value, typename Allocator>
linked::list<Value, Allocator>::~list() {
  clear();
}

template <typename Value, typename Allocator>
auto linked::list<Value, Allocator>::operator=(const list &other) -> list & {
  if (this == &other)
    return *this;

  clear();
  if constexpr (allocator_traits::propagate_on_container_copy_assignment::value)
    allocator = other.allocator;
  append_copies(other.nodes.head(), other.length());
  return *this;
}

template <typename Value, typename Allocator>
auto linked::list<Value, Allocator>::operator=(list &&other) noexcept(
    std::allocator_traits<allocator_type>::is_always_equal::value ||
    std::allocator_traits<
        allocator_type>::propagate_on_container_move_assignment::value)
    -> list & {
  if (this == &other)
    return *this;

  clear();
  if constexpr (allocator_traits::propagate_on_container_move_assignment::value)
    allocator = std::move(other.allocator);

  if (allocator == other.allocator) {
    nodes = std::move(other.nodes);
  } else {
    for (auto &value : other)
      add(std::move(value));
    other.clear();
  }
  return *this;
}

template <typename Value, typename Allocator>
auto linked::list<Value, Allocator>::length() const noexcept -> size_type {
  return nodes.length();
}

template <typename Value, typename Allocator>
auto linked::list<Value, Allocator>::size() const noexcept -> size_type {
  return nodes.length();
}

template <typename Value, typename Allocator>
auto linked::list<Value, Allocator>::empty() const noexcept -> bool {
  return nodes.head() == nullptr;
}

template <typename Value, typename Allocator>
auto linked::list<Value, Allocator>::get_allocator() const -> allocator_type {
  return allocator;
}

template <typename Value, typename Allocator>
auto linked::list<Value, Allocator>::front() -> reference {
  return node_at(0, "front").value;
}

template <typename Value, typename Allocator>
auto linked::list<Value, Allocator>::front() const -> const_reference {
  return node_at(0, "front").value;
}

template <typename Value, typename Allocator>
auto linked::list<Value, Allocator>::back() -> reference {
  return node_at(static_cast<index_type>(length()) - 1, "back").value;
}

template <typename Value, typename Allocator>
auto linked::list<Value, Allocator>::back() const -> const_reference {
  return node_at(static_cast<index_type>(length()) - 1, "back").value;
}

template <typename Value, typename Allocator>
void linked::list<Value, Allocator>::add(const value_type &value) {
  nodes.push_back(create_node(value));
}

template <typename Value, typename Allocator>
void linked::list<Value, Allocator>::add(value_type &&value) {
  nodes.push_back(create_node(std::move(value)));
}

template <typename Value, typename Allocator>
template <typename... CtorArgs>
auto linked::list<Value, Allocator>::emplace(CtorArgs &&...args)
    -> reference {
  auto &node = create_node(std::forward<CtorArgs>(args)...);
  nodes.push_back(node);
  return node.value;
}

template <typename Value, typename Allocator>
void linked::list<Value, Allocator>::insert(index_type index,
                                            const value_type &value) {
  insert_node(index, value);
}

template <typename Value, typename Allocator>
void linked::list<Value, Allocator>::insert(index_type index,
                                            value_type &&value) {
  insert_node(index, std::move(value));
}

template <typename Value, typename Allocator>
auto linked::list<Value, Allocator>::remove_at(index_type index)
    -> value_type {
  check_index(index, "remove_at");

  auto predecessor =
      index == 0 ? nullptr : &nodes.walk(static_cast<size_type>(index - 1));
  auto &target = predecessor ? *predecessor->next : *nodes.head();
  // Move the value out first, so a throwing move leaves the list intact.
  value_type removed(std::move(target.value));

  if (predecessor)
    destroy_node(nodes.unlink_after(*predecessor));
  else
    destroy_node(nodes.unlink_front());
  return removed;
}

template <typename Value, typename Allocator>
auto linked::list<Value, Allocator>::contains(const value_type &value) const
    -> bool
  requires std::equality_comparable<Value>
{
  return index_of(value) != -1;
}

template <typename Value, typename Allocator>
auto linked::list<Value, Allocator>::index_of(const value_type &value) const
    -> index_type
  requires std::equality_comparable<Value>
{
  index_type index{0};
  for (const auto &current : *this) {
    if (current == value)
      return index;
    ++index;
  }
  return -1;
}

template <typename Value, typename Allocator>
void linked::list<Value, Allocator>::clear() noexcept {
  auto node = nodes.release();
  while (node != nullptr) {
    auto next = node->next;
    destroy_node(*node);
    node = next;
  }
}

template <typename Value, typename Allocator>
template <typename Action>
void linked::list<Value, Allocator>::for_each(Action &&action) {
  for (auto &value : *this)
    std::invoke(action, value);
}

template <typename Value, typename Allocator>
template <typename Action>
void linked::list<Value, Allocator>::for_each(Action &&action) const {
  for (const auto &value : *this)
    std::invoke(action, value);
}

template <typename Value, typename Allocator>
template <typename Transform>
auto linked::list<Value, Allocator>::map(Transform &&transform) const
    -> list<std::remove_cvref_t<
        std::invoke_result_t<Transform &, const value_type &>>> {
  list<std::remove_cvref_t<
      std::invoke_result_t<Transform &, const value_type &>>>
      transformed{};
  for (const auto &value : *this)
    transformed.add(std::invoke(transform, value));
  return transformed;
}

template <typename Value, typename Allocator>
template <typename Test>
auto linked::list<Value, Allocator>::where(Test &&test) const -> list {
  list filtered(
      allocator_traits::select_on_container_copy_construction(allocator));
  for (const auto &value : *this)
    if (std::invoke(test, value))
      filtered.add(value);
  return filtered;
}

template <typename Value, typename Allocator>
auto linked::list<Value, Allocator>::to_string() const -> std::string {
  std::ostringstream stream{};
  stream << *this;
  return stream.str();
}

template <typename Value, typename Allocator>
auto linked::list<Value, Allocator>::begin() -> iterator {
  return iterator{nodes.head()};
}

template <typename Value, typename Allocator>
auto linked::list<Value, Allocator>::begin() const -> const_iterator {
  return const_iterator{nodes.head()};
}

template <typename Value, typename Allocator>
auto linked::list<Value, Allocator>::cbegin() const -> const_iterator {
  return begin();
}

template <typename Value, typename Allocator>
auto linked::list<Value, Allocator>::end() const -> sentinel {
  return {};
}

template <typename Value, typename Allocator>
auto linked::list<Value, Allocator>::cend() const -> sentinel {
  return {};
}

template <typename Value, typename Allocator>
auto linked::list<Value, Allocator>::operator[](index_type index)
    -> reference {
  return node_at(index, "operator[]").value;
}

template <typename Value, typename Allocator>
auto linked::list<Value, Allocator>::operator[](index_type index) const
    -> const_reference {
  return node_at(index, "operator[]").value;
}

template <typename Value, typename Allocator>
auto linked::list<Value, Allocator>::operator+=(list &&other) -> list & {
  if (this == &other)
    return *this += static_cast<const list &>(other);

  if (allocator == other.allocator) {
    nodes.splice_back(other.nodes);
  } else {
    for (auto &value : other)
      add(std::move(value));
    other.clear();
  }
  return *this;
}

template <typename Value, typename Allocator>
auto linked::list<Value, Allocator>::operator+=(const list &other) -> list & {
  // The length is taken up front, so appending a list to itself copies each
  // original element exactly once.
  append_copies(other.nodes.head(), other.length());
  return *this;
}

template <typename Value, typename Allocator>
auto linked::list<Value, Allocator>::operator-=(const value_type &value)
    -> list &
  requires std::equality_comparable<Value>
{
  auto current = nodes.head();
  if (!current)
    return *this;

  if (current->value == value) {
    destroy_node(nodes.unlink_front());
    return *this;
  }

  while (current->next && !(current->next->value == value))
    current = current->next;
  if (current->next)
    destroy_node(nodes.unlink_after(*current));
  return *this;
}

template <typename Value, typename Allocator>
template <typename... CtorArgs>
auto linked::list<Value, Allocator>::create_node(CtorArgs &&...args)
    -> node_type & {
  auto node = allocator_traits::allocate(allocator, 1);
  try {
    allocator_traits::construct(allocator, node, nullptr,
                                std::forward<CtorArgs>(args)...);
  } catch (...) {
    allocator_traits::deallocate(allocator, node, 1);
    throw;
  }
  return *node;
}

template <typename Value, typename Allocator>
void linked::list<Value, Allocator>::destroy_node(node_type &node) noexcept {
  allocator_traits::destroy(allocator, &node);
  allocator_traits::deallocate(allocator, &node, 1);
}

template <typename Value, typename Allocator>
void linked::list<Value, Allocator>::check_index(index_type index,
                                                 const char *operation) const {
  if (index < 0 || index >= static_cast<index_type>(length()))
    throw std::out_of_range{std::string{"linked::list::"} + operation +
                            ": index " + std::to_string(index) +
                            " out of range for length " +
                            std::to_string(length())};
}

template <typename Value, typename Allocator>
auto linked::list<Value, Allocator>::node_at(index_type index,
                                             const char *operation) const
    -> node_type & {
  check_index(index, operation);
  // The tail is cached, no need to walk for the last element.
  if (index == static_cast<index_type>(length()) - 1)
    return *nodes.tail();
  return nodes.walk(static_cast<size_type>(index));
}

template <typename Value, typename Allocator>
template <typename NodeValue>
void linked::list<Value, Allocator>::insert_node(index_type index,
                                                 NodeValue &&value) {
  check_index(index, "insert");

  auto &node = create_node(std::forward<NodeValue>(value));
  if (index == 0)
    nodes.push_front(node);
  else
    nodes.link_after(nodes.walk(static_cast<size_type>(index - 1)), node);
}

template <typename Value, typename Allocator>
void linked::list<Value, Allocator>::append_copies(const node_type *first,
                                                   size_type count) {
  for (; count != 0; --count, first = first->next)
    add(first->value);
}
