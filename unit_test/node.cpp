#include <catch2/catch.hpp>
#include <linked/details/linked_list.hpp>

#include <array>
#include <cstddef>
#include <string>
#include <utility>

namespace {
using node_type = linked::details::node<int>;
using list_type = linked::details::linked_list<int>;

// Checks the head, tail and length bookkeeping against the actual chain.
void check_consistency(const list_type &list) {
  if (!list.head()) {
    CHECK(list.tail() == nullptr);
    CHECK(list.length() == 0);
    return;
  }

  std::size_t count{0};
  for (const auto &node : *list.head())
    ++count;
  CHECK(count == list.length());
  CHECK(&list.head()->last() == list.tail());
}
} // namespace

TEST_CASE("linked::details::node iteration", "[linked][node]") {
  node_type third{nullptr, 3};
  node_type second{&third, 2};
  node_type first{&second, 1};

  std::string visited{};
  for (const auto &node : first)
    visited += std::to_string(node.value);
  CHECK(visited == "123");

  CHECK(&first.last() == &third);
  CHECK(&third.last() == &third);
  CHECK(&first.nth(0) == &first);
  CHECK(&first.nth(2) == &third);

  auto iterator = first.begin();
  auto previous = iterator++;
  CHECK(&*previous == &first);
  CHECK(iterator->value == 2);
  ++iterator;
  ++iterator;
  CHECK(iterator == first.end());
}

TEST_CASE("linked::details::linked_list structural operations",
          "[linked][node]") {
  std::array<node_type, 5> nodes{node_type{nullptr, 0}, node_type{nullptr, 1},
                                 node_type{nullptr, 2}, node_type{nullptr, 3},
                                 node_type{nullptr, 4}};
  list_type list{};
  check_consistency(list);

  SECTION("push and link") {
    list.push_back(nodes[1]);
    list.push_front(nodes[0]);
    list.push_back(nodes[3]);
    list.link_after(nodes[1], nodes[2]);
    list.link_after(nodes[3], nodes[4]);
    check_consistency(list);

    CHECK(list.length() == 5);
    CHECK(list.tail() == &nodes[4]);
    for (std::size_t ii{0}; ii != nodes.size(); ++ii)
      CHECK(list.walk(ii).value == static_cast<int>(ii));
  }

  SECTION("unlink") {
    for (auto &node : nodes)
      list.push_back(node);

    CHECK(&list.unlink_front() == &nodes[0]);
    CHECK(&list.unlink_after(nodes[3]) == &nodes[4]);
    CHECK(list.tail() == &nodes[3]);
    CHECK(&list.unlink_after(nodes[1]) == &nodes[2]);
    check_consistency(list);
    CHECK(list.length() == 2);

    list.unlink_front();
    list.unlink_front();
    check_consistency(list);
    CHECK(list.head() == nullptr);
  }

  SECTION("splice and release") {
    list_type other{};
    list.push_back(nodes[0]);
    other.push_back(nodes[1]);
    other.push_back(nodes[2]);

    list.splice_back(other);
    check_consistency(list);
    check_consistency(other);
    CHECK(list.length() == 3);
    CHECK(list.tail() == &nodes[2]);

    list_type moved{std::move(list)};
    check_consistency(list);
    CHECK(moved.length() == 3);

    CHECK(moved.release() == &nodes[0]);
    check_consistency(moved);
  }
}
