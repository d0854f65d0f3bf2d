#include <catch2/catch.hpp>
#include <linked/list.hpp>

#include <cstddef>
#include <memory>
#include <sstream>
#include <string>
#include <utility>

namespace {
// Allocators with different ids do not share memory.
template <typename T> struct tagged_allocator {
  using value_type = T;

  tagged_allocator() noexcept = default;
  explicit tagged_allocator(int id) noexcept : id{id} {}
  template <typename U>
  tagged_allocator(const tagged_allocator<U> &other) noexcept : id{other.id} {}

  auto allocate(std::size_t n) -> T * { return std::allocator<T>{}.allocate(n); }
  void deallocate(T *pointer, std::size_t n) noexcept {
    std::allocator<T>{}.deallocate(pointer, n);
  }

  friend auto operator==(const tagged_allocator &lhs,
                         const tagged_allocator &rhs) -> bool {
    return lhs.id == rhs.id;
  }

  int id{0};
};

using tagged_list =
    linked::list<int, tagged_allocator<linked::list<int>::node_type>>;
} // namespace

TEST_CASE("linked::list for_each visits in order", "[linked][list][transform]") {
  linked::list<int> list{1, 2, 3};

  std::string visited{};
  list.for_each([&visited](int value) { visited += std::to_string(value); });
  CHECK(visited == "123");

  list.for_each([](int &value) { value += 10; });
  CHECK(list.to_string() == "LinkedList: [11,12,13]");

  const auto &view = list;
  int sum{0};
  view.for_each([&sum](const int &value) { sum += value; });
  CHECK(sum == 36);
}

TEST_CASE("linked::list map", "[linked][list][transform]") {
  const linked::list<int> list{1, 2, 3};

  SECTION("preserves length and order") {
    auto doubled = list.map([](int value) { return value * 2; });
    REQUIRE(doubled.length() == list.length());
    for (std::ptrdiff_t ii{0}; ii != 3; ++ii)
      CHECK(doubled[ii] == list[ii] * 2);
  }

  SECTION("may change the element type") {
    auto labels =
        list.map([](int value) { return "#" + std::to_string(value); });
    CHECK(labels.to_string() == "LinkedList: [#1,#2,#3]");
    CHECK(labels.contains("#2"));
  }

  SECTION("leaves the receiver untouched") {
    auto unused = list.map([](int value) { return value + 1; });
    CHECK(list.to_string() == "LinkedList: [1,2,3]");
  }

  SECTION("empty in, empty out") {
    linked::list<int> empty{};
    CHECK(empty.map([](int value) { return value; }).empty());
  }
}

TEST_CASE("linked::list where", "[linked][list][transform]") {
  const linked::list<int> list{5, 2, 8, 1, 4, 7};

  auto even = list.where([](int value) { return value % 2 == 0; });
  CHECK(even.to_string() == "LinkedList: [2,8,4]");
  CHECK(even.back() == 4);
  CHECK(list.length() == 6);

  auto none = list.where([](int) { return false; });
  CHECK(none.empty());

  auto all = list.where([](int) { return true; });
  CHECK(all == list);
}

TEST_CASE("linked::list concatenation", "[linked][list][transform]") {
  linked::list<int> lhs{1, 2};
  linked::list<int> rhs{3, 4};

  SECTION("example") {
    auto joined = lhs + rhs;
    CHECK(joined.to_string() == "LinkedList: [1,2,3,4]");
    CHECK(joined.length() == 4);
  }

  SECTION("copying leaves both operands untouched") {
    auto joined = lhs + rhs;
    joined[2] = 30;
    CHECK(lhs.to_string() == "LinkedList: [1,2]");
    CHECK(rhs.to_string() == "LinkedList: [3,4]");
  }

  SECTION("moving consumes the right operand") {
    lhs += std::move(rhs);
    CHECK(lhs.to_string() == "LinkedList: [1,2,3,4]");
    CHECK(lhs.back() == 4);
    CHECK(rhs.empty());

    lhs.add(5);
    CHECK(lhs.length() == 5);
    CHECK(lhs.back() == 5);
  }

  SECTION("empty right operand") {
    lhs += linked::list<int>{};
    CHECK(lhs.to_string() == "LinkedList: [1,2]");
    CHECK(lhs.back() == 2);
  }

  SECTION("empty left operand adopts the right one") {
    linked::list<int> empty{};
    empty += std::move(rhs);
    CHECK(empty.to_string() == "LinkedList: [3,4]");
    CHECK(empty.front() == 3);
    CHECK(empty.back() == 4);
    CHECK(empty.length() == 2);
  }

  SECTION("appending a list to itself") {
    lhs += lhs;
    CHECK(lhs.to_string() == "LinkedList: [1,2,1,2]");
  }

  SECTION("different allocators move the values") {
    using allocator = tagged_allocator<linked::list<int>::node_type>;
    tagged_list first({1, 2}, allocator{1});
    tagged_list second({3}, allocator{2});

    first += std::move(second);
    CHECK(first.to_string() == "LinkedList: [1,2,3]");
    CHECK(second.empty());
    CHECK(first.get_allocator().id == 1);
  }
}

TEST_CASE("linked::list subtraction", "[linked][list][transform]") {
  SECTION("example") {
    linked::list<int> list{9, 2, 3};
    auto result = list - 2;
    CHECK(result.to_string() == "LinkedList: [9,3]");
    CHECK(list.to_string() == "LinkedList: [9,2,3]");
  }

  SECTION("only the first occurrence is removed") {
    linked::list<int> list{1, 2, 3, 2, 2};
    list -= 2;
    CHECK(list.to_string() == "LinkedList: [1,3,2,2]");
    CHECK(list.length() == 4);
  }

  SECTION("adjacent duplicates") {
    linked::list<int> list{1, 2, 2};
    list -= 2;
    CHECK(list.to_string() == "LinkedList: [1,2]");
  }

  SECTION("head") {
    linked::list<int> list{4, 5, 4};
    list -= 4;
    CHECK(list.to_string() == "LinkedList: [5,4]");
  }

  SECTION("tail moves back") {
    linked::list<int> list{4, 5, 6};
    list -= 6;
    CHECK(list.back() == 5);
    list.add(7);
    CHECK(list.to_string() == "LinkedList: [4,5,7]");
  }

  SECTION("last remaining element") {
    linked::list<int> list{4};
    list -= 4;
    CHECK(list.empty());
    list.add(1);
    CHECK(list.front() == 1);
    CHECK(list.back() == 1);
  }

  SECTION("missing value and empty list") {
    linked::list<int> list{1, 2};
    list -= 3;
    CHECK(list.to_string() == "LinkedList: [1,2]");

    linked::list<int> empty{};
    empty -= 3;
    CHECK(empty.empty());
  }
}

TEST_CASE("linked::list string representation", "[linked][list]") {
  linked::list<std::string> list{"a", "b"};
  CHECK(list.to_string() == "LinkedList: [a,b]");

  std::ostringstream stream{};
  stream << linked::list<int>{7} << ' ' << linked::list<int>{};
  CHECK(stream.str() == "LinkedList: [7] LinkedList: []");
}

TEST_CASE("linked::list equality", "[linked][list]") {
  CHECK(linked::list<int>{1, 2} == linked::list<int>{1, 2});
  CHECK(linked::list<int>{1, 2} != linked::list<int>{2, 1});
  CHECK(linked::list<int>{1, 2} != linked::list<int>{1, 2, 3});
  CHECK(linked::list<int>{} == linked::list<int>{});
}
