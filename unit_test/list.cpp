#include <catch2/catch.hpp>
#include <linked/list.hpp>

#include <any>
#include <cstddef>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace config {
constexpr std::size_t element_count{1'000};
} // namespace config

namespace {
template <typename T> struct counting_allocator {
  using value_type = T;

  counting_allocator() noexcept = default;
  template <typename U>
  counting_allocator(const counting_allocator<U> &) noexcept {}

  auto allocate(std::size_t n) -> T * {
    ++allocations;
    return std::allocator<T>{}.allocate(n);
  }

  void deallocate(T *pointer, std::size_t n) noexcept {
    ++deallocations;
    std::allocator<T>{}.deallocate(pointer, n);
  }

  friend auto operator==(const counting_allocator &, const counting_allocator &)
      -> bool {
    return true;
  }

  static inline std::size_t allocations{0};
  static inline std::size_t deallocations{0};
};

// Refuses to be constructed from a negative number.
struct fragile {
  explicit fragile(int value) : value{value} {
    if (value < 0)
      throw std::runtime_error{"negative fragile"};
  }

  int value;
};

// Takes its own address away, only std::addressof reaches it.
struct opaque {
  auto operator&() const -> const opaque * = delete;

  int id;
};

using counted_list =
    linked::list<int, counting_allocator<linked::list<int>::node_type>>;
} // namespace

TEST_CASE("linked::list starts empty", "[linked][list]") {
  linked::list<int> list{};

  CHECK(list.length() == 0);
  CHECK(list.empty());
  CHECK(list.begin() == list.end());
  CHECK(list.to_string() == "LinkedList: []");
}

TEST_CASE("linked::list add appends in order", "[linked][list]") {
  linked::list<int> list{};

  for (int ii{0}; ii != config::element_count; ++ii) {
    list.add(ii);
    CHECK(list.length() == static_cast<std::size_t>(ii + 1));
  }

  for (int ii{0}; ii != config::element_count; ++ii)
    CHECK(list[ii] == ii);

  SECTION("example") {
    linked::list<int> small{};
    small.add(1);
    small.add(2);
    small.add(3);

    CHECK(small.length() == 3);
    CHECK(small.to_string() == "LinkedList: [1,2,3]");
    CHECK(small[0] == 1);
    CHECK(small[2] == 3);
  }
}

TEST_CASE("linked::list emplace constructs in place", "[linked][list]") {
  linked::list<std::string> list{};

  auto &value = list.emplace(3, 'x');
  CHECK(value == "xxx");
  value += "y";
  CHECK(list[0] == "xxxy");
  CHECK(list.length() == 1);
}

TEST_CASE("linked::list insert", "[linked][list]") {
  linked::list<int> list{1, 2, 3};

  SECTION("in the middle") {
    list.insert(1, 9);
    CHECK(list.to_string() == "LinkedList: [1,9,2,3]");
    CHECK(list.length() == 4);
  }

  SECTION("at the front") {
    list.insert(0, 7);
    CHECK(list[0] == 7);
    CHECK(list.length() == 4);
    CHECK(list.front() == 7);
  }

  SECTION("before the last element keeps the tail") {
    list.insert(2, 8);
    CHECK(list.to_string() == "LinkedList: [1,2,8,3]");
    CHECK(list.back() == 3);
    list.add(4);
    CHECK(list.to_string() == "LinkedList: [1,2,8,3,4]");
  }

  SECTION("rejects the append position and negative indices") {
    CHECK_THROWS_AS(list.insert(3, 4), std::out_of_range);
    CHECK_THROWS_AS(list.insert(-1, 4), std::out_of_range);
    CHECK(list.to_string() == "LinkedList: [1,2,3]");
  }

  SECTION("rejects every index on an empty list") {
    linked::list<int> empty{};
    CHECK_THROWS_AS(empty.insert(0, 1), std::out_of_range);
    CHECK(empty.empty());
  }
}

TEST_CASE("linked::list remove_at", "[linked][list]") {
  linked::list<int> list{1, 9, 2, 3};

  SECTION("example") {
    CHECK(list.remove_at(0) == 1);
    CHECK(list.to_string() == "LinkedList: [9,2,3]");
    CHECK(list.length() == 3);
  }

  SECTION("last element moves the tail back") {
    CHECK(list.remove_at(3) == 3);
    CHECK(list.length() == 3);
    CHECK(list.back() == 2);
    CHECK(list[2] == 2);
    list.add(5);
    CHECK(list.to_string() == "LinkedList: [1,9,2,5]");
  }

  SECTION("middle element") {
    CHECK(list.remove_at(1) == 9);
    CHECK(list.to_string() == "LinkedList: [1,2,3]");
  }

  SECTION("until empty") {
    while (!list.empty())
      list.remove_at(0);
    CHECK(list.length() == 0);
    CHECK(list.to_string() == "LinkedList: []");
    list.add(4);
    CHECK(list.front() == 4);
    CHECK(list.back() == 4);
  }

  SECTION("returns containers that accept themselves as elements intact") {
    linked::list<std::vector<std::any>> nested{};
    nested.add({1, 2, 3});
    nested.add({4});

    auto removed = nested.remove_at(0);
    CHECK(removed.size() == 3);
    CHECK(std::any_cast<int>(removed[2]) == 3);
    CHECK(nested.length() == 1);
    CHECK(nested.remove_at(0).size() == 1);
  }

  SECTION("rejects out of range indices") {
    CHECK_THROWS_AS(list.remove_at(-1), std::out_of_range);
    CHECK_THROWS_AS(list.remove_at(4), std::out_of_range);
    CHECK(list.length() == 4);
  }
}

TEST_CASE("linked::list indexed access", "[linked][list]") {
  linked::list<int> list{1, 2, 3};

  SECTION("write in place") {
    list[0] = 10;
    list[1] = 20;
    list[2] = 30;
    CHECK(list.to_string() == "LinkedList: [10,20,30]");
    CHECK(list.back() == 30);
  }

  SECTION("read through const") {
    const auto &view = list;
    CHECK(view[1] == 2);
    CHECK(view[2] == 3);
  }

  SECTION("rejects out of range indices") {
    const auto &view = list;
    CHECK_THROWS_AS(list[-1], std::out_of_range);
    CHECK_THROWS_AS(list[3], std::out_of_range);
    CHECK_THROWS_AS(view[3], std::out_of_range);
  }

  SECTION("front and back reject an empty list") {
    linked::list<int> empty{};
    CHECK_THROWS_AS(empty.front(), std::out_of_range);
    CHECK_THROWS_AS(empty.back(), std::out_of_range);
  }
}

TEST_CASE("linked::list search", "[linked][list]") {
  linked::list<int> list{4, 5, 6, 5};

  CHECK(list.contains(5));
  CHECK(list.index_of(5) == 1);
  CHECK(list.index_of(6) == 2);
  CHECK_FALSE(list.contains(7));
  CHECK(list.index_of(7) == -1);

  for (int value{0}; value != 10; ++value)
    CHECK(list.contains(value) == (list.index_of(value) != -1));

  linked::list<int> empty{};
  CHECK_FALSE(empty.contains(0));
  CHECK(empty.index_of(0) == -1);
}

TEST_CASE("linked::list clear", "[linked][list]") {
  linked::list<std::string> list{"a", "b", "c"};

  list.clear();

  CHECK(list.length() == 0);
  CHECK_FALSE(list.contains("a"));
  CHECK(list.index_of("b") == -1);
  CHECK(list.to_string() == "LinkedList: []");

  list.add("d");
  CHECK(list.to_string() == "LinkedList: [d]");
}

TEST_CASE("linked::list copy and move", "[linked][list]") {
  linked::list<int> original{1, 2, 3};

  SECTION("copy construction is deep") {
    auto copy = original;
    copy[0] = 10;
    copy.add(4);
    CHECK(original.to_string() == "LinkedList: [1,2,3]");
    CHECK(copy.to_string() == "LinkedList: [10,2,3,4]");
  }

  SECTION("copy assignment replaces the contents") {
    linked::list<int> copy{7, 8};
    copy = original;
    CHECK(copy == original);
  }

  SECTION("move construction empties the source") {
    auto moved = std::move(original);
    CHECK(moved.to_string() == "LinkedList: [1,2,3]");
    CHECK(original.empty());
  }

  SECTION("move assignment empties the source") {
    linked::list<int> moved{5};
    moved = std::move(original);
    CHECK(moved.to_string() == "LinkedList: [1,2,3]");
    CHECK(original.empty());
  }
}

TEST_CASE("linked::list iteration", "[linked][list]") {
  linked::list<int> list{1, 2, 3};

  std::vector<int> seen{};
  for (const auto &value : list)
    seen.push_back(value);
  CHECK(seen == std::vector<int>{1, 2, 3});

  for (auto &value : list)
    value *= 2;
  CHECK(list.to_string() == "LinkedList: [2,4,6]");

  linked::list<opaque> opaques{};
  opaques.add(opaque{7});
  opaques.add(opaque{8});
  auto opaque_iterator = opaques.begin();
  CHECK(opaque_iterator->id == 7);
  CHECK((++opaque_iterator)->id == 8);

  auto iterator = list.cbegin();
  CHECK(*iterator++ == 2);
  CHECK(*iterator == 4);
  ++iterator;
  ++iterator;
  CHECK(iterator == list.cend());
}

TEST_CASE("linked::list releases every node", "[linked][list][memory]") {
  using allocator = counting_allocator<linked::list<int>::node_type>;
  allocator::allocations = 0;
  allocator::deallocations = 0;

  {
    counted_list list{};
    for (int ii{0}; ii != config::element_count; ++ii)
      list.add(ii);
    list.remove_at(0);
    list.remove_at(10);
    list -= 500;
    list.insert(3, 42);

    auto copy = list;
    list.clear();
    list.add(1);
  }

  CHECK(allocator::allocations == allocator::deallocations);
  CHECK(allocator::allocations == 2 * config::element_count - 3 + 2 + 1);
}

TEST_CASE("linked::list keeps its state when a value constructor throws",
          "[linked][list][memory]") {
  using allocator =
      counting_allocator<linked::list<fragile>::node_type>;
  allocator::allocations = 0;
  allocator::deallocations = 0;

  {
    linked::list<fragile, allocator> list{};
    list.emplace(1);
    list.emplace(2);

    CHECK_THROWS_AS(list.emplace(-1), std::runtime_error);
    CHECK(list.length() == 2);
    CHECK(list.back().value == 2);
  }

  CHECK(allocator::allocations == 3);
  CHECK(allocator::deallocations == 3);
}

TEST_CASE("linked::list benchmark", "[linked][list][!benchmark]") {
  BENCHMARK_ADVANCED("linked::list::add empty")
  (Catch::Benchmark::Chronometer meter) {
    linked::list<std::size_t> list{};
    meter.measure([&list] { list.add(1); });
  };

  BENCHMARK_ADVANCED("linked::list::add size 100")
  (Catch::Benchmark::Chronometer meter) {
    linked::list<std::size_t> list{};
    for (std::size_t ii{0}; ii != 100; ++ii)
      list.add(ii);
    meter.measure([&list] { list.add(1); });
  };

  BENCHMARK_ADVANCED("linked::list::operator[] last of 1000")
  (Catch::Benchmark::Chronometer meter) {
    linked::list<std::size_t> list{};
    for (std::size_t ii{0}; ii != 1000; ++ii)
      list.add(ii);
    meter.measure([&list] { return list[999]; });
  };

  BENCHMARK_ADVANCED("linked::list::operator[] middle of 1000")
  (Catch::Benchmark::Chronometer meter) {
    linked::list<std::size_t> list{};
    for (std::size_t ii{0}; ii != 1000; ++ii)
      list.add(ii);
    meter.measure([&list] { return list[500]; });
  };

  BENCHMARK_ADVANCED("std::vector::push_back size 100")
  (Catch::Benchmark::Chronometer meter) {
    std::vector<std::size_t> vector{};
    for (std::size_t ii{0}; ii != 100; ++ii)
      vector.push_back(ii);
    meter.measure([&vector] { vector.push_back(1); });
  };
}
