#include <iostream>
#include <linked/list.hpp>

int main() {
  linked::list<int> container{};
  container.add(1);
  container.add(2);
  container.add(3);
  container.insert(1, 9);
  std::cout << container << "\n";

  std::cout << "removed " << container.remove_at(0) << "\n";
  container -= 2;
  std::cout << container << "\n";

  auto squares = container.map([](int value) { return value * value; });
  auto odd = (squares + linked::list<int>{4, 5})
                 .where([](int value) { return value % 2 != 0; });

  for (const auto &value : odd)
    std::cout << value << "\n";
  std::cout << odd.to_string() << "\n";

  return 0;
}
