#include "jsonl_rev/arena.hpp"
#include <iostream>
#include <string>
#include <vector>

int main(){
  jr::Arena a(16);

  // views taken before the arena grows must survive the growth
  std::vector<std::string_view> views;
  std::vector<std::string> want;
  for (int i = 0; i < 50; ++i) {
    want.push_back("value-" + std::to_string(i));
    views.push_back(a.copy(want.back()));
  }
  std::string big(100, 'q');
  std::string_view bv = a.copy(big);
  for (std::size_t i = 0; i < views.size(); ++i) {
    if (views[i] != want[i]) { std::cerr << "[FAIL] view " << i << " moved\n"; return 1; }
  }
  if (bv != big) { std::cerr << "[FAIL] oversized copy\n"; return 1; }
  if (a.copy("").size() != 0) { std::cerr << "[FAIL] empty copy\n"; return 1; }

  const std::size_t peak = a.used();
  if (a.high_water() != peak || a.capacity() < peak) { std::cerr << "[FAIL] counters\n"; return 1; }

  a.reset();
  if (a.used() != 0 || a.high_water() != peak) { std::cerr << "[FAIL] reset keeps high water\n"; return 1; }
  const std::size_t cap = a.capacity();
  a.copy("again");
  if (a.capacity() != cap) { std::cerr << "[FAIL] reset reuses blocks\n"; return 1; }

  a.reset_and_shrink();
  if (a.capacity() != 16) { std::cerr << "[FAIL] shrink keeps one block, cap=" << a.capacity() << "\n"; return 1; }

  std::cout << "[PASS] arena views stable, peak=" << peak << "\n";
  return 0;
}
