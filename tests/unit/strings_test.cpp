#include "internal/util/strings.hpp"

#include <cassert>
#include <iostream>
#include <string>

namespace {

using nutrition::util::EqualsIgnoreCase;
using nutrition::util::FoldCase;

void TestFoldCase() {
  assert(FoldCase("Chicken CURRY") == "chicken curry");
  assert(FoldCase("ÉCLAIR") == "éclair");
  assert(FoldCase("ÄPFEL MÜSLI") == "äpfel müsli");
  assert(FoldCase("Straße") == "strasse");
  assert(FoldCase("ΣΟΥΒΛΑΚΙ") == FoldCase("σουβλακι"));
  assert(FoldCase("").empty());
}

void TestEqualsIgnoreCase() {
  assert(EqualsIgnoreCase("ÉCLAIR", "éclair"));
  assert(EqualsIgnoreCase("STRASSE", "straße"));
  assert(!EqualsIgnoreCase("éclair", "eclair"));
  assert(!EqualsIgnoreCase("Curry", "Curry "));

  // precomposed é against e + combining acute: not normalized
  assert(!EqualsIgnoreCase("\xC3\xA9", "e\xCC\x81"));
}

} // namespace

int main() {
  TestFoldCase();
  TestEqualsIgnoreCase();

  std::cout << "nutrition_unit_strings: pass\n";
  return 0;
}
