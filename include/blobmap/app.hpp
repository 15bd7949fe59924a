#pragma once
#include <iostream>

namespace blobmap {

// Утилита сборки: compile / lookup / dump / info.
// Коды выхода: 0 успех, 1 битый блоб или ошибка ввода-вывода, 2 ошибка в аргументах.
class App {
public:
  explicit App(std::ostream& out = std::cout) : out_(out) {}

  int run(int argc, char** argv);

private:
  std::ostream& out_;
};

} // namespace blobmap
