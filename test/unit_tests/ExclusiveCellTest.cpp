#include "ExclusiveCell.hpp"
#include "TestHeaders.hpp"

using namespace lpane;

namespace {
struct Base {
  virtual ~Base() {}
  virtual int value() const { return 1; }
};

struct Derived : public Base {
  int counter = 0;
  virtual int value() const { return 2; }
};
}  // namespace

TEST_CASE("ExclusiveCell needs a value", "[ExclusiveCell]") {
  REQUIRE_THROWS_AS(ExclusiveCell<int>(unique_ptr<int>(), "empty"),
                    std::invalid_argument);
}

TEST_CASE("Borrows are released with the guard", "[ExclusiveCell]") {
  ExclusiveCell<int> cell(unique_ptr<int>(new int(5)), "number");
  {
    auto guard = cell.borrowMut();
    REQUIRE(cell.isBorrowedByThisThread());
    *guard = 6;
  }
  REQUIRE(!cell.isBorrowedByThisThread());
  REQUIRE(*cell.borrowMut() == 6);
}

TEST_CASE("Re-entrant borrows throw", "[ExclusiveCell]") {
  ExclusiveCell<int> cell(unique_ptr<int>(new int(0)), "number");
  auto guard = cell.borrowMut();
  REQUIRE_THROWS_AS(cell.borrowMut(), std::logic_error);
  // The failed attempt did not disturb the existing borrow
  REQUIRE(cell.isBorrowedByThisThread());
}

TEST_CASE("Moved guards keep the borrow", "[ExclusiveCell]") {
  ExclusiveCell<Derived> cell(unique_ptr<Derived>(new Derived()), "derived");
  {
    BorrowGuard<Derived> first = cell.borrowMut();
    BorrowGuard<Derived> second(std::move(first));
    REQUIRE(first.get() == nullptr);
    REQUIRE(cell.isBorrowedByThisThread());

    BorrowGuard<Base> asBase(std::move(second));
    REQUIRE(asBase->value() == 2);
    REQUIRE(cell.isBorrowedByThisThread());
  }
  REQUIRE(!cell.isBorrowedByThisThread());
}

TEST_CASE("Projected guards keep the borrow", "[ExclusiveCell]") {
  ExclusiveCell<Derived> cell(unique_ptr<Derived>(new Derived()), "derived");
  {
    auto guard = cell.borrowMut();
    int* counter = &guard->counter;
    BorrowGuard<int> part = std::move(guard).project(counter);
    *part = 3;
    REQUIRE(guard.get() == nullptr);
    REQUIRE(cell.isBorrowedByThisThread());
  }
  REQUIRE(!cell.isBorrowedByThisThread());
  REQUIRE(cell.borrowMut()->counter == 3);
}

TEST_CASE("Other threads wait for the borrow", "[ExclusiveCell]") {
  ExclusiveCell<int> cell(unique_ptr<int>(new int(0)), "number");
  std::atomic<bool> done(false);
  std::thread other;
  {
    auto guard = cell.borrowMut();
    other = std::thread([&cell, &done]() {
      *cell.borrowMut() += 1;
      done = true;
    });
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    REQUIRE(!done);
    *guard = 10;
  }
  other.join();
  REQUIRE(done);
  REQUIRE(*cell.borrowMut() == 11);
}
