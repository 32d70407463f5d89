#include <catch2/catch_test_macros.hpp>
#include "TestHelpers.h"
#include "util/rx/StateSubject.h"
#include <algorithm>
#include <thread>

using namespace Feedwise;
using Feedwise::Rx::StateSubject;

//==============================================================================
TEST_CASE("StateSubject delivers the current value, then changes", "[StateSubject]") {
  StateSubject<int> subject(1);
  std::vector<int> seen;

  auto unsub = subject.subscribe([&seen](const int &v) { seen.push_back(v); });
  subject.next(2);
  subject.next(3);
  unsub();
  subject.next(4);

  REQUIRE(seen == std::vector<int>{1, 2, 3});
  REQUIRE(subject.getSubscriberCount() == 0);
  REQUIRE(subject.getValue() == 4);
}

TEST_CASE("StateSubject::select skips unchanged derived values", "[StateSubject]") {
  StateSubject<int> subject(1);
  std::vector<bool> parity;

  auto unsub = subject.select<bool>([](const int &v) { return v % 2 == 0; },
                                    [&parity](const bool &even) { parity.push_back(even); });
  subject.next(3);
  subject.next(4);
  subject.next(6);
  unsub();

  REQUIRE(parity == std::vector<bool>{false, true});
}

TEST_CASE("StateSubject logs a throwing subscriber and keeps delivering", "[StateSubject]") {
  Testing::ScopedLogCapture logs;
  StateSubject<int> subject(0);
  int last = -1;

  auto bad = subject.subscribe([](const int &v) {
    if (v > 0)
      throw std::runtime_error("render failed");
  });
  auto good = subject.subscribe([&last](const int &v) { last = v; });

  subject.next(5);
  REQUIRE(last == 5);
  REQUIRE(logs.contains(Util::LogLevel::Error, "render failed"));
  bad();
  good();
}

TEST_CASE("StateSubject initial value never arrives after a newer one", "[StateSubject]") {
  StateSubject<int> subject(0);
  constexpr int finalValue = 2000;

  std::thread writer([&subject]() {
    for (int i = 1; i <= finalValue; ++i)
      subject.next(i);
  });

  std::vector<std::vector<int>> histories(50);
  std::vector<StateSubject<int>::Unsubscriber> unsubs;
  for (auto &history : histories)
    unsubs.push_back(subject.subscribe([&history](const int &v) { history.push_back(v); }));

  writer.join();

  for (const auto &history : histories) {
    REQUIRE_FALSE(history.empty());
    REQUIRE(std::is_sorted(history.begin(), history.end()));
    REQUIRE(history.back() == finalValue);
  }

  for (auto &unsub : unsubs)
    unsub();
}
