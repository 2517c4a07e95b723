#include <cassert>
#include <chrono>
#include <iostream>
#include <stdexcept>
#include <vector>

#include "cochan/cochan.hpp"

using namespace cochan;
using namespace std::chrono_literals;

// =============================================================================
// Test Counters
// =============================================================================

static int tests_passed = 0;
static int tests_failed = 0;

#define TEST(name)                                                             \
  std::cout << "Testing " << name << "... ";                                   \
  try

#define PASS()                                                                 \
  std::cout << "PASSED" << std::endl;                                          \
  ++tests_passed

#define FAIL(msg)                                                              \
  std::cout << "FAILED: " << msg << std::endl;                                 \
  ++tests_failed

// =============================================================================
// Readiness
// =============================================================================

void test_readiness() {
  TEST("single ready case always wins regardless of order") {
    scheduler sched({.workers = 1});
    auto a = make_channel<int>(1);
    auto b = make_channel<int>(1);
    auto c = make_channel<int>(1);
    int wrong = 0;
    int received = 0;

    sched.spawn([&]() -> task<> {
      for (int i = 0; i < 100; ++i) {
        co_await b.send(i);
        std::size_t picked = co_await select(
            on_receive(a), on_receive(b, [&](int v) { received += v; }),
            on_receive(c));
        if (picked != 1)
          ++wrong;

        co_await b.send(i);
        picked = co_await select(on_receive(c), on_receive(a),
                                 on_receive(b, [&](int v) { received += v; }));
        if (picked != 2)
          ++wrong;
      }
    });
    sched.run();

    assert(wrong == 0);
    assert(received == 2 * (99 * 100 / 2));
    PASS();
  } catch (const std::exception &e) {
    FAIL(e.what());
  }

  TEST("ready send case wins over idle receive") {
    scheduler sched({.workers = 1});
    auto out = make_channel<int>(1);
    auto idle = make_channel<int>();
    std::size_t picked = 99;
    bool sent = false;

    sched.spawn([&]() -> task<> {
      picked = co_await select(on_receive(idle),
                               on_send(out, 7, [&] { sent = true; }));
    });
    sched.run();

    assert(picked == 1);
    assert(sent);
    assert(*out.try_receive() == 7);
    PASS();
  } catch (const std::exception &e) {
    FAIL(e.what());
  }

  TEST("ready cases are chosen at random") {
    scheduler sched({.workers = 1});
    auto a = make_channel<int>(1);
    auto b = make_channel<int>(1);
    std::vector<int> hits(2, 0);

    sched.spawn([&]() -> task<> {
      for (int i = 0; i < 400; ++i) {
        if (a.size() == 0)
          co_await a.send(1);
        if (b.size() == 0)
          co_await b.send(2);
        std::size_t picked = co_await select(on_receive(a), on_receive(b));
        ++hits[picked];
      }
    });
    sched.run();

    // Chance of either count staying at zero is 2^-399.
    assert(hits[0] > 0 && hits[1] > 0);
    assert(hits[0] + hits[1] == 400);
    PASS();
  } catch (const std::exception &e) {
    FAIL(e.what());
  }
}

// =============================================================================
// Default Case
// =============================================================================

void test_default() {
  TEST("default runs when nothing is ready") {
    scheduler sched({.workers = 1});
    auto a = make_channel<int>();
    bool default_ran = false;
    std::size_t picked = 0;

    sched.spawn([&]() -> task<> {
      picked = co_await select(on_receive(a), on_send(a, 1),
                               otherwise([&] { default_ran = true; }));
    });
    sched.run();

    assert(picked == select_default);
    assert(default_ran);
    assert(a.waiting_receivers() == 0 && a.waiting_senders() == 0);
    PASS();
  } catch (const std::exception &e) {
    FAIL(e.what());
  }

  TEST("default does not run when a case is ready") {
    scheduler sched({.workers = 1});
    auto a = make_channel<int>(1);
    a.try_send(3);
    bool default_ran = false;
    int value = 0;
    std::size_t picked = select_default;

    sched.spawn([&]() -> task<> {
      picked = co_await select(otherwise([&] { default_ran = true; }),
                               on_receive(a, [&](int v) { value = v; }));
    });
    sched.run();

    assert(picked == 1);
    assert(!default_ran);
    assert(value == 3);
    PASS();
  } catch (const std::exception &e) {
    FAIL(e.what());
  }
}

// =============================================================================
// Blocking Select
// =============================================================================

void test_blocking() {
  TEST("blocked select completes the case a sender picked") {
    scheduler sched({.workers = 2});
    auto a = make_channel<int>();
    auto b = make_channel<int>();
    std::size_t picked = 99;
    int value = 0;

    sched.spawn([&]() -> task<> {
      picked = co_await select(on_receive(a, [&](int v) { value = v; }),
                               on_receive(b, [&](int v) { value = v; }));
    });
    sched.spawn([&]() -> task<> {
      while (b.waiting_receivers() == 0) {
        co_await yield();
      }
      co_await b.send(21);
    });
    sched.run();

    assert(picked == 1);
    assert(value == 21);
    assert(a.waiting_receivers() == 0);
    assert(b.waiting_receivers() == 0);
    PASS();
  } catch (const std::exception &e) {
    FAIL(e.what());
  }

  TEST("blocked send case hands its value to a receiver") {
    scheduler sched({.workers = 2});
    auto a = make_channel<int>();
    auto b = make_channel<int>();
    std::size_t picked = 99;
    int received = 0;

    sched.spawn([&]() -> task<> {
      picked = co_await select(on_send(a, 5), on_receive(b));
    });
    sched.spawn([&]() -> task<> {
      while (a.waiting_senders() == 0) {
        co_await yield();
      }
      received = (co_await a.receive()).value;
    });
    sched.run();

    assert(picked == 0);
    assert(received == 5);
    assert(b.waiting_receivers() == 0);
    PASS();
  } catch (const std::exception &e) {
    FAIL(e.what());
  }

  TEST("close completes a blocked receive case") {
    scheduler sched({.workers = 2});
    auto a = make_channel<int>();
    auto b = make_channel<int>();
    bool open = true;
    std::size_t picked = 99;

    sched.spawn([&]() -> task<> {
      picked = co_await select(
          on_receive(a), on_receive(b, [&](int, bool ok) { open = ok; }));
    });
    sched.spawn([&]() -> task<> {
      while (b.waiting_receivers() == 0) {
        co_await yield();
      }
      b.close();
    });
    sched.run();

    assert(picked == 1);
    assert(!open);
    assert(a.waiting_receivers() == 0);
    PASS();
  } catch (const std::exception &e) {
    FAIL(e.what());
  }

  TEST("send case on a closed channel throws") {
    scheduler sched({.workers = 1});
    auto a = make_channel<int>(1);
    a.close();
    int returned = 0;

    sched.spawn([&]() -> task<> {
      try {
        co_await select(on_send(a, 8), otherwise());
      } catch (const send_on_closed_error<int> &e) {
        returned = e.value();
      }
    });
    sched.run();

    assert(returned == 8);
    PASS();
  } catch (const std::exception &e) {
    FAIL(e.what());
  }

  TEST("close fails a blocked send case") {
    scheduler sched({.workers = 2});
    auto a = make_channel<int>();
    auto b = make_channel<int>();
    int returned = 0;
    bool completed = false;

    sched.spawn([&]() -> task<> {
      try {
        co_await select(on_send(a, 13), on_receive(b));
        completed = true;
      } catch (const send_on_closed_error<int> &e) {
        returned = e.value();
      }
    });
    sched.spawn([&]() -> task<> {
      while (a.waiting_senders() == 0) {
        co_await yield();
      }
      a.close();
    });
    sched.run();

    assert(returned == 13);
    assert(!completed);
    assert(a.waiting_senders() == 0);
    assert(b.waiting_receivers() == 0);
    PASS();
  } catch (const std::exception &e) {
    FAIL(e.what());
  }

  TEST("a stray wake leaves a blocked select waiting") {
    scheduler sched({.workers = 1});
    auto a = make_channel<int>();
    auto b = make_channel<int>();
    std::size_t picked = 99;
    int got = 0;
    bool still_blocked = false;

    auto selector = sched.spawn([&]() -> task<> {
      picked = co_await select(on_receive(a),
                               on_receive(b, [&](int v) { got = v; }));
    });
    sched.spawn([&, selector]() -> task<> {
      while (selector.state() != task_state::blocked) {
        co_await yield();
      }
      sched.wake(selector.id());
      co_await yield();
      still_blocked = selector.state() == task_state::blocked;
      co_await b.send(4);
    });
    sched.run();

    assert(still_blocked);
    assert(picked == 1);
    assert(got == 4);
    assert(!selector.error());
    PASS();
  } catch (const std::exception &e) {
    FAIL(e.what());
  }
}

// =============================================================================
// Timeouts
// =============================================================================

void test_timeouts() {
  TEST("after() times out a select") {
    scheduler sched({.workers = 2});
    auto never = make_channel<int>();
    std::size_t picked = 99;
    auto start = std::chrono::steady_clock::now();
    std::chrono::steady_clock::duration waited{};

    sched.spawn([&]() -> task<> {
      picked = co_await select(on_receive(never), on_receive(after(20ms)));
      waited = std::chrono::steady_clock::now() - start;
    });
    sched.run();

    assert(picked == 1);
    assert(waited >= 20ms);
    assert(never.waiting_receivers() == 0);
    PASS();
  } catch (const std::exception &e) {
    FAIL(e.what());
  }

  TEST("repeated timed out selects leave no registrations") {
    scheduler sched({.workers = 2});
    auto never = make_channel<int>();
    int timeouts = 0;

    sched.spawn([&]() -> task<> {
      for (int i = 0; i < 50; ++i) {
        std::size_t picked = co_await select(on_receive(never), on_send(never, i),
                                             on_receive(after(1ms)));
        if (picked == 2)
          ++timeouts;
        assert(never.waiting_receivers() == 0);
        assert(never.waiting_senders() == 0);
      }
    });
    sched.run();

    assert(timeouts == 50);
    PASS();
  } catch (const std::exception &e) {
    FAIL(e.what());
  }
}

// =============================================================================
// Fibonacci / Quit
// =============================================================================

task<> fibonacci(channel<int> c, channel<int> quit) {
  int x = 0, y = 1;
  bool done = false;
  while (!done) {
    co_await select(on_send(c, x,
                            [&] {
                              int next = x + y;
                              x = y;
                              y = next;
                            }),
                    on_receive(quit, [&] { done = true; }));
  }
}

void test_fibonacci() {
  TEST("fibonacci generator stops on quit") {
    scheduler sched({.workers = 2});
    auto c = make_channel<int>();
    auto quit = make_channel<int>();
    std::vector<int> values;

    sched.spawn([&]() -> task<> {
      for (int i = 0; i < 10; ++i) {
        values.push_back((co_await c.receive()).value);
      }
      co_await quit.send(0);
    });
    auto generator = sched.spawn(fibonacci, c, quit);
    sched.run();

    assert((values == std::vector<int>{0, 1, 1, 2, 3, 5, 8, 13, 21, 34}));
    assert(generator.done() && !generator.error());
    assert(c.waiting_senders() == 0);
    PASS();
  } catch (const std::exception &e) {
    FAIL(e.what());
  }
}

// =============================================================================
// Main
// =============================================================================

int main() {
  std::cout << "=== Select Tests ===" << std::endl << std::endl;

  std::cout << "--- Readiness Tests ---" << std::endl;
  test_readiness();
  std::cout << std::endl;

  std::cout << "--- Default Tests ---" << std::endl;
  test_default();
  std::cout << std::endl;

  std::cout << "--- Blocking Tests ---" << std::endl;
  test_blocking();
  std::cout << std::endl;

  std::cout << "--- Timeout Tests ---" << std::endl;
  test_timeouts();
  std::cout << std::endl;

  std::cout << "--- Fibonacci Tests ---" << std::endl;
  test_fibonacci();
  std::cout << std::endl;

  std::cout << "=== Results ===" << std::endl;
  std::cout << "Passed: " << tests_passed << std::endl;
  std::cout << "Failed: " << tests_failed << std::endl;

  return tests_failed > 0 ? 1 : 0;
}
