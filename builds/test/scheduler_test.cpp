#include <atomic>
#include <cassert>
#include <chrono>
#include <cstdlib>
#include <iostream>
#include <stdexcept>
#include <string>
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
// Helper Coroutines
// =============================================================================

task<int> compute_value(int x) { co_return x * 2; }

task<int> nested_compute(channel<int> ch) {
  int a = co_await compute_value(5);
  auto r = co_await ch.receive();
  co_return a + r.value;
}

// =============================================================================
// Spawn / Run
// =============================================================================

void test_spawn_run() {
  TEST("run completes every spawned task") {
    scheduler sched({.workers = 4});
    std::atomic<int> counter{0};
    std::vector<task_handle> handles;

    for (int i = 0; i < 50; ++i) {
      handles.push_back(sched.spawn([&counter]() -> task<> {
        counter.fetch_add(1, std::memory_order_relaxed);
        co_return;
      }));
    }
    for (auto &h : handles)
      assert(h.state() == task_state::runnable);
    assert(sched.live_tasks() == 50);

    sched.run();

    assert(counter.load() == 50);
    assert(sched.live_tasks() == 0);
    for (auto &h : handles)
      assert(h.done() && !h.error());
    PASS();
  } catch (const std::exception &e) {
    FAIL(e.what());
  }

  TEST("plain void bodies and arguments") {
    scheduler sched({.workers = 2});
    int total = 0;
    sched.spawn([&total](int a, int b) { total = a + b; }, 3, 4);
    sched.run();
    assert(total == 7);
    PASS();
  } catch (const std::exception &e) {
    FAIL(e.what());
  }

  TEST("tasks spawn tasks") {
    scheduler sched({.workers = 3});
    std::atomic<int> counter{0};

    sched.spawn([&]() -> task<> {
      assert(scheduler::current() == &sched);
      for (int i = 0; i < 10; ++i) {
        spawn([&counter]() { counter.fetch_add(1); });
      }
      co_return;
    });
    sched.run();

    assert(counter.load() == 10);
    PASS();
  } catch (const std::exception &e) {
    FAIL(e.what());
  }

  TEST("run can be called again") {
    scheduler sched({.workers = 2});
    int runs = 0;
    sched.spawn([&] { ++runs; });
    sched.run();
    sched.spawn([&] { ++runs; });
    sched.run();
    assert(runs == 2);
    PASS();
  } catch (const std::exception &e) {
    FAIL(e.what());
  }

  TEST("run from inside a task is rejected") {
    scheduler sched({.workers = 1});
    bool rejected = false;
    sched.spawn([&] {
      try {
        sched.run();
      } catch (const std::logic_error &) {
        rejected = true;
      }
    });
    sched.run();
    assert(rejected);
    PASS();
  } catch (const std::exception &e) {
    FAIL(e.what());
  }

  TEST("nested task coroutines block and resume") {
    scheduler sched({.workers = 2});
    auto ch = make_channel<int>();
    int result = 0;

    sched.spawn([&]() -> task<> { result = co_await nested_compute(ch); });
    sched.spawn([&]() -> task<> { co_await ch.send(32); });
    sched.run();

    assert(result == 42);
    PASS();
  } catch (const std::exception &e) {
    FAIL(e.what());
  }
}

// =============================================================================
// Wake / Park / Yield
// =============================================================================

void test_wake() {
  TEST("wake is idempotent") {
    scheduler sched({.workers = 2});
    int resumed = 0;

    auto parked = sched.spawn([&]() -> task<> {
      co_await scheduler::park();
      ++resumed;
    });
    sched.spawn([&, parked]() -> task<> {
      while (parked.state() != task_state::blocked) {
        co_await yield();
      }
      sched.wake(parked.id());
      sched.wake(parked.id());
      sched.wake(parked.id());
    });
    sched.run();

    assert(resumed == 1);
    assert(parked.done());
    // Stale id: the slot is free or reused.
    sched.wake(parked.id());
    PASS();
  } catch (const std::exception &e) {
    FAIL(e.what());
  }

  TEST("yield lets other tasks run") {
    scheduler sched({.workers = 1});
    std::string trace;

    for (char c : {'a', 'b'}) {
      sched.spawn([&trace, c]() -> task<> {
        for (int i = 0; i < 3; ++i) {
          trace += c;
          co_await yield();
        }
      });
    }
    sched.run();

    assert(trace == "ababab");
    PASS();
  } catch (const std::exception &e) {
    FAIL(e.what());
  }

  TEST("sleep_for suspends for at least the duration") {
    scheduler sched({.workers = 2});
    std::chrono::steady_clock::duration slept{};

    sched.spawn([&]() -> task<> {
      auto start = std::chrono::steady_clock::now();
      co_await sleep_for(20ms);
      slept = std::chrono::steady_clock::now() - start;
    });
    sched.run();

    assert(slept >= 20ms);
    PASS();
  } catch (const std::exception &e) {
    FAIL(e.what());
  }

  TEST("sleep_until in the past does not suspend") {
    scheduler sched({.workers = 1});
    bool done = false;
    sched.spawn([&]() -> task<> {
      co_await sleep_until(std::chrono::steady_clock::now() - 1s);
      done = true;
    });
    sched.run();
    assert(done);
    PASS();
  } catch (const std::exception &e) {
    FAIL(e.what());
  }
}

// =============================================================================
// Deadlock Detection
// =============================================================================

void test_deadlock() {
  TEST("unbuffered send without receiver is a deadlock") {
    scheduler sched({.workers = 2});
    auto ch = make_channel<int>();

    auto sender = sched.spawn([&]() -> task<> { co_await ch.send(1); });

    bool detected = false;
    try {
      sched.run();
    } catch (const deadlock_error &e) {
      detected = true;
      assert(e.blocked().size() == 1);
      assert(e.blocked()[0].id == sender.id());
      assert(e.blocked()[0].reason == "chan send");
    }

    assert(detected);
    assert(sender.done());
    assert(sender.error() != nullptr);
    assert(ch.waiting_senders() == 0);
    assert(sched.live_tasks() == 0);
    PASS();
  } catch (const std::exception &e) {
    FAIL(e.what());
  }

  TEST("deadlock lists every blocked task") {
    scheduler sched({.workers = 1});
    auto a = make_channel<int>();
    auto b = make_channel<int>();
    bool finished = false;

    sched.spawn([&]() -> task<> { co_await a.receive(); });
    sched.spawn([&]() -> task<> { co_await select(on_receive(a), on_receive(b)); });
    sched.spawn([&] { finished = true; });

    std::size_t blocked = 0;
    try {
      sched.run();
    } catch (const deadlock_error &e) {
      blocked = e.blocked().size();
    }

    assert(blocked == 2);
    assert(finished);
    assert(a.waiting_receivers() == 0);
    assert(b.waiting_receivers() == 0);
    PASS();
  } catch (const std::exception &e) {
    FAIL(e.what());
  }

  TEST("deadlock with a mutex local to another blocked task") {
    scheduler sched({.workers = 1});
    auto never = make_channel<int>();
    task_handle waiter;

    auto holder = sched.spawn([&]() -> task<> {
      mutex mu;
      co_await mu.lock();
      waiter = sched.spawn([&mu]() -> task<> {
        co_await mu.lock();
        mu.unlock();
      });
      co_await never.receive();
      mu.unlock();
    });

    std::vector<std::string> reasons;
    try {
      sched.run();
    } catch (const deadlock_error &e) {
      for (const auto &b : e.blocked())
        reasons.push_back(b.reason);
    }

    // The holder's frame, and the mutex in it, is released first.
    assert((reasons == std::vector<std::string>{"chan receive", "mutex lock"}));
    assert(holder.done() && waiter.done());
    assert(never.waiting_receivers() == 0);
    assert(sched.live_tasks() == 0);
    PASS();
  } catch (const std::exception &e) {
    FAIL(e.what());
  }

  TEST("a sleeping task is not deadlocked") {
    scheduler sched({.workers = 1});
    auto ch = make_channel<int>();
    int got = 0;

    sched.spawn([&]() -> task<> { got = (co_await ch.receive()).value; });
    sched.spawn([&]() -> task<> {
      co_await sleep_for(10ms);
      co_await ch.send(5);
    });
    sched.run();

    assert(got == 5);
    PASS();
  } catch (const std::exception &e) {
    FAIL(e.what());
  }
}

// =============================================================================
// Exceptions, Timers and Options
// =============================================================================

void test_misc() {
  TEST("a failing task does not stop the others") {
    scheduler sched({.workers = 2});
    int completed = 0;

    auto failing = sched.spawn([]() -> task<> {
      throw std::runtime_error("boom");
      co_return;
    });
    sched.spawn([&] { ++completed; });
    sched.run();

    assert(completed == 1);
    assert(failing.done());
    bool rethrown = false;
    try {
      failing.rethrow_if_failed();
    } catch (const std::runtime_error &e) {
      rethrown = std::string(e.what()) == "boom";
    }
    assert(rethrown);
    PASS();
  } catch (const std::exception &e) {
    FAIL(e.what());
  }

  TEST("timer_service fires in deadline order") {
    timer_service timers;
    std::vector<int> fired;
    auto now = std::chrono::steady_clock::now();
    timers.add_timer(now + 3ms, [&] { fired.push_back(3); });
    timers.add_timer(now + 1ms, [&] { fired.push_back(1); });
    timers.add_timer(now + 1ms, [&] { fired.push_back(2); });
    timers.add_timer(now + 1h, [&] { fired.push_back(4); });

    assert(timers.size() == 4);
    assert(*timers.next_deadline() == now + 1ms);
    for (auto &callback : timers.take_due(now + 5ms))
      callback();

    assert((fired == std::vector<int>{1, 2, 3}));
    assert(timers.size() == 1);
    timers.clear();
    assert(timers.empty());
    assert(!timers.next_deadline());
    PASS();
  } catch (const std::exception &e) {
    FAIL(e.what());
  }

  TEST("options come from the environment") {
    setenv("COCHAN_WORKERS", "3", 1);
    setenv("COCHAN_DETECT_DEADLOCK", "off", 1);
    auto options = scheduler_options::from_env();
    assert(options.workers == 3);
    assert(!options.detect_deadlock);

    setenv("COCHAN_WORKERS", "lots", 1);
    unsetenv("COCHAN_DETECT_DEADLOCK");
    options = scheduler_options::from_env();
    assert(options.workers == scheduler_options::default_workers());
    assert(options.detect_deadlock);
    unsetenv("COCHAN_WORKERS");
    PASS();
  } catch (const std::exception &e) {
    FAIL(e.what());
  }

  TEST("log level can be changed") {
    auto previous = get_log_level();
    set_log_level(log_level::debug);
    assert(log_enabled(log_level::info));
    set_log_level(log_level::error);
    assert(!log_enabled(log_level::warn));
    assert(log_enabled(log_level::error));
    set_log_level(previous);
    PASS();
  } catch (const std::exception &e) {
    FAIL(e.what());
  }

  TEST("long log lines are not truncated") {
    std::string blocked_list;
    for (int i = 0; i < 200; ++i)
      blocked_list += "\n  task#" + std::to_string(i) + " chan receive";
    auto line = format_log_line(log_level::error, "%s", blocked_list.c_str());
    assert(line == "[cochan] error: " + blocked_list);
    PASS();
  } catch (const std::exception &e) {
    FAIL(e.what());
  }

  TEST("default scheduler runs free spawns") {
    int value = 0;
    spawn([&value]() -> task<> {
      auto ch = after(1ms);
      co_await ch.receive();
      value = 1;
    });
    run();
    assert(value == 1);
    assert(default_scheduler().live_tasks() == 0);
    PASS();
  } catch (const std::exception &e) {
    FAIL(e.what());
  }
}

// =============================================================================
// Main
// =============================================================================

int main() {
  std::cout << "=== Scheduler Tests ===" << std::endl << std::endl;

  std::cout << "--- Spawn/Run Tests ---" << std::endl;
  test_spawn_run();
  std::cout << std::endl;

  std::cout << "--- Wake Tests ---" << std::endl;
  test_wake();
  std::cout << std::endl;

  std::cout << "--- Deadlock Tests ---" << std::endl;
  test_deadlock();
  std::cout << std::endl;

  std::cout << "--- Misc Tests ---" << std::endl;
  test_misc();
  std::cout << std::endl;

  std::cout << "=== Results ===" << std::endl;
  std::cout << "Passed: " << tests_passed << std::endl;
  std::cout << "Failed: " << tests_failed << std::endl;

  return tests_failed > 0 ? 1 : 0;
}
