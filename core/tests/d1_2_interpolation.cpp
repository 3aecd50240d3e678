// D1.2 - Ratio interpolation test (pure C++, no GL)
// Tests: stepped interpolation on a manual clock, easing endpoints,
// cancellation, supersede, immediate commit paths, dispose mid-animation.

#include "sp/ratio/Completion.hpp"
#include "sp/ratio/Easing.hpp"
#include "sp/ratio/RatioStore.hpp"
#include "sp/ratio/Scheduler.hpp"

#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <vector>

static void requireTrue(bool cond, const char* msg) {
  if (!cond) {
    std::fprintf(stderr, "ASSERT FAIL: %s\n", msg);
    std::exit(1);
  }
}

static void requireClose(double a, double b, double eps, const char* msg) {
  if (std::fabs(a - b) > eps) {
    std::fprintf(stderr, "ASSERT FAIL: %s (got %.9f, expected %.9f)\n", msg, a, b);
    std::exit(1);
  }
}

int main() {
  // --- Test 1: easing endpoints and shape ---
  {
    requireClose(sp::easing::linear(0.3), 0.3, 1e-12, "linear");
    requireClose(sp::easing::easeOut(0.0), 0.0, 1e-6, "easeOut(0)");
    requireClose(sp::easing::easeOut(1.0), 1.0, 1e-6, "easeOut(1)");
    requireClose(sp::easing::easeIn(1.0), 1.0, 1e-6, "easeIn(1)");
    requireTrue(sp::easing::easeOut(0.5) > 0.5, "easeOut front-loaded");
    requireTrue(sp::easing::easeIn(0.5) < 0.5, "easeIn back-loaded");
    requireClose(sp::easing::easeInOut(0.5), 0.5, 1e-4, "easeInOut symmetric");
    std::printf("  Test 1 (easing) PASS\n");
  }

  // --- Test 2: 4 linear steps over 120ms ---
  {
    sp::ManualScheduler clock;
    sp::RatioStore store(0.1);
    store.setScheduler(&clock);

    std::vector<double> seen;
    store.addListener([&](double v) { seen.push_back(v); });

    sp::Completion done = store.interpolateTo(0.9, 120000, sp::easing::linear, 4);
    requireTrue(!done.isDone(), "pending after start");
    requireTrue(store.isInterpolating(), "interpolating");
    requireTrue(clock.activeTimerCount() == 1, "one timer");

    clock.advance(30000);
    requireClose(store.value(), 0.3, 1e-9, "step 1");
    clock.advance(30000);
    requireClose(store.value(), 0.5, 1e-9, "step 2");
    clock.advance(30000);
    requireClose(store.value(), 0.7, 1e-9, "step 3");
    requireTrue(!done.isDone(), "still pending before final step");
    clock.advance(30000);
    requireTrue(store.value() == 0.9, "final value exact");
    requireTrue(done.isDone(), "resolved at final step");
    requireTrue(!store.isInterpolating(), "timer gone");
    requireTrue(clock.activeTimerCount() == 0, "no timers left");
    requireTrue(seen.size() == 4, "one notification per step");

    clock.advance(500000);
    requireTrue(seen.size() == 4, "nothing after completion");
    std::printf("  Test 2 (linear steps) PASS\n");
  }

  // --- Test 3: default easeOut terminates monotonically at the target ---
  {
    sp::ManualScheduler clock;
    sp::RatioStore store(0.2);
    store.setScheduler(&clock);

    double last = store.value();
    bool monotonic = true;
    store.addListener([&](double v) {
      if (v < last) monotonic = false;
      last = v;
    });

    sp::Completion done = store.interpolateTo(0.8);
    clock.advance(sp::kDefaultInterpolationMicros * 2);
    requireTrue(done.isDone(), "resolved");
    requireTrue(store.value() == 0.8, "exact target");
    requireTrue(monotonic, "values never move backwards");
    std::printf("  Test 3 (easeOut terminates) PASS\n");
  }

  // --- Test 4: a second call resolves the first ---
  {
    sp::ManualScheduler clock;
    sp::RatioStore store(0.1);
    store.setScheduler(&clock);

    int firstDone = 0;
    sp::Completion first = store.interpolateTo(0.9, 120000, sp::easing::linear, 4);
    first.then([&]() { firstDone++; });
    clock.advance(30000);

    sp::Completion second = store.interpolateTo(0.2, 120000, sp::easing::linear, 4);
    requireTrue(first.isDone(), "first resolved on supersede");
    requireTrue(firstDone == 1, "first continuation ran once");
    requireTrue(!second.isDone(), "second pending");
    requireTrue(clock.activeTimerCount() == 1, "only the new timer");

    clock.advance(120000);
    requireTrue(second.isDone(), "second resolved");
    requireClose(store.value(), 0.2, 1e-12, "second target reached");
    std::printf("  Test 4 (supersede) PASS\n");
  }

  // --- Test 5: cancelInterpolation resolves and freezes ---
  {
    sp::ManualScheduler clock;
    sp::RatioStore store(0.0);
    store.setScheduler(&clock);

    sp::Completion done = store.interpolateTo(1.0, 100000, sp::easing::linear, 10);
    clock.advance(20000);
    double mid = store.value();
    store.cancelInterpolation();
    requireTrue(done.isDone(), "resolved on cancel");
    clock.advance(200000);
    requireClose(store.value(), mid, 1e-12, "value frozen after cancel");
    std::printf("  Test 5 (cancel) PASS\n");
  }

  // --- Test 6: immediate commit paths ---
  {
    sp::RatioStore noClock(0.3);
    sp::Completion a = noClock.interpolateTo(0.7);
    requireTrue(a.isDone(), "no scheduler: resolved");
    requireClose(noClock.value(), 0.7, 1e-12, "no scheduler: committed");

    sp::ManualScheduler clock;
    sp::RatioStore store(0.3);
    store.setScheduler(&clock);

    requireTrue(store.interpolateTo(0.6, 0).isDone(), "zero duration resolved");
    requireClose(store.value(), 0.6, 1e-12, "zero duration committed");
    requireTrue(store.interpolateTo(0.2, 1000, sp::easing::linear, 0).isDone(),
                "zero steps resolved");
    requireClose(store.value(), 0.2, 1e-12, "zero steps committed");
    requireTrue(store.interpolateTo(0.2 + 1e-9).isDone(), "tiny change resolved");
    requireTrue(store.interpolateTo(4.0).isDone() == false, "target clamped then animated");
    clock.advance(sp::kDefaultInterpolationMicros);
    requireClose(store.value(), 1.0, 1e-12, "clamped target reached");
    requireTrue(clock.activeTimerCount() == 0, "no timers scheduled");
    std::printf("  Test 6 (immediate commit) PASS\n");
  }

  // --- Test 7: dispose mid-animation resolves and stops the timer ---
  {
    sp::ManualScheduler clock;
    sp::RatioStore store(0.0);
    store.setScheduler(&clock);

    bool continued = false;
    sp::Completion done = store.interpolateTo(1.0, 100000, sp::easing::linear, 10);
    done.then([&]() { continued = true; });
    clock.advance(30000);
    double frozen = store.value();

    store.dispose();
    requireTrue(done.isDone() && continued, "completion resolved by dispose");
    requireTrue(clock.activeTimerCount() == 0, "timer cancelled");
    clock.advance(500000);
    requireClose(store.value(), frozen, 1e-12, "value frozen after dispose");
    std::printf("  Test 7 (dispose mid-animation) PASS\n");
  }

  // --- Test 8: continuation registered after resolution runs at once ---
  {
    sp::Completion c;
    int runs = 0;
    c.then([&]() { runs++; });
    c.resolve();
    c.resolve();
    requireTrue(runs == 1, "resolve is idempotent");
    c.then([&]() { runs++; });
    requireTrue(runs == 2, "late continuation runs immediately");
    std::printf("  Test 8 (completion) PASS\n");
  }

  std::printf("D1.2 interpolation: ALL PASS\n");
  return 0;
}
