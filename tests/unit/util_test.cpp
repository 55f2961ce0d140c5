#include <atomic>
#include <cassert>
#include <iostream>
#include <stdexcept>
#include <string>

#include "internal/util/cancel.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/hash.hpp"
#include "internal/util/retry.hpp"
#include "internal/util/text.hpp"
#include "internal/util/uuid.hpp"
#include "internal/util/worker_pool.hpp"

namespace {

using namespace strata::util;

void TestSha256KnownVector() {
  assert(Sha256Hex("abc") == "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
  assert(Sha256Hex("") == "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
}

void TestFnvIsStable() {
  assert(ToHex(Fnv1a64("")) == "cbf29ce484222325");
  assert(Fnv1a64("consciousness") == Fnv1a64("consciousness"));
  assert(Fnv1a64("a") != Fnv1a64("b"));
}

void TestUuidRoundTrip() {
  const auto id  = GenerateUUID();
  const auto str = ToString(id);
  assert(str.size() == 36);
  assert(str[14] == '4');
  assert(FromString(str) == id);
  assert(NewId() != NewId());
}

void TestTokenizeLowersAndSplits() {
  const auto tokens = Tokenize("The Quick-brown fox, 42 times!");
  assert(tokens.size() == 6);
  assert(tokens[0] == "the");
  assert(tokens[1] == "quick");
  assert(tokens[2] == "brown");
  assert(tokens[4] == "42");
}

void TestUtf8PrefixNeverSplitsSequence() {
  const std::string text = "ab\xC3\xA9" "cd"; // "abécd"
  assert(Utf8Prefix(text, 3) == "ab");
  assert(Utf8Prefix(text, 4) == "ab\xC3\xA9");
  assert(Utf8Prefix(text, 100) == text);
  assert(CountSentences("One. Two! Three") == 3);
  assert(CountWords("  one two\tthree\n") == 3);
}

void TestBackoffGrowsAndCaps() {
  const RetryPolicy policy{5, 50, 2.0, 150};
  assert(BackoffMs(policy, 1) == 50);
  assert(BackoffMs(policy, 2) == 100);
  assert(BackoffMs(policy, 3) == 150);
  assert(BackoffMs(policy, 4) == 150);
}

void TestRetryOnlyRetriesTransientErrors() {
  const RetryPolicy policy{3, 1, 2.0, 2};

  int calls  = 0;
  int result = RetryTransient(policy, [&] {
    if (++calls < 3) throw TransientStoreError("flaky");
    return 7;
  });
  assert(result == 7);
  assert(calls == 3);

  calls      = 0;
  bool threw = false;
  try {
    RetryTransient(policy, [&] {
      ++calls;
      throw TransientStoreError("down");
    });
  } catch (const TransientStoreError&) {
    threw = true;
  }
  assert(threw);
  assert(calls == 3);

  calls = 0;
  threw = false;
  try {
    RetryTransient(policy, [&] {
      ++calls;
      throw ValidationError("bad input");
    });
  } catch (const ValidationError&) {
    threw = true;
  }
  assert(threw);
  assert(calls == 1);
}

void TestWorkerPoolPropagatesResultsAndErrors() {
  WorkerPool pool(2);

  std::atomic<int> counter{0};
  auto             a = pool.Submit([&] { return ++counter; });
  auto             b = pool.Submit([&] { return ++counter; });
  assert(a.get() + b.get() == 3);

  auto failing = pool.Submit([]() -> int { throw InvalidState("boom"); });
  bool threw   = false;
  try {
    (void)failing.get();
  } catch (const InvalidState&) {
    threw = true;
  }
  assert(threw);

  pool.Shutdown();
  assert(pool.Size() == 2);
}

void TestCancelTokenCopiesShareFlag() {
  CancelToken token;
  CancelToken copy = token;
  assert(!copy.IsCancelled());

  token.Cancel();
  assert(copy.IsCancelled());

  bool threw = false;
  try {
    copy.ThrowIfCancelled("migration");
  } catch (const Cancelled& e) {
    threw = std::string(e.what()).find("migration") != std::string::npos;
  }
  assert(threw);
}

} // namespace

int main() {
  TestSha256KnownVector();
  TestFnvIsStable();
  TestUuidRoundTrip();
  TestTokenizeLowersAndSplits();
  TestUtf8PrefixNeverSplitsSequence();
  TestBackoffGrowsAndCaps();
  TestRetryOnlyRetriesTransientErrors();
  TestWorkerPoolPropagatesResultsAndErrors();
  TestCancelTokenCopiesShareFlag();

  std::cout << "strata_unit_util: pass\n";
  return 0;
}
