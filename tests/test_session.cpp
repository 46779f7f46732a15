#include <doctest/doctest.h>

#include <atomic>
#include <thread>
#include <vector>

#include "session.hpp"
#include "util.hpp"

using namespace honeypot;

TEST_CASE("withSession creates once and reuses the record") {
	SessionStore store;
	bool firstFresh = false;
	bool secondFresh = true;
	store.withSession("s-1", [&](SessionState &s, bool fresh) {
		firstFresh = fresh;
		s.turnIndex = 3;
	});
	store.withSession("s-1", [&](SessionState &s, bool fresh) {
		secondFresh = fresh;
		CHECK(s.turnIndex == 3);
		CHECK(s.sessionId == "s-1");
		CHECK((int)s.hiddenState.size() == kStateDim);
	});
	CHECK(firstFresh);
	CHECK_FALSE(secondFresh);
	CHECK(store.size() == 1);
}

TEST_CASE("snapshot reports unknown sessions") {
	SessionStore store;
	json out;
	std::string error;
	CHECK_FALSE(store.snapshot("missing", out, &error));
	CHECK_FALSE(error.empty());
	store.withSession("s-2", [](SessionState &s, bool) { s.stage = Stage::Verifying; });
	REQUIRE(store.snapshot("s-2", out, &error));
	CHECK(out["sessionId"] == "s-2");
}

TEST_CASE("idle sessions are evicted after the ttl") {
	SessionStore store(1000);
	store.withSession("a", [](SessionState &, bool) {});
	store.withSession("b", [](SessionState &, bool) {});
	CHECK(store.evictIdle(nowEpochMs()) == 0);
	CHECK(store.evictIdle(nowEpochMs() + 5000) == 2);
	CHECK(store.size() == 0);
}

TEST_CASE("markFinalized succeeds exactly once under concurrent callers") {
	SessionStore store;
	store.withSession("dup", [](SessionState &, bool) {});
	std::atomic<int> winners{0};
	std::vector<std::thread> threads;
	for (int i = 0; i < 16; i++) {
		threads.emplace_back([&]() {
			if (store.markFinalized("dup")) winners++;
		});
	}
	for (auto &t : threads) t.join();
	CHECK(winners.load() == 1);
	CHECK_FALSE(store.markFinalized("dup"));
}

TEST_CASE("finalization claimed on the held state is exclusive") {
	SessionStore store;
	std::atomic<int> winners{0};
	std::vector<std::thread> threads;
	for (int i = 0; i < 16; i++) {
		threads.emplace_back([&]() {
			store.withSession("held", [&](SessionState &s, bool) {
				if (SessionStore::markFinalized(s)) winners++;
			});
		});
	}
	for (auto &t : threads) t.join();
	CHECK(winners.load() == 1);
	CHECK_FALSE(store.markFinalized("held"));

	// A claim taken before eviction is not lost with the record.
	bool claimed = false;
	store.withSession("evicted", [&](SessionState &s, bool) { claimed = SessionStore::markFinalized(s); });
	CHECK(store.evictIdle(nowEpochMs() + 3600ll * 1000ll * 2) == 2);
	CHECK(claimed);
	CHECK_FALSE(store.markFinalized("evicted"));
}
