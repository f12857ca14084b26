#include <doctest/doctest.h>

#include <set>

#include "correlation_store.hpp"

TEST_CASE("Identifiers are unique and shaped like req-<time>-<random>")
{
    CorrelationStore store;
    std::set<std::string> seen;
    for (int i = 0; i < 1000; ++i)
    {
        std::string id = store.issueIdentifier();
        CHECK(id.rfind("req-", 0) == 0);
        CHECK(seen.insert(id).second);
    }
    std::string id = *seen.begin();
    CHECK(id.size() - id.rfind('-') - 1 == 5);
}

TEST_CASE("Pending exchanges resolve once and unknown ids are ignored")
{
    CorrelationStore store;
    store.registerPending("a", "http://h/1", "GET");
    store.registerPending("b", "http://h/2", "POST");

    CHECK(store.pendingCount() == 2);
    store.resolvePending("a");
    store.resolvePending("a");
    store.resolvePending("never-registered");
    CHECK(store.pendingCount() == 1);
    CHECK_FALSE(store.isPending("a"));
    CHECK(store.isPending("b"));
}

TEST_CASE("Orphans keep registration order with method and url")
{
    CorrelationStore store;
    store.registerPending("z", "http://h/z", "GET");
    store.registerPending("a", "http://h/a", "DELETE");
    store.registerPending("m", "http://h/m", "PUT");
    store.resolvePending("a");

    auto orphans = store.orphans();
    REQUIRE(orphans.size() == 2);
    CHECK(orphans[0].id == "z");
    CHECK(orphans[1].id == "m");
    CHECK(orphans[1].method == "PUT");
    CHECK(orphans[1].url == "http://h/m");

    RequestInfo unknown = store.requestInfo("nope");
    CHECK(unknown.method == "unknown method");
    CHECK(unknown.url == "unknown URL");
}

TEST_CASE("Duplicate requests are keyed by method, host and path")
{
    CorrelationStore store;
    CHECK_FALSE(store.isDuplicateRequest("GET", "h", "/a"));
    CHECK(store.isDuplicateRequest("GET", "h", "/a"));
    CHECK(store.isDuplicateRequest("GET", "h", "/a"));
    CHECK_FALSE(store.isDuplicateRequest("POST", "h", "/a"));
    CHECK_FALSE(store.isDuplicateRequest("GET", "other", "/a"));
}

TEST_CASE("Duplicate responses are keyed by id and status")
{
    CorrelationStore store;
    CHECK_FALSE(store.isDuplicateResponse("id", 200));
    CHECK(store.isDuplicateResponse("id", 200));
    CHECK_FALSE(store.isDuplicateResponse("id", 500));
}

TEST_CASE("Secondary tokens map back to the primary id")
{
    CorrelationStore store;
    store.registerSecondaryToken("tok-1", "req-1");

    REQUIRE(store.lookupSecondaryToken("tok-1").has_value());
    CHECK(*store.lookupSecondaryToken("tok-1") == "req-1");
    CHECK_FALSE(store.lookupSecondaryToken("tok-2").has_value());

    store.registerSecondaryToken("", "req-2");
    CHECK_FALSE(store.lookupSecondaryToken("").has_value());
}
