#include <catch2/catch_test_macros.hpp>

#include <file_editor/core/result.hpp>

#include <memory>
#include <string>
#include <utility>
#include <vector>

using namespace file_editor;

// ===========================================================================
// Basic Ok / Err
// ===========================================================================

TEST_CASE("Result: Ok result holds value", "[result]") {
    auto r = Result<int, std::string>::Ok(42);
    REQUIRE(r.IsOk());
    REQUIRE_FALSE(r.IsErr());
    CHECK(static_cast<bool>(r));
    CHECK(r.Value() == 42);
}

TEST_CASE("Result: Err result holds error", "[result]") {
    auto r = Result<int, std::string>::Err("field 'name' must be a string");
    REQUIRE(r.IsErr());
    REQUIRE_FALSE(r.IsOk());
    CHECK_FALSE(static_cast<bool>(r));
    CHECK(r.Error() == "field 'name' must be a string");
}

// ===========================================================================
// Map / MapError
// ===========================================================================

TEST_CASE("Result: Map changes type and passes Err through", "[result]") {
    auto count = Result<std::vector<std::string>, std::string>::Ok({"a", "b", "c"})
                     .Map([](std::vector<std::string> v) {
                         return static_cast<int>(v.size());
                     });
    REQUIRE(count.IsOk());
    CHECK(count.Value() == 3);

    bool called = false;
    auto failed = Result<int, std::string>::Err("nope").Map([&called](int v) {
        called = true;
        return v * 3;
    });
    CHECK_FALSE(called);
    REQUIRE(failed.IsErr());
    CHECK(failed.Error() == "nope");
}

TEST_CASE("Result: MapError lifts errno into a message", "[result]") {
    auto to_message = [](int err) { return "errno " + std::to_string(err); };

    auto lifted = Result<std::string, int>::Err(2).MapError(to_message);
    REQUIRE(lifted.IsErr());
    CHECK(lifted.Error() == "errno 2");

    bool called = false;
    auto kept = Result<std::string, int>::Ok("line one\n").MapError([&called](int) {
        called = true;
        return std::string("unused");
    });
    CHECK_FALSE(called);
    REQUIRE(kept.IsOk());
    CHECK(kept.Value() == "line one\n");
}

TEST_CASE("Result: Map and MapError chain", "[result]") {
    auto decode = [](bool ok) {
        return ok ? Result<int, std::string>::Ok(4)
                  : Result<int, std::string>::Err("field 'line' must be an integer");
    };
    auto run = [&decode](bool ok) {
        return decode(ok)
            .MapError([](std::string reason) { return reason.size(); })
            .Map([](int line) { return line - 1; });
    };

    auto good = run(true);
    REQUIRE(good.IsOk());
    CHECK(good.Value() == 3);

    auto bad = run(false);
    REQUIRE(bad.IsErr());
    CHECK(bad.Error() == std::string("field 'line' must be an integer").size());
}

// ===========================================================================
// Copy / move semantics
// ===========================================================================

TEST_CASE("Result: copy keeps both sides intact", "[result]") {
    auto r1 = Result<std::string, int>::Err(-32602);
    auto r2 = r1;
    REQUIRE(r1.IsErr());
    REQUIRE(r2.IsErr());
    CHECK(r1.Error() == -32602);
    CHECK(r2.Error() == -32602);
}

TEST_CASE("Result: move value and error out", "[result]") {
    auto ok = Result<std::string, int>::Ok("content");
    CHECK(std::move(ok).Value() == "content");

    auto err = Result<int, std::string>::Err("moved error");
    CHECK(std::move(err).Error() == "moved error");
}

TEST_CASE("Result: move-only type in Ok", "[result]") {
    auto r = Result<std::unique_ptr<int>, std::string>::Ok(std::make_unique<int>(42));
    REQUIRE(r.IsOk());
    auto ptr = std::move(r).Value();
    REQUIRE(ptr != nullptr);
    CHECK(*ptr == 42);
}

// ===========================================================================
// Result<void, E>
// ===========================================================================

TEST_CASE("Result<void>: Ok and Err", "[result]") {
    auto ok = Result<void, std::string>::Ok();
    CHECK(ok.IsOk());
    CHECK(static_cast<bool>(ok));

    auto err = Result<void, std::string>::Err("Method not specified.");
    REQUIRE(err.IsErr());
    CHECK(err.Error() == "Method not specified.");
    CHECK(std::move(err).Error() == "Method not specified.");
}
