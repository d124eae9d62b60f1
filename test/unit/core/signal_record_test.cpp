#include <catch2/catch_test_macros.hpp>
#include "common/signal_test_utils.h"

using namespace signal_lambda;
using namespace signal_lambda::test;

TEST_CASE("SignalRecord JSON conversion", "[core][signal_record]") {

    SECTION("FromJson accepts objects") {
        JsonValue json;
        JsonValue::object_t object;
        object.emplace("ticker", Json("AAPL"));
        object.emplace("value", Json(0.9));
        json.data = std::move(object);

        auto record = SignalRecord::FromJson(json);
        REQUIRE(record.Size() == 2);
        REQUIRE(record.Contains("ticker"));
        REQUIRE(NumberField(record, "value") == 0.9);
    }

    SECTION("FromJson rejects non-objects") {
        REQUIRE_THROWS_AS(SignalRecord::FromJson(Json(1.0)), std::invalid_argument);
        REQUIRE_THROWS_AS(SignalRecord::FromJson(JsonArray({Json(1.0)})), std::invalid_argument);
        REQUIRE_THROWS_AS(SignalRecord::FromJson(JsonNull()), std::invalid_argument);
    }

    SECTION("ToJson round trips nested fields") {
        auto record = MakeSignal({{"ticker", Json("MSFT")}, {"tags", JsonArray({Json("a"), Json(true)})}});
        auto back = SignalRecord::FromJson(record.ToJson());
        REQUIRE(back == record);
    }
}

TEST_CASE("SignalRecord accessors", "[core][signal_record]") {

    SECTION("GetTicker returns string tickers only") {
        REQUIRE(MakeSignal({{"ticker", Json("AAPL")}}).GetTicker() == "AAPL");
        REQUIRE_FALSE(MakeSignal({{"ticker", Json(1.0)}}).GetTicker().has_value());
        REQUIRE_FALSE(MakeSignal({{"value", Json(1.0)}}).GetTicker().has_value());
    }

    SECTION("Find returns nullptr for missing fields") {
        auto record = MakeSignal({{"value", Json(1.0)}});
        REQUIRE(record.Find("value") != nullptr);
        REQUIRE(record.Find("missing") == nullptr);
    }

    SECTION("Equality compares values deeply") {
        auto a = MakeSignal({{"x", JsonArray({Json(1.0), Json(2.0)})}});
        auto b = MakeSignal({{"x", JsonArray({Json(1.0), Json(2.0)})}});
        auto c = MakeSignal({{"x", JsonArray({Json(1.0), Json(3.0)})}});
        REQUIRE(a == b);
        REQUIRE_FALSE(a == c);
        REQUIRE_FALSE(JsonEquals(Json(1.0), Json("1")));
        REQUIRE(JsonEquals(JsonNull(), JsonNull()));
    }
}

TEST_CASE("ParseSignalBatch", "[core][signal_record]") {

    SECTION("Preserves order") {
        std::vector<JsonValue> values{MakeSignal({{"ticker", Json("A")}}).ToJson(),
                                      MakeSignal({{"ticker", Json("B")}}).ToJson()};
        auto batch = ParseSignalBatch(values);
        REQUIRE(batch.size() == 2);
        REQUIRE(batch[0].GetTicker() == "A");
        REQUIRE(batch[1].GetTicker() == "B");
    }

    SECTION("Names the offending position") {
        std::vector<JsonValue> values{MakeSignal({{"ticker", Json("A")}}).ToJson(), Json("oops")};
        REQUIRE_THROWS_WITH(ParseSignalBatch(values),
                            "signals[1]: signal record must be a JSON object");
    }

    SECTION("Empty batch") {
        REQUIRE(ParseSignalBatch({}).empty());
        REQUIRE(SignalBatchToJson({}).empty());
    }
}
