#include <catch2/catch_test_macros.hpp>
#include "runtime/execution/output_capture.h"

using namespace signal_lambda::runtime;

TEST_CASE("OutputCapture bounds", "[runtime][output]") {

    SECTION("Lines keep their record index") {
        OutputCapture output;
        output.Write("batch line");
        output.Write("record line", 3);
        REQUIRE(output.GetLines().size() == 2);
        REQUIRE_FALSE(output.GetLines()[0].record_index.has_value());
        REQUIRE(output.GetLines()[1].record_index == 3u);
    }

    SECTION("Lines beyond the limit are counted, not kept") {
        OutputCapture output(2, 100);
        output.Write("a");
        output.Write("b");
        output.Write("c");
        output.Write("d");
        REQUIRE(output.GetLines().size() == 2);
        REQUIRE(output.GetLines()[1].text == "b");
        REQUIRE(output.GetDroppedCount() == 2);
    }

    SECTION("Long lines are truncated with a marker") {
        OutputCapture output(10, 5);
        output.Write("abcdefghij");
        REQUIRE(output.GetLines()[0].text == std::string{"abcde"} + std::string{OutputCapture::kTruncationMarker});
        output.Write("abcde");
        REQUIRE(output.GetLines()[1].text == "abcde");
    }

    SECTION("Embedded newlines start new lines") {
        OutputCapture output(3, 100);
        output.Write("first\nsecond", 1);
        REQUIRE(output.GetLines().size() == 2);
        REQUIRE(output.GetLines()[0].text == "first");
        REQUIRE(output.GetLines()[1].text == "second");
        REQUIRE(output.GetLines()[1].record_index == 1u);

        output.Write("third\nfourth\n");
        REQUIRE(output.GetLines().size() == 3);
        REQUIRE(output.GetLines()[2].text == "third");
        REQUIRE(output.GetDroppedCount() == 2);
    }
}
