#include <catch2/catch_test_macros.hpp>
#include "compiler/error_formatting/argument_error.h"

using namespace signal_lambda::error_formatting;

TEST_CASE("ArgumentCountError wording", "[compiler][errors]") {
    REQUIRE(ArgumentCountError("len", 1, 1, 2).Format() == "len() takes exactly one argument (2 given)");
    REQUIRE(ArgumentCountError("copy", 0, 0, 1).Format() == "copy() takes no arguments (1 given)");
    REQUIRE(ArgumentCountError("atan2", 2, 2, 1).Format() == "atan2() takes exactly 2 arguments (1 given)");
    REQUIRE(ArgumentCountError("range", 1, 3, 0).Format() == "range() takes at least 1 argument (0 given)");
    REQUIRE(ArgumentCountError("round", 1, 2, 3).Format() == "round() takes at most 2 arguments (3 given)");
}

TEST_CASE("UnknownIdentifierError suggestions", "[compiler][errors]") {
    std::vector<std::string> known{"signals", "result", "len", "enumerate"};

    REQUIRE(UnknownIdentifierError("resutl", known).Format() ==
            "Unknown identifier: resutl (did you mean 'result'?)");
    REQUIRE(UnknownIdentifierError("enumerat", known).Format() ==
            "Unknown identifier: enumerat (did you mean 'enumerate'?)");
    REQUIRE(UnknownIdentifierError("foo", known).Format() == "Unknown identifier: foo");
    REQUIRE(UnknownIdentifierError("x", {}).Format() == "Unknown identifier: x");
}

TEST_CASE("UnexpectedKeywordError wording", "[compiler][errors]") {
    REQUIRE(UnexpectedKeywordError("sorted", "key").Format() ==
            "sorted() got an unexpected keyword argument 'key'");
}
