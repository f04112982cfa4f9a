#include <gridspace/core/Error.hpp>

#include <doctest/doctest.h>

#include <vector>

using namespace GS;

TEST_SUITE("core.error") {
    TEST_CASE("Error string helpers") {
        std::vector<Error::Code> codes;
        for (int i = static_cast<int>(Error::Code::InvalidError);
             i <= static_cast<int>(Error::Code::CapacityExceeded);
             ++i) {
            codes.push_back(static_cast<Error::Code>(i));
        }

        for (auto code : codes) {
            auto label = errorCodeToString(code);
            CHECK_FALSE(label.empty());
            // describeError echoes the label when the message is empty.
            Error e{code, {}};
            CHECK(describeError(e) == std::string{label});
        }

        Error withMsg{Error::Code::MalformedInput, "bad"};
        CHECK(describeError(withMsg) == "malformed_input:bad");

        Error notFound{Error::Code::NotFound, {}};
        CHECK(describeError(notFound) == "not_found");

        auto unknownLabel = errorCodeToString(static_cast<Error::Code>(999));
        CHECK(unknownLabel == "unknown_error");
    }

    TEST_CASE("Expected carries either value or error") {
        Expected<int> ok = 7;
        REQUIRE(ok.has_value());
        CHECK(*ok == 7);

        Expected<int> failed = std::unexpected(Error{Error::Code::IndexOutOfRange, "row 12"});
        REQUIRE_FALSE(failed.has_value());
        CHECK(failed.error().code == Error::Code::IndexOutOfRange);
        CHECK(describeError(failed.error()) == "index_out_of_range:row 12");
    }
}
