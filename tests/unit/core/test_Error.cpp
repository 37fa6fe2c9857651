#include <kmsdash/core/Error.hpp>

#include <doctest/doctest.h>

#include <vector>

using namespace KD;

TEST_SUITE("core.error") {
    TEST_CASE("Error string helpers") {
        std::vector<Error::Code> codes;
        for (int i = static_cast<int>(Error::Code::InvalidError);
             i <= static_cast<int>(Error::Code::IoFailure);
             ++i) {
            codes.push_back(static_cast<Error::Code>(i));
        }

        for (auto code : codes) {
            auto label = errorCodeToString(code);
            CHECK_FALSE(label.empty());
            // describeError echoes the label when message is absent.
            Error e{code, {}};
            CHECK(describeError(e) == std::string{label});
        }

        Error withMsg{Error::Code::SpawnFailed, "python3: No such file or directory"};
        CHECK(describeError(withMsg) == "spawn_failed:python3: No such file or directory");

        Error withoutMsg{Error::Code::NotFound, {}};
        CHECK(describeError(withoutMsg) == "not_found");

        CHECK(errorCodeToString(Error::Code::ConfigValidation) == "config_validation");
        CHECK(errorCodeToString(static_cast<Error::Code>(999)) == "unknown_error");
    }
}
