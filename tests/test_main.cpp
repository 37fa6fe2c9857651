#define DOCTEST_CONFIG_IMPLEMENT
#include <doctest/doctest.h>

#include <kmsdash/log/TaggedLogger.hpp>

#include <cstdlib>
#include <cstring>
#include <iostream>
#include <mutex>

struct ShowTestStart : public doctest::IReporter {
    ShowTestStart(const doctest::ContextOptions& /* in */) {
    }
    void test_case_start(const doctest::TestCaseData& in) override {
#ifdef KD_LOG_DEBUG
        std::lock_guard<std::mutex> lock(KD::TaggedLogger::coutMutex);
#endif
        std::cout << "Test: " << in.m_name << std::endl;
    }
    void report_query(const doctest::QueryData&) override {
    }
    void test_run_start() override {
    }
    void test_run_end(const doctest::TestRunStats&) override {
    }
    void test_case_reenter(const doctest::TestCaseData&) override {
    }
    void test_case_end(const doctest::CurrentTestCaseStats&) override {
    }
    void test_case_exception(const doctest::TestCaseException&) override {
    }
    void subcase_start(const doctest::SubcaseSignature& in) override {
#ifdef KD_LOG_DEBUG
        std::lock_guard<std::mutex> lock(KD::TaggedLogger::coutMutex);
#endif
        std::cout << "\tSubcase: " << in.m_name << std::endl;
    }
    void subcase_end() override {
    }
    void log_assert(const doctest::AssertData&) override {
    }
    void log_message(const doctest::MessageData&) override {
    }
    void test_case_skipped(const doctest::TestCaseData&) override {
    }
};

REGISTER_LISTENER("test_start", 1, ShowTestStart);

int main(int argc, char** argv) {
#ifdef KD_LOG_DEBUG
    KD::set_logging_enabled(false);
#endif

    doctest::Context context;
    context.applyCommandLine(argc, argv);

#ifdef KD_LOG_DEBUG
    KD::set_thread_name("TestMain");
    bool enableLog = false;
    if (const char* _env_log = std::getenv("KMSDASH_LOG")) {
        if (std::strcmp(_env_log, "0") != 0) enableLog = true;
    }
#endif

    if (context.shouldExit()) {
        return context.run();
    }

#ifdef KD_LOG_DEBUG
    if (enableLog) {
        KD::set_logging_enabled(true);
        kd_log("Starting test execution", "TEST");
    }
#endif

    int res = context.run();

#ifdef KD_LOG_DEBUG
    if (enableLog) {
        kd_log(res == 0 ? "All tests passed" : "Some tests failed", "TEST");
    }
#endif

    return res;
}
