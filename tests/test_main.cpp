#define DOCTEST_CONFIG_IMPLEMENT
#include <doctest/doctest.h>

#include <iostream>

struct show_test_start : public doctest::IReporter {
	show_test_start(const doctest::ContextOptions &) {}

	void test_case_start(const doctest::TestCaseData &in) override {
		std::cout << "Test: " << in.m_name << std::endl;
	}

	void report_query(const doctest::QueryData &) override {}
	void test_run_start() override {}
	void test_run_end(const doctest::TestRunStats &) override {}
	void test_case_reenter(const doctest::TestCaseData &) override {}
	void test_case_end(const doctest::CurrentTestCaseStats &) override {}
	void test_case_exception(const doctest::TestCaseException &) override {}
	void subcase_start(const doctest::SubcaseSignature &) override {}
	void subcase_end() override {}
	void log_assert(const doctest::AssertData &) override {}
	void log_message(const doctest::MessageData &) override {}
	void test_case_skipped(const doctest::TestCaseData &) override {}
};

REGISTER_LISTENER("show_test_start", 1, show_test_start);

int main(int argc, char **argv) {
	doctest::Context context;
	context.applyCommandLine(argc, argv);

	return context.run();
}
