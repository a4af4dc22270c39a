#include <unit_test.hpp>
#include <cstdlib>
#include <exception>
#include <filesystem>
#include <iostream>
#include <vector>

namespace sj::test {
namespace {
struct AssertFailed {};

struct State {
	static auto instance() -> State& {
		static auto ret = State{};
		return ret;
	}

	std::vector<TestCase const*> tests{};
	bool failed{};
};

void print_failure(std::string_view const type, std::string_view const expr, std::string_view const file, int const line) {
	auto const filename = std::filesystem::path{file}.filename().string();
	std::cerr << "  " << type << " failed: '" << expr << "' [" << filename << ":" << line << "]\n";
}
} // namespace

void check_expect(bool const pred, std::string_view const expr, std::string_view const file, int const line) {
	if (pred) { return; }
	print_failure("expectation", expr, file, line);
	State::instance().failed = true;
}

void check_assert(bool const pred, std::string_view const expr, std::string_view const file, int const line) {
	if (pred) { return; }
	print_failure("assertion", expr, file, line);
	State::instance().failed = true;
	throw AssertFailed{};
}

TestCase::TestCase(std::string_view const name) : name(name) { State::instance().tests.push_back(this); }

auto run_tests(std::string_view const filter) -> int {
	auto& state = State::instance();
	auto passed = 0;
	auto failed = 0;
	for (auto const* test : state.tests) {
		if (!filter.empty() && test->name.find(filter) == std::string_view::npos) { continue; }
		state.failed = false;
		try {
			test->run();
		} catch (AssertFailed const&) {
			// reported by check_assert
		} catch (std::exception const& e) {
			std::cerr << "  exception: " << e.what() << '\n';
			state.failed = true;
		}
		if (state.failed) {
			std::cerr << "[FAILED] " << test->name << '\n';
			++failed;
		} else {
			std::cout << "[passed] " << test->name << '\n';
			++passed;
		}
	}
	std::cout << '\n' << passed << " passed, " << failed << " failed\n";
	return failed == 0 ? EXIT_SUCCESS : EXIT_FAILURE;
}
} // namespace sj::test
