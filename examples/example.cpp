#include "Errors.hpp"
#include "Settings.hpp"
#include "Transport.hpp"
#include "WebhookNotifier.hpp"

#include <iostream>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include <spdlog/spdlog.h>

void printStatistics(const http_notifier::RetryStatistics& stats) {
	std::cout << "  Attempts: " << stats.attemptNumber << std::endl;
	std::cout << "  Idle for: " << stats.idleFor << "s" << std::endl;
	std::cout << "  Since first attempt: " << stats.delaySinceFirstAttempt << "s" << std::endl;
}

void printAttempts(const std::vector<http_notifier::Attempt>& attempts) {
	for (const auto& attempt : attempts) {
		auto kind = http_notifier::failureKindOf(attempt.outcome);
		std::cout << "  #" << attempt.index << " "
				  << (kind ? http_notifier::toString(*kind) : std::string_view("Success"));
		if (attempt.delay > 0)
			std::cout << ", waited " << attempt.delay << "s";
		std::cout << std::endl;
	}
}

int main(int argc, char** argv) {
	std::cout << "========================================" << std::endl;
	std::cout << "   HttpNotifier Example" << std::endl;
	std::cout << "========================================" << std::endl << std::endl;

	if (argc < 2) {
		std::cerr << "usage: " << argv[0] << " <config.json>" << std::endl;
		return 2;
	}

	spdlog::set_level(spdlog::level::debug);

	try {
		const auto settings = http_notifier::Settings::load(argv[1]);
		http_notifier::WebhookNotifier notifier(settings, std::make_shared<http_notifier::CurlTransport>());

		int failures = 0;
		for (const auto& [name, endpoint] : settings.targets) {
			std::cout << "\nRunning target: " << name << std::endl;
			std::cout << "----------------------------------------" << std::endl;

			nlohmann::json payload = {
				{"username", "http-notifier"},
				{"text", "This is a simple text"}
			};

			try {
				std::string response = notifier.notify(endpoint, payload);
				std::cout << "Delivered: " << response << std::endl;
			} catch (const http_notifier::RetryError& e) {
				++failures;
				std::cerr << "Failure: " << e.what() << std::endl;
			}
			printAttempts(notifier.lastAttempts());
			printStatistics(notifier.lastStatistics());
		}

		return failures == 0 ? 0 : 1;
	} catch (const std::exception& e) {
		std::cerr << "Failed with exception: " << e.what() << std::endl;
		return 1;
	}
}
