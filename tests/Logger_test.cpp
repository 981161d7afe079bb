#include <catch2/catch.hpp>

#include "MockTransport.hpp"
#include "escpos/PrinterSession.hpp"
#include "logger/Logger.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;

namespace {
	fs::path freshLogDir(const std::string &name)
	{
		auto dir = fs::temp_directory_path() / name;
		fs::remove_all(dir);
		return dir;
	}

	std::string readAll(const fs::path &dir)
	{
		std::string all;
		for (const auto &entry : fs::directory_iterator(dir)) {
			std::ifstream file(entry.path());
			std::stringstream ss;
			ss << file.rdbuf();
			all += ss.str();
		}
		return all;
	}

	struct LevelGuard {
		Logger::Level saved = Logger::getLevel();
		~LevelGuard() { Logger::shutdown(); Logger::setLevel(saved); }
	};
}

TEST_CASE("Logger: each init in the same second gets its own file")
{
	LevelGuard guard;
	auto dir = freshLogDir("escpos_logger_rotation");
	Logger::setLevel(Logger::Level::Error);

	for (int i = 0; i < 3; ++i) {
		Logger::init(dir.string());
		Logger::logError("entry " + std::to_string(i));
	}
	Logger::shutdown();

	int files = 0;
	for (const auto &entry : fs::directory_iterator(dir)) {
		(void)entry;
		++files;
	}
	CHECK(files == 3);

	auto text = readAll(dir);
	CHECK(text.find("entry 0") != std::string::npos);
	CHECK(text.find("entry 1") != std::string::npos);
	CHECK(text.find("entry 2") != std::string::npos);
	fs::remove_all(dir);
}

TEST_CASE("Logger: TX hex dump follows the debug level")
{
	LevelGuard guard;
	MockTransport transport;
	escpos::PrinterSession session(transport);

	SECTION("debug level logs the bytes") {
		auto dir = freshLogDir("escpos_logger_debug");
		Logger::init(dir.string());
		Logger::setLevel(Logger::Level::Debug);
		REQUIRE(session.init().isSuccess());
		Logger::shutdown();
		CHECK(readAll(dir).find("[TX] 1B 40") != std::string::npos);
		fs::remove_all(dir);
	}
	SECTION("higher level skips the dump") {
		auto dir = freshLogDir("escpos_logger_info");
		Logger::init(dir.string());
		Logger::setLevel(Logger::Level::Info);
		REQUIRE(session.init().isSuccess());
		Logger::shutdown();
		CHECK(readAll(dir).find("[TX]") == std::string::npos);
		fs::remove_all(dir);
	}
}
