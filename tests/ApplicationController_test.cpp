#include <catch2/catch.hpp>

#include "application/controllers/ApplicationController.hpp"
#include "logger/Logger.hpp"

#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>

namespace fs = std::filesystem;

namespace {
	struct FileBackedController {
		fs::path capture = fs::temp_directory_path() / "escpos_cli_capture.bin";
		fs::path configFile = fs::temp_directory_path() / "escpos_cli_config.json";
		Logger::Level savedLevel = Logger::getLevel();
		ApplicationController app;

		FileBackedController()
		{
			nlohmann::json json = {
				{"transport", {{"type", "file"}}},
				{"file", {{"path", capture.string()}, {"readable", true}}},
				{"printer", {{"init", {{"on", {{"start", false}}}}}}},
				{"logging", {{"level", "error"}}}
			};
			std::ofstream(configFile) << json.dump(2);
		}

		~FileBackedController()
		{
			app.shutdown();
			Logger::setLevel(savedLevel);
			fs::remove(capture);
			fs::remove(configFile);
		}
	};
}

TEST_CASE("ApplicationController: status type outside a byte is refused")
{
	FileBackedController fixture;
	REQUIRE(fixture.app.initialize(fixture.configFile.string()));

	CHECK(fixture.app.run({"status", "260"}) == 2);
	CHECK(fixture.app.run({"status", "-1"}) == 2);
	CHECK(fixture.app.run({"status", "abc"}) == 2);
	CHECK(fs::file_size(fixture.capture) == 0);
}

TEST_CASE("ApplicationController: status query is sent for a valid type")
{
	FileBackedController fixture;
	REQUIRE(fixture.app.initialize(fixture.configFile.string()));

	// the capture file has no reply byte, so the read fails after the request
	CHECK(fixture.app.run({"status", "4"}) == 1);
	CHECK(fs::file_size(fixture.capture) == 3);
}
