#include <catch2/catch.hpp>

#include "escpos/PrinterSession.hpp"
#include "escpos/command/paper/PaperCommands.hpp"
#include "escpos/transport/impl/FileTransport.hpp"
#include "escpos/types/Error.hpp"

#include <filesystem>
#include <fstream>
#include <iterator>

using namespace escpos;
using escpos::transport::FileTransport;
using Bytes = types::Bytes;

namespace {
	std::string capturePath(const std::string &name)
	{
		auto path = std::filesystem::temp_directory_path() / name;
		std::filesystem::remove(path);
		return path.string();
	}

	void seed(const std::string &path, const std::string &content)
	{
		std::ofstream file(path, std::ios::binary | std::ios::trunc);
		file << content;
	}

	Bytes contents(const std::string &path)
	{
		std::ifstream file(path, std::ios::binary);
		return Bytes(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
	}
}

TEST_CASE("FileTransport: written bytes land in the file")
{
	auto path = capturePath("escpos_file_write.bin");
	{
		FileTransport transport(path, false);
		const uint8_t data[] = {0x1B, 0x40, 0x00, 0xFA};
		CHECK(transport.write(data, sizeof(data)) == sizeof(data));
		CHECK(transport.isOpen());
	}
	CHECK(contents(path) == Bytes{0x1B, 0x40, 0x00, 0xFA});
	std::filesystem::remove(path);
}

TEST_CASE("FileTransport: read on a write-only transport throws")
{
	auto path = capturePath("escpos_file_writeonly.bin");
	FileTransport transport(path, false);
	uint8_t buffer[1];
	CHECK_THROWS_AS(transport.read(buffer, 1), types::TransportException);
}

TEST_CASE("FileTransport: write-only open truncates")
{
	auto path = capturePath("escpos_file_trunc.bin");
	seed(path, "previous contents");
	{
		FileTransport transport(path, false);
	}
	CHECK(std::filesystem::file_size(path) == 0);
	std::filesystem::remove(path);
}

TEST_CASE("FileTransport: readable capture file holds only the new job")
{
	auto path = capturePath("escpos_file_rejob.bin");
	seed(path, "OLDJOB-OLDJOB-OLDJOB");
	{
		FileTransport transport(path, true);
		PrinterSession session(transport);
		REQUIRE(session.init().isSuccess());
		REQUIRE(session.paper()->cut().isSuccess());
	}
	CHECK(contents(path) == Bytes{0x1B, 0x40, 0x1D, 0x56, 0x41, 0x30});
	std::filesystem::remove(path);
}

TEST_CASE("FileTransport: readable open creates a missing file")
{
	auto path = capturePath("escpos_file_missing.bin");
	REQUIRE_FALSE(std::filesystem::exists(path));
	{
		FileTransport transport(path, true);
		uint8_t buffer[4];
		CHECK(transport.read(buffer, sizeof(buffer)) == 0);
	}
	CHECK(std::filesystem::exists(path));
	std::filesystem::remove(path);
}

TEST_CASE("FileTransport: unopenable path throws")
{
	CHECK_THROWS_AS(FileTransport("/nonexistent-dir/escpos.bin", false), types::TransportException);
}
