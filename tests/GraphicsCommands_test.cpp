#include <catch2/catch.hpp>

#include "MockTransport.hpp"
#include "escpos/PrinterSession.hpp"
#include "escpos/command/graphics/GraphicsCommands.hpp"

using namespace escpos;
using Bytes = types::Bytes;

TEST_CASE("GraphicsCommands: gSend frame layout")
{
	MockTransport transport;
	PrinterSession session(transport);

	Bytes data = {0x80, 0xFF, 0x1B};
	auto result = session.graphics()->gSend(0x30, 0x45, data);

	CHECK(result.isSuccess());
	CHECK(result.bytesWritten == 3 + 4 + 3);
	CHECK(transport.written() == Bytes{0x1B, 0x28, 0x4C, 5, 0, 0x30, 0x45, 0x80, 0xFF, 0x1B});
}

TEST_CASE("GraphicsCommands: length above 255 spills into the high byte")
{
	MockTransport transport;
	PrinterSession session(transport);

	Bytes data(300, 0xAA);
	session.graphics()->gSend(0x30, 0x70, data);

	Bytes written = transport.written();
	REQUIRE(written.size() == 3 + 4 + 300);
	CHECK(written[3] == (302 % 256));
	CHECK(written[4] == (302 / 256));
	CHECK(written[5] == 0x30);
	CHECK(written[6] == 0x70);
	CHECK(Bytes(written.begin() + 7, written.end()) == data);
}

TEST_CASE("GraphicsCommands: oversized payload is ignored")
{
	MockTransport transport;
	PrinterSession session(transport);

	Bytes data(command::graphics::MAX_GRAPHICS_DATA + 1, 0x00);
	CHECK(session.graphics()->gSend(0x30, 0x70, data).isIgnored());
	CHECK(transport.writes.empty());
}

TEST_CASE("GraphicsCommands: raster image store and print")
{
	MockTransport transport;
	PrinterSession session(transport);

	SECTION("10x2 dots needs two bytes per row") {
		Bytes image = {0xFF, 0xC0, 0x81, 0x40};
		auto result = session.graphics()->storeRasterImage(10, 2, image);
		CHECK(result.isSuccess());
		CHECK(transport.written() == concat({
			{0x1B, 0x28, 0x4C, 14, 0, 0x30, 0x70},
			{0x30, 0x01, 0x01, 0x31, 10, 0, 2, 0},
			image
		}));
	}
	SECTION("size mismatch is ignored") {
		CHECK(session.graphics()->storeRasterImage(16, 2, Bytes(3, 0)).isIgnored());
		CHECK(session.graphics()->storeRasterImage(0, 0, {}).isIgnored());
		CHECK(transport.writes.empty());
	}
	SECTION("print stored graphics") {
		session.graphics()->printStoredGraphics();
		CHECK(transport.written() == Bytes{0x1B, 0x28, 0x4C, 2, 0, 0x30, 0x32});
	}
}
