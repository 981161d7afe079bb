#include <catch2/catch.hpp>

#include "MockTransport.hpp"
#include "escpos/PrinterSession.hpp"
#include "escpos/command/style/StyleCommands.hpp"

using namespace escpos;
using Bytes = types::Bytes;

TEST_CASE("StyleCommands: font size in range is packed and stored")
{
	MockTransport transport;
	PrinterSession session(transport);

	for (uint8_t w = 0; w <= 7; ++w) {
		for (uint8_t h = 0; h <= 7; ++h) {
			transport.clear();
			auto result = session.style()->setFontSize(w, h);
			CHECK(result.isSuccess());
			REQUIRE(transport.writes.size() == 1);
			CHECK(transport.writes[0] == Bytes{0x1D, '!', static_cast<uint8_t>((w << 4) | h)});
			CHECK(session.state().fontWidth == w);
			CHECK(session.state().fontHeight == h);
		}
	}
}

TEST_CASE("StyleCommands: font size out of range is ignored")
{
	MockTransport transport;
	PrinterSession session(transport);
	session.style()->setFontSize(3, 4);
	transport.clear();

	auto wide = session.style()->setFontSize(8, 1);
	auto tall = session.style()->setFontSize(1, 8);
	auto both = session.style()->setFontSize(255, 255);

	CHECK(wide.isIgnored());
	CHECK(tall.isIgnored());
	CHECK(both.isIgnored());
	CHECK(transport.writes.empty());
	CHECK(session.state().fontWidth == 3);
	CHECK(session.state().fontHeight == 4);
}

TEST_CASE("StyleCommands: toggles mirror the value sent")
{
	MockTransport transport;
	PrinterSession session(transport);
	auto style = session.style();

	SECTION("underline") {
		style->setUnderline(2);
		CHECK(transport.written() == Bytes{0x1B, '-', 2});
		CHECK(session.state().underline == 2);
	}
	SECTION("emphasize") {
		style->setEmphasize(1);
		CHECK(transport.written() == Bytes{0x1B, 'G', 1});
		CHECK(session.state().emphasize == 1);
	}
	SECTION("upside down") {
		style->setUpsidedown(1);
		CHECK(transport.written() == Bytes{0x1B, '{', 1});
		CHECK(session.state().upsideDown == 1);
	}
	SECTION("rotate") {
		style->setRotate(1);
		CHECK(transport.written() == Bytes{0x1B, 'R', 1});
		CHECK(session.state().rotate == 1);
	}
	SECTION("reverse") {
		style->setReverse(1);
		CHECK(transport.written() == Bytes{0x1D, 'B', 1});
		CHECK(session.state().reverse == 1);
	}
	SECTION("smooth") {
		style->setSmooth(1);
		CHECK(transport.written() == Bytes{0x1D, 'b', 1});
		CHECK(session.state().smooth == 1);
	}
	SECTION("values are not range checked") {
		style->setUnderline(0xC8);
		CHECK(transport.written() == Bytes{0x1B, '-', 0xC8});
		CHECK(session.state().underline == 0xC8);
	}
}

TEST_CASE("StyleCommands: send re-transmits the tracked value")
{
	MockTransport transport;
	PrinterSession session(transport);
	session.style()->setEmphasize(1);
	session.style()->setFontSize(2, 3);
	transport.clear();

	session.style()->sendEmphasize();
	session.style()->sendFontSize();
	session.style()->sendReverse();

	CHECK(transport.written() == Bytes{0x1B, 'G', 1, 0x1D, '!', 0x23, 0x1D, 'B', 0});
}

TEST_CASE("StyleCommands: font style does not touch font scale")
{
	MockTransport transport;
	PrinterSession session(transport);

	session.style()->setFontStyle(0x30);
	CHECK(transport.written() == Bytes{0x1B, 0x21, 0x30});
	CHECK(session.state().fontWidth == 1);
	CHECK(session.state().fontHeight == 1);
}

TEST_CASE("StyleCommands: font names")
{
	MockTransport transport;
	PrinterSession session(transport);
	auto style = session.style();

	style->setFont("A");
	style->setFont("B");
	style->setFont("C");
	style->setFont("Z");
	style->setFont(Font::C);

	REQUIRE(transport.writes.size() == 5);
	CHECK(transport.writes[0] == Bytes{0x1B, 'M', 0});
	CHECK(transport.writes[1] == Bytes{0x1B, 'M', 1});
	CHECK(transport.writes[2] == Bytes{0x1B, 'M', 2});
	CHECK(transport.writes[3] == Bytes{0x1B, 'M', 0});
	CHECK(transport.writes[4] == Bytes{0x1B, 'M', 2});
}

TEST_CASE("StyleCommands: alignment names")
{
	MockTransport transport;
	PrinterSession session(transport);
	auto style = session.style();

	style->setAlign("left");
	style->setAlign("center");
	style->setAlign("right");
	style->setAlign("justify");
	style->setAlign(Align::Right);

	REQUIRE(transport.writes.size() == 5);
	CHECK(transport.writes[0] == Bytes{0x1B, 'a', 0});
	CHECK(transport.writes[1] == Bytes{0x1B, 'a', 1});
	CHECK(transport.writes[2] == Bytes{0x1B, 'a', 2});
	CHECK(transport.writes[3] == Bytes{0x1B, 'a', 0});
	CHECK(transport.writes[4] == Bytes{0x1B, 'a', 2});
}

TEST_CASE("StyleCommands: language codes")
{
	MockTransport transport;
	PrinterSession session(transport);

	const char *codes[] = {"en", "fr", "de", "uk", "da", "sv", "it", "es", "ja", "no"};
	uint8_t index = 0;
	for (const char *code : codes) {
		transport.clear();
		session.style()->setLang(code);
		CHECK(transport.written() == Bytes{0x1B, 'R', index});
		++index;
	}

	transport.clear();
	session.style()->setLang("pt");
	CHECK(transport.written() == Bytes{0x1B, 'R', 0});
}

TEST_CASE("StyleCommands: left margin")
{
	MockTransport transport;
	PrinterSession session(transport);

	CHECK(session.style()->setMarginLeft(47).isSuccess());
	CHECK(transport.written() == Bytes{0x1D, 0x4C, 47, 0});

	transport.clear();
	CHECK(session.style()->setMarginLeft(48).isIgnored());
	CHECK(transport.writes.empty());
}

TEST_CASE("StyleCommands: raw byte setters")
{
	MockTransport transport;
	PrinterSession session(transport);

	session.style()->setLetterSpace(4);
	session.style()->setFontColor(0x81);
	session.style()->setChineseOn();

	REQUIRE(transport.writes.size() == 3);
	CHECK(transport.writes[0] == Bytes{0x1B, 0x20, 4});
	CHECK(transport.writes[1] == Bytes{0x1B, 0x72, 0x81});
	CHECK(transport.writes[2] == Bytes{0x1C, 0x26});
}

TEST_CASE("StyleCommands: failed transmission is reported")
{
	MockTransport transport;
	PrinterSession session(transport);
	transport.failWrites = true;

	auto result = session.style()->setUnderline(1);
	CHECK(result.isTransportError());
	// the state still records the requested value, the caller sees the divergence
	CHECK(session.state().underline == 1);
}
