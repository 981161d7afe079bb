#include <catch2/catch.hpp>

#include "MockTransport.hpp"
#include "escpos/PrinterSession.hpp"
#include "escpos/command/drawer/DrawerCommands.hpp"

using namespace escpos;
using Bytes = types::Bytes;

TEST_CASE("DrawerCommands")
{
	MockTransport transport;
	PrinterSession session(transport);
	auto drawer = session.drawer();

	drawer->openDrawer();
	drawer->cash();
	drawer->pulse();

	REQUIRE(transport.writes.size() == 3);
	CHECK(transport.writes[0] == Bytes{0x1B, 0x70, 0x00, 0x0A, 0x0A});
	CHECK(transport.writes[1] == Bytes{0x1B, 0x70, 0x00, 0x0A, 0xFF});
	CHECK(transport.writes[2] == Bytes{0x1B, 0x70, 0x02});
}
