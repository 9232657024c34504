#include "gps/core/record.hpp"

#include "testing/scriptedOracle.hpp"

#include <gtest/gtest.h>

#include <array>
#include <string_view>

namespace gps::core {
namespace gtest {

TEST(Record, Parse_AllFields) {
	const ParseResult result = parseRecord("GPS:ZA FE large:-2894701.55:1033798.5:2003378.29:#FF75C9F1:Cluster_ABCD:");
	ASSERT_EQ(result.status, ParseStatus::Ok);

	const CoordinateRecord& record = result.record;
	EXPECT_EQ(record.name, "ZA FE large");
	EXPECT_DOUBLE_EQ(record.position.x, -2894701.55);
	EXPECT_DOUBLE_EQ(record.position.y, 1033798.5);
	EXPECT_DOUBLE_EQ(record.position.z, 2003378.29);
	EXPECT_EQ(record.colour, "#FF75C9F1");
	EXPECT_EQ(record.notes, "Cluster_ABCD");
	EXPECT_FALSE(record.zone.has_value());
	EXPECT_FALSE(record.duplicate);
	EXPECT_TRUE(record.resources.empty());
}

TEST(Record, Parse_SurroundingWhitespace) {
	const ParseResult result = parseRecord("  GPS:Rock:1:2:3:#FF75C9F1::\r\n");
	ASSERT_EQ(result.status, ParseStatus::Ok);
	EXPECT_EQ(result.record.name, "Rock");
	EXPECT_EQ(result.record.notes, "");
}

TEST(Record, Parse_BlankAndComment_Skipped) {
	EXPECT_EQ(parseRecord("").status, ParseStatus::Skipped);
	EXPECT_EQ(parseRecord("   \t").status, ParseStatus::Skipped);
	EXPECT_EQ(parseRecord("# GPS:Rock:1:2:3:#FF75C9F1::").status, ParseStatus::Skipped);
}

TEST(Record, Parse_TooFewFields_Malformed) {
	EXPECT_EQ(parseRecord("GPS:Rock:1:2:3:#FF75C9F1").status, ParseStatus::Malformed);
	EXPECT_EQ(parseRecord("not a coordinate").status, ParseStatus::Malformed);
}

TEST(Record, Parse_BadNumber_Fatal) {
	EXPECT_EQ(parseRecord("GPS:Rock:1:two:3:#FF75C9F1::").status, ParseStatus::BadNumber);
	EXPECT_EQ(parseRecord("GPS:Rock:1:2::#FF75C9F1::").status, ParseStatus::BadNumber);
	EXPECT_EQ(parseRecord("GPS:Rock:1:2:3.5x:#FF75C9F1::").status, ParseStatus::BadNumber);
	EXPECT_EQ(parseRecord("GPS:Rock:nan:2:3:#FF75C9F1::").status, ParseStatus::BadNumber);
	EXPECT_EQ(parseRecord("GPS:Rock:1:inf:3:#FF75C9F1::").status, ParseStatus::BadNumber);
}

TEST(Record, Parse_SignedAndExponent) {
	const ParseResult result = parseRecord("GPS:Rock:+12.5:-0.25:1e3:#FF75C9F1::");
	ASSERT_EQ(result.status, ParseStatus::Ok);
	EXPECT_DOUBLE_EQ(result.record.position.x, 12.5);
	EXPECT_DOUBLE_EQ(result.record.position.y, -0.25);
	EXPECT_DOUBLE_EQ(result.record.position.z, 1000.0);
}

// serialize(parse(line)) keeps name, colour and notes, and the numbers parse back to the same values.
TEST(Record, RoundTrip) {
	static constexpr std::array<std::string_view, 4> LINES = {
	        "GPS:ZA FE large:-2894701.55:1033798.5:2003378.29:#FF75C9F1:Cluster_ABCD:",
	        "GPS:Cluster Alpha (north, 2):0:0:0:#FFFFFF00::",
	        "GPS:ZB U , SI 10k:123456.789:-0.001:98765.4321:#FFA1B2C3:notes with spaces:",
	        "GPS:Rock:1e-3:5:-7:#FF000000:x:",
	};

	for (const auto line: LINES) {
		const ParseResult first = parseRecord(line);
		ASSERT_EQ(first.status, ParseStatus::Ok) << line;

		const std::string serialized = toGpsLine(first.record);
		const ParseResult second     = parseRecord(serialized);
		ASSERT_EQ(second.status, ParseStatus::Ok) << serialized;

		EXPECT_EQ(second.record.name, first.record.name);
		EXPECT_EQ(second.record.colour, first.record.colour);
		EXPECT_EQ(second.record.notes, first.record.notes);
		EXPECT_EQ(second.record.position.x, first.record.position.x);
		EXPECT_EQ(second.record.position.y, first.record.position.y);
		EXPECT_EQ(second.record.position.z, first.record.position.z);
		EXPECT_EQ(serialized.back(), ':');
	}
}

TEST(Record, Serialize_Format) {
	const CoordinateRecord record = gps::gtest::makeRecord("ZA FE", 1.5, -2.0, 300000.25);
	EXPECT_EQ(toGpsLine(record), "GPS:ZA FE:1.5:-2:300000.25:#FF75C9F1::");

	// Round numbers stay in plain notation.
	const CoordinateRecord far = gps::gtest::makeRecord("ZC SI", 100000.0, 20000000.0, 0.001);
	EXPECT_EQ(toGpsLine(far), "GPS:ZC SI:100000:20000000:0.001:#FF75C9F1::");
}

TEST(Record, Distance_RoundedAndSymmetric) {
	const CoordinateRecord a = gps::gtest::makeRecord("a", 0.0, 0.0, 0.0);
	const CoordinateRecord b = gps::gtest::makeRecord("b", 3.0, 4.0, 12.0);
	const CoordinateRecord c = gps::gtest::makeRecord("c", 0.4, 0.0, 0.0);
	const CoordinateRecord d = gps::gtest::makeRecord("d", 1000.6, 0.0, 0.0);

	EXPECT_EQ(distance(a, b), 13);
	EXPECT_EQ(distance(b, a), 13);
	EXPECT_EQ(distance(a, a), 0);
	EXPECT_EQ(distance(a, c), 0);
	EXPECT_EQ(distance(a, d), 1001);
	EXPECT_EQ(distance(c, d), distance(d, c));
}

TEST(Record, ClusterMarker_Prefix) {
	EXPECT_TRUE(isClusterMarker(gps::gtest::makeRecord("Cluster North", 0, 0, 0), "Cluster"));
	EXPECT_TRUE(isClusterMarker(gps::gtest::makeRecord("Cluster", 0, 0, 0), "Cluster"));
	EXPECT_FALSE(isClusterMarker(gps::gtest::makeRecord("ZA FE", 0, 0, 0), "Cluster"));
	EXPECT_FALSE(isClusterMarker(gps::gtest::makeRecord("cluster north", 0, 0, 0), "Cluster"));
}

TEST(Record, SanitizeFolderName) {
	EXPECT_EQ(sanitizeFolderName("Cluster ABCD"), "Cluster_ABCD");
	EXPECT_EQ(sanitizeFolderName("Cluster (north, far)"), "Cluster_north_far");
	EXPECT_EQ(sanitizeFolderName(""), "");
}

} // namespace gtest
} // namespace gps::core
