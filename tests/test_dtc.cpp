#include <gtest/gtest.h>
#include <diag/dtc.hpp>

using namespace vhil::diag;

TEST(DtcCodec, EncodesDomainAndDigits) {
  auto raw = EncodeDtc("P0171");
  ASSERT_TRUE(raw.has_value());
  EXPECT_EQ((*raw)[0], 0x02);
  EXPECT_EQ((*raw)[1], 0x01);
  EXPECT_EQ((*raw)[2], 0x71);

  EXPECT_EQ((*EncodeDtc("B1234"))[0], 0x08);
  EXPECT_EQ((*EncodeDtc("C0035"))[0], 0x01);
  EXPECT_EQ((*EncodeDtc("U0100"))[0], 0x00);
}

TEST(DtcCodec, HexDigitsAreAccepted) {
  auto raw = EncodeDtc("U3FAB");
  ASSERT_TRUE(raw.has_value());
  EXPECT_EQ((*raw)[1], 0x3F);
  EXPECT_EQ((*raw)[2], 0xAB);
  EXPECT_EQ(DecodeDtc(*raw), "U3FAB");
}

TEST(DtcCodec, NormalizeUpperCasesHexDigits) {
  EXPECT_EQ(NormalizeDtcCode("P0a7f"), "P0A7F");
  EXPECT_EQ(NormalizeDtcCode("U3FAB"), "U3FAB");
  EXPECT_EQ(EncodeDtc("P0a7f"), EncodeDtc("P0A7F"));
}

TEST(DtcCodec, DecodeInvertsEncode) {
  for (const char* code : {"P0171", "B1234", "C0035", "U0100"}) {
    auto raw = EncodeDtc(code);
    ASSERT_TRUE(raw.has_value()) << code;
    EXPECT_EQ(DecodeDtc(*raw), std::string(code));
  }
}

TEST(DtcCodec, UnknownDomainByteDecodesToNothing) {
  EXPECT_FALSE(DecodeDtc({0x05, 0x01, 0x71}).has_value());
}

TEST(DtcCodec, MalformedCodesAreRejected) {
  EXPECT_FALSE(IsValidDtcCode(""));
  EXPECT_FALSE(IsValidDtcCode("P017"));
  EXPECT_FALSE(IsValidDtcCode("P01711"));
  EXPECT_FALSE(IsValidDtcCode("X0171"));
  EXPECT_FALSE(IsValidDtcCode("P01G1"));
  EXPECT_FALSE(EncodeDtc("Z1234").has_value());
  EXPECT_TRUE(IsValidDtcCode("P0171"));
}
