#include "swedish_bban_mapper.hpp"
#include "log_capture.hpp"

#include <gtest/gtest.h>

using namespace duckdb::ibangen;
using duckdb::ibangen::accountgen::SwedishBbanMapper;

TEST(SwedishBbanMapperTest, DanskeRoundTrip) {
    SwedishBbanMapper mapper;
    auto iban_part = mapper.ToIbanPart("123456789012345");
    EXPECT_EQ(iban_part, "12000000056789012345");
    EXPECT_TRUE(mapper.HasDiscoveredMapping());
    EXPECT_EQ(mapper.GetBbanPrefix(), "1234");
    EXPECT_EQ(mapper.GetIbanPrefix(), "120000000");
    EXPECT_EQ(mapper.ToNationalBban(iban_part), "123456789012345");
}

TEST(SwedishBbanMapperTest, NationalBbanIsStable) {
    SwedishBbanMapper mapper;
    auto once = mapper.ToNationalBban("50000000058398257466");
    EXPECT_EQ(once, "58398257466");
    EXPECT_EQ(mapper.ToNationalBban("50000000058398257466"), once);
    EXPECT_EQ(mapper.GetBbanPrefix(), "5839");
    EXPECT_EQ(mapper.GetIbanPrefix(), "5000000005839");
}

TEST(SwedishBbanMapperTest, SebAndSwedbank) {
    SwedishBbanMapper seb;
    EXPECT_EQ(seb.ToIbanPart("51231234567"), "50000000051231234567");

    SwedishBbanMapper swedbank;
    EXPECT_EQ(swedbank.ToIbanPart("71231234567"), "80000000071231234567");
    EXPECT_EQ(swedbank.ToNationalBban("80000000071230000001"), "71230000001");

    SwedishBbanMapper swedbank8;
    EXPECT_EQ(swedbank8.ToIbanPart("812341234567890"), "80000812341234567890");
}

TEST(SwedishBbanMapperTest, IcaAndHandelsbanken) {
    SwedishBbanMapper ica;
    EXPECT_EQ(ica.ToIbanPart("92711234567"), "92700000092711234567");
    EXPECT_EQ(ica.GetIbanPrefix(), "9270000009271");

    SwedishBbanMapper handelsbanken;
    EXPECT_EQ(handelsbanken.ToIbanPart("6789123456789"), "60000000000123456789");
    EXPECT_EQ(handelsbanken.ToNationalBban("60000000000123456789"), "6789123456789");
}

TEST(SwedishBbanMapperTest, Plusgirot) {
    SwedishBbanMapper mapper;
    EXPECT_EQ(mapper.ToIbanPart("12345678"), "95000099600012345678");
    EXPECT_EQ(mapper.GetBbanPrefix(), "");
    EXPECT_EQ(mapper.ToNationalBban("95000099600087654321"), "87654321");

    SwedishBbanMapper fresh;
    EXPECT_EQ(fresh.ToNationalBban("95000099600087654321"), "87654321");
}

TEST(SwedishBbanMapperTest, StandardLengthPassesThrough) {
    SwedishBbanMapper mapper;
    EXPECT_EQ(mapper.ToIbanPart("12345678901234567890"), "12345678901234567890");
    EXPECT_FALSE(mapper.HasDiscoveredMapping());
    EXPECT_EQ(mapper.ToNationalBban("12345678901234567890"), "12345678901234567890");
}

TEST(SwedishBbanMapperTest, UnknownFormatIsLogged) {
    LogCapture capture;
    SwedishBbanMapper mapper;
    EXPECT_EQ(mapper.ToIbanPart("NOT-A-BBAN"), "NOT-A-BBAN");
    EXPECT_FALSE(mapper.HasDiscoveredMapping());
    EXPECT_TRUE(capture.Contains(LogLevel::WARN, "Unrecognized Swedish BBAN format: NOT-A-BBAN"));
}

// One mapper serves one bank, a second bank's number gets the first bank's prefix
TEST(SwedishBbanMapperTest, FirstBankWins) {
    SwedishBbanMapper mapper;
    mapper.ToIbanPart("123456789012345");
    EXPECT_EQ(mapper.ToIbanPart("51231234567"), "1200000001234567");
}
