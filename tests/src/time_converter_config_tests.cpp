/**
 * @file time_converter_config_tests.cpp
 * @brief Unit tests for converter configuration: clock, defaults and conversion traces.
 */
#include "TimeConverter/TimeConverter.hpp"
#include "gtest/gtest.h"
#include <gmock/gmock.h>
#include "helpers/TestHelpers.hpp"

#include <string>

#include <absl/time/clock.h>

using ::testing::AllOf;
using ::testing::Field;
using ::testing::HasSubstr;
using ::testing::MockFunction;
using ::testing::Return;
using ::testing::StrEq;

TEST(TimeConverterConfigTests, Now_HasUtcZoneAttached)
{
    // Arrange
    const TimeConverter converter;
    const absl::Time before = absl::Now() - absl::Seconds(1);

    // Act
    const UniversalTimestamp now = converter.Now();

    // Assert
    EXPECT_EQ("UTC", now.ZoneName());
    EXPECT_EQ(0, now.UtcOffsetSeconds());
    EXPECT_LE(before, now.Instant());
    EXPECT_GE(absl::Now() + absl::Seconds(1), now.Instant());
}

TEST(TimeConverterConfigTests, Now_ReadsConfiguredClockAtMicrosecondPrecision)
{
    // Arrange
    MockFunction<absl::Time()> clock;
    const absl::Time instant = absl::FromUnixNanos(1328257004456789123);
    EXPECT_CALL(clock, Call()).WillOnce(Return(instant));

    TimeConverterConfig config;
    config.clock = clock.AsStdFunction();
    const TimeConverter converter(config);

    // Act
    const UniversalTimestamp now = converter.Now();

    // Assert
    EXPECT_EQ(absl::FromUnixMicros(1328257004456789), now.Instant());
    EXPECT_EQ(MakeNaive(2012, 2, 3, 8, 16, 44, 456789), now.WallClock());
}

TEST(TimeConverterConfigTests, Now_WithoutClock_FallsBackToSystemClock)
{
    // Arrange
    TimeConverterConfig config;
    config.clock = nullptr;
    const TimeConverter converter(config);

    // Act
    const UniversalTimestamp now = converter.Now();

    // Assert
    EXPECT_LT(absl::UnixEpoch(), now.Instant());
}

TEST(TimeConverterConfigTests, DefaultZone_AppliesToNaiveInputWithoutZoneName)
{
    // Arrange
    TimeConverterConfig config;
    config.defaultZone = "EST";
    const TimeConverter converter(config);
    const TimeConverter utcConverter;

    // Act
    const UniversalTimestamp fromNaive = converter.ToUniversal(MakeNaive(2012, 2, 1, 6, 56, 31));
    const UniversalTimestamp fromText = converter.FromLocal("2012-02-01 06:56:31");

    // Assert
    const UniversalTimestamp expected = MakeZoned(utcConverter, "UTC", MakeNaive(2012, 2, 1, 11, 56, 31));
    EXPECT_EQ(expected, fromNaive);
    EXPECT_EQ(expected, fromText);
}

TEST(TimeConverterConfigTests, DefaultZone_Unknown_ThrowsOnConstruction)
{
    // Arrange
    TimeConverterConfig config;
    config.defaultZone = "Unknown/Zone";

    // Act & Assert
    EXPECT_THROW(TimeConverter{config}, UnknownZoneError);
}

TEST(TimeConverterConfigTests, DefaultPattern_AppliesWhenNoPatternGiven)
{
    // Arrange
    TimeConverterConfig config;
    config.defaultPattern = "%d.%m.%Y %H:%M";
    const TimeConverter converter(config);

    // Act
    const std::string rendered = converter.Format(converter.FromUnix(std::int64_t{1328097391}), "Europe/Amsterdam");

    // Assert
    EXPECT_EQ("01.02.2012 12:56", rendered);
    EXPECT_EQ("2012-02-01T12:56:31+01:00", converter.Format(converter.FromUnix(std::int64_t{1328097391}), "Europe/Amsterdam", ""));
}

TEST(TimeConverterConfigTests, OnTrace_ReportsEachPublicOperationOnce)
{
    // Arrange
    MockFunction<void(const ConversionTrace&)> onTrace;
    TimeConverterConfig config;
    config.onTrace = onTrace.AsStdFunction();
    const TimeConverter converter(config);

    EXPECT_CALL(onTrace, Call(AllOf(Field(&ConversionTrace::operation, StrEq("ToUniversal")),
                                    Field(&ConversionTrace::detail, HasSubstr("text '2012-02-01 06:56:31' in zone EST")))))
        .Times(1);
    EXPECT_CALL(onTrace, Call(Field(&ConversionTrace::operation, StrEq("FromUnix")))).Times(1);
    EXPECT_CALL(onTrace, Call(Field(&ConversionTrace::operation, StrEq("ToUnix")))).Times(1);
    EXPECT_CALL(onTrace, Call(AllOf(Field(&ConversionTrace::operation, StrEq("ToLocal")),
                                    Field(&ConversionTrace::detail, HasSubstr("to zone Pacific/Auckland")))))
        .Times(1);

    // Act
    const UniversalTimestamp universal = converter.ToUniversal("2012-02-01 06:56:31", "EST");
    const EpochTimestamp epochSeconds = converter.ToUnix(universal);
    converter.FromUnix(epochSeconds);
    converter.ToLocal(std::int64_t{0}, "Pacific/Auckland");
}

TEST(TimeConverterConfigTests, OnTrace_FormatReportsLocalConversionAndRendering)
{
    // Arrange
    MockFunction<void(const ConversionTrace&)> onTrace;
    TimeConverterConfig config;
    config.onTrace = onTrace.AsStdFunction();
    const TimeConverter converter(config);

    ::testing::InSequence sequence;
    EXPECT_CALL(onTrace, Call(Field(&ConversionTrace::operation, StrEq("ToLocal"))));
    EXPECT_CALL(onTrace, Call(AllOf(Field(&ConversionTrace::operation, StrEq("Format")),
                                    Field(&ConversionTrace::detail, HasSubstr("pattern '%H'")))));

    // Act
    const std::string rendered = converter.Format(std::int64_t{1328097391}, "EST", "%H");

    // Assert
    EXPECT_EQ("06", rendered);
}

TEST(TimeConverterConfigTests, OnTrace_IsReportedBeforeRejection)
{
    // Arrange
    MockFunction<void(const ConversionTrace&)> onTrace;
    TimeConverterConfig config;
    config.onTrace = onTrace.AsStdFunction();
    const TimeConverter converter(config);

    EXPECT_CALL(onTrace, Call(Field(&ConversionTrace::detail, StrEq("unsupported value in zone UTC")))).Times(1);

    // Act & Assert
    EXPECT_THROW(converter.ToUniversal(TimeValue()), TypeInputError);
}
