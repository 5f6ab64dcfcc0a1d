#include "cnclink/GrblProtocol.hpp"
#include "mock_grbl.hpp"
#include <gtest/gtest.h>

// =============================================================================
// Response parsing
// =============================================================================

TEST(GrblProtocolTest, ParsesMinimalIdleStatus) {
    const GrblResponse response = GrblProtocol::parseResponse("<Idle|MPos:1.000,2.000,3.000|FS:0,0>");

    ASSERT_EQ(response.type, ResponseType::STATUS);
    const GrblStatus& status = response.status;
    EXPECT_EQ(status.state, MachineState::IDLE);
    ASSERT_TRUE(status.machinePosition);
    EXPECT_TRUE(status.machinePosition->isApprox(Eigen::Vector3d(1.0, 2.0, 3.0)));
    EXPECT_FALSE(status.workPosition);
    EXPECT_FALSE(status.workCoordinateOffset);
    ASSERT_TRUE(status.feedRate);
    EXPECT_DOUBLE_EQ(*status.feedRate, 0.0);
    EXPECT_FALSE(status.overrides);
    EXPECT_FALSE(status.pins.any());
}

TEST(GrblProtocolTest, ParsesFullStatusReport) {
    GrblStatus status;
    ASSERT_TRUE(GrblProtocol::parseStatusReport(
        "<Hold:0|WPos:1.500,-2.000,3.250|Bf:15,128|FS:500,8000|Ov:110,50,90|Pn:XZP|A:SF|Ln:42>", status));

    EXPECT_EQ(status.state, MachineState::HOLD);
    ASSERT_TRUE(status.subState);
    EXPECT_EQ(*status.subState, 0);
    ASSERT_TRUE(status.workPosition);
    EXPECT_TRUE(status.workPosition->isApprox(Eigen::Vector3d(1.5, -2.0, 3.25)));
    EXPECT_FALSE(status.machinePosition);
    EXPECT_EQ(*status.plannerBlocksAvailable, 15);
    EXPECT_EQ(*status.rxBytesAvailable, 128);
    EXPECT_DOUBLE_EQ(*status.feedRate, 500.0);
    EXPECT_DOUBLE_EQ(*status.spindleSpeed, 8000.0);
    ASSERT_TRUE(status.overrides);
    EXPECT_EQ(status.overrides->feed, 110);
    EXPECT_EQ(status.overrides->rapid, 50);
    EXPECT_EQ(status.overrides->spindle, 90);
    EXPECT_TRUE(status.pins.limitX);
    EXPECT_FALSE(status.pins.limitY);
    EXPECT_TRUE(status.pins.limitZ);
    EXPECT_TRUE(status.pins.probe);
    EXPECT_TRUE(status.accessories.spindleCW);
    EXPECT_TRUE(status.accessories.flood);
    EXPECT_FALSE(status.accessories.mist);
    EXPECT_EQ(*status.lineNumber, 42);
}

TEST(GrblProtocolTest, ResolvesWorkPositionFromOffset) {
    GrblStatus status;
    ASSERT_TRUE(GrblProtocol::parseStatusReport("<Run|MPos:10.000,5.000,0.000|WCO:2.000,1.000,-1.000>", status));
    EXPECT_EQ(status.state, MachineState::RUN);

    const auto work = status.resolvedWorkPosition();
    ASSERT_TRUE(work);
    EXPECT_TRUE(work->isApprox(Eigen::Vector3d(8.0, 4.0, 1.0)));

    GrblStatus bare;
    ASSERT_TRUE(GrblProtocol::parseStatusReport("<Idle|MPos:1.000,1.000,1.000>", bare));
    EXPECT_FALSE(bare.resolvedWorkPosition());
}

TEST(GrblProtocolTest, ClassifiesResponses) {
    EXPECT_EQ(GrblProtocol::parseResponse("ok").type, ResponseType::OK);
    EXPECT_EQ(GrblProtocol::parseResponse("ok\r\n").type, ResponseType::OK);

    const GrblResponse error = GrblProtocol::parseResponse("error:20");
    EXPECT_EQ(error.type, ResponseType::ERROR);
    EXPECT_EQ(error.code, 20);
    EXPECT_EQ(error.message, GrblProtocol::errorDescription(20));

    const GrblResponse alarm = GrblProtocol::parseResponse("ALARM:9");
    EXPECT_EQ(alarm.type, ResponseType::ALARM);
    EXPECT_EQ(alarm.code, 9);
    EXPECT_NE(alarm.message.find("Homing fail"), std::string::npos);

    const GrblResponse setting = GrblProtocol::parseResponse("$110=500.000");
    EXPECT_EQ(setting.type, ResponseType::SETTING);
    EXPECT_EQ(setting.settingNumber, 110);
    EXPECT_EQ(setting.settingValue, "500.000");

    const GrblResponse welcome = GrblProtocol::parseResponse("Grbl 1.1h ['$' for help]");
    EXPECT_EQ(welcome.type, ResponseType::WELCOME);
    EXPECT_EQ(welcome.version, "1.1h");

    const GrblResponse feedback = GrblProtocol::parseResponse("[MSG:'$H'|'$X' to unlock]");
    EXPECT_EQ(feedback.type, ResponseType::FEEDBACK);
    EXPECT_EQ(feedback.message, "MSG:'$H'|'$X' to unlock");
}

TEST(GrblProtocolTest, UnknownCodesGetGenericDescriptions) {
    EXPECT_EQ(GrblProtocol::errorDescription(99), "Unknown error 99");
    EXPECT_EQ(GrblProtocol::alarmDescription(42), "Unknown alarm 42");
    EXPECT_FALSE(GrblProtocol::errorDescription(1).empty());
    EXPECT_FALSE(GrblProtocol::alarmDescription(1).empty());
}

TEST(GrblProtocolTest, MalformedStatusFallsBackToFeedback) {
    GrblStatus status;
    EXPECT_FALSE(GrblProtocol::parseStatusReport("<Idle|MPos:1,2", status));
    EXPECT_EQ(GrblProtocol::parseResponse("<Idle|MPos:1,2").type, ResponseType::FEEDBACK);
}

TEST(GrblProtocolTest, MachineStateNames) {
    EXPECT_EQ(GrblProtocol::machineStateFromString("Alarm"), MachineState::ALARM);
    EXPECT_EQ(GrblProtocol::machineStateFromString("Bogus"), MachineState::UNKNOWN);
    EXPECT_EQ(GrblProtocol::machineStateToString(MachineState::DOOR), "Door");
}

// =============================================================================
// Command formatting
// =============================================================================

TEST(GrblProtocolTest, FormatsSingleLineCommands) {
    EXPECT_EQ(GrblProtocol::formatCommand(GrblCommand::gcode("G1 X1\nY2 ")), "G1 X1 Y2\n");
    EXPECT_EQ(GrblProtocol::formatCommand(GrblCommand::system(GrblCommandType::KILL_ALARM)), "$X\n");
    EXPECT_EQ(GrblProtocol::formatCommand(GrblCommand::system(GrblCommandType::VIEW_SETTINGS)), "$$\n");
    EXPECT_EQ(GrblProtocol::formatCommand(GrblCommand::setting(110, 500.0)), "$110=500\n");
    EXPECT_EQ(GrblProtocol::formatCommand(GrblCommand::jog(Eigen::Vector3d(1.0, -2.5, 0.0), 500.0)),
        "$J=G91 X1.000 Y-2.500 Z0.000 F500\n");
    EXPECT_EQ(GrblProtocol::formatCommand(GrblCommand::jog(Eigen::Vector3d(0.0, 0.0, 10.0), 250.0, false)),
        "$J=G90 X0.000 Y0.000 Z10.000 F250\n");
}

TEST(GrblProtocolTest, FormattedCommandsDecodeToTheSameCommand) {
    const std::vector<GrblCommand> commands = {
        GrblCommand::gcode("G0 X10 Y20"),
        GrblCommand::system(GrblCommandType::HELP),
        GrblCommand::system(GrblCommandType::VIEW_PARAMETERS),
        GrblCommand::system(GrblCommandType::VIEW_PARSER_STATE),
        GrblCommand::system(GrblCommandType::VIEW_BUILD_INFO),
        GrblCommand::system(GrblCommandType::VIEW_STARTUP_BLOCKS),
        GrblCommand::system(GrblCommandType::CHECK_MODE),
        GrblCommand::system(GrblCommandType::HOME),
        GrblCommand::system(GrblCommandType::RESET_SETTINGS),
        GrblCommand::system(GrblCommandType::RESET_PARAMETERS),
        GrblCommand::system(GrblCommandType::RESET_ALL),
        GrblCommand::system(GrblCommandType::SLEEP),
        GrblCommand::setting(130, 200.5),
        GrblCommand::jog(Eigen::Vector3d(-1.0, 0.25, 3.0), 1200.0)
    };

    for (const auto& command : commands) {
        std::string line = GrblProtocol::formatCommand(command);
        ASSERT_FALSE(line.empty());
        EXPECT_EQ(line.back(), '\n');
        EXPECT_EQ(line.find('\n'), line.size() - 1);
        line.pop_back();

        GrblCommand decoded;
        ASSERT_TRUE(MockGrbl::decodeCommand(line, decoded)) << line;
        EXPECT_EQ(decoded.type, command.type) << line;
        EXPECT_EQ(decoded.text, command.text) << line;
        EXPECT_EQ(decoded.settingNumber, command.settingNumber) << line;
        EXPECT_DOUBLE_EQ(decoded.settingValue, command.settingValue) << line;
        EXPECT_LT((decoded.jogTarget - command.jogTarget).norm(), 1e-9) << line;
        EXPECT_DOUBLE_EQ(decoded.jogFeedRate, command.jogFeedRate) << line;
        EXPECT_EQ(decoded.jogRelative, command.jogRelative) << line;
    }
}

// =============================================================================
// Real-time commands and overrides
// =============================================================================

TEST(GrblProtocolTest, RealtimeBytes) {
    EXPECT_EQ(GrblProtocol::formatRealtime(RealtimeCommand::STATUS_QUERY), '?');
    EXPECT_EQ(GrblProtocol::formatRealtime(RealtimeCommand::FEED_HOLD), '!');
    EXPECT_EQ(GrblProtocol::formatRealtime(RealtimeCommand::CYCLE_START), '~');
    EXPECT_EQ(GrblProtocol::formatRealtime(RealtimeCommand::SOFT_RESET), 0x18);
    EXPECT_EQ(GrblProtocol::formatRealtime(RealtimeCommand::JOG_CANCEL), 0x85);

    RealtimeCommand command;
    ASSERT_TRUE(GrblProtocol::realtimeFromByte(0x91, command));
    EXPECT_EQ(command, RealtimeCommand::FEED_OVERRIDE_COARSE_PLUS);
    EXPECT_FALSE(GrblProtocol::realtimeFromByte('A', command));
    EXPECT_FALSE(GrblProtocol::realtimeFromByte(0x98, command));
}

TEST(GrblProtocolTest, FeedOverrideClampsToRange) {
    OverrideState overrides;
    for (int i = 0; i < 15; ++i) {
        EXPECT_TRUE(overrides.apply(RealtimeCommand::FEED_OVERRIDE_COARSE_PLUS));
    }
    EXPECT_EQ(overrides.feed, 200);

    for (int i = 0; i < 30; ++i) {
        overrides.apply(RealtimeCommand::FEED_OVERRIDE_COARSE_MINUS);
    }
    EXPECT_EQ(overrides.feed, 10);

    overrides.apply(RealtimeCommand::FEED_OVERRIDE_FINE_PLUS);
    EXPECT_EQ(overrides.feed, 11);
    overrides.apply(RealtimeCommand::FEED_OVERRIDE_RESET);
    EXPECT_EQ(overrides.feed, 100);
}

TEST(GrblProtocolTest, RapidAndSpindleOverrides) {
    OverrideState overrides;
    overrides.apply(RealtimeCommand::RAPID_OVERRIDE_LOW);
    EXPECT_EQ(overrides.rapid, 25);
    overrides.apply(RealtimeCommand::RAPID_OVERRIDE_MEDIUM);
    EXPECT_EQ(overrides.rapid, 50);

    overrides.apply(RealtimeCommand::SPINDLE_OVERRIDE_FINE_MINUS);
    EXPECT_EQ(overrides.spindle, 99);

    EXPECT_FALSE(overrides.apply(RealtimeCommand::STATUS_QUERY));
    overrides.reset();
    EXPECT_EQ(overrides.rapid, 100);
    EXPECT_EQ(overrides.spindle, 100);
}
