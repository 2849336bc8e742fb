#include "protocol/encoder.hpp"
#include <gtest/gtest.h>

using namespace tttarm;
using namespace tttarm::protocol;

TEST(ProtocolTest, EncodesMachineMoveFrame) {
    Frame expected = {0xAA, 0x55, 0x32, 0x31, 0x34, 0x9A};
    EXPECT_EQ(encode("214"), expected);
    EXPECT_EQ(encode(Command::machine_move(1, 4)), expected);
}

TEST(ProtocolTest, CommandPayloads) {
    EXPECT_EQ(Command::human_move(0, 8).payload(), "108");
    EXPECT_EQ(Command::machine_move(3, 7).payload(), "237");
    EXPECT_EQ(Command::cheat_report(0, 4).payload(), "304");
    EXPECT_EQ(Command::calibration_a(6, 1).payload(), "461");
    EXPECT_EQ(Command::calibration_b(2, 4).payload(), "524");
}

TEST(ProtocolTest, DefaultCommandIsZeroedHumanMove) {
    Command command;
    EXPECT_EQ(command.opcode, Opcode::HumanMove);
    EXPECT_EQ(command.arg1, 0);
    EXPECT_EQ(command.arg2, 0);
    EXPECT_EQ(command.payload(), "100");
}

TEST(ProtocolTest, EncodingIsTotalOverAscii) {
    EXPECT_EQ(encode(""), (Frame{0xAA, 0x55, 0x9A}));
    Frame frame = encode("hello");
    ASSERT_EQ(frame.size(), 8u);
    EXPECT_EQ(frame[2], 'h');
    EXPECT_EQ(frame[6], 'o');
    EXPECT_EQ(frame.back(), kTrailer);
}

TEST(ProtocolTest, DecodeReturnsPayloadOfWellFormedFrame) {
    auto payload = decode(encode("304"));
    ASSERT_TRUE(payload.has_value());
    EXPECT_EQ(*payload, "304");
}

TEST(ProtocolTest, DecodeRejectsBrokenFraming) {
    EXPECT_FALSE(decode(Frame{}).has_value());
    EXPECT_FALSE(decode(Frame{0xAA, 0x55}).has_value());
    EXPECT_FALSE(decode(Frame{0xAA, 0x56, 0x32, 0x9A}).has_value());
    EXPECT_FALSE(decode(Frame{0xAB, 0x55, 0x32, 0x9A}).has_value());
    EXPECT_FALSE(decode(Frame{0xAA, 0x55, 0x32, 0x9B}).has_value());
}

TEST(ProtocolTest, ParseCommand) {
    auto command = parse_command("214");
    ASSERT_TRUE(command.has_value());
    EXPECT_EQ(command->opcode, Opcode::MachineMove);
    EXPECT_EQ(command->arg1, 1);
    EXPECT_EQ(command->arg2, 4);

    EXPECT_FALSE(parse_command("21").has_value());
    EXPECT_FALSE(parse_command("2145").has_value());
    EXPECT_FALSE(parse_command("2a4").has_value());
    EXPECT_FALSE(parse_command("014").has_value());
    EXPECT_FALSE(parse_command("614").has_value());
}

TEST(ProtocolTest, HexRendering) {
    EXPECT_EQ(to_hex(encode("214")), "AA 55 32 31 34 9A");
    EXPECT_EQ(to_hex(Frame{}), "");
}
