#include "protocol/calibration.hpp"
#include <gtest/gtest.h>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

using namespace tttarm::protocol;

TEST(CalibrationTest, RotatedMapping) {
    EXPECT_EQ(rotated_position(2), 0);
    EXPECT_EQ(rotated_position(5), 1);
    EXPECT_EQ(rotated_position(8), 2);
    EXPECT_EQ(rotated_position(1), 3);
    EXPECT_EQ(rotated_position(7), 5);
    EXPECT_EQ(rotated_position(0), 6);
    EXPECT_EQ(rotated_position(6), 8);
    EXPECT_EQ(rotated_position(4), 4);
    EXPECT_EQ(rotated_position(3), 3);
}

TEST(CalibrationTest, MappedCellsAreDistinct) {
    std::set<int> images;
    for (int p : {0, 1, 2, 4, 5, 6, 7, 8}) {
        images.insert(rotated_position(p));
    }
    EXPECT_EQ(images.size(), 8u);
}

TEST(CalibrationTest, StandardLayoutUsesOpcodesOneAndTwo) {
    CalibrationSequence seq({0, 1}, {2, 3}, {4, 5}, {6, 7});

    EXPECT_EQ(seq.remaining(), 4u);
    EXPECT_EQ(seq.next()->payload(), "101");
    EXPECT_EQ(seq.next()->payload(), "123");
    EXPECT_EQ(seq.next()->payload(), "245");
    EXPECT_EQ(seq.next()->payload(), "267");
    EXPECT_TRUE(seq.done());
    EXPECT_FALSE(seq.next().has_value());
}

TEST(CalibrationTest, RotatedLayoutMapsPositions) {
    CalibrationSequence seq({2, 5}, {8, 1}, {7, 0}, {6, 4}, true);

    std::vector<std::string> payloads;
    while (auto command = seq.next()) {
        payloads.push_back(command->payload());
    }
    EXPECT_EQ(payloads, (std::vector<std::string>{"401", "423", "556", "584"}));
}

TEST(CalibrationTest, CenterSequenceIsSingleCommand) {
    CalibrationSequence seq = CalibrationSequence::center(7);
    ASSERT_EQ(seq.remaining(), 1u);
    auto command = seq.next();
    ASSERT_TRUE(command.has_value());
    EXPECT_EQ(command->opcode, Opcode::MachineMove);
    EXPECT_EQ(command->payload(), "274");
    EXPECT_TRUE(seq.done());
}

TEST(CalibrationTest, RejectsMultiDigitPositions) {
    EXPECT_THROW(CalibrationSequence({0, 10}, {2, 3}, {4, 5}, {6, 7}), std::invalid_argument);
    EXPECT_THROW(CalibrationSequence({-1, 1}, {2, 3}, {4, 5}, {6, 7}), std::invalid_argument);
    EXPECT_THROW(CalibrationSequence::center(12), std::invalid_argument);
}
