#include <gtest/gtest.h>
#include "shifter.hpp"

TEST(ShifterTest, LslZeroPassesCarryThrough) {
    ShiftResult r = BarrelShifter::shift(0x12345678, ShiftType::LSL, 0, true);
    EXPECT_EQ(r.value, 0x12345678u);
    EXPECT_TRUE(r.carry);
}

TEST(ShifterTest, LslCarryOut) {
    ShiftResult r = BarrelShifter::shift(0x80000001, ShiftType::LSL, 1, false);
    EXPECT_EQ(r.value, 0x2u);
    EXPECT_TRUE(r.carry);
}

TEST(ShifterTest, LsrImmediateZeroMeansThirtyTwo) {
    ShiftResult r = BarrelShifter::shift(0x80000000, ShiftType::LSR, 0, false);
    EXPECT_EQ(r.value, 0u);
    EXPECT_TRUE(r.carry);

    r = BarrelShifter::shift(0x10, ShiftType::LSR, 4, true);
    EXPECT_EQ(r.value, 0x1u);
    EXPECT_FALSE(r.carry);
}

TEST(ShifterTest, AsrKeepsSign) {
    ShiftResult r = BarrelShifter::shift(0xF0000000, ShiftType::ASR, 4, true);
    EXPECT_EQ(r.value, 0xFF000000u);
    EXPECT_FALSE(r.carry);

    r = BarrelShifter::shift(0x80000000, ShiftType::ASR, 0, false);
    EXPECT_EQ(r.value, 0xFFFFFFFFu);
    EXPECT_TRUE(r.carry);
}

TEST(ShifterTest, RorAndRrx) {
    ShiftResult r = BarrelShifter::shift(0x000000FF, ShiftType::ROR, 8, false);
    EXPECT_EQ(r.value, 0xFF000000u);
    EXPECT_TRUE(r.carry);

    // ROR #0 is rotate right extended through carry
    r = BarrelShifter::shift(0x3, ShiftType::ROR, 0, true);
    EXPECT_EQ(r.value, 0x80000001u);
    EXPECT_TRUE(r.carry);
}

TEST(ShifterTest, RegisterAmountZeroLeavesValue) {
    ShiftResult r = BarrelShifter::shift_by_register(0xABCD, ShiftType::LSR, 0, true);
    EXPECT_EQ(r.value, 0xABCDu);
    EXPECT_TRUE(r.carry);

    // Only the bottom byte counts
    r = BarrelShifter::shift_by_register(0xABCD, ShiftType::LSL, 0x100, false);
    EXPECT_EQ(r.value, 0xABCDu);
    EXPECT_FALSE(r.carry);
}

TEST(ShifterTest, RegisterAmountThirtyTwoAndBeyond) {
    ShiftResult r = BarrelShifter::shift_by_register(0x1, ShiftType::LSL, 32, false);
    EXPECT_EQ(r.value, 0u);
    EXPECT_TRUE(r.carry);

    r = BarrelShifter::shift_by_register(0xFFFFFFFF, ShiftType::LSL, 33, true);
    EXPECT_EQ(r.value, 0u);
    EXPECT_FALSE(r.carry);

    r = BarrelShifter::shift_by_register(0x80000000, ShiftType::LSR, 32, false);
    EXPECT_EQ(r.value, 0u);
    EXPECT_TRUE(r.carry);

    r = BarrelShifter::shift_by_register(0x80000000, ShiftType::ASR, 40, false);
    EXPECT_EQ(r.value, 0xFFFFFFFFu);
    EXPECT_TRUE(r.carry);

    r = BarrelShifter::shift_by_register(0x80000001, ShiftType::ROR, 32, false);
    EXPECT_EQ(r.value, 0x80000001u);
    EXPECT_TRUE(r.carry);
}

TEST(ShifterTest, RegisterAmountSmall) {
    ShiftResult r = BarrelShifter::shift_by_register(0x1, ShiftType::LSL, 4, false);
    EXPECT_EQ(r.value, 0x10u);
}

TEST(ShifterTest, RotatedImmediate) {
    ShiftResult r = BarrelShifter::rotate_immediate(0xFF, 8, false);
    EXPECT_EQ(r.value, 0xFF000000u);
    EXPECT_TRUE(r.carry);

    r = BarrelShifter::rotate_immediate(0x01, 24, true);
    EXPECT_EQ(r.value, 0x100u);
    EXPECT_FALSE(r.carry);

    // No rotation: carry unchanged
    r = BarrelShifter::rotate_immediate(0x80, 0, true);
    EXPECT_EQ(r.value, 0x80u);
    EXPECT_TRUE(r.carry);
}
