#include <gtest/gtest.h>
#include "register_file.hpp"

TEST(RegisterFileTest, ResetClearsEverything) {
    RegisterFile rf;
    rf.write(3, 0x1234);
    Flags f;
    f.n = true;
    rf.set_flags(f);

    rf.reset();
    for (int i = 0; i < NUM_REGISTERS; i++) {
        EXPECT_EQ(rf.read(i), 0u);
    }
    EXPECT_EQ(rf.get_flags(), Flags());
}

TEST(RegisterFileTest, R0IsOrdinary) {
    RegisterFile rf;
    rf.write(0, 99);
    EXPECT_EQ(rf.read(0), 99u);
}

TEST(RegisterFileTest, InvalidIndexThrows) {
    RegisterFile rf;
    EXPECT_THROW(rf.read(16), std::out_of_range);
    EXPECT_THROW(rf.read(-1), std::out_of_range);
    EXPECT_THROW(rf.write(16, 1), std::out_of_range);
    EXPECT_THROW(rf.read_forwarded(20), std::out_of_range);
    EXPECT_THROW(rf.stage_write(-2, 1), std::out_of_range);
}

TEST(RegisterFileTest, StagedWriteVisibleOnlyAfterCommit) {
    RegisterFile rf;
    rf.write(5, 1);
    rf.stage_write(5, 2);

    EXPECT_EQ(rf.read(5), 1u);
    EXPECT_EQ(rf.read_forwarded(5), 2u);
    EXPECT_EQ(rf.read_forwarded(6), 0u);

    rf.commit();
    EXPECT_EQ(rf.read(5), 2u);

    // Nothing pending after the edge
    rf.commit();
    EXPECT_EQ(rf.read(5), 2u);
}

TEST(RegisterFileTest, StagedFlags) {
    RegisterFile rf;
    Flags f = Flags::from_bits(0b0110);
    rf.stage_flags(f);
    EXPECT_EQ(rf.get_flags(), Flags());

    rf.commit();
    EXPECT_TRUE(rf.get_flags().z);
    EXPECT_TRUE(rf.get_flags().c);
    EXPECT_FALSE(rf.get_flags().n);
    EXPECT_EQ(rf.get_flags().to_bits(), 0b0110u);
}

TEST(RegisterFileTest, GetAllMirrorsRegisters) {
    RegisterFile rf;
    rf.write(REG_LR, 0x40);
    EXPECT_EQ(rf.get_all()[REG_LR], 0x40u);
}
