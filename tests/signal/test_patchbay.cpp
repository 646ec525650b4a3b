/**
 * @file test_patchbay.cpp
 * @brief Unit tests for the PatchBay connection graph
 */

#include <gtest/gtest.h>
#include <philbrick/signal/PatchBay.hpp>

namespace philbrick {
namespace {

class PatchBayTest : public ::testing::Test {
  protected:
    PatchBay bay;
    Port src{"out", PortDirection::Output, "A"};
    Port src2{"out", PortDirection::Output, "B"};
    Port dst{"in", PortDirection::Input, "C"};
    Port dst2{"in", PortDirection::Input, "D"};
    Port dst3{"in", PortDirection::Input, "E"};
};

// =============================================================================
// Connect / Propagate
// =============================================================================

TEST_F(PatchBayTest, PropagateCopiesSourceToDest) {
    bay.Connect(src, dst);
    src.Write(4.25);
    bay.Propagate();
    EXPECT_DOUBLE_EQ(dst.Read(), 4.25);
}

TEST_F(PatchBayTest, ConnectIsIdempotent) {
    bay.Connect(src, dst);
    bay.Connect(src, dst);
    EXPECT_EQ(bay.Size(), 1u);
    EXPECT_TRUE(bay.IsConnected(src, dst));
}

TEST_F(PatchBayTest, DedupIsByEndpointIdentityNotValue) {
    Port twin{"out", PortDirection::Output, "A"}; // same name and owner, different port
    bay.Connect(src, dst);
    bay.Connect(twin, dst);
    EXPECT_EQ(bay.Size(), 2u);
}

TEST_F(PatchBayTest, PropagateOverNoEdgesIsNoOp) {
    dst.Write(1.0);
    EXPECT_NO_THROW(bay.Propagate());
    EXPECT_DOUBLE_EQ(dst.Read(), 1.0);
}

TEST_F(PatchBayTest, ConnectionsKeepInsertionOrder) {
    bay.Connect(src, dst2);
    bay.Connect(src, dst);
    const auto &conns = bay.GetConnections();
    ASSERT_EQ(conns.size(), 2u);
    EXPECT_EQ(conns[0].dest, &dst2);
    EXPECT_EQ(conns[1].dest, &dst);
}

// =============================================================================
// Fan-out / Fan-in
// =============================================================================

TEST_F(PatchBayTest, FanOutDeliversSameValueToAll) {
    bay.Connect(src, dst);
    bay.Connect(src, dst2);
    bay.Connect(src, dst3);

    src.Write(-3.5);
    bay.Propagate();

    EXPECT_DOUBLE_EQ(dst.Read(), -3.5);
    EXPECT_DOUBLE_EQ(dst2.Read(), -3.5);
    EXPECT_DOUBLE_EQ(dst3.Read(), -3.5);
}

TEST_F(PatchBayTest, FanInLastEdgeWins) {
    bay.Connect(src, dst);
    bay.Connect(src2, dst);

    src.Write(1.0);
    src2.Write(2.0);
    bay.Propagate();
    EXPECT_DOUBLE_EQ(dst.Read(), 2.0);

    // A repeated connect keeps the edge where it was
    bay.Connect(src, dst);
    bay.Propagate();
    EXPECT_DOUBLE_EQ(dst.Read(), 2.0);

    // Disconnect then connect moves it last
    bay.Disconnect(src, dst);
    bay.Connect(src, dst);
    bay.Propagate();
    EXPECT_DOUBLE_EQ(dst.Read(), 1.0);
}

// =============================================================================
// Disconnect / Clear
// =============================================================================

TEST_F(PatchBayTest, DisconnectStopsPropagation) {
    bay.Connect(src, dst);
    src.Write(1.0);
    bay.Propagate();
    EXPECT_DOUBLE_EQ(dst.Read(), 1.0);

    bay.Disconnect(src, dst);
    EXPECT_FALSE(bay.IsConnected(src, dst));
    src.Write(9.0);
    bay.Propagate();
    EXPECT_DOUBLE_EQ(dst.Read(), 1.0);
}

TEST_F(PatchBayTest, DisconnectMissingEdgeIsNoOp) {
    bay.Connect(src, dst);
    bay.Disconnect(src, dst2);
    EXPECT_EQ(bay.Size(), 1u);
}

TEST_F(PatchBayTest, ClearRemovesAllEdges) {
    bay.Connect(src, dst);
    bay.Connect(src, dst2);
    bay.Clear();
    EXPECT_TRUE(bay.Empty());

    src.Write(5.0);
    bay.Propagate();
    EXPECT_DOUBLE_EQ(dst.Read(), 0.0);
    EXPECT_DOUBLE_EQ(dst2.Read(), 0.0);
}

// =============================================================================
// Direction checks
// =============================================================================

TEST_F(PatchBayTest, InputAsSourceThrows) {
    EXPECT_THROW(bay.Connect(dst, dst2), WiringError);
}

TEST_F(PatchBayTest, OutputAsDestThrows) {
    EXPECT_THROW(bay.Connect(src, src2), WiringError);
    EXPECT_TRUE(bay.Empty());
}

} // namespace
} // namespace philbrick
