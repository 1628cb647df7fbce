#include <gtest/gtest.h>

#include "Fixtures.hpp"

using namespace rummikub::core;
using namespace rummikub::test;

TEST(Board, ValidIffEveryMeldIsValid)
{
    Board b;
    EXPECT_TRUE(b.IsValid());
    EXPECT_TRUE(b.Empty());

    b.AddMeld(MeldOf({Red(5), Red(6), Red(7)}));
    b.AddMeld(MeldOf({Blue(9), Black(9), Orange(9)}));
    EXPECT_TRUE(b.IsValid());
    EXPECT_EQ(b.FirstInvalid(), b.MeldCount());

    b.AddMeld(MeldOf({Red(1), Red(2)}));
    EXPECT_FALSE(b.IsValid());
    EXPECT_EQ(b.FirstInvalid(), 2u);
}

TEST(Board, Aggregates)
{
    TileSP const r5 = Red(5);
    Board b = BoardOf({MeldOf({r5, Red(6), Red(7)}), MeldOf({Blue(9), Black(9), Wild()})});

    EXPECT_EQ(b.MeldCount(), 2u);
    EXPECT_EQ(b.TileCount(), 6u);
    EXPECT_EQ(b.FaceValue(), 36u);
    EXPECT_EQ(b.AllTiles().size(), 6u);
    EXPECT_EQ(b.AllTiles().front()->id, r5->id);
    EXPECT_FALSE(b.HasDuplicateTiles());

    b.AddMeld(MeldOf({r5, Blue(5), Black(5)}));
    EXPECT_TRUE(b.IsValid());
    EXPECT_TRUE(b.HasDuplicateTiles());
}

TEST(Board, CloneIsIndependent)
{
    TileSP const r7 = Red(7);
    Board const original = BoardOf({MeldOf({Red(5), Red(6), r7})});

    Board copy = original.Clone();
    copy.Melds().front().RemoveTile(r7->id);
    copy.AddMeld(MeldOf({Blue(1), Blue(2), Blue(3)}));

    EXPECT_EQ(original.MeldCount(), 1u);
    EXPECT_TRUE(original.Melds().front().Contains(r7->id));
    EXPECT_TRUE(original.IsValid());

    // tiles are shared by identity
    EXPECT_EQ(copy.Melds().front().Tiles().front().get(), original.Melds().front().Tiles().front().get());
}
