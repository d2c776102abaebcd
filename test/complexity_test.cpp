// This file is part of Calico.
// See docs/License.html for the copyright notice.

#include "complexity.h"
#include "evolve.h"
#include "ruletable.h"
#include "ruletable_rule.h"
#include <gtest/gtest.h>
#include <math.h>
#include <random>
using namespace std ;

static int flip(const neighborhood &nb, int, int, int) {
   return 1 - nb[1] ;
}

static int cycle3(const neighborhood &nb, int, int, int) {
   return (nb[1] + 1) % 3 ;
}

TEST(EntropyTest, ConstantHistoryIsZero) {
   cahistory h ;
   ASSERT_STREQ(NULL, initsimple(h, 20, 4, 2)) ;
   ruletable t ;
   mt19937 rng(1) ;
   double actual ;
   int q ;
   ASSERT_STREQ(NULL, randomruletable(0.0, 4, 1, rng, t, actual, q)) ;
   table_rule rule(t) ;
   ASSERT_STREQ(NULL, evolve(h, 10, rule)) ;
   // everything is 0 from generation 1 on; start from there
   cahistory quiet ;
   for (int i=1; i<h.size(); i++)
      ASSERT_STREQ(NULL, quiet.push(h[i])) ;
   double e = -1, mi = -1 ;
   ASSERT_STREQ(NULL, averagecellentropy(quiet, e)) ;
   ASSERT_STREQ(NULL, averagemutualinformation(quiet, mi)) ;
   EXPECT_EQ(0.0, e) ;
   EXPECT_EQ(0.0, mi) ;
}

TEST(EntropyTest, SingleGridHistory) {
   cahistory h ;
   ASSERT_STREQ(NULL, initsimple(h, 8)) ;
   double e = -1 ;
   ASSERT_STREQ(NULL, averagecellentropy(h, e)) ;
   EXPECT_EQ(0.0, e) ;
   double mi ;
   EXPECT_TRUE(0 != averagemutualinformation(h, mi)) ;
}

TEST(EntropyTest, AlternatingCellsCarryOneBit) {
   mt19937 rng(2) ;
   cahistory h ;
   ASSERT_STREQ(NULL, initrandom(h, 16, rng)) ;
   funcrule rule(&flip) ;
   // ten generations: five of each state, and eight pairs two apart
   ASSERT_STREQ(NULL, evolve(h, 9, rule)) ;
   double e, c, mi1, mi2 ;
   ASSERT_STREQ(NULL, averagecellentropy(h, e)) ;
   ASSERT_STREQ(NULL, cellentropy(h, 3, 0, c)) ;
   ASSERT_STREQ(NULL, averagemutualinformation(h, mi2, 2)) ;
   EXPECT_NEAR(1.0, e, 1e-12) ;
   EXPECT_NEAR(1.0, c, 1e-12) ;
   EXPECT_NEAR(1.0, mi2, 1e-12) ;
   // eleven generations give ten adjacent pairs, five of each kind
   ASSERT_STREQ(NULL, evolve(h, 1, rule)) ;
   ASSERT_STREQ(NULL, averagemutualinformation(h, mi1)) ;
   EXPECT_NEAR(1.0, mi1, 1e-12) ;
}

TEST(EntropyTest, DeterministicSuccessorGivesFullInformation) {
   // 0 -> 1 -> 2 -> 0; 12 transitions cover each state 4 times
   cahistory h ;
   vector<int> cells(5, 0) ;
   ASSERT_STREQ(NULL, initfromcells(h, 5, 3, cells)) ;
   funcrule rule(&cycle3, 3) ;
   ASSERT_STREQ(NULL, evolve(h, 12, rule)) ;
   double mi ;
   ASSERT_STREQ(NULL, averagemutualinformation(h, mi)) ;
   EXPECT_NEAR(log2(3.0), mi, 1e-12) ;
}

TEST(EntropyTest, BoundsOnRandomRule) {
   mt19937 rng(3) ;
   ruletable t ;
   double actual ;
   int q ;
   ASSERT_STREQ(NULL, randomruletable(0.6, 4, 1, rng, t, actual, q)) ;
   table_rule rule(t) ;
   cahistory h ;
   ASSERT_STREQ(NULL, initrandom(h, 60, rng, 4)) ;
   ASSERT_STREQ(NULL, evolve(h, 40, rule)) ;
   double e, mi ;
   ASSERT_STREQ(NULL, averagecellentropy(h, e)) ;
   ASSERT_STREQ(NULL, averagemutualinformation(h, mi, 3)) ;
   EXPECT_GE(e, 0.0) ;
   EXPECT_LE(e, 2.0) ;
   EXPECT_GE(mi, 0.0) ;
   EXPECT_LE(mi, 2.0) ;
}

TEST(EntropyTest, TwoDimensionalHistory) {
   cahistory h ;
   ASSERT_STREQ(NULL, initsimple2d(h, 3, 3)) ;
   // one cell is 1 out of the two generations; the rest stay 0
   ASSERT_STREQ(NULL, h.push(cagrid(3, 3, 2))) ;
   double c, e ;
   ASSERT_STREQ(NULL, cellentropy(h, 1, 1, c)) ;
   EXPECT_DOUBLE_EQ(1.0, c) ;
   ASSERT_STREQ(NULL, averagecellentropy(h, e)) ;
   EXPECT_DOUBLE_EQ(1.0 / 9.0, e) ;
}

TEST(EntropyTest, RejectsBadArguments) {
   cahistory empty ;
   double v ;
   EXPECT_TRUE(0 != averagecellentropy(empty, v)) ;
   EXPECT_TRUE(0 != averagemutualinformation(empty, v)) ;
   cahistory h ;
   ASSERT_STREQ(NULL, initsimple(h, 4)) ;
   ASSERT_STREQ(NULL, h.push(h[0])) ;
   EXPECT_TRUE(0 != averagemutualinformation(h, v, 0)) ;
   EXPECT_TRUE(0 != averagemutualinformation(h, v, 2)) ;
   EXPECT_STREQ(NULL, averagemutualinformation(h, v, 1)) ;
   EXPECT_TRUE(0 != cellentropy(h, 4, 0, v)) ;
   EXPECT_TRUE(0 != cellentropy(h, 0, 1, v)) ;
}
