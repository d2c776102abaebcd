// This file is part of Calico.
// See docs/License.html for the copyright notice.

#include "evolve.h"
#include "wolframrules.h"
#include "liferules.h"
#include "totalistic.h"
#include "ruletable_rule.h"
#include "testerrors.h"
#include <gtest/gtest.h>
#include <random>
#include <string>
#include <vector>
using namespace std ;

static void checkhistory(const cahistory &h) {
   for (int t=0; t<h.size(); t++) {
      ASSERT_TRUE(h[t].sameshape(h[0])) << "generation " << t ;
      for (int y=0; y<h[t].height(); y++)
         for (int x=0; x<h[t].width(); x++)
            ASSERT_LT(h[t].getcell(x, y), h[t].NumCellStates()) ;
   }
}

TEST(EvolveTest, Rule30FromSingleCell) {
   // reference outputs indexed by left*4 + center*2 + right
   const int rule30[8] = { 0, 1, 1, 1, 1, 0, 0, 0 } ;
   cahistory h ;
   ASSERT_STREQ(NULL, initsimple(h, 200)) ;
   nks_rule rule ;
   ASSERT_STREQ(NULL, evolve(h, 100, rule)) ;
   ASSERT_EQ(101, h.size()) ;
   checkhistory(h) ;
   for (int t=1; t<h.size(); t++) {
      const cagrid &prev = h[t - 1] ;
      ASSERT_EQ(200, h[t].width()) ;
      for (int x=0; x<200; x++) {
         int l = prev.getcell((x + 199) % 200) ;
         int c = prev.getcell(x) ;
         int r = prev.getcell((x + 1) % 200) ;
         ASSERT_EQ(rule30[l * 4 + c * 2 + r], h[t].getcell(x))
            << "generation " << t << " cell " << x ;
      }
   }
   // the first step lights the center and its two neighbors
   EXPECT_EQ(3, h[1].population()) ;
   EXPECT_EQ(1, h[1].getcell(99)) ;
   EXPECT_EQ(1, h[1].getcell(101)) ;
}

TEST(EvolveTest, LengthIsTimestepsPlusOne) {
   mt19937 rng(5) ;
   cahistory h ;
   ASSERT_STREQ(NULL, initrandom(h, 31, rng, 3)) ;
   carule *rule = 0 ;
   ASSERT_STREQ(NULL, makerule("T777,K3", &rule)) ;
   ASSERT_STREQ(NULL, evolve(h, 17, *rule)) ;
   EXPECT_EQ(18, h.size()) ;
   checkhistory(h) ;
   ASSERT_STREQ(NULL, evolve(h, 0, *rule)) ;
   EXPECT_EQ(18, h.size()) ;
   delete rule ;
}

// each cell takes its right neighbor's value; an in-place update
// would smear the first value across the row
static int shiftleft(const neighborhood &nb, int, int, int) {
   return nb[2] ;
}

TEST(EvolveTest, UpdatesAreSimultaneous) {
   vector<int> cells ;
   for (int i=0; i<7; i++)
      cells.push_back(i) ;
   cahistory h ;
   ASSERT_STREQ(NULL, initfromcells(h, 7, 7, cells)) ;
   funcrule rule(&shiftleft, 7) ;
   ASSERT_STREQ(NULL, evolve(h, 1, rule)) ;
   for (int x=0; x<7; x++)
      EXPECT_EQ((x + 1) % 7, h[1].getcell(x)) ;
}

/*
 *   Counts how often it is asked; acts like rule 90.
 */
class countingrule : public carule {
public:
   countingrule() : calls(0) {}
   virtual int apply(const neighborhood &nb, int, int, int gen) {
      calls++ ;
      gens.push_back(gen) ;
      return nb[0] ^ nb[2] ;
   }
   int calls ;
   vector<int> gens ;
} ;

TEST(EvolveTest, MemoizedRunMatchesPlainRun) {
   mt19937 rng(8) ;
   cahistory plain, memo ;
   ASSERT_STREQ(NULL, initrandom(plain, 64, rng)) ;
   memo = plain ;
   countingrule r1, r2 ;
   ASSERT_STREQ(NULL, evolve(plain, 20, r1)) ;
   ASSERT_STREQ(NULL, evolve(memo, 20, r2, 1, true)) ;
   for (int t=0; t<plain.size(); t++)
      EXPECT_TRUE(plain[t] == memo[t]) ;
   EXPECT_EQ(64 * 20, r1.calls) ;
   // at most one call per distinct binary triple
   EXPECT_LE(r2.calls, 8) ;
   // a second call starts with an empty cache
   int before = r2.calls ;
   ASSERT_STREQ(NULL, evolve(memo, 5, r2, 1, true)) ;
   EXPECT_GT(r2.calls, before) ;
}

TEST(EvolveTest, GenerationIsIndexBeingComputed) {
   cahistory h ;
   ASSERT_STREQ(NULL, initsimple(h, 4)) ;
   countingrule rule ;
   ASSERT_STREQ(NULL, evolve(h, 3, rule)) ;
   ASSERT_EQ(12u, rule.gens.size()) ;
   EXPECT_EQ(1, rule.gens[0]) ;
   EXPECT_EQ(1, rule.gens[3]) ;
   EXPECT_EQ(2, rule.gens[4]) ;
   EXPECT_EQ(3, rule.gens[11]) ;
}

TEST(EvolveTest, LookupFailureStopsTheRun) {
   recordingerrors errs ;
   // only the all-zero tuple is defined
   ruletable t(2, 3) ;
   t.define(neighborhood(3, 0), 0) ;
   table_rule rule(t) ;
   cahistory h ;
   ASSERT_STREQ(NULL, initsimple(h, 9)) ;
   const char *err = evolve(h, 5, rule) ;
   ASSERT_TRUE(err != 0) ;
   EXPECT_NE(string::npos, string(err).find("no transition")) ;
   EXPECT_NE(string::npos, string(err).find("0,0,1")) ;
   EXPECT_EQ(1, h.size()) ;
   ASSERT_EQ(1u, errs.warnings.size()) ;
   EXPECT_EQ(string(err), errs.warnings[0]) ;
}

TEST(EvolveTest, LookupFailureKeepsEarlierGenerations) {
   recordingerrors errs ;
   // zeros stay zero, a lone 1 spreads; 111 is missing
   ruletable t(2, 3) ;
   for (int i=0; i<7; i++)
      t.set(i, i == 0 ? 0 : 1) ;
   table_rule rule(t) ;
   cahistory h ;
   ASSERT_STREQ(NULL, initsimple(h, 9)) ;
   EXPECT_TRUE(0 != evolve(h, 5, rule)) ;
   // 000010000 -> 000111000 -> fails on 111
   EXPECT_EQ(2, h.size()) ;
}

static int outofrange(const neighborhood &, int, int, int) {
   return 2 ;
}

TEST(EvolveTest, OutOfRangeOutputIsAnError) {
   recordingerrors errs ;
   cahistory h ;
   ASSERT_STREQ(NULL, initsimple(h, 5)) ;
   funcrule rule(&outofrange) ;
   const char *err = evolve(h, 1, rule) ;
   ASSERT_TRUE(err != 0) ;
   EXPECT_NE(string::npos, string(err).find("out of range")) ;
   EXPECT_EQ(1, h.size()) ;
}

TEST(EvolveTest, RejectsBadArguments) {
   nks_rule rule ;
   cahistory empty ;
   EXPECT_TRUE(0 != evolve(empty, 1, rule)) ;
   cahistory h ;
   ASSERT_STREQ(NULL, initsimple(h, 5)) ;
   EXPECT_TRUE(0 != evolve(h, -1, rule)) ;
   EXPECT_TRUE(0 != evolve(h, 1, rule, 0)) ;
   EXPECT_TRUE(0 != evolve2d(h, 1, rule)) ;
   cahistory h2 ;
   ASSERT_STREQ(NULL, initsimple2d(h2, 5, 5)) ;
   EXPECT_TRUE(0 != evolve(h2, 1, rule)) ;
   EXPECT_TRUE(0 != evolve2d(h2, 1, rule, 1, oneDimensional)) ;
   EXPECT_EQ(1, h.size()) ;
   EXPECT_EQ(1, h2.size()) ;
}

TEST(EvolveTest, NonMemoizableRuleRefusesCache) {
   reversible_rule rule ;
   cahistory h ;
   ASSERT_STREQ(NULL, initsimple(h, 5)) ;
   EXPECT_TRUE(0 != evolve(h, 1, rule, 1, true)) ;
   EXPECT_EQ(1, h.size()) ;
   funcrule f(&shiftleft, 2, false) ;
   EXPECT_TRUE(0 != evolve(h, 1, f, 1, true)) ;
   EXPECT_STREQ(NULL, evolve(h, 1, f)) ;
}

TEST(EvolveTest, ReversibleRuleRunsBackwards) {
   mt19937 rng(12) ;
   cahistory h ;
   ASSERT_STREQ(NULL, initrandom(h, 40, rng)) ;
   reversible_rule forward ;
   ASSERT_STREQ(NULL, forward.setrule("W30,Rev")) ;
   ASSERT_STREQ(NULL, evolve(h, 10, forward)) ;
   // swapping the last two generations reverses time
   reversible_rule backward ;
   ASSERT_STREQ(NULL, backward.setrule("W30,Rev")) ;
   ASSERT_STREQ(NULL, backward.setprevious(h[10])) ;
   cahistory back ;
   ASSERT_STREQ(NULL, back.push(h[9])) ;
   ASSERT_STREQ(NULL, evolve(back, 9, backward)) ;
   for (int t=0; t<=9; t++)
      EXPECT_TRUE(back[t] == h[9 - t]) << "generation " << t ;
}

TEST(Evolve2dTest, BlinkerHasPeriodTwo) {
   vector<int> cells(25, 0) ;
   // vertical bar in the middle column
   cells[1 * 5 + 2] = cells[2 * 5 + 2] = cells[3 * 5 + 2] = 1 ;
   cahistory h ;
   ASSERT_STREQ(NULL, initfromcells2d(h, 5, 5, 2, cells)) ;
   life_rule rule ;
   ASSERT_STREQ(NULL, evolve2d(h, 2, rule)) ;
   ASSERT_EQ(3, h.size()) ;
   EXPECT_FALSE(h[1] == h[0]) ;
   EXPECT_TRUE(h[2] == h[0]) ;
   // horizontal in between
   EXPECT_EQ(1, h[1].getcell(1, 2)) ;
   EXPECT_EQ(1, h[1].getcell(2, 2)) ;
   EXPECT_EQ(1, h[1].getcell(3, 2)) ;
   EXPECT_EQ(3, h[1].population()) ;
}

TEST(Evolve2dTest, GliderWrapsAroundTorus) {
   vector<int> cells(36, 0) ;
   int glider[5][2] = { {1, 0}, {2, 1}, {0, 2}, {1, 2}, {2, 2} } ;
   for (int i=0; i<5; i++)
      cells[glider[i][1] * 6 + glider[i][0]] = 1 ;
   cahistory h ;
   ASSERT_STREQ(NULL, initfromcells2d(h, 6, 6, 2, cells)) ;
   life_rule rule ;
   // a glider moves one cell diagonally every 4 generations
   ASSERT_STREQ(NULL, evolve2d(h, 24, rule, 1, Moore, true)) ;
   EXPECT_TRUE(h[24] == h[0]) ;
   for (int t=0; t<h.size(); t++)
      EXPECT_EQ(5, h[t].population()) ;
}

static int anyalive(const neighborhood &nb, int, int, int) {
   for (size_t i=0; i<nb.size(); i++)
      if (nb[i])
         return 1 ;
   return 0 ;
}

TEST(Evolve2dTest, NeighborhoodShapes) {
   cahistory moore, cross ;
   ASSERT_STREQ(NULL, initsimple2d(moore, 9, 9)) ;
   ASSERT_STREQ(NULL, initsimple2d(cross, 9, 9)) ;
   funcrule rule(&anyalive) ;
   ASSERT_STREQ(NULL, evolve2d(moore, 1, rule, 1, Moore)) ;
   ASSERT_STREQ(NULL, evolve2d(cross, 1, rule, 2, vonNeumann)) ;
   EXPECT_EQ(9, moore[1].population()) ;
   EXPECT_EQ(13, cross[1].population()) ;
   EXPECT_EQ(0, cross[1].getcell(2, 2)) ;
   EXPECT_EQ(1, cross[1].getcell(3, 3)) ;
}

TEST(EvolveTest, TotalisticWithMoreColorsThanCells) {
   // all cells at k-1 sum past the last digit of the rule number
   totalistic_rule rule ;
   ASSERT_STREQ(NULL, rule.setrule("T262143,K4")) ;
   cahistory h ;
   ASSERT_STREQ(NULL, initfromcells(h, 6, 4, vector<int>(6, 3))) ;
   ASSERT_STREQ(NULL, evolve(h, 2, rule)) ;
   ASSERT_EQ(3, h.size()) ;
   EXPECT_EQ(0, h[1].population()) ;
   EXPECT_EQ(6, h[2].population()) ;
   EXPECT_EQ(3, h[2].getcell(0)) ;
   ASSERT_STREQ(NULL, rule.setrule("T48828124,K5")) ;
   ASSERT_STREQ(NULL, initfromcells(h, 5, 5, vector<int>(5, 4))) ;
   ASSERT_STREQ(NULL, evolve(h, 1, rule)) ;
   EXPECT_EQ(0, h[1].population()) ;
}

TEST(Evolve2dTest, TotalisticOverMooreBlock) {
   // only an all-zero block gives 1
   totalistic_rule rule ;
   ASSERT_STREQ(NULL, rule.setrule("T1,K2")) ;
   cahistory h ;
   ASSERT_STREQ(NULL, initfromcells2d(h, 4, 4, 2, vector<int>(16, 0))) ;
   ASSERT_STREQ(NULL, evolve2d(h, 2, rule, 1, Moore)) ;
   EXPECT_EQ(16, h[1].population()) ;
   EXPECT_EQ(0, h[2].population()) ;
}

TEST(EvolveTest, VerboseRunReportsStatus) {
   recordingerrors errs ;
   caperf::setVerbose(1) ;
   cahistory h ;
   ASSERT_STREQ(NULL, initsimple(h, 50)) ;
   nks_rule rule ;
   ASSERT_STREQ(NULL, evolve(h, 10, rule, 1, true)) ;
   caperf::setVerbose(0) ;
   ASSERT_FALSE(errs.statuses.empty()) ;
   EXPECT_EQ(0u, errs.statuses.back().find("evolve gens 10 cells 500")) ;
}
