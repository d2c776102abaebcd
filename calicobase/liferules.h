// This file is part of Calico.
// See docs/License.html for the copyright notice.

/**
 *   Outer-totalistic two-state rules on the Moore neighborhood of radius
 *   1, written as "B<digits>/S<digits>".  A dead cell is born if its
 *   count of live neighbors is one of the B digits; a live cell survives
 *   if its count is one of the S digits.  Conway's Game of Life is
 *   B3/S23 (also accepted as "Life").
 *
 *   The neighborhood must be the 9-cell row-major Moore block, so the
 *   cell itself is at index 4.
 */
#ifndef LIFERULES_H
#define LIFERULES_H
#include "carule.h"

const int MOORECELLS = 9 ;      // cells in a radius 1 Moore block
const int MOORECENTER = 4 ;     // index of the cell itself

// B3/S23; returns <0 if the neighborhood is not a binary Moore block
int gameoflife(const neighborhood &nb) ;

class life_rule : public carule {
public:
   life_rule() ;
   virtual ~life_rule() ;
   virtual int apply(const neighborhood &nb, int x, int y, int gen) ;
   virtual const char *setrule(const char *s) ;
   virtual const char *getrule() ;
   virtual const char *DefaultRule() { return "B3/S23" ; }
   bool isRegularLife() ;    // is this B3/S23?
   static void doInitializeRuleInfo(staticRuleInfo &) ;
private:
   // one bit for each neighbor count
   // bit:     17 16 15 14 13 12 11 10  9  8  7  6  5  4  3  2  1  0
   // meaning: s8 s7 s6 s5 s4 s3 s2 s1 s0 b8 b7 b6 b5 b4 b3 b2 b1 b0
   int rulebits ;
   std::string canonrule ;
   void createCanonicalName() ;
} ;
#endif
