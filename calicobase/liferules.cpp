// This file is part of Calico.
// See docs/License.html for the copyright notice.

#include "liferules.h"
#include <string.h>
#ifndef WIN32
   #include <strings.h>
   #define stricmp strcasecmp
#endif
using namespace std ;

// bit offset for survival part of rule
static const int survival_offset = 9 ;

// count live neighbors, not counting the cell itself; <0 if not binary
static int livecount(const neighborhood &nb) {
   if (nb.size() != MOORECELLS)
      return -1 ;
   int n = 0 ;
   for (int i=0; i<MOORECELLS; i++) {
      if (nb[i] > 1)
         return -1 ;
      if (i != MOORECENTER)
         n += nb[i] ;
   }
   return n ;
}

int gameoflife(const neighborhood &nb) {
   int n = livecount(nb) ;
   if (n < 0)
      return -1 ;
   if (nb[MOORECENTER])
      return (n == 2 || n == 3) ? 1 : 0 ;
   return n == 3 ? 1 : 0 ;
}

life_rule::life_rule() {
   setrule(DefaultRule()) ;
}

life_rule::~life_rule() {
}

int life_rule::apply(const neighborhood &nb, int, int, int) {
   int n = livecount(nb) ;
   if (n < 0)
      return -1 ;
   int offset = nb[MOORECENTER] ? survival_offset : 0 ;
   return (rulebits >> (n + offset)) & 1 ;
}

bool life_rule::isRegularLife() {
   return rulebits == ((1 << 3) | (1 << (2 + survival_offset)) |
                       (1 << (3 + survival_offset))) ;
}

const char *life_rule::setrule(const char *s) {
   string rule = trim(s) ;
   if (stricmp(rule.c_str(), "Life") == 0)
      rule = "B3/S23" ;
   vector<string> parts = tokenize(rule, "/") ;
   if (parts.size() != 2)
      return "Life rules must look like B<digits>/S<digits>." ;
   int bits = 0 ;
   bool seen_b = false, seen_s = false ;
   for (size_t p=0; p<parts.size(); p++) {
      const string &part = parts[p] ;
      int offset ;
      if (part[0] == 'B' || part[0] == 'b') {
         if (seen_b)
            return "Life rules need exactly one B part." ;
         seen_b = true ;
         offset = 0 ;
      } else if (part[0] == 'S' || part[0] == 's') {
         if (seen_s)
            return "Life rules need exactly one S part." ;
         seen_s = true ;
         offset = survival_offset ;
      } else {
         return "Life rules must look like B<digits>/S<digits>." ;
      }
      for (size_t i=1; i<part.size(); i++) {
         if (part[i] < '0' || part[i] > '8')
            return "Neighbor counts must be from 0 to 8." ;
         bits |= 1 << (part[i] - '0' + offset) ;
      }
   }
   rulebits = bits ;
   createCanonicalName() ;
   return 0 ;
}

// canonical form lists each count once, in increasing order
void life_rule::createCanonicalName() {
   canonrule = "B" ;
   for (int i=0; i<survival_offset; i++)
      if (rulebits & (1 << i))
         canonrule += (char)('0' + i) ;
   canonrule += "/S" ;
   for (int i=0; i<survival_offset; i++)
      if (rulebits & (1 << (i + survival_offset)))
         canonrule += (char)('0' + i) ;
}

const char *life_rule::getrule() {
   return canonrule.c_str() ;
}

static carule *creator_life() { return new life_rule() ; }
void life_rule::doInitializeRuleInfo(staticRuleInfo &ai) {
   ai.setRuleName("Life") ;
   ai.setRuleCreator(&creator_life) ;
   ai.minstates = 2 ;
   ai.maxstates = 2 ;
}
