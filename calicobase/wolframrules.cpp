// This file is part of Calico.
// See docs/License.html for the copyright notice.

#include "wolframrules.h"
#include <string.h>
#ifndef WIN32
   #include <strings.h>
   #define stricmp strcasecmp
#endif
using namespace std ;

int binaryrule(const neighborhood &nb, const bigint &rulenumber) {
   // the index has to fit in an int
   if (nb.empty() || nb.size() > 30)
      return -1 ;
   int i = 0 ;
   for (size_t j=0; j<nb.size(); j++) {
      if (nb[j] > 1)
         return -1 ;
      i = (i << 1) | nb[j] ;
   }
   return rulenumber.bit(i) ;
}

int nksrule(const neighborhood &nb, const bigint &rulenumber) {
   if (nb.size() != 3)
      return -1 ;
   return binaryrule(nb, rulenumber) ;
}

/*
 *   Split "W<n>[,...]" into the rule number and the remaining tokens.
 */
static const char *parsewolfram(const char *s, bigint &n,
                                vector<string> &rest) {
   vector<string> tokens = tokenize(trim(s), ",") ;
   if (tokens.empty() || (tokens[0][0] != 'W' && tokens[0][0] != 'w'))
      return "Wolfram rules must start with W." ;
   const char *err = bigint::parse(tokens[0].c_str() + 1, n) ;
   if (err)
      return err ;
   rest.assign(tokens.begin() + 1, tokens.end()) ;
   for (size_t i=0; i<rest.size(); i++)
      rest[i] = trim(rest[i]) ;
   return 0 ;
}

nks_rule::nks_rule() {
   setnumber(30) ;
}

nks_rule::~nks_rule() {
}

int nks_rule::apply(const neighborhood &nb, int, int, int) {
   if (nb.size() != 3 || nb[0] > 1 || nb[1] > 1 || nb[2] > 1)
      return -1 ;
   return rulebits[(nb[0] << 2) | (nb[1] << 1) | nb[2]] ;
}

const char *nks_rule::setnumber(int n) {
   if (n < 0 || n > 255)
      return "Elementary rule number must be from 0 to 255." ;
   for (int i=0; i<8; i++)
      rulebits[i] = (n >> i) & 1 ;
   canonrule = "W" + string(bigint(n).tostring(0)) ;
   return 0 ;
}

const char *nks_rule::setrule(const char *s) {
   bigint n ;
   vector<string> rest ;
   const char *err = parsewolfram(s, n, rest) ;
   if (err)
      return err ;
   if (!rest.empty())
      return "Elementary rules take no parameters." ;
   if (n > bigint(255))
      return "Elementary rule number must be from 0 to 255." ;
   return setnumber(n.toint()) ;
}

const char *nks_rule::getrule() {
   return canonrule.c_str() ;
}

static carule *creator_nks() { return new nks_rule() ; }
void nks_rule::doInitializeRuleInfo(staticRuleInfo &ai) {
   ai.setRuleName("NKS") ;
   ai.setRuleCreator(&creator_nks) ;
   ai.minstates = 2 ;
   ai.maxstates = 2 ;
}

binary_rule::binary_rule() {
   setrule(DefaultRule()) ;
}

binary_rule::~binary_rule() {
}

int binary_rule::apply(const neighborhood &nb, int, int, int) {
   if ((int)nb.size() != 2 * rad + 1)
      return -1 ;
   return binaryrule(nb, rulenumber) ;
}

const char *binary_rule::setnumber(const bigint &n, int r) {
   if (r < 1 || r > MAXBINARYRADIUS)
      return "Binary rule radius must be from 1 to 10." ;
   // there are 2^(2r+1) neighborhoods, one output bit each
   if (n.bitsreq() > (1 << (2 * r + 1)))
      return "Rule number too large for this radius." ;
   rulenumber = n ;
   rad = r ;
   canonrule = "W" + string(n.tostring(0)) + ",R" ;
   canonrule += bigint(r).tostring(0) ;
   return 0 ;
}

const char *binary_rule::setrule(const char *s) {
   bigint n ;
   vector<string> rest ;
   const char *err = parsewolfram(s, n, rest) ;
   if (err)
      return err ;
   int r = 1 ;
   if (rest.size() > 1)
      return "Binary rules take only a radius parameter." ;
   if (rest.size() == 1) {
      err = parseintparam(rest[0], 'R', r) ;
      if (err)
         return err ;
   }
   return setnumber(n, r) ;
}

const char *binary_rule::getrule() {
   return canonrule.c_str() ;
}

static carule *creator_binary() { return new binary_rule() ; }
void binary_rule::doInitializeRuleInfo(staticRuleInfo &ai) {
   ai.setRuleName("Binary") ;
   ai.setRuleCreator(&creator_binary) ;
   ai.minstates = 2 ;
   ai.maxstates = 2 ;
}

reversible_rule::reversible_rule() {
   setrule(DefaultRule()) ;
}

reversible_rule::~reversible_rule() {
}

int reversible_rule::apply(const neighborhood &nb, int x, int y, int gen) {
   if (y != 0 || x < 0)
      return -1 ;
   int regular = base.apply(nb, x, y, gen) ;
   if (regular < 0)
      return regular ;
   if (x >= (int)previous.size())
      previous.resize(x + 1, 0) ;
   int newstate = regular ^ previous[x] ;
   // the current state becomes the previous one for the next generation
   previous[x] = nb[nb.size() / 2] ;
   return newstate ;
}

const char *reversible_rule::setrule(const char *s) {
   bigint n ;
   vector<string> rest ;
   const char *err = parsewolfram(s, n, rest) ;
   if (err)
      return err ;
   if (rest.size() != 1 || stricmp(rest[0].c_str(), "Rev") != 0)
      return "Reversible rules must look like W<n>,Rev." ;
   if (n > bigint(255))
      return "Elementary rule number must be from 0 to 255." ;
   err = base.setnumber(n.toint()) ;
   if (err)
      return err ;
   canonrule = string(base.getrule()) + ",Rev" ;
   previous.clear() ;
   return 0 ;
}

const char *reversible_rule::getrule() {
   return canonrule.c_str() ;
}

const char *reversible_rule::setprevious(const cagrid &g) {
   if (g.check())
      return g.check() ;
   if (g.dimensions() != 1 || g.NumCellStates() != 2)
      return "Reversible rules need a one-dimensional binary grid." ;
   previous = g.cells() ;
   return 0 ;
}

static carule *creator_reversible() { return new reversible_rule() ; }
void reversible_rule::doInitializeRuleInfo(staticRuleInfo &ai) {
   ai.setRuleName("Reversible") ;
   ai.setRuleCreator(&creator_reversible) ;
   ai.minstates = 2 ;
   ai.maxstates = 2 ;
}
