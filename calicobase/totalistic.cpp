// This file is part of Calico.
// See docs/License.html for the copyright notice.

#include "totalistic.h"
using namespace std ;

int totalisticrule(const neighborhood &nb, int k, const bigint &rulenumber) {
   if (k < 2 || k > MAXTOTALISTICSTATES)
      return -1 ;
   int s = 0 ;
   for (size_t i=0; i<nb.size(); i++) {
      if (nb[i] >= k)
         return -1 ;
      s += nb[i] ;
   }
   return rulenumber.digit(s, k) ;
}

totalistic_rule::totalistic_rule() {
   setrule(DefaultRule()) ;
}

totalistic_rule::~totalistic_rule() {
}

int totalistic_rule::apply(const neighborhood &nb, int, int, int) {
   unsigned int s = 0 ;
   for (size_t i=0; i<nb.size(); i++) {
      if (nb[i] >= numstates)
         return -1 ;
      s += nb[i] ;
   }
   // digits past the table are the rule number's leading zeros
   if (s >= outputs.size())
      return 0 ;
   return outputs[s] ;
}

const char *totalistic_rule::setnumber(const bigint &n, int k, int r) {
   if (k < 2 || k > MAXTOTALISTICSTATES)
      return "Totalistic rules need from 2 to 36 states." ;
   if (r < 1 || r > MAXTOTALISTICRADIUS)
      return "Totalistic rule radius must be from 1 to 64." ;
   int window = 2 * r + 1 ;
   int ndigits = k * window - k + 1 ;
   if (n >= bigint::power(k, ndigits))
      return "Rule number too large for this number of states and radius." ;
   // the largest sum is (k-1)*window, which can need more digits than
   // the rule number has
   int nsums = (k - 1) * window + 1 ;
   numstates = k ;
   rad = r ;
   rulenumber = n ;
   // peel off the base-k digits once so apply() is a plain lookup
   outputs.resize(nsums > ndigits ? nsums : ndigits) ;
   bigint t = n ;
   for (size_t i=0; i<outputs.size(); i++) {
      outputs[i] = (state)t.mod_smallint(k) ;
      t.div_smallint(k) ;
   }
   canonrule = "T" + string(n.tostring(0)) + ",K" ;
   canonrule += bigint(k).tostring(0) ;
   if (r != 1) {
      canonrule += ",R" ;
      canonrule += bigint(r).tostring(0) ;
   }
   return 0 ;
}

const char *totalistic_rule::setrule(const char *s) {
   vector<string> tokens = tokenize(trim(s), ",") ;
   if (tokens.empty() || (tokens[0][0] != 'T' && tokens[0][0] != 't'))
      return "Totalistic rules must start with T." ;
   bigint n ;
   const char *err = bigint::parse(tokens[0].c_str() + 1, n) ;
   if (err)
      return err ;
   int k = -1 ;
   int r = 1 ;
   for (size_t i=1; i<tokens.size(); i++) {
      string tok = trim(tokens[i]) ;
      if (tok.empty())
         continue ;
      if (tok[0] == 'K' || tok[0] == 'k')
         err = parseintparam(tok, 'K', k) ;
      else if (tok[0] == 'R' || tok[0] == 'r')
         err = parseintparam(tok, 'R', r) ;
      else
         err = "Unknown totalistic rule parameter." ;
      if (err)
         return err ;
   }
   if (k < 0)
      return "Totalistic rules need a K<states> parameter." ;
   return setnumber(n, k, r) ;
}

const char *totalistic_rule::getrule() {
   return canonrule.c_str() ;
}

const char *totalistic_rule::digitstring() {
   return rulenumber.tobase(numstates, numstates * (2 * rad + 1) - numstates + 1) ;
}

static carule *creator_totalistic() { return new totalistic_rule() ; }
void totalistic_rule::doInitializeRuleInfo(staticRuleInfo &ai) {
   ai.setRuleName("Totalistic") ;
   ai.setRuleCreator(&creator_totalistic) ;
   ai.minstates = 2 ;
   ai.maxstates = MAXTOTALISTICSTATES ;
}
