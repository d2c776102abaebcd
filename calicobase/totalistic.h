// This file is part of Calico.
// See docs/License.html for the copyright notice.

/**
 *   k-color totalistic rules.  The new state depends only on the sum s
 *   of the neighborhood.  The rule number is read in base k and the
 *   output is digit s, counting from the least significant digit
 *   (digit 0 is the output for an all-zero neighborhood).  Rule numbers
 *   are limited to k*n-k+1 digits for a window of n cells; a sum past
 *   the last digit (possible once k > n, or when the window is larger
 *   than the rule's) gets the implicit leading zero.  Written most
 *   significant digit first and zero-padded to k*n-k+1 digits, the rule
 *   number lists the outputs from the highest sum down to sum 0, which
 *   is the usual way the rule is drawn.
 *
 *   k is limited to 2..36 so that every digit has an alphanumeric
 *   symbol.
 */
#ifndef TOTALISTIC_H
#define TOTALISTIC_H
#include "carule.h"

const int MAXTOTALISTICSTATES = 36 ;
const int MAXTOTALISTICRADIUS = 64 ;

// returns <0 if k is out of range or a cell is not below k
int totalisticrule(const neighborhood &nb, int k, const bigint &rulenumber) ;

/**
 *   "T<n>,K<k>[,R<r>]", one-dimensional window of 2r+1 cells.
 */
class totalistic_rule : public carule {
public:
   totalistic_rule() ;
   virtual ~totalistic_rule() ;
   virtual int apply(const neighborhood &nb, int x, int y, int gen) ;
   virtual const char *setrule(const char *s) ;
   virtual const char *getrule() ;
   virtual const char *DefaultRule() { return "T777,K3" ; }
   virtual int NumCellStates() { return numstates ; }
   virtual int radius() { return rad ; }
   const char *setnumber(const bigint &n, int k, int r) ;
   // the zero-padded base-k digit string, most significant first
   const char *digitstring() ;
   static void doInitializeRuleInfo(staticRuleInfo &) ;
private:
   int numstates ;
   int rad ;
   bigint rulenumber ;
   std::vector<state> outputs ;   // output for each sum
   std::string canonrule ;
} ;
#endif
