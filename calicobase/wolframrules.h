// This file is part of Calico.
// See docs/License.html for the copyright notice.

/**
 *   Binary rules in Wolfram's numbering.  The neighborhood is read as a
 *   base-2 numeral with the leftmost cell the most significant bit,
 *   giving an index i in [0, 2^n); the new state is bit i of the rule
 *   number.  For r=1 this is the familiar elementary CA numbering
 *   (rule 30: 111 110 101 100 011 010 001 000 -> 0 0 0 1 1 1 1 0).
 */
#ifndef WOLFRAMRULES_H
#define WOLFRAMRULES_H
#include "carule.h"

// largest radius binary_rule accepts; the rule number then has
// 2^(2r+1) bits
const int MAXBINARYRADIUS = 10 ;

// returns <0 if a cell is not 0 or 1, or the neighborhood is too long
int binaryrule(const neighborhood &nb, const bigint &rulenumber) ;
// the r=1 specialization
int nksrule(const neighborhood &nb, const bigint &rulenumber) ;

/**
 *   Elementary rules W0..W255.
 */
class nks_rule : public carule {
public:
   nks_rule() ;
   virtual ~nks_rule() ;
   virtual int apply(const neighborhood &nb, int x, int y, int gen) ;
   virtual const char *setrule(const char *s) ;
   virtual const char *getrule() ;
   virtual const char *DefaultRule() { return "W30" ; }
   const char *setnumber(int n) ;
   static void doInitializeRuleInfo(staticRuleInfo &) ;
private:
   int rulebits[8] ;
   std::string canonrule ;
} ;

/**
 *   Binary rules of any radius, "W<n>,R<r>".
 */
class binary_rule : public carule {
public:
   binary_rule() ;
   virtual ~binary_rule() ;
   virtual int apply(const neighborhood &nb, int x, int y, int gen) ;
   virtual const char *setrule(const char *s) ;
   virtual const char *getrule() ;
   virtual const char *DefaultRule() { return "W1771476585,R2" ; }
   virtual int radius() { return rad ; }
   const char *setnumber(const bigint &n, int r) ;
   static void doInitializeRuleInfo(staticRuleInfo &) ;
private:
   bigint rulenumber ;
   int rad ;
   std::string canonrule ;
} ;

/**
 *   Second-order reversible version of an elementary rule, "W<n>,Rev":
 *   the new state is the elementary rule's output XOR the state the
 *   cell had one generation before the current one.  The rule keeps
 *   that earlier generation itself, so it only works left to right in
 *   one dimension and can never be memoized.
 */
class reversible_rule : public carule {
public:
   reversible_rule() ;
   virtual ~reversible_rule() ;
   virtual int apply(const neighborhood &nb, int x, int y, int gen) ;
   virtual const char *setrule(const char *s) ;
   virtual const char *getrule() ;
   virtual const char *DefaultRule() { return "W90,Rev" ; }
   virtual bool memoizable() { return false ; }
   // use g as the generation before the first one evolved; without
   // this all cells start out with a previous state of 0
   const char *setprevious(const cagrid &g) ;
   static void doInitializeRuleInfo(staticRuleInfo &) ;
private:
   nks_rule base ;
   std::vector<state> previous ;
   std::string canonrule ;
} ;
#endif
