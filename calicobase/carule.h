// This file is part of Calico.
// See docs/License.html for the copyright notice.

/**
 *   This is the pure abstract class any transition rule must support.
 *   As long as a rule implements this interface, the evolution engine
 *   can drive it; built-in rule families and user-supplied rules are
 *   treated the same way.
 */
#ifndef CARULE_H
#define CARULE_H
#include "neighborhood.h"
#include "bigint.h"
#include <string>
#include <vector>

class carule {
public:
   carule() {}
   virtual ~carule() ;
   // compute the next state of cell (x,y) given its neighborhood; gen is
   // the index in the history of the grid being computed.  Returns <0 if
   // the rule has no transition for this neighborhood.
   virtual int apply(const neighborhood &nb, int x, int y, int gen) = 0 ;
   // new rules; returns err msg
   virtual const char *setrule(const char *s) ;
   virtual const char *getrule() ;
   virtual const char *DefaultRule() { return "" ; }
   // return number of cell states this rule works over (2..256)
   virtual int NumCellStates() { return 2 ; }
   // neighborhood radius the rule was built for
   virtual int radius() { return 1 ; }
   // can the output be cached by neighborhood alone?  Rules that look
   // at x, y or gen, or keep state of their own, must return false.
   virtual bool memoizable() { return true ; }
} ;

/**
 *   Adapts a plain function to the carule interface.
 */
typedef int (*rulefunc)(const neighborhood &nb, int x, int y, int gen) ;
class funcrule : public carule {
public:
   funcrule(rulefunc f, int numstates=2, bool canmemo=true)
      : func(f), nstates(numstates), memo(canmemo) {}
   virtual int apply(const neighborhood &nb, int x, int y, int gen) {
      return func(nb, x, y, gen) ;
   }
   virtual int NumCellStates() { return nstates ; }
   virtual bool memoizable() { return memo ; }
private:
   rulefunc func ;
   int nstates ;
   bool memo ;
} ;

/**
 *   If you need any static information about a rule family, this class
 *   holds it.  Each family registers itself through a static method
 *   that fills in one of these.
 */
class staticRuleInfo {
public:
   staticRuleInfo() ;
   virtual ~staticRuleInfo() { } ;

   // mandatory
   void setRuleName(const char *s) { ruleName = s ; }
   void setRuleCreator(carule *(*f)()) { creator = f ; }

   // minimum and maximum number of cell states supported by this family;
   // both must be within 2..256
   int minstates ;
   int maxstates ;

   // basic data
   const char *ruleName ;
   carule *(*creator)() ;
   int id ; // my index
   staticRuleInfo *next ;

   // support:  give me sequential rule family IDs
   static int getNumRules() { return nextRuleId ; }
   static int nextRuleId ;
   static staticRuleInfo &tick() ;
   static staticRuleInfo *head ;
   static staticRuleInfo *byName(const char *s) ;
   static staticRuleInfo *byIndex(int i) ;
   static int nameToIndex(const char *s) ;
} ;

// register the built-in rule families; safe to call more than once
void initrules() ;
// create a rule from a rule string, trying each family in registration
// order; on success *result is a new rule owned by the caller
const char *makerule(const char *s, carule **result) ;

/*
 *   Rule string helpers shared by the rule families.
 */
std::vector<std::string> tokenize(const std::string &str,
                                  const std::string &delimiters) ;
bool starts_with(const std::string &line, const std::string &keyword) ;
std::string trim(const std::string &s, const std::string &t = " \t\r\n") ;
// parse a token like "R2" (letter then unsigned int); returns err msg
const char *parseintparam(const std::string &tok, char letter, int &value) ;
#endif
