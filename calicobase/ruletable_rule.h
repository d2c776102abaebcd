// This file is part of Calico.
// See docs/License.html for the copyright notice.

#ifndef RULETABLE_RULE_H
#define RULETABLE_RULE_H
#include "carule.h"
#include "ruletable.h"
/**
 *   A rule that looks its transitions up in a rule table.  The rule
 *   string names a table file: name.table (or name.table.gz) is looked
 *   for in the user's rules directory, then in the rules directory, and
 *   finally the name is tried as a path.  Tuples the table leaves
 *   undefined make apply() fail.
 */
class table_rule : public carule {
public:
   table_rule() ;
   explicit table_rule(const ruletable &t, TNeighborhood kind=oneDimensional,
                       int r=1) ;
   virtual ~table_rule() ;
   virtual int apply(const neighborhood &nb, int x, int y, int gen) ;
   virtual const char *setrule(const char *s) ;
   virtual const char *getrule() ;
   virtual const char *DefaultRule() ;
   virtual int NumCellStates() { return table.NumCellStates() ; }
   virtual int radius() { return rad ; }
   // returns err msg if the table does not fit the neighborhood
   const char *setruletable(const ruletable &t, TNeighborhood kind, int r,
                            const char *name="table") ;
   const ruletable &gettable() const { return table ; }
   TNeighborhood neighborhoodkind() const { return nbkind ; }
   static void doInitializeRuleInfo(staticRuleInfo &) ;
private:
   const char *loadfromdir(const std::string &name, const char *dir,
                           const char *suffix) ;
   ruletable table ;
   TNeighborhood nbkind ;
   int rad ;
   std::string currentrule ;
} ;
#endif
