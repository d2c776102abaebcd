// This file is part of Calico.
// See docs/License.html for the copyright notice.

#include "ruletable_rule.h"
#include "readtable.h"
#include "util.h"      // for cagetuserrules, cagetrulesdir, cawarning
#include <string.h>
using namespace std ;

// elementary rule 110 written as a table
static const char *defaultRuleData[] = {
   "n_states:2", "neighborhood:oneDimensional", "radius:1",
   "0000", "0011", "0101", "0111", "1000", "1011", "1101", "1110", 0 } ;

static const char *defaultRuleName = "ECA110" ;

static const char *openfailure = "Failed to open file: " ;

static bool notfound(const char *err) {
   return err && strncmp(err, openfailure, strlen(openfailure)) == 0 ;
}

table_rule::table_rule() : nbkind(oneDimensional), rad(1) {
   setrule(DefaultRule()) ;
}

table_rule::table_rule(const ruletable &t, TNeighborhood kind, int r)
   : table(t), nbkind(kind), rad(r), currentrule("table") {
}

table_rule::~table_rule() {
}

const char *table_rule::DefaultRule() {
   return defaultRuleName ;
}

int table_rule::apply(const neighborhood &nb, int, int, int) {
   return table.lookup(nb) ;
}

const char *table_rule::setruletable(const ruletable &t, TNeighborhood kind,
                                     int r, const char *name) {
   if (r < 1 || windowsize(kind, r) != t.windowsize())
      return "Rule table does not match the neighborhood." ;
   table = t ;
   nbkind = kind ;
   rad = r ;
   currentrule = name ;
   return 0 ;
}

const char *table_rule::loadfromdir(const string &name, const char *dir,
                                    const char *suffix) {
   string path = dir ;
   int istart = (int)path.size() ;
   path += name + suffix ;
   // change "dangerous" characters to underscores
   for (unsigned int i=istart; i<path.size(); i++)
      if (path[i] == '/' || path[i] == '\\') path[i] = '_' ;
   ruletable t ;
   TNeighborhood kind ;
   int r ;
   const char *err = readruletable(path.c_str(), t, kind, r) ;
   if (err)
      return err ;
   return setruletable(t, kind, r, name.c_str()) ;
}

const char *table_rule::setrule(const char *s) {
   string name = trim(s) ;
   if (name.empty())
      return "Rule table name is empty." ;
   ruletable t ;
   TNeighborhood kind ;
   int r ;
   const char *err = 0 ;
   if (name == defaultRuleName) {
      err = readruletabledata(defaultRuleData, t, kind, r) ;
      if (err == 0)
         err = setruletable(t, kind, r, defaultRuleName) ;
      return err ;
   }
   // look in the user's rules dir then in the rules dir, plain first
   const char *dirs[2] = { cagetuserrules(), cagetrulesdir() } ;
   const char *suffixes[2] = { ".table", ".table.gz" } ;
   err = openfailure ;
   for (int i=0; i<4 && notfound(err); i++)
      err = loadfromdir(name, dirs[i/2], suffixes[i%2]) ;
   if (notfound(err)) {
      // maybe it's a path
      err = readruletable(name.c_str(), t, kind, r) ;
      if (err == 0)
         err = setruletable(t, kind, r, name.c_str()) ;
   }
   // if the file exists and we've got an error then it must be a file
   // format issue
   if (err && !notfound(err))
      cawarning(err) ;
   return err ;
}

const char *table_rule::getrule() {
   return currentrule.c_str() ;
}

static carule *creator_table() { return new table_rule() ; }
void table_rule::doInitializeRuleInfo(staticRuleInfo &ai) {
   ai.setRuleName("RuleTable") ;
   ai.setRuleCreator(&creator_table) ;
   ai.minstates = 2 ;
   ai.maxstates = 256 ;
}
