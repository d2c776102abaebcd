// This file is part of Calico.
// See docs/License.html for the copyright notice.

#include "carule.h"
#include "wolframrules.h"
#include "totalistic.h"
#include "liferules.h"
#include "ruletable_rule.h"
#include <string.h>
#include <stdlib.h>
#include <ctype.h>
#ifndef WIN32
   #include <strings.h>
   #define strnicmp strncasecmp
#endif
using namespace std ;

carule::~carule() {
}

const char *carule::setrule(const char *) {
   return "This rule does not accept rule strings." ;
}

const char *carule::getrule() {
   return DefaultRule() ;
}

int staticRuleInfo::nextRuleId = 0 ;
staticRuleInfo *staticRuleInfo::head = 0 ;
staticRuleInfo::staticRuleInfo() {
   id = nextRuleId++ ;
   next = head ;
   head = this ;
   ruleName = 0 ;
   creator = 0 ;
   minstates = 2 ;
   maxstates = 2 ;
}
staticRuleInfo *staticRuleInfo::byName(const char *s) {
   for (staticRuleInfo *i=head; i; i=i->next)
      if (i->ruleName && strcmp(i->ruleName, s) == 0)
         return i ;
   return 0 ;
}
staticRuleInfo *staticRuleInfo::byIndex(int n) {
   for (staticRuleInfo *i=head; i; i=i->next)
      if (i->id == n)
         return i ;
   return 0 ;
}
int staticRuleInfo::nameToIndex(const char *s) {
   staticRuleInfo *r = byName(s) ;
   if (r == 0)
      return -1 ;
   return r->id ;
}
staticRuleInfo &staticRuleInfo::tick() {
   return *(new staticRuleInfo()) ;
}

void initrules() {
   static bool initialized = false ;
   if (initialized)
      return ;
   initialized = true ;
   // the order here is the order makerule() tries the families in
   nks_rule::doInitializeRuleInfo(staticRuleInfo::tick()) ;
   binary_rule::doInitializeRuleInfo(staticRuleInfo::tick()) ;
   reversible_rule::doInitializeRuleInfo(staticRuleInfo::tick()) ;
   totalistic_rule::doInitializeRuleInfo(staticRuleInfo::tick()) ;
   life_rule::doInitializeRuleInfo(staticRuleInfo::tick()) ;
   table_rule::doInitializeRuleInfo(staticRuleInfo::tick()) ;
}

const char *makerule(const char *s, carule **result) {
   initrules() ;
   *result = 0 ;
   for (int i=0; i<staticRuleInfo::getNumRules(); i++) {
      staticRuleInfo *ai = staticRuleInfo::byIndex(i) ;
      if (ai == 0 || ai->creator == 0)
         continue ;
      carule *r = (*ai->creator)() ;
      // tables are registered last so they only see names no other
      // family accepts
      if (r->setrule(s) == 0) {
         *result = r ;
         return 0 ;
      }
      delete r ;
   }
   return "Rule string is not valid for any rule family." ;
}

vector<string> tokenize(const string &str, const string &delimiters) {
   vector<string> tokens ;
   // skip delimiters at beginning
   string::size_type lastPos = str.find_first_not_of(delimiters, 0) ;
   // find first "non-delimiter"
   string::size_type pos = str.find_first_of(delimiters, lastPos) ;
   while (string::npos != pos || string::npos != lastPos) {
      tokens.push_back(str.substr(lastPos, pos - lastPos)) ;
      lastPos = str.find_first_not_of(delimiters, pos) ;
      pos = str.find_first_of(delimiters, lastPos) ;
   }
   return tokens ;
}

bool starts_with(const string &line, const string &keyword) {
   return strnicmp(line.c_str(), keyword.c_str(), keyword.length()) == 0 ;
}

string trim(const string &s, const string &t) {
   string::size_type first = s.find_first_not_of(t) ;
   if (first == string::npos)
      return "" ;
   string::size_type last = s.find_last_not_of(t) ;
   return s.substr(first, last - first + 1) ;
}

const char *parseintparam(const string &tok, char letter, int &value) {
   static string errmsg ;
   if (tok.size() < 2 ||
       toupper((unsigned char)tok[0]) != toupper((unsigned char)letter)) {
      errmsg = string("Expected a parameter starting with ") + letter + "." ;
      return errmsg.c_str() ;
   }
   for (size_t i=1; i<tok.size(); i++)
      if (tok[i] < '0' || tok[i] > '9' || i > 6) {
         errmsg = string("Bad value for parameter ") + letter + "." ;
         return errmsg.c_str() ;
      }
   value = atoi(tok.c_str() + 1) ;
   return 0 ;
}
