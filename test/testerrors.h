// This file is part of Calico.
// See docs/License.html for the copyright notice.

#ifndef TESTERRORS_H
#define TESTERRORS_H
#include "util.h"
#include <string>
#include <vector>

/**
 *   Error handler that records what it is told instead of printing it.
 *   Installed for the life of the object.
 */
class recordingerrors : public caerrors {
public:
   recordingerrors(const char *userrules="", const char *ruledir="")
      : userdir(userrules), rulesdir(ruledir) {
      caerrors::seterrorhandler(this) ;
   }
   virtual ~recordingerrors() {
      caerrors::seterrorhandler(0) ;
   }
   virtual void warning(const char *s) { warnings.push_back(s) ; }
   virtual void status(const char *s) { statuses.push_back(s) ; }
   virtual const char *getuserrules() { return userdir.c_str() ; }
   virtual const char *getrulesdir() { return rulesdir.c_str() ; }
   std::vector<std::string> warnings, statuses ;
private:
   std::string userdir, rulesdir ;
} ;
#endif
