// This file is part of Calico.
// See docs/License.html for the copyright notice.

/**
 *   Basic utility classes for things like warnings and status lines.
 */
#ifndef UTIL_H
#define UTIL_H
#include <zlib.h>
#include <string>

void cawarning(const char *s) ;
void castatus(const char *s) ;
const char *cagetuserrules() ;
const char *cagetrulesdir() ;
/**
 *   Reads lines through zlib, so gzip-compressed and plain text files
 *   are handled the same way.  LF, CR and CRLF all end a line and the
 *   terminator is not returned.  The file is closed on destruction.
 */
class linereader {
public:
   linereader(gzFile f) : fp(f), lastchar(0) {}
   ~linereader() ;
   // false at end of file
   bool getline(std::string &line) ;
private:
   gzFile fp ;
   int lastchar ;
} ;
/**
 *   To substitute your own routines, use the following class.
 */
class caerrors {
public:
   virtual ~caerrors() {}
   virtual void warning(const char *s) = 0 ;
   virtual void status(const char *s) = 0 ;
   virtual const char *getuserrules() = 0 ;
   virtual const char *getrulesdir() = 0 ;
   static void seterrorhandler(caerrors *obj) ;
} ;
/**
 *   A routine to get the number of seconds elapsed since an arbitrary
 *   point, as a double.
 */
double calicoSecondCount() ;
/*
 *   Performance data for an evolution run.  We keep running values
 *   here.  We can copy this to a "mark" variable, and then report
 *   performance for deltas.
 */
struct caperf {
   void clear() {
      fastCellInc = 0 ;
      cellsCalculated = 0 ;
      cacheHits = 0 ;
      cacheLookups = 0 ;
      timeStamp = calicoSecondCount() ;
      genval = 0 ;
   }
   void reportStep(caperf &mark, double genval) ;
   void reportTotal(caperf &start, const char *what) ;
   int fastinc() {
      if ((++fastCellInc & reportMask) == 0)
         return 1 ;
      else
         return 0 ;
   }
   void cachelookup(int hit) {
      cacheLookups++ ;
      if (hit)
         cacheHits++ ;
   }
   static double getReportInterval() {
      return reportInterval ;
   }
   static void setReportInterval(double v) {
      reportInterval = v ;
   }
   static void setVerbose(int v) { verbose = v ; }
   static int getVerbose() { return verbose ; }
   int fastCellInc ;
   double cellsCalculated ;
   double cacheHits ;
   double cacheLookups ;
   double timeStamp ;
   double genval ;
   static int reportMask ;
   static double reportInterval ;
   static int verbose ;
} ;
#endif
