// This file is part of Calico.
// See docs/License.html for the copyright notice.

#include "util.h"
#include <stdio.h>
using namespace std ;

#ifdef _WIN32
#include <windows.h>
#else
#include <sys/time.h>
#endif

/**
 *   Everything goes to stderr.
 */
class basecaerrors : public caerrors {
public:
   virtual void warning(const char *s) {
      fprintf(stderr, "%s\n", s) ;
   }
   virtual void status(const char *s) {
      fprintf(stderr, "%s\n", s) ;
   }
   virtual const char *getuserrules() {
      return "" ;
   }
   virtual const char *getrulesdir() {
      return "" ;
   }
} ;

static basecaerrors defaulterrors ;
static caerrors *errorhandler = &defaulterrors ;

void caerrors::seterrorhandler(caerrors *o) {
   errorhandler = o ? o : &defaulterrors ;
}

void cawarning(const char *s) {
   errorhandler->warning(s) ;
}

void castatus(const char *s) {
   errorhandler->status(s) ;
}

const char *cagetuserrules() {
   return errorhandler->getuserrules() ;
}

const char *cagetrulesdir() {
   return errorhandler->getrulesdir() ;
}

linereader::~linereader() {
   if (fp)
      gzclose(fp) ;
}

const int LF = 10 ;
const int CR = 13 ;
bool linereader::getline(string &line) {
   line.clear() ;
   for (;;) {
      int c = gzgetc(fp) ;
      // swallow the LF of a CRLF pair
      if (c == LF && lastchar == CR) {
         lastchar = LF ;
         continue ;
      }
      lastchar = c ;
      if (c < 0)
         return !line.empty() ;
      if (c == LF || c == CR)
         return true ;
      line += (char)c ;
   }
}

#ifdef _WIN32
static double freq = 0.0;
double calicoSecondCount() {
   LARGE_INTEGER now;
   if (freq == 0.0) {
      LARGE_INTEGER f;
      QueryPerformanceFrequency(&f);
      freq = (double)f.QuadPart;
      if (freq <= 0.0) freq = 1.0;	// play safe and avoid div by 0
   }
   QueryPerformanceCounter(&now);
   return (now.QuadPart) / freq;
}
#else
double calicoSecondCount() {
   struct timeval tv ;
   gettimeofday(&tv, 0) ;
   return tv.tv_sec + 0.000001 * tv.tv_usec ;
}
#endif

/*
 *   Reporting.
 *   The cell count between clock checks wants to be big to reduce the
 *   number of "get times" we do, but small enough that a slow rule
 *   still gets a timely status line.
 */
int caperf::reportMask = ((1<<16)-1) ; // cell count between checks
/*
 *   How frequently do we emit a status line?  Every two seconds
 *   should be reasonable.  If we set this to zero, then that disables
 *   performance reporting.
 */
double caperf::reportInterval = 2 ; // time between reports
int caperf::verbose ;
/*
 *   Static buffer for status updates.
 */
static char perfstatusline[200] ;
void caperf::reportStep(caperf &mark, double newGen) {
   cellsCalculated += fastCellInc ;
   fastCellInc = 0 ;
   timeStamp = calicoSecondCount() ;
   double elapsed = timeStamp - mark.timeStamp ;
   if (reportInterval == 0 || elapsed < reportInterval)
      return ;
   if (verbose) {
      double inc = newGen - mark.genval ;
      if (inc == 0)
         inc = 1e30 ;
      double cellCount = cellsCalculated - mark.cellsCalculated ;
      double lookups = cacheLookups - mark.cacheLookups ;
      double hitFrac = 0 ;
      if (lookups > 0)
         hitFrac = (cacheHits - mark.cacheHits) / lookups ;
      snprintf(perfstatusline, sizeof(perfstatusline),
          "PERF gps %g cps %g cpg %g hits %g gen %g",
          inc / elapsed, cellCount / elapsed, cellCount / inc, hitFrac,
          newGen) ;
      castatus(perfstatusline) ;
   }
   genval = newGen ;
   mark = *this ;
}
void caperf::reportTotal(caperf &start, const char *what) {
   cellsCalculated += fastCellInc ;
   fastCellInc = 0 ;
   if (!verbose)
      return ;
   double elapsed = calicoSecondCount() - start.timeStamp ;
   double lookups = cacheLookups - start.cacheLookups ;
   double hitFrac = 0 ;
   if (lookups > 0)
      hitFrac = (cacheHits - start.cacheHits) / lookups ;
   snprintf(perfstatusline, sizeof(perfstatusline),
       "%s gens %g cells %g secs %g hits %g",
       what, genval - start.genval, cellsCalculated - start.cellsCalculated,
       elapsed, hitFrac) ;
   castatus(perfstatusline) ;
}
