// This file is part of Calico.
// See docs/License.html for the copyright notice.

#include "complexity.h"
#include <math.h>
#include <vector>
using namespace std ;

// -sum p log2 p over the nonzero counts
static double entropyofcounts(const vector<int> &counts, int total) {
   double h = 0 ;
   for (size_t i=0; i<counts.size(); i++)
      if (counts[i] > 0) {
         double p = (double)counts[i] / total ;
         h -= p * log2(p) ;
      }
   return h ;
}

const char *cellentropy(const cahistory &h, int x, int y, double &result) {
   if (h.empty())
      return "History is empty." ;
   const cagrid &g = h[0] ;
   if (x < 0 || x >= g.width() || y < 0 || y >= g.height())
      return "Cell position is outside the grid." ;
   vector<int> counts(g.NumCellStates(), 0) ;
   for (int t=0; t<h.size(); t++)
      counts[h[t].getcell(x, y)]++ ;
   result = entropyofcounts(counts, h.size()) ;
   return 0 ;
}

const char *averagecellentropy(const cahistory &h, double &result) {
   if (h.empty())
      return "History is empty." ;
   const cagrid &g = h[0] ;
   double sum = 0 ;
   for (int y=0; y<g.height(); y++)
      for (int x=0; x<g.width(); x++) {
         double e ;
         const char *err = cellentropy(h, x, y, e) ;
         if (err)
            return err ;
         sum += e ;
      }
   result = sum / g.size() ;
   return 0 ;
}

/*
 *   Mutual information of one cell from its joint counts; the marginals
 *   come from the same pairs so the estimate can't go negative except
 *   by rounding.
 */
static double cellmutualinformation(const cahistory &h, int x, int y,
                                    int k, int d) {
   int n = h.size() - d ;
   vector<int> joint(k * k, 0) ;
   vector<int> first(k, 0), second(k, 0) ;
   for (int t=0; t<n; t++) {
      int a = h[t].getcell(x, y) ;
      int b = h[t + d].getcell(x, y) ;
      joint[a * k + b]++ ;
      first[a]++ ;
      second[b]++ ;
   }
   double mi = 0 ;
   for (int a=0; a<k; a++)
      for (int b=0; b<k; b++) {
         int c = joint[a * k + b] ;
         if (c == 0)
            continue ;
         // p(a,b) / (p(a) p(b)) = c n / (first second)
         mi += ((double)c / n) *
               log2((double)c * n / ((double)first[a] * second[b])) ;
      }
   return mi < 0 ? 0 : mi ;
}

const char *averagemutualinformation(const cahistory &h, double &result,
                                     int temporaldistance) {
   if (h.empty())
      return "History is empty." ;
   if (temporaldistance < 1)
      return "Temporal distance must be at least 1." ;
   if (temporaldistance >= h.size())
      return "Temporal distance must be less than the history length." ;
   const cagrid &g = h[0] ;
   int k = g.NumCellStates() ;
   double sum = 0 ;
   for (int y=0; y<g.height(); y++)
      for (int x=0; x<g.width(); x++)
         sum += cellmutualinformation(h, x, y, k, temporaldistance) ;
   result = sum / g.size() ;
   return 0 ;
}
