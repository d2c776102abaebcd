// This file is part of Calico.
// See docs/License.html for the copyright notice.

#include "ruletable.h"
#include <algorithm>
using namespace std ;

const int ruletable::MAXENTRIES ;

ruletable::ruletable(int k, int windowsize) : numstates(k), window(windowsize) {
   int n = 1 ;
   for (int i=0; i<window; i++)
      n *= k ;
   outputs.assign(n, -1) ;
}

const char *ruletable::checksize(int k, int windowsize) {
   if (k < 2 || k > MAXCELLSTATES)
      return "Number of cell states must be from 2 to 256." ;
   if (windowsize < 1)
      return "Neighborhood must have at least one cell." ;
   double n = 1 ;
   for (int i=0; i<windowsize; i++) {
      n *= k ;
      if (n > MAXENTRIES)
         return "Rule table too large." ;
   }
   return 0 ;
}

int ruletable::tupleindex(const neighborhood &nb) const {
   if ((int)nb.size() != window)
      return -1 ;
   int i = 0 ;
   for (int j=0; j<window; j++) {
      if (nb[j] >= numstates)
         return -1 ;
      i = i * numstates + nb[j] ;
   }
   return i ;
}

void ruletable::tupleat(int i, neighborhood &nb) const {
   nb.resize(window) ;
   for (int j=window-1; j>=0; j--) {
      nb[j] = (state)(i % numstates) ;
      i /= numstates ;
   }
}

int ruletable::lookup(const neighborhood &nb) const {
   int i = tupleindex(nb) ;
   if (i < 0)
      return -1 ;
   return outputs[i] ;
}

int ruletable::set(int i, int output) {
   if (i < 0 || i >= (int)outputs.size())
      return -1 ;
   if (output < 0 || output >= numstates)
      return -1 ;
   outputs[i] = output ;
   return 0 ;
}

int ruletable::define(const neighborhood &nb, int output) {
   return set(tupleindex(nb), output) ;
}

bool ruletable::iscomplete() const {
   return find(outputs.begin(), outputs.end(), -1) == outputs.end() ;
}

int ruletable::numdefined() const {
   return (int)(outputs.size() - count(outputs.begin(), outputs.end(), -1)) ;
}

double ruletable::lambda(int quiescent) const {
   int active = 0 ;
   for (size_t i=0; i<outputs.size(); i++)
      if (outputs[i] >= 0 && outputs[i] != quiescent)
         active++ ;
   return (double)active / outputs.size() ;
}

int ruletable::operator==(const ruletable &t) const {
   return numstates == t.numstates && window == t.window &&
          outputs == t.outputs ;
}

int tablerule(const neighborhood &nb, const ruletable &table) {
   return table.lookup(nb) ;
}

const char *randomruletable(double lambdaval, int k, int r, mt19937 &rng,
                            ruletable &table, double &actuallambda,
                            int &quiescent, bool strongquiescence,
                            bool isotropic, int quiescentstate) {
   if (lambdaval < 0 || lambdaval > 1)
      return "Lambda must be from 0 to 1." ;
   if (r < 1)
      return "Neighborhood radius must be at least 1." ;
   int window = windowsize(oneDimensional, r) ;
   const char *err = ruletable::checksize(k, window) ;
   if (err)
      return err ;
   if (quiescentstate < 0 || quiescentstate >= k)
      return "Quiescent state out of range." ;
   ruletable t(k, window) ;
   uniform_real_distribution<double> coin(0.0, 1.0) ;
   uniform_int_distribution<int> other(0, k - 2) ;
   neighborhood nb ;
   for (int i=0; i<t.numentries(); i++) {
      // a reflected tuple may already have been given its class output
      if (t.get(i) >= 0)
         continue ;
      int out = quiescentstate ;
      if (coin(rng) < lambdaval) {
         out = other(rng) ;
         if (out >= quiescentstate)
            out++ ;
      }
      t.set(i, out) ;
      if (isotropic) {
         t.tupleat(i, nb) ;
         reverse(nb.begin(), nb.end()) ;
         t.define(nb, out) ;
      }
   }
   if (strongquiescence) {
      nb.assign(window, (state)quiescentstate) ;
      t.define(nb, quiescentstate) ;
   }
   table = t ;
   actuallambda = t.lambda(quiescentstate) ;
   quiescent = quiescentstate ;
   return 0 ;
}
