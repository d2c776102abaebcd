// This file is part of Calico.
// See docs/License.html for the copyright notice.

/**
 *   A rule table maps every neighborhood tuple over k states and a window
 *   of n cells to an output state.  Entries are stored densely, indexed
 *   by the tuple read as a base-k numeral with the leftmost cell most
 *   significant, so there are k^n of them.  Tables read from a file may
 *   leave entries undefined; a table built by randomruletable() is
 *   always complete.
 */
#ifndef RULETABLE_H
#define RULETABLE_H
#include "neighborhood.h"
#include <vector>
#include <random>

class ruletable {
public:
   ruletable() : numstates(2), window(1), outputs(2, -1) {}
   ruletable(int k, int windowsize) ;
   // tables bigger than this are refused
   static const int MAXENTRIES = 1 << 24 ;
   // returns err msg if k^windowsize entries are not possible
   static const char *checksize(int k, int windowsize) ;
   int NumCellStates() const { return numstates ; }
   int windowsize() const { return window ; }
   int numentries() const { return (int)outputs.size() ; }
   // <0 if the tuple has the wrong length or a state >= k
   int tupleindex(const neighborhood &nb) const ;
   void tupleat(int i, neighborhood &nb) const ;
   // <0 if no output is defined for the tuple
   int lookup(const neighborhood &nb) const ;
   int get(int i) const { return outputs[i] ; }
   // returns <0 if error
   int define(const neighborhood &nb, int output) ;
   int set(int i, int output) ;
   bool iscomplete() const ;
   int numdefined() const ;
   // fraction of all entries mapped to something other than quiescent
   double lambda(int quiescent) const ;
   int operator==(const ruletable &t) const ;
private:
   int numstates ;
   int window ;
   std::vector<int> outputs ;   // -1 means undefined
} ;

// direct lookup; <0 if the neighborhood is absent from the table
int tablerule(const neighborhood &nb, const ruletable &table) ;

/*
 *   Build a random one-dimensional table of radius r over k states.
 *   Each entry (or each reflection class when isotropic) is non-quiescent
 *   with probability lambdaval, the non-quiescent output drawn uniformly
 *   from the other k-1 states.  With strongquiescence the all-quiescent
 *   tuple always maps to the quiescent state.  Because of those two
 *   options the achieved lambda is measured and returned in actuallambda,
 *   along with the quiescent state used.
 */
const char *randomruletable(double lambdaval, int k, int r, std::mt19937 &rng,
                            ruletable &table, double &actuallambda,
                            int &quiescent, bool strongquiescence=false,
                            bool isotropic=false, int quiescentstate=0) ;
#endif
