// This file is part of Calico.
// See docs/License.html for the copyright notice.

/**
 *   The evolution engine.  Each timestep reads every neighborhood from
 *   the last grid in the history and writes the rule's outputs into a
 *   fresh grid, which is appended once it is complete.  No cell ever
 *   sees a value from the generation being built, so the visit order
 *   does not matter.
 *
 *   With memoize set, outputs are cached by neighborhood for the
 *   duration of one call.  Rules whose memoizable() is false are
 *   refused.
 *
 *   If the rule fails (returns <0 or a state outside [0,k)) the call
 *   stops at once: the grid being built is thrown away, the grids
 *   already appended stay, a warning goes to the error handler and the
 *   message is returned.
 */
#ifndef EVOLVE_H
#define EVOLVE_H
#include "cagrid.h"
#include "carule.h"
#include "neighborhood.h"
#include <map>

/**
 *   Outputs seen so far in one evolve call, keyed by neighborhood.
 */
class rulecache {
public:
   rulecache() {}
   // <0 if nb has not been seen
   int find(const neighborhood &nb) const {
      std::map<neighborhood, state>::const_iterator i = cache.find(nb) ;
      return i == cache.end() ? -1 : i->second ;
   }
   void insert(const neighborhood &nb, int out) { cache[nb] = (state)out ; }
   int size() const { return (int)cache.size() ; }
   void clear() { cache.clear() ; }
private:
   std::map<neighborhood, state> cache ;
} ;

// one-dimensional; appends timesteps grids to h; returns err msg or 0
const char *evolve(cahistory &h, int timesteps, carule &rule, int r=1,
                   bool memoize=false) ;
// two-dimensional; kind must be Moore or vonNeumann
const char *evolve2d(cahistory &h, int timesteps, carule &rule, int r=1,
                     TNeighborhood kind=Moore, bool memoize=false) ;
#endif
