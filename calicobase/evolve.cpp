// This file is part of Calico.
// See docs/License.html for the copyright notice.

#include "evolve.h"
#include "util.h"
#include <sstream>
using namespace std ;

static string errmsg ;

static const char *rulefailure(const neighborhood &nb, int x, int y, int gen,
                               int out) {
   ostringstream oss ;
   if (out < 0)
      oss << "Rule has no transition for neighborhood" ;
   else
      oss << "Rule produced a state out of range (" << out << ") for neighborhood" ;
   for (size_t i=0; i<nb.size(); i++)
      oss << (i ? "," : " ") << (int)nb[i] ;
   oss << " at cell (" << x << "," << y << ") of generation " << gen << "." ;
   errmsg = oss.str() ;
   cawarning(errmsg.c_str()) ;
   return errmsg.c_str() ;
}

/*
 *   The loop shared by both dimensions.  gen passed to the rule is the
 *   history index of the grid being computed.
 */
static const char *runsteps(cahistory &h, int timesteps, carule &rule,
                            const nbshape &shape, bool memoize) {
   if (memoize && !rule.memoizable())
      return "This rule cannot be memoized." ;
   rulecache cache ;
   caperf running ;
   running.clear() ;
   running.genval = h.size() - 1 ;
   caperf start = running ;
   caperf mark = running ;
   neighborhood nb ;
   for (int t=0; t<timesteps; t++) {
      const cagrid &current = h.back() ;
      cagrid next = current ;
      int gen = h.size() ;
      int k = current.NumCellStates() ;
      for (int y=0; y<current.height(); y++)
         for (int x=0; x<current.width(); x++) {
            shape.extract(current, x, y, nb) ;
            int out = -1 ;
            if (memoize) {
               out = cache.find(nb) ;
               running.cachelookup(out >= 0) ;
               if (out < 0) {
                  out = rule.apply(nb, x, y, gen) ;
                  if (out >= 0 && out < k)
                     cache.insert(nb, out) ;
               }
            } else {
               out = rule.apply(nb, x, y, gen) ;
            }
            // setcell refuses states outside [0,k)
            if (out < 0 || next.setcell(x, y, out) < 0)
               return rulefailure(nb, x, y, gen, out) ;
            if (running.fastinc())
               running.reportStep(mark, gen) ;
         }
      const char *err = h.push(next) ;
      if (err)
         return err ;
   }
   running.reportStep(mark, h.size() - 1) ;
   running.genval = h.size() - 1 ;
   running.reportTotal(start, "evolve") ;
   return 0 ;
}

static const char *checkargs(const cahistory &h, int timesteps, int r,
                             int dims) {
   if (h.empty())
      return "History is empty; initialize it first." ;
   if (timesteps < 0)
      return "Number of timesteps must not be negative." ;
   if (r < 1)
      return "Neighborhood radius must be at least 1." ;
   if (h.back().dimensions() != dims)
      return dims == 1 ? "evolve needs a one-dimensional grid." :
                         "evolve2d needs a two-dimensional grid." ;
   return 0 ;
}

const char *evolve(cahistory &h, int timesteps, carule &rule, int r,
                   bool memoize) {
   const char *err = checkargs(h, timesteps, r, 1) ;
   if (err)
      return err ;
   return runsteps(h, timesteps, rule, nbshape(oneDimensional, r), memoize) ;
}

const char *evolve2d(cahistory &h, int timesteps, carule &rule, int r,
                     TNeighborhood kind, bool memoize) {
   const char *err = checkargs(h, timesteps, r, 2) ;
   if (err)
      return err ;
   if (kind != Moore && kind != vonNeumann)
      return "Two-dimensional neighborhoods must be Moore or vonNeumann." ;
   return runsteps(h, timesteps, rule, nbshape(kind, r), memoize) ;
}
