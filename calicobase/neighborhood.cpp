// This file is part of Calico.
// See docs/License.html for the copyright notice.

#include "neighborhood.h"
#include <stdlib.h>
#include <string.h>
#ifndef WIN32
   #include <strings.h>
   #define stricmp strcasecmp
#endif
using namespace std ;

int windowsize(TNeighborhood kind, int r) {
   switch (kind) {
   case Moore:
      return (2 * r + 1) * (2 * r + 1) ;
   case vonNeumann:
      return 2 * r * (r + 1) + 1 ;
   default:
      return 2 * r + 1 ;
   }
}

const char *parseneighborhood(const char *s, TNeighborhood &kind) {
   if (stricmp(s, "oneDimensional") == 0)
      kind = oneDimensional ;
   else if (stricmp(s, "Moore") == 0)
      kind = Moore ;
   else if (stricmp(s, "vonNeumann") == 0 || stricmp(s, "von Neumann") == 0)
      kind = vonNeumann ;
   else
      return "Unknown neighborhood." ;
   return 0 ;
}

const char *neighborhoodname(TNeighborhood kind) {
   switch (kind) {
   case Moore:
      return "Moore" ;
   case vonNeumann:
      return "vonNeumann" ;
   default:
      return "oneDimensional" ;
   }
}

nbshape::nbshape(TNeighborhood kind, int r) : nbkind(kind), rad(r) {
   if (kind == oneDimensional) {
      for (int i=-r; i<=r; i++) {
         dx.push_back(i) ;
         dy.push_back(0) ;
      }
      return ;
   }
   for (int j=-r; j<=r; j++)
      for (int i=-r; i<=r; i++) {
         // von Neumann drops the corners outside the diamond
         if (kind == vonNeumann && abs(i) + abs(j) > r)
            continue ;
         dx.push_back(i) ;
         dy.push_back(j) ;
      }
}

void nbshape::extract(const cagrid &g, int x, int y, neighborhood &nb) const {
   int wd = g.width() ;
   int ht = g.height() ;
   nb.resize(dx.size()) ;
   for (size_t i=0; i<dx.size(); i++)
      nb[i] = (state)g.getcell(wrapindex(x + dx[i], wd),
                               wrapindex(y + dy[i], ht)) ;
}

int nbshape::indexof(int ox, int oy) const {
   for (size_t i=0; i<dx.size(); i++)
      if (dx[i] == ox && dy[i] == oy)
         return (int)i ;
   return -1 ;
}

void getneighborhood(const cagrid &g, int x, int r, neighborhood &nb) {
   nbshape(oneDimensional, r).extract(g, x, 0, nb) ;
}

void getneighborhood2d(const cagrid &g, int x, int y, int r,
                       TNeighborhood kind, neighborhood &nb) {
   nbshape(kind, r).extract(g, x, y, nb) ;
}
