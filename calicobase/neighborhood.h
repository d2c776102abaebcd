// This file is part of Calico.
// See docs/License.html for the copyright notice.

/**
 *   Neighborhood extraction with periodic boundaries.  Indices wrap
 *   modulo the grid dimensions, so a 1D grid is a ring and a 2D grid
 *   is a torus.
 *
 *   The cells of a neighborhood are always returned in the same order
 *   so the tuple can be used as a lookup key:
 *     oneDimensional:  left to right, x-r .. x+r
 *     Moore:           row-major over the (2r+1)x(2r+1) block
 *     vonNeumann:      row-major over the cells within Manhattan
 *                      distance r (the diamond inside the Moore block)
 *   In all three the center cell sits at index size()/2.
 */
#ifndef NEIGHBORHOOD_H
#define NEIGHBORHOOD_H
#include "cagrid.h"
#include <vector>

typedef std::vector<state> neighborhood ;

enum TNeighborhood { oneDimensional, Moore, vonNeumann } ;

// map index i into [0,n)
inline int wrapindex(int i, int n) {
   int m = i % n ;
   return m < 0 ? m + n : m ;
}

// number of cells in a neighborhood of the given kind and radius
int windowsize(TNeighborhood kind, int r) ;
// accepts "oneDimensional", "Moore", "vonNeumann" or "von Neumann"
const char *parseneighborhood(const char *s, TNeighborhood &kind) ;
const char *neighborhoodname(TNeighborhood kind) ;

/**
 *   Offsets for one neighborhood shape, computed once and reused for
 *   every cell of an evolution run.
 */
class nbshape {
public:
   nbshape(TNeighborhood kind, int r) ;
   TNeighborhood kind() const { return nbkind ; }
   int radius() const { return rad ; }
   int size() const { return (int)dx.size() ; }
   int center() const { return size() / 2 ; }
   // fill nb with the neighbors of cell (x,y); y must be 0 in 1D
   void extract(const cagrid &g, int x, int y, neighborhood &nb) const ;
   int offsetx(int i) const { return dx[i] ; }
   int offsety(int i) const { return dy[i] ; }
   // position of offset (ox,oy) in the tuple, or -1 if outside the shape
   int indexof(int ox, int oy) const ;
private:
   TNeighborhood nbkind ;
   int rad ;
   std::vector<int> dx, dy ;
} ;

void getneighborhood(const cagrid &g, int x, int r, neighborhood &nb) ;
void getneighborhood2d(const cagrid &g, int x, int y, int r,
                       TNeighborhood kind, neighborhood &nb) ;
#endif
