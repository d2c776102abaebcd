// This file is part of Calico.
// See docs/License.html for the copyright notice.

/**
 *   Grids and histories.  A grid is a fixed-shape array of cell states,
 *   either one-dimensional (a ring of width cells) or two-dimensional
 *   (a torus of height rows by width columns), stored row-major.  A
 *   history is the append-only sequence of grids an evolution produces;
 *   entry 0 is the initial state.
 */
#ifndef CAGRID_H
#define CAGRID_H
#include <vector>
#include <random>

/**
 *   The size of a state.  Unsigned char works for now.
 */
typedef unsigned char state ;
const int MAXCELLSTATES = 256 ;

class cagrid {
public:
   cagrid() : dims(1), rows(0), cols(0), numstates(2),
              badgrid("Grid size must be positive.") {}
   cagrid(int width, int k) ;
   cagrid(int height, int width, int k) ;
   // err msg if the size or k given to the constructor was bad, else 0
   const char *check() const { return badgrid ; }
   int dimensions() const { return dims ; }
   int width() const { return cols ; }
   int height() const { return rows ; }
   int size() const { return rows * cols ; }
   // return number of cell states (k) in this grid
   int NumCellStates() const { return numstates ; }
   // no range checking; x is the column, y the row (always 0 in 1D)
   int getcell(int x, int y=0) const { return cellbuf[y * cols + x] ; }
   // returns <0 if error
   int setcell(int x, int y, int newstate) ;
   const std::vector<state> &cells() const { return cellbuf ; }
   bool sameshape(const cagrid &g) const ;
   // number of cells not in the quiescent state 0
   int population() const ;
   int operator==(const cagrid &g) const ;
   int operator!=(const cagrid &g) const { return !(*this == g) ; }
private:
   void allocate() ;
   int dims, rows, cols ;
   int numstates ;
   const char *badgrid ;
   std::vector<state> cellbuf ;
} ;

/**
 *   Downstream consumers (renderers, statistics) only ever see a const
 *   history; grids are appended by the evolution engine and never
 *   changed afterwards.
 */
class cahistory {
public:
   cahistory() {}
   int size() const { return (int)grids.size() ; }
   bool empty() const { return grids.empty() ; }
   const cagrid &operator[](int i) const { return grids[i] ; }
   const cagrid &back() const { return grids.back() ; }
   // append a grid; returns error if the grid is bad or its shape or
   // k differs from the grids already present
   const char *push(const cagrid &g) ;
   void clear() { grids.clear() ; }
private:
   std::vector<cagrid> grids ;
} ;

// returns err msg if the size is not positive or k is outside 2..256
const char *checkgrid(int height, int width, int k) ;

/*
 *   Initializers.  Each one replaces the contents of h with a single
 *   grid and returns an error message, or 0 if all went well (in which
 *   case h has length 1).
 */
// all cells 0 except the center cell, which is set to val
const char *initsimple(cahistory &h, int width, int k=2, int val=1) ;
const char *initsimple2d(cahistory &h, int height, int width,
                         int k=2, int val=1) ;
// each cell drawn uniformly from [0,k); if count >= 0 only a centered
// run of count cells (row-major) is randomized and the rest are 0
const char *initrandom(cahistory &h, int width, std::mt19937 &rng,
                       int k=2, int count=-1) ;
const char *initrandom2d(cahistory &h, int height, int width,
                         std::mt19937 &rng, int k=2, int count=-1) ;
// caller-supplied cells, row-major
const char *initfromcells(cahistory &h, int width, int k,
                          const std::vector<int> &cells) ;
const char *initfromcells2d(cahistory &h, int height, int width, int k,
                            const std::vector<int> &cells) ;
#endif
